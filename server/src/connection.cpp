/*
 * 설명: 연결 상태/프로토콜 이름 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "collab/connection.hpp"

namespace collab {

const char* ToString(Protocol protocol) {
  switch (protocol) {
    case Protocol::kNative:
      return "native";
    case Protocol::kBinary:
      return "binary";
    case Protocol::kLegacy:
      return "legacy";
  }
  return "unknown";
}

const char* ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kJoined:
      return "joined";
    case ConnectionState::kLeaving:
      return "leaving";
    case ConnectionState::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

}  // namespace collab
