/*
 * 설명: 연결 상태 머신, 와이어 프로토콜 종류, 전송 계층 출력 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp
 */
#pragma once

#include <optional>
#include <string>

#include "collab/event.hpp"

namespace collab {

enum class Protocol { kNative, kBinary, kLegacy };

enum class ConnectionState { kConnecting, kJoined, kLeaving, kDisconnected };

const char* ToString(Protocol protocol);
const char* ToString(ConnectionState state);

struct Identity {
  std::optional<std::string> user_id;
  std::optional<std::string> username;
};

// 전송 세션이 구현한다. 모든 호출은 임의 스레드에서 올 수 있으므로 블로킹하면 안 된다.
class ConnectionSink {
 public:
  virtual ~ConnectionSink() = default;
  virtual void Deliver(const ServerEvent& event) = 0;
  virtual void Close(const std::string& reason) = 0;
};

}  // namespace collab
