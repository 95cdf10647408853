/*
 * 설명: 프로토콜과 무관한 표준 이벤트(닫힌 variant)와 JSON 직렬화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace collab {

constexpr int kEventVersion = 1;

enum class SignalKind { kCallRequest, kCallResponse, kOffer, kAnswer, kIceCandidate, kCallEnd };

const char* ToString(SignalKind kind);
std::optional<SignalKind> ParseSignalKind(const std::string& value);

struct EventMeta {
  std::string scope_id;
  std::string origin_connection_id;
  std::optional<std::string> origin_user_id;
  std::optional<std::string> origin_username;
  std::int64_t timestamp_ms{0};
  int version{kEventVersion};
};

struct UserJoined {};
struct UserLeft {
  std::string reason;
};
struct PieceMoved {
  std::string piece_id;
  int x{0};
  int y{0};
  int rotation{0};
};
struct PieceLocked {
  std::string piece_id;
};
struct PieceUnlocked {
  std::string piece_id;
};
struct ChatPosted {
  std::string message_id;
  std::string text;
};
struct CursorMoved {
  int x{0};
  int y{0};
};
struct CustomEvent {
  std::string name;
  nlohmann::json data;
};
struct SignalDelivered {
  SignalKind kind{SignalKind::kOffer};
  nlohmann::json payload;
};

using EventBody = std::variant<UserJoined, UserLeft, PieceMoved, PieceLocked, PieceUnlocked, ChatPosted, CursorMoved,
                               CustomEvent, SignalDelivered>;

// scope_id는 방 이벤트면 방 ID, 시그널이면 대상 연결 ID다.
struct CollabEvent {
  EventMeta meta;
  EventBody body;
};

// 클라이언트로 나가는 이벤트. 각 와이어 어댑터가 자기 형식으로 인코딩한다.
struct ServerEvent {
  std::string name;
  nlohmann::json payload;
};

std::int64_t NowMillis();
std::string EventName(const CollabEvent& event);
nlohmann::json EventPayload(const CollabEvent& event);
ServerEvent ToServerEvent(const CollabEvent& event);

nlohmann::json ToJson(const CollabEvent& event);
bool FromJson(const nlohmann::json& json, CollabEvent& event, std::string& error);

}  // namespace collab
