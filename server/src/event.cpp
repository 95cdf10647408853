/*
 * 설명: 표준 이벤트의 이름, 클라이언트 페이로드, 백플레인 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_codec_test.cpp
 */
#include "collab/event.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "collab/overloaded.hpp"

namespace collab {
namespace {
const char* SignalEventName(SignalKind kind) {
  switch (kind) {
    case SignalKind::kCallRequest:
      return "call-incoming";
    case SignalKind::kCallResponse:
      return "call-response";
    case SignalKind::kOffer:
      return "offer";
    case SignalKind::kAnswer:
      return "answer";
    case SignalKind::kIceCandidate:
      return "ice-candidate";
    case SignalKind::kCallEnd:
      return "call-ended";
  }
  return "signal";
}

const char* SignalPayloadField(SignalKind kind) {
  switch (kind) {
    case SignalKind::kCallRequest:
      return "request";
    case SignalKind::kCallResponse:
      return "response";
    case SignalKind::kOffer:
      return "offer";
    case SignalKind::kAnswer:
      return "answer";
    case SignalKind::kIceCandidate:
      return "candidate";
    case SignalKind::kCallEnd:
      return nullptr;
  }
  return nullptr;
}

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> OptionalFromJson(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

nlohmann::json BodyToJson(const EventBody& body) {
  return std::visit(
      Overloaded{[](const UserJoined&) { return nlohmann::json::object(); },
                 [](const UserLeft& e) { return nlohmann::json{{"reason", e.reason}}; },
                 [](const PieceMoved& e) {
                   return nlohmann::json{{"pieceId", e.piece_id}, {"x", e.x}, {"y", e.y}, {"rotation", e.rotation}};
                 },
                 [](const PieceLocked& e) { return nlohmann::json{{"pieceId", e.piece_id}}; },
                 [](const PieceUnlocked& e) { return nlohmann::json{{"pieceId", e.piece_id}}; },
                 [](const ChatPosted& e) { return nlohmann::json{{"id", e.message_id}, {"message", e.text}}; },
                 [](const CursorMoved& e) { return nlohmann::json{{"x", e.x}, {"y", e.y}}; },
                 [](const CustomEvent& e) { return nlohmann::json{{"event", e.name}, {"data", e.data}}; },
                 [](const SignalDelivered& e) {
                   return nlohmann::json{{"kind", ToString(e.kind)}, {"payload", e.payload}};
                 }},
      body);
}

const char* BodyKind(const EventBody& body) {
  return std::visit(Overloaded{[](const UserJoined&) { return "user-joined"; },
                               [](const UserLeft&) { return "user-left"; },
                               [](const PieceMoved&) { return "piece-moved"; },
                               [](const PieceLocked&) { return "piece-locked"; },
                               [](const PieceUnlocked&) { return "piece-unlocked"; },
                               [](const ChatPosted&) { return "chat-message"; },
                               [](const CursorMoved&) { return "cursor-update"; },
                               [](const CustomEvent&) { return "custom-event"; },
                               [](const SignalDelivered&) { return "signal"; }},
                    body);
}

int IntField(const nlohmann::json& json, const char* key) {
  return json.at(key).get<int>();
}

std::string StringField(const nlohmann::json& json, const char* key) {
  return json.at(key).get<std::string>();
}

EventBody BodyFromJson(const std::string& kind, const nlohmann::json& body) {
  if (kind == "user-joined") {
    return UserJoined{};
  }
  if (kind == "user-left") {
    return UserLeft{body.value("reason", std::string{})};
  }
  if (kind == "piece-moved") {
    return PieceMoved{StringField(body, "pieceId"), IntField(body, "x"), IntField(body, "y"),
                      IntField(body, "rotation")};
  }
  if (kind == "piece-locked") {
    return PieceLocked{StringField(body, "pieceId")};
  }
  if (kind == "piece-unlocked") {
    return PieceUnlocked{StringField(body, "pieceId")};
  }
  if (kind == "chat-message") {
    return ChatPosted{StringField(body, "id"), StringField(body, "message")};
  }
  if (kind == "cursor-update") {
    return CursorMoved{IntField(body, "x"), IntField(body, "y")};
  }
  if (kind == "custom-event") {
    return CustomEvent{StringField(body, "event"), body.value("data", nlohmann::json())};
  }
  if (kind == "signal") {
    auto signal_kind = ParseSignalKind(StringField(body, "kind"));
    if (!signal_kind) {
      throw std::invalid_argument("알 수 없는 시그널 종류");
    }
    return SignalDelivered{*signal_kind, body.value("payload", nlohmann::json())};
  }
  throw std::invalid_argument("알 수 없는 이벤트 종류: " + kind);
}
}  // namespace

const char* ToString(SignalKind kind) {
  switch (kind) {
    case SignalKind::kCallRequest:
      return "call.request";
    case SignalKind::kCallResponse:
      return "call.response";
    case SignalKind::kOffer:
      return "call.offer";
    case SignalKind::kAnswer:
      return "call.answer";
    case SignalKind::kIceCandidate:
      return "call.ice-candidate";
    case SignalKind::kCallEnd:
      return "call.end";
  }
  return "call.unknown";
}

std::optional<SignalKind> ParseSignalKind(const std::string& value) {
  for (auto kind : {SignalKind::kCallRequest, SignalKind::kCallResponse, SignalKind::kOffer, SignalKind::kAnswer,
                    SignalKind::kIceCandidate, SignalKind::kCallEnd}) {
    if (value == ToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string EventName(const CollabEvent& event) {
  if (const auto* signal = std::get_if<SignalDelivered>(&event.body)) {
    return SignalEventName(signal->kind);
  }
  return BodyKind(event.body);
}

nlohmann::json EventPayload(const CollabEvent& event) {
  const auto& meta = event.meta;
  if (const auto* signal = std::get_if<SignalDelivered>(&event.body)) {
    nlohmann::json payload{{"from", meta.origin_connection_id},
                           {"fromUserId", OptionalToJson(meta.origin_user_id)},
                           {"timestamp", meta.timestamp_ms},
                           {"v", meta.version}};
    if (const char* field = SignalPayloadField(signal->kind)) {
      // {"offer": {...}} 형태로 보낸 경우 한 겹 벗겨서 전달한다.
      const auto& body = signal->payload;
      payload[field] = body.is_object() && body.contains(field) ? body.at(field) : body;
    }
    return payload;
  }

  nlohmann::json payload{{"roomId", meta.scope_id},
                         {"connectionId", meta.origin_connection_id},
                         {"userId", OptionalToJson(meta.origin_user_id)},
                         {"username", OptionalToJson(meta.origin_username)},
                         {"timestamp", meta.timestamp_ms},
                         {"v", meta.version}};
  payload.update(BodyToJson(event.body));
  return payload;
}

ServerEvent ToServerEvent(const CollabEvent& event) { return ServerEvent{EventName(event), EventPayload(event)}; }

nlohmann::json ToJson(const CollabEvent& event) {
  const auto& meta = event.meta;
  return {{"v", meta.version},
          {"kind", BodyKind(event.body)},
          {"meta",
           {{"scope", meta.scope_id},
            {"origin", meta.origin_connection_id},
            {"userId", OptionalToJson(meta.origin_user_id)},
            {"username", OptionalToJson(meta.origin_username)},
            {"ts", meta.timestamp_ms}}},
          {"body", BodyToJson(event.body)}};
}

bool FromJson(const nlohmann::json& json, CollabEvent& event, std::string& error) {
  try {
    if (!json.is_object() || !json.contains("kind") || !json.contains("meta") || !json.contains("body")) {
      error = "이벤트 형식이 올바르지 않습니다";
      return false;
    }
    const auto& meta_json = json.at("meta");
    EventMeta meta;
    meta.version = json.value("v", kEventVersion);
    meta.scope_id = StringField(meta_json, "scope");
    meta.origin_connection_id = StringField(meta_json, "origin");
    meta.origin_user_id = OptionalFromJson(meta_json, "userId");
    meta.origin_username = OptionalFromJson(meta_json, "username");
    meta.timestamp_ms = meta_json.value("ts", std::int64_t{0});
    event = CollabEvent{meta, BodyFromJson(StringField(json, "kind"), json.at("body"))};
    return true;
  } catch (const std::exception& ex) {
    error = ex.what();
    return false;
  }
}

}  // namespace collab
