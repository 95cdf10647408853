/*
 * 설명: 엔진/소켓 패킷 번호, 네임스페이스, ack ID를 파싱하고 레거시 이벤트를 표준 명령에 대응시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/legacy_protocol_test.cpp
 */
#include "collab/legacy_protocol.hpp"

#include <cctype>

namespace collab {
namespace {
bool Fail(std::string& error_code, std::string& error_message, const std::string& message) {
  error_code = "bad_request";
  error_message = message;
  return false;
}

std::string NamespacePrefix(const std::string& nsp) { return nsp.empty() || nsp == "/" ? "" : nsp + ","; }

nlohmann::json ObjectOr(const nlohmann::json& payload, const char* key) {
  if (payload.is_string()) {
    return nlohmann::json{{key, payload}};
  }
  return payload.is_object() ? payload : nlohmann::json::object();
}
}  // namespace

bool DecodeLegacyPacket(const std::string& text, LegacyPacket& out, std::string& error_code,
                        std::string& error_message) {
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
    return Fail(error_code, error_message, "패킷 번호가 없습니다");
  }
  int engine = text[0] - '0';
  if (engine > static_cast<int>(EnginePacket::kNoop)) {
    return Fail(error_code, error_message, "알 수 없는 엔진 패킷입니다");
  }
  out = LegacyPacket{};
  out.engine = static_cast<EnginePacket>(engine);
  std::size_t pos = 1;
  if (out.engine != EnginePacket::kMessage) {
    return true;
  }

  if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
    return Fail(error_code, error_message, "소켓 패킷 번호가 없습니다");
  }
  int socket = text[pos] - '0';
  if (socket > static_cast<int>(SocketPacket::kError)) {
    return Fail(error_code, error_message, "알 수 없는 소켓 패킷입니다");
  }
  out.socket = static_cast<SocketPacket>(socket);
  ++pos;

  if (pos < text.size() && text[pos] == '/') {
    auto comma = text.find(',', pos);
    if (comma == std::string::npos) {
      out.nsp = text.substr(pos);
      return true;
    }
    out.nsp = text.substr(pos, comma - pos);
    pos = comma + 1;
  }

  std::size_t digits_end = pos;
  while (digits_end < text.size() && std::isdigit(static_cast<unsigned char>(text[digits_end]))) {
    ++digits_end;
  }
  if (digits_end > pos) {
    try {
      out.ack_id = std::stoull(text.substr(pos, digits_end - pos));
    } catch (const std::exception&) {
      return Fail(error_code, error_message, "ack ID가 올바르지 않습니다");
    }
    pos = digits_end;
  }

  if (pos < text.size()) {
    try {
      out.data = nlohmann::json::parse(text.substr(pos));
    } catch (const nlohmann::json::exception&) {
      return Fail(error_code, error_message, "JSON 파싱 오류");
    }
  }
  if (out.socket == SocketPacket::kEvent && (!out.data.is_array() || out.data.empty() || !out.data[0].is_string())) {
    return Fail(error_code, error_message, "이벤트 패킷은 [\"이름\", 데이터] 형식이어야 합니다");
  }
  return true;
}

std::string EncodeLegacyPacket(const LegacyPacket& packet) {
  std::string text = std::to_string(static_cast<int>(packet.engine));
  if (packet.engine != EnginePacket::kMessage) {
    if (!packet.data.is_null()) {
      text += packet.data.dump();
    }
    return text;
  }
  if (packet.socket) {
    text += std::to_string(static_cast<int>(*packet.socket));
  }
  text += NamespacePrefix(packet.nsp);
  if (packet.ack_id) {
    text += std::to_string(*packet.ack_id);
  }
  if (!packet.data.is_null()) {
    text += packet.data.dump();
  }
  return text;
}

bool TranslateLegacyEvent(const nlohmann::json& data, LegacyInbound& out, std::string& error_code,
                          std::string& error_message) {
  if (!data.is_array() || data.empty() || !data[0].is_string()) {
    return Fail(error_code, error_message, "이벤트 이름이 없습니다");
  }
  auto name = data[0].get<std::string>();
  nlohmann::json payload = data.size() > 1 ? data[1] : nlohmann::json(nullptr);

  std::string canonical;
  nlohmann::json body;
  if (name == "join") {
    body = ObjectOr(payload, "roomId");
    if (!body.contains("roomId") && body.contains("room")) {
      body["roomId"] = body["room"];
    }
    canonical = "room.join";
  } else if (name == "leave") {
    canonical = "room.leave";
  } else if (name == "message") {
    canonical = "chat.send";
    body = ObjectOr(payload, "message");
  } else if (name == "puzzle-move") {
    canonical = "piece.move";
    body = payload;
  } else if (name == "cursor-update") {
    canonical = "cursor.update";
    body = payload;
  } else if (name == "ping-test") {
    out = LegacyPingTest{};
    return true;
  } else {
    ClientCommand candidate;
    std::string candidate_code;
    std::string candidate_message;
    if (DecodeCommand(name, payload, candidate, candidate_code, candidate_message)) {
      out = std::move(candidate);
      return true;
    }
    if (candidate_code != "unknown_event") {
      error_code = candidate_code;
      error_message = candidate_message;
      return false;
    }
    // 그 밖의 이름은 방 범위 사용자 정의 이벤트로 전달한다.
    out = ClientCommand{EmitCustomCommand{name, payload}};
    return true;
  }

  ClientCommand command;
  if (!DecodeCommand(canonical, body, command, error_code, error_message)) {
    return false;
  }
  out = std::move(command);
  return true;
}

std::string LegacyEventName(const std::string& server_event_name) {
  if (server_event_name == "room.joined") {
    return "joined";
  }
  if (server_event_name == "room.left") {
    return "left";
  }
  if (server_event_name == "chat.sent") {
    return "message-sent";
  }
  return server_event_name;
}

std::string EncodeLegacyOpen(const std::string& sid) {
  nlohmann::json handshake{{"sid", sid},
                           {"upgrades", nlohmann::json::array({"websocket"})},
                           {"pingInterval", kLegacyPingIntervalMs},
                           {"pingTimeout", kLegacyPingTimeoutMs}};
  return EncodeLegacyPacket(LegacyPacket{EnginePacket::kOpen, std::nullopt, "/", std::nullopt, handshake});
}

std::string EncodeLegacyConnectAck(const std::string& nsp, const std::string& sid) {
  return EncodeLegacyPacket(
      LegacyPacket{EnginePacket::kMessage, SocketPacket::kConnect, nsp, std::nullopt, {{"sid", sid}}});
}

std::string EncodeLegacyEvent(const ServerEvent& event, const std::string& nsp) {
  return EncodeLegacyPacket(LegacyPacket{EnginePacket::kMessage, SocketPacket::kEvent, nsp, std::nullopt,
                                         nlohmann::json::array({LegacyEventName(event.name), event.payload})});
}

std::string EncodeLegacyAck(const std::string& nsp, std::uint64_t ack_id, const nlohmann::json& args) {
  nlohmann::json list = args.is_array() ? args : nlohmann::json::array({args});
  return EncodeLegacyPacket(LegacyPacket{EnginePacket::kMessage, SocketPacket::kAck, nsp, ack_id, list});
}

std::string EncodeLegacyError(std::string_view code, std::string_view message, const std::string& nsp) {
  return EncodeLegacyPacket(LegacyPacket{EnginePacket::kMessage, SocketPacket::kError, nsp, std::nullopt,
                                         {{"code", code}, {"message", message}}});
}

}  // namespace collab
