/*
 * 설명: 기본 WebSocket 엔벨로프를 표준 명령으로 변환하고 서버 이벤트를 엔벨로프로 감싼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_equivalence_test.cpp
 */
#include "collab/native_protocol.hpp"

#include "collab/api_response.hpp"

namespace collab {

bool DecodeNativeMessage(const std::string& text, NativeRequest& out, std::string& error_code,
                         std::string& error_message) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception&) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return false;
  }
  if (!message.is_object()) {
    error_code = "bad_request";
    error_message = "잘못된 메시지 형식";
    return false;
  }
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    out.seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  auto event_it = message.find("event");
  if (type_it == message.end() || !type_it->is_string()) {
    error_code = "bad_request";
    error_message = "잘못된 메시지 형식";
    return false;
  }
  if (*type_it != "event" || event_it == message.end() || !event_it->is_string()) {
    error_code = "bad_request";
    error_message = "알 수 없는 메시지 유형";
    return false;
  }
  auto payload_it = message.find("p");
  nlohmann::json payload = payload_it == message.end() ? nlohmann::json(nullptr) : *payload_it;
  return DecodeCommand(event_it->get<std::string>(), payload, out.command, error_code, error_message);
}

std::string EncodeNativeEvent(const ServerEvent& event, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = event.name, .seq = seq, .payload = event.payload};
  return ToWsJson(env).dump();
}

std::string EncodeNativeError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  return ToWsJson(env).dump();
}

}  // namespace collab
