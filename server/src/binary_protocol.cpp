/*
 * 설명: 바이너리 프레임을 분리/검증하고 JSON 메시지를 표준 명령이나 제어 메시지로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/binary_protocol_test.cpp
 */
#include "collab/binary_protocol.hpp"

#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace collab {
namespace {
void AppendLittleEndian(std::string& out, std::uint64_t value, std::size_t bytes) {
  for (std::size_t i = 0; i < bytes; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

std::uint32_t ReadLength(const std::string& buffer) {
  std::uint32_t length = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    length |= static_cast<std::uint32_t>(static_cast<unsigned char>(buffer[i])) << (8 * i);
  }
  return length;
}
}  // namespace

FrameDecoder::Status FrameDecoder::Next(std::string& payload) {
  if (buffer_.size() < 4) {
    return Status::kNeedMore;
  }
  auto length = ReadLength(buffer_);
  if (length > max_frame_bytes_) {
    return Status::kTooLarge;
  }
  if (buffer_.size() < 4 + static_cast<std::size_t>(length)) {
    return Status::kNeedMore;
  }
  payload = buffer_.substr(4, length);
  buffer_.erase(0, 4 + static_cast<std::size_t>(length));
  return Status::kFrame;
}

bool DecodeBinaryPayload(const std::string& payload, BinaryInbound& out, std::string& error_code,
                         std::string& error_message) {
  if (payload.empty()) {
    error_code = "bad_request";
    error_message = "빈 프레임입니다";
    return false;
  }
  auto tag = static_cast<std::uint8_t>(payload[0]);
  std::string body = payload.substr(1);
  if (tag == kRawFrameTag) {
    out = BinaryRawEcho{std::move(body)};
    return true;
  }
  if (tag != kJsonFrameTag) {
    error_code = "bad_request";
    error_message = "알 수 없는 프레임 태그입니다";
    return false;
  }

  nlohmann::json message;
  try {
    message = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception&) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return false;
  }
  if (!message.is_object() || !message.contains("type") || !message["type"].is_string()) {
    error_code = "bad_request";
    error_message = "type 필드가 필요합니다";
    return false;
  }
  auto type = message["type"].get<std::string>();
  auto data = message.value("data", nlohmann::json());

  if (type == "ping") {
    out = BinaryPing{};
    return true;
  }
  if (type == "echo") {
    out = BinaryEcho{data};
    return true;
  }
  if (type == "binary-request") {
    out = BinaryDataRequest{};
    return true;
  }
  if (type == "auth") {
    auto token_it = message.find("token");
    if (token_it == message.end() || !token_it->is_string()) {
      error_code = "bad_request";
      error_message = "token이 필요합니다";
      return false;
    }
    out = BinaryAuth{token_it->get<std::string>()};
    return true;
  }
  if (type == "broadcast") {
    out = ClientCommand{EmitCustomCommand{"broadcast", data}};
    return true;
  }
  ClientCommand command;
  if (!DecodeCommand(type, data, command, error_code, error_message)) {
    return false;
  }
  out = std::move(command);
  return true;
}

std::string EncodeFrame(std::uint8_t tag, std::string_view body) {
  std::string frame;
  frame.reserve(5 + body.size());
  AppendLittleEndian(frame, body.size() + 1, 4);
  frame.push_back(static_cast<char>(tag));
  frame.append(body.data(), body.size());
  return frame;
}

std::string EncodeJsonFrame(const nlohmann::json& message) { return EncodeFrame(kJsonFrameTag, message.dump()); }

std::string EncodeRawFrame(std::string_view bytes) { return EncodeFrame(kRawFrameTag, bytes); }

std::string EncodeBinaryEvent(const ServerEvent& event) {
  return EncodeJsonFrame({{"type", event.name}, {"data", event.payload}});
}

std::string EncodeBinaryError(std::string_view code, std::string_view message) {
  return EncodeJsonFrame({{"type", "error"}, {"code", code}, {"message", message}});
}

std::string EncodeBinaryPong(std::int64_t timestamp_ms) {
  return EncodeJsonFrame({{"type", "pong"}, {"timestamp", timestamp_ms}});
}

std::string EncodeBinaryWelcome(const std::string& connection_id, std::int64_t timestamp_ms) {
  return EncodeJsonFrame({{"type", "welcome"}, {"connectionId", connection_id}, {"timestamp", timestamp_ms}});
}

std::string MakeBinaryDataResponse(std::int64_t timestamp_ms, std::size_t body_bytes) {
  std::string body;
  body.reserve(8 + body_bytes);
  AppendLittleEndian(body, static_cast<std::uint64_t>(timestamp_ms), 8);
  std::vector<unsigned char> random(body_bytes);
  if (body_bytes > 0 && RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  body.append(reinterpret_cast<const char*>(random.data()), random.size());
  return body;
}

}  // namespace collab
