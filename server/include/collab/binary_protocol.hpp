/*
 * 설명: 길이 접두 바이너리 프레임 프로토콜([4바이트 LE 길이][태그][본문])의 디코딩/인코딩 함수 쌍.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/binary_protocol_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "collab/command.hpp"
#include "collab/event.hpp"

namespace collab {

constexpr std::uint8_t kJsonFrameTag = 0x01;
constexpr std::uint8_t kRawFrameTag = 0x02;
constexpr std::size_t kBinaryResponseBodyBytes = 1024;

// 스트림에서 바이트를 모아 완성된 프레임 페이로드(태그 포함)를 꺼낸다.
class FrameDecoder {
 public:
  enum class Status { kNeedMore, kFrame, kTooLarge };

  explicit FrameDecoder(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

  void Append(const char* data, std::size_t size) { buffer_.append(data, size); }
  Status Next(std::string& payload);
  std::size_t Buffered() const { return buffer_.size(); }

 private:
  std::size_t max_frame_bytes_;
  std::string buffer_;
};

struct BinaryPing {};
struct BinaryEcho {
  nlohmann::json data;
};
struct BinaryDataRequest {};
struct BinaryAuth {
  std::string token;
};
struct BinaryRawEcho {
  std::string bytes;
};

using BinaryInbound = std::variant<BinaryPing, BinaryEcho, BinaryDataRequest, BinaryAuth, BinaryRawEcho, ClientCommand>;

bool DecodeBinaryPayload(const std::string& payload, BinaryInbound& out, std::string& error_code,
                         std::string& error_message);

std::string EncodeFrame(std::uint8_t tag, std::string_view body);
std::string EncodeJsonFrame(const nlohmann::json& message);
std::string EncodeRawFrame(std::string_view bytes);

std::string EncodeBinaryEvent(const ServerEvent& event);
std::string EncodeBinaryError(std::string_view code, std::string_view message);
std::string EncodeBinaryPong(std::int64_t timestamp_ms);
std::string EncodeBinaryWelcome(const std::string& connection_id, std::int64_t timestamp_ms);
// 8바이트 LE 타임스탬프 + 무작위 본문
std::string MakeBinaryDataResponse(std::int64_t timestamp_ms, std::size_t body_bytes = kBinaryResponseBodyBytes);

}  // namespace collab
