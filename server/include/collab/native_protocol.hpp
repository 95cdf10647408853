/*
 * 설명: 기본 WebSocket 허브 프로토콜({t, seq, event, p})의 디코딩/인코딩 함수 쌍.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_equivalence_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "collab/command.hpp"
#include "collab/event.hpp"

namespace collab {

struct NativeRequest {
  std::uint64_t seq{0};
  ClientCommand command;
};

bool DecodeNativeMessage(const std::string& text, NativeRequest& out, std::string& error_code,
                         std::string& error_message);
std::string EncodeNativeEvent(const ServerEvent& event, std::uint64_t seq = 0);
std::string EncodeNativeError(std::string_view code, std::string_view message, std::uint64_t seq = 0);

}  // namespace collab
