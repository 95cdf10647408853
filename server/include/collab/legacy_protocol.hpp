/*
 * 설명: 번호 엔벨로프 기반 레거시 텍스트 프로토콜의 디코딩/인코딩 함수 쌍과 이벤트 이름 매핑.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/legacy_protocol_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "collab/command.hpp"
#include "collab/event.hpp"

namespace collab {

enum class EnginePacket { kOpen = 0, kClose = 1, kPing = 2, kPong = 3, kMessage = 4, kUpgrade = 5, kNoop = 6 };
enum class SocketPacket { kConnect = 0, kDisconnect = 1, kEvent = 2, kAck = 3, kError = 4 };

struct LegacyPacket {
  EnginePacket engine{EnginePacket::kMessage};
  std::optional<SocketPacket> socket;
  std::string nsp{"/"};
  std::optional<std::uint64_t> ack_id;
  nlohmann::json data;
};

constexpr int kLegacyPingIntervalMs = 25000;
constexpr int kLegacyPingTimeoutMs = 60000;

bool DecodeLegacyPacket(const std::string& text, LegacyPacket& out, std::string& error_code,
                        std::string& error_message);
std::string EncodeLegacyPacket(const LegacyPacket& packet);

struct LegacyPingTest {};
using LegacyInbound = std::variant<LegacyPingTest, ClientCommand>;

// 이벤트 패킷 데이터(["name", payload])를 표준 명령으로 옮긴다.
bool TranslateLegacyEvent(const nlohmann::json& data, LegacyInbound& out, std::string& error_code,
                          std::string& error_message);
std::string LegacyEventName(const std::string& server_event_name);

std::string EncodeLegacyOpen(const std::string& sid);
std::string EncodeLegacyConnectAck(const std::string& nsp, const std::string& sid);
std::string EncodeLegacyEvent(const ServerEvent& event, const std::string& nsp = "/");
std::string EncodeLegacyAck(const std::string& nsp, std::uint64_t ack_id, const nlohmann::json& args);
std::string EncodeLegacyError(std::string_view code, std::string_view message, const std::string& nsp = "/");

}  // namespace collab
