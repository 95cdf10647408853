/*
 * 설명: 클라이언트 요청을 프로토콜과 무관한 명령(닫힌 variant)으로 디코딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/command_test.cpp
 */
#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "collab/event.hpp"

namespace collab {

struct JoinRoomCommand {
  std::string room_id;
};
struct LeaveRoomCommand {};
struct MovePieceCommand {
  std::string piece_id;
  int x{0};
  int y{0};
  int rotation{0};
};
struct LockPieceCommand {
  std::string piece_id;
};
struct UnlockPieceCommand {
  std::string piece_id;
};
struct SendChatCommand {
  std::string text;
};
struct UpdateCursorCommand {
  int x{0};
  int y{0};
};
struct EmitCustomCommand {
  std::string name;
  nlohmann::json data;
};
struct RelaySignalCommand {
  SignalKind kind{SignalKind::kOffer};
  std::string to_connection_id;
  nlohmann::json payload;
};
struct ListMembersCommand {};

using ClientCommand = std::variant<JoinRoomCommand, LeaveRoomCommand, MovePieceCommand, LockPieceCommand,
                                   UnlockPieceCommand, SendChatCommand, UpdateCursorCommand, EmitCustomCommand,
                                   RelaySignalCommand, ListMembersCommand>;

bool DecodeCommand(const std::string& name, const nlohmann::json& payload, ClientCommand& out,
                   std::string& error_code, std::string& error_message);
std::string CommandName(const ClientCommand& command);

}  // namespace collab
