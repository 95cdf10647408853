/*
 * 설명: 표준 이벤트 이름과 JSON 페이로드를 검증해 명령으로 변환한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/command_test.cpp
 */
#include "collab/command.hpp"

#include <cmath>
#include <limits>

#include "collab/overloaded.hpp"

namespace collab {
namespace {
bool Fail(std::string& error_code, std::string& error_message, const char* code, const std::string& message) {
  error_code = code;
  error_message = message;
  return false;
}

bool ReadString(const nlohmann::json& payload, const char* key, std::string& out) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return !out.empty();
}

// 좌표는 반올림하고, integral_only면 소수를 거부한다. int 범위를 벗어나면 실패.
bool ReadInt(const nlohmann::json& payload, const char* key, int& out, bool integral_only = false) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_number()) {
    return false;
  }
  const double value = it->get<double>();
  if (!std::isfinite(value)) {
    return false;
  }
  const double rounded = std::round(value);
  if (integral_only && rounded != value) {
    return false;
  }
  if (rounded < static_cast<double>(std::numeric_limits<int>::min()) ||
      rounded > static_cast<double>(std::numeric_limits<int>::max())) {
    return false;
  }
  out = static_cast<int>(rounded);
  return true;
}
}  // namespace

bool DecodeCommand(const std::string& name, const nlohmann::json& payload, ClientCommand& out,
                   std::string& error_code, std::string& error_message) {
  const nlohmann::json body = payload.is_null() ? nlohmann::json::object() : payload;
  if (!body.is_object()) {
    return Fail(error_code, error_message, "bad_request", "페이로드는 객체여야 합니다");
  }

  if (name == "room.join") {
    JoinRoomCommand cmd;
    if (!ReadString(body, "roomId", cmd.room_id)) {
      return Fail(error_code, error_message, "bad_request", "roomId가 필요합니다");
    }
    out = cmd;
    return true;
  }
  if (name == "room.leave") {
    out = LeaveRoomCommand{};
    return true;
  }
  if (name == "room.members") {
    out = ListMembersCommand{};
    return true;
  }
  if (name == "piece.move") {
    MovePieceCommand cmd;
    if (!ReadString(body, "pieceId", cmd.piece_id) || !ReadInt(body, "x", cmd.x) || !ReadInt(body, "y", cmd.y)) {
      return Fail(error_code, error_message, "bad_request", "pieceId, x, y가 필요합니다");
    }
    if (body.contains("rotation") && !ReadInt(body, "rotation", cmd.rotation, true)) {
      return Fail(error_code, error_message, "bad_request", "rotation은 숫자여야 합니다");
    }
    if (cmd.rotation != 0 && cmd.rotation != 90 && cmd.rotation != 180 && cmd.rotation != 270) {
      return Fail(error_code, error_message, "bad_request", "rotation은 0, 90, 180, 270 중 하나여야 합니다");
    }
    out = cmd;
    return true;
  }
  if (name == "piece.lock" || name == "piece.unlock") {
    std::string piece_id;
    if (!ReadString(body, "pieceId", piece_id)) {
      return Fail(error_code, error_message, "bad_request", "pieceId가 필요합니다");
    }
    if (name == "piece.lock") {
      out = LockPieceCommand{piece_id};
    } else {
      out = UnlockPieceCommand{piece_id};
    }
    return true;
  }
  if (name == "chat.send") {
    auto it = body.find("message");
    if (it == body.end() || !it->is_string()) {
      return Fail(error_code, error_message, "invalid_message", "message가 필요합니다");
    }
    out = SendChatCommand{it->get<std::string>()};
    return true;
  }
  if (name == "cursor.update") {
    UpdateCursorCommand cmd;
    if (!ReadInt(body, "x", cmd.x) || !ReadInt(body, "y", cmd.y)) {
      return Fail(error_code, error_message, "bad_request", "x, y가 필요합니다");
    }
    out = cmd;
    return true;
  }
  if (name == "event.emit") {
    EmitCustomCommand cmd;
    if (!ReadString(body, "event", cmd.name)) {
      return Fail(error_code, error_message, "bad_request", "event 이름이 필요합니다");
    }
    cmd.data = body.value("data", nlohmann::json());
    out = cmd;
    return true;
  }
  if (auto kind = ParseSignalKind(name)) {
    RelaySignalCommand cmd;
    cmd.kind = *kind;
    if (!ReadString(body, "to", cmd.to_connection_id)) {
      return Fail(error_code, error_message, "bad_request", "대상 연결(to)이 필요합니다");
    }
    cmd.payload = body;
    cmd.payload.erase("to");
    out = cmd;
    return true;
  }
  return Fail(error_code, error_message, "unknown_event", "알 수 없는 이벤트: " + name);
}

std::string CommandName(const ClientCommand& command) {
  return std::visit(Overloaded{[](const JoinRoomCommand&) -> std::string { return "room.join"; },
                               [](const LeaveRoomCommand&) -> std::string { return "room.leave"; },
                               [](const MovePieceCommand&) -> std::string { return "piece.move"; },
                               [](const LockPieceCommand&) -> std::string { return "piece.lock"; },
                               [](const UnlockPieceCommand&) -> std::string { return "piece.unlock"; },
                               [](const SendChatCommand&) -> std::string { return "chat.send"; },
                               [](const UpdateCursorCommand&) -> std::string { return "cursor.update"; },
                               [](const EmitCustomCommand&) -> std::string { return "event.emit"; },
                               [](const RelaySignalCommand& cmd) -> std::string { return ToString(cmd.kind); },
                               [](const ListMembersCommand&) -> std::string { return "room.members"; }},
                    command);
}

}  // namespace collab
