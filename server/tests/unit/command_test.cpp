#include <gtest/gtest.h>

#include "collab/command.hpp"

using namespace collab;

namespace {
struct Decoded {
  bool ok;
  ClientCommand command;
  std::string error_code;
};

Decoded Decode(const std::string& name, const nlohmann::json& payload) {
  Decoded decoded{};
  std::string message;
  decoded.ok = DecodeCommand(name, payload, decoded.command, decoded.error_code, message);
  return decoded;
}
}  // namespace

TEST(CommandTest, DecodesRoomCommands) {
  auto join = Decode("room.join", {{"roomId", "r1"}});
  ASSERT_TRUE(join.ok);
  EXPECT_EQ(std::get<JoinRoomCommand>(join.command).room_id, "r1");

  EXPECT_TRUE(std::holds_alternative<LeaveRoomCommand>(Decode("room.leave", nullptr).command));
  EXPECT_TRUE(std::holds_alternative<ListMembersCommand>(Decode("room.members", nullptr).command));
  EXPECT_EQ(Decode("room.join", nlohmann::json::object()).error_code, "bad_request");
  EXPECT_EQ(Decode("room.join", {{"roomId", 7}}).error_code, "bad_request");
}

TEST(CommandTest, MoveValidatesCoordinatesAndRotation) {
  auto move = Decode("piece.move", {{"pieceId", "p1"}, {"x", 10.4}, {"y", -3}, {"rotation", 180}});
  ASSERT_TRUE(move.ok);
  const auto& cmd = std::get<MovePieceCommand>(move.command);
  EXPECT_EQ(cmd.piece_id, "p1");
  EXPECT_EQ(cmd.x, 10);
  EXPECT_EQ(cmd.y, -3);
  EXPECT_EQ(cmd.rotation, 180);

  auto default_rotation = Decode("piece.move", {{"pieceId", "p1"}, {"x", 1}, {"y", 2}});
  ASSERT_TRUE(default_rotation.ok);
  EXPECT_EQ(std::get<MovePieceCommand>(default_rotation.command).rotation, 0);

  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", 1}, {"y", 2}, {"rotation", 45}}).error_code,
            "bad_request");
  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", "1"}, {"y", 2}}).error_code, "bad_request");
  EXPECT_EQ(Decode("piece.move", {{"x", 1}, {"y", 2}}).error_code, "bad_request");
}

TEST(CommandTest, MoveRejectsOutOfRangeNumbers) {
  // 2^32 + 90은 int로 자르면 90이 되므로 범위 검사로 막아야 한다.
  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", 1}, {"y", 2}, {"rotation", 4294967386LL}}).error_code,
            "bad_request");
  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", 1}, {"y", 2}, {"rotation", 1e300}}).error_code,
            "bad_request");
  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", 1}, {"y", 2}, {"rotation", 90.5}}).error_code,
            "bad_request");
  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", 3e9}, {"y", 2}}).error_code, "bad_request");
  EXPECT_EQ(Decode("piece.move", {{"pieceId", "p1"}, {"x", 1}, {"y", -3e9}}).error_code, "bad_request");
  EXPECT_EQ(Decode("cursor.update", {{"x", 1e300}, {"y", 2}}).error_code, "bad_request");

  auto integral = Decode("piece.move", {{"pieceId", "p1"}, {"x", 2147483647}, {"y", 2}, {"rotation", 270.0}});
  ASSERT_TRUE(integral.ok);
  EXPECT_EQ(std::get<MovePieceCommand>(integral.command).x, 2147483647);
  EXPECT_EQ(std::get<MovePieceCommand>(integral.command).rotation, 270);
}

TEST(CommandTest, LockAndUnlockNeedPieceId) {
  auto lock = Decode("piece.lock", {{"pieceId", "p9"}});
  ASSERT_TRUE(lock.ok);
  EXPECT_EQ(std::get<LockPieceCommand>(lock.command).piece_id, "p9");
  auto unlock = Decode("piece.unlock", {{"pieceId", "p9"}});
  ASSERT_TRUE(unlock.ok);
  EXPECT_EQ(std::get<UnlockPieceCommand>(unlock.command).piece_id, "p9");
  EXPECT_EQ(Decode("piece.lock", {{"pieceId", ""}}).error_code, "bad_request");
}

TEST(CommandTest, ChatWithoutMessageIsInvalid) {
  auto chat = Decode("chat.send", {{"message", " hi "}});
  ASSERT_TRUE(chat.ok);
  EXPECT_EQ(std::get<SendChatCommand>(chat.command).text, " hi ");
  EXPECT_EQ(Decode("chat.send", nlohmann::json::object()).error_code, "invalid_message");
  EXPECT_EQ(Decode("chat.send", {{"message", 12}}).error_code, "invalid_message");
}

TEST(CommandTest, CustomEventKeepsData) {
  auto emit = Decode("event.emit", {{"event", "drawing"}, {"data", {{"points", {1, 2, 3}}}}});
  ASSERT_TRUE(emit.ok);
  const auto& cmd = std::get<EmitCustomCommand>(emit.command);
  EXPECT_EQ(cmd.name, "drawing");
  EXPECT_EQ(cmd.data["points"].size(), 3u);
  EXPECT_EQ(Decode("event.emit", {{"data", 1}}).error_code, "bad_request");
}

TEST(CommandTest, SignalStripsTargetFromPayload) {
  auto offer = Decode("call.offer", {{"to", "n2.4"}, {"offer", {{"sdp", "v=0"}}}});
  ASSERT_TRUE(offer.ok);
  const auto& cmd = std::get<RelaySignalCommand>(offer.command);
  EXPECT_TRUE(cmd.kind == SignalKind::kOffer);
  EXPECT_EQ(cmd.to_connection_id, "n2.4");
  EXPECT_FALSE(cmd.payload.contains("to"));
  EXPECT_EQ(cmd.payload["offer"]["sdp"], "v=0");
  EXPECT_EQ(CommandName(offer.command), "call.offer");

  EXPECT_EQ(Decode("call.end", nlohmann::json::object()).error_code, "bad_request");
}

TEST(CommandTest, RejectsUnknownNamesAndNonObjectPayloads) {
  EXPECT_EQ(Decode("piece.teleport", nullptr).error_code, "unknown_event");
  EXPECT_EQ(Decode("room.join", nlohmann::json::array({"r1"})).error_code, "bad_request");
}

TEST(CommandTest, NamesRoundTripForEveryCommand) {
  EXPECT_EQ(CommandName(JoinRoomCommand{"r1"}), "room.join");
  EXPECT_EQ(CommandName(LeaveRoomCommand{}), "room.leave");
  EXPECT_EQ(CommandName(MovePieceCommand{}), "piece.move");
  EXPECT_EQ(CommandName(LockPieceCommand{}), "piece.lock");
  EXPECT_EQ(CommandName(UnlockPieceCommand{}), "piece.unlock");
  EXPECT_EQ(CommandName(SendChatCommand{}), "chat.send");
  EXPECT_EQ(CommandName(UpdateCursorCommand{}), "cursor.update");
  EXPECT_EQ(CommandName(EmitCustomCommand{}), "event.emit");
  EXPECT_EQ(CommandName(ListMembersCommand{}), "room.members");
}
