#include <string>

#include <gtest/gtest.h>

#include "collab/legacy_protocol.hpp"

using namespace collab;

namespace {
LegacyPacket Parse(const std::string& text) {
  LegacyPacket packet;
  std::string code;
  std::string message;
  EXPECT_TRUE(DecodeLegacyPacket(text, packet, code, message)) << text << ": " << message;
  return packet;
}

std::string ParseError(const std::string& text) {
  LegacyPacket packet;
  std::string code;
  std::string message;
  EXPECT_FALSE(DecodeLegacyPacket(text, packet, code, message)) << text;
  return code;
}

LegacyInbound Translate(const nlohmann::json& data) {
  LegacyInbound inbound;
  std::string code;
  std::string message;
  EXPECT_TRUE(TranslateLegacyEvent(data, inbound, code, message)) << message;
  return inbound;
}
}  // namespace

TEST(LegacyProtocolTest, EnginePackets) {
  EXPECT_TRUE(Parse("2").engine == EnginePacket::kPing);
  EXPECT_TRUE(Parse("2probe").engine == EnginePacket::kPing);
  EXPECT_TRUE(Parse("1").engine == EnginePacket::kClose);
  EXPECT_FALSE(Parse("3").socket.has_value());
}

TEST(LegacyProtocolTest, EventWithAckAndNamespace) {
  auto packet = Parse("42/chat,17[\"message\",\"hi\"]");
  ASSERT_TRUE(packet.socket.has_value());
  EXPECT_TRUE(*packet.socket == SocketPacket::kEvent);
  EXPECT_EQ(packet.nsp, "/chat");
  EXPECT_EQ(packet.ack_id.value_or(0), 17u);
  EXPECT_EQ(packet.data[0], "message");
  EXPECT_EQ(packet.data[1], "hi");

  auto plain = Parse("42[\"leave\"]");
  EXPECT_EQ(plain.nsp, "/");
  EXPECT_FALSE(plain.ack_id.has_value());
}

TEST(LegacyProtocolTest, ConnectPackets) {
  EXPECT_TRUE(*Parse("40").socket == SocketPacket::kConnect);
  auto with_nsp = Parse("40/admin");
  EXPECT_EQ(with_nsp.nsp, "/admin");
  EXPECT_TRUE(*Parse("41").socket == SocketPacket::kDisconnect);
}

TEST(LegacyProtocolTest, MalformedPackets) {
  EXPECT_EQ(ParseError(""), "bad_request");
  EXPECT_EQ(ParseError("x"), "bad_request");
  EXPECT_EQ(ParseError("9"), "bad_request");
  EXPECT_EQ(ParseError("4"), "bad_request");
  EXPECT_EQ(ParseError("48"), "bad_request");
  EXPECT_EQ(ParseError("42[oops"), "bad_request");
  EXPECT_EQ(ParseError("42{\"a\":1}"), "bad_request");
  EXPECT_EQ(ParseError("42[]"), "bad_request");
}

TEST(LegacyProtocolTest, EncodesPackets) {
  EXPECT_EQ(EncodeLegacyConnectAck("/", "abc"), "40{\"sid\":\"abc\"}");
  EXPECT_EQ(EncodeLegacyConnectAck("/admin", "abc"), "40/admin,{\"sid\":\"abc\"}");
  EXPECT_EQ(EncodeLegacyEvent(ServerEvent{"chat-message", {{"message", "hi"}}}),
            "42[\"chat-message\",{\"message\":\"hi\"}]");
  EXPECT_EQ(EncodeLegacyAck("/", 5, nlohmann::json{{"ok", true}}), "435[{\"ok\":true}]");
  EXPECT_EQ(EncodeLegacyError("busy", "x"), "44{\"code\":\"busy\",\"message\":\"x\"}");
}

TEST(LegacyProtocolTest, OpenHandshakeAdvertisesTimers) {
  auto open = EncodeLegacyOpen("sid1");
  ASSERT_EQ(open[0], '0');
  auto handshake = nlohmann::json::parse(open.substr(1));
  EXPECT_EQ(handshake["sid"], "sid1");
  EXPECT_EQ(handshake["pingInterval"], kLegacyPingIntervalMs);
  EXPECT_EQ(handshake["pingTimeout"], kLegacyPingTimeoutMs);
  EXPECT_EQ(handshake["upgrades"][0], "websocket");
}

TEST(LegacyProtocolTest, ReplyNamesFollowLegacyClients) {
  EXPECT_EQ(LegacyEventName("room.joined"), "joined");
  EXPECT_EQ(LegacyEventName("room.left"), "left");
  EXPECT_EQ(LegacyEventName("chat.sent"), "message-sent");
  EXPECT_EQ(LegacyEventName("piece-moved"), "piece-moved");
}

TEST(LegacyProtocolTest, TranslatesLegacyEventNames) {
  auto join = std::get<ClientCommand>(Translate(nlohmann::json::array({"join", "r1"})));
  EXPECT_EQ(std::get<JoinRoomCommand>(join).room_id, "r1");

  auto join_object = std::get<ClientCommand>(Translate(nlohmann::json::array({"join", {{"room", "r2"}}})));
  EXPECT_EQ(std::get<JoinRoomCommand>(join_object).room_id, "r2");

  auto chat = std::get<ClientCommand>(Translate(nlohmann::json::array({"message", "hello"})));
  EXPECT_EQ(std::get<SendChatCommand>(chat).text, "hello");

  auto move = std::get<ClientCommand>(
      Translate(nlohmann::json::array({"puzzle-move", {{"pieceId", "p1"}, {"x", 3}, {"y", 4}}})));
  EXPECT_EQ(std::get<MovePieceCommand>(move).x, 3);

  auto cursor = std::get<ClientCommand>(Translate(nlohmann::json::array({"cursor-update", {{"x", 1}, {"y", 2}}})));
  EXPECT_EQ(std::get<UpdateCursorCommand>(cursor).y, 2);

  auto leave = std::get<ClientCommand>(Translate(nlohmann::json::array({"leave"})));
  EXPECT_TRUE(std::holds_alternative<LeaveRoomCommand>(leave));
  EXPECT_TRUE(std::holds_alternative<LegacyPingTest>(Translate(nlohmann::json::array({"ping-test"}))));
}

TEST(LegacyProtocolTest, CanonicalAndCustomNames) {
  auto lock = std::get<ClientCommand>(Translate(nlohmann::json::array({"piece.lock", {{"pieceId", "p1"}}})));
  EXPECT_EQ(std::get<LockPieceCommand>(lock).piece_id, "p1");

  auto custom = std::get<ClientCommand>(Translate(nlohmann::json::array({"drawing", {{"stroke", 1}}})));
  const auto& emit = std::get<EmitCustomCommand>(custom);
  EXPECT_EQ(emit.name, "drawing");
  EXPECT_EQ(emit.data["stroke"], 1);

  LegacyInbound inbound;
  std::string code;
  std::string message;
  EXPECT_FALSE(TranslateLegacyEvent(nlohmann::json::array({"piece.lock", nlohmann::json::object()}), inbound, code,
                                    message));
  EXPECT_EQ(code, "bad_request");
  EXPECT_FALSE(TranslateLegacyEvent(nlohmann::json::array({"join"}), inbound, code, message));
}
