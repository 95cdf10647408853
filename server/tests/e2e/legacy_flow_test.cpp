#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "e2e_support.hpp"

namespace {

using namespace collab::test;

bool StartsWith(const std::string& text, const std::string& prefix) { return text.rfind(prefix, 0) == 0; }

std::string ReadUntilPrefix(WsClient& ws, const std::string& prefix) {
  for (int i = 0; i < 20; ++i) {
    auto text = ReadText(ws);
    if (StartsWith(text, prefix)) {
      return text;
    }
  }
  ADD_FAILURE() << "패킷을 받지 못함: " << prefix;
  return "";
}

// "42[name, data]" 이벤트 패킷에서 data를 꺼낸다.
nlohmann::json ReadLegacyEvent(WsClient& ws, const std::string& name) {
  for (int i = 0; i < 20; ++i) {
    auto text = ReadText(ws);
    if (!StartsWith(text, "42")) {
      continue;
    }
    auto args = nlohmann::json::parse(text.substr(2));
    if (args.is_array() && args.size() == 2 && args[0] == name) {
      return args[1];
    }
  }
  ADD_FAILURE() << "이벤트를 받지 못함: " << name;
  return nlohmann::json::object();
}

nlohmann::json ReadNativeEvent(WsClient& ws, const std::string& event) {
  for (int i = 0; i < 20; ++i) {
    auto message = nlohmann::json::parse(ReadText(ws));
    if (message["t"] == "event" && message["event"] == event) {
      return message["p"];
    }
  }
  ADD_FAILURE() << "이벤트를 받지 못함: " << event;
  return nlohmann::json::object();
}

class LegacyFlowTest : public ::testing::Test {
 protected:
  void SetUp() override { server_ = std::make_unique<InProcessServer>(MakeE2eConfig()); }

  void TearDown() override { server_.reset(); }

  // 엔진 오픈 패킷을 받고 기본 네임스페이스에 연결한다.
  std::unique_ptr<WsClient> ConnectLegacy(std::string& sid) {
    auto ws = OpenWs(ioc_, server_->HttpPort(), "/socket.io/?EIO=4&transport=websocket");
    auto open = ReadText(*ws);
    EXPECT_TRUE(StartsWith(open, "0{"));
    sid = nlohmann::json::parse(open.substr(1))["sid"].get<std::string>();
    WriteText(*ws, "40");
    auto ack = ReadText(*ws);
    EXPECT_TRUE(StartsWith(ack, "40{"));
    EXPECT_EQ(nlohmann::json::parse(ack.substr(2))["sid"], sid);
    return ws;
  }

  boost::asio::io_context ioc_;
  std::unique_ptr<InProcessServer> server_;
};

TEST_F(LegacyFlowTest, PollingHandshakeReturnsOpenPacket) {
  auto res = Get(ioc_, server_->HttpPort(), "/socket.io/?EIO=4&transport=polling");
  EXPECT_EQ(res.result(), http::status::ok);
  ASSERT_TRUE(StartsWith(res.body(), "0{"));
  auto handshake = nlohmann::json::parse(res.body().substr(1));
  EXPECT_TRUE(handshake["sid"].is_string());
  EXPECT_EQ(handshake["upgrades"], nlohmann::json::array({"websocket"}));
  EXPECT_EQ(handshake["pingInterval"], 25000);
}

TEST_F(LegacyFlowTest, OpenPacketAdvertisesTimers) {
  auto ws = OpenWs(ioc_, server_->HttpPort(), "/socket.io/?EIO=4&transport=websocket");
  auto open = ReadText(*ws);
  ASSERT_TRUE(StartsWith(open, "0{"));
  auto handshake = nlohmann::json::parse(open.substr(1));
  EXPECT_EQ(handshake["sid"].get<std::string>().rfind("e2e-node.", 0), 0U);
  EXPECT_EQ(handshake["pingTimeout"], 60000);
  CloseWs(*ws);
}

TEST_F(LegacyFlowTest, PingsAreAnswered) {
  std::string sid;
  auto ws = ConnectLegacy(sid);
  WriteText(*ws, "2");
  EXPECT_EQ(ReadText(*ws), "3");
  WriteText(*ws, "2probe");
  EXPECT_EQ(ReadText(*ws), "3probe");
  CloseWs(*ws);
}

TEST_F(LegacyFlowTest, JoinWithAckReturnsLegacyReply) {
  std::string sid;
  auto ws = ConnectLegacy(sid);

  WriteText(*ws, "421[\"join\",\"r1\"]");
  auto ack = ReadUntilPrefix(*ws, "431");
  auto args = nlohmann::json::parse(ack.substr(3));
  ASSERT_TRUE(args.is_array());
  ASSERT_EQ(args.size(), 1U);
  EXPECT_TRUE(args[0]["ok"].get<bool>());
  EXPECT_EQ(args[0]["event"], "joined");
  EXPECT_EQ(args[0]["data"]["roomId"], "r1");
  EXPECT_EQ(args[0]["data"]["connectionId"], sid);

  WriteText(*ws, "422[\"ping-test\"]");
  auto pong = nlohmann::json::parse(ReadUntilPrefix(*ws, "432").substr(3));
  EXPECT_EQ(pong[0]["event"], "pong-test");
  EXPECT_TRUE(pong[0]["data"]["timestamp"].is_number());

  WriteText(*ws, "423[\"message\",\"   \"]");
  auto rejected = nlohmann::json::parse(ReadUntilPrefix(*ws, "433").substr(3));
  EXPECT_FALSE(rejected[0]["ok"].get<bool>());
  EXPECT_EQ(rejected[0]["code"], "invalid_message");
  CloseWs(*ws);
}

TEST_F(LegacyFlowTest, MalformedPacketReturnsErrorPacket) {
  std::string sid;
  auto ws = ConnectLegacy(sid);
  WriteText(*ws, "42not-json");
  auto error = ReadUntilPrefix(*ws, "44");
  auto body = nlohmann::json::parse(error.substr(2));
  EXPECT_EQ(body["code"], "bad_request");
  CloseWs(*ws);
}

TEST_F(LegacyFlowTest, LegacyAndNativeClientsShareARoom) {
  std::string sid;
  auto legacy = ConnectLegacy(sid);
  auto native = OpenWs(ioc_, server_->HttpPort(), "/ws");
  ReadNativeEvent(*native, "connected");

  WriteText(*native, nlohmann::json{{"t", "event"}, {"event", "room.join"}, {"seq", 1}, {"p", {{"roomId", "mixed"}}}}
                         .dump());
  ReadNativeEvent(*native, "room.joined");

  WriteText(*legacy, "42[\"join\",{\"roomId\":\"mixed\"}]");
  ReadLegacyEvent(*legacy, "joined");
  EXPECT_EQ(ReadNativeEvent(*native, "user-joined")["connectionId"], sid);

  WriteText(*legacy, "42[\"message\",\"hello from legacy\"]");
  auto sent = ReadLegacyEvent(*legacy, "message-sent");
  EXPECT_EQ(sent["roomId"], "mixed");
  EXPECT_EQ(ReadLegacyEvent(*legacy, "chat-message")["message"], "hello from legacy");
  EXPECT_EQ(ReadNativeEvent(*native, "chat-message")["message"], "hello from legacy");

  WriteText(*native, nlohmann::json{{"t", "event"},
                                    {"event", "chat.send"},
                                    {"seq", 2},
                                    {"p", {{"message", "hello from native"}}}}
                         .dump());
  EXPECT_EQ(ReadLegacyEvent(*legacy, "chat-message")["message"], "hello from native");

  WriteText(*legacy, "41");
  EXPECT_EQ(ReadNativeEvent(*native, "user-left")["connectionId"], sid);
  CloseWs(*native);
}

}  // namespace
