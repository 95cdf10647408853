#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "collab/session_coordinator.hpp"
#include "e2e_support.hpp"

namespace {

using namespace collab::test;

nlohmann::json ParseBody(const http::response<http::string_body>& res) { return nlohmann::json::parse(res.body()); }

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  EXPECT_TRUE(body["error"].is_null());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  EXPECT_EQ(body["error"]["code"].get<std::string>(), code);
}

std::string Command(const std::string& event, std::uint64_t seq, const nlohmann::json& payload) {
  return nlohmann::json{{"t", "event"}, {"event", event}, {"seq", seq}, {"p", payload}}.dump();
}

// 원하는 이벤트가 올 때까지 다른 메시지는 건너뛴다.
nlohmann::json ReadUntilEvent(WsClient& ws, const std::string& event) {
  for (int i = 0; i < 20; ++i) {
    auto message = nlohmann::json::parse(ReadText(ws));
    if (message["t"] == "event" && message["event"] == event) {
      return message;
    }
  }
  ADD_FAILURE() << "이벤트를 받지 못함: " << event;
  return nlohmann::json::object();
}

nlohmann::json ReadUntilError(WsClient& ws) {
  for (int i = 0; i < 20; ++i) {
    auto message = nlohmann::json::parse(ReadText(ws));
    if (message["t"] == "error") {
      return message;
    }
  }
  ADD_FAILURE() << "오류 메시지를 받지 못함";
  return nlohmann::json::object();
}

// 서버가 닫을 때까지 받은 이벤트 이름을 모으고 마지막 읽기 오류를 돌려준다.
beast::error_code ReadUntilClosed(WsClient& ws, std::vector<std::string>& events) {
  for (int i = 0; i < 50; ++i) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    ws.read(buffer, ec);
    if (ec) {
      return ec;
    }
    auto message = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
    if (message["t"] == "event") {
      events.push_back(message["event"].get<std::string>());
    }
  }
  ADD_FAILURE() << "연결이 닫히지 않음";
  return {};
}

bool Contains(const std::vector<std::string>& events, const std::string& name) {
  for (const auto& event : events) {
    if (event == name) {
      return true;
    }
  }
  return false;
}

class CollabFlowTest : public ::testing::Test {
 protected:
  void SetUp() override { server_ = std::make_unique<InProcessServer>(MakeE2eConfig()); }

  void TearDown() override { server_.reset(); }

  std::unique_ptr<WsClient> Connect(const std::string& target, nlohmann::json& connected) {
    auto ws = OpenWs(ioc_, server_->HttpPort(), target);
    connected = nlohmann::json::parse(ReadText(*ws));
    return ws;
  }

  std::string IssueToken(const std::string& user_id, const std::string& username) {
    return server_->App().GetIdentityResolver()->Issue(user_id, username, std::chrono::hours(1));
  }

  boost::asio::io_context ioc_;
  std::unique_ptr<InProcessServer> server_;
};

TEST_F(CollabFlowTest, HealthReportsInstance) {
  auto res = Get(ioc_, server_->HttpPort(), "/api/health");
  EXPECT_EQ(res.result(), http::status::ok);
  auto body = ParseBody(res);
  ExpectSuccessEnvelope(body);
  EXPECT_EQ(body["data"]["status"], "ok");
  EXPECT_EQ(body["data"]["instanceId"], "e2e-node");
  EXPECT_FALSE(body["data"]["draining"].get<bool>());
}

TEST_F(CollabFlowTest, UnknownRouteReturnsNotFound) {
  auto res = Get(ioc_, server_->HttpPort(), "/api/nothing");
  EXPECT_EQ(res.result(), http::status::not_found);
  ExpectErrorEnvelope(ParseBody(res), "not_found");
}

TEST_F(CollabFlowTest, InvalidTokenIsRejectedBeforeUpgrade) {
  auto res = RequestUpgrade(ioc_, server_->HttpPort(), "/ws?token=forged.token");
  EXPECT_EQ(res.result(), http::status::unauthorized);
  ExpectErrorEnvelope(ParseBody(res), "unauthorized");
}

TEST_F(CollabFlowTest, ConnectedEventCarriesIdentity) {
  nlohmann::json connected;
  auto ws = Connect("/ws?token=" + IssueToken("u-alice", "alice"), connected);
  EXPECT_EQ(connected["event"], "connected");
  EXPECT_EQ(connected["p"]["userId"], "u-alice");
  EXPECT_EQ(connected["p"]["username"], "alice");
  EXPECT_EQ(connected["p"]["connectionId"].get<std::string>().rfind("e2e-node.", 0), 0U);

  nlohmann::json anonymous;
  auto guest = Connect("/ws", anonymous);
  EXPECT_TRUE(anonymous["p"]["userId"].is_null());

  CloseWs(*ws);
  CloseWs(*guest);
}

TEST_F(CollabFlowTest, TwoClientsCollaborateOnPieces) {
  nlohmann::json connected_a;
  nlohmann::json connected_b;
  auto a = Connect("/ws?token=" + IssueToken("u-alice", "alice"), connected_a);
  auto b = Connect("/ws", connected_b);
  const auto b_id = connected_b["p"]["connectionId"].get<std::string>();

  WriteText(*a, Command("room.join", 1, {{"roomId", "puzzle-1"}}));
  auto joined_a = ReadUntilEvent(*a, "room.joined");
  EXPECT_EQ(joined_a["seq"], 1);
  EXPECT_EQ(joined_a["p"]["roomId"], "puzzle-1");
  ASSERT_EQ(joined_a["p"]["iceServers"].size(), 1U);

  WriteText(*b, Command("room.join", 1, {{"roomId", "puzzle-1"}}));
  auto joined_b = ReadUntilEvent(*b, "room.joined");
  EXPECT_EQ(joined_b["p"]["members"].size(), 2U);
  auto user_joined = ReadUntilEvent(*a, "user-joined");
  EXPECT_EQ(user_joined["p"]["connectionId"], b_id);

  WriteText(*a, Command("piece.lock", 2, {{"pieceId", "p1"}}));
  auto locked = ReadUntilEvent(*a, "piece.locked");
  EXPECT_EQ(locked["p"]["pieceId"], "p1");
  EXPECT_EQ(locked["p"]["ttlMs"], 30000);
  EXPECT_EQ(ReadUntilEvent(*b, "piece-locked")["p"]["pieceId"], "p1");

  WriteText(*b, Command("piece.lock", 2, {{"pieceId", "p1"}}));
  auto busy = ReadUntilError(*b);
  EXPECT_EQ(busy["seq"], 2);
  EXPECT_EQ(busy["p"]["code"], "busy");

  WriteText(*b, Command("piece.move", 3, {{"pieceId", "p1"}, {"x", 1}, {"y", 1}}));
  EXPECT_EQ(ReadUntilError(*b)["p"]["code"], "lock_required");

  WriteText(*a, Command("piece.move", 3, {{"pieceId", "p1"}, {"x", 10.4}, {"y", 20}, {"rotation", 90}}));
  ReadUntilEvent(*a, "piece.move-confirmed");
  auto moved = ReadUntilEvent(*b, "piece-moved");
  EXPECT_EQ(moved["p"]["x"], 10);
  EXPECT_EQ(moved["p"]["y"], 20);
  EXPECT_EQ(moved["p"]["rotation"], 90);
  EXPECT_EQ(moved["p"]["userId"], "u-alice");

  WriteText(*a, Command("chat.send", 4, {{"message", "  hello  "}}));
  ReadUntilEvent(*a, "chat.sent");
  EXPECT_EQ(ReadUntilEvent(*b, "chat-message")["p"]["message"], "hello");
  EXPECT_EQ(ReadUntilEvent(*a, "chat-message")["p"]["message"], "hello");

  auto metrics = ParseBody(Get(ioc_, server_->HttpPort(), "/metrics"));
  ExpectSuccessEnvelope(metrics);
  EXPECT_EQ(metrics["data"]["connections"]["active"], 2);
  EXPECT_EQ(metrics["data"]["rooms"]["active"], 1);
  EXPECT_GE(metrics["data"]["locks"]["acquired"].get<long long>(), 1);
  EXPECT_GE(metrics["data"]["locks"]["denied"].get<long long>(), 1);

  CloseWs(*a);
  EXPECT_EQ(ReadUntilEvent(*b, "piece-unlocked")["p"]["pieceId"], "p1");
  ReadUntilEvent(*b, "user-left");

  WriteText(*b, Command("piece.lock", 5, {{"pieceId", "p1"}}));
  EXPECT_EQ(ReadUntilEvent(*b, "piece.locked")["seq"], 5);
  CloseWs(*b);
}

TEST_F(CollabFlowTest, MalformedMessagesReturnErrors) {
  nlohmann::json connected;
  auto ws = Connect("/ws", connected);

  WriteText(*ws, "{not json");
  auto parse_error = ReadUntilError(*ws);
  EXPECT_EQ(parse_error["p"]["code"], "bad_request");
  EXPECT_EQ(parse_error["seq"], 0);

  WriteText(*ws, Command("piece.teleport", 7, nlohmann::json::object()));
  auto unknown = ReadUntilError(*ws);
  EXPECT_EQ(unknown["p"]["code"], "unknown_event");
  EXPECT_EQ(unknown["seq"], 7);

  WriteText(*ws, Command("chat.send", 8, {{"message", "hi"}}));
  EXPECT_EQ(ReadUntilError(*ws)["p"]["code"], "not_in_room");

  auto metrics = ParseBody(Get(ioc_, server_->HttpPort(), "/metrics"));
  EXPECT_GE(metrics["data"]["protocolErrors"].get<long long>(), 1);
  CloseWs(*ws);
}

TEST_F(CollabFlowTest, SignalReachesTargetPeer) {
  nlohmann::json connected_a;
  nlohmann::json connected_b;
  auto a = Connect("/ws", connected_a);
  auto b = Connect("/ws", connected_b);
  const auto a_id = connected_a["p"]["connectionId"].get<std::string>();
  const auto b_id = connected_b["p"]["connectionId"].get<std::string>();

  WriteText(*a, Command("call.offer", 1, {{"to", b_id}, {"offer", {{"sdp", "v=0"}}}}));
  EXPECT_EQ(ReadUntilEvent(*a, "call.relayed")["p"]["to"], b_id);
  auto offer = ReadUntilEvent(*b, "offer");
  EXPECT_EQ(offer["p"]["from"], a_id);
  EXPECT_EQ(offer["p"]["offer"]["sdp"], "v=0");

  WriteText(*a, Command("call.offer", 2, {{"to", "e2e-node.999"}, {"offer", {{"sdp", "v=0"}}}}));
  EXPECT_EQ(ReadUntilError(*a)["p"]["code"], "peer_unavailable");

  CloseWs(*a);
  CloseWs(*b);
}

TEST_F(CollabFlowTest, ShutdownFlushesLeaveAndCloseFrames) {
  nlohmann::json connected_a;
  nlohmann::json connected_b;
  auto a = Connect("/ws", connected_a);
  auto b = Connect("/ws", connected_b);
  WriteText(*a, Command("room.join", 1, {{"roomId", "closing-room"}}));
  ReadUntilEvent(*a, "room.joined");
  WriteText(*b, Command("room.join", 1, {{"roomId", "closing-room"}}));
  ReadUntilEvent(*b, "room.joined");
  ReadUntilEvent(*a, "user-joined");

  std::thread stopper([this]() { server_->App().Stop(); });
  std::vector<std::string> events_a;
  std::vector<std::string> events_b;
  auto ec_a = ReadUntilClosed(*a, events_a);
  auto ec_b = ReadUntilClosed(*b, events_b);
  stopper.join();

  // 먼저 끊긴 쪽의 퇴장 알림은 남은 쪽에 닫기 프레임보다 먼저 도착한다.
  EXPECT_TRUE(Contains(events_a, "user-left") || Contains(events_b, "user-left"));
  EXPECT_TRUE(ec_a == websocket::error::closed) << ec_a.message();
  EXPECT_TRUE(ec_b == websocket::error::closed) << ec_b.message();
  EXPECT_TRUE(a->reason().code == websocket::close_code::going_away);
  EXPECT_EQ(std::string(a->reason().reason.data(), a->reason().reason.size()), "server_shutdown");
  EXPECT_TRUE(b->reason().code == websocket::close_code::going_away);
}

TEST_F(CollabFlowTest, DrainingServerRefusesUpgrades) {
  server_->App().GetCoordinator()->BeginDrain();

  auto health = ParseBody(Get(ioc_, server_->HttpPort(), "/api/health"));
  EXPECT_TRUE(health["data"]["draining"].get<bool>());

  auto res = RequestUpgrade(ioc_, server_->HttpPort(), "/ws");
  EXPECT_EQ(res.result(), http::status::service_unavailable);
  auto body = ParseBody(res);
  ExpectErrorEnvelope(body, "server_draining");
}

}  // namespace
