#include <gtest/gtest.h>

#include "collab/api_response.hpp"
#include "collab/native_protocol.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = collab::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = collab::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
  EXPECT_TRUE(env["error"]["detail"].is_null());
}

TEST(JsonEnvelopeTest, ErrorDetailIsCarried) {
  auto env = collab::MakeErrorEnvelope("server_draining", "종료 중", {{"instanceId", "node-a"}});
  EXPECT_EQ(env["error"]["detail"]["instanceId"], "node-a");
}

TEST(JsonEnvelopeTest, WsEventAndErrorShape) {
  auto event = nlohmann::json::parse(collab::EncodeNativeEvent(collab::ServerEvent{"room.joined", {{"roomId", "r1"}}}, 7));
  EXPECT_EQ(event["t"], "event");
  EXPECT_EQ(event["seq"], 7);
  EXPECT_EQ(event["event"], "room.joined");
  EXPECT_EQ(event["p"]["roomId"], "r1");

  auto error = nlohmann::json::parse(collab::EncodeNativeError("not_in_room", "방 없음", 3));
  EXPECT_EQ(error["t"], "error");
  EXPECT_EQ(error["seq"], 3);
  EXPECT_TRUE(error["event"].is_null());
  EXPECT_EQ(error["p"]["code"], "not_in_room");
}
