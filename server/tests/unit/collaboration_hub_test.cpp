#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "collab/collaboration_hub.hpp"
#include "test_support.hpp"

using namespace collab;

class CollaborationHubTest : public ::testing::Test {
 protected:
  void SetUp() override {
    node_ = test::MakeNode(ioc_, store_, "n1");
    a_ = node_.Connect(sink_a_, Identity{"u-a", "alice"});
    b_ = node_.Connect(sink_b_, Identity{"u-b", "bob"});
  }

  void TearDown() override {
    node_.throttle->CancelAll();
    ioc_.restart();
    ioc_.run();
  }

  HubReply Send(const std::string& connection_id, const ClientCommand& command) {
    return node_.hub->Dispatch(connection_id, command);
  }

  void JoinBoth(const std::string& room_id = "r1") {
    ASSERT_TRUE(Send(a_, JoinRoomCommand{room_id}).ok);
    ASSERT_TRUE(Send(b_, JoinRoomCommand{room_id}).ok);
    sink_a_->Clear();
    sink_b_->Clear();
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<InMemoryStore> store_ = std::make_shared<InMemoryStore>();
  test::Node node_;
  std::shared_ptr<test::RecordingSink> sink_a_ = std::make_shared<test::RecordingSink>();
  std::shared_ptr<test::RecordingSink> sink_b_ = std::make_shared<test::RecordingSink>();
  std::string a_;
  std::string b_;
};

TEST_F(CollaborationHubTest, JoinRepliesWithMembersAndIceServers) {
  ASSERT_TRUE(Send(a_, JoinRoomCommand{"r1"}).ok);
  auto reply = Send(b_, JoinRoomCommand{"r1"});
  ASSERT_TRUE(reply.ok);
  ASSERT_TRUE(reply.event.has_value());
  EXPECT_EQ(reply.event->name, "room.joined");
  EXPECT_EQ(reply.event->payload["roomId"], "r1");
  EXPECT_EQ(reply.event->payload["connectionId"], b_);
  EXPECT_EQ(reply.event->payload["members"].size(), 2u);
  EXPECT_EQ(reply.event->payload["iceServers"].size(), 1u);
}

TEST_F(CollaborationHubTest, SecondLockerIsBusyUntilRelease) {
  JoinBoth();
  auto locked = Send(a_, LockPieceCommand{"p1"});
  ASSERT_TRUE(locked.ok);
  EXPECT_EQ(locked.event->name, "piece.locked");
  EXPECT_EQ(locked.event->payload["ttlMs"], 30000);
  ASSERT_EQ(sink_b_->EventsNamed("piece-locked").size(), 1u);
  EXPECT_TRUE(sink_a_->EventsNamed("piece-locked").empty());

  auto denied = Send(b_, LockPieceCommand{"p1"});
  EXPECT_FALSE(denied.ok);
  EXPECT_EQ(denied.error_code, "busy");

  auto released = Send(a_, UnlockPieceCommand{"p1"});
  ASSERT_TRUE(released.ok);
  EXPECT_EQ(released.event->name, "piece.unlocked");
  auto unlocked = sink_b_->EventsNamed("piece-unlocked");
  ASSERT_EQ(unlocked.size(), 1u);
  EXPECT_EQ(unlocked[0].payload["pieceId"], "p1");

  EXPECT_TRUE(Send(b_, LockPieceCommand{"p1"}).ok);
}

TEST_F(CollaborationHubTest, LocksAreScopedToTheRoom) {
  ASSERT_TRUE(Send(a_, JoinRoomCommand{"r1"}).ok);
  ASSERT_TRUE(Send(b_, JoinRoomCommand{"r2"}).ok);
  EXPECT_TRUE(Send(a_, LockPieceCommand{"p1"}).ok);
  EXPECT_TRUE(Send(b_, LockPieceCommand{"p1"}).ok);
}

TEST_F(CollaborationHubTest, MoveRequiresTheLock) {
  JoinBoth();
  auto rejected = Send(b_, MovePieceCommand{"p1", 10, 20, 90});
  EXPECT_FALSE(rejected.ok);
  EXPECT_EQ(rejected.error_code, "lock_required");
  EXPECT_TRUE(sink_a_->EventsNamed("piece-moved").empty());

  ASSERT_TRUE(Send(b_, LockPieceCommand{"p1"}).ok);
  auto moved = Send(b_, MovePieceCommand{"p1", 10, 20, 90});
  ASSERT_TRUE(moved.ok);
  EXPECT_EQ(moved.event->name, "piece.move-confirmed");
  EXPECT_EQ(moved.event->payload["x"], 10);

  auto seen = sink_a_->EventsNamed("piece-moved");
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].payload["pieceId"], "p1");
  EXPECT_EQ(seen[0].payload["y"], 20);
  EXPECT_EQ(seen[0].payload["rotation"], 90);
  EXPECT_EQ(seen[0].payload["username"], "bob");
  EXPECT_TRUE(sink_b_->EventsNamed("piece-moved").empty());
}

TEST_F(CollaborationHubTest, UnlockByNonHolderFails) {
  JoinBoth();
  ASSERT_TRUE(Send(a_, LockPieceCommand{"p1"}).ok);
  auto reply = Send(b_, UnlockPieceCommand{"p1"});
  EXPECT_FALSE(reply.ok);
  EXPECT_EQ(reply.error_code, "not_lock_holder");
  EXPECT_TRUE(node_.locks->IsHeldBy(LockObjectId("r1", "p1"), a_));
}

TEST_F(CollaborationHubTest, LockStoreOutageIsReported) {
  JoinBoth();
  store_->SetAvailable(false);
  auto reply = Send(a_, LockPieceCommand{"p1"});
  store_->SetAvailable(true);
  EXPECT_FALSE(reply.ok);
  EXPECT_EQ(reply.error_code, "lock_unavailable");
}

TEST_F(CollaborationHubTest, ChatIsTrimmedAndEchoedToSender) {
  JoinBoth();
  auto reply = Send(a_, SendChatCommand{"  hello there \n"});
  ASSERT_TRUE(reply.ok);
  EXPECT_EQ(reply.event->name, "chat.sent");
  auto id = reply.event->payload["id"].get<std::string>();
  EXPECT_FALSE(id.empty());

  for (const auto& sink : {sink_a_, sink_b_}) {
    auto chats = sink->EventsNamed("chat-message");
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_EQ(chats[0].payload["message"], "hello there");
    EXPECT_EQ(chats[0].payload["id"], id);
    EXPECT_EQ(chats[0].payload["userId"], "u-a");
  }
}

TEST_F(CollaborationHubTest, ChatLengthIsValidated) {
  JoinBoth();
  EXPECT_EQ(Send(a_, SendChatCommand{"   "}).error_code, "invalid_message");
  EXPECT_EQ(Send(a_, SendChatCommand{std::string(1001, 'x')}).error_code, "invalid_message");
  EXPECT_TRUE(Send(a_, SendChatCommand{std::string(1000, 'x')}).ok);
  EXPECT_EQ(sink_b_->EventsNamed("chat-message").size(), 1u);
}

TEST_F(CollaborationHubTest, RoomCommandsRequireMembership) {
  EXPECT_EQ(Send(a_, LockPieceCommand{"p1"}).error_code, "not_in_room");
  EXPECT_EQ(Send(a_, MovePieceCommand{"p1", 1, 1, 0}).error_code, "not_in_room");
  EXPECT_EQ(Send(a_, SendChatCommand{"hi"}).error_code, "not_in_room");
  EXPECT_EQ(Send(a_, EmitCustomCommand{"poke", nullptr}).error_code, "not_in_room");
  EXPECT_EQ(Send(a_, ListMembersCommand{}).error_code, "not_in_room");
}

TEST_F(CollaborationHubTest, CustomEventsGoToOthers) {
  JoinBoth();
  auto reply = Send(a_, EmitCustomCommand{"drawing", nlohmann::json{{"stroke", 3}}});
  ASSERT_TRUE(reply.ok);
  EXPECT_EQ(reply.event->name, "event.emitted");
  auto seen = sink_b_->EventsNamed("custom-event");
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].payload["event"], "drawing");
  EXPECT_EQ(seen[0].payload["data"]["stroke"], 3);
  EXPECT_TRUE(sink_a_->EventsNamed("custom-event").empty());
}

TEST_F(CollaborationHubTest, ListMembersAndLeave) {
  JoinBoth();
  auto members = Send(a_, ListMembersCommand{});
  ASSERT_TRUE(members.ok);
  EXPECT_EQ(members.event->name, "room.members");
  EXPECT_EQ(members.event->payload["members"].size(), 2u);

  auto left = Send(b_, LeaveRoomCommand{});
  ASSERT_TRUE(left.ok);
  EXPECT_EQ(left.event->payload["roomId"], "r1");
  EXPECT_EQ(left.event->payload["left"], true);
  ASSERT_EQ(sink_a_->EventsNamed("user-left").size(), 1u);

  auto again = Send(b_, LeaveRoomCommand{});
  EXPECT_TRUE(again.ok);
  EXPECT_EQ(again.event->payload["left"], false);
  EXPECT_TRUE(again.event->payload["roomId"].is_null());
}

TEST_F(CollaborationHubTest, CursorUpdatesAreCoalesced) {
  JoinBoth();
  for (int i = 0; i < 100; ++i) {
    auto reply = Send(a_, UpdateCursorCommand{i, i * 2});
    EXPECT_TRUE(reply.ok);
    EXPECT_FALSE(reply.event.has_value());
  }
  ioc_.run_for(std::chrono::milliseconds(100));

  auto cursors = sink_b_->EventsNamed("cursor-update");
  ASSERT_EQ(cursors.size(), 1u);
  EXPECT_EQ(cursors[0].payload["x"], 99);
  EXPECT_EQ(cursors[0].payload["y"], 198);
  EXPECT_TRUE(sink_a_->EventsNamed("cursor-update").empty());
}

TEST_F(CollaborationHubTest, PendingCursorIsFlushedBeforeLeaving) {
  JoinBoth();
  ASSERT_TRUE(Send(a_, UpdateCursorCommand{7, 8}).ok);
  ASSERT_TRUE(Send(a_, LeaveRoomCommand{}).ok);

  auto events = sink_b_->Events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].name, "cursor-update");
  EXPECT_EQ(events[1].name, "user-left");
  EXPECT_EQ(node_.throttle->ActiveStreams(), 0u);
}

TEST_F(CollaborationHubTest, CursorResumesAfterRejoining) {
  JoinBoth();
  ASSERT_TRUE(Send(a_, LeaveRoomCommand{}).ok);
  EXPECT_TRUE(node_.throttle->IsClosed(a_));
  ASSERT_TRUE(Send(a_, JoinRoomCommand{"r1"}).ok);
  EXPECT_FALSE(node_.throttle->IsClosed(a_));

  sink_b_->Clear();
  ASSERT_TRUE(Send(a_, UpdateCursorCommand{3, 4}).ok);
  ioc_.run_for(std::chrono::milliseconds(100));
  auto cursors = sink_b_->EventsNamed("cursor-update");
  ASSERT_EQ(cursors.size(), 1u);
  EXPECT_EQ(cursors[0].payload["x"], 3);
}

TEST_F(CollaborationHubTest, CursorOutsideRoomIsIgnored) {
  auto reply = Send(a_, UpdateCursorCommand{1, 2});
  EXPECT_TRUE(reply.ok);
  EXPECT_FALSE(reply.event.has_value());
  EXPECT_EQ(node_.throttle->ActiveStreams(), 0u);
}

TEST_F(CollaborationHubTest, SignalsAreRelayedThroughTheHub) {
  auto reply = Send(a_, RelaySignalCommand{SignalKind::kCallRequest, b_, nlohmann::json{{"video", true}}});
  ASSERT_TRUE(reply.ok);
  EXPECT_EQ(reply.event->name, "call.relayed");
  EXPECT_EQ(reply.event->payload["kind"], "call.request");
  auto incoming = sink_b_->EventsNamed("call-incoming");
  ASSERT_EQ(incoming.size(), 1u);
  EXPECT_EQ(incoming[0].payload["from"], a_);
  EXPECT_EQ(incoming[0].payload["request"]["video"], true);
}
