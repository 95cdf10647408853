#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "collab/throttle.hpp"

using namespace collab;
using namespace std::chrono_literals;

namespace {
CollabEvent Cursor(const std::string& connection_id, int x) {
  CollabEvent event;
  event.meta.scope_id = "r1";
  event.meta.origin_connection_id = connection_id;
  event.body = CursorMoved{x, 0};
  return event;
}

struct Flushed {
  std::string connection_id;
  std::string room_id;
  int x{0};
};
}  // namespace

class ThrottleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    throttle_->SetFlushHandler([this](const std::string& connection_id, const std::string& room_id,
                                      const CollabEvent& event) {
      std::lock_guard<std::mutex> lock(mutex_);
      flushed_.push_back(Flushed{connection_id, room_id, std::get<CursorMoved>(event.body).x});
    });
  }

  void TearDown() override {
    throttle_->CancelAll();
    ioc_.restart();
    ioc_.run();
  }

  std::vector<Flushed> FlushedSoFar() {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushed_;
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<Observability> observability_ = std::make_shared<Observability>(LogLevel::kError);
  std::shared_ptr<ThrottlePipeline> throttle_ = std::make_shared<ThrottlePipeline>(ioc_, 20ms, observability_);
  std::mutex mutex_;
  std::vector<Flushed> flushed_;
};

TEST_F(ThrottleTest, BurstCollapsesToLatestValue) {
  for (int i = 0; i < 100; ++i) {
    throttle_->Submit("c1", "r1", "cursor", Cursor("c1", i));
  }
  ioc_.run_for(100ms);

  auto flushed = FlushedSoFar();
  ASSERT_EQ(flushed.size(), 1u);
  EXPECT_EQ(flushed[0].connection_id, "c1");
  EXPECT_EQ(flushed[0].room_id, "r1");
  EXPECT_EQ(flushed[0].x, 99);
}

TEST_F(ThrottleTest, StreamsAreKeyedByConnectionAndKey) {
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 1));
  throttle_->Submit("c1", "r1", "viewport", Cursor("c1", 2));
  throttle_->Submit("c2", "r1", "cursor", Cursor("c2", 3));
  EXPECT_EQ(throttle_->ActiveStreams(), 3u);
  EXPECT_EQ(observability_->Snapshot().throttle_streams, 3u);

  ioc_.run_for(100ms);
  EXPECT_EQ(FlushedSoFar().size(), 3u);
}

TEST_F(ThrottleTest, IdleTicksSendNothing) {
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 1));
  ioc_.run_for(100ms);
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 2));
  ioc_.run_for(100ms);

  auto flushed = FlushedSoFar();
  ASSERT_EQ(flushed.size(), 2u);
  EXPECT_EQ(flushed[1].x, 2);
}

TEST_F(ThrottleTest, DrainFlushesPendingValueImmediately) {
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 5));
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 6));
  throttle_->Drain("c1");

  auto flushed = FlushedSoFar();
  ASSERT_EQ(flushed.size(), 1u);
  EXPECT_EQ(flushed[0].x, 6);
  EXPECT_EQ(throttle_->ActiveStreams(), 0u);

  ioc_.run_for(60ms);
  EXPECT_EQ(FlushedSoFar().size(), 1u);
}

TEST_F(ThrottleTest, CancelDropsPendingValue) {
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 5));
  throttle_->Submit("c2", "r1", "cursor", Cursor("c2", 9));
  throttle_->Cancel("c1");
  EXPECT_EQ(throttle_->ActiveStreams(), 1u);

  ioc_.run_for(60ms);
  auto flushed = FlushedSoFar();
  ASSERT_EQ(flushed.size(), 1u);
  EXPECT_EQ(flushed[0].connection_id, "c2");
}

TEST_F(ThrottleTest, SubmitAfterCancelIsIgnored) {
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 1));
  throttle_->Cancel("c1");
  // 종료 처리와 경합해 늦게 도착한 값은 스트림을 되살리지 않는다.
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 2));
  EXPECT_TRUE(throttle_->IsClosed("c1"));
  EXPECT_EQ(throttle_->ActiveStreams(), 0u);
  EXPECT_EQ(observability_->Snapshot().throttle_streams, 0u);

  ioc_.run_for(60ms);
  EXPECT_TRUE(FlushedSoFar().empty());
}

TEST_F(ThrottleTest, DrainedConnectionResumesAfterReopen) {
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 1));
  throttle_->Drain("c1");
  throttle_->Submit("c1", "r1", "cursor", Cursor("c1", 2));
  EXPECT_EQ(throttle_->ActiveStreams(), 0u);

  throttle_->Reopen("c1");
  EXPECT_FALSE(throttle_->IsClosed("c1"));
  throttle_->Submit("c1", "r2", "cursor", Cursor("c1", 3));
  ioc_.run_for(100ms);

  auto flushed = FlushedSoFar();
  ASSERT_EQ(flushed.size(), 2u);
  EXPECT_EQ(flushed[0].x, 1);
  EXPECT_EQ(flushed[1].room_id, "r2");
  EXPECT_EQ(flushed[1].x, 3);
}
