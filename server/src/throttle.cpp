/*
 * 설명: 스트림별 strand와 steady_timer로 틱 루프를 돌려 최신 값만 전달한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/throttle_test.cpp
 */
#include "collab/throttle.hpp"

#include <algorithm>
#include <vector>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace collab {
namespace {
// 종료 표시는 Submit 경합 구간만 덮으면 되므로 오래된 것부터 버린다.
constexpr std::size_t kMaxClosedMarks = 4096;
}  // namespace

ThrottlePipeline::ThrottlePipeline(boost::asio::io_context& ioc, std::chrono::milliseconds tick,
                                   std::shared_ptr<Observability> observability)
    : ioc_(ioc), tick_(tick), observability_(std::move(observability)) {}

void ThrottlePipeline::SetFlushHandler(FlushHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  flush_handler_ = std::move(handler);
}

void ThrottlePipeline::Submit(const std::string& connection_id, const std::string& room_id,
                              const std::string& stream_key, const CollabEvent& event) {
  std::shared_ptr<Stream> stream;
  bool created = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.count(connection_id) > 0) {
      return;
    }
    auto& per_connection = streams_[connection_id];
    auto it = per_connection.find(stream_key);
    if (it == per_connection.end()) {
      stream = std::make_shared<Stream>(ioc_);
      stream->connection_id = connection_id;
      stream->key = stream_key;
      per_connection.emplace(stream_key, stream);
      ++stream_count_;
      created = true;
    } else {
      stream = it->second;
    }
  }
  {
    std::lock_guard<std::mutex> lock(stream->mutex);
    stream->pending = Pending{room_id, event};
  }
  if (created) {
    UpdateGauge();
    boost::asio::post(stream->strand, [self = shared_from_this(), stream]() { self->ScheduleTick(stream); });
  }
}

void ThrottlePipeline::ScheduleTick(const std::shared_ptr<Stream>& stream) {
  {
    std::lock_guard<std::mutex> lock(stream->mutex);
    if (stream->stopped) {
      return;
    }
  }
  stream->timer.expires_after(tick_);
  auto self = shared_from_this();
  stream->timer.async_wait(
      boost::asio::bind_executor(stream->strand, [self, stream](const boost::system::error_code& ec) {
        if (!ec) {
          self->HandleTick(stream);
        }
      }));
}

void ThrottlePipeline::HandleTick(const std::shared_ptr<Stream>& stream) {
  std::optional<Pending> pending;
  {
    std::lock_guard<std::mutex> lock(stream->mutex);
    if (stream->stopped) {
      return;
    }
    pending.swap(stream->pending);
  }
  // 틱 사이에 값이 없으면 빈 브로드캐스트를 보내지 않는다.
  if (pending) {
    Flush(stream->connection_id, *pending);
  }
  ScheduleTick(stream);
}

void ThrottlePipeline::Drain(const std::string& connection_id) {
  std::map<std::string, std::shared_ptr<Stream>> owned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    MarkClosedLocked(connection_id);
    auto it = streams_.find(connection_id);
    if (it == streams_.end()) {
      return;
    }
    owned.swap(it->second);
    streams_.erase(it);
    stream_count_ -= owned.size();
  }
  for (auto& [key, stream] : owned) {
    std::optional<Pending> pending;
    {
      std::lock_guard<std::mutex> lock(stream->mutex);
      pending.swap(stream->pending);
    }
    StopStream(stream);
    if (pending) {
      Flush(connection_id, *pending);
    }
  }
  UpdateGauge();
}

void ThrottlePipeline::Cancel(const std::string& connection_id) {
  std::map<std::string, std::shared_ptr<Stream>> owned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    MarkClosedLocked(connection_id);
    auto it = streams_.find(connection_id);
    if (it == streams_.end()) {
      return;
    }
    owned.swap(it->second);
    streams_.erase(it);
    stream_count_ -= owned.size();
  }
  for (auto& [key, stream] : owned) {
    StopStream(stream);
  }
  UpdateGauge();
}

void ThrottlePipeline::Reopen(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.erase(connection_id) > 0) {
    closed_order_.erase(std::find(closed_order_.begin(), closed_order_.end(), connection_id));
  }
}

bool ThrottlePipeline::IsClosed(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_.count(connection_id) > 0;
}

void ThrottlePipeline::MarkClosedLocked(const std::string& connection_id) {
  if (!closed_.insert(connection_id).second) {
    return;
  }
  closed_order_.push_back(connection_id);
  if (closed_order_.size() > kMaxClosedMarks) {
    closed_.erase(closed_order_.front());
    closed_order_.pop_front();
  }
}

void ThrottlePipeline::CancelAll() {
  std::vector<std::shared_ptr<Stream>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [connection_id, per_connection] : streams_) {
      for (auto& [key, stream] : per_connection) {
        all.push_back(stream);
      }
    }
    streams_.clear();
    stream_count_ = 0;
  }
  for (auto& stream : all) {
    StopStream(stream);
  }
  UpdateGauge();
}

void ThrottlePipeline::StopStream(const std::shared_ptr<Stream>& stream) {
  {
    std::lock_guard<std::mutex> lock(stream->mutex);
    stream->stopped = true;
    stream->pending.reset();
  }
  // 타이머는 strand 안에서만 만진다.
  boost::asio::post(stream->strand, [stream]() { stream->timer.cancel(); });
}

void ThrottlePipeline::Flush(const std::string& connection_id, const Pending& pending) {
  FlushHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = flush_handler_;
  }
  if (handler) {
    handler(connection_id, pending.room_id, pending.event);
  }
}

std::size_t ThrottlePipeline::ActiveStreams() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_count_;
}

void ThrottlePipeline::UpdateGauge() {
  if (observability_) {
    observability_->SetThrottleStreams(ActiveStreams());
  }
}

}  // namespace collab
