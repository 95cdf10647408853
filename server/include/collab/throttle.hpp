/*
 * 설명: 연결별 고빈도 스트림(커서 등)을 틱 단위로 병합해 마지막 값만 브로드캐스트한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/throttle_test.cpp
 */
#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "collab/event.hpp"
#include "collab/observability.hpp"

namespace collab {

class ThrottlePipeline : public std::enable_shared_from_this<ThrottlePipeline> {
 public:
  using FlushHandler =
      std::function<void(const std::string& connection_id, const std::string& room_id, const CollabEvent& event)>;

  ThrottlePipeline(boost::asio::io_context& ioc, std::chrono::milliseconds tick,
                   std::shared_ptr<Observability> observability);

  void SetFlushHandler(FlushHandler handler);

  // 첫 제출 시 (연결, 스트림 키)별 큐와 틱 작업을 만든다. 이전 미전송 값은 덮어쓴다.
  void Submit(const std::string& connection_id, const std::string& room_id, const std::string& stream_key,
              const CollabEvent& event);
  // 남은 값을 즉시 내보낸 뒤 연결의 모든 스트림을 해체한다.
  // Drain/Cancel 이후의 Submit은 Reopen 전까지 무시된다.
  void Drain(const std::string& connection_id);
  void Cancel(const std::string& connection_id);
  void Reopen(const std::string& connection_id);
  bool IsClosed(const std::string& connection_id) const;
  void CancelAll();

  std::size_t ActiveStreams() const;
  std::chrono::milliseconds Tick() const { return tick_; }

 private:
  struct Pending {
    std::string room_id;
    CollabEvent event;
  };

  struct Stream : public std::enable_shared_from_this<Stream> {
    std::string connection_id;
    std::string key;
    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer timer;
    std::optional<Pending> pending;
    bool stopped{false};
    std::mutex mutex;

    explicit Stream(boost::asio::io_context& ioc) : strand(boost::asio::make_strand(ioc)), timer(ioc) {}
  };

  void ScheduleTick(const std::shared_ptr<Stream>& stream);
  void HandleTick(const std::shared_ptr<Stream>& stream);
  void StopStream(const std::shared_ptr<Stream>& stream);
  void Flush(const std::string& connection_id, const Pending& pending);
  void UpdateGauge();
  // mutex_를 잡은 상태에서 호출한다.
  void MarkClosedLocked(const std::string& connection_id);

  boost::asio::io_context& ioc_;
  std::chrono::milliseconds tick_;
  std::shared_ptr<Observability> observability_;
  FlushHandler flush_handler_;
  std::unordered_map<std::string, std::map<std::string, std::shared_ptr<Stream>>> streams_;
  std::size_t stream_count_{0};
  std::unordered_set<std::string> closed_;
  std::deque<std::string> closed_order_;
  mutable std::mutex mutex_;
};

}  // namespace collab
