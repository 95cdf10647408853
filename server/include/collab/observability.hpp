/*
 * 설명: 구조화 로그, 메트릭 카운터, 저하 모드 신호, 수명주기 이벤트 전파를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace collab {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> connection_id;
  std::optional<std::string> room_id;
  std::optional<std::string> user_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t connections_active{0};
  std::uint64_t rooms_active{0};
  std::uint64_t broadcasts{0};
  std::uint64_t publish_failures{0};
  std::uint64_t locks_acquired{0};
  std::uint64_t locks_denied{0};
  std::uint64_t protocol_errors{0};
  std::uint64_t throttle_streams{0};
  bool degraded{false};
};

enum class LifecycleKind { kConnectionOpened, kConnectionClosed, kLockAcquired, kLockDenied };

const char* ToString(LifecycleKind kind);

struct LifecycleEvent {
  LifecycleKind kind;
  std::string connection_id;
  std::string subject;
  std::string detail;
  std::chrono::system_clock::time_point at;
};

class Observability {
 public:
  using LifecycleListener = std::function<void(const LifecycleEvent&)>;

  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementBroadcast() { broadcasts_.fetch_add(1); }
  void IncrementPublishFailure() { publish_failures_.fetch_add(1); }
  void IncrementProtocolError() { protocol_errors_.fetch_add(1); }
  void SetConnectionsActive(std::uint64_t count) { connections_active_.store(count); }
  void SetRoomsActive(std::uint64_t count) { rooms_active_.store(count); }
  void SetThrottleStreams(std::uint64_t count) { throttle_streams_.store(count); }

  void SetDegraded(bool degraded, const std::string& reason);
  bool IsDegraded() const { return degraded_.load(); }

  void AddLifecycleListener(LifecycleListener listener);
  void EmitLifecycle(const LifecycleEvent& event);

  MetricsSnapshot Snapshot() const;
  nlohmann::json SnapshotJson() const;
  void Log(const LogContext& ctx) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> connections_active_{0};
  std::atomic<std::uint64_t> rooms_active_{0};
  std::atomic<std::uint64_t> broadcasts_{0};
  std::atomic<std::uint64_t> publish_failures_{0};
  std::atomic<std::uint64_t> locks_acquired_{0};
  std::atomic<std::uint64_t> locks_denied_{0};
  std::atomic<std::uint64_t> protocol_errors_{0};
  std::atomic<std::uint64_t> throttle_streams_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<bool> degraded_{false};
  mutable std::mutex log_mutex_;
  std::mutex listener_mutex_;
  std::vector<LifecycleListener> listeners_;
};

}  // namespace collab
