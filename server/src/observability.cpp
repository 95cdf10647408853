/*
 * 설명: 구조화 로그와 메트릭 카운터, 저하 모드 전환, 수명주기 이벤트 전파를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "collab/observability.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace collab {

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

const char* ToString(LifecycleKind kind) {
  switch (kind) {
    case LifecycleKind::kConnectionOpened:
      return "connection-opened";
    case LifecycleKind::kConnectionClosed:
      return "connection-closed";
    case LifecycleKind::kLockAcquired:
      return "lock-acquired";
    case LifecycleKind::kLockDenied:
      return "lock-denied";
  }
  return "unknown";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::SetDegraded(bool degraded, const std::string& reason) {
  bool previous = degraded_.exchange(degraded);
  if (previous == degraded) {
    return;
  }
  LogContext ctx;
  ctx.name = degraded ? "degraded.enter" : "degraded.exit";
  ctx.level = degraded ? LogLevel::kWarn : LogLevel::kInfo;
  ctx.detail = reason;
  Log(ctx);
}

void Observability::AddLifecycleListener(LifecycleListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.push_back(std::move(listener));
}

void Observability::EmitLifecycle(const LifecycleEvent& event) {
  if (event.kind == LifecycleKind::kLockAcquired) {
    locks_acquired_.fetch_add(1);
  } else if (event.kind == LifecycleKind::kLockDenied) {
    locks_denied_.fetch_add(1);
  }
  std::vector<LifecycleListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners = listeners_;
  }
  // 관찰자는 전달 경로에 관여하지 않으므로 실패해도 기록만 남긴다.
  for (const auto& listener : listeners) {
    try {
      listener(event);
    } catch (const std::exception& ex) {
      LogContext ctx;
      ctx.name = "lifecycle.listener_failed";
      ctx.level = LogLevel::kWarn;
      ctx.connection_id = event.connection_id;
      ctx.detail = ex.what();
      Log(ctx);
    }
  }
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.connections_active = connections_active_.load();
  snapshot.rooms_active = rooms_active_.load();
  snapshot.broadcasts = broadcasts_.load();
  snapshot.publish_failures = publish_failures_.load();
  snapshot.locks_acquired = locks_acquired_.load();
  snapshot.locks_denied = locks_denied_.load();
  snapshot.protocol_errors = protocol_errors_.load();
  snapshot.throttle_streams = throttle_streams_.load();
  snapshot.degraded = degraded_.load();
  return snapshot;
}

nlohmann::json Observability::SnapshotJson() const {
  auto snapshot = Snapshot();
  return {{"connections", {{"active", snapshot.connections_active}}},
          {"rooms", {{"active", snapshot.rooms_active}}},
          {"broadcasts", snapshot.broadcasts},
          {"backplane", {{"publishFailures", snapshot.publish_failures}, {"degraded", snapshot.degraded}}},
          {"locks", {{"acquired", snapshot.locks_acquired}, {"denied", snapshot.locks_denied}}},
          {"protocolErrors", snapshot.protocol_errors},
          {"throttle", {{"streams", snapshot.throttle_streams}}}};
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(log_mutex_);
  std::cout << log_json.dump() << std::endl;
}

}  // namespace collab
