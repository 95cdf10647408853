/*
 * 설명: Redis 기반 공유 저장소(원자적 리스, 집합, 패턴 구독)를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/redis_store_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <sw/redis++/redis++.h>

#include "collab/observability.hpp"
#include "collab/shared_store.hpp"

namespace collab {

struct RedisConfig {
  std::string host;
  unsigned short port;
  std::string password;
  std::chrono::milliseconds timeout{std::chrono::milliseconds(500)};
  std::size_t pool_size{4};
};

class RedisStore : public SharedStore {
 public:
  // observability가 없으면 구독 스레드의 오류는 기록되지 않는다.
  explicit RedisStore(const RedisConfig& config, std::shared_ptr<Observability> observability = nullptr);
  ~RedisStore() override;

  bool AcquireLease(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) override;
  bool ReleaseLease(const std::string& key, const std::string& owner) override;
  std::optional<std::string> Get(const std::string& key) override;
  bool Delete(const std::string& key) override;

  void SetAdd(const std::string& key, const std::string& member, std::chrono::milliseconds ttl) override;
  void SetRemove(const std::string& key, const std::string& member) override;
  std::vector<std::string> SetMembers(const std::string& key) override;

  std::size_t Publish(const std::string& channel, const std::string& payload) override;
  SubscriptionId Subscribe(const std::string& pattern, MessageHandler handler) override;
  void Unsubscribe(SubscriptionId id) override;

  bool Ping() override;

 private:
  struct SubscriptionWorker {
    std::string pattern;
    MessageHandler handler;
    std::atomic<bool> running{true};
    std::thread thread;
  };

  template <typename Fn>
  auto Call(const char* op, Fn&& fn) -> decltype(fn());
  void ConsumeLoop(SubscriptionWorker* worker);
  void LogSubscriptionError(const std::string& name, const std::string& detail) const;

  RedisConfig config_;
  std::shared_ptr<Observability> observability_;
  std::unique_ptr<sw::redis::Redis> redis_;
  SubscriptionId next_subscription_id_{1};
  std::map<SubscriptionId, std::unique_ptr<SubscriptionWorker>> workers_;
  std::mutex mutex_;
};

}  // namespace collab
