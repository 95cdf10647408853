/*
 * 설명: 인스턴스 간 공유되는 키-값/발행-구독 저장소 추상화와 메모리 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/shared_store_test.cpp, server/tests/it/redis_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace collab {

class StoreException : public std::runtime_error {
 public:
  StoreException(const std::string& message, bool retryable)
      : std::runtime_error(message), retryable(retryable) {}
  bool retryable;
};

using SubscriptionId = std::uint64_t;
using MessageHandler = std::function<void(const std::string& channel, const std::string& payload)>;

// 모든 연산은 원자적이어야 하며 실패 시 StoreException을 던진다.
class SharedStore {
 public:
  virtual ~SharedStore() = default;

  // 키가 없거나 이미 owner가 보유 중이면 값을 쓰고 TTL을 갱신한다.
  virtual bool AcquireLease(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) = 0;
  // 현재 값이 owner일 때만 삭제한다.
  virtual bool ReleaseLease(const std::string& key, const std::string& owner) = 0;
  virtual std::optional<std::string> Get(const std::string& key) = 0;
  virtual bool Delete(const std::string& key) = 0;

  virtual void SetAdd(const std::string& key, const std::string& member, std::chrono::milliseconds ttl) = 0;
  virtual void SetRemove(const std::string& key, const std::string& member) = 0;
  virtual std::vector<std::string> SetMembers(const std::string& key) = 0;

  virtual std::size_t Publish(const std::string& channel, const std::string& payload) = 0;
  virtual SubscriptionId Subscribe(const std::string& pattern, MessageHandler handler) = 0;
  virtual void Unsubscribe(SubscriptionId id) = 0;

  virtual bool Ping() = 0;
};

bool MatchChannelPattern(const std::string& pattern, const std::string& channel);

// 단일 프로세스 안에서 여러 인스턴스가 공유할 수 있는 메모리 저장소.
// 발행은 호출 스레드에서 구독자에게 동기 전달된다.
class InMemoryStore : public SharedStore {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  InMemoryStore();
  explicit InMemoryStore(Clock clock);

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

  void SetAvailable(bool available);
  std::size_t SubscriptionCount() const;

 private:
  struct ValueEntry {
    std::string value;
    std::chrono::steady_clock::time_point expires_at;
  };
  struct SetEntry {
    std::set<std::string> members;
    std::chrono::steady_clock::time_point expires_at;
  };
  struct Subscription {
    std::string pattern;
    MessageHandler handler;
  };

  void EnsureAvailable() const;
  void EvictExpired(const std::string& key, std::chrono::steady_clock::time_point now);

  Clock clock_;
  bool available_{true};
  SubscriptionId next_subscription_id_{1};
  std::unordered_map<std::string, ValueEntry> values_;
  std::unordered_map<std::string, SetEntry> sets_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  mutable std::mutex mutex_;
};

}  // namespace collab
