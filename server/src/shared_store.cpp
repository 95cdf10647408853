/*
 * 설명: 메모리 기반 공유 저장소와 채널 패턴 매칭을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/shared_store_test.cpp
 */
#include "collab/shared_store.hpp"

namespace collab {

bool MatchChannelPattern(const std::string& pattern, const std::string& channel) {
  std::size_t p = 0;
  std::size_t c = 0;
  std::size_t star = std::string::npos;
  std::size_t resume = 0;
  while (c < channel.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == channel[c])) {
      ++p;
      ++c;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = c;
    } else if (star != std::string::npos) {
      p = star + 1;
      c = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

InMemoryStore::InMemoryStore() : InMemoryStore([]() { return std::chrono::steady_clock::now(); }) {}

InMemoryStore::InMemoryStore(Clock clock) : clock_(std::move(clock)) {}

void InMemoryStore::EnsureAvailable() const {
  if (!available_) {
    throw StoreException("저장소에 연결할 수 없습니다", true);
  }
}

void InMemoryStore::EvictExpired(const std::string& key, std::chrono::steady_clock::time_point now) {
  auto value_it = values_.find(key);
  if (value_it != values_.end() && value_it->second.expires_at <= now) {
    values_.erase(value_it);
  }
  auto set_it = sets_.find(key);
  if (set_it != sets_.end() && set_it->second.expires_at <= now) {
    sets_.erase(set_it);
  }
}

bool InMemoryStore::AcquireLease(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto now = clock_();
  EvictExpired(key, now);
  auto it = values_.find(key);
  if (it == values_.end()) {
    values_[key] = ValueEntry{owner, now + ttl};
    return true;
  }
  if (it->second.value == owner) {
    it->second.expires_at = now + ttl;
    return true;
  }
  return false;
}

bool InMemoryStore::ReleaseLease(const std::string& key, const std::string& owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  EvictExpired(key, clock_());
  auto it = values_.find(key);
  if (it == values_.end() || it->second.value != owner) {
    return false;
  }
  values_.erase(it);
  return true;
}

std::optional<std::string> InMemoryStore::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  EvictExpired(key, clock_());
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

bool InMemoryStore::Delete(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  EvictExpired(key, clock_());
  bool removed = values_.erase(key) > 0;
  removed = sets_.erase(key) > 0 || removed;
  return removed;
}

void InMemoryStore::SetAdd(const std::string& key, const std::string& member, std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto now = clock_();
  EvictExpired(key, now);
  auto& entry = sets_[key];
  entry.members.insert(member);
  entry.expires_at = now + ttl;
}

void InMemoryStore::SetRemove(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  EvictExpired(key, clock_());
  auto it = sets_.find(key);
  if (it == sets_.end()) {
    return;
  }
  it->second.members.erase(member);
  if (it->second.members.empty()) {
    sets_.erase(it);
  }
}

std::vector<std::string> InMemoryStore::SetMembers(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  EvictExpired(key, clock_());
  auto it = sets_.find(key);
  if (it == sets_.end()) {
    return {};
  }
  return {it->second.members.begin(), it->second.members.end()};
}

std::size_t InMemoryStore::Publish(const std::string& channel, const std::string& payload) {
  std::vector<MessageHandler> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    EnsureAvailable();
    for (const auto& [id, sub] : subscriptions_) {
      if (MatchChannelPattern(sub.pattern, channel)) {
        targets.push_back(sub.handler);
      }
    }
  }
  for (const auto& handler : targets) {
    handler(channel, payload);
  }
  return targets.size();
}

SubscriptionId InMemoryStore::Subscribe(const std::string& pattern, MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto id = next_subscription_id_++;
  subscriptions_[id] = Subscription{pattern, std::move(handler)};
  return id;
}

void InMemoryStore::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.erase(id);
}

bool InMemoryStore::Ping() {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

void InMemoryStore::SetAvailable(bool available) {
  std::lock_guard<std::mutex> lock(mutex_);
  available_ = available;
}

std::size_t InMemoryStore::SubscriptionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

}  // namespace collab
