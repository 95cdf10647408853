/*
 * 설명: Lua 스크립트로 리스 연산의 원자성을 보장하고 패턴 구독마다 소비 스레드를 둔다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/redis_store_it_test.cpp
 */
#include "collab/redis_store.hpp"

#include <iterator>

namespace collab {
namespace {
constexpr const char* kAcquireScript = R"lua(
local current = redis.call('GET', KEYS[1])
if not current then
  redis.call('SET', KEYS[1], ARGV[1], 'PX', ARGV[2])
  return 1
end
if current == ARGV[1] then
  redis.call('PEXPIRE', KEYS[1], ARGV[2])
  return 1
end
return 0
)lua";

constexpr const char* kReleaseScript = R"lua(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('DEL', KEYS[1])
end
return 0
)lua";

constexpr auto kResubscribeDelay = std::chrono::milliseconds(200);
}  // namespace

RedisStore::RedisStore(const RedisConfig& config, std::shared_ptr<Observability> observability)
    : config_(config), observability_(std::move(observability)) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  if (!config.password.empty()) {
    options.password = config.password;
  }
  options.connect_timeout = config.timeout;
  options.socket_timeout = config.timeout;

  sw::redis::ConnectionPoolOptions pool_options;
  pool_options.size = config.pool_size;
  pool_options.wait_timeout = config.timeout;

  redis_ = std::make_unique<sw::redis::Redis>(options, pool_options);
}

RedisStore::~RedisStore() {
  std::map<SubscriptionId, std::unique_ptr<SubscriptionWorker>> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& [id, worker] : workers) {
    worker->running = false;
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
  }
}

template <typename Fn>
auto RedisStore::Call(const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const sw::redis::TimeoutError& ex) {
    throw StoreException(std::string(op) + " 시간 초과: " + ex.what(), true);
  } catch (const sw::redis::IoError& ex) {
    throw StoreException(std::string(op) + " 연결 오류: " + ex.what(), true);
  } catch (const sw::redis::Error& ex) {
    throw StoreException(std::string(op) + " 실패: " + ex.what(), false);
  }
}

bool RedisStore::AcquireLease(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
  auto ttl_text = std::to_string(ttl.count());
  return Call("AcquireLease", [&]() {
    return redis_->eval<long long>(kAcquireScript, {key}, {owner, ttl_text}) == 1;
  });
}

bool RedisStore::ReleaseLease(const std::string& key, const std::string& owner) {
  return Call("ReleaseLease", [&]() { return redis_->eval<long long>(kReleaseScript, {key}, {owner}) == 1; });
}

std::optional<std::string> RedisStore::Get(const std::string& key) {
  return Call("Get", [&]() -> std::optional<std::string> {
    auto value = redis_->get(key);
    if (!value) {
      return std::nullopt;
    }
    return *value;
  });
}

bool RedisStore::Delete(const std::string& key) {
  return Call("Delete", [&]() { return redis_->del(key) > 0; });
}

void RedisStore::SetAdd(const std::string& key, const std::string& member, std::chrono::milliseconds ttl) {
  Call("SetAdd", [&]() {
    auto pipe = redis_->pipeline(false);
    pipe.sadd(key, member).pexpire(key, ttl);
    pipe.exec();
  });
}

void RedisStore::SetRemove(const std::string& key, const std::string& member) {
  Call("SetRemove", [&]() { redis_->srem(key, member); });
}

std::vector<std::string> RedisStore::SetMembers(const std::string& key) {
  return Call("SetMembers", [&]() {
    std::vector<std::string> members;
    redis_->smembers(key, std::back_inserter(members));
    return members;
  });
}

std::size_t RedisStore::Publish(const std::string& channel, const std::string& payload) {
  return Call("Publish", [&]() { return static_cast<std::size_t>(redis_->publish(channel, payload)); });
}

SubscriptionId RedisStore::Subscribe(const std::string& pattern, MessageHandler handler) {
  auto worker = std::make_unique<SubscriptionWorker>();
  worker->pattern = pattern;
  worker->handler = std::move(handler);
  auto* raw = worker.get();
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_subscription_id_++;
  raw->thread = std::thread([this, raw]() { ConsumeLoop(raw); });
  workers_[id] = std::move(worker);
  return id;
}

void RedisStore::Unsubscribe(SubscriptionId id) {
  std::unique_ptr<SubscriptionWorker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(id);
    if (it == workers_.end()) {
      return;
    }
    worker = std::move(it->second);
    workers_.erase(it);
  }
  worker->running = false;
  if (worker->thread.joinable()) {
    worker->thread.join();
  }
}

void RedisStore::ConsumeLoop(SubscriptionWorker* worker) {
  while (worker->running) {
    try {
      auto subscriber = redis_->subscriber();
      subscriber.on_pmessage([this, worker](std::string /*pattern*/, std::string channel, std::string message) {
        try {
          worker->handler(channel, message);
        } catch (const std::exception& ex) {
          LogSubscriptionError("store.subscription_handler_failed", channel + ": " + ex.what());
        }
      });
      subscriber.psubscribe(worker->pattern);
      while (worker->running) {
        try {
          subscriber.consume();
        } catch (const sw::redis::TimeoutError&) {
          // 소켓 타임아웃마다 종료 플래그를 확인한다.
          continue;
        }
      }
    } catch (const sw::redis::Error& ex) {
      LogSubscriptionError("store.subscription_reconnect", worker->pattern + ": " + ex.what());
      std::this_thread::sleep_for(kResubscribeDelay);
    }
  }
}

void RedisStore::LogSubscriptionError(const std::string& name, const std::string& detail) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = name,
                                 .level = LogLevel::kWarn,
                                 .detail = detail});
}

bool RedisStore::Ping() {
  try {
    redis_->ping();
    return true;
  } catch (const sw::redis::Error&) {
    return false;
  }
}

}  // namespace collab
