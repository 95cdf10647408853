/*
 * 설명: 백플레인 메시지 봉투를 발행하고, 다른 인스턴스에서 온 메시지를 로컬 전달 경로로 넘긴다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/backplane_test.cpp
 */
#include "collab/backplane.hpp"

#include <random>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

namespace collab {
namespace {
constexpr const char* kRoomKind = "room";
constexpr const char* kPeerKind = "peer";
constexpr const char* kPresenceKind = "presence";
}  // namespace

Backplane::Backplane(std::shared_ptr<SharedStore> store, std::string key_prefix, std::string instance_id,
                     std::shared_ptr<Observability> observability, BackplaneOptions options)
    : store_(std::move(store)), key_prefix_(std::move(key_prefix)), instance_id_(std::move(instance_id)),
      observability_(std::move(observability)), options_(options) {}

Backplane::~Backplane() { Stop(); }

void Backplane::SetRoomHandler(RoomHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  room_handler_ = std::move(handler);
}

void Backplane::SetPeerHandler(PeerHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  peer_handler_ = std::move(handler);
}

void Backplane::SetPresenceHandler(PresenceHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  presence_handler_ = std::move(handler);
}

std::string Backplane::RoomChannel(const std::string& room_id) const { return key_prefix_ + ":room:" + room_id; }

std::string Backplane::PeerChannel(const std::string& connection_id) const {
  return key_prefix_ + ":peer:" + connection_id;
}

bool Backplane::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!subscriptions_.empty()) {
      return true;
    }
  }
  auto handler = [this](const std::string& channel, const std::string& payload) { OnMessage(channel, payload); };
  std::vector<SubscriptionId> ids;
  try {
    ids.push_back(store_->Subscribe(key_prefix_ + ":room:*", handler));
    ids.push_back(store_->Subscribe(key_prefix_ + ":peer:*", handler));
  } catch (const StoreException& ex) {
    for (auto id : ids) {
      store_->Unsubscribe(id);
    }
    if (observability_) {
      observability_->SetDegraded(true, std::string("backplane subscribe failed: ") + ex.what());
    }
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_ = std::move(ids);
  return true;
}

void Backplane::Stop() {
  std::vector<SubscriptionId> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids.swap(subscriptions_);
  }
  for (auto id : ids) {
    store_->Unsubscribe(id);
  }
}

bool Backplane::IsSubscribed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !subscriptions_.empty();
}

bool Backplane::PublishRoomEvent(const std::string& room_id, const CollabEvent& event,
                                 const std::vector<std::string>& exclude) {
  nlohmann::json envelope{{"origin", instance_id_},
                          {"kind", kRoomKind},
                          {"target", room_id},
                          {"exclude", exclude},
                          {"event", ToJson(event)}};
  return Publish(RoomChannel(room_id), envelope.dump());
}

bool Backplane::PublishPeerEvent(const std::string& connection_id, const CollabEvent& event) {
  nlohmann::json envelope{{"origin", instance_id_},
                          {"kind", kPeerKind},
                          {"target", connection_id},
                          {"exclude", nlohmann::json::array()},
                          {"event", ToJson(event)}};
  return Publish(PeerChannel(connection_id), envelope.dump());
}

bool Backplane::PublishPresence(const std::string& room_id, const nlohmann::json& members) {
  nlohmann::json envelope{{"origin", instance_id_},
                          {"kind", kPresenceKind},
                          {"target", room_id},
                          {"exclude", nlohmann::json::array()},
                          {"members", members}};
  return Publish(RoomChannel(room_id), envelope.dump());
}

bool Backplane::Publish(const std::string& channel, const std::string& payload) {
  // 회로가 열린 동안에는 I/O 스레드를 백오프로 붙잡지 않는다.
  const std::size_t max_attempts = circuit_open_ ? 1 : options_.max_publish_attempts;
  for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    try {
      store_->Publish(channel, payload);
      circuit_open_ = false;
      if (observability_) {
        observability_->SetDegraded(false, "backplane publish recovered");
      }
      return true;
    } catch (const StoreException& ex) {
      if (ex.retryable && attempt < max_attempts) {
        Backoff(attempt);
        continue;
      }
      circuit_open_ = true;
      if (observability_) {
        observability_->IncrementPublishFailure();
        observability_->SetDegraded(true, std::string("backplane publish failed: ") + ex.what());
      }
      return false;
    }
  }
  return false;
}

bool Backplane::CheckRecovery() {
  if (!circuit_open_) {
    return true;
  }
  try {
    if (!store_->Ping()) {
      return false;
    }
  } catch (const StoreException&) {
    return false;
  }
  circuit_open_ = false;
  if (observability_) {
    observability_->SetDegraded(false, "backplane store reachable");
  }
  return true;
}

void Backplane::OnMessage(const std::string& channel, const std::string& payload) {
  try {
    auto envelope = nlohmann::json::parse(payload);
    // 자기 인스턴스가 보낸 메시지는 이미 로컬 전달을 마쳤다.
    if (envelope.value("origin", std::string{}) == instance_id_) {
      return;
    }
    auto kind = envelope.value("kind", std::string{});
    auto target = envelope.value("target", std::string{});
    if (kind == kPresenceKind) {
      if (!envelope.contains("members") || !envelope["members"].is_array()) {
        throw std::runtime_error("프레즌스 멤버 목록이 없습니다");
      }
      PresenceHandler presence_handler;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        presence_handler = presence_handler_;
      }
      if (presence_handler) {
        presence_handler(target, envelope["members"]);
      }
      return;
    }
    CollabEvent event;
    std::string error;
    if (!envelope.contains("event") || !FromJson(envelope["event"], event, error)) {
      throw std::runtime_error("이벤트 디코딩 실패: " + error);
    }
    RoomHandler room_handler;
    PeerHandler peer_handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      room_handler = room_handler_;
      peer_handler = peer_handler_;
    }
    if (kind == kRoomKind && room_handler) {
      auto exclude = envelope.value("exclude", std::vector<std::string>{});
      room_handler(target, event, exclude);
    } else if (kind == kPeerKind && peer_handler) {
      peer_handler(target, event);
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.name = "backplane.drop";
      ctx.level = LogLevel::kWarn;
      ctx.detail = channel + ": " + ex.what();
      observability_->Log(ctx);
    }
  }
}

void Backplane::Backoff(std::size_t attempt) const {
  auto base_ms = options_.backoff_base.count() * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + dist(gen)));
}

}  // namespace collab
