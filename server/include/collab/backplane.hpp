/*
 * 설명: 공유 저장소 발행-구독 위에서 인스턴스 간 방/피어 이벤트를 전달한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/backplane_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "collab/event.hpp"
#include "collab/observability.hpp"
#include "collab/shared_store.hpp"

namespace collab {

struct BackplaneOptions {
  std::size_t max_publish_attempts{3};
  std::chrono::milliseconds backoff_base{50};
};

class Backplane {
 public:
  using RoomHandler =
      std::function<void(const std::string& room_id, const CollabEvent& event, const std::vector<std::string>& exclude)>;
  using PeerHandler = std::function<void(const std::string& connection_id, const CollabEvent& event)>;
  using PresenceHandler = std::function<void(const std::string& room_id, const nlohmann::json& members)>;

  Backplane(std::shared_ptr<SharedStore> store, std::string key_prefix, std::string instance_id,
            std::shared_ptr<Observability> observability, BackplaneOptions options = {});
  ~Backplane();

  void SetRoomHandler(RoomHandler handler);
  void SetPeerHandler(PeerHandler handler);
  void SetPresenceHandler(PresenceHandler handler);

  // 방/피어 채널 패턴을 한 번 구독한다. 저장소 장애 시 false를 반환하고 이후 재시도할 수 있다.
  bool Start();
  void Stop();
  bool IsSubscribed() const;

  bool PublishRoomEvent(const std::string& room_id, const CollabEvent& event,
                        const std::vector<std::string>& exclude = {});
  bool PublishPeerEvent(const std::string& connection_id, const CollabEvent& event);
  // 방 채널로 이 인스턴스의 로컬 멤버 목록을 알린다. 클라이언트에는 전달되지 않는다.
  bool PublishPresence(const std::string& room_id, const nlohmann::json& members);

  // 발행이 최종 실패하면 열리고, 이후 발행은 재시도 없이 한 번만 시도한다.
  bool IsCircuitOpen() const { return circuit_open_.load(); }
  // 회로가 열려 있으면 저장소 ping으로 복구를 확인한다. 유지보수 주기에서 호출한다.
  bool CheckRecovery();

  std::string RoomChannel(const std::string& room_id) const;
  std::string PeerChannel(const std::string& connection_id) const;
  const std::string& InstanceId() const { return instance_id_; }

 private:
  bool Publish(const std::string& channel, const std::string& payload);
  void OnMessage(const std::string& channel, const std::string& payload);
  void Backoff(std::size_t attempt) const;

  std::shared_ptr<SharedStore> store_;
  std::string key_prefix_;
  std::string instance_id_;
  std::shared_ptr<Observability> observability_;
  BackplaneOptions options_;
  RoomHandler room_handler_;
  PeerHandler peer_handler_;
  PresenceHandler presence_handler_;
  std::atomic<bool> circuit_open_{false};
  std::vector<SubscriptionId> subscriptions_;
  mutable std::mutex mutex_;
};

}  // namespace collab
