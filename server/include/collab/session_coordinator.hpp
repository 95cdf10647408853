/*
 * 설명: 연결 등록부, 방 멤버십, 프레즌스, 로컬/백플레인 브로드캐스트를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "collab/backplane.hpp"
#include "collab/config.hpp"
#include "collab/connection.hpp"
#include "collab/event.hpp"
#include "collab/lock_manager.hpp"
#include "collab/observability.hpp"
#include "collab/room_directory.hpp"
#include "collab/shared_store.hpp"
#include "collab/throttle.hpp"

namespace collab {

struct CoordinatorOptions {
  std::string instance_id;
  std::string key_prefix{"collab"};
  std::chrono::milliseconds presence_ttl{std::chrono::seconds(90)};
  std::chrono::milliseconds room_grace{std::chrono::seconds(60)};
  std::chrono::milliseconds keepalive_timeout{std::chrono::seconds(60)};
  std::vector<IceServerConfig> ice_servers;
  std::function<std::chrono::steady_clock::time_point()> clock;
};

struct MemberInfo {
  std::string connection_id;
  std::optional<std::string> user_id;
  std::optional<std::string> username;
  bool local{true};
};

struct JoinResult {
  std::string room_id;
  std::string connection_id;
  std::vector<MemberInfo> members;
  std::vector<IceServerConfig> ice_servers;
};

nlohmann::json ToJson(const MemberInfo& member);
nlohmann::json ToJson(const std::vector<MemberInfo>& members);
nlohmann::json ToJson(const IceServerConfig& server);
nlohmann::json ToJson(const JoinResult& result);

class SessionCoordinator : public std::enable_shared_from_this<SessionCoordinator> {
 public:
  SessionCoordinator(CoordinatorOptions options, std::shared_ptr<SharedStore> store,
                     std::shared_ptr<Backplane> backplane, std::shared_ptr<EditLockManager> locks,
                     std::shared_ptr<ThrottlePipeline> throttle, std::shared_ptr<RoomDirectory> directory,
                     std::shared_ptr<Observability> observability);

  // 백플레인 핸들러와 스로틀 플러시 경로를 연결하고 구독을 시작한다.
  bool Start();
  void Stop();

  std::optional<std::string> Connect(Protocol protocol, const std::shared_ptr<ConnectionSink>& sink,
                                     const Identity& identity = {});
  bool AttachIdentity(const std::string& connection_id, const Identity& identity);

  bool JoinRoom(const std::string& connection_id, const std::string& room_id, JoinResult& result,
                std::string& error_code, std::string& error_message);
  // 멤버가 아니면 false. 잠금 해제, user-left 발행, 스로틀 큐 배출까지 수행한다.
  bool LeaveRoom(const std::string& connection_id, const std::string& reason = "left");
  bool Disconnect(const std::string& connection_id, const std::string& reason);

  void Broadcast(const std::string& room_id, const CollabEvent& event,
                 const std::vector<std::string>& exclude = {});
  std::size_t DeliverLocal(const std::string& room_id, const CollabEvent& event,
                           const std::vector<std::string>& exclude);
  bool DeliverToConnection(const std::string& connection_id, const CollabEvent& event);

  CollabEvent MakeEvent(const std::string& connection_id, const std::string& scope_id, EventBody body) const;

  void Touch(const std::string& connection_id);
  std::size_t SweepIdle();
  std::size_t CollectEmptyRooms();
  bool RefreshPresenceLeases();

  void BeginDrain();
  bool IsDraining() const { return draining_.load(); }
  std::size_t DisconnectAll(const std::string& reason);

  bool IsLocal(const std::string& connection_id) const;
  std::optional<std::string> RoomOf(const std::string& connection_id) const;
  std::optional<ConnectionState> StateOf(const std::string& connection_id) const;
  std::optional<Identity> IdentityOf(const std::string& connection_id) const;
  std::vector<MemberInfo> Members(const std::string& room_id) const;
  std::vector<std::string> LocalMembers(const std::string& room_id) const;
  bool HasRoom(const std::string& room_id) const;
  std::size_t ActiveConnections() const;
  std::size_t ActiveRooms() const;

  const std::string& InstanceId() const { return options_.instance_id; }
  std::string LivenessKey(const std::string& connection_id) const;
  const std::vector<IceServerConfig>& IceServers() const { return options_.ice_servers; }

 private:
  struct ConnectionEntry {
    std::string id;
    Protocol protocol{Protocol::kNative};
    Identity identity;
    ConnectionState state{ConnectionState::kConnecting};
    std::optional<std::string> room_id;
    std::weak_ptr<ConnectionSink> sink;
    std::chrono::steady_clock::time_point last_seen;
    bool closing{false};
    mutable std::mutex mutex;
  };

  struct RoomEntry {
    std::string id;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity;
    std::set<std::string> local_members;
    std::map<std::string, MemberInfo> remote_members;
    std::optional<std::chrono::steady_clock::time_point> empty_since;
    mutable std::mutex mutex;
  };

  std::shared_ptr<ConnectionEntry> FindConnection(const std::string& connection_id) const;
  std::shared_ptr<RoomEntry> FindRoom(const std::string& room_id) const;
  // 등록부와 방 뮤텍스를 함께 잡고 멤버를 넣어 빈 방 회수와 경합하지 않게 한다.
  void AddLocalMember(const std::string& room_id, const std::string& connection_id);
  void RemoveLocalMember(const std::string& room_id, const std::string& connection_id);
  void OnRemoteRoomEvent(const std::string& room_id, const CollabEvent& event,
                         const std::vector<std::string>& exclude);
  void OnRemotePresence(const std::string& room_id, const nlohmann::json& members);
  void OnRemotePeerEvent(const std::string& connection_id, const CollabEvent& event);
  void OnThrottleFlush(const std::string& connection_id, const std::string& room_id, const CollabEvent& event);
  void UpdateGauges();
  void LogEvent(const std::string& name, LogLevel level, const std::string& connection_id,
                const std::optional<std::string>& room_id, const std::string& detail) const;
  std::chrono::steady_clock::time_point Now() const;

  CoordinatorOptions options_;
  std::shared_ptr<SharedStore> store_;
  std::shared_ptr<Backplane> backplane_;
  std::shared_ptr<EditLockManager> locks_;
  std::shared_ptr<ThrottlePipeline> throttle_;
  std::shared_ptr<RoomDirectory> directory_;
  std::shared_ptr<Observability> observability_;

  std::atomic<std::uint64_t> next_connection_{1};
  std::atomic<bool> draining_{false};
  // 등록부 뮤텍스는 조회/삽입에만 짧게 잡고, 엔티티 상태는 각 엔트리 뮤텍스가 보호한다.
  std::unordered_map<std::string, std::shared_ptr<ConnectionEntry>> connections_;
  mutable std::mutex connections_mutex_;
  std::unordered_map<std::string, std::shared_ptr<RoomEntry>> rooms_;
  mutable std::mutex rooms_mutex_;
};

// 잠금 객체 ID는 방 단위로 구분한다.
std::string LockObjectId(const std::string& room_id, const std::string& piece_id);

}  // namespace collab
