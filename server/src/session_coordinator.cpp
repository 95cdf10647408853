/*
 * 설명: 연결 상태 머신과 방 멤버십을 관리하고 로컬 전달과 백플레인 발행을 조율한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp
 */
#include "collab/session_coordinator.hpp"

#include <algorithm>

namespace collab {
namespace {
constexpr std::size_t kMaxRoomIdLength = 128;

bool Contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}
}  // namespace

std::string LockObjectId(const std::string& room_id, const std::string& piece_id) { return room_id + "/" + piece_id; }

nlohmann::json ToJson(const MemberInfo& member) {
  return {{"connectionId", member.connection_id},
          {"userId", member.user_id ? nlohmann::json(*member.user_id) : nlohmann::json(nullptr)},
          {"username", member.username ? nlohmann::json(*member.username) : nlohmann::json(nullptr)},
          {"local", member.local}};
}

nlohmann::json ToJson(const std::vector<MemberInfo>& members) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& member : members) {
    list.push_back(ToJson(member));
  }
  return list;
}

nlohmann::json ToJson(const IceServerConfig& server) {
  nlohmann::json json{{"urls", server.urls}};
  if (server.username) {
    json["username"] = *server.username;
  }
  if (server.credential) {
    json["credential"] = *server.credential;
  }
  return json;
}

nlohmann::json ToJson(const JoinResult& result) {
  nlohmann::json ice = nlohmann::json::array();
  for (const auto& server : result.ice_servers) {
    ice.push_back(ToJson(server));
  }
  return {{"roomId", result.room_id},
          {"connectionId", result.connection_id},
          {"members", ToJson(result.members)},
          {"iceServers", ice}};
}

SessionCoordinator::SessionCoordinator(CoordinatorOptions options, std::shared_ptr<SharedStore> store,
                                       std::shared_ptr<Backplane> backplane, std::shared_ptr<EditLockManager> locks,
                                       std::shared_ptr<ThrottlePipeline> throttle,
                                       std::shared_ptr<RoomDirectory> directory,
                                       std::shared_ptr<Observability> observability)
    : options_(std::move(options)), store_(std::move(store)), backplane_(std::move(backplane)),
      locks_(std::move(locks)), throttle_(std::move(throttle)), directory_(std::move(directory)),
      observability_(std::move(observability)) {}

bool SessionCoordinator::Start() {
  std::weak_ptr<SessionCoordinator> weak = weak_from_this();
  if (throttle_) {
    throttle_->SetFlushHandler([weak](const std::string& connection_id, const std::string& room_id,
                                      const CollabEvent& event) {
      if (auto self = weak.lock()) {
        self->OnThrottleFlush(connection_id, room_id, event);
      }
    });
  }
  if (!backplane_) {
    return true;
  }
  backplane_->SetRoomHandler(
      [weak](const std::string& room_id, const CollabEvent& event, const std::vector<std::string>& exclude) {
        if (auto self = weak.lock()) {
          self->OnRemoteRoomEvent(room_id, event, exclude);
        }
      });
  backplane_->SetPeerHandler([weak](const std::string& connection_id, const CollabEvent& event) {
    if (auto self = weak.lock()) {
      self->OnRemotePeerEvent(connection_id, event);
    }
  });
  backplane_->SetPresenceHandler([weak](const std::string& room_id, const nlohmann::json& members) {
    if (auto self = weak.lock()) {
      self->OnRemotePresence(room_id, members);
    }
  });
  return backplane_->Start();
}

void SessionCoordinator::Stop() {
  if (backplane_) {
    backplane_->Stop();
  }
}

std::optional<std::string> SessionCoordinator::Connect(Protocol protocol, const std::shared_ptr<ConnectionSink>& sink,
                                                       const Identity& identity) {
  if (draining_) {
    return std::nullopt;
  }
  auto entry = std::make_shared<ConnectionEntry>();
  entry->id = options_.instance_id + "." + std::to_string(next_connection_.fetch_add(1));
  entry->protocol = protocol;
  entry->identity = identity;
  entry->sink = sink;
  entry->last_seen = Now();
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.emplace(entry->id, entry);
  }
  if (store_) {
    try {
      store_->AcquireLease(LivenessKey(entry->id), options_.instance_id, options_.presence_ttl);
    } catch (const StoreException& ex) {
      if (observability_) {
        observability_->SetDegraded(true, ex.what());
      }
      LogEvent("connection.lease_failed", LogLevel::kWarn, entry->id, std::nullopt, ex.what());
    }
  }
  if (observability_) {
    observability_->EmitLifecycle(LifecycleEvent{LifecycleKind::kConnectionOpened, entry->id, ToString(protocol), "",
                                                 std::chrono::system_clock::now()});
  }
  UpdateGauges();
  LogEvent("connection.opened", LogLevel::kDebug, entry->id, std::nullopt, ToString(protocol));
  return entry->id;
}

bool SessionCoordinator::AttachIdentity(const std::string& connection_id, const Identity& identity) {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return false;
  }
  std::lock_guard<std::mutex> lock(conn->mutex);
  conn->identity = identity;
  return true;
}

bool SessionCoordinator::JoinRoom(const std::string& connection_id, const std::string& room_id, JoinResult& result,
                                  std::string& error_code, std::string& error_message) {
  if (room_id.empty() || room_id.size() > kMaxRoomIdLength) {
    error_code = "bad_request";
    error_message = "roomId가 올바르지 않습니다";
    return false;
  }
  auto conn = FindConnection(connection_id);
  if (!conn) {
    error_code = "connection_not_found";
    error_message = "연결을 찾을 수 없습니다";
    return false;
  }
  if (draining_) {
    error_code = "room_unavailable";
    error_message = "서버가 종료 중입니다";
    return false;
  }

  std::optional<std::string> current_room;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if (conn->closing) {
      error_code = "connection_not_found";
      error_message = "연결이 종료 중입니다";
      return false;
    }
    current_room = conn->room_id;
  }
  if (current_room && *current_room == room_id) {
    result = JoinResult{room_id, connection_id, Members(room_id), options_.ice_servers};
    return true;
  }

  auto status = directory_ ? directory_->Lookup(room_id) : RoomStatus::kUnknown;
  if (status == RoomStatus::kClosed || status == RoomStatus::kUnavailable) {
    error_code = "room_unavailable";
    error_message = status == RoomStatus::kClosed ? "닫힌 방입니다" : "방 상태를 확인할 수 없습니다";
    LogEvent("room.join_denied", LogLevel::kInfo, connection_id, room_id, ToString(status));
    return false;
  }

  if (current_room) {
    LeaveRoom(connection_id, "switched");
  }

  if (throttle_) {
    throttle_->Reopen(connection_id);
  }
  AddLocalMember(room_id, connection_id);
  bool closed_meanwhile = false;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    // 조회 중 끊긴 연결은 Disconnect가 방을 보지 못했으므로 여기서 되돌린다.
    closed_meanwhile = conn->closing;
    if (!closed_meanwhile) {
      conn->room_id = room_id;
      conn->state = ConnectionState::kJoined;
    }
  }
  if (closed_meanwhile) {
    RemoveLocalMember(room_id, connection_id);
    if (throttle_) {
      throttle_->Cancel(connection_id);
    }
    UpdateGauges();
    error_code = "connection_not_found";
    error_message = "연결이 종료 중입니다";
    LogEvent("room.join_aborted", LogLevel::kInfo, connection_id, room_id, "closing");
    return false;
  }
  Broadcast(room_id, MakeEvent(connection_id, room_id, UserJoined{}), {connection_id});

  result = JoinResult{room_id, connection_id, Members(room_id), options_.ice_servers};
  UpdateGauges();
  LogEvent("room.joined", LogLevel::kInfo, connection_id, room_id, "");
  return true;
}

bool SessionCoordinator::LeaveRoom(const std::string& connection_id, const std::string& reason) {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return false;
  }
  std::string room_id;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if (!conn->room_id) {
      return false;
    }
    room_id = *conn->room_id;
    conn->state = ConnectionState::kLeaving;
  }

  // 대기 중인 커서 값은 퇴장 알림보다 먼저 나가야 한다.
  if (throttle_) {
    throttle_->Drain(connection_id);
  }

  RemoveLocalMember(room_id, connection_id);

  if (locks_) {
    const auto prefix = LockObjectId(room_id, "");
    for (const auto& object_id : locks_->ReleaseAllFor(connection_id)) {
      if (object_id.rfind(prefix, 0) != 0) {
        continue;
      }
      Broadcast(room_id, MakeEvent(connection_id, room_id, PieceUnlocked{object_id.substr(prefix.size())}));
    }
  }
  Broadcast(room_id, MakeEvent(connection_id, room_id, UserLeft{reason}), {connection_id});

  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->room_id.reset();
    if (conn->state == ConnectionState::kLeaving) {
      conn->state = ConnectionState::kConnecting;
    }
  }
  UpdateGauges();
  LogEvent("room.left", LogLevel::kInfo, connection_id, room_id, reason);
  return true;
}

bool SessionCoordinator::Disconnect(const std::string& connection_id, const std::string& reason) {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if (conn->closing) {
      return false;
    }
    conn->closing = true;
  }

  if (!LeaveRoom(connection_id, reason) && locks_) {
    locks_->ReleaseAllFor(connection_id);
  }
  if (throttle_) {
    throttle_->Cancel(connection_id);
  }

  std::shared_ptr<ConnectionSink> sink;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->state = ConnectionState::kDisconnected;
    sink = conn->sink.lock();
  }
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
  }
  if (store_) {
    try {
      store_->ReleaseLease(LivenessKey(connection_id), options_.instance_id);
    } catch (const StoreException& ex) {
      LogEvent("connection.lease_release_failed", LogLevel::kWarn, connection_id, std::nullopt, ex.what());
    }
  }
  if (observability_) {
    observability_->EmitLifecycle(LifecycleEvent{LifecycleKind::kConnectionClosed, connection_id, "", reason,
                                                 std::chrono::system_clock::now()});
  }
  if (sink) {
    sink->Close(reason);
  }
  UpdateGauges();
  LogEvent("connection.closed", LogLevel::kDebug, connection_id, std::nullopt, reason);
  return true;
}

void SessionCoordinator::Broadcast(const std::string& room_id, const CollabEvent& event,
                                   const std::vector<std::string>& exclude) {
  DeliverLocal(room_id, event, exclude);
  if (observability_) {
    observability_->IncrementBroadcast();
  }
  // 발행 실패 시 로컬 전달만 유지된다(저하 모드).
  if (backplane_) {
    backplane_->PublishRoomEvent(room_id, event, exclude);
  }
}

std::size_t SessionCoordinator::DeliverLocal(const std::string& room_id, const CollabEvent& event,
                                             const std::vector<std::string>& exclude) {
  auto room = FindRoom(room_id);
  if (!room) {
    return 0;
  }
  std::vector<std::string> members;
  {
    std::lock_guard<std::mutex> lock(room->mutex);
    members.assign(room->local_members.begin(), room->local_members.end());
    room->last_activity = std::chrono::system_clock::now();
  }
  auto server_event = ToServerEvent(event);
  std::size_t delivered = 0;
  for (const auto& member : members) {
    if (Contains(exclude, member)) {
      continue;
    }
    auto conn = FindConnection(member);
    if (!conn) {
      continue;
    }
    std::shared_ptr<ConnectionSink> sink;
    {
      std::lock_guard<std::mutex> lock(conn->mutex);
      sink = conn->sink.lock();
    }
    if (sink) {
      sink->Deliver(server_event);
      ++delivered;
    }
  }
  return delivered;
}

bool SessionCoordinator::DeliverToConnection(const std::string& connection_id, const CollabEvent& event) {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return false;
  }
  std::shared_ptr<ConnectionSink> sink;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if (conn->closing) {
      return false;
    }
    sink = conn->sink.lock();
  }
  if (!sink) {
    return false;
  }
  sink->Deliver(ToServerEvent(event));
  return true;
}

CollabEvent SessionCoordinator::MakeEvent(const std::string& connection_id, const std::string& scope_id,
                                          EventBody body) const {
  CollabEvent event;
  event.meta.scope_id = scope_id;
  event.meta.origin_connection_id = connection_id;
  event.meta.timestamp_ms = NowMillis();
  if (auto conn = FindConnection(connection_id)) {
    std::lock_guard<std::mutex> lock(conn->mutex);
    event.meta.origin_user_id = conn->identity.user_id;
    event.meta.origin_username = conn->identity.username;
  }
  event.body = std::move(body);
  return event;
}

void SessionCoordinator::Touch(const std::string& connection_id) {
  if (auto conn = FindConnection(connection_id)) {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->last_seen = Now();
  }
}

std::size_t SessionCoordinator::SweepIdle() {
  if (options_.keepalive_timeout.count() <= 0) {
    return 0;
  }
  auto now = Now();
  std::vector<std::string> idle;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto& [id, conn] : connections_) {
      std::lock_guard<std::mutex> entry_lock(conn->mutex);
      if (now - conn->last_seen > options_.keepalive_timeout) {
        idle.push_back(id);
      }
    }
  }
  std::size_t closed = 0;
  for (const auto& id : idle) {
    if (Disconnect(id, "idle-timeout")) {
      ++closed;
    }
  }
  return closed;
}

std::size_t SessionCoordinator::CollectEmptyRooms() {
  auto now = Now();
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    for (auto it = rooms_.begin(); it != rooms_.end();) {
      std::unique_lock<std::mutex> room_lock(it->second->mutex);
      bool expired = it->second->local_members.empty() && it->second->empty_since &&
                     now - *it->second->empty_since >= options_.room_grace;
      room_lock.unlock();
      if (expired) {
        it = rooms_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0) {
    UpdateGauges();
  }
  return removed;
}

bool SessionCoordinator::RefreshPresenceLeases() {
  if (!store_) {
    return true;
  }
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto& [id, conn] : connections_) {
      ids.push_back(id);
    }
  }
  try {
    for (const auto& id : ids) {
      store_->AcquireLease(LivenessKey(id), options_.instance_id, options_.presence_ttl);
    }
  } catch (const StoreException& ex) {
    if (observability_) {
      observability_->SetDegraded(true, ex.what());
    }
    LogEvent("presence.refresh_failed", LogLevel::kWarn, "", std::nullopt, ex.what());
    return false;
  }
  return true;
}

void SessionCoordinator::BeginDrain() {
  if (!draining_.exchange(true)) {
    LogEvent("coordinator.draining", LogLevel::kInfo, "", std::nullopt, options_.instance_id);
  }
}

std::size_t SessionCoordinator::DisconnectAll(const std::string& reason) {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto& [id, conn] : connections_) {
      ids.push_back(id);
    }
  }
  std::size_t closed = 0;
  for (const auto& id : ids) {
    if (Disconnect(id, reason)) {
      ++closed;
    }
  }
  return closed;
}

bool SessionCoordinator::IsLocal(const std::string& connection_id) const {
  return FindConnection(connection_id) != nullptr;
}

std::optional<std::string> SessionCoordinator::RoomOf(const std::string& connection_id) const {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(conn->mutex);
  return conn->room_id;
}

std::optional<ConnectionState> SessionCoordinator::StateOf(const std::string& connection_id) const {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(conn->mutex);
  return conn->state;
}

std::optional<Identity> SessionCoordinator::IdentityOf(const std::string& connection_id) const {
  auto conn = FindConnection(connection_id);
  if (!conn) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(conn->mutex);
  return conn->identity;
}

std::vector<MemberInfo> SessionCoordinator::Members(const std::string& room_id) const {
  std::vector<MemberInfo> members;
  auto room = FindRoom(room_id);
  if (!room) {
    return members;
  }
  std::vector<std::string> local_ids;
  std::vector<MemberInfo> remote;
  {
    std::lock_guard<std::mutex> lock(room->mutex);
    local_ids.assign(room->local_members.begin(), room->local_members.end());
    for (const auto& [id, info] : room->remote_members) {
      remote.push_back(info);
    }
  }
  for (const auto& id : local_ids) {
    MemberInfo info{id, std::nullopt, std::nullopt, true};
    if (auto identity = IdentityOf(id)) {
      info.user_id = identity->user_id;
      info.username = identity->username;
    }
    members.push_back(std::move(info));
  }
  members.insert(members.end(), remote.begin(), remote.end());
  return members;
}

std::vector<std::string> SessionCoordinator::LocalMembers(const std::string& room_id) const {
  auto room = FindRoom(room_id);
  if (!room) {
    return {};
  }
  std::lock_guard<std::mutex> lock(room->mutex);
  return {room->local_members.begin(), room->local_members.end()};
}

bool SessionCoordinator::HasRoom(const std::string& room_id) const { return FindRoom(room_id) != nullptr; }

std::size_t SessionCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}

std::size_t SessionCoordinator::ActiveRooms() const {
  std::lock_guard<std::mutex> lock(rooms_mutex_);
  return rooms_.size();
}

std::string SessionCoordinator::LivenessKey(const std::string& connection_id) const {
  return options_.key_prefix + ":alive:" + connection_id;
}

std::shared_ptr<SessionCoordinator::ConnectionEntry> SessionCoordinator::FindConnection(
    const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  auto it = connections_.find(connection_id);
  return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionCoordinator::RoomEntry> SessionCoordinator::FindRoom(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(rooms_mutex_);
  auto it = rooms_.find(room_id);
  return it == rooms_.end() ? nullptr : it->second;
}

void SessionCoordinator::AddLocalMember(const std::string& room_id, const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(rooms_mutex_);
  auto& room = rooms_[room_id];
  if (!room) {
    room = std::make_shared<RoomEntry>();
    room->id = room_id;
    room->created_at = std::chrono::system_clock::now();
  }
  std::lock_guard<std::mutex> room_lock(room->mutex);
  room->local_members.insert(connection_id);
  room->remote_members.erase(connection_id);
  room->empty_since.reset();
  room->last_activity = std::chrono::system_clock::now();
}

void SessionCoordinator::RemoveLocalMember(const std::string& room_id, const std::string& connection_id) {
  auto room = FindRoom(room_id);
  if (!room) {
    return;
  }
  std::lock_guard<std::mutex> lock(room->mutex);
  room->local_members.erase(connection_id);
  room->last_activity = std::chrono::system_clock::now();
  if (room->local_members.empty()) {
    room->empty_since = Now();
  }
}

void SessionCoordinator::OnRemoteRoomEvent(const std::string& room_id, const CollabEvent& event,
                                           const std::vector<std::string>& exclude) {
  auto room = FindRoom(room_id);
  if (!room) {
    return;
  }
  const auto& origin = event.meta.origin_connection_id;
  const bool joined = std::holds_alternative<UserJoined>(event.body);
  if (joined) {
    std::lock_guard<std::mutex> lock(room->mutex);
    room->remote_members[origin] =
        MemberInfo{origin, event.meta.origin_user_id, event.meta.origin_username, false};
  } else if (std::holds_alternative<UserLeft>(event.body)) {
    std::lock_guard<std::mutex> lock(room->mutex);
    room->remote_members.erase(origin);
  }
  DeliverLocal(room_id, event, exclude);

  // 늦게 들어온 인스턴스가 기존 멤버를 알 수 있도록 이 인스턴스의 로컬 멤버를 알린다.
  if (joined && backplane_) {
    nlohmann::json announced = nlohmann::json::array();
    for (const auto& member : Members(room_id)) {
      if (member.local) {
        announced.push_back(ToJson(member));
      }
    }
    if (!announced.empty()) {
      backplane_->PublishPresence(room_id, announced);
    }
  }
}

void SessionCoordinator::OnRemotePresence(const std::string& room_id, const nlohmann::json& members) {
  auto room = FindRoom(room_id);
  if (!room) {
    return;
  }
  std::vector<MemberInfo> learned;
  {
    std::lock_guard<std::mutex> lock(room->mutex);
    for (const auto& item : members) {
      if (!item.is_object() || !item.contains("connectionId") || !item["connectionId"].is_string()) {
        continue;
      }
      MemberInfo info{item["connectionId"].get<std::string>(), std::nullopt, std::nullopt, false};
      if (item.contains("userId") && item["userId"].is_string()) {
        info.user_id = item["userId"].get<std::string>();
      }
      if (item.contains("username") && item["username"].is_string()) {
        info.username = item["username"].get<std::string>();
      }
      if (room->local_members.count(info.connection_id) > 0 ||
          room->remote_members.count(info.connection_id) > 0) {
        continue;
      }
      room->remote_members[info.connection_id] = info;
      learned.push_back(std::move(info));
    }
  }
  // 새로 알게 된 멤버는 이 인스턴스의 로컬 멤버 누구도 아직 모르므로 참가 알림으로 전한다.
  for (const auto& member : learned) {
    CollabEvent event;
    event.meta.scope_id = room_id;
    event.meta.origin_connection_id = member.connection_id;
    event.meta.origin_user_id = member.user_id;
    event.meta.origin_username = member.username;
    event.meta.timestamp_ms = NowMillis();
    event.body = UserJoined{};
    DeliverLocal(room_id, event, {});
  }
  if (!learned.empty()) {
    LogEvent("presence.synced", LogLevel::kDebug, "", room_id, std::to_string(learned.size()));
  }
}

void SessionCoordinator::OnRemotePeerEvent(const std::string& connection_id, const CollabEvent& event) {
  DeliverToConnection(connection_id, event);
}

void SessionCoordinator::OnThrottleFlush(const std::string& connection_id, const std::string& room_id,
                                         const CollabEvent& event) {
  Broadcast(room_id, event, {connection_id});
}

void SessionCoordinator::UpdateGauges() {
  if (observability_) {
    observability_->SetConnectionsActive(ActiveConnections());
    observability_->SetRoomsActive(ActiveRooms());
  }
}

void SessionCoordinator::LogEvent(const std::string& name, LogLevel level, const std::string& connection_id,
                                  const std::optional<std::string>& room_id, const std::string& detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = name;
  ctx.level = level;
  if (!connection_id.empty()) {
    ctx.connection_id = connection_id;
  }
  ctx.room_id = room_id;
  ctx.detail = detail;
  observability_->Log(ctx);
}

std::chrono::steady_clock::time_point SessionCoordinator::Now() const {
  return options_.clock ? options_.clock() : std::chrono::steady_clock::now();
}

}  // namespace collab
