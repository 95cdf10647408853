/*
 * 설명: 방 참가/퇴장, 조각 잠금/이동, 채팅, 커서, 사용자 정의 이벤트, 시그널 명령을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/collaboration_hub_test.cpp
 */
#include "collab/collaboration_hub.hpp"

#include <chrono>

#include "collab/identity.hpp"

namespace collab {
namespace {
std::string Trim(const std::string& text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}
}  // namespace

HubReply OkReply(std::string name, nlohmann::json payload) {
  HubReply reply;
  reply.event = ServerEvent{std::move(name), std::move(payload)};
  return reply;
}

HubReply ErrorReply(std::string code, std::string message) {
  HubReply reply;
  reply.ok = false;
  reply.error_code = std::move(code);
  reply.error_message = std::move(message);
  return reply;
}

CollaborationHub::CollaborationHub(std::shared_ptr<SessionCoordinator> coordinator,
                                   std::shared_ptr<EditLockManager> locks, std::shared_ptr<ThrottlePipeline> throttle,
                                   std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability)
    : coordinator_(std::move(coordinator)), locks_(std::move(locks)), throttle_(std::move(throttle)),
      relay_(std::move(relay)), observability_(std::move(observability)) {}

HubReply CollaborationHub::Dispatch(const std::string& connection_id, const ClientCommand& command) {
  auto started = std::chrono::steady_clock::now();
  auto reply = std::visit([&](const auto& cmd) { return Handle(connection_id, cmd); }, command);
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = CommandName(command);
    ctx.level = LogLevel::kDebug;
    ctx.connection_id = connection_id;
    ctx.room_id = coordinator_->RoomOf(connection_id);
    ctx.latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - started)
                                           .count());
    ctx.detail = reply.ok ? "ok" : reply.error_code;
    observability_->Log(ctx);
  }
  return reply;
}

std::optional<std::string> CollaborationHub::RequireRoom(const std::string& connection_id, HubReply& reply) const {
  auto room = coordinator_->RoomOf(connection_id);
  if (!room) {
    reply = ErrorReply("not_in_room", "방에 참가하지 않았습니다");
  }
  return room;
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const JoinRoomCommand& cmd) {
  JoinResult result;
  std::string error_code;
  std::string error_message;
  if (!coordinator_->JoinRoom(connection_id, cmd.room_id, result, error_code, error_message)) {
    return ErrorReply(error_code, error_message);
  }
  return OkReply("room.joined", ToJson(result));
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const LeaveRoomCommand&) {
  auto room = coordinator_->RoomOf(connection_id);
  bool left = coordinator_->LeaveRoom(connection_id, "left");
  return OkReply("room.left", {{"roomId", room ? nlohmann::json(*room) : nlohmann::json(nullptr)}, {"left", left}});
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const MovePieceCommand& cmd) {
  HubReply reply;
  auto room = RequireRoom(connection_id, reply);
  if (!room) {
    return reply;
  }
  if (!locks_->IsHeldBy(LockObjectId(*room, cmd.piece_id), connection_id)) {
    return ErrorReply("lock_required", "조각을 이동하려면 먼저 잠금을 획득해야 합니다");
  }
  auto event =
      coordinator_->MakeEvent(connection_id, *room, PieceMoved{cmd.piece_id, cmd.x, cmd.y, cmd.rotation});
  coordinator_->Broadcast(*room, event, {connection_id});
  return OkReply("piece.move-confirmed", EventPayload(event));
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const LockPieceCommand& cmd) {
  HubReply reply;
  auto room = RequireRoom(connection_id, reply);
  if (!room) {
    return reply;
  }
  auto result = locks_->TryAcquire(LockObjectId(*room, cmd.piece_id), connection_id);
  if (!result.acquired) {
    if (result.reason == "busy") {
      return ErrorReply("busy", "다른 사용자가 편집 중인 조각입니다");
    }
    return ErrorReply("lock_unavailable", "잠금 저장소를 사용할 수 없습니다");
  }
  coordinator_->Broadcast(*room, coordinator_->MakeEvent(connection_id, *room, PieceLocked{cmd.piece_id}),
                          {connection_id});
  return OkReply("piece.locked",
            {{"roomId", *room}, {"pieceId", cmd.piece_id}, {"ttlMs", locks_->DefaultTtl().count()}});
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const UnlockPieceCommand& cmd) {
  HubReply reply;
  auto room = RequireRoom(connection_id, reply);
  if (!room) {
    return reply;
  }
  if (!locks_->Release(LockObjectId(*room, cmd.piece_id), connection_id)) {
    return ErrorReply("not_lock_holder", "잠금 보유자가 아닙니다");
  }
  coordinator_->Broadcast(*room, coordinator_->MakeEvent(connection_id, *room, PieceUnlocked{cmd.piece_id}),
                          {connection_id});
  return OkReply("piece.unlocked", {{"roomId", *room}, {"pieceId", cmd.piece_id}});
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const SendChatCommand& cmd) {
  HubReply reply;
  auto room = RequireRoom(connection_id, reply);
  if (!room) {
    return reply;
  }
  auto text = Trim(cmd.text);
  if (text.empty() || text.size() > kMaxChatLength) {
    return ErrorReply("invalid_message", "메시지는 1자 이상 1000자 이하여야 합니다");
  }
  auto message_id = RandomHex(8);
  coordinator_->Broadcast(*room, coordinator_->MakeEvent(connection_id, *room, ChatPosted{message_id, text}));
  return OkReply("chat.sent", {{"roomId", *room}, {"id", message_id}});
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const UpdateCursorCommand& cmd) {
  // 방 밖의 커서 갱신은 조용히 무시한다.
  auto room = coordinator_->RoomOf(connection_id);
  if (room) {
    throttle_->Submit(connection_id, *room, "cursor",
                      coordinator_->MakeEvent(connection_id, *room, CursorMoved{cmd.x, cmd.y}));
  }
  return HubReply{};
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const EmitCustomCommand& cmd) {
  HubReply reply;
  auto room = RequireRoom(connection_id, reply);
  if (!room) {
    return reply;
  }
  coordinator_->Broadcast(*room, coordinator_->MakeEvent(connection_id, *room, CustomEvent{cmd.name, cmd.data}),
                          {connection_id});
  return OkReply("event.emitted", {{"roomId", *room}, {"event", cmd.name}});
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const RelaySignalCommand& cmd) {
  std::string error_code;
  std::string error_message;
  if (!relay_->RelayToPeer(connection_id, cmd.to_connection_id, cmd.kind, cmd.payload, error_code, error_message)) {
    return ErrorReply(error_code, error_message);
  }
  return OkReply("call.relayed", {{"to", cmd.to_connection_id}, {"kind", ToString(cmd.kind)}});
}

HubReply CollaborationHub::Handle(const std::string& connection_id, const ListMembersCommand&) {
  HubReply reply;
  auto room = RequireRoom(connection_id, reply);
  if (!room) {
    return reply;
  }
  return OkReply("room.members", {{"roomId", *room}, {"members", ToJson(coordinator_->Members(*room))}});
}

}  // namespace collab
