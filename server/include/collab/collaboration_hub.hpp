/*
 * 설명: 디코딩된 명령을 코디네이터/잠금/스로틀/시그널 경로로 분배하고 요청자 응답을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/collaboration_hub_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "collab/command.hpp"
#include "collab/event.hpp"
#include "collab/lock_manager.hpp"
#include "collab/observability.hpp"
#include "collab/session_coordinator.hpp"
#include "collab/signaling_relay.hpp"
#include "collab/throttle.hpp"

namespace collab {

struct HubReply {
  bool ok{true};
  // 응답 이벤트가 없는 명령(커서 갱신)도 있다.
  std::optional<ServerEvent> event;
  std::string error_code;
  std::string error_message;
};

class CollaborationHub {
 public:
  static constexpr std::size_t kMaxChatLength = 1000;

  CollaborationHub(std::shared_ptr<SessionCoordinator> coordinator, std::shared_ptr<EditLockManager> locks,
                   std::shared_ptr<ThrottlePipeline> throttle, std::shared_ptr<SignalingRelay> relay,
                   std::shared_ptr<Observability> observability);

  HubReply Dispatch(const std::string& connection_id, const ClientCommand& command);

 private:
  HubReply Handle(const std::string& connection_id, const JoinRoomCommand& cmd);
  HubReply Handle(const std::string& connection_id, const LeaveRoomCommand& cmd);
  HubReply Handle(const std::string& connection_id, const MovePieceCommand& cmd);
  HubReply Handle(const std::string& connection_id, const LockPieceCommand& cmd);
  HubReply Handle(const std::string& connection_id, const UnlockPieceCommand& cmd);
  HubReply Handle(const std::string& connection_id, const SendChatCommand& cmd);
  HubReply Handle(const std::string& connection_id, const UpdateCursorCommand& cmd);
  HubReply Handle(const std::string& connection_id, const EmitCustomCommand& cmd);
  HubReply Handle(const std::string& connection_id, const RelaySignalCommand& cmd);
  HubReply Handle(const std::string& connection_id, const ListMembersCommand& cmd);

  std::optional<std::string> RequireRoom(const std::string& connection_id, HubReply& reply) const;

  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<EditLockManager> locks_;
  std::shared_ptr<ThrottlePipeline> throttle_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
};

HubReply OkReply(std::string name, nlohmann::json payload);
HubReply ErrorReply(std::string code, std::string message);

}  // namespace collab
