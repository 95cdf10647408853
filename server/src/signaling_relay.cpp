/*
 * 설명: 로컬 대상은 직접, 원격 대상은 연결별 백플레인 채널로 시그널을 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/signaling_relay_test.cpp
 */
#include "collab/signaling_relay.hpp"

namespace collab {

SignalingRelay::SignalingRelay(std::shared_ptr<SessionCoordinator> coordinator, std::shared_ptr<Backplane> backplane,
                               std::shared_ptr<SharedStore> store, std::shared_ptr<Observability> observability)
    : coordinator_(std::move(coordinator)), backplane_(std::move(backplane)), store_(std::move(store)),
      observability_(std::move(observability)) {}

bool SignalingRelay::RelayToPeer(const std::string& from_connection_id, const std::string& to_connection_id,
                                 SignalKind kind, const nlohmann::json& payload, std::string& error_code,
                                 std::string& error_message) {
  if (to_connection_id.empty()) {
    error_code = "bad_request";
    error_message = "대상 연결(to)이 필요합니다";
    return false;
  }
  if (!coordinator_->IsLocal(from_connection_id)) {
    error_code = "connection_not_found";
    error_message = "발신 연결을 찾을 수 없습니다";
    return false;
  }
  if (to_connection_id == from_connection_id) {
    error_code = "bad_request";
    error_message = "자기 자신에게는 시그널을 보낼 수 없습니다";
    return false;
  }

  auto event = coordinator_->MakeEvent(from_connection_id, to_connection_id, SignalDelivered{kind, payload});
  if (coordinator_->IsLocal(to_connection_id)) {
    if (coordinator_->DeliverToConnection(to_connection_id, event)) {
      return true;
    }
    error_code = "peer_unavailable";
    error_message = "대상 연결이 종료되었습니다";
    return false;
  }

  // 원격 대상은 생존 리스로 활성 여부를 확인한다.
  try {
    if (!store_ || !store_->Get(coordinator_->LivenessKey(to_connection_id))) {
      error_code = "peer_unavailable";
      error_message = "대상 연결을 찾을 수 없습니다";
      return false;
    }
  } catch (const StoreException& ex) {
    if (observability_) {
      observability_->SetDegraded(true, ex.what());
    }
    error_code = "relay_failed";
    error_message = "대상 연결 상태를 확인할 수 없습니다";
    return false;
  }
  if (!backplane_ || !backplane_->PublishPeerEvent(to_connection_id, event)) {
    error_code = "relay_failed";
    error_message = "시그널 전달에 실패했습니다";
    return false;
  }
  return true;
}

}  // namespace collab
