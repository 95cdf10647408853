/*
 * 설명: 피어 간 협상 메시지를 지정 연결에만 전달한다(방 브로드캐스트 아님).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/signaling_relay_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "collab/backplane.hpp"
#include "collab/event.hpp"
#include "collab/observability.hpp"
#include "collab/session_coordinator.hpp"
#include "collab/shared_store.hpp"

namespace collab {

class SignalingRelay {
 public:
  SignalingRelay(std::shared_ptr<SessionCoordinator> coordinator, std::shared_ptr<Backplane> backplane,
                 std::shared_ptr<SharedStore> store, std::shared_ptr<Observability> observability);

  // 페이로드는 해석하지 않는다. 양 끝 연결이 살아 있는지만 확인한다.
  bool RelayToPeer(const std::string& from_connection_id, const std::string& to_connection_id, SignalKind kind,
                   const nlohmann::json& payload, std::string& error_code, std::string& error_message);

 private:
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<Backplane> backplane_;
  std::shared_ptr<SharedStore> store_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace collab
