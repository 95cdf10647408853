/*
 * 설명: 서버 전체 수명주기(구성 요소 조립, 리스너, 유지보수 타이머, 종료 드레인)를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp, server/tests/e2e/binary_flow_test.cpp,
 *         server/tests/e2e/legacy_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "collab/backplane.hpp"
#include "collab/collaboration_hub.hpp"
#include "collab/config.hpp"
#include "collab/identity.hpp"
#include "collab/lock_manager.hpp"
#include "collab/observability.hpp"
#include "collab/room_directory.hpp"
#include "collab/session_coordinator.hpp"
#include "collab/shared_store.hpp"
#include "collab/signaling_relay.hpp"
#include "collab/throttle.hpp"
#include "collab/websocket_session.hpp"

namespace collab {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 테스트에서 저장소와 방 디렉터리를 주입할 때 사용한다.
  ServerApp(const AppConfig& config, std::shared_ptr<SharedStore> store, std::shared_ptr<RoomDirectory> directory);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  unsigned short HttpPort() const { return http_port_.load(); }
  unsigned short BinaryPort() const { return binary_port_.load(); }
  std::shared_ptr<SharedStore> GetStore() { return store_; }
  std::shared_ptr<SessionCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<EditLockManager> GetLockManager() { return locks_; }
  std::shared_ptr<IdentityResolver> GetIdentityResolver() { return identity_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Build(std::shared_ptr<SharedStore> store, std::shared_ptr<RoomDirectory> directory);
  void RunWorkers();
  void JoinWorkers();
  void ScheduleMaintenance();
  void RunMaintenance();
  void Drain(const std::string& reason);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer maintenance_timer_;
  boost::asio::steady_timer drain_timer_;
  std::shared_ptr<Listener> http_listener_;
  std::shared_ptr<Listener> binary_listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SharedStore> store_;
  std::shared_ptr<RoomDirectory> directory_;
  std::shared_ptr<Backplane> backplane_;
  std::shared_ptr<EditLockManager> locks_;
  std::shared_ptr<ThrottlePipeline> throttle_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<CollaborationHub> hub_;
  std::shared_ptr<IdentityResolver> identity_;
  SessionLimits limits_;
  std::mutex workers_mutex_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned short> http_port_{0};
  std::atomic<unsigned short> binary_port_{0};
};

}  // namespace collab
