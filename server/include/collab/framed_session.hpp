/*
 * 설명: 길이 접두 바이너리 프레임 TCP 연결의 수신 분배, 송신 큐, 백프레셔를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/binary_flow_test.cpp
 */
#pragma once

#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include "collab/binary_protocol.hpp"
#include "collab/collaboration_hub.hpp"
#include "collab/connection.hpp"
#include "collab/identity.hpp"
#include "collab/observability.hpp"
#include "collab/session_coordinator.hpp"
#include "collab/websocket_session.hpp"

namespace collab {

class FramedSession : public ConnectionSink, public std::enable_shared_from_this<FramedSession> {
 public:
  FramedSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<SessionCoordinator> coordinator,
                std::shared_ptr<CollaborationHub> hub, std::shared_ptr<IdentityResolver> identity,
                std::shared_ptr<Observability> observability, const SessionLimits& limits);
  ~FramedSession() override;
  void Run();

  void Deliver(const ServerEvent& event) override;
  void Close(const std::string& reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleFrame(const std::string& payload);
  void HandleAuth(const BinaryAuth& auth);
  void EnqueueMessage(std::string message);
  void DropQueued();
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseNow(const std::string& reason);
  void Shutdown(const std::string& reason);

  boost::beast::tcp_stream stream_;
  std::array<char, 8192> read_buffer_{};
  FrameDecoder decoder_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<CollaborationHub> hub_;
  std::shared_ptr<IdentityResolver> identity_;
  std::shared_ptr<Observability> observability_;
  SessionLimits limits_;
  std::optional<std::string> connection_id_;
  bool authenticated_{false};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
};

}  // namespace collab
