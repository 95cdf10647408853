/*
 * 설명: WebSocket 연결(기본 허브/레거시 텍스트 프로토콜)의 수신 분배, 송신 큐, 백프레셔를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp, server/tests/e2e/legacy_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "collab/collaboration_hub.hpp"
#include "collab/connection.hpp"
#include "collab/legacy_protocol.hpp"
#include "collab/observability.hpp"
#include "collab/session_coordinator.hpp"

namespace collab {

struct SessionLimits {
  std::size_t max_queue_messages{256};
  std::size_t max_queue_bytes{1024 * 1024};
  std::chrono::seconds keepalive_timeout{60};
  std::size_t max_frame_bytes{1024 * 1024};
};

class WebSocketSession : public ConnectionSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, Protocol protocol,
                   const Identity& identity, std::shared_ptr<SessionCoordinator> coordinator,
                   std::shared_ptr<CollaborationHub> hub, std::shared_ptr<Observability> observability,
                   const SessionLimits& limits);
  ~WebSocketSession() override;
  void Run();

  void Deliver(const ServerEvent& event) override;
  void Close(const std::string& reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleNative(const std::string& text);
  void HandleLegacy(const std::string& text);
  void HandleLegacyEvent(const LegacyPacket& packet);
  void SendReply(const HubReply& reply, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  std::string EncodeEvent(const ServerEvent& event) const;
  void EnqueueMessage(std::string message);
  void DropQueued();
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void CloseNow(const std::string& reason);
  void StartClose(const std::string& reason);
  void Shutdown(const std::string& reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  Protocol protocol_;
  Identity identity_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<CollaborationHub> hub_;
  std::shared_ptr<Observability> observability_;
  SessionLimits limits_;
  std::optional<std::string> connection_id_;
  std::string nsp_{"/"};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::optional<std::string> pending_close_;
};

}  // namespace collab
