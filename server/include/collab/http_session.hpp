/*
 * 설명: HTTP 연결을 처리하고 상태/메트릭 엔드포인트, 폴링 핸드셰이크, WS 업그레이드를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp, server/tests/e2e/legacy_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "collab/collaboration_hub.hpp"
#include "collab/identity.hpp"
#include "collab/observability.hpp"
#include "collab/session_coordinator.hpp"
#include "collab/websocket_session.hpp"

namespace collab {

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);
std::string ParseBearer(const std::string& header_value);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<SessionCoordinator> coordinator,
              std::shared_ptr<CollaborationHub> hub, std::shared_ptr<IdentityResolver> identity,
              std::shared_ptr<Observability> observability, const SessionLimits& limits);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleWebSocket(Protocol protocol, const std::string& query);
  void SendJson(boost::beast::http::status status, const nlohmann::json& envelope);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<SessionCoordinator> coordinator_;
  std::shared_ptr<CollaborationHub> hub_;
  std::shared_ptr<IdentityResolver> identity_;
  std::shared_ptr<Observability> observability_;
  SessionLimits limits_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace collab
