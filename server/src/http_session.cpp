/*
 * 설명: HTTP 요청을 처리하고 상태/메트릭/폴링 핸드셰이크와 WS 업그레이드(기본 허브, 레거시)를 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp, server/tests/e2e/legacy_flow_test.cpp
 */
#include "collab/http_session.hpp"

#include <optional>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "collab/api_response.hpp"
#include "collab/legacy_protocol.hpp"

namespace collab {

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::string ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<SessionCoordinator> coordinator,
                         std::shared_ptr<CollaborationHub> hub, std::shared_ptr<IdentityResolver> identity,
                         std::shared_ptr<Observability> observability, const SessionLimits& limits)
    : stream_(std::move(socket)), coordinator_(std::move(coordinator)), hub_(std::move(hub)),
      identity_(std::move(identity)), observability_(std::move(observability)), limits_(limits) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (websocket::is_upgrade(req_)) {
    if (path == "/ws") {
      return HandleWebSocket(Protocol::kNative, query);
    }
    if (path == "/socket.io/" || path == "/socket.io") {
      return HandleWebSocket(Protocol::kLegacy, query);
    }
    return SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "리소스를 찾을 수 없습니다"));
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"},
                           {"instanceId", coordinator_->InstanceId()},
                           {"draining", coordinator_->IsDraining()}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    return SendJson(http::status::ok, MakeSuccessEnvelope(observability_->SnapshotJson()));
  }

  if (req_.method() == http::verb::get && (path == "/socket.io/" || path == "/socket.io")) {
    // 폴링 전송은 핸드셰이크만 제공하고 이후 통신은 WebSocket 업그레이드로 유도한다.
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->result(http::status::ok);
    res->set(http::field::server, "collab-sync");
    res->set(http::field::content_type, "text/plain; charset=UTF-8");
    res->body() = EncodeLegacyOpen(RandomHex(10));
    res->content_length(res->body().size());
    return SendResponse(res);
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "리소스를 찾을 수 없습니다"));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& envelope) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, "collab-sync");
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = envelope.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         request_start_)
                       .count();
    observability_->Log(LogContext{.trace_id = trace_id_,
                                   .name = std::string(req_.target()),
                                   .latency_ms = static_cast<long>(latency),
                                   .level = res->result_int() >= 400 ? LogLevel::kWarn : LogLevel::kInfo,
                                   .detail = std::to_string(res->result_int())});
  }
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

void HttpSession::HandleWebSocket(Protocol protocol, const std::string& query) {
  std::string token;
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    token = ParseBearer(std::string(auth_it->value()));
  }
  if (token.empty()) {
    auto params = ParseQueryParams(query);
    auto it = params.find("token");
    if (it != params.end()) {
      token = it->second;
    }
  }

  std::string error_code;
  std::string error_message;
  auto identity = identity_->Resolve(token, error_code, error_message);
  if (!identity) {
    return SendJson(boost::beast::http::status::unauthorized, MakeErrorEnvelope(error_code, error_message));
  }
  if (coordinator_->IsDraining()) {
    return SendJson(boost::beast::http::status::service_unavailable,
                    MakeErrorEnvelope("server_draining", "서버가 종료 중입니다",
                                      {{"instanceId", coordinator_->InstanceId()}}));
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // 업그레이드 이후에는 스트림 자체 타임아웃 대신 WebSocket 유휴 타임아웃과 핑을 사용한다.
  ws.next_layer().expires_never();
  boost::beast::websocket::stream_base::timeout timeout_opt{};
  timeout_opt.handshake_timeout = std::chrono::seconds(30);
  timeout_opt.idle_timeout = limits_.keepalive_timeout;
  timeout_opt.keep_alive_pings = true;
  ws.set_option(timeout_opt);
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "collab-sync");
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Log(LogContext{.trace_id = trace_id_,
                                     .name = "ws.accept_failed",
                                     .level = LogLevel::kWarn,
                                     .detail = ec.message()});
    }
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), protocol, *identity, coordinator_, hub_, observability_, limits_)
      ->Run();
}

}  // namespace collab
