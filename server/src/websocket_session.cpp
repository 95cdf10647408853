/*
 * 설명: WebSocket 메시지를 읽어 프로토콜별로 디코딩하고 허브 응답과 방 이벤트를 백프레셔 하에 전송한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp, server/tests/e2e/legacy_flow_test.cpp
 */
#include "collab/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "collab/native_protocol.hpp"

namespace collab {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, Protocol protocol,
                                   const Identity& identity, std::shared_ptr<SessionCoordinator> coordinator,
                                   std::shared_ptr<CollaborationHub> hub, std::shared_ptr<Observability> observability,
                                   const SessionLimits& limits)
    : ws_(std::move(ws)), protocol_(protocol), identity_(identity), coordinator_(std::move(coordinator)),
      hub_(std::move(hub)), observability_(std::move(observability)), limits_(limits) {}

WebSocketSession::~WebSocketSession() {
  if (connection_id_) {
    coordinator_->Disconnect(*connection_id_, "session_destroyed");
  }
}

void WebSocketSession::Run() {
  ws_.read_message_max(limits_.max_frame_bytes);
  std::weak_ptr<WebSocketSession> weak = shared_from_this();
  ws_.control_callback([weak](boost::beast::websocket::frame_type, boost::beast::string_view) {
    if (auto self = weak.lock()) {
      if (self->connection_id_) {
        self->coordinator_->Touch(*self->connection_id_);
      }
    }
  });

  connection_id_ = coordinator_->Connect(protocol_, shared_from_this(), identity_);
  if (!connection_id_) {
    CloseNow("server_draining");
    return;
  }
  if (protocol_ == Protocol::kLegacy) {
    EnqueueMessage(EncodeLegacyOpen(*connection_id_));
  } else {
    nlohmann::json payload{
        {"connectionId", *connection_id_},
        {"userId", identity_.user_id ? nlohmann::json(*identity_.user_id) : nlohmann::json(nullptr)},
        {"username", identity_.username ? nlohmann::json(*identity_.username) : nlohmann::json(nullptr)}};
    EnqueueMessage(EncodeNativeEvent(ServerEvent{"connected", payload}));
  }
  DoRead();
}

void WebSocketSession::Deliver(const ServerEvent& event) {
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), event]() { self->EnqueueMessage(self->EncodeEvent(event)); });
}

void WebSocketSession::Close(const std::string& reason) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), reason]() { self->CloseNow(reason); });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return Shutdown("closed");
  }
  if (ec) {
    return Shutdown(closing_ ? "closed" : "transport_error");
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (connection_id_) {
    coordinator_->Touch(*connection_id_);
  }
  if (protocol_ == Protocol::kLegacy) {
    HandleLegacy(data);
  } else {
    HandleNative(data);
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleNative(const std::string& text) {
  NativeRequest request;
  std::string error_code;
  std::string error_message;
  if (!DecodeNativeMessage(text, request, error_code, error_message)) {
    if (observability_) {
      observability_->IncrementProtocolError();
    }
    SendError(error_code, error_message, request.seq);
    return;
  }
  SendReply(hub_->Dispatch(*connection_id_, request.command), request.seq);
}

void WebSocketSession::HandleLegacy(const std::string& text) {
  LegacyPacket packet;
  std::string error_code;
  std::string error_message;
  if (!DecodeLegacyPacket(text, packet, error_code, error_message)) {
    if (observability_) {
      observability_->IncrementProtocolError();
    }
    EnqueueMessage(EncodeLegacyError(error_code, error_message, nsp_));
    return;
  }
  switch (packet.engine) {
    case EnginePacket::kPing:
      // "2probe" 같은 탐침 문자열은 그대로 돌려준다.
      EnqueueMessage("3" + text.substr(1));
      return;
    case EnginePacket::kClose:
      Shutdown("client_close");
      return;
    case EnginePacket::kMessage:
      break;
    default:
      return;
  }
  switch (*packet.socket) {
    case SocketPacket::kConnect:
      nsp_ = packet.nsp;
      EnqueueMessage(EncodeLegacyConnectAck(nsp_, *connection_id_));
      break;
    case SocketPacket::kDisconnect:
      Shutdown("client_disconnect");
      break;
    case SocketPacket::kEvent:
      HandleLegacyEvent(packet);
      break;
    case SocketPacket::kAck:
    case SocketPacket::kError:
      break;
  }
}

void WebSocketSession::HandleLegacyEvent(const LegacyPacket& packet) {
  LegacyInbound inbound;
  std::string error_code;
  std::string error_message;
  HubReply reply;
  if (!TranslateLegacyEvent(packet.data, inbound, error_code, error_message)) {
    if (observability_) {
      observability_->IncrementProtocolError();
    }
    reply = ErrorReply(error_code, error_message);
  } else if (std::holds_alternative<LegacyPingTest>(inbound)) {
    reply = OkReply("pong-test", {{"timestamp", NowMillis()}});
  } else {
    reply = hub_->Dispatch(*connection_id_, std::get<ClientCommand>(inbound));
  }

  if (packet.ack_id) {
    nlohmann::json result;
    if (reply.ok) {
      result = {{"ok", true}};
      if (reply.event) {
        result["event"] = LegacyEventName(reply.event->name);
        result["data"] = reply.event->payload;
      }
    } else {
      result = {{"ok", false}, {"code", reply.error_code}, {"message", reply.error_message}};
    }
    EnqueueMessage(EncodeLegacyAck(nsp_, *packet.ack_id, nlohmann::json::array({result})));
    return;
  }
  if (!reply.ok) {
    EnqueueMessage(EncodeLegacyError(reply.error_code, reply.error_message, nsp_));
  } else if (reply.event) {
    EnqueueMessage(EncodeLegacyEvent(*reply.event, nsp_));
  }
}

void WebSocketSession::SendReply(const HubReply& reply, std::uint64_t seq) {
  if (!reply.ok) {
    SendError(reply.error_code, reply.error_message, seq);
    return;
  }
  if (reply.event) {
    EnqueueMessage(EncodeNativeEvent(*reply.event, seq));
  }
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(EncodeNativeError(code, message, seq));
}

std::string WebSocketSession::EncodeEvent(const ServerEvent& event) const {
  if (protocol_ == Protocol::kLegacy) {
    return EncodeLegacyEvent(event, nsp_);
  }
  return EncodeNativeEvent(event);
}

void WebSocketSession::DropQueued() {
  // 진행 중인 쓰기가 참조하는 선두 메시지는 완료 콜백까지 유지한다.
  while (send_queue_.size() > (writing_ ? 1U : 0U)) {
    send_queue_.pop_back();
  }
  queued_bytes_ = send_queue_.empty() ? 0 : send_queue_.front().size();
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_ || pending_close_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + message_size > limits_.max_queue_bytes) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  } else if (pending_close_) {
    StartClose(*pending_close_);
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  DropQueued();
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->Shutdown("backpressure_exceeded"); });
}

void WebSocketSession::CloseNow(const std::string& reason) {
  if (closing_ || pending_close_) {
    return;
  }
  // 이미 쌓인 이벤트(예: user-left)를 보낸 뒤 닫기 프레임을 보낸다.
  if (writing_ || !send_queue_.empty()) {
    pending_close_ = reason;
    return;
  }
  StartClose(reason);
}

void WebSocketSession::StartClose(const std::string& reason) {
  closing_ = true;
  pending_close_.reset();
  boost::beast::websocket::close_reason close{reason == "server_draining" || reason == "server_shutdown"
                                                  ? boost::beast::websocket::close_code::going_away
                                                  : boost::beast::websocket::close_code::normal};
  close.reason = reason;
  auto self = shared_from_this();
  ws_.async_close(close, [self](boost::beast::error_code) {});
}

void WebSocketSession::Shutdown(const std::string& reason) {
  if (connection_id_) {
    coordinator_->Disconnect(*connection_id_, reason);
  }
}

}  // namespace collab
