/*
 * 설명: 바이너리 프레임을 해석해 핑/에코/원시 데이터/인증/협업 명령을 처리하고 응답 프레임을 송신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/binary_flow_test.cpp
 */
#include "collab/framed_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include "collab/overloaded.hpp"

namespace collab {

FramedSession::FramedSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<SessionCoordinator> coordinator,
                             std::shared_ptr<CollaborationHub> hub, std::shared_ptr<IdentityResolver> identity,
                             std::shared_ptr<Observability> observability, const SessionLimits& limits)
    : stream_(std::move(socket)), decoder_(limits.max_frame_bytes), coordinator_(std::move(coordinator)),
      hub_(std::move(hub)), identity_(std::move(identity)), observability_(std::move(observability)),
      limits_(limits) {}

FramedSession::~FramedSession() {
  if (connection_id_) {
    coordinator_->Disconnect(*connection_id_, "session_destroyed");
  }
}

void FramedSession::Run() {
  authenticated_ = identity_->AllowAnonymous();
  connection_id_ = coordinator_->Connect(Protocol::kBinary, shared_from_this(), Identity{});
  if (!connection_id_) {
    CloseNow("server_draining");
    return;
  }
  EnqueueMessage(EncodeBinaryWelcome(*connection_id_, NowMillis()));
  DoRead();
}

void FramedSession::Deliver(const ServerEvent& event) {
  boost::asio::post(stream_.get_executor(),
                    [self = shared_from_this(), event]() { self->EnqueueMessage(EncodeBinaryEvent(event)); });
}

void FramedSession::Close(const std::string& reason) {
  boost::asio::post(stream_.get_executor(), [self = shared_from_this(), reason]() { self->CloseNow(reason); });
}

void FramedSession::DoRead() {
  if (closing_) {
    return;
  }
  // 유휴 연결은 keepalive 타임아웃이 지나면 읽기가 만료되어 정리된다.
  stream_.expires_after(limits_.keepalive_timeout);
  auto self = shared_from_this();
  stream_.async_read_some(boost::asio::buffer(read_buffer_),
                          [self](boost::beast::error_code ec, std::size_t bytes) { self->OnRead(ec, bytes); });
}

void FramedSession::OnRead(boost::beast::error_code ec, std::size_t bytes_transferred) {
  if (ec == boost::beast::error::timeout) {
    return Shutdown("idle-timeout");
  }
  if (ec) {
    return Shutdown(closing_ ? "closed" : "transport_closed");
  }
  if (connection_id_) {
    coordinator_->Touch(*connection_id_);
  }
  decoder_.Append(read_buffer_.data(), bytes_transferred);

  std::string payload;
  while (!closing_) {
    auto status = decoder_.Next(payload);
    if (status == FrameDecoder::Status::kNeedMore) {
      break;
    }
    if (status == FrameDecoder::Status::kTooLarge) {
      // 길이 필드를 신뢰할 수 없으므로 스트림을 재동기화할 수 없다.
      if (observability_) {
        observability_->IncrementProtocolError();
      }
      EnqueueMessage(EncodeBinaryError("frame_too_large", "프레임 크기가 허용 범위를 초과했습니다."));
      CloseNow("frame_too_large");
      return;
    }
    HandleFrame(payload);
  }

  if (!closing_) {
    DoRead();
  }
}

void FramedSession::HandleFrame(const std::string& payload) {
  BinaryInbound inbound;
  std::string error_code;
  std::string error_message;
  if (!DecodeBinaryPayload(payload, inbound, error_code, error_message)) {
    if (observability_) {
      observability_->IncrementProtocolError();
    }
    EnqueueMessage(EncodeBinaryError(error_code, error_message));
    return;
  }

  std::visit(Overloaded{
                 [this](const BinaryPing&) { EnqueueMessage(EncodeBinaryPong(NowMillis())); },
                 [this](const BinaryEcho& echo) {
                   EnqueueMessage(EncodeJsonFrame({{"type", "echo"}, {"data", echo.data}}));
                 },
                 [this](const BinaryDataRequest&) {
                   EnqueueMessage(EncodeRawFrame(MakeBinaryDataResponse(NowMillis())));
                 },
                 [this](const BinaryRawEcho& raw) { EnqueueMessage(EncodeRawFrame(raw.bytes)); },
                 [this](const BinaryAuth& auth) { HandleAuth(auth); },
                 [this](const ClientCommand& command) {
                   if (!authenticated_) {
                     EnqueueMessage(EncodeBinaryError("unauthorized", "인증이 필요합니다."));
                     return;
                   }
                   auto reply = hub_->Dispatch(*connection_id_, command);
                   if (!reply.ok) {
                     EnqueueMessage(EncodeBinaryError(reply.error_code, reply.error_message));
                   } else if (reply.event) {
                     EnqueueMessage(EncodeBinaryEvent(*reply.event));
                   }
                 },
             },
             inbound);
}

void FramedSession::HandleAuth(const BinaryAuth& auth) {
  std::string error_code;
  std::string error_message;
  auto identity = identity_->Resolve(auth.token, error_code, error_message);
  if (!identity) {
    EnqueueMessage(EncodeBinaryError(error_code, error_message));
    return;
  }
  coordinator_->AttachIdentity(*connection_id_, *identity);
  authenticated_ = true;
  nlohmann::json data{{"connectionId", *connection_id_},
                      {"userId", identity->user_id ? nlohmann::json(*identity->user_id) : nlohmann::json(nullptr)},
                      {"username", identity->username ? nlohmann::json(*identity->username) : nlohmann::json(nullptr)}};
  EnqueueMessage(EncodeBinaryEvent(ServerEvent{"auth.ok", data}));
}

void FramedSession::DropQueued() {
  // 진행 중인 쓰기가 참조하는 선두 메시지는 완료 콜백까지 유지한다.
  while (send_queue_.size() > (writing_ ? 1U : 0U)) {
    send_queue_.pop_back();
  }
  queued_bytes_ = send_queue_.empty() ? 0 : send_queue_.front().size();
}

void FramedSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + message_size > limits_.max_queue_bytes) {
    DropQueued();
    CloseNow("backpressure_exceeded");
    Shutdown("backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void FramedSession::WriteNext() {
  if (send_queue_.empty()) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  boost::asio::async_write(stream_, boost::asio::buffer(send_queue_.front()),
                           [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void FramedSession::OnWrite(boost::beast::error_code ec) {
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
  } else if (closing_) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
  }
}

void FramedSession::CloseNow(const std::string& reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  if (observability_) {
    observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                   .connection_id = connection_id_,
                                   .name = "binary.close",
                                   .level = LogLevel::kDebug,
                                   .detail = reason});
  }
  // 대기 중인 프레임(오류 프레임 포함)을 보낸 뒤 송신 방향을 닫는다.
  if (!writing_) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
  }
}

void FramedSession::Shutdown(const std::string& reason) {
  if (connection_id_) {
    coordinator_->Disconnect(*connection_id_, reason);
  }
}

}  // namespace collab
