/*
 * 설명: 서버 구성 요소를 조립하고 HTTP/바이너리 리스너, 유지보수 타이머, 시그널 기반 드레인을 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/collab_flow_test.cpp, server/tests/e2e/binary_flow_test.cpp,
 *         server/tests/e2e/legacy_flow_test.cpp
 */
#include "collab/app.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "collab/db_client.hpp"
#include "collab/framed_session.hpp"
#include "collab/http_session.hpp"
#include "collab/redis_store.hpp"

namespace collab {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  using SessionFactory = std::function<void(boost::asio::ip::tcp::socket)>;

  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, SessionFactory factory)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), factory_(std::move(factory)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(boost::asio::make_strand(ioc_),
                           [self = shared_from_this()](boost::beast::error_code ec,
                                                       boost::asio::ip::tcp::socket socket) {
                             if (!ec) {
                               self->factory_(std::move(socket));
                             }
                             if (self->acceptor_.is_open()) {
                               self->DoAccept();
                             }
                           });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  SessionFactory factory_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_),
      maintenance_timer_(ioc_), drain_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  std::shared_ptr<SharedStore> store;
  if (config.store_backend == "redis") {
    RedisConfig redis_config{config.redis_host, config.redis_port, config.redis_password,
                             std::chrono::milliseconds(config.store_timeout_ms)};
    store = std::make_shared<RedisStore>(redis_config, observability_);
  } else {
    store = std::make_shared<InMemoryStore>();
  }

  std::shared_ptr<RoomDirectory> directory;
  if (config.room_directory == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    directory = std::make_shared<MariaDbRoomDirectory>(std::make_shared<MariaDbClient>(db_config), observability_);
  } else {
    directory = std::make_shared<StaticRoomDirectory>();
  }
  Build(std::move(store), std::move(directory));
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<SharedStore> store,
                     std::shared_ptr<RoomDirectory> directory)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_),
      maintenance_timer_(ioc_), drain_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  Build(std::move(store), std::move(directory));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Build(std::shared_ptr<SharedStore> store, std::shared_ptr<RoomDirectory> directory) {
  store_ = std::move(store);
  directory_ = std::move(directory);
  backplane_ = std::make_shared<Backplane>(store_, config_.key_prefix, config_.instance_id, observability_);
  locks_ = std::make_shared<EditLockManager>(store_, config_.key_prefix,
                                             std::chrono::seconds(config_.lock_ttl_seconds), observability_);
  throttle_ = std::make_shared<ThrottlePipeline>(ioc_, std::chrono::milliseconds(config_.throttle_tick_ms),
                                                 observability_);

  CoordinatorOptions options;
  options.instance_id = config_.instance_id;
  options.key_prefix = config_.key_prefix;
  options.presence_ttl = std::chrono::seconds(config_.presence_ttl_seconds);
  options.room_grace = std::chrono::seconds(config_.room_grace_seconds);
  options.keepalive_timeout = std::chrono::seconds(config_.keepalive_timeout_seconds);
  options.ice_servers = config_.ice_servers;
  coordinator_ = std::make_shared<SessionCoordinator>(options, store_, backplane_, locks_, throttle_, directory_,
                                                      observability_);
  relay_ = std::make_shared<SignalingRelay>(coordinator_, backplane_, store_, observability_);
  hub_ = std::make_shared<CollaborationHub>(coordinator_, locks_, throttle_, relay_, observability_);
  identity_ = std::make_shared<IdentityResolver>(IdentityConfig{config_.auth_secret, config_.auth_allow_anonymous});

  limits_.max_queue_messages = config_.ws_queue_limit_messages;
  limits_.max_queue_bytes = config_.ws_queue_limit_bytes;
  limits_.keepalive_timeout = std::chrono::seconds(config_.keepalive_timeout_seconds);
  limits_.max_frame_bytes = config_.max_frame_bytes;
}

void ServerApp::Run() {
  try {
    running_ = true;
    if (!coordinator_->Start()) {
      // 백플레인 구독 실패는 로컬 전용 모드로 계속 진행하고 유지보수 타이머가 재시도한다.
      observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                     .name = "server.backplane_unavailable",
                                     .level = LogLevel::kWarn});
    }

    auto coordinator = coordinator_;
    auto hub = hub_;
    auto identity = identity_;
    auto observability = observability_;
    auto limits = limits_;
    boost::asio::ip::tcp::endpoint http_endpoint{boost::asio::ip::tcp::v4(), config_.port};
    http_listener_ = std::make_shared<Listener>(
        ioc_, http_endpoint, [coordinator, hub, identity, observability, limits](boost::asio::ip::tcp::socket socket) {
          std::make_shared<HttpSession>(std::move(socket), coordinator, hub, identity, observability, limits)->Run();
        });
    boost::asio::ip::tcp::endpoint binary_endpoint{boost::asio::ip::tcp::v4(), config_.binary_port};
    binary_listener_ = std::make_shared<Listener>(
        ioc_, binary_endpoint,
        [coordinator, hub, identity, observability, limits](boost::asio::ip::tcp::socket socket) {
          std::make_shared<FramedSession>(std::move(socket), coordinator, hub, identity, observability, limits)
              ->Run();
        });
    http_port_ = http_listener_->Port();
    binary_port_ = binary_listener_->Port();
    http_listener_->Run();
    binary_listener_->Run();

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::beast::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                     .name = "server.signal",
                                     .level = LogLevel::kInfo,
                                     .detail = std::to_string(signal_number)});
      Drain("server_shutdown");
    });
    ScheduleMaintenance();

    std::cout << "서버 시작: 포트 " << http_port_.load() << " (바이너리 " << binary_port_.load() << "), 인스턴스 "
              << config_.instance_id << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
  JoinWorkers();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  std::lock_guard<std::mutex> lock(workers_mutex_);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else if (worker.joinable()) {
      worker.join();
    }
  }
}

void ServerApp::ScheduleMaintenance() {
  maintenance_timer_.expires_after(std::chrono::seconds(1));
  maintenance_timer_.async_wait([this](const boost::beast::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    RunMaintenance();
    ScheduleMaintenance();
  });
}

void ServerApp::RunMaintenance() {
  auto idle = coordinator_->SweepIdle();
  auto collected = coordinator_->CollectEmptyRooms();
  coordinator_->RefreshPresenceLeases();
  if (!backplane_->IsSubscribed()) {
    backplane_->Start();
  }
  backplane_->CheckRecovery();
  if (idle > 0 || collected > 0) {
    observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                   .name = "server.maintenance",
                                   .level = LogLevel::kDebug,
                                   .detail = "idle=" + std::to_string(idle) + " rooms=" + std::to_string(collected)});
  }
}

// 새 연결을 막고 모든 연결을 정리한 뒤, 종료 프레임이 나갈 유예 시간 후 I/O 컨텍스트를 멈춘다.
void ServerApp::Drain(const std::string& reason) {
  if (!running_.exchange(false)) {
    return;
  }
  if (http_listener_) {
    http_listener_->Stop();
  }
  if (binary_listener_) {
    binary_listener_->Stop();
  }
  coordinator_->BeginDrain();
  auto closed = coordinator_->DisconnectAll(reason);
  throttle_->CancelAll();
  coordinator_->Stop();
  observability_->Log(LogContext{.trace_id = observability_->NextTraceId(),
                                 .name = "server.drained",
                                 .level = LogLevel::kInfo,
                                 .detail = "connections=" + std::to_string(closed)});

  work_guard_.reset();
  // 세션 strand에 쌓인 user-left와 닫기 프레임은 유예 시간 동안 전송된다.
  drain_timer_.expires_after(std::chrono::milliseconds(config_.drain_grace_ms));
  drain_timer_.async_wait([this](const boost::beast::error_code&) { ioc_.stop(); });
}

void ServerApp::Stop() {
  Drain("server_shutdown");
  JoinWorkers();
}

}  // namespace collab
