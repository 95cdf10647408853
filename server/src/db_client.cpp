/*
 * 설명: MariaDB 연결 재사용과 재연결/재시도 로직을 구현한다.
 * 버전: v1.3.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_directory_it_test.cpp
 */
#include "collab/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace collab {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::~MariaDbClient() {
  std::lock_guard<std::mutex> lock(mutex_);
  ResetConnection();
}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  unsigned int timeout = config_.timeout_seconds;
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("연결 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code, IsRetryable(code));
  }
  return conn;
}

void MariaDbClient::ResetConnection() {
  if (conn_) {
    mysql_close(conn_);
    conn_ = nullptr;
  }
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    try {
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", CR_SERVER_LOST, true);
      }
      // 유휴 중 끊긴 연결은 ping으로 걸러 새로 맺는다.
      if (conn_ && mysql_ping(conn_) != 0) {
        ResetConnection();
      }
      if (!conn_) {
        conn_ = Connect();
      }
      work(conn_);
      return;
    } catch (const DbException& ex) {
      if (ex.retryable) {
        ResetConnection();
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    }
  }
}

std::optional<std::string> MariaDbClient::QuerySingleValue(MYSQL* conn, const std::string& sql,
                                                           const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  std::optional<std::string> value;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row && row[0]) {
    value = row[0];
  }
  mysql_free_result(res);
  return value;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + static_cast<std::size_t>(dist(gen))));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  transient_injector_ = injector;
}

}  // namespace collab
