/*
 * 설명: 방 디렉터리 조회용 MariaDB 연결(재사용, 재연결, 재시도)을 캡슐화한다.
 * 버전: v1.3.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_directory_it_test.cpp
 */
#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace collab {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  unsigned int timeout_seconds = 2;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 조인 경로에서 호출되므로 연결 하나를 유지하며 직렬화한다.
class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);
  ~MariaDbClient();

  MariaDbClient(const MariaDbClient&) = delete;
  MariaDbClient& operator=(const MariaDbClient&) = delete;

  // 연결 오류처럼 재시도 가능한 실패는 연결을 버리고 백오프 후 다시 시도한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work);

  // 첫 행의 첫 열을 돌려준다. 행이 없거나 NULL이면 nullopt.
  std::optional<std::string> QuerySingleValue(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  void ResetConnection();
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::mutex mutex_;
  MYSQL* conn_{nullptr};
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace collab
