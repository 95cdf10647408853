/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace collab {

struct IceServerConfig {
  std::vector<std::string> urls;
  std::optional<std::string> username;
  std::optional<std::string> credential;
};

struct AppConfig {
  unsigned short port;
  unsigned short binary_port;
  std::string instance_id;
  std::string store_backend;
  std::string redis_host;
  unsigned short redis_port;
  std::string redis_password;
  std::string key_prefix;
  std::size_t store_timeout_ms;
  std::string room_directory;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string auth_secret;
  bool auth_allow_anonymous;
  std::size_t lock_ttl_seconds;
  std::size_t throttle_tick_ms;
  std::size_t room_grace_seconds;
  std::size_t keepalive_timeout_seconds;
  std::size_t presence_ttl_seconds;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t max_frame_bytes;
  std::size_t drain_grace_ms;
  std::vector<IceServerConfig> ice_servers;
};

AppConfig LoadConfigFromEnv();

std::vector<std::string> SplitList(const std::string& value, char delimiter);

}  // namespace collab
