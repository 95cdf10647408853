/*
 * 설명: 환경 변수에서 서버 설정을 읽고 기본값을 채운다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "collab/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <random>
#include <sstream>

namespace collab {
namespace {

std::string RandomInstanceId() {
  static const char* kHex = "0123456789abcdef";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 15);
  std::string id = "node-";
  for (int i = 0; i < 8; ++i) {
    id.push_back(kHex[dist(gen)]);
  }
  return id;
}

bool ParseBool(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

}  // namespace

std::vector<std::string> SplitList(const std::string& value, char delimiter) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, delimiter)) {
    auto begin = item.find_first_not_of(" \t");
    if (begin == std::string::npos) {
      continue;
    }
    auto end = item.find_last_not_of(" \t");
    items.push_back(item.substr(begin, end - begin + 1));
  }
  return items;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.binary_port = static_cast<unsigned short>(std::stoi(get_env("BINARY_PORT", "8081")));
  cfg.instance_id = get_env("INSTANCE_ID", "");
  if (cfg.instance_id.empty()) {
    cfg.instance_id = RandomInstanceId();
  }
  cfg.store_backend = get_env("STORE_BACKEND", "redis");
  cfg.redis_host = get_env("REDIS_HOST", "redis");
  cfg.redis_port = static_cast<unsigned short>(std::stoi(get_env("REDIS_PORT", "6379")));
  cfg.redis_password = get_env("REDIS_PASSWORD", "");
  cfg.key_prefix = get_env("KEY_PREFIX", "collab");
  cfg.store_timeout_ms = static_cast<std::size_t>(std::stoul(get_env("STORE_TIMEOUT_MS", "500")));
  cfg.room_directory = get_env("ROOM_DIRECTORY", "static");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.auth_secret = get_env("AUTH_SECRET", "");
  cfg.auth_allow_anonymous = ParseBool(get_env("AUTH_ALLOW_ANONYMOUS", "true"));
  cfg.lock_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("LOCK_TTL_SECONDS", "30")));
  cfg.throttle_tick_ms = static_cast<std::size_t>(std::stoul(get_env("THROTTLE_TICK_MS", "100")));
  cfg.room_grace_seconds = static_cast<std::size_t>(std::stoul(get_env("ROOM_GRACE_SECONDS", "60")));
  cfg.keepalive_timeout_seconds = static_cast<std::size_t>(std::stoul(get_env("KEEPALIVE_TIMEOUT_SECONDS", "60")));
  cfg.presence_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("PRESENCE_TTL_SECONDS", "90")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.max_frame_bytes = static_cast<std::size_t>(std::stoul(get_env("MAX_FRAME_BYTES", "1048576")));
  cfg.drain_grace_ms = static_cast<std::size_t>(std::stoul(get_env("DRAIN_GRACE_MS", "500")));

  auto stun_urls = SplitList(get_env("ICE_STUN_URLS", "stun:stun.l.google.com:19302"), ',');
  if (!stun_urls.empty()) {
    cfg.ice_servers.push_back(IceServerConfig{stun_urls, std::nullopt, std::nullopt});
  }
  auto turn_url = get_env("ICE_TURN_URL", "");
  if (!turn_url.empty()) {
    IceServerConfig turn{{turn_url}, std::nullopt, std::nullopt};
    auto username = get_env("ICE_TURN_USERNAME", "");
    auto credential = get_env("ICE_TURN_CREDENTIAL", "");
    if (!username.empty()) {
      turn.username = username;
    }
    if (!credential.empty()) {
      turn.credential = credential;
    }
    cfg.ice_servers.push_back(std::move(turn));
  }
  return cfg;
}

}  // namespace collab
