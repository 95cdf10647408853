/*
 * 설명: 전송 자격 증명(HMAC 서명 토큰)에서 사용자 신원을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "collab/connection.hpp"

namespace collab {

std::string BytesToHex(const unsigned char* data, std::size_t len);
bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out);
std::string RandomHex(std::size_t bytes);

struct IdentityConfig {
  std::string secret;
  bool allow_anonymous{true};
};

// 토큰 형식: <userId>.<hex(username)>.<expiryUnix>.<hex(HMAC-SHA256)>
class IdentityResolver {
 public:
  explicit IdentityResolver(IdentityConfig config);

  // 빈 토큰은 익명 허용 시 빈 Identity로 확인된다.
  std::optional<Identity> Resolve(const std::string& token, std::string& error_code,
                                  std::string& error_message) const;
  std::string Issue(const std::string& user_id, const std::string& username, std::chrono::seconds ttl) const;
  bool AllowAnonymous() const { return config_.allow_anonymous; }

 private:
  std::string Sign(const std::string& body) const;

  IdentityConfig config_;
};

}  // namespace collab
