/*
 * 설명: HMAC-SHA256 서명 토큰을 검증/발급하고 16진 변환 유틸리티를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#include "collab/identity.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace collab {

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    unsigned int byte;
    std::istringstream iss(hex.substr(i, 2));
    iss >> std::hex >> byte;
    if (iss.fail()) {
      return false;
    }
    out.push_back(static_cast<unsigned char>(byte));
  }
  return true;
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

IdentityResolver::IdentityResolver(IdentityConfig config) : config_(std::move(config)) {}

std::string IdentityResolver::Sign(const std::string& body) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), config_.secret.data(), static_cast<int>(config_.secret.size()),
            reinterpret_cast<const unsigned char*>(body.data()), body.size(), digest, &digest_len)) {
    throw std::runtime_error("HMAC 계산 실패");
  }
  return BytesToHex(digest, digest_len);
}

std::string IdentityResolver::Issue(const std::string& user_id, const std::string& username,
                                    std::chrono::seconds ttl) const {
  auto expiry = std::chrono::duration_cast<std::chrono::seconds>(
                    (std::chrono::system_clock::now() + ttl).time_since_epoch())
                    .count();
  std::string body = user_id + "." +
                     BytesToHex(reinterpret_cast<const unsigned char*>(username.data()), username.size()) + "." +
                     std::to_string(expiry);
  return body + "." + Sign(body);
}

std::optional<Identity> IdentityResolver::Resolve(const std::string& token, std::string& error_code,
                                                  std::string& error_message) const {
  if (token.empty()) {
    if (config_.allow_anonymous) {
      return Identity{};
    }
    error_code = "unauthorized";
    error_message = "인증 토큰이 필요합니다";
    return std::nullopt;
  }
  auto fail = [&](const char* message) -> std::optional<Identity> {
    error_code = "unauthorized";
    error_message = message;
    return std::nullopt;
  };
  if (config_.secret.empty()) {
    return fail("토큰 검증이 설정되지 않았습니다");
  }

  auto sig_pos = token.rfind('.');
  if (sig_pos == std::string::npos) {
    return fail("토큰 형식이 올바르지 않습니다");
  }
  std::string body = token.substr(0, sig_pos);
  std::string signature = token.substr(sig_pos + 1);
  std::string expected = Sign(body);
  if (signature.size() != expected.size() ||
      CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    return fail("토큰 서명이 올바르지 않습니다");
  }

  auto first = body.find('.');
  auto second = first == std::string::npos ? std::string::npos : body.find('.', first + 1);
  if (second == std::string::npos) {
    return fail("토큰 형식이 올바르지 않습니다");
  }
  std::string user_id = body.substr(0, first);
  std::string username_hex = body.substr(first + 1, second - first - 1);
  std::string expiry_text = body.substr(second + 1);

  std::vector<unsigned char> username_bytes;
  if (user_id.empty() || !HexToBytes(username_hex, username_bytes)) {
    return fail("토큰 형식이 올바르지 않습니다");
  }
  long long expiry = 0;
  try {
    expiry = std::stoll(expiry_text);
  } catch (const std::exception&) {
    return fail("토큰 형식이 올바르지 않습니다");
  }
  auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                 .count();
  if (now > expiry) {
    return fail("토큰이 만료되었습니다");
  }

  Identity identity;
  identity.user_id = user_id;
  identity.username = std::string(username_bytes.begin(), username_bytes.end());
  return identity;
}

}  // namespace collab
