/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "collab/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace collab {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeEnvelope(bool success, const nlohmann::json& data, const nlohmann::json& error) {
  return {{"success", success}, {"data", data}, {"error", error}, {"meta", {{"timestamp", CurrentTimestamp()}}}};
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) { return MakeEnvelope(true, data, nullptr); }

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  return MakeEnvelope(false, nullptr, {{"code", code}, {"message", message}, {"detail", detail}});
}

// 이벤트가 아닌 메시지(error)는 event를 null로 둔다.
nlohmann::json ToWsJson(const WsEnvelope& env) {
  return {{"t", env.type},
          {"seq", env.seq},
          {"event", env.type == "event" ? nlohmann::json(env.event) : nlohmann::json(nullptr)},
          {"p", env.payload}};
}

}  // namespace collab
