/*
 * 설명: 외부 방 존재/폐쇄 여부 확인 인터페이스와 정적/MariaDB 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp, server/tests/it/room_directory_it_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "collab/db_client.hpp"
#include "collab/observability.hpp"

namespace collab {

// kUnknown은 지연 생성 대상이고, kUnavailable은 조회 실패(참가 거부)를 뜻한다.
enum class RoomStatus { kOpen, kClosed, kUnknown, kUnavailable };

const char* ToString(RoomStatus status);

class RoomDirectory {
 public:
  virtual ~RoomDirectory() = default;
  virtual RoomStatus Lookup(const std::string& room_id) = 0;
};

class StaticRoomDirectory : public RoomDirectory {
 public:
  RoomStatus Lookup(const std::string& room_id) override;
  void Close(const std::string& room_id);
  void Reopen(const std::string& room_id);
  void SetUnavailable(bool unavailable);

 private:
  std::set<std::string> closed_;
  bool unavailable_{false};
  std::mutex mutex_;
};

class MariaDbRoomDirectory : public RoomDirectory {
 public:
  MariaDbRoomDirectory(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability);

  RoomStatus Lookup(const std::string& room_id) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
};

RoomStatus RoomStatusFromColumn(const std::string& status);

}  // namespace collab
