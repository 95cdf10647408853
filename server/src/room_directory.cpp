/*
 * 설명: 방 상태를 정적 목록 또는 MariaDB puzzle_sessions 테이블에서 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_coordinator_test.cpp, server/tests/it/room_directory_it_test.cpp
 */
#include "collab/room_directory.hpp"

#include <sstream>

namespace collab {

const char* ToString(RoomStatus status) {
  switch (status) {
    case RoomStatus::kOpen:
      return "open";
    case RoomStatus::kClosed:
      return "closed";
    case RoomStatus::kUnknown:
      return "unknown";
    case RoomStatus::kUnavailable:
      return "unavailable";
  }
  return "unknown";
}

RoomStatus RoomStatusFromColumn(const std::string& status) {
  if (status == "active") {
    return RoomStatus::kOpen;
  }
  if (status == "paused" || status == "completed" || status == "cancelled" || status == "expired") {
    return RoomStatus::kClosed;
  }
  return RoomStatus::kUnknown;
}

RoomStatus StaticRoomDirectory::Lookup(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) {
    return RoomStatus::kUnavailable;
  }
  return closed_.count(room_id) > 0 ? RoomStatus::kClosed : RoomStatus::kUnknown;
}

void StaticRoomDirectory::Close(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_.insert(room_id);
}

void StaticRoomDirectory::Reopen(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_.erase(room_id);
}

void StaticRoomDirectory::SetUnavailable(bool unavailable) {
  std::lock_guard<std::mutex> lock(mutex_);
  unavailable_ = unavailable;
}

MariaDbRoomDirectory::MariaDbRoomDirectory(std::shared_ptr<MariaDbClient> db_client,
                                           std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), observability_(std::move(observability)) {}

RoomStatus MariaDbRoomDirectory::Lookup(const std::string& room_id) {
  RoomStatus status = RoomStatus::kUnknown;
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT status FROM puzzle_sessions WHERE id='" << db_client_->Escape(conn, room_id) << "' LIMIT 1;";
      auto column = db_client_->QuerySingleValue(conn, oss.str(), "방 상태 조회 실패");
      status = column ? RoomStatusFromColumn(*column) : RoomStatus::kUnknown;
    });
  } catch (const DbException& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.name = "room_directory.lookup_failed";
      ctx.level = LogLevel::kWarn;
      ctx.room_id = room_id;
      ctx.detail = ex.what();
      observability_->Log(ctx);
    }
    return RoomStatus::kUnavailable;
  }
  return status;
}

}  // namespace collab
