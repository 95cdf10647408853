/*
 * 설명: 공유 저장소 위의 TTL 기반 편집 잠금(분산 상호배제)을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lock_manager_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "collab/observability.hpp"
#include "collab/shared_store.hpp"

namespace collab {

struct LockResult {
  bool acquired{false};
  // 실패 사유: "busy"(다른 보유자) 또는 "unavailable"(저장소 장애)
  std::string reason;
};

class EditLockManager {
 public:
  EditLockManager(std::shared_ptr<SharedStore> store, std::string key_prefix, std::chrono::milliseconds default_ttl,
                  std::shared_ptr<Observability> observability);

  LockResult TryAcquire(const std::string& object_id, const std::string& holder_id,
                        std::optional<std::chrono::milliseconds> ttl = std::nullopt);
  bool Release(const std::string& object_id, const std::string& holder_id);
  std::vector<std::string> ReleaseAllFor(const std::string& holder_id);

  bool IsHeldBy(const std::string& object_id, const std::string& holder_id);
  std::optional<std::string> HolderOf(const std::string& object_id);
  std::chrono::milliseconds DefaultTtl() const { return default_ttl_; }

 private:
  std::string LockKey(const std::string& object_id) const;
  std::string HolderIndexKey(const std::string& holder_id) const;
  void EmitLockEvent(LifecycleKind kind, const std::string& object_id, const std::string& holder_id,
                     const std::string& detail);
  void ReportStoreFailure(const char* op, const std::string& object_id, const StoreException& ex);

  std::shared_ptr<SharedStore> store_;
  std::string key_prefix_;
  std::chrono::milliseconds default_ttl_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace collab
