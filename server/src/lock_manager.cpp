/*
 * 설명: 원자적 리스 연산으로 편집 잠금을 획득/해제하고 저장소 장애 시 실패로 닫는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lock_manager_test.cpp
 */
#include "collab/lock_manager.hpp"

namespace collab {
namespace {
// 보유자 인덱스는 잠금보다 오래 살아야 정리 누락이 없다.
constexpr int kIndexTtlMultiplier = 2;
}  // namespace

EditLockManager::EditLockManager(std::shared_ptr<SharedStore> store, std::string key_prefix,
                                 std::chrono::milliseconds default_ttl,
                                 std::shared_ptr<Observability> observability)
    : store_(std::move(store)), key_prefix_(std::move(key_prefix)), default_ttl_(default_ttl),
      observability_(std::move(observability)) {}

std::string EditLockManager::LockKey(const std::string& object_id) const { return key_prefix_ + ":lock:" + object_id; }

std::string EditLockManager::HolderIndexKey(const std::string& holder_id) const {
  return key_prefix_ + ":held:" + holder_id;
}

LockResult EditLockManager::TryAcquire(const std::string& object_id, const std::string& holder_id,
                                       std::optional<std::chrono::milliseconds> ttl) {
  auto lease_ttl = ttl.value_or(default_ttl_);
  LockResult result;
  // 재시도하지 않는다. 호출자는 거절을 즉시 보아야 한다.
  try {
    result.acquired = store_->AcquireLease(LockKey(object_id), holder_id, lease_ttl);
  } catch (const StoreException& ex) {
    ReportStoreFailure("lock.acquire", object_id, ex);
    result.reason = "unavailable";
    EmitLockEvent(LifecycleKind::kLockDenied, object_id, holder_id, result.reason);
    return result;
  }
  if (!result.acquired) {
    result.reason = "busy";
    EmitLockEvent(LifecycleKind::kLockDenied, object_id, holder_id, result.reason);
    return result;
  }
  EmitLockEvent(LifecycleKind::kLockAcquired, object_id, holder_id, "");
  if (observability_) {
    observability_->SetDegraded(false, "lock store recovered");
  }
  try {
    store_->SetAdd(HolderIndexKey(holder_id), object_id, lease_ttl * kIndexTtlMultiplier);
  } catch (const StoreException& ex) {
    // 인덱스 누락 시에도 잠금은 TTL로 스스로 만료된다.
    ReportStoreFailure("lock.index", object_id, ex);
  }
  return result;
}

bool EditLockManager::Release(const std::string& object_id, const std::string& holder_id) {
  bool released = false;
  try {
    released = store_->ReleaseLease(LockKey(object_id), holder_id);
    store_->SetRemove(HolderIndexKey(holder_id), object_id);
  } catch (const StoreException& ex) {
    ReportStoreFailure("lock.release", object_id, ex);
  }
  return released;
}

std::vector<std::string> EditLockManager::ReleaseAllFor(const std::string& holder_id) {
  std::vector<std::string> released;
  std::vector<std::string> candidates;
  try {
    candidates = store_->SetMembers(HolderIndexKey(holder_id));
  } catch (const StoreException& ex) {
    ReportStoreFailure("lock.sweep", holder_id, ex);
    return released;
  }
  for (const auto& object_id : candidates) {
    try {
      if (store_->ReleaseLease(LockKey(object_id), holder_id)) {
        released.push_back(object_id);
      }
    } catch (const StoreException& ex) {
      ReportStoreFailure("lock.sweep", object_id, ex);
    }
  }
  try {
    store_->Delete(HolderIndexKey(holder_id));
  } catch (const StoreException& ex) {
    ReportStoreFailure("lock.sweep", holder_id, ex);
  }
  return released;
}

bool EditLockManager::IsHeldBy(const std::string& object_id, const std::string& holder_id) {
  auto holder = HolderOf(object_id);
  return holder && *holder == holder_id;
}

std::optional<std::string> EditLockManager::HolderOf(const std::string& object_id) {
  try {
    return store_->Get(LockKey(object_id));
  } catch (const StoreException& ex) {
    ReportStoreFailure("lock.lookup", object_id, ex);
    return std::nullopt;
  }
}

void EditLockManager::EmitLockEvent(LifecycleKind kind, const std::string& object_id, const std::string& holder_id,
                                    const std::string& detail) {
  if (observability_) {
    observability_->EmitLifecycle(
        LifecycleEvent{kind, holder_id, object_id, detail, std::chrono::system_clock::now()});
  }
}

void EditLockManager::ReportStoreFailure(const char* op, const std::string& object_id, const StoreException& ex) {
  if (!observability_) {
    return;
  }
  observability_->SetDegraded(true, ex.what());
  LogContext ctx;
  ctx.name = op;
  ctx.level = LogLevel::kWarn;
  ctx.detail = object_id + ": " + ex.what();
  observability_->Log(ctx);
}

}  // namespace collab
