#include "persistence/result_store.h"
#include <spdlog/spdlog.h>

namespace slotforge {

std::string InMemoryResultStore::save(StoredOptimization record) {
    std::lock_guard lock(mutex_);
    record.id = "opt-" + std::to_string(next_id_++);
    std::string id = record.id;
    records_.emplace(id, std::move(record));
    return id;
}

std::optional<StoredOptimization> InMemoryResultStore::find(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

ApplyStatus InMemoryResultStore::mark_applied(const std::string& id,
                                              const std::string& applied_by,
                                              const Timestamp& applied_at) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return ApplyStatus::NotFound;
    if (it->second.applied) return ApplyStatus::AlreadyApplied;

    it->second.applied = true;
    it->second.applied_at = applied_at;
    it->second.applied_by = applied_by;
    spdlog::info("Optimization {} applied by {} ({} changes)",
                 id, applied_by, it->second.result.changes.size());
    return ApplyStatus::Applied;
}

size_t InMemoryResultStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

}  // namespace slotforge
