#pragma once
#ifndef SLOTFORGE_RESULT_STORE_H
#define SLOTFORGE_RESULT_STORE_H

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "model/booking.h"
#include "optimizer/schedule_optimizer.h"

namespace slotforge {

struct StoredOptimization {
    std::string id;
    std::string practice_id;
    std::optional<std::string> provider_id;
    Date optimization_date;
    std::string optimization_type = "daily";
    OptimizationResult result;
    std::string model_version;
    double model_confidence = 0.0;

    bool applied = false;
    std::optional<Timestamp> applied_at;
    std::string applied_by;
};

enum class ApplyStatus { Applied, NotFound, AlreadyApplied };

// Where optimization results are kept until someone applies them
class ResultStore {
public:
    virtual ~ResultStore() = default;

    // Assigns and returns the record id; any id on the input is ignored
    virtual std::string save(StoredOptimization record) = 0;
    virtual std::optional<StoredOptimization> find(const std::string& id) const = 0;
    virtual ApplyStatus mark_applied(const std::string& id,
                                     const std::string& applied_by,
                                     const Timestamp& applied_at) = 0;
};

class InMemoryResultStore : public ResultStore {
public:
    std::string save(StoredOptimization record) override;
    std::optional<StoredOptimization> find(const std::string& id) const override;
    ApplyStatus mark_applied(const std::string& id,
                             const std::string& applied_by,
                             const Timestamp& applied_at) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, StoredOptimization> records_;
    size_t next_id_ = 1;
};

}  // namespace slotforge

#endif  // SLOTFORGE_RESULT_STORE_H
