#pragma once
#ifndef SLOTFORGE_OPTIMIZATION_SERVICE_H
#define SLOTFORGE_OPTIMIZATION_SERVICE_H

#include <atomic>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "config/config.h"
#include "optimizer/recommendations.h"
#include "optimizer/schedule_optimizer.h"
#include "persistence/result_store.h"
#include "persistence/schedule_source.h"
#include "risk/risk_model.h"

namespace slotforge {

struct OptimizationRequest {
    std::string practice_id;
    Date day;
    std::optional<std::string> provider_id;
    // Falls back to the configured strategy
    std::optional<Strategy> strategy;
};

struct OptimizationRecord {
    std::string id;
    OptimizationResult result;
};

// Runs optimization requests against a schedule source and risk model and
// stores the results. Each request runs independently on the worker pool;
// the only shared write is the result store.
class OptimizationService {
public:
    OptimizationService(const ScheduleSource& source,
                        const RiskModel& risk_model,
                        ResultStore& store,
                        Config config);
    ~OptimizationService();

    OptimizationService(const OptimizationService&) = delete;
    OptimizationService& operator=(const OptimizationService&) = delete;

    // Throws EmptyInputError when there are no bookings for the request
    OptimizationRecord run(const OptimizationRequest& request);

    // Exceptions from run() surface through the future
    std::future<OptimizationRecord> submit(OptimizationRequest request);

    ApplyStatus apply(const std::string& optimization_id, const std::string& applied_by);

    std::vector<Advisory> advisories(const Date& day) const;

    // Waits for queued requests to finish; later submits are rejected
    void stop();

    size_t completed() const { return completed_.load(); }

private:
    ProviderCalendars calendars_for(const OptimizationRequest& request,
                                    const std::vector<Booking>& bookings) const;

    const ScheduleSource& source_;
    const RiskModel& risk_model_;
    ResultStore& store_;
    Config config_;
    boost::asio::thread_pool pool_;
    std::atomic<bool> accepting_{true};
    std::atomic<size_t> completed_{0};
};

}  // namespace slotforge

#endif  // SLOTFORGE_OPTIMIZATION_SERVICE_H
