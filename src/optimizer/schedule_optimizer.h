#pragma once
#ifndef SLOTFORGE_SCHEDULE_OPTIMIZER_H
#define SLOTFORGE_SCHEDULE_OPTIMIZER_H

#include <string>
#include <vector>
#include "config/config.h"
#include "model/booking.h"
#include "optimizer/impact.h"
#include "schedule/slot_builder.h"

namespace slotforge {

struct OptimizationResult {
    Schedule original_schedule;
    Schedule optimized_schedule;
    std::vector<Change> changes;
    double predicted_revenue_gain = 0.0;
    double optimization_score = 0.0;
    std::vector<std::string> recommendations;
    ScheduleMetrics metrics;
    std::vector<ProviderFailure> failures;
};

// One day's optimization: build slots, raise capacity where no-shows are
// likely, then derive changes, impact and recommendations. Stateless apart
// from its configuration, so one instance can serve concurrent callers.
class ScheduleOptimizer {
public:
    ScheduleOptimizer(OptimizerConfig optimizer, ImpactConfig impact);

    OptimizationResult optimize_day(const std::vector<Booking>& bookings,
                                    const ProbabilityMap& probabilities,
                                    const ProviderCalendars& calendars,
                                    const Date& day) const;

    const OptimizerConfig& optimizer_config() const { return optimizer_; }
    const ImpactConfig& impact_config() const { return impact_; }

private:
    OptimizerConfig optimizer_;
    ImpactConfig impact_;
};

}  // namespace slotforge

#endif  // SLOTFORGE_SCHEDULE_OPTIMIZER_H
