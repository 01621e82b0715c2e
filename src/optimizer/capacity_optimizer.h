#pragma once
#ifndef SLOTFORGE_CAPACITY_OPTIMIZER_H
#define SLOTFORGE_CAPACITY_OPTIMIZER_H

#include <vector>
#include "config/config.h"
#include "model/booking.h"

namespace slotforge {

// Slots starting before 10:00 or after 16:xx get their overbooking damped
constexpr int EDGE_MORNING_HOUR = 10;
constexpr int EDGE_EVENING_HOUR = 16;
constexpr double EDGE_HOUR_DAMPING = 0.7;

double overbook_factor(Strategy strategy);

// Sum of per-booking no-show probabilities; missing entries count as 0.1
double expected_no_shows(const TimeSlot& slot, const ProbabilityMap& probabilities);

// Greedy per-slot overbooking. Each slot is decided on its own booking count
// and probabilities; there is no budget shared across slots.
class CapacityOptimizer {
public:
    explicit CapacityOptimizer(OptimizerConfig config);

    // Same order and length as `slots`; only capacity can differ
    std::vector<TimeSlot> optimize(const std::vector<TimeSlot>& slots,
                                   const ProbabilityMap& probabilities) const;

    TimeSlot optimize_slot(const TimeSlot& slot, const ProbabilityMap& probabilities) const;

    // Extra capacity beyond 1 for a slot with the given expected no-shows, >= 0
    int overbook_count(const TimeSlot& slot, double expected) const;

    const OptimizerConfig& config() const { return config_; }

private:
    OptimizerConfig config_;
};

}  // namespace slotforge

#endif  // SLOTFORGE_CAPACITY_OPTIMIZER_H
