#pragma once
#ifndef SLOTFORGE_IMPACT_H
#define SLOTFORGE_IMPACT_H

#include <string>
#include <variant>
#include <vector>
#include "config/config.h"
#include "model/booking.h"

namespace slotforge {

inline const std::string OVERBOOK_REASON = "High no-show probability detected";

struct OverbookAdded {
    Timestamp time_slot;
    std::string provider_id;
    int additional_capacity = 0;
    std::string reason;

    bool operator==(const OverbookAdded& other) const = default;
};

struct BufferAdjusted {
    Timestamp time_slot;
    std::string provider_id;
    int new_buffer = 0;
    int old_buffer = 0;

    bool operator==(const BufferAdjusted& other) const = default;
};

using Change = std::variant<OverbookAdded, BufferAdjusted>;

std::string change_type(const Change& change);

// Pairwise diff by position. For one slot an overbook change precedes its
// buffer change. Throws std::invalid_argument on length mismatch.
std::vector<Change> diff_schedules(const std::vector<TimeSlot>& original,
                                   const std::vector<TimeSlot>& optimized);

int total_capacity(const std::vector<TimeSlot>& slots);

// additional capacity * avg booking value * fill rate, never negative
double revenue_gain(const std::vector<TimeSlot>& original,
                    const std::vector<TimeSlot>& optimized,
                    const ImpactConfig& config);

// Mean over slots of 0.6 * utilization + 0.4 * balance, 0.0 for no slots
double slot_score(const TimeSlot& slot);
double optimization_score(const std::vector<TimeSlot>& optimized);

struct ScheduleMetrics {
    int predicted_no_shows = 0;
    int recommended_overbooks = 0;
    int slots_optimized = 0;
    double utilization_before = 0.0;
    double utilization_after = 0.0;
    double original_revenue = 0.0;
    double optimized_revenue = 0.0;
};

// Share of capacity actually filled by bookings
double utilization_rate(const std::vector<TimeSlot>& slots);

ScheduleMetrics summarize(const std::vector<TimeSlot>& original,
                          const std::vector<TimeSlot>& optimized,
                          const ProbabilityMap& probabilities,
                          const ImpactConfig& config);

}  // namespace slotforge

#endif  // SLOTFORGE_IMPACT_H
