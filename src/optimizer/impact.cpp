#include "optimizer/impact.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace slotforge {

std::string change_type(const Change& change) {
    return std::holds_alternative<OverbookAdded>(change) ? "overbook_added" : "buffer_adjusted";
}

std::vector<Change> diff_schedules(const std::vector<TimeSlot>& original,
                                   const std::vector<TimeSlot>& optimized) {
    if (original.size() != optimized.size()) {
        throw std::invalid_argument("cannot diff schedules of different length: " +
                                    std::to_string(original.size()) + " vs " +
                                    std::to_string(optimized.size()));
    }

    std::vector<Change> changes;
    for (size_t i = 0; i < original.size(); ++i) {
        const auto& before = original[i];
        const auto& after = optimized[i];

        if (after.capacity > before.capacity) {
            changes.emplace_back(OverbookAdded{before.start, before.provider_id,
                                               after.capacity - before.capacity, OVERBOOK_REASON});
        }
        if (after.buffer_minutes != before.buffer_minutes) {
            changes.emplace_back(BufferAdjusted{before.start, before.provider_id,
                                                after.buffer_minutes, before.buffer_minutes});
        }
    }
    return changes;
}

int total_capacity(const std::vector<TimeSlot>& slots) {
    int total = 0;
    for (const auto& slot : slots) total += slot.capacity;
    return total;
}

double revenue_gain(const std::vector<TimeSlot>& original,
                    const std::vector<TimeSlot>& optimized,
                    const ImpactConfig& config) {
    int additional = total_capacity(optimized) - total_capacity(original);
    return std::max(0.0, additional * config.avg_booking_value * config.fill_rate);
}

double slot_score(const TimeSlot& slot) {
    double booked = static_cast<double>(slot.booked());
    double utilization = std::min(booked / std::max(slot.capacity, 1), 1.0);
    double overbook_ratio = (slot.capacity - 1) / std::max(booked, 1.0);
    double balance = 1.0 - std::clamp(overbook_ratio, 0.0, 1.0);
    return utilization * 0.6 + balance * 0.4;
}

double optimization_score(const std::vector<TimeSlot>& optimized) {
    if (optimized.empty()) return 0.0;

    double total = 0.0;
    for (const auto& slot : optimized) {
        total += slot_score(slot);
    }
    return std::clamp(total / static_cast<double>(optimized.size()), 0.0, 1.0);
}

double utilization_rate(const std::vector<TimeSlot>& slots) {
    int capacity = 0;
    int filled = 0;
    for (const auto& slot : slots) {
        capacity += slot.capacity;
        filled += std::min(slot.booked(), slot.capacity);
    }
    if (capacity <= 0) return 0.0;
    return static_cast<double>(filled) / capacity;
}

ScheduleMetrics summarize(const std::vector<TimeSlot>& original,
                          const std::vector<TimeSlot>& optimized,
                          const ProbabilityMap& probabilities,
                          const ImpactConfig& config) {
    ScheduleMetrics metrics;

    double expected = 0.0;
    int bookings = 0;
    for (const auto& slot : original) {
        for (const auto& booking : slot.bookings) {
            expected += probability_of(probabilities, booking.id);
        }
        bookings += slot.booked();
    }
    metrics.predicted_no_shows = static_cast<int>(std::floor(expected + 0.5));

    for (size_t i = 0; i < original.size() && i < optimized.size(); ++i) {
        int added = optimized[i].capacity - original[i].capacity;
        if (added != 0) metrics.slots_optimized++;
        if (added > 0) metrics.recommended_overbooks += added;
    }

    metrics.utilization_before = utilization_rate(original);
    metrics.utilization_after = utilization_rate(optimized);
    metrics.original_revenue = bookings * config.avg_booking_value;
    metrics.optimized_revenue = metrics.original_revenue + revenue_gain(original, optimized, config);
    return metrics;
}

}  // namespace slotforge
