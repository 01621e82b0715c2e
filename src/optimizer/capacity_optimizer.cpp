#include "optimizer/capacity_optimizer.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace slotforge {

double overbook_factor(Strategy strategy) {
    switch (strategy) {
        case Strategy::Aggressive: return 1.2;
        case Strategy::Conservative: return 0.8;
        case Strategy::Balanced: break;
    }
    return 1.0;
}

double expected_no_shows(const TimeSlot& slot, const ProbabilityMap& probabilities) {
    double total = 0.0;
    for (const auto& booking : slot.bookings) {
        total += probability_of(probabilities, booking.id);
    }
    return total;
}

CapacityOptimizer::CapacityOptimizer(OptimizerConfig config)
    : config_(std::move(config)) {}

int CapacityOptimizer::overbook_count(const TimeSlot& slot, double expected) const {
    double base = std::floor(expected * overbook_factor(config_.strategy));
    double max_overbook = std::floor(slot.booked() * config_.max_overbook_pct);

    int hour = hour_of(slot.start);
    if (hour < EDGE_MORNING_HOUR || hour > EDGE_EVENING_HOUR) {
        base = std::floor(base * EDGE_HOUR_DAMPING);
    }

    // Bounded in double before the int conversion
    double count = std::min(base, max_overbook);
    if (!(count > 0.0)) return 0;
    double ceiling = static_cast<double>(std::numeric_limits<int>::max()) - slot.capacity;
    return static_cast<int>(std::min(count, ceiling));
}

TimeSlot CapacityOptimizer::optimize_slot(const TimeSlot& slot, const ProbabilityMap& probabilities) const {
    double expected = expected_no_shows(slot, probabilities);
    if (expected < config_.min_no_show_threshold) {
        return slot;
    }

    TimeSlot optimized = slot;
    optimized.capacity = slot.capacity + overbook_count(slot, expected);
    return optimized;
}

std::vector<TimeSlot> CapacityOptimizer::optimize(const std::vector<TimeSlot>& slots,
                                                  const ProbabilityMap& probabilities) const {
    std::vector<TimeSlot> optimized;
    optimized.reserve(slots.size());
    for (const auto& slot : slots) {
        optimized.push_back(optimize_slot(slot, probabilities));
    }
    return optimized;
}

}  // namespace slotforge
