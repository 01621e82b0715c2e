#include "optimizer/recommendations.h"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace slotforge {

std::vector<std::string> generate_recommendations(const std::vector<TimeSlot>& optimized,
                                                  const ProbabilityMap& probabilities) {
    std::vector<std::string> recommendations;

    auto high_risk = std::count_if(probabilities.begin(), probabilities.end(),
                                   [](const auto& entry) { return entry.second > HIGH_RISK_PROBABILITY; });
    if (high_risk > 0) {
        recommendations.push_back(
            fmt::format("Send additional reminders to {} high-risk patients", high_risk));
    }

    auto empty = std::count_if(optimized.begin(), optimized.end(),
                               [](const TimeSlot& slot) { return slot.bookings.empty(); });
    if (empty > 0) {
        recommendations.push_back(
            fmt::format("Consider opening {} empty slots for same-day bookings", empty));
    }

    bool has_morning = std::any_of(optimized.begin(), optimized.end(),
                                   [](const TimeSlot& slot) { return hour_of(slot.start) < MORNING_CUTOFF_HOUR; });
    if (has_morning) {
        recommendations.push_back(MORNING_REMINDER_TIP);
    }

    return recommendations;
}

std::vector<Advisory> daily_advisories(const std::vector<Booking>& bookings,
                                       const ProbabilityMap& probabilities,
                                       size_t typical_capacity) {
    std::vector<Advisory> advisories;

    auto high_risk = std::count_if(bookings.begin(), bookings.end(), [&](const Booking& b) {
        return probability_of(probabilities, b.id) > HIGH_RISK_PROBABILITY;
    });
    if (high_risk > 0) {
        advisories.push_back({"high_risk_alert", "high",
                              fmt::format("{} appointments have high no-show risk", high_risk),
                              "Send additional reminders or consider overbooking"});
    }

    if (!bookings.empty()) {
        double total = 0.0;
        for (const auto& booking : bookings) {
            total += probability_of(probabilities, booking.id);
        }
        double average = total / static_cast<double>(bookings.size());
        if (average > OPTIMIZATION_OPPORTUNITY_PROBABILITY) {
            advisories.push_back({"optimization_opportunity", "medium",
                                  fmt::format("Average no-show probability is {:.1f}%", average * 100.0),
                                  "Consider running schedule optimization"});
        }
    }

    if (bookings.size() < typical_capacity) {
        advisories.push_back({"capacity_alert", "low",
                              fmt::format("Only {} appointments scheduled", bookings.size()),
                              "Open slots for same-day bookings or promote availability"});
    }

    return advisories;
}

}  // namespace slotforge
