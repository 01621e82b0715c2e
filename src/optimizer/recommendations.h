#pragma once
#ifndef SLOTFORGE_RECOMMENDATIONS_H
#define SLOTFORGE_RECOMMENDATIONS_H

#include <string>
#include <vector>
#include "model/booking.h"

namespace slotforge {

constexpr double HIGH_RISK_PROBABILITY = 0.4;
constexpr int MORNING_CUTOFF_HOUR = 12;
constexpr double OPTIMIZATION_OPPORTUNITY_PROBABILITY = 0.15;

inline const std::string MORNING_REMINDER_TIP = "Send morning appointment reminders by 6 PM the day before";

// Advisory strings for an optimized day, in fixed order:
// high-risk reminders, empty slots, morning reminder timing.
std::vector<std::string> generate_recommendations(const std::vector<TimeSlot>& optimized,
                                                  const ProbabilityMap& probabilities);

struct Advisory {
    std::string type;
    std::string priority;
    std::string message;
    std::string action;
};

// Practice-level alerts for a day's bookings (high risk, average risk, low volume)
std::vector<Advisory> daily_advisories(const std::vector<Booking>& bookings,
                                       const ProbabilityMap& probabilities,
                                       size_t typical_capacity);

}  // namespace slotforge

#endif  // SLOTFORGE_RECOMMENDATIONS_H
