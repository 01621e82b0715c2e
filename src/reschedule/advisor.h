#pragma once
#ifndef SLOTFORGE_ADVISOR_H
#define SLOTFORGE_ADVISOR_H

#include <string>
#include <vector>
#include "config/config.h"
#include "model/booking.h"

namespace slotforge {

constexpr double PREFERRED_HOUR_SCORE = 2.0;
constexpr double PREFERRED_DAY_SCORE = 1.0;
constexpr double AVAILABILITY_WEIGHT = 1.5;
constexpr double CONFIDENCE_SCALE = 5.0;

struct ReschedulePreferences {
    std::vector<int> preferred_hours{9, 10, 11, 14, 15};
    // Monday = 0
    std::vector<int> preferred_days{1, 2, 3, 4, 5};
};

struct RescheduleSuggestion {
    Timestamp time;
    std::string provider_id;
    double confidence = 0.0;
};

class RescheduleAdvisor {
public:
    explicit RescheduleAdvisor(RescheduleConfig config = {});

    // Ranks slots with spare capacity by preference match and emptiness.
    // Returns at most top_n, best first; equal scores keep slot order.
    std::vector<RescheduleSuggestion> suggest(const Booking& cancelled,
                                              const std::vector<TimeSlot>& available,
                                              const ReschedulePreferences& preferences) const;

    // Walks weekdays after `from`, proposing scan hours not already taken by
    // the cancelled booking's provider. Sooner days get higher confidence.
    // Throws std::invalid_argument unless 1 <= days_ahead <= max_days_ahead.
    std::vector<RescheduleSuggestion> scan_days(const Booking& cancelled,
                                                const std::vector<Booking>& existing,
                                                const Date& from,
                                                int days_ahead) const;

    static double preference_score(const TimeSlot& slot, const ReschedulePreferences& preferences);

private:
    RescheduleConfig config_;
};

}  // namespace slotforge

#endif  // SLOTFORGE_ADVISOR_H
