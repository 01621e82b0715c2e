#include "reschedule/advisor.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace slotforge {

namespace {

bool contains(const std::vector<int>& values, int value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

constexpr int SATURDAY = 5;
constexpr double SCAN_BASE_CONFIDENCE = 0.9;
constexpr double SCAN_DAILY_DECAY = 0.02;

}  // namespace

RescheduleAdvisor::RescheduleAdvisor(RescheduleConfig config)
    : config_(std::move(config)) {}

double RescheduleAdvisor::preference_score(const TimeSlot& slot, const ReschedulePreferences& preferences) {
    double score = 0.0;
    if (contains(preferences.preferred_hours, hour_of(slot.start))) {
        score += PREFERRED_HOUR_SCORE;
    }
    if (contains(preferences.preferred_days, weekday_of(slot.start))) {
        score += PREFERRED_DAY_SCORE;
    }
    double occupancy = static_cast<double>(slot.booked()) / slot.capacity;
    score += (1.0 - occupancy) * AVAILABILITY_WEIGHT;
    return score;
}

std::vector<RescheduleSuggestion> RescheduleAdvisor::suggest(const Booking& cancelled,
                                                             const std::vector<TimeSlot>& available,
                                                             const ReschedulePreferences& preferences) const {
    struct Candidate {
        const TimeSlot* slot;
        double score;
    };

    std::vector<Candidate> candidates;
    for (const auto& slot : available) {
        if (slot.booked() < slot.capacity) {
            candidates.push_back({&slot, preference_score(slot, preferences)});
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    spdlog::debug("Reschedule for booking {}: {} candidate slots", cancelled.id, candidates.size());

    std::vector<RescheduleSuggestion> suggestions;
    for (const auto& candidate : candidates) {
        if (suggestions.size() >= config_.top_n) break;
        double confidence = std::clamp(candidate.score / CONFIDENCE_SCALE, 0.0, 1.0);
        suggestions.push_back({candidate.slot->start, candidate.slot->provider_id, confidence});
    }
    return suggestions;
}

std::vector<RescheduleSuggestion> RescheduleAdvisor::scan_days(const Booking& cancelled,
                                                               const std::vector<Booking>& existing,
                                                               const Date& from,
                                                               int days_ahead) const {
    if (days_ahead < 1 || days_ahead > config_.max_days_ahead) {
        throw std::invalid_argument("days_ahead must be within 1.." +
                                    std::to_string(config_.max_days_ahead));
    }

    std::vector<RescheduleSuggestion> suggestions;
    for (int offset = 1; offset <= days_ahead; ++offset) {
        Date day = from + boost::gregorian::days(offset);
        if (weekday_of(day) >= SATURDAY) continue;

        for (int hour : config_.scan_hours) {
            Timestamp candidate(day, boost::posix_time::hours(hour));
            bool taken = std::any_of(existing.begin(), existing.end(), [&](const Booking& b) {
                return b.provider_id == cancelled.provider_id && b.scheduled_time == candidate;
            });
            if (!taken) {
                suggestions.push_back({candidate, cancelled.provider_id,
                                       SCAN_BASE_CONFIDENCE - offset * SCAN_DAILY_DECAY});
            }
        }

        if (suggestions.size() >= config_.scan_budget) break;
    }

    if (suggestions.size() > config_.scan_budget) {
        suggestions.resize(config_.scan_budget);
    }
    return suggestions;
}

}  // namespace slotforge
