#pragma once
#ifndef SLOTFORGE_SERIALIZER_H
#define SLOTFORGE_SERIALIZER_H

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/config.h"
#include "model/booking.h"
#include "optimizer/recommendations.h"
#include "optimizer/schedule_optimizer.h"
#include "reschedule/advisor.h"

namespace slotforge {

// Insertion-ordered so providers and slots keep their schedule order
using Json = nlohmann::ordered_json;

// A self-contained optimization request, as read by the command-line tool
struct OptimizationInput {
    Date day;
    std::vector<Booking> bookings;
    ProviderCalendars calendars;
    ProbabilityMap probabilities;
    std::optional<Strategy> strategy;
    // Providers whose calendar times could not be parsed
    std::vector<ProviderFailure> calendar_failures;
};

class Serializer {
public:
    static Json serialize_slot(const TimeSlot& slot);
    static Json serialize_schedule(const Schedule& schedule);
    static Json serialize_change(const Change& change);
    static Json serialize_metrics(const ScheduleMetrics& metrics);
    static Json serialize_result(const OptimizationResult& result);
    static Json serialize_suggestions(const std::vector<RescheduleSuggestion>& suggestions);
    static Json serialize_advisories(const std::vector<Advisory>& advisories);

    // Throws RequestError on malformed documents. A calendar with unparsable
    // times is reported in calendar_failures instead.
    static OptimizationInput parse_input(const std::string& text);
    static Booking parse_booking(const Json& node);
    // Throws ConfigurationError on unparsable times
    static ProviderCalendar parse_calendar(const Json& node);
};

}  // namespace slotforge

#endif  // SLOTFORGE_SERIALIZER_H
