#include "model/booking.h"
#include "core/errors.h"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace slotforge {

namespace {

int parse_two_digits(const std::string& text, size_t offset) {
    if (offset + 2 > text.size() ||
        !std::isdigit(static_cast<unsigned char>(text[offset])) ||
        !std::isdigit(static_cast<unsigned char>(text[offset + 1]))) {
        return -1;
    }
    return (text[offset] - '0') * 10 + (text[offset + 1] - '0');
}

}  // namespace

bool TimeSlot::contains(const Booking& booking) const {
    return booking.provider_id == provider_id &&
           booking.scheduled_time >= start &&
           booking.scheduled_time < end;
}

Schedule group_by_provider(const std::vector<TimeSlot>& slots) {
    Schedule schedule;
    for (const auto& slot : slots) {
        auto it = std::find_if(schedule.begin(), schedule.end(),
                               [&](const ProviderSchedule& ps) {
                                   return ps.provider_id == slot.provider_id;
                               });
        if (it == schedule.end()) {
            schedule.push_back({slot.provider_id, {}});
            it = std::prev(schedule.end());
        }
        it->slots.push_back(slot);
    }
    return schedule;
}

double probability_of(const ProbabilityMap& probabilities, const std::string& booking_id) {
    auto it = probabilities.find(booking_id);
    if (it == probabilities.end()) return DEFAULT_NO_SHOW_PROBABILITY;
    return it->second;
}

int hour_of(const Timestamp& ts) {
    return static_cast<int>(ts.time_of_day().hours());
}

int weekday_of(const Date& day) {
    // boost numbers Sunday as 0
    return (static_cast<int>(day.day_of_week().as_number()) + 6) % 7;
}

int weekday_of(const Timestamp& ts) {
    return weekday_of(ts.date());
}

std::string to_iso(const Timestamp& ts) {
    return boost::posix_time::to_iso_extended_string(ts);
}

Timestamp parse_timestamp(const std::string& text) {
    if (text.size() < 16) {
        throw RequestError("invalid timestamp '" + text + "', expected YYYY-MM-DDTHH:MM[:SS]");
    }

    std::string normalized = text;
    if (normalized[10] == 'T') {
        normalized[10] = ' ';
    }
    // "YYYY-MM-DD HH:MM" has no seconds field
    if (normalized.size() == 16) {
        normalized += ":00";
    }

    Timestamp ts;
    try {
        ts = boost::posix_time::time_from_string(normalized);
    } catch (const std::exception& e) {
        throw RequestError("invalid timestamp '" + text + "': " + e.what());
    }
    if (ts.is_special()) {
        throw RequestError("invalid timestamp '" + text + "'");
    }
    return ts;
}

Date parse_date(const std::string& text) {
    Date day;
    try {
        day = boost::gregorian::from_simple_string(text);
    } catch (const std::exception& e) {
        throw RequestError("invalid date '" + text + "': " + e.what());
    }
    if (day.is_special()) {
        throw RequestError("invalid date '" + text + "'");
    }
    return day;
}

TimeOfDay parse_time_of_day(const std::string& text) {
    if (text.size() != 5 || text[2] != ':') {
        throw ConfigurationError("invalid time of day '" + text + "', expected HH:MM");
    }
    int hours = parse_two_digits(text, 0);
    int minutes = parse_two_digits(text, 3);
    if (hours < 0 || minutes < 0 || minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
        throw ConfigurationError("invalid time of day '" + text + "'");
    }
    return boost::posix_time::hours(hours) + boost::posix_time::minutes(minutes);
}

Calendar make_calendar(const std::string& start, const std::string& end, int slot_duration_minutes) {
    return Calendar{parse_time_of_day(start), parse_time_of_day(end), slot_duration_minutes};
}

}  // namespace slotforge
