#pragma once
#ifndef SLOTFORGE_BOOKING_H
#define SLOTFORGE_BOOKING_H

#include <string>
#include <vector>
#include <unordered_map>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace slotforge {

// Naive practice-local time
using Timestamp = boost::posix_time::ptime;
using TimeOfDay = boost::posix_time::time_duration;
using Date = boost::gregorian::date;

// Booking id -> predicted no-show probability in [0, 1]
using ProbabilityMap = std::unordered_map<std::string, double>;

// Applied wherever a booking has no entry in the ProbabilityMap
constexpr double DEFAULT_NO_SHOW_PROBABILITY = 0.1;

struct Booking {
    std::string id;
    std::string provider_id;
    std::string patient_id;
    Timestamp scheduled_time;
    int duration_minutes = 30;
    std::string appointment_type = "consultation";
};

struct Calendar {
    TimeOfDay start;
    TimeOfDay end;
    int slot_duration_minutes = 30;
};

// Ordered provider -> calendar list; order drives slot order downstream
struct ProviderCalendar {
    std::string provider_id;
    Calendar calendar;
};
using ProviderCalendars = std::vector<ProviderCalendar>;

// [start, end) interval of one provider's day
struct TimeSlot {
    Timestamp start;
    Timestamp end;
    std::string provider_id;
    std::vector<Booking> bookings;
    int capacity = 1;
    int buffer_minutes = 0;

    bool contains(const Booking& booking) const;
    int booked() const { return static_cast<int>(bookings.size()); }
};

// Slots of one provider, in chronological order
struct ProviderSchedule {
    std::string provider_id;
    std::vector<TimeSlot> slots;
};
using Schedule = std::vector<ProviderSchedule>;

// Groups slots by provider, keeping first-appearance order of providers
Schedule group_by_provider(const std::vector<TimeSlot>& slots);

double probability_of(const ProbabilityMap& probabilities, const std::string& booking_id);

int hour_of(const Timestamp& ts);
// Monday = 0 ... Sunday = 6
int weekday_of(const Timestamp& ts);
int weekday_of(const Date& day);

std::string to_iso(const Timestamp& ts);
// Accepts "YYYY-MM-DDTHH:MM[:SS]" or "YYYY-MM-DD HH:MM[:SS]"; throws RequestError
Timestamp parse_timestamp(const std::string& text);
// Accepts "YYYY-MM-DD"; throws RequestError
Date parse_date(const std::string& text);
// Accepts "HH:MM" in 00:00..24:00; throws ConfigurationError
TimeOfDay parse_time_of_day(const std::string& text);

// Throws ConfigurationError
Calendar make_calendar(const std::string& start, const std::string& end, int slot_duration_minutes);

}  // namespace slotforge

#endif  // SLOTFORGE_BOOKING_H
