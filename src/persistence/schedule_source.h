#pragma once
#ifndef SLOTFORGE_SCHEDULE_SOURCE_H
#define SLOTFORGE_SCHEDULE_SOURCE_H

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "model/booking.h"

namespace slotforge {

// Supplies a practice's bookings and provider working hours
class ScheduleSource {
public:
    virtual ~ScheduleSource() = default;

    // Bookings scheduled on `day`, optionally limited to one provider
    virtual std::vector<Booking> bookings_for(const Date& day,
                                              const std::optional<std::string>& provider_id) const = 0;

    // Calendars in provider registration order, optionally limited to one provider
    virtual ProviderCalendars calendars_for(const std::optional<std::string>& provider_id) const = 0;
};

class InMemoryScheduleSource : public ScheduleSource {
public:
    void add_booking(Booking booking);
    // Replaces the calendar of an already registered provider in place
    void set_calendar(const std::string& provider_id, Calendar calendar);

    std::vector<Booking> bookings_for(const Date& day,
                                      const std::optional<std::string>& provider_id) const override;
    ProviderCalendars calendars_for(const std::optional<std::string>& provider_id) const override;

private:
    mutable std::mutex mutex_;
    std::vector<Booking> bookings_;
    ProviderCalendars calendars_;
};

}  // namespace slotforge

#endif  // SLOTFORGE_SCHEDULE_SOURCE_H
