#include "persistence/schedule_source.h"
#include <algorithm>
#include <utility>

namespace slotforge {

void InMemoryScheduleSource::add_booking(Booking booking) {
    std::lock_guard lock(mutex_);
    bookings_.push_back(std::move(booking));
}

void InMemoryScheduleSource::set_calendar(const std::string& provider_id, Calendar calendar) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(calendars_.begin(), calendars_.end(),
                           [&](const ProviderCalendar& pc) { return pc.provider_id == provider_id; });
    if (it != calendars_.end()) {
        it->calendar = calendar;
        return;
    }
    calendars_.push_back({provider_id, calendar});
}

std::vector<Booking> InMemoryScheduleSource::bookings_for(const Date& day,
                                                          const std::optional<std::string>& provider_id) const {
    std::lock_guard lock(mutex_);
    std::vector<Booking> out;
    for (const auto& booking : bookings_) {
        if (booking.scheduled_time.date() != day) continue;
        if (provider_id && booking.provider_id != *provider_id) continue;
        out.push_back(booking);
    }
    return out;
}

ProviderCalendars InMemoryScheduleSource::calendars_for(const std::optional<std::string>& provider_id) const {
    std::lock_guard lock(mutex_);
    if (!provider_id) return calendars_;

    ProviderCalendars out;
    for (const auto& entry : calendars_) {
        if (entry.provider_id == *provider_id) out.push_back(entry);
    }
    return out;
}

}  // namespace slotforge
