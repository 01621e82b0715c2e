#include "schedule/slot_builder.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <iterator>

namespace slotforge {

SlotBuilder::SlotBuilder(int buffer_minutes)
    : buffer_minutes_(buffer_minutes) {}

void SlotBuilder::validate(const Calendar& calendar) {
    if (calendar.slot_duration_minutes <= 0) {
        throw ConfigurationError("slot duration must be positive, got " +
                                 std::to_string(calendar.slot_duration_minutes));
    }
    if (calendar.start.is_negative() || calendar.start >= calendar.end) {
        throw ConfigurationError("calendar start " + boost::posix_time::to_simple_string(calendar.start) +
                                 " is not before end " + boost::posix_time::to_simple_string(calendar.end));
    }
    if (calendar.end > boost::posix_time::hours(24)) {
        throw ConfigurationError("calendar end " + boost::posix_time::to_simple_string(calendar.end) +
                                 " is past midnight");
    }
}

std::vector<TimeSlot> SlotBuilder::build_provider(const std::string& provider_id,
                                                  const Calendar& calendar,
                                                  const std::vector<Booking>& bookings,
                                                  const Date& day) const {
    validate(calendar);

    const Timestamp day_end = Timestamp(day, calendar.end);
    const auto step = boost::posix_time::minutes(calendar.slot_duration_minutes);

    std::vector<TimeSlot> slots;
    // Every slot is a full step long; the last one may run past the calendar end
    for (Timestamp current(day, calendar.start); current < day_end; current += step) {
        TimeSlot slot;
        slot.start = current;
        slot.end = current + step;
        slot.provider_id = provider_id;
        slot.capacity = 1;
        slot.buffer_minutes = buffer_minutes_;

        for (const auto& booking : bookings) {
            if (slot.contains(booking)) {
                slot.bookings.push_back(booking);
            }
        }
        slots.push_back(std::move(slot));
    }
    return slots;
}

BuildResult SlotBuilder::build(const std::vector<Booking>& bookings,
                               const ProviderCalendars& calendars,
                               const Date& day) const {
    BuildResult result;
    for (const auto& entry : calendars) {
        try {
            auto provider_slots = build_provider(entry.provider_id, entry.calendar, bookings, day);
            spdlog::debug("Built {} slots for provider {}", provider_slots.size(), entry.provider_id);
            result.slots.insert(result.slots.end(),
                                std::make_move_iterator(provider_slots.begin()),
                                std::make_move_iterator(provider_slots.end()));
        } catch (const ConfigurationError& e) {
            spdlog::warn("Skipping provider {}: {}", entry.provider_id, e.what());
            result.failures.push_back({entry.provider_id, e.what()});
        }
    }
    return result;
}

}  // namespace slotforge
