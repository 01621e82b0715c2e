#pragma once
#ifndef SLOTFORGE_SLOT_BUILDER_H
#define SLOTFORGE_SLOT_BUILDER_H

#include <string>
#include <vector>
#include "model/booking.h"

namespace slotforge {

struct ProviderFailure {
    std::string provider_id;
    std::string reason;
};

struct BuildResult {
    std::vector<TimeSlot> slots;
    // Providers whose calendar was rejected; their slots are absent from `slots`
    std::vector<ProviderFailure> failures;
};

// Partitions providers' working hours for one day into fixed-duration slots
// and assigns each booking to the slot whose [start, end) contains it.
class SlotBuilder {
public:
    explicit SlotBuilder(int buffer_minutes = 0);

    // A malformed calendar only drops that provider; the others are still built.
    BuildResult build(const std::vector<Booking>& bookings,
                      const ProviderCalendars& calendars,
                      const Date& day) const;

    // Throws ConfigurationError when start >= end or the slot duration is not positive
    std::vector<TimeSlot> build_provider(const std::string& provider_id,
                                         const Calendar& calendar,
                                         const std::vector<Booking>& bookings,
                                         const Date& day) const;

    static void validate(const Calendar& calendar);

private:
    int buffer_minutes_;
};

}  // namespace slotforge

#endif  // SLOTFORGE_SLOT_BUILDER_H
