#include <gtest/gtest.h>
#include "reschedule/advisor.h"
#include <stdexcept>

using namespace slotforge;

namespace {

// 2024-03-04 is a Monday
TimeSlot open_slot(const std::string& when, int booked, int capacity, const std::string& provider = "dr-a") {
    TimeSlot slot;
    slot.start = parse_timestamp(when);
    slot.end = slot.start + boost::posix_time::minutes(30);
    slot.provider_id = provider;
    slot.capacity = capacity;
    for (int i = 0; i < booked; ++i) {
        slot.bookings.push_back(Booking{when + "#" + std::to_string(i), provider, "p", slot.start});
    }
    return slot;
}

const Booking CANCELLED{"cancelled-1", "dr-a", "patient-9", parse_timestamp("2024-03-04T09:00:00")};

}  // namespace

TEST(RescheduleTest, test_preferred_empty_slot_ranks_first) {
    ReschedulePreferences prefs{{10}, {1}};
    std::vector<TimeSlot> slots{
        open_slot("2024-03-10T13:00:00", 1, 2),  // Sunday, half full
        open_slot("2024-03-05T10:00:00", 0, 1),  // Tuesday 10:00, empty
    };

    RescheduleAdvisor advisor;
    auto suggestions = advisor.suggest(CANCELLED, slots, prefs);
    ASSERT_EQ(suggestions.size(), 2u);
    EXPECT_EQ(to_iso(suggestions[0].time), "2024-03-05T10:00:00");
    EXPECT_GT(suggestions[0].confidence, suggestions[1].confidence);
    EXPECT_NEAR(suggestions[0].confidence, 4.5 / 5.0, 1e-9);
    EXPECT_NEAR(suggestions[1].confidence, 0.75 / 5.0, 1e-9);
}

TEST(RescheduleTest, test_full_slots_are_skipped) {
    std::vector<TimeSlot> slots{
        open_slot("2024-03-05T10:00:00", 1, 1),
        open_slot("2024-03-05T11:00:00", 3, 2),
        open_slot("2024-03-05T14:00:00", 1, 2),
    };

    RescheduleAdvisor advisor;
    auto suggestions = advisor.suggest(CANCELLED, slots, ReschedulePreferences{});
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(to_iso(suggestions[0].time), "2024-03-05T14:00:00");
}

TEST(RescheduleTest, test_returns_at_most_top_three) {
    std::vector<TimeSlot> slots;
    for (int hour = 9; hour <= 16; ++hour) {
        slots.push_back(open_slot("2024-03-05T" + std::string(hour < 10 ? "0" : "") +
                                  std::to_string(hour) + ":00:00", 0, 1));
    }

    RescheduleAdvisor advisor;
    auto suggestions = advisor.suggest(CANCELLED, slots, ReschedulePreferences{});
    EXPECT_EQ(suggestions.size(), 3u);
}

TEST(RescheduleTest, test_top_n_is_configurable) {
    RescheduleConfig cfg;
    cfg.top_n = 1;
    std::vector<TimeSlot> slots{open_slot("2024-03-05T10:00:00", 0, 1), open_slot("2024-03-05T11:00:00", 0, 1)};

    auto suggestions = RescheduleAdvisor(cfg).suggest(CANCELLED, slots, ReschedulePreferences{});
    EXPECT_EQ(suggestions.size(), 1u);
}

TEST(RescheduleTest, test_equal_scores_keep_slot_order) {
    std::vector<TimeSlot> slots{
        open_slot("2024-03-05T15:00:00", 0, 1, "dr-c"),
        open_slot("2024-03-05T09:00:00", 0, 1, "dr-a"),
        open_slot("2024-03-05T14:00:00", 0, 1, "dr-b"),
    };

    RescheduleAdvisor advisor;
    auto suggestions = advisor.suggest(CANCELLED, slots, ReschedulePreferences{});
    ASSERT_EQ(suggestions.size(), 3u);
    EXPECT_EQ(suggestions[0].provider_id, "dr-c");
    EXPECT_EQ(suggestions[1].provider_id, "dr-a");
    EXPECT_EQ(suggestions[2].provider_id, "dr-b");
}

TEST(RescheduleTest, test_occupancy_rewards_emptier_slots) {
    ReschedulePreferences none{{}, {}};
    EXPECT_NEAR(RescheduleAdvisor::preference_score(open_slot("2024-03-05T10:00:00", 0, 4), none), 1.5, 1e-9);
    EXPECT_NEAR(RescheduleAdvisor::preference_score(open_slot("2024-03-05T10:00:00", 2, 4), none), 0.75, 1e-9);
}

TEST(RescheduleTest, test_confidence_is_within_unit_interval) {
    ReschedulePreferences prefs{{10}, {1}};
    std::vector<TimeSlot> slots{open_slot("2024-03-05T10:00:00", 0, 3)};

    auto suggestions = RescheduleAdvisor().suggest(CANCELLED, slots, prefs);
    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_GE(suggestions[0].confidence, 0.0);
    EXPECT_LE(suggestions[0].confidence, 1.0);
}

TEST(RescheduleTest, test_no_candidates) {
    EXPECT_TRUE(RescheduleAdvisor().suggest(CANCELLED, {}, ReschedulePreferences{}).empty());
}

TEST(RescheduleTest, test_scan_skips_weekend_and_caps_at_budget) {
    // Friday 2024-03-01: Saturday and Sunday are skipped, Monday fills the budget
    RescheduleAdvisor advisor;
    auto suggestions = advisor.scan_days(CANCELLED, {}, Date(2024, 3, 1), 7);

    ASSERT_EQ(suggestions.size(), 5u);
    EXPECT_EQ(to_iso(suggestions[0].time), "2024-03-04T09:00:00");
    EXPECT_EQ(to_iso(suggestions[4].time), "2024-03-04T15:00:00");
    for (const auto& s : suggestions) {
        EXPECT_EQ(s.provider_id, "dr-a");
        EXPECT_NEAR(s.confidence, 0.9 - 3 * 0.02, 1e-9);
    }
}

TEST(RescheduleTest, test_scan_skips_taken_times_for_same_provider) {
    std::vector<Booking> existing{
        Booking{"x", "dr-a", "p", parse_timestamp("2024-03-05T09:00:00")},
        Booking{"y", "dr-b", "p", parse_timestamp("2024-03-05T10:00:00")},
    };

    RescheduleAdvisor advisor;
    auto suggestions = advisor.scan_days(CANCELLED, existing, Date(2024, 3, 4), 1);
    ASSERT_EQ(suggestions.size(), 5u);
    EXPECT_EQ(to_iso(suggestions[0].time), "2024-03-05T10:00:00");
    EXPECT_EQ(to_iso(suggestions[4].time), "2024-03-05T16:00:00");
}

TEST(RescheduleTest, test_scan_continues_to_next_day_when_short) {
    std::vector<Booking> existing;
    for (int hour : {9, 10, 11, 14}) {
        existing.push_back(Booking{"t" + std::to_string(hour), "dr-a", "p",
                                   Timestamp(Date(2024, 3, 5), boost::posix_time::hours(hour))});
    }

    RescheduleAdvisor advisor;
    auto suggestions = advisor.scan_days(CANCELLED, existing, Date(2024, 3, 4), 5);
    ASSERT_EQ(suggestions.size(), 5u);
    EXPECT_EQ(to_iso(suggestions[0].time), "2024-03-05T15:00:00");
    EXPECT_EQ(to_iso(suggestions[2].time), "2024-03-06T09:00:00");
    EXPECT_NEAR(suggestions[0].confidence, 0.88, 1e-9);
    EXPECT_NEAR(suggestions[2].confidence, 0.86, 1e-9);
}

TEST(RescheduleTest, test_scan_rejects_out_of_range_days) {
    RescheduleAdvisor advisor;
    EXPECT_THROW(advisor.scan_days(CANCELLED, {}, Date(2024, 3, 4), 0), std::invalid_argument);
    EXPECT_THROW(advisor.scan_days(CANCELLED, {}, Date(2024, 3, 4), 31), std::invalid_argument);
}
