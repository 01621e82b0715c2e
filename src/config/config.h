#pragma once
#ifndef SLOTFORGE_CONFIG_H
#define SLOTFORGE_CONFIG_H

#include <string>
#include <vector>
#include <cstddef>

namespace slotforge {

enum class Strategy { Conservative, Balanced, Aggressive };

// Throws RequestError for anything other than conservative/balanced/aggressive
Strategy parse_strategy(const std::string& name);
std::string to_string(Strategy strategy);

struct OptimizerConfig {
    double max_overbook_pct = 0.15;
    double min_no_show_threshold = 0.10;
    int buffer_minutes = 5;
    Strategy strategy = Strategy::Balanced;
};

struct ImpactConfig {
    double avg_booking_value = 150.0;
    // Fraction of added capacity assumed to turn into an attended booking
    double fill_rate = 0.7;
};

struct RescheduleConfig {
    size_t top_n = 3;
    size_t scan_budget = 5;
    std::vector<int> scan_hours{9, 10, 11, 14, 15, 16};
    int max_days_ahead = 30;
};

// Working hours used when a provider has no calendar of its own
struct CalendarDefaults {
    std::string start = "09:00";
    std::string end = "17:00";
    int slot_duration_minutes = 30;
};

struct Config {
    OptimizerConfig optimizer;
    ImpactConfig impact;
    RescheduleConfig reschedule;
    CalendarDefaults default_calendar;

    std::string log_level = "info";
    size_t worker_threads = 4;
    std::string model_version = "1.0.0";
    double model_confidence = 0.85;
    size_t typical_daily_capacity = 20;

    // Unparsable SLOTFORGE_* values keep their defaults and are logged
    static Config from_env();

    // Throws ConfigurationError on out-of-range values
    void validate() const;
};

Config& get_config();

}  // namespace slotforge

#endif  // SLOTFORGE_CONFIG_H
