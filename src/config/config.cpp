#include "config/config.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace slotforge {

namespace {

std::optional<double> env_double(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return std::nullopt;
    try {
        size_t pos = 0;
        double value = std::stod(raw, &pos);
        if (pos != std::string(raw).size()) throw std::invalid_argument("trailing characters");
        return value;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}='{}': not a number", name, raw);
        return std::nullopt;
    }
}

std::optional<long> env_long(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return std::nullopt;
    try {
        size_t pos = 0;
        long value = std::stol(raw, &pos);
        if (pos != std::string(raw).size()) throw std::invalid_argument("trailing characters");
        return value;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}='{}': not an integer", name, raw);
        return std::nullopt;
    }
}

}  // namespace

Strategy parse_strategy(const std::string& name) {
    if (name == "conservative") return Strategy::Conservative;
    if (name == "balanced") return Strategy::Balanced;
    if (name == "aggressive") return Strategy::Aggressive;
    throw RequestError("unknown strategy: '" + name + "'");
}

std::string to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::Conservative: return "conservative";
        case Strategy::Aggressive: return "aggressive";
        case Strategy::Balanced: break;
    }
    return "balanced";
}

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

Config Config::from_env() {
    Config cfg;

    if (auto v = env_double("SLOTFORGE_MAX_OVERBOOK_PCT")) cfg.optimizer.max_overbook_pct = *v;
    if (auto v = env_double("SLOTFORGE_MIN_NO_SHOW_THRESHOLD")) cfg.optimizer.min_no_show_threshold = *v;
    if (auto v = env_long("SLOTFORGE_BUFFER_MINUTES")) cfg.optimizer.buffer_minutes = static_cast<int>(*v);

    if (const char* strategy = std::getenv("SLOTFORGE_STRATEGY")) {
        try {
            cfg.optimizer.strategy = parse_strategy(strategy);
        } catch (const RequestError& e) {
            spdlog::warn("Ignoring SLOTFORGE_STRATEGY: {}", e.what());
        }
    }

    if (auto v = env_double("SLOTFORGE_AVG_BOOKING_VALUE")) cfg.impact.avg_booking_value = *v;
    if (auto v = env_double("SLOTFORGE_FILL_RATE")) cfg.impact.fill_rate = *v;

    // Negative counts would wrap around in size_t
    if (auto v = env_long("SLOTFORGE_RESCHEDULE_TOP_N"); v && *v > 0) {
        cfg.reschedule.top_n = static_cast<size_t>(*v);
    }
    if (auto v = env_long("SLOTFORGE_RESCHEDULE_SCAN_BUDGET"); v && *v > 0) {
        cfg.reschedule.scan_budget = static_cast<size_t>(*v);
    }
    if (auto v = env_long("SLOTFORGE_WORKERS"); v && *v > 0) {
        cfg.worker_threads = static_cast<size_t>(*v);
    }

    if (const char* level = std::getenv("SLOTFORGE_LOG_LEVEL")) {
        cfg.log_level = level;
    }
    if (const char* version = std::getenv("SLOTFORGE_MODEL_VERSION")) {
        cfg.model_version = version;
    }

    return cfg;
}

void Config::validate() const {
    if (optimizer.max_overbook_pct < 0.0 || optimizer.max_overbook_pct > 1.0) {
        throw ConfigurationError("max_overbook_pct must be within [0, 1]");
    }
    if (optimizer.min_no_show_threshold < 0.0) {
        throw ConfigurationError("min_no_show_threshold must be non-negative");
    }
    if (optimizer.buffer_minutes < 0) {
        throw ConfigurationError("buffer_minutes must be non-negative");
    }
    if (impact.avg_booking_value < 0.0) {
        throw ConfigurationError("avg_booking_value must be non-negative");
    }
    if (impact.fill_rate < 0.0 || impact.fill_rate > 1.0) {
        throw ConfigurationError("fill_rate must be within [0, 1]");
    }
    if (reschedule.top_n == 0) {
        throw ConfigurationError("reschedule top_n must be positive");
    }
    if (reschedule.scan_budget == 0) {
        throw ConfigurationError("reschedule scan_budget must be positive");
    }
    if (reschedule.max_days_ahead <= 0) {
        throw ConfigurationError("reschedule max_days_ahead must be positive");
    }
    if (default_calendar.slot_duration_minutes <= 0) {
        throw ConfigurationError("default slot duration must be positive");
    }
    if (worker_threads == 0) {
        throw ConfigurationError("worker_threads must be positive");
    }
}

}  // namespace slotforge
