#include "protocol/serializer.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <type_traits>

namespace slotforge {

Json Serializer::serialize_slot(const TimeSlot& slot) {
    Json bookings = Json::array();
    for (const auto& booking : slot.bookings) {
        bookings.push_back({
            {"id", booking.id},
            {"provider_id", booking.provider_id},
            {"patient_id", booking.patient_id},
            {"scheduled_time", to_iso(booking.scheduled_time)},
            {"duration_minutes", booking.duration_minutes},
            {"appointment_type", booking.appointment_type},
        });
    }

    return Json{
        {"start", to_iso(slot.start)},
        {"end", to_iso(slot.end)},
        {"bookings", std::move(bookings)},
        {"capacity", slot.capacity},
        {"buffer_minutes", slot.buffer_minutes},
    };
}

Json Serializer::serialize_schedule(const Schedule& schedule) {
    Json out = Json::object();
    for (const auto& provider : schedule) {
        Json slots = Json::array();
        for (const auto& slot : provider.slots) {
            slots.push_back(serialize_slot(slot));
        }
        out[provider.provider_id] = std::move(slots);
    }
    return out;
}

Json Serializer::serialize_change(const Change& change) {
    return std::visit([](const auto& c) -> Json {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, OverbookAdded>) {
            return Json{
                {"type", "overbook_added"},
                {"time_slot", to_iso(c.time_slot)},
                {"provider_id", c.provider_id},
                {"additional_capacity", c.additional_capacity},
                {"reason", c.reason},
            };
        } else {
            return Json{
                {"type", "buffer_adjusted"},
                {"time_slot", to_iso(c.time_slot)},
                {"provider_id", c.provider_id},
                {"new_buffer", c.new_buffer},
                {"old_buffer", c.old_buffer},
            };
        }
    }, change);
}

Json Serializer::serialize_metrics(const ScheduleMetrics& metrics) {
    return Json{
        {"predicted_no_shows", metrics.predicted_no_shows},
        {"recommended_overbooks", metrics.recommended_overbooks},
        {"slots_optimized", metrics.slots_optimized},
        {"utilization_rate_before", metrics.utilization_before},
        {"utilization_rate_after", metrics.utilization_after},
        {"original_revenue", metrics.original_revenue},
        {"optimized_revenue", metrics.optimized_revenue},
    };
}

Json Serializer::serialize_result(const OptimizationResult& result) {
    Json changes = Json::array();
    for (const auto& change : result.changes) {
        changes.push_back(serialize_change(change));
    }

    Json out{
        {"original_schedule", serialize_schedule(result.original_schedule)},
        {"optimized_schedule", serialize_schedule(result.optimized_schedule)},
        {"changes", std::move(changes)},
        {"predicted_revenue_gain", result.predicted_revenue_gain},
        {"optimization_score", result.optimization_score},
        {"recommendations", result.recommendations},
        {"metrics", serialize_metrics(result.metrics)},
    };

    if (!result.failures.empty()) {
        Json failures = Json::array();
        for (const auto& failure : result.failures) {
            failures.push_back({{"provider_id", failure.provider_id}, {"reason", failure.reason}});
        }
        out["failed_providers"] = std::move(failures);
    }
    return out;
}

Json Serializer::serialize_suggestions(const std::vector<RescheduleSuggestion>& suggestions) {
    Json out = Json::array();
    for (const auto& s : suggestions) {
        out.push_back({
            {"time", to_iso(s.time)},
            {"provider_id", s.provider_id},
            {"confidence", s.confidence},
        });
    }
    return out;
}

Json Serializer::serialize_advisories(const std::vector<Advisory>& advisories) {
    Json out = Json::array();
    for (const auto& a : advisories) {
        out.push_back({
            {"type", a.type},
            {"priority", a.priority},
            {"message", a.message},
            {"action", a.action},
        });
    }
    return out;
}

Booking Serializer::parse_booking(const Json& node) {
    Booking booking;
    try {
        booking.id = node.at("id").get<std::string>();
        booking.provider_id = node.at("provider_id").get<std::string>();
        booking.patient_id = node.value("patient_id", std::string{});
        booking.scheduled_time = parse_timestamp(node.at("scheduled_time").get<std::string>());
        booking.duration_minutes = node.value("duration_minutes", 30);
        booking.appointment_type = node.value("appointment_type", std::string{"consultation"});
    } catch (const Json::exception& e) {
        throw RequestError(std::string("malformed booking: ") + e.what());
    }
    return booking;
}

ProviderCalendar Serializer::parse_calendar(const Json& node) {
    try {
        return ProviderCalendar{
            node.at("provider_id").get<std::string>(),
            make_calendar(node.at("start").get<std::string>(),
                          node.at("end").get<std::string>(),
                          node.value("slot_duration", 30)),
        };
    } catch (const Json::exception& e) {
        throw RequestError(std::string("malformed calendar: ") + e.what());
    }
}

OptimizationInput Serializer::parse_input(const std::string& text) {
    Json doc;
    try {
        doc = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw RequestError(std::string("request is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw RequestError("request must be a JSON object");
    }

    OptimizationInput input;
    try {
        input.day = parse_date(doc.at("date").get<std::string>());

        if (doc.contains("strategy")) {
            input.strategy = parse_strategy(doc.at("strategy").get<std::string>());
        }
        for (const auto& node : doc.value("calendars", Json::array())) {
            try {
                input.calendars.push_back(parse_calendar(node));
            } catch (const ConfigurationError& e) {
                // Drops only this provider
                auto provider_id = node.at("provider_id").get<std::string>();
                spdlog::warn("Skipping calendar of provider {}: {}", provider_id, e.what());
                input.calendar_failures.push_back({provider_id, e.what()});
            }
        }
        for (const auto& node : doc.value("bookings", Json::array())) {
            input.bookings.push_back(parse_booking(node));
        }
        Json probabilities = doc.value("probabilities", Json::object());
        for (const auto& item : probabilities.items()) {
            double p = item.value().get<double>();
            if (!(p >= 0.0 && p <= 1.0)) {
                throw RequestError("probability for booking '" + item.key() + "' must be within [0, 1]");
            }
            input.probabilities[item.key()] = p;
        }
    } catch (const Json::exception& e) {
        throw RequestError(std::string("malformed request: ") + e.what());
    }
    return input;
}

}  // namespace slotforge
