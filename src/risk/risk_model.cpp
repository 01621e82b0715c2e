#include "risk/risk_model.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace slotforge {

RiskLevel classify_risk(double probability) {
    if (probability < 0.15) return RiskLevel::Low;
    if (probability < 0.35) return RiskLevel::Medium;
    return RiskLevel::High;
}

std::string to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: break;
    }
    return "high";
}

ProbabilityMap predict_all(const RiskModel& model, const std::vector<Booking>& bookings) {
    ProbabilityMap probabilities;
    for (const auto& booking : bookings) {
        BookingAttributes attributes;
        attributes.booking = booking;

        try {
            auto assessment = model.predict(attributes);
            if (std::isnan(assessment.probability)) {
                spdlog::warn("Risk model returned NaN for booking {}, using default", booking.id);
                continue;
            }
            probabilities[booking.id] = std::clamp(assessment.probability, 0.0, 1.0);
        } catch (const std::exception& e) {
            spdlog::warn("Risk prediction failed for booking {}: {}", booking.id, e.what());
        }
    }
    return probabilities;
}

}  // namespace slotforge
