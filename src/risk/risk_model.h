#pragma once
#ifndef SLOTFORGE_RISK_MODEL_H
#define SLOTFORGE_RISK_MODEL_H

#include <string>
#include <vector>
#include "model/booking.h"

namespace slotforge {

enum class RiskLevel { Low, Medium, High };

// low p < 0.15, medium p < 0.35, high otherwise
RiskLevel classify_risk(double probability);
std::string to_string(RiskLevel level);

struct RiskFactor {
    std::string name;
    double impact = 0.0;
};

struct RiskAssessment {
    double probability = 0.0;
    RiskLevel level = RiskLevel::Low;
    std::vector<RiskFactor> top_factors;
};

// Booking plus the history figures a predictor is fed with
struct BookingAttributes {
    Booking booking;
    double patient_no_show_rate = 0.15;
    int patient_total_appointments = 10;
    double practice_no_show_rate = 0.12;
};

// External no-show oracle. Implementations must be safe to call concurrently.
class RiskModel {
public:
    virtual ~RiskModel() = default;

    virtual RiskAssessment predict(const BookingAttributes& attributes) const = 0;
};

// Probability per booking id, clamped into [0, 1]. A booking whose
// prediction fails is logged and left out, so it falls back to the default.
ProbabilityMap predict_all(const RiskModel& model, const std::vector<Booking>& bookings);

}  // namespace slotforge

#endif  // SLOTFORGE_RISK_MODEL_H
