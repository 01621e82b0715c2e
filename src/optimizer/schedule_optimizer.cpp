#include "optimizer/schedule_optimizer.h"
#include "optimizer/capacity_optimizer.h"
#include "optimizer/recommendations.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace slotforge {

ScheduleOptimizer::ScheduleOptimizer(OptimizerConfig optimizer, ImpactConfig impact)
    : optimizer_(std::move(optimizer)), impact_(std::move(impact)) {}

OptimizationResult ScheduleOptimizer::optimize_day(const std::vector<Booking>& bookings,
                                                   const ProbabilityMap& probabilities,
                                                   const ProviderCalendars& calendars,
                                                   const Date& day) const {
    spdlog::info("Optimizing schedule for {} bookings on {} ({} strategy)",
                 bookings.size(), boost::gregorian::to_iso_extended_string(day),
                 to_string(optimizer_.strategy));

    SlotBuilder builder(optimizer_.buffer_minutes);
    BuildResult built = builder.build(bookings, calendars, day);

    CapacityOptimizer capacity(optimizer_);
    std::vector<TimeSlot> optimized = capacity.optimize(built.slots, probabilities);

    OptimizationResult result;
    result.changes = diff_schedules(built.slots, optimized);
    result.predicted_revenue_gain = revenue_gain(built.slots, optimized, impact_);
    result.optimization_score = optimization_score(optimized);
    result.recommendations = generate_recommendations(optimized, probabilities);
    result.metrics = summarize(built.slots, optimized, probabilities, impact_);
    result.original_schedule = group_by_provider(built.slots);
    result.optimized_schedule = group_by_provider(optimized);
    result.failures = std::move(built.failures);

    spdlog::info("Optimization produced {} changes, score {:.3f}, revenue gain {:.2f}",
                 result.changes.size(), result.optimization_score, result.predicted_revenue_gain);
    return result;
}

}  // namespace slotforge
