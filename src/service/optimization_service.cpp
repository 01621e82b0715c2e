#include "service/optimization_service.h"
#include "core/errors.h"
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

namespace slotforge {

OptimizationService::OptimizationService(const ScheduleSource& source,
                                         const RiskModel& risk_model,
                                         ResultStore& store,
                                         Config config)
    : source_(source),
      risk_model_(risk_model),
      store_(store),
      config_(std::move(config)),
      pool_(config_.worker_threads) {
    config_.validate();
    spdlog::info("Optimization service started with {} workers", config_.worker_threads);
}

OptimizationService::~OptimizationService() {
    stop();
}

void OptimizationService::stop() {
    accepting_.store(false);
    pool_.join();
}

ProviderCalendars OptimizationService::calendars_for(const OptimizationRequest& request,
                                                     const std::vector<Booking>& bookings) const {
    ProviderCalendars calendars = source_.calendars_for(request.provider_id);

    // Providers with bookings but no registered hours get the default day
    const auto& defaults = config_.default_calendar;
    for (const auto& booking : bookings) {
        bool known = std::any_of(calendars.begin(), calendars.end(), [&](const ProviderCalendar& pc) {
            return pc.provider_id == booking.provider_id;
        });
        if (!known) {
            spdlog::debug("No calendar for provider {}, using {}-{}",
                          booking.provider_id, defaults.start, defaults.end);
            calendars.push_back({booking.provider_id,
                                 make_calendar(defaults.start, defaults.end, defaults.slot_duration_minutes)});
        }
    }
    return calendars;
}

OptimizationRecord OptimizationService::run(const OptimizationRequest& request) {
    auto day = boost::gregorian::to_iso_extended_string(request.day);
    std::vector<Booking> bookings = source_.bookings_for(request.day, request.provider_id);
    if (bookings.empty()) {
        throw EmptyInputError("no bookings found for optimization on " + day +
                              (request.provider_id ? " for provider " + *request.provider_id : ""));
    }

    ProbabilityMap probabilities = predict_all(risk_model_, bookings);

    OptimizerConfig optimizer_config = config_.optimizer;
    if (request.strategy) {
        optimizer_config.strategy = *request.strategy;
    }

    ScheduleOptimizer optimizer(optimizer_config, config_.impact);
    OptimizationResult result = optimizer.optimize_day(
        bookings, probabilities, calendars_for(request, bookings), request.day);

    StoredOptimization record;
    record.practice_id = request.practice_id;
    record.provider_id = request.provider_id;
    record.optimization_date = request.day;
    record.model_version = config_.model_version;
    record.model_confidence = config_.model_confidence;
    record.result = result;

    OptimizationRecord out;
    out.id = store_.save(std::move(record));
    out.result = std::move(result);

    completed_.fetch_add(1);
    spdlog::info("Stored optimization {} for practice {} on {}", out.id, request.practice_id, day);
    return out;
}

std::future<OptimizationRecord> OptimizationService::submit(OptimizationRequest request) {
    if (!accepting_.load()) {
        throw std::runtime_error("optimization service is stopped");
    }

    spdlog::debug("Queued optimization for practice {} on {}",
                  request.practice_id, boost::gregorian::to_iso_extended_string(request.day));

    auto task = std::make_shared<std::packaged_task<OptimizationRecord()>>(
        [this, request = std::move(request)]() {
            try {
                return run(request);
            } catch (const std::exception& e) {
                spdlog::warn("Optimization for practice {} failed: {}", request.practice_id, e.what());
                throw;
            }
        });
    auto future = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return future;
}

ApplyStatus OptimizationService::apply(const std::string& optimization_id, const std::string& applied_by) {
    auto status = store_.mark_applied(optimization_id, applied_by,
                                      boost::posix_time::second_clock::local_time());
    if (status == ApplyStatus::NotFound) {
        spdlog::warn("Cannot apply unknown optimization {}", optimization_id);
    } else if (status == ApplyStatus::AlreadyApplied) {
        spdlog::warn("Optimization {} was already applied", optimization_id);
    }
    return status;
}

std::vector<Advisory> OptimizationService::advisories(const Date& day) const {
    std::vector<Booking> bookings = source_.bookings_for(day, std::nullopt);
    ProbabilityMap probabilities = predict_all(risk_model_, bookings);
    return daily_advisories(bookings, probabilities, config_.typical_daily_capacity);
}

}  // namespace slotforge
