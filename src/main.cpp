#include "config/config.h"
#include "core/errors.h"
#include "optimizer/schedule_optimizer.h"
#include "protocol/serializer.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <iterator>

int main(int argc, char* argv[]) {
    // stdout carries the result document, logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("slotforge"));

    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <request.json>\n";
        return 2;
    }

    try {
        auto& config = slotforge::get_config();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        config.validate();

        std::ifstream file(argv[1]);
        if (!file.is_open()) {
            spdlog::error("Cannot open request file {}", argv[1]);
            return 1;
        }
        std::string text(std::istreambuf_iterator<char>(file), {});

        auto input = slotforge::Serializer::parse_input(text);
        if (input.bookings.empty()) {
            spdlog::info("No bookings on {}, nothing to optimize",
                         boost::gregorian::to_iso_extended_string(input.day));
            return 0;
        }

        slotforge::OptimizerConfig optimizer_config = config.optimizer;
        if (input.strategy) {
            optimizer_config.strategy = *input.strategy;
        }

        slotforge::ScheduleOptimizer optimizer(optimizer_config, config.impact);
        auto result = optimizer.optimize_day(input.bookings, input.probabilities,
                                             input.calendars, input.day);
        result.failures.insert(result.failures.end(),
                               input.calendar_failures.begin(), input.calendar_failures.end());

        std::cout << slotforge::Serializer::serialize_result(result).dump(2) << std::endl;
        return 0;

    } catch (const slotforge::RequestError& e) {
        spdlog::error("Invalid request: {}", e.what());
        return 1;
    } catch (const slotforge::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
