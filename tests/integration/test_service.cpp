#include <gtest/gtest.h>
#include "service/optimization_service.h"
#include "core/errors.h"
#include <map>
#include <stdexcept>
#include <utility>

using namespace slotforge;

namespace {

const Date DAY(2024, 3, 4);

class TableRiskModel : public RiskModel {
public:
    explicit TableRiskModel(std::map<std::string, double> table) : table_(std::move(table)) {}

    RiskAssessment predict(const BookingAttributes& attributes) const override {
        auto it = table_.find(attributes.booking.id);
        double p = it == table_.end() ? 0.0 : it->second;
        return RiskAssessment{p, classify_risk(p), {}};
    }

private:
    std::map<std::string, double> table_;
};

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_.set_calendar("dr-a", make_calendar("11:00", "12:00", 30));
        for (int i = 0; i < 10; ++i) {
            source_.add_booking(Booking{"b" + std::to_string(i), "dr-a", "patient-" + std::to_string(i),
                                        parse_timestamp("2024-03-04T11:05:00")});
        }
        source_.add_booking(Booking{"next-day", "dr-a", "p", parse_timestamp("2024-03-05T11:05:00")});
        config_.worker_threads = 2;
    }

    OptimizationRequest request() const {
        return OptimizationRequest{"practice-1", DAY, std::nullopt, std::nullopt};
    }

    InMemoryScheduleSource source_;
    TableRiskModel risk_{{{"b0", 1.0}, {"b1", 0.8}}};
    InMemoryResultStore store_;
    Config config_;
};

}  // namespace

TEST_F(ServiceTest, test_run_stores_result) {
    OptimizationService service(source_, risk_, store_, config_);
    auto record = service.run(request());

    EXPECT_EQ(record.id, "opt-1");
    ASSERT_EQ(record.result.optimized_schedule.size(), 1u);
    EXPECT_EQ(record.result.optimized_schedule[0].slots[0].capacity, 2);
    EXPECT_EQ(record.result.changes.size(), 1u);
    EXPECT_EQ(service.completed(), 1u);

    auto stored = store_.find(record.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->practice_id, "practice-1");
    EXPECT_EQ(stored->optimization_date, DAY);
    EXPECT_EQ(stored->model_version, "1.0.0");
    EXPECT_DOUBLE_EQ(stored->model_confidence, 0.85);
    EXPECT_FALSE(stored->applied);
    EXPECT_DOUBLE_EQ(stored->result.predicted_revenue_gain, 105.0);
}

TEST_F(ServiceTest, test_run_without_bookings_fails) {
    OptimizationService service(source_, risk_, store_, config_);

    auto empty_day = request();
    empty_day.day = Date(2024, 3, 6);
    EXPECT_THROW(service.run(empty_day), EmptyInputError);

    auto other_provider = request();
    other_provider.provider_id = "dr-nobody";
    EXPECT_THROW(service.run(other_provider), EmptyInputError);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(ServiceTest, test_request_strategy_overrides_config) {
    config_.optimizer.max_overbook_pct = 0.5;
    OptimizationService service(source_, risk_, store_, config_);

    auto balanced = service.run(request());
    auto bold_request = request();
    bold_request.strategy = Strategy::Aggressive;
    auto bold = service.run(bold_request);

    EXPECT_EQ(balanced.result.optimized_schedule[0].slots[0].capacity, 2);
    EXPECT_EQ(bold.result.optimized_schedule[0].slots[0].capacity, 3);
}

TEST_F(ServiceTest, test_provider_without_calendar_gets_default_day) {
    source_.add_booking(Booking{"walk-in", "dr-q", "p", parse_timestamp("2024-03-04T09:10:00")});
    OptimizationService service(source_, risk_, store_, config_);

    auto record = service.run(request());
    ASSERT_EQ(record.result.optimized_schedule.size(), 2u);
    const auto& dr_q = record.result.optimized_schedule[1];
    EXPECT_EQ(dr_q.provider_id, "dr-q");
    ASSERT_EQ(dr_q.slots.size(), 16u);
    EXPECT_EQ(to_iso(dr_q.slots.front().start), "2024-03-04T09:00:00");
    EXPECT_EQ(to_iso(dr_q.slots.back().end), "2024-03-04T17:00:00");
    EXPECT_EQ(dr_q.slots[0].bookings.size(), 1u);
}

TEST_F(ServiceTest, test_apply_lifecycle) {
    OptimizationService service(source_, risk_, store_, config_);
    auto record = service.run(request());

    EXPECT_EQ(service.apply(record.id, "manager@clinic"), ApplyStatus::Applied);
    EXPECT_EQ(service.apply(record.id, "manager@clinic"), ApplyStatus::AlreadyApplied);
    EXPECT_EQ(service.apply("opt-404", "manager@clinic"), ApplyStatus::NotFound);

    auto stored = store_.find(record.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->applied);
    EXPECT_TRUE(stored->applied_at.has_value());
    EXPECT_EQ(stored->applied_by, "manager@clinic");
}

TEST_F(ServiceTest, test_daily_advisories) {
    OptimizationService service(source_, risk_, store_, config_);
    auto advisories = service.advisories(DAY);

    ASSERT_EQ(advisories.size(), 3u);
    EXPECT_EQ(advisories[0].message, "2 appointments have high no-show risk");
    EXPECT_EQ(advisories[1].message, "Average no-show probability is 18.0%");
    EXPECT_EQ(advisories[2].message, "Only 10 appointments scheduled");
}

TEST_F(ServiceTest, test_submit_reports_errors_through_future) {
    OptimizationService service(source_, risk_, store_, config_);

    auto ok = service.submit(request());
    auto empty_day = request();
    empty_day.day = Date(2024, 3, 9);
    auto failed = service.submit(empty_day);

    EXPECT_EQ(ok.get().result.changes.size(), 1u);
    EXPECT_THROW(failed.get(), EmptyInputError);
}

TEST_F(ServiceTest, test_invalid_config_rejected) {
    config_.impact.fill_rate = 1.5;
    EXPECT_THROW({ OptimizationService service(source_, risk_, store_, config_); }, ConfigurationError);
}
