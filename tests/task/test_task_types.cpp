#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../test_utils.hpp"
#include "quant_engine/task/task_types.hpp"

using namespace quant_engine;
using namespace quant_engine::testing;

class TaskTypesTest : public TestBase {};

TEST_F(TaskTypesTest, StatusNamesRoundTrip) {
    for (TaskStatus status : {TaskStatus::PENDING, TaskStatus::RUNNING, TaskStatus::COMPLETED,
                              TaskStatus::FAILED, TaskStatus::CANCELLED}) {
        auto parsed = task_status_from_string(task_status_to_string(status));
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value(), status);
    }
    EXPECT_TRUE(task_status_from_string("paused").is_error());
}

TEST_F(TaskTypesTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(TaskStatus::PENDING));
    EXPECT_FALSE(is_terminal(TaskStatus::RUNNING));
    EXPECT_TRUE(is_terminal(TaskStatus::COMPLETED));
    EXPECT_TRUE(is_terminal(TaskStatus::FAILED));
    EXPECT_TRUE(is_terminal(TaskStatus::CANCELLED));
}

TEST_F(TaskTypesTest, ParseNullConfigGivesDefaults) {
    auto config = TaskConfig::parse(nlohmann::json());
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().backtest_mode, BacktestMode::HISTORICAL_SIMULATION);
    EXPECT_FALSE(config.value().thresholds.has_value());
}

TEST_F(TaskTypesTest, ParseKeepsUnknownKeysInExtensions) {
    nlohmann::json j = {{"backtest_mode", "model_validation"},
                        {"thresholds", {{"buy_threshold", 0.4}, {"sell_threshold", -0.4}}},
                        {"extensions", {{"benchmark", "000300.SH"}}}};

    auto config = TaskConfig::parse(j);
    ASSERT_TRUE(config.is_ok()) << config.error()->to_string();
    EXPECT_EQ(config.value().backtest_mode, BacktestMode::MODEL_VALIDATION);
    ASSERT_TRUE(config.value().thresholds.has_value());
    EXPECT_DOUBLE_EQ(config.value().thresholds->buy_threshold, 0.4);
    EXPECT_EQ(config.value().extensions["benchmark"], "000300.SH");

    auto round_trip = TaskConfig::parse(config.value().to_json());
    ASSERT_TRUE(round_trip.is_ok());
    EXPECT_EQ(round_trip.value().extensions, config.value().extensions);
}

TEST_F(TaskTypesTest, ParseRejectsUnknownMode) {
    auto config = TaskConfig::parse({{"backtest_mode", "live"}});
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error()->code(), ErrorCode::VALIDATION_ERROR);
}

TEST_F(TaskTypesTest, ParseRejectsInvalidThresholds) {
    auto config =
        TaskConfig::parse({{"thresholds", {{"buy_threshold", -0.5}, {"sell_threshold", 0.5}}}});
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error()->code(), ErrorCode::VALIDATION_ERROR);
}

TEST_F(TaskTypesTest, ParseRejectsNonObject) {
    EXPECT_TRUE(TaskConfig::parse(nlohmann::json::array()).is_error());
    EXPECT_TRUE(TaskConfig::parse({{"backtest_mode", 3}}).is_error());
}

TEST_F(TaskTypesTest, BatchSummaryCounts) {
    BatchSummary summary;
    summary.batch_id = "batch_1";
    summary.count(TaskStatus::COMPLETED);
    summary.count(TaskStatus::FAILED);
    summary.count(TaskStatus::PENDING);

    EXPECT_EQ(summary.total, 3);
    EXPECT_EQ(summary.completed, 1);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_FALSE(summary.is_finished());

    auto j = summary.to_json();
    EXPECT_EQ(j["total"], 3);
    EXPECT_EQ(j["pending"], 1);
}

TEST_F(TaskTypesTest, TaskJsonUsesNullForMissingFields) {
    Task task;
    task.id = "bt_1";
    task.stock_code = "000001.SZ";
    task.start_date = date(2024, 1, 1);
    task.end_date = date(2024, 1, 5);

    auto j = task.to_json();
    EXPECT_EQ(j["status"], "pending");
    EXPECT_EQ(j["start_date"], "2024-01-01");
    EXPECT_TRUE(j["error_message"].is_null());
    EXPECT_TRUE(j["started_at"].is_null());
}
