#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "quant_engine/orchestrator/engine_config.hpp"

using namespace quant_engine;
using namespace quant_engine::testing;

class EngineConfigTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "engine_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    std::filesystem::path test_dir;
};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.orchestrator.poll_interval_seconds, 30);
    EXPECT_EQ(config.orchestrator.batch_limit, 50u);
    EXPECT_EQ(config.replay.exchange, "SSE");
}

TEST_F(EngineConfigTest, JsonRoundTrip) {
    EngineConfig config;
    config.database.host = "db.internal";
    config.database.name = "backtests";
    config.replay.use_cache = false;
    config.thresholds.buy_threshold = 0.5;
    config.thresholds.sell_threshold = -0.4;
    config.orchestrator.poll_interval_seconds = 5;
    config.orchestrator.batch_limit = 7;

    EngineConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.database.host, "db.internal");
    EXPECT_EQ(loaded.database.name, "backtests");
    EXPECT_FALSE(loaded.replay.use_cache);
    EXPECT_DOUBLE_EQ(loaded.thresholds.buy_threshold, 0.5);
    EXPECT_DOUBLE_EQ(loaded.thresholds.sell_threshold, -0.4);
    EXPECT_EQ(loaded.orchestrator.poll_interval_seconds, 5);
    EXPECT_EQ(loaded.orchestrator.batch_limit, 7u);
    EXPECT_EQ(loaded.to_json(), config.to_json());
}

TEST_F(EngineConfigTest, PartialJsonKeepsDefaults) {
    EngineConfig config;
    config.from_json({{"orchestrator", {{"batch_limit", 3}}}});

    EXPECT_EQ(config.orchestrator.batch_limit, 3u);
    EXPECT_EQ(config.orchestrator.poll_interval_seconds, 30);
    EXPECT_EQ(config.database.host, "localhost");
}

TEST_F(EngineConfigTest, RejectsNonPositivePollInterval) {
    EngineConfig config;
    config.orchestrator.poll_interval_seconds = 0;
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("poll_interval_seconds"),
              std::string::npos);
}

TEST_F(EngineConfigTest, RejectsZeroBatchLimit) {
    EngineConfig config;
    config.orchestrator.batch_limit = 0;
    EXPECT_TRUE(config.validate().is_error());
}

TEST_F(EngineConfigTest, RejectsProgressStepOutOfRange) {
    OrchestratorConfig config;
    config.progress_step = 0.0;
    EXPECT_TRUE(config.validate().is_error());
    config.progress_step = 150.0;
    EXPECT_TRUE(config.validate().is_error());
    config.progress_step = 100.0;
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(EngineConfigTest, RejectsRetryAndCancelSettings) {
    OrchestratorConfig config;
    config.status_write_attempts = 0;
    EXPECT_TRUE(config.validate().is_error());

    config = OrchestratorConfig{};
    config.status_retry_delay_ms = -1;
    EXPECT_TRUE(config.validate().is_error());

    config = OrchestratorConfig{};
    config.cancel_check_interval_ms = -5;
    EXPECT_TRUE(config.validate().is_error());

    config.cancel_check_interval_ms = 0;
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(EngineConfigTest, RejectsMissingDatabaseHost) {
    EngineConfig config;
    config.database.host.clear();
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::VALIDATION_ERROR);
}

TEST_F(EngineConfigTest, RejectsNonNumericPort) {
    EngineConfig config;
    config.database.port = "pg";
    EXPECT_TRUE(config.validate().is_error());

    config.database.port = "54\xC3\xA9";
    EXPECT_TRUE(config.validate().is_error());

    config.database.port = "6432";
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(EngineConfigTest, ConnectionStringOmitsEmptyCredentials) {
    DatabaseConfig config;
    config.host = "db";
    config.name = "factors";
    EXPECT_EQ(config.get_connection_string(),
              "host=db port=5432 dbname=factors connect_timeout=10 "
              "application_name=backtest_scheduler");

    config.username = "quant";
    config.password = "secret";
    config.application_name.clear();
    EXPECT_EQ(config.get_connection_string(),
              "host=db port=5432 dbname=factors user=quant password=secret connect_timeout=10");
}

TEST_F(EngineConfigTest, RejectsEmptyExchange) {
    EngineConfig config;
    config.replay.exchange.clear();
    EXPECT_TRUE(config.validate().is_error());
}

TEST_F(EngineConfigTest, RejectsInvertedThresholds) {
    EngineConfig config;
    config.thresholds.buy_threshold = -0.5;
    config.thresholds.sell_threshold = 0.5;
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(EngineConfigTest, RejectsPositionSizingOutOfRange) {
    EngineConfig config;
    config.sizing.max_position = 1.5;
    EXPECT_TRUE(config.validate().is_error());

    config.sizing.max_position = 1.0;
    config.sizing.risk_multiplier = 0.0;
    EXPECT_TRUE(config.validate().is_error());
}

TEST_F(EngineConfigTest, RejectsSimulatorSettings) {
    EngineConfig rates;
    rates.simulator.costs.commission_rate = 1.5;
    EXPECT_TRUE(rates.validate().is_error());

    EngineConfig year;
    year.simulator.metrics.trading_days_per_year = 0;
    EXPECT_TRUE(year.validate().is_error());

    EngineConfig risk_free;
    risk_free.simulator.metrics.risk_free_rate = -0.01;
    EXPECT_TRUE(risk_free.validate().is_error());
}

TEST_F(EngineConfigTest, LoadsFromFile) {
    const auto path = test_dir / "engine.json";
    {
        std::ofstream file(path);
        file << R"({
            "database": {"host": "pg", "port": "6432", "name": "factors"},
            "replay": {"exchange": "SZSE"},
            "orchestrator": {"poll_interval_seconds": 2, "batch_limit": 4}
        })";
    }

    EngineConfig config;
    auto loaded = config.load_from_file(path.string());
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->to_string();
    EXPECT_EQ(config.database.host, "pg");
    EXPECT_EQ(config.database.port, "6432");
    EXPECT_EQ(config.replay.exchange, "SZSE");
    EXPECT_EQ(config.orchestrator.poll_interval_seconds, 2);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(EngineConfigTest, MissingFileIsReported) {
    EngineConfig config;
    auto loaded = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::FILE_NOT_FOUND);
}
