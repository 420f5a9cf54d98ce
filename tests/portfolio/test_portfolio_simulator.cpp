#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../test_utils.hpp"
#include "quant_engine/portfolio/portfolio_simulator.hpp"

using namespace quant_engine;
using namespace quant_engine::testing;

namespace {

const std::string STOCK = "600000.SH";

TradingSignal make_signal(const Timestamp& when, SignalType type, double position_size) {
    TradingSignal signal;
    signal.stock_code = STOCK;
    signal.timestamp = when;
    signal.signal_type = type;
    signal.position_size = type == SignalType::HOLD ? 0.0 : position_size;
    signal.strength = type == SignalType::HOLD ? 0.0 : 0.9;
    signal.confidence = 0.9;
    return signal;
}

}  // namespace

class PortfolioSimulatorTest : public TestBase {
protected:
    PortfolioSimulator simulator{1000000.0};
};

TEST_F(PortfolioSimulatorTest, RejectsNonPositiveCapital) {
    EXPECT_THROW(PortfolioSimulator(0.0), std::invalid_argument);
    EXPECT_THROW(PortfolioSimulator(-5.0), std::invalid_argument);
}

TEST_F(PortfolioSimulatorTest, BuyIsCappedAndRoundedToLots) {
    auto step = simulator.step(make_signal(date(2024, 1, 2), SignalType::BUY, 1.0),
                               make_price(date(2024, 1, 2), 10.0));
    ASSERT_TRUE(step.is_ok()) << step.error()->to_string();

    const auto& report = step.value();
    EXPECT_TRUE(report.position_capped);
    ASSERT_TRUE(report.trade.has_value());
    EXPECT_EQ(report.trade->side, Side::BUY);
    EXPECT_DOUBLE_EQ(report.trade->shares, 10000.0);
    EXPECT_DOUBLE_EQ(report.trade->notional, 100000.0);
    EXPECT_NEAR(report.trade->cost.total, 30.0 + 2.0 + 100.0, 1e-9);

    EXPECT_NEAR(simulator.cash(), 1000000.0 - 100000.0 - 132.0, 1e-6);
    EXPECT_NEAR(report.net_asset_value, 1000000.0 - 132.0, 1e-6);
    ASSERT_EQ(simulator.positions().count(STOCK), 1u);
    EXPECT_DOUBLE_EQ(simulator.positions().at(STOCK).avg_cost, 10.0);
}

TEST_F(PortfolioSimulatorTest, SellClosesPositionAndRealizesPnl) {
    ASSERT_TRUE(simulator
                    .step(make_signal(date(2024, 1, 2), SignalType::BUY, 0.1),
                          make_price(date(2024, 1, 2), 10.0))
                    .is_ok());
    auto sell = simulator.step(make_signal(date(2024, 1, 3), SignalType::SELL, 0.5),
                               make_price(date(2024, 1, 3), 11.0));
    ASSERT_TRUE(sell.is_ok());

    ASSERT_TRUE(sell.value().trade.has_value());
    const auto& trade = *sell.value().trade;
    EXPECT_EQ(trade.side, Side::SELL);
    EXPECT_DOUBLE_EQ(trade.shares, 10000.0);
    EXPECT_NEAR(trade.cost.total, 33.0 + 110.0 + 2.2 + 110.0, 1e-9);
    ASSERT_TRUE(trade.realized_pnl.has_value());
    EXPECT_NEAR(*trade.realized_pnl, 10000.0 - 255.2, 1e-6);

    EXPECT_TRUE(simulator.positions().empty());
    EXPECT_NEAR(simulator.cash(), 1000000.0 - 132.0 + 10000.0 - 255.2, 1e-6);
    EXPECT_NEAR(simulator.portfolio_value(), simulator.cash(), 1e-9);
}

TEST_F(PortfolioSimulatorTest, SellWithoutPositionDoesNothing) {
    auto step = simulator.step(make_signal(date(2024, 1, 2), SignalType::SELL, 1.0),
                               make_price(date(2024, 1, 2), 10.0));
    ASSERT_TRUE(step.is_ok());
    EXPECT_FALSE(step.value().trade.has_value());
    EXPECT_DOUBLE_EQ(simulator.cash(), 1000000.0);
}

TEST_F(PortfolioSimulatorTest, HoldMarksPositionToMarket) {
    simulator.step(make_signal(date(2024, 1, 2), SignalType::BUY, 0.1),
                   make_price(date(2024, 1, 2), 10.0));
    auto hold = simulator.step(make_signal(date(2024, 1, 3), SignalType::HOLD, 0.0),
                               make_price(date(2024, 1, 3), 10.2));
    ASSERT_TRUE(hold.is_ok());
    EXPECT_FALSE(hold.value().trade.has_value());

    const auto& position = simulator.positions().at(STOCK);
    EXPECT_NEAR(position.market_value, 102000.0, 1e-6);
    EXPECT_NEAR(position.unrealized_pnl, 2000.0, 1e-6);
    EXPECT_NEAR(hold.value().net_asset_value, simulator.cash() + 102000.0, 1e-6);
}

TEST_F(PortfolioSimulatorTest, StopLossExitsOnHold) {
    simulator.step(make_signal(date(2024, 1, 2), SignalType::BUY, 0.1),
                   make_price(date(2024, 1, 2), 10.0));
    auto step = simulator.step(make_signal(date(2024, 1, 3), SignalType::HOLD, 0.0),
                               make_price(date(2024, 1, 3), 9.0));
    ASSERT_TRUE(step.is_ok());
    EXPECT_TRUE(step.value().stop_loss_triggered);
    ASSERT_TRUE(step.value().trade.has_value());
    EXPECT_EQ(step.value().trade->side, Side::SELL);
    EXPECT_LT(*step.value().trade->realized_pnl, 0.0);
    EXPECT_TRUE(simulator.positions().empty());
}

TEST_F(PortfolioSimulatorTest, BuyShrinksToFitCash) {
    SimulatorConfig config;
    config.risk.max_position_ratio = 1.0;
    PortfolioSimulator small(1005.0, config);

    auto step = small.step(make_signal(date(2024, 1, 2), SignalType::BUY, 1.0),
                           make_price(date(2024, 1, 2), 10.0));
    ASSERT_TRUE(step.is_ok());
    EXPECT_TRUE(step.value().insufficient_funds);
    EXPECT_FALSE(step.value().trade.has_value());
    EXPECT_DOUBLE_EQ(small.cash(), 1005.0);
}

TEST_F(PortfolioSimulatorTest, CashNeverGoesNegative) {
    SimulatorConfig config;
    config.risk.max_position_ratio = 1.0;
    PortfolioSimulator sim(100000.0, config);

    for (int day = 2; day <= 12; ++day) {
        SignalType type = day % 2 == 0 ? SignalType::BUY : SignalType::SELL;
        auto step = sim.step(make_signal(date(2024, 1, day), type, 1.0),
                             make_price(date(2024, 1, day), 10.0 + day * 0.1));
        ASSERT_TRUE(step.is_ok());
        EXPECT_GE(sim.cash(), 0.0);
    }
}

TEST_F(PortfolioSimulatorTest, RejectsOutOfOrderSteps) {
    ASSERT_TRUE(simulator
                    .step(make_signal(date(2024, 1, 3), SignalType::HOLD, 0.0),
                          make_price(date(2024, 1, 3), 10.0))
                    .is_ok());
    auto repeated = simulator.step(make_signal(date(2024, 1, 3), SignalType::HOLD, 0.0),
                                   make_price(date(2024, 1, 3), 10.0));
    ASSERT_TRUE(repeated.is_error());
    EXPECT_EQ(repeated.error()->code(), ErrorCode::ORDERING_ERROR);
}

TEST_F(PortfolioSimulatorTest, RejectsBadInput) {
    auto no_stock = make_signal(date(2024, 1, 2), SignalType::BUY, 0.1);
    no_stock.stock_code.clear();
    EXPECT_EQ(simulator.step(no_stock, make_price(date(2024, 1, 2), 10.0)).error()->code(),
              ErrorCode::INVALID_SIGNAL);

    EXPECT_EQ(simulator
                  .step(make_signal(date(2024, 1, 2), SignalType::BUY, 0.1),
                        make_price(date(2024, 1, 2), 0.0))
                  .error()
                  ->code(),
              ErrorCode::INVALID_DATA);
    EXPECT_TRUE(simulator.nav_series().empty());
}

TEST_F(PortfolioSimulatorTest, DailyReturnsStartFromInitialCapital) {
    simulator.step(make_signal(date(2024, 1, 2), SignalType::HOLD, 0.0),
                   make_price(date(2024, 1, 2), 10.0));
    simulator.step(make_signal(date(2024, 1, 3), SignalType::HOLD, 0.0),
                   make_price(date(2024, 1, 3), 10.0));

    auto returns = simulator.daily_returns();
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_DOUBLE_EQ(returns[0], 0.0);

    auto report = simulator.finalize();
    EXPECT_DOUBLE_EQ(report.final_value, 1000000.0);
    EXPECT_EQ(report.trading_days, 2);
    EXPECT_EQ(report.trade_count, 0);
}

TEST_F(PortfolioSimulatorTest, ResetRestoresInitialState) {
    simulator.step(make_signal(date(2024, 1, 2), SignalType::BUY, 0.1),
                   make_price(date(2024, 1, 2), 10.0));
    simulator.reset();
    EXPECT_DOUBLE_EQ(simulator.cash(), 1000000.0);
    EXPECT_TRUE(simulator.positions().empty());
    EXPECT_TRUE(simulator.trades().empty());
    EXPECT_TRUE(simulator.nav_series().empty());
}

TEST_F(PortfolioSimulatorTest, ConfigValidation) {
    SimulatorConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    config.lot_size = 0.5;
    EXPECT_TRUE(config.validate().is_error());
}
