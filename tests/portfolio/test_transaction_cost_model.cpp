#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "quant_engine/portfolio/transaction_cost_model.hpp"

using namespace quant_engine;
using namespace quant_engine::testing;

class TransactionCostModelTest : public TestBase {
protected:
    TransactionCostModel model;
};

TEST_F(TransactionCostModelTest, MinimumFeesApplyToSmallTrades) {
    auto cost = model.calculate(Side::BUY, 1, 1.00);
    EXPECT_DOUBLE_EQ(cost.commission, 5.0);
    EXPECT_DOUBLE_EQ(cost.transfer_fee, 1.0);
    EXPECT_DOUBLE_EQ(cost.stamp_tax, 0.0);
    EXPECT_DOUBLE_EQ(cost.slippage, 0.001);
    EXPECT_DOUBLE_EQ(cost.total, 6.001);
}

TEST_F(TransactionCostModelTest, StampTaxOnSellsOnly) {
    auto buy = model.calculate(Side::BUY, 1000, 12.5);
    auto sell = model.calculate(Side::SELL, 1000, 12.5);

    EXPECT_DOUBLE_EQ(buy.stamp_tax, 0.0);
    EXPECT_DOUBLE_EQ(sell.stamp_tax, 12.5);
    EXPECT_DOUBLE_EQ(sell.commission, 5.0);
    EXPECT_DOUBLE_EQ(sell.transfer_fee, 1.0);
    EXPECT_DOUBLE_EQ(sell.slippage, 12.5);
    EXPECT_DOUBLE_EQ(sell.total, 31.0);
    EXPECT_DOUBLE_EQ(sell.total - buy.total, 12.5);
}

TEST_F(TransactionCostModelTest, ProportionalFeesOnLargeTrades) {
    auto cost = model.calculate(Side::BUY, 100000, 10.0);
    EXPECT_DOUBLE_EQ(cost.commission, 300.0);
    EXPECT_DOUBLE_EQ(cost.transfer_fee, 20.0);
    EXPECT_DOUBLE_EQ(cost.slippage, 1000.0);
}

TEST_F(TransactionCostModelTest, NothingTradedCostsNothing) {
    auto cost = model.calculate(Side::SELL, 0, 10.0);
    EXPECT_DOUBLE_EQ(cost.total, 0.0);
    EXPECT_DOUBLE_EQ(cost.commission, 0.0);
}

TEST_F(TransactionCostModelTest, CustomScheduleFromJson) {
    TransactionCostConfig config;
    config.from_json({{"commission_rate", 0.001}, {"min_commission", 0.0}, {"slippage_rate", 0.0}});
    ASSERT_TRUE(config.validate().is_ok());

    TransactionCostModel custom(config);
    auto cost = custom.calculate(Side::BUY, 1000, 10.0);
    EXPECT_DOUBLE_EQ(cost.commission, 10.0);
    EXPECT_DOUBLE_EQ(cost.slippage, 0.0);
    EXPECT_DOUBLE_EQ(custom.estimate_buy_cost_rate(), 0.001);
}

TEST_F(TransactionCostModelTest, ValidateRejectsNegativeRates) {
    TransactionCostConfig config;
    config.stamp_tax_rate = -0.001;
    EXPECT_TRUE(config.validate().is_error());

    config = TransactionCostConfig{};
    config.min_commission = -1.0;
    EXPECT_TRUE(config.validate().is_error());
}
