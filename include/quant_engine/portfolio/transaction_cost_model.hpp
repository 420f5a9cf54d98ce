// include/quant_engine/portfolio/transaction_cost_model.hpp
#pragma once

#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/portfolio/portfolio_types.hpp"

namespace quant_engine {

/**
 * @brief Fee schedule of an A-share trade
 */
struct TransactionCostConfig : public ConfigBase {
    double commission_rate{0.0003};    // Both directions
    double min_commission{5.0};        // Per trade floor
    double stamp_tax_rate{0.001};      // Sell side only
    double transfer_fee_rate{0.00002};  // Both directions
    double min_transfer_fee{1.0};
    double slippage_rate{0.001};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["commission_rate"] = commission_rate;
        j["min_commission"] = min_commission;
        j["stamp_tax_rate"] = stamp_tax_rate;
        j["transfer_fee_rate"] = transfer_fee_rate;
        j["min_transfer_fee"] = min_transfer_fee;
        j["slippage_rate"] = slippage_rate;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("commission_rate"))
            commission_rate = j.at("commission_rate").get<double>();
        if (j.contains("min_commission"))
            min_commission = j.at("min_commission").get<double>();
        if (j.contains("stamp_tax_rate"))
            stamp_tax_rate = j.at("stamp_tax_rate").get<double>();
        if (j.contains("transfer_fee_rate"))
            transfer_fee_rate = j.at("transfer_fee_rate").get<double>();
        if (j.contains("min_transfer_fee"))
            min_transfer_fee = j.at("min_transfer_fee").get<double>();
        if (j.contains("slippage_rate"))
            slippage_rate = j.at("slippage_rate").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override;
};

/**
 * @brief Computes commission, stamp tax, transfer fee and slippage of a trade
 *
 * Usage:
 *   TransactionCostModel model(config);
 *   auto cost = model.calculate(Side::SELL, 1000, 12.5);
 *   proceeds = notional - cost.total;
 */
class TransactionCostModel {
public:
    explicit TransactionCostModel(TransactionCostConfig config = TransactionCostConfig{});

    /**
     * @brief Cost of trading shares at price
     * @param side BUY or SELL; stamp tax applies to sells only
     * @param shares Number of shares, non-negative
     * @param price Fill price
     * @return Cost breakdown; all zero when nothing is traded
     */
    TransactionCost calculate(Side side, double shares, double price) const;

    /**
     * @brief Proportional cost rate assumed when checking cash for a buy
     */
    double estimate_buy_cost_rate() const {
        return config_.commission_rate + config_.slippage_rate;
    }

    const TransactionCostConfig& config() const {
        return config_;
    }

private:
    TransactionCostConfig config_;
};

}  // namespace quant_engine
