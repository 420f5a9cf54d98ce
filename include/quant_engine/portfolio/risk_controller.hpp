// include/quant_engine/portfolio/risk_controller.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"
#include "quant_engine/portfolio/portfolio_types.hpp"
#include "quant_engine/portfolio/transaction_cost_model.hpp"
#include "quant_engine/signal/signal_generator.hpp"

namespace quant_engine {

/**
 * @brief Configuration for per-trade risk controls
 */
struct RiskConfig : public ConfigBase {
    double max_position_ratio{0.10};  // Largest fraction of cash committed by one buy
    double stop_loss_ratio{0.05};     // Loss from avg cost that forces a full exit

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_position_ratio"] = max_position_ratio;
        j["stop_loss_ratio"] = stop_loss_ratio;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_position_ratio"))
            max_position_ratio = j.at("max_position_ratio").get<double>();
        if (j.contains("stop_loss_ratio"))
            stop_loss_ratio = j.at("stop_loss_ratio").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override;
};

/**
 * @brief Signal after risk controls, with the controls that fired
 */
struct RiskDecision {
    TradingSignal signal;
    bool position_capped{false};
    bool stop_loss_triggered{false};
    bool scaled_for_cash{false};
};

/**
 * @brief Applies position caps, stop-loss exits and cash sufficiency to a signal
 *
 * Controls run in a fixed order: cap, stop-loss, cash check. A stop-loss
 * overrides whatever the signal asked for.
 */
class RiskController {
public:
    RiskController(RiskConfig config, TransactionCostModel cost_model);

    /**
     * @brief Apply the risk controls to a signal
     * @param signal Filtered signal
     * @param position Current holding of the signal's stock, or nullptr
     * @param price Current price of the stock
     * @param cash Cash available
     * @return Adjusted signal and the controls that changed it
     */
    RiskDecision apply(const TradingSignal& signal, const PortfolioPosition* position,
                       double price, double cash) const;

    bool is_stop_loss_triggered(const PortfolioPosition& position, double price) const;

    const RiskConfig& config() const {
        return config_;
    }

private:
    RiskConfig config_;
    TransactionCostModel cost_model_;
};

}  // namespace quant_engine
