// include/quant_engine/portfolio/portfolio_simulator.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/logger.hpp"
#include "quant_engine/data/market_data.hpp"
#include "quant_engine/portfolio/performance_calculator.hpp"
#include "quant_engine/portfolio/portfolio_types.hpp"
#include "quant_engine/portfolio/risk_controller.hpp"
#include "quant_engine/portfolio/transaction_cost_model.hpp"
#include "quant_engine/signal/signal_generator.hpp"

namespace quant_engine {

/**
 * @brief Configuration of a portfolio simulation
 */
struct SimulatorConfig : public ConfigBase {
    TransactionCostConfig costs;
    RiskConfig risk;
    MetricsConfig metrics;
    double lot_size{100.0};  // Buys are rounded down to whole lots

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["costs"] = costs.to_json();
        j["risk"] = risk.to_json();
        j["metrics"] = metrics.to_json();
        j["lot_size"] = lot_size;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("costs"))
            costs.from_json(j.at("costs"));
        if (j.contains("risk"))
            risk.from_json(j.at("risk"));
        if (j.contains("metrics"))
            metrics.from_json(j.at("metrics"));
        if (j.contains("lot_size"))
            lot_size = j.at("lot_size").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override;
};

/**
 * @brief What happened during one simulation step
 */
struct StepReport {
    Timestamp timestamp;
    TradingSignal applied_signal;  // Signal after risk controls
    std::optional<TradeRecord> trade;
    bool stop_loss_triggered{false};
    bool position_capped{false};
    bool scaled_for_cash{false};
    bool insufficient_funds{false};  // Buy reduced by whole lots to fit the cash
    double net_asset_value{0.0};
};

/**
 * @brief Single-run portfolio state: cash, positions, NAV series and trade ledger
 *
 * One simulator belongs to one backtest run. Steps must be fed in strictly
 * increasing time order; each step completes its risk, cost and state update
 * before returning.
 */
class PortfolioSimulator {
public:
    /**
     * @brief Constructor
     * @param initial_capital Starting cash, must be positive
     * @param config Cost, risk and metric settings
     */
    explicit PortfolioSimulator(double initial_capital,
                                SimulatorConfig config = SimulatorConfig{});

    /**
     * @brief Apply one signal at the day's closing price
     * @param signal Filtered and sized signal
     * @param price Price of the signal's stock on the signal date
     * @return Step details, or an error for invalid prices or out-of-order steps
     */
    Result<StepReport> step(const TradingSignal& signal, const PriceData& price);

    /**
     * @brief Performance metrics of the run so far
     */
    PerformanceReport finalize() const;

    /**
     * @brief Return to the initial state
     */
    void reset();

    double initial_capital() const {
        return initial_capital_;
    }
    double cash() const {
        return cash_;
    }
    const std::map<std::string, PortfolioPosition>& positions() const {
        return positions_;
    }
    const std::vector<std::pair<Timestamp, double>>& nav_series() const {
        return nav_series_;
    }
    const std::vector<TradeRecord>& trades() const {
        return trades_;
    }

    /**
     * @brief Cash plus market value of all positions
     */
    double portfolio_value() const;

    /**
     * @brief Day-over-day returns of the NAV series, the first relative to initial capital
     */
    std::vector<double> daily_returns() const;

private:
    std::optional<TradeRecord> execute_buy(const TradingSignal& signal, double price,
                                           const Timestamp& when, bool& insufficient_funds);
    std::optional<TradeRecord> execute_sell(const TradingSignal& signal, double price,
                                            const Timestamp& when);
    std::vector<double> value_series() const;

    double initial_capital_;
    SimulatorConfig config_;
    TransactionCostModel cost_model_;
    RiskController risk_controller_;
    PerformanceCalculator calculator_;

    double cash_;
    std::map<std::string, PortfolioPosition> positions_;
    std::vector<std::pair<Timestamp, double>> nav_series_;
    std::vector<TradeRecord> trades_;
};

}  // namespace quant_engine
