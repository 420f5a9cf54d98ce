// include/quant_engine/portfolio/portfolio_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "quant_engine/core/types.hpp"

namespace quant_engine {

/**
 * @brief Holding of one stock inside a simulated portfolio
 */
struct PortfolioPosition {
    std::string stock_code;
    double shares{0.0};
    double avg_cost{0.0};  // Weighted average fill price of the buys
    double market_value{0.0};
    double unrealized_pnl{0.0};
    Timestamp last_update;

    /**
     * @brief Revalue the position at a new price
     */
    void mark(double price, const Timestamp& when) {
        market_value = shares * price;
        unrealized_pnl = (price - avg_cost) * shares;
        last_update = when;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Breakdown of the costs charged on one trade
 */
struct TransactionCost {
    double commission{0.0};
    double stamp_tax{0.0};
    double transfer_fee{0.0};
    double slippage{0.0};
    double total{0.0};
};

/**
 * @brief Entry of the simulated trade ledger
 */
struct TradeRecord {
    Timestamp timestamp;
    std::string stock_code;
    Side side{Side::BUY};
    double shares{0.0};
    double price{0.0};
    double notional{0.0};
    TransactionCost cost;
    double cash_after{0.0};
    std::optional<double> realized_pnl;  // Set on sells, net of sell-side costs
    std::string reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Metrics of a completed simulation
 */
struct PerformanceReport {
    double initial_capital{0.0};
    double final_value{0.0};
    double total_return{0.0};
    double annual_return{0.0};
    double max_drawdown{0.0};
    double volatility{0.0};
    std::optional<double> sharpe_ratio;
    std::optional<double> sortino_ratio;
    std::optional<double> calmar_ratio;
    std::optional<double> var_95;
    std::optional<double> var_99;

    int trade_count{0};
    int winning_trades{0};
    int losing_trades{0};
    double win_rate{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    double profit_loss_ratio{0.0};
    int trading_days{0};

    nlohmann::json to_json() const;
};

}  // namespace quant_engine
