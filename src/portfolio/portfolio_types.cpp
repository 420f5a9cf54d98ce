// src/portfolio/portfolio_types.cpp

#include "quant_engine/portfolio/portfolio_types.hpp"
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

namespace {

nlohmann::json optional_to_json(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json PortfolioPosition::to_json() const {
    nlohmann::json j;
    j["stock_code"] = stock_code;
    j["shares"] = shares;
    j["avg_cost"] = avg_cost;
    j["market_value"] = market_value;
    j["unrealized_pnl"] = unrealized_pnl;
    j["last_update"] = core::format_date(last_update);
    return j;
}

nlohmann::json TradeRecord::to_json() const {
    nlohmann::json j;
    j["date"] = core::format_date(timestamp);
    j["stock_code"] = stock_code;
    j["side"] = side_to_string(side);
    j["shares"] = shares;
    j["price"] = price;
    j["notional"] = notional;
    j["commission"] = cost.commission;
    j["stamp_tax"] = cost.stamp_tax;
    j["transfer_fee"] = cost.transfer_fee;
    j["slippage"] = cost.slippage;
    j["total_cost"] = cost.total;
    j["cash_after"] = cash_after;
    j["realized_pnl"] = optional_to_json(realized_pnl);
    j["reason"] = reason;
    return j;
}

nlohmann::json PerformanceReport::to_json() const {
    nlohmann::json j;
    j["initial_capital"] = initial_capital;
    j["final_value"] = final_value;
    j["total_return"] = total_return;
    j["annual_return"] = annual_return;
    j["max_drawdown"] = max_drawdown;
    j["volatility"] = volatility;
    j["sharpe_ratio"] = optional_to_json(sharpe_ratio);
    j["sortino_ratio"] = optional_to_json(sortino_ratio);
    j["calmar_ratio"] = optional_to_json(calmar_ratio);
    j["var_95"] = optional_to_json(var_95);
    j["var_99"] = optional_to_json(var_99);
    j["trade_count"] = trade_count;
    j["winning_trades"] = winning_trades;
    j["losing_trades"] = losing_trades;
    j["win_rate"] = win_rate;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    j["profit_loss_ratio"] = profit_loss_ratio;
    j["trading_days"] = trading_days;
    return j;
}

}  // namespace quant_engine
