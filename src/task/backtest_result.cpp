// src/task/backtest_result.cpp

#include "quant_engine/task/backtest_result.hpp"
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

namespace {

std::optional<double> optional_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

Timestamp date_from_json(const nlohmann::json& j, const char* key) {
    auto parsed = core::parse_date(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw *parsed.error();
    }
    return parsed.value();
}

TradeRecord trade_from_json(const nlohmann::json& j) {
    TradeRecord trade;
    trade.timestamp = date_from_json(j, "date");
    trade.stock_code = j.at("stock_code").get<std::string>();
    trade.side = j.at("side").get<std::string>() == "SELL" ? Side::SELL : Side::BUY;
    trade.shares = j.at("shares").get<double>();
    trade.price = j.at("price").get<double>();
    trade.notional = j.at("notional").get<double>();
    trade.cost.commission = j.at("commission").get<double>();
    trade.cost.stamp_tax = j.at("stamp_tax").get<double>();
    trade.cost.transfer_fee = j.at("transfer_fee").get<double>();
    trade.cost.slippage = j.at("slippage").get<double>();
    trade.cost.total = j.at("total_cost").get<double>();
    trade.cash_after = j.at("cash_after").get<double>();
    trade.realized_pnl = optional_from_json(j, "realized_pnl");
    if (j.contains("reason"))
        trade.reason = j.at("reason").get<std::string>();
    return trade;
}

PerformanceReport performance_from_json(const nlohmann::json& j) {
    PerformanceReport report;
    report.initial_capital = j.at("initial_capital").get<double>();
    report.final_value = j.at("final_value").get<double>();
    report.total_return = j.at("total_return").get<double>();
    report.annual_return = j.at("annual_return").get<double>();
    report.max_drawdown = j.at("max_drawdown").get<double>();
    report.volatility = j.at("volatility").get<double>();
    report.sharpe_ratio = optional_from_json(j, "sharpe_ratio");
    report.sortino_ratio = optional_from_json(j, "sortino_ratio");
    report.calmar_ratio = optional_from_json(j, "calmar_ratio");
    report.var_95 = optional_from_json(j, "var_95");
    report.var_99 = optional_from_json(j, "var_99");
    report.trade_count = j.at("trade_count").get<int>();
    report.winning_trades = j.at("winning_trades").get<int>();
    report.losing_trades = j.at("losing_trades").get<int>();
    report.win_rate = j.at("win_rate").get<double>();
    report.avg_win = j.at("avg_win").get<double>();
    report.avg_loss = j.at("avg_loss").get<double>();
    report.profit_loss_ratio = j.at("profit_loss_ratio").get<double>();
    report.trading_days = j.at("trading_days").get<int>();
    return report;
}

}  // namespace

nlohmann::json BacktestResult::to_json() const {
    nlohmann::json j;
    j["result_id"] = result_id;
    j["task_id"] = task_id;
    j["batch_id"] = batch_id;
    j["stock_code"] = stock_code;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["backtest_mode"] = backtest_mode_to_string(mode);
    j["initial_capital"] = initial_capital;
    j["factor_combination"] = factor_combination.to_json();
    j["performance"] = performance.to_json();

    j["nav_series"] = nlohmann::json::array();
    for (const auto& [date, nav] : nav_series) {
        j["nav_series"].push_back({{"date", core::format_date(date)}, {"nav", nav}});
    }
    j["daily_returns"] = daily_returns;
    j["trades"] = nlohmann::json::array();
    for (const auto& trade : trades) {
        j["trades"].push_back(trade.to_json());
    }
    j["final_positions"] = nlohmann::json::array();
    for (const auto& position : final_positions) {
        j["final_positions"].push_back(position.to_json());
    }

    j["data_point_count"] = data_point_count;
    j["skipped_dates"] = skipped_dates;
    j["execution_time"] = execution_time_seconds;
    j["created_at"] = core::format_timestamp(created_at);
    return j;
}

Result<BacktestResult> BacktestResult::from_json(const nlohmann::json& j) {
    try {
        BacktestResult result;
        result.result_id = j.at("result_id").get<std::string>();
        result.task_id = j.at("task_id").get<std::string>();
        result.batch_id = j.at("batch_id").get<std::string>();
        result.stock_code = j.at("stock_code").get<std::string>();
        result.start_date = date_from_json(j, "start_date");
        result.end_date = date_from_json(j, "end_date");
        backtest_mode_from_string(j.at("backtest_mode").get<std::string>(), result.mode);
        result.initial_capital = j.at("initial_capital").get<double>();

        auto combination = FactorCombination::from_json(j.at("factor_combination"));
        if (combination.is_error()) {
            return forward_error<BacktestResult>(combination);
        }
        result.factor_combination = combination.value();
        result.performance = performance_from_json(j.at("performance"));

        for (const auto& point : j.at("nav_series")) {
            result.nav_series.emplace_back(date_from_json(point, "date"),
                                           point.at("nav").get<double>());
        }
        result.daily_returns = j.at("daily_returns").get<std::vector<double>>();
        for (const auto& trade : j.at("trades")) {
            result.trades.push_back(trade_from_json(trade));
        }
        for (const auto& entry : j.at("final_positions")) {
            PortfolioPosition position;
            position.stock_code = entry.at("stock_code").get<std::string>();
            position.shares = entry.at("shares").get<double>();
            position.avg_cost = entry.at("avg_cost").get<double>();
            position.market_value = entry.at("market_value").get<double>();
            position.unrealized_pnl = entry.at("unrealized_pnl").get<double>();
            position.last_update = date_from_json(entry, "last_update");
            result.final_positions.push_back(position);
        }

        result.data_point_count = j.at("data_point_count").get<size_t>();
        result.skipped_dates = j.at("skipped_dates").get<size_t>();
        result.execution_time_seconds = j.at("execution_time").get<double>();
        return result;
    } catch (const EngineError& e) {
        return make_error<BacktestResult>(e.code(), e.what(), "BacktestResult");
    } catch (const nlohmann::json::exception& e) {
        return make_error<BacktestResult>(ErrorCode::JSON_PARSE_ERROR,
                                          std::string("Malformed result document: ") + e.what(),
                                          "BacktestResult");
    }
}

}  // namespace quant_engine
