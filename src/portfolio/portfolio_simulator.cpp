// src/portfolio/portfolio_simulator.cpp

#include "quant_engine/portfolio/portfolio_simulator.hpp"
#include <cmath>
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

Result<void> SimulatorConfig::validate() const {
    auto costs_valid = costs.validate();
    if (costs_valid.is_error()) {
        return costs_valid;
    }
    auto risk_valid = risk.validate();
    if (risk_valid.is_error()) {
        return risk_valid;
    }
    auto metrics_valid = metrics.validate();
    if (metrics_valid.is_error()) {
        return metrics_valid;
    }
    if (lot_size < 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "lot_size must be at least 1",
                                "SimulatorConfig");
    }
    return Result<void>();
}

PortfolioSimulator::PortfolioSimulator(double initial_capital, SimulatorConfig config)
    : initial_capital_(initial_capital),
      config_(std::move(config)),
      cost_model_(config_.costs),
      risk_controller_(config_.risk, cost_model_),
      calculator_(config_.metrics),
      cash_(initial_capital) {
    Logger::register_component("PortfolioSimulator");
    if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
        throw std::invalid_argument("Initial capital must be positive");
    }
}

Result<StepReport> PortfolioSimulator::step(const TradingSignal& signal, const PriceData& price) {
    if (signal.stock_code.empty()) {
        return make_error<StepReport>(ErrorCode::INVALID_SIGNAL, "Signal has no stock code",
                                      "PortfolioSimulator");
    }
    if (!std::isfinite(price.close) || price.close <= 0.0) {
        return make_error<StepReport>(ErrorCode::INVALID_DATA,
                                      "Close price must be positive for " + signal.stock_code,
                                      "PortfolioSimulator");
    }
    if (!nav_series_.empty() && signal.timestamp <= nav_series_.back().first) {
        return make_error<StepReport>(ErrorCode::ORDERING_ERROR,
                                      "Step at " + core::format_date(signal.timestamp) +
                                          " does not follow " +
                                          core::format_date(nav_series_.back().first),
                                      "PortfolioSimulator");
    }

    const double close = price.close;
    auto held = positions_.find(signal.stock_code);
    const PortfolioPosition* position = held == positions_.end() ? nullptr : &held->second;

    RiskDecision decision = risk_controller_.apply(signal, position, close, cash_);

    StepReport report;
    report.timestamp = signal.timestamp;
    report.applied_signal = decision.signal;
    report.position_capped = decision.position_capped;
    report.stop_loss_triggered = decision.stop_loss_triggered;
    report.scaled_for_cash = decision.scaled_for_cash;

    if (decision.stop_loss_triggered) {
        INFO("Stop loss on " << signal.stock_code << " at " << close << " (avg cost "
                             << position->avg_cost << ")");
    }

    switch (decision.signal.signal_type) {
        case SignalType::BUY:
            report.trade =
                execute_buy(decision.signal, close, signal.timestamp, report.insufficient_funds);
            break;
        case SignalType::SELL:
            report.trade = execute_sell(decision.signal, close, signal.timestamp);
            break;
        case SignalType::HOLD:
            break;
    }

    auto marked = positions_.find(signal.stock_code);
    if (marked != positions_.end()) {
        marked->second.mark(close, signal.timestamp);
    }

    report.net_asset_value = portfolio_value();
    nav_series_.emplace_back(signal.timestamp, report.net_asset_value);
    return report;
}

std::optional<TradeRecord> PortfolioSimulator::execute_buy(const TradingSignal& signal,
                                                           double price, const Timestamp& when,
                                                           bool& insufficient_funds) {
    const double lot = config_.lot_size;
    double shares = std::floor(cash_ * signal.position_size / price / lot) * lot;
    if (shares <= 0.0) {
        return std::nullopt;
    }

    TransactionCost cost = cost_model_.calculate(Side::BUY, shares, price);
    while (shares > 0.0 && shares * price + cost.total > cash_) {
        insufficient_funds = true;
        shares -= lot;
        cost = cost_model_.calculate(Side::BUY, shares, price);
    }
    if (insufficient_funds) {
        INFO("Insufficient cash for full buy of " << signal.stock_code << ", reduced to "
                                                  << shares << " shares");
    }
    if (shares <= 0.0) {
        return std::nullopt;
    }

    const double notional = shares * price;
    cash_ -= notional + cost.total;

    PortfolioPosition& position = positions_[signal.stock_code];
    double total_shares = position.shares + shares;
    position.avg_cost = (position.shares * position.avg_cost + notional) / total_shares;
    position.shares = total_shares;
    position.stock_code = signal.stock_code;

    TradeRecord trade;
    trade.timestamp = when;
    trade.stock_code = signal.stock_code;
    trade.side = Side::BUY;
    trade.shares = shares;
    trade.price = price;
    trade.notional = notional;
    trade.cost = cost;
    trade.cash_after = cash_;
    trade.reason = signal.reason;
    trades_.push_back(trade);

    DEBUG("BUY " << shares << " " << signal.stock_code << " @ " << price << " cost "
                 << cost.total);
    return trade;
}

std::optional<TradeRecord> PortfolioSimulator::execute_sell(const TradingSignal& signal,
                                                            double price,
                                                            const Timestamp& when) {
    auto it = positions_.find(signal.stock_code);
    if (it == positions_.end() || it->second.shares <= 0.0) {
        return std::nullopt;
    }

    const PortfolioPosition position = it->second;
    const double shares = position.shares;
    const double notional = shares * price;
    TransactionCost cost = cost_model_.calculate(Side::SELL, shares, price);

    cash_ += notional - cost.total;
    positions_.erase(it);

    TradeRecord trade;
    trade.timestamp = when;
    trade.stock_code = signal.stock_code;
    trade.side = Side::SELL;
    trade.shares = shares;
    trade.price = price;
    trade.notional = notional;
    trade.cost = cost;
    trade.cash_after = cash_;
    trade.realized_pnl = (price - position.avg_cost) * shares - cost.total;
    trade.reason = signal.reason;
    trades_.push_back(trade);

    DEBUG("SELL " << shares << " " << signal.stock_code << " @ " << price << " pnl "
                  << *trade.realized_pnl);
    return trade;
}

double PortfolioSimulator::portfolio_value() const {
    double value = cash_;
    for (const auto& [code, position] : positions_) {
        value += position.market_value;
    }
    return value;
}

std::vector<double> PortfolioSimulator::value_series() const {
    std::vector<double> values;
    values.reserve(nav_series_.size() + 1);
    values.push_back(initial_capital_);
    for (const auto& [when, nav] : nav_series_) {
        values.push_back(nav);
    }
    return values;
}

std::vector<double> PortfolioSimulator::daily_returns() const {
    return calculator_.calculate_returns(value_series());
}

PerformanceReport PortfolioSimulator::finalize() const {
    return calculator_.calculate_report(initial_capital_, value_series(), trades_);
}

void PortfolioSimulator::reset() {
    cash_ = initial_capital_;
    positions_.clear();
    nav_series_.clear();
    trades_.clear();
}

}  // namespace quant_engine
