// src/portfolio/performance_calculator.cpp

#include "quant_engine/portfolio/performance_calculator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace quant_engine {

namespace {

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    Eigen::Map<const Eigen::VectorXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
    double mean = v.mean();
    return std::sqrt((v.array() - mean).square().mean());
}

}  // namespace

Result<void> MetricsConfig::validate() const {
    if (trading_days_per_year <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "trading_days_per_year must be positive", "MetricsConfig");
    }
    if (!std::isfinite(risk_free_rate) || risk_free_rate < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "risk_free_rate must not be negative", "MetricsConfig");
    }
    return Result<void>();
}

PerformanceCalculator::PerformanceCalculator(MetricsConfig config) : config_(std::move(config)) {}

// ========== Returns ==========

double PerformanceCalculator::calculate_total_return(double start_value, double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

double PerformanceCalculator::calculate_annual_return(double total_return,
                                                      int trading_days) const {
    if (trading_days <= 0) {
        return 0.0;
    }
    return total_return * static_cast<double>(config_.trading_days_per_year) /
           static_cast<double>(trading_days);
}

std::vector<double> PerformanceCalculator::calculate_returns(
    const std::vector<double>& values) const {
    std::vector<double> returns;
    if (values.size() < 2) {
        return returns;
    }

    returns.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] > 0.0) {
            returns.push_back((values[i] - values[i - 1]) / values[i - 1]);
        }
    }
    return returns;
}

// ========== Risk ==========

double PerformanceCalculator::calculate_volatility(const std::vector<double>& returns) const {
    return population_stddev(returns) * std::sqrt(static_cast<double>(config_.trading_days_per_year));
}

std::optional<double> PerformanceCalculator::calculate_downside_volatility(
    const std::vector<double>& returns) const {
    std::vector<double> negative;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative),
                 [](double r) { return r < 0.0; });
    if (negative.empty()) {
        return std::nullopt;
    }
    return population_stddev(negative) *
           std::sqrt(static_cast<double>(config_.trading_days_per_year));
}

std::optional<double> PerformanceCalculator::calculate_sharpe_ratio(double annual_return,
                                                                    double volatility) const {
    if (volatility <= 0.0) {
        return std::nullopt;
    }
    return (annual_return - config_.risk_free_rate) / volatility;
}

std::optional<double> PerformanceCalculator::calculate_sortino_ratio(
    double annual_return, const std::vector<double>& returns) const {
    auto downside = calculate_downside_volatility(returns);
    if (!downside || *downside <= 0.0) {
        return std::nullopt;
    }
    return (annual_return - config_.risk_free_rate) / *downside;
}

std::optional<double> PerformanceCalculator::calculate_calmar_ratio(double annual_return,
                                                                    double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return std::nullopt;
    }
    return annual_return / max_drawdown;
}

std::vector<double> PerformanceCalculator::calculate_drawdowns(
    const std::vector<double>& values) const {
    std::vector<double> drawdowns;
    drawdowns.reserve(values.size());
    if (values.empty()) {
        return drawdowns;
    }

    double peak = values.front();
    for (double value : values) {
        peak = std::max(peak, value);
        drawdowns.push_back(peak > 0.0 && value < peak ? (peak - value) / peak : 0.0);
    }
    return drawdowns;
}

double PerformanceCalculator::calculate_max_drawdown(const std::vector<double>& values) const {
    double max_drawdown = 0.0;
    if (values.empty()) {
        return max_drawdown;
    }

    double peak = values.front();
    for (double value : values) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            max_drawdown = std::max(max_drawdown, (peak - value) / peak);
        }
    }
    return max_drawdown;
}

double PerformanceCalculator::percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());

    double rank = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    double fraction = rank - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

std::optional<double> PerformanceCalculator::calculate_var(const std::vector<double>& returns,
                                                           double confidence) const {
    if (returns.empty()) {
        return std::nullopt;
    }
    return std::abs(percentile(returns, (1.0 - confidence) * 100.0));
}

// ========== Trades ==========

void PerformanceCalculator::calculate_trade_statistics(const std::vector<TradeRecord>& trades,
                                                       PerformanceReport& report) const {
    report.trade_count = static_cast<int>(trades.size());

    double total_win = 0.0;
    double total_loss = 0.0;
    int closed = 0;
    for (const auto& trade : trades) {
        if (!trade.realized_pnl) {
            continue;
        }
        ++closed;
        if (*trade.realized_pnl > 0.0) {
            ++report.winning_trades;
            total_win += *trade.realized_pnl;
        } else if (*trade.realized_pnl < 0.0) {
            ++report.losing_trades;
            total_loss += -*trade.realized_pnl;
        }
    }

    report.win_rate = closed > 0 ? static_cast<double>(report.winning_trades) / closed : 0.0;
    report.avg_win = report.winning_trades > 0 ? total_win / report.winning_trades : 0.0;
    report.avg_loss = report.losing_trades > 0 ? total_loss / report.losing_trades : 0.0;
    report.profit_loss_ratio = report.avg_loss > 0.0 ? report.avg_win / report.avg_loss : 0.0;
}

PerformanceReport PerformanceCalculator::calculate_report(
    double initial_capital, const std::vector<double>& values,
    const std::vector<TradeRecord>& trades) const {
    PerformanceReport report;
    report.initial_capital = initial_capital;
    report.final_value = values.empty() ? initial_capital : values.back();

    auto returns = calculate_returns(values);
    report.trading_days = static_cast<int>(returns.size());

    report.total_return = calculate_total_return(initial_capital, report.final_value);
    report.annual_return = calculate_annual_return(report.total_return, report.trading_days);
    report.volatility = calculate_volatility(returns);
    report.max_drawdown = calculate_max_drawdown(values);
    report.sharpe_ratio = calculate_sharpe_ratio(report.annual_return, report.volatility);
    report.sortino_ratio = calculate_sortino_ratio(report.annual_return, returns);
    report.calmar_ratio = calculate_calmar_ratio(report.annual_return, report.max_drawdown);
    report.var_95 = calculate_var(returns, 0.95);
    report.var_99 = calculate_var(returns, 0.99);

    calculate_trade_statistics(trades, report);
    return report;
}

}  // namespace quant_engine
