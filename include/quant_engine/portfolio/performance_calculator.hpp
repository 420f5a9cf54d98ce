// include/quant_engine/portfolio/performance_calculator.hpp
#pragma once

#include <optional>
#include <vector>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/portfolio/portfolio_types.hpp"

namespace quant_engine {

/**
 * @brief Annualization conventions
 */
struct MetricsConfig : public ConfigBase {
    int trading_days_per_year{252};
    double risk_free_rate{0.03};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["trading_days_per_year"] = trading_days_per_year;
        j["risk_free_rate"] = risk_free_rate;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("trading_days_per_year"))
            trading_days_per_year = j.at("trading_days_per_year").get<int>();
        if (j.contains("risk_free_rate"))
            risk_free_rate = j.at("risk_free_rate").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override;
};

/**
 * @brief Stateless calculation of end-of-run performance metrics
 *
 * All methods are const and free of side effects. Ratios that are undefined for
 * the given data (zero volatility, no negative returns, no drawdown) are
 * returned as nullopt rather than as sentinel values.
 */
class PerformanceCalculator {
public:
    explicit PerformanceCalculator(MetricsConfig config = MetricsConfig{});

    // ========== Returns ==========

    /**
     * @brief Total return as decimal (0.10 = 10%)
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Simple annualization: total_return * days_per_year / trading_days
     */
    double calculate_annual_return(double total_return, int trading_days) const;

    /**
     * @brief Day-over-day returns of a value series
     */
    std::vector<double> calculate_returns(const std::vector<double>& values) const;

    // ========== Risk ==========

    /**
     * @brief Population standard deviation of returns, annualized
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Annualized standard deviation of the negative returns only
     * @return nullopt when there are no negative returns
     */
    std::optional<double> calculate_downside_volatility(const std::vector<double>& returns) const;

    std::optional<double> calculate_sharpe_ratio(double annual_return, double volatility) const;
    std::optional<double> calculate_sortino_ratio(double annual_return,
                                                  const std::vector<double>& returns) const;
    std::optional<double> calculate_calmar_ratio(double annual_return, double max_drawdown) const;

    /**
     * @brief Largest peak-to-trough decline as a fraction of the peak
     *
     * Single forward pass tracking the running peak; extending the series can
     * never reduce the result.
     */
    double calculate_max_drawdown(const std::vector<double>& values) const;

    std::vector<double> calculate_drawdowns(const std::vector<double>& values) const;

    /**
     * @brief Historical VaR: absolute value of the (1 - confidence) percentile of returns
     * @return nullopt for an empty return series
     */
    std::optional<double> calculate_var(const std::vector<double>& returns,
                                        double confidence) const;

    /**
     * @brief Percentile with linear interpolation between closest ranks
     * @param q Percentile in [0, 100]
     */
    static double percentile(std::vector<double> values, double q);

    // ========== Trades ==========

    /**
     * @brief Fill trade statistics of a report from the ledger
     *
     * Every ledger entry counts as a trade; wins and losses are judged on the
     * realized P&L of closing sells.
     */
    void calculate_trade_statistics(const std::vector<TradeRecord>& trades,
                                    PerformanceReport& report) const;

    /**
     * @brief Compute the full report of a simulation
     * @param initial_capital Capital at the start of the run
     * @param values Net asset value series, starting with initial_capital
     * @param trades Trade ledger
     */
    PerformanceReport calculate_report(double initial_capital, const std::vector<double>& values,
                                       const std::vector<TradeRecord>& trades) const;

    const MetricsConfig& config() const {
        return config_;
    }

private:
    MetricsConfig config_;
};

}  // namespace quant_engine
