// include/quant_engine/task/backtest_result.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/factor/factor_combination.hpp"
#include "quant_engine/portfolio/portfolio_types.hpp"

namespace quant_engine {

/**
 * @brief Persisted outcome of a completed backtest
 */
struct BacktestResult {
    std::string result_id;
    std::string task_id;
    std::string batch_id;
    std::string stock_code;
    Timestamp start_date;
    Timestamp end_date;
    BacktestMode mode{BacktestMode::HISTORICAL_SIMULATION};
    double initial_capital{0.0};

    FactorCombination factor_combination;  // Weights as used by the run
    PerformanceReport performance;

    std::vector<std::pair<Timestamp, double>> nav_series;
    std::vector<double> daily_returns;
    std::vector<TradeRecord> trades;
    std::vector<PortfolioPosition> final_positions;

    size_t data_point_count{0};  // Snapshots consumed
    size_t skipped_dates{0};     // Trading days without a usable snapshot
    double execution_time_seconds{0.0};
    Timestamp created_at;

    nlohmann::json to_json() const;

    /**
     * @brief Rebuild a result from its to_json() document
     */
    static Result<BacktestResult> from_json(const nlohmann::json& j);
};

}  // namespace quant_engine
