// include/quant_engine/core/types.hpp
#pragma once

#include <chrono>
#include <string>

namespace quant_engine {

/**
 * @brief Wall-clock timestamp. Calendar dates are represented as midnight UTC.
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief How a backtest consumes its history
 */
enum class BacktestMode {
    HISTORICAL_SIMULATION,  // Replay history and trade on generated signals
    MODEL_VALIDATION        // Same pipeline, results tagged for model evaluation
};

inline std::string backtest_mode_to_string(BacktestMode mode) {
    switch (mode) {
        case BacktestMode::HISTORICAL_SIMULATION:
            return "historical_simulation";
        case BacktestMode::MODEL_VALIDATION:
            return "model_validation";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a backtest mode name
 * @return true when the name is known, in which case mode is set
 */
inline bool backtest_mode_from_string(const std::string& name, BacktestMode& mode) {
    if (name == "historical_simulation") {
        mode = BacktestMode::HISTORICAL_SIMULATION;
        return true;
    }
    if (name == "model_validation") {
        mode = BacktestMode::MODEL_VALIDATION;
        return true;
    }
    return false;
}

/**
 * @brief Order side recorded in the trade ledger
 */
enum class Side { BUY, SELL };

inline std::string side_to_string(Side side) {
    return side == Side::BUY ? "BUY" : "SELL";
}

}  // namespace quant_engine
