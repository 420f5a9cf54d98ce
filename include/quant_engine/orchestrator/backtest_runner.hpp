// include/quant_engine/orchestrator/backtest_runner.hpp
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/logger.hpp"
#include "quant_engine/data/data_replayer.hpp"
#include "quant_engine/factor/factor_combination.hpp"
#include "quant_engine/portfolio/portfolio_simulator.hpp"
#include "quant_engine/signal/signal_generator.hpp"
#include "quant_engine/task/backtest_result.hpp"
#include "quant_engine/task/task_types.hpp"

namespace quant_engine {

/**
 * @brief How a run ended when it did not fail
 */
struct RunOutcome {
    bool cancelled{false};
    std::optional<BacktestResult> result;  // Set when the run completed

    static RunOutcome completed(BacktestResult result) {
        RunOutcome outcome;
        outcome.result = std::move(result);
        return outcome;
    }

    static RunOutcome cancelled_run() {
        RunOutcome outcome;
        outcome.cancelled = true;
        return outcome;
    }
};

using CancelCheck = std::function<bool()>;
using ProgressCallback = std::function<void(double)>;

/**
 * @brief Runs the replay, signal and simulation pipeline of one task
 *
 * Each run gets its own PortfolioSimulator. The snapshot cache passed in is
 * shared by all runs of this runner.
 */
class BacktestRunner {
public:
    BacktestRunner(std::shared_ptr<FactorSnapshotProvider> provider,
                   std::shared_ptr<SnapshotCache> cache, ReplayConfig replay_config = {},
                   SimulatorConfig simulator_config = {}, SignalThresholds thresholds = {},
                   PositionSizingConfig sizing = {});

    /**
     * @brief Execute a task
     * @param task Task to run; its config selects the mode and threshold override
     * @param combination Factor weights, read-only during the run
     * @param cancel_requested Polled before every snapshot
     * @param on_progress Receives the percentage of trading days processed
     * @return The outcome, DATA_NOT_FOUND when no usable snapshot exists, or the
     *         first fatal replay or simulation error
     */
    Result<RunOutcome> run(const Task& task, const FactorCombination& combination,
                           const CancelCheck& cancel_requested = CancelCheck{},
                           const ProgressCallback& on_progress = ProgressCallback{});

    void clear_cache() {
        replayer_.clear_cache();
    }

    size_t cache_size() const {
        return replayer_.cache_size();
    }

private:
    DataReplayer replayer_;
    SimulatorConfig simulator_config_;
    SignalThresholds thresholds_;
    PositionSizingConfig sizing_;
};

}  // namespace quant_engine
