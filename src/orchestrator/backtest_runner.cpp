// src/orchestrator/backtest_runner.cpp

#include "quant_engine/orchestrator/backtest_runner.hpp"
#include <chrono>
#include "quant_engine/core/id_generator.hpp"
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

BacktestRunner::BacktestRunner(std::shared_ptr<FactorSnapshotProvider> provider,
                               std::shared_ptr<SnapshotCache> cache, ReplayConfig replay_config,
                               SimulatorConfig simulator_config, SignalThresholds thresholds,
                               PositionSizingConfig sizing)
    : replayer_(std::move(provider), std::move(cache), std::move(replay_config)),
      simulator_config_(std::move(simulator_config)),
      thresholds_(std::move(thresholds)),
      sizing_(std::move(sizing)) {
    Logger::register_component("BacktestRunner");
}

Result<RunOutcome> BacktestRunner::run(const Task& task, const FactorCombination& combination,
                                       const CancelCheck& cancel_requested,
                                       const ProgressCallback& on_progress) {
    Logger::register_component("BacktestRunner");
    const auto started = std::chrono::steady_clock::now();
    const BacktestMode mode = task.config.backtest_mode;

    auto replay = replayer_.replay(task.stock_code, task.start_date, task.end_date, combination,
                                   mode);
    if (replay.is_error()) {
        return forward_error<RunOutcome>(replay);
    }
    SnapshotStream stream = replay.take_value();
    const size_t total_dates = stream.total_dates();

    SignalGenerator generator(task.config.thresholds.value_or(thresholds_));
    PortfolioSimulator simulator(task.initial_capital, simulator_config_);

    DEBUG("Running " << task.id << " over " << total_dates << " trading days");

    while (true) {
        if (cancel_requested && cancel_requested()) {
            INFO("Task " << task.id << " cancelled after " << stream.emitted() << " snapshots");
            return RunOutcome::cancelled_run();
        }

        auto next = stream.next();
        if (next.is_error()) {
            return forward_error<RunOutcome>(next);
        }
        const std::optional<DataSnapshot>& snapshot = next.value();
        if (!snapshot) {
            break;
        }

        TradingSignal signal = generator.generate(*snapshot, combination, generator.thresholds(),
                                                  task.stock_code, snapshot->timestamp);
        signal = generator.apply_filters(signal);
        signal.position_size = generator.calculate_position_size(signal, sizing_);

        auto step = simulator.step(signal, snapshot->price);
        if (step.is_error()) {
            return forward_error<RunOutcome>(step);
        }

        if (on_progress && total_dates > 0) {
            on_progress(100.0 * static_cast<double>(total_dates - stream.remaining()) /
                        static_cast<double>(total_dates));
        }
    }

    if (stream.emitted() == 0) {
        return make_error<RunOutcome>(ErrorCode::DATA_NOT_FOUND,
                                      "No usable snapshots for " + task.stock_code + " between " +
                                          core::format_date(task.start_date) + " and " +
                                          core::format_date(task.end_date),
                                      "BacktestRunner");
    }

    BacktestResult result;
    result.result_id = IdGenerator::generate_result_id(std::chrono::system_clock::now());
    result.task_id = task.id;
    result.batch_id = task.batch_id;
    result.stock_code = task.stock_code;
    result.start_date = task.start_date;
    result.end_date = task.end_date;
    result.mode = mode;
    result.initial_capital = task.initial_capital;
    result.factor_combination = combination;
    result.performance = simulator.finalize();
    result.nav_series = simulator.nav_series();
    result.daily_returns = simulator.daily_returns();
    result.trades = simulator.trades();
    for (const auto& [code, position] : simulator.positions()) {
        result.final_positions.push_back(position);
    }
    result.data_point_count = stream.emitted();
    result.skipped_dates = stream.skipped();
    result.execution_time_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    result.created_at = std::chrono::system_clock::now();

    INFO("Task " << task.id << " simulated " << result.data_point_count << " days, "
                 << result.trades.size() << " trades, total return "
                 << result.performance.total_return);
    return RunOutcome::completed(std::move(result));
}

}  // namespace quant_engine
