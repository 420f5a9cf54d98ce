// include/quant_engine/storage/postgres_database.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/logger.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/factor/factor_combination.hpp"
#include "quant_engine/storage/task_store.hpp"

namespace quant_engine {

/**
 * @brief PostgreSQL connection settings, the "database" section of the engine configuration
 *
 * The password is usually left empty here and supplied through the environment.
 */
struct DatabaseConfig : public ConfigBase {
    std::string host{"localhost"};
    std::string port{"5432"};
    std::string name{"quant_engine"};
    std::string username;
    std::string password;
    int connect_timeout_seconds{10};
    std::string application_name{"backtest_scheduler"};  // Shown in pg_stat_activity

    std::string version{"1.0.0"};

    /**
     * @brief libpq keyword/value connection string; empty credentials are omitted
     */
    std::string get_connection_string() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief PostgreSQL backed task store, factor combination store and market data source
 *
 * All access goes through one connection guarded by a mutex. A transaction
 * returned by begin() holds that mutex until it is committed or destroyed, so
 * the owning thread must not call other methods while it is open.
 */
class PostgresDatabase : public TaskStore, public FactorCombinationStore {
public:
    /**
     * @brief Constructor
     * @param connection_string Connection string for PostgreSQL
     */
    explicit PostgresDatabase(std::string connection_string);

    ~PostgresDatabase() override;

    // Delete copy and move operations
    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;
    PostgresDatabase(PostgresDatabase&&) = delete;
    PostgresDatabase& operator=(PostgresDatabase&&) = delete;

    /**
     * @brief Connect to the database
     * @return Result indicating success or failure
     */
    Result<void> connect();

    void disconnect();

    bool is_connected() const;

    // ========== TaskStore ==========

    Result<void> create_task(const Task& task) override;
    Result<Task> get_task_by_id(const std::string& task_id) override;
    Result<std::vector<Task>> list_pending_tasks(size_t limit) override;
    Result<std::vector<Task>> list_tasks(const TaskQuery& query) override;
    Result<std::vector<Task>> get_tasks_by_batch(const std::string& batch_id) override;
    Result<BatchSummary> get_batch_summary(const std::string& batch_id) override;

    /**
     * @brief Conditional UPDATE ... WHERE status = 'pending' so that only one
     *        scheduler instance can claim a task
     */
    Result<bool> claim_task(const std::string& task_id) override;
    Result<bool> request_cancel(const std::string& task_id) override;
    Result<bool> is_cancel_requested(const std::string& task_id) override;

    Result<void> update_task_progress(const std::string& task_id, double progress) override;
    Result<void> update_task_status(const TaskStatusUpdate& update) override;
    Result<BacktestResult> get_result(const std::string& result_id) override;
    Result<std::unique_ptr<TaskStoreTransaction>> begin() override;

    // ========== FactorCombinationStore ==========

    Result<FactorCombination> get_combination(const std::string& id) override;
    Result<void> save_combination(const FactorCombination& combination) override;

    // ========== Market data ==========

    /**
     * @brief Daily bar of a stock on one date
     * @return Arrow table with columns trade_date, stock_code, open, high, low,
     *         close, volume, amount, pct_chg; empty when the stock did not trade
     */
    Result<std::shared_ptr<arrow::Table>> get_daily_price(const std::string& stock_code,
                                                          const Timestamp& date);

    /**
     * @brief Latest value of each factor recorded on or before a date
     * @return Arrow table with columns factor_name, value, trade_date
     */
    Result<std::shared_ptr<arrow::Table>> get_factor_values(
        const std::string& stock_code, const Timestamp& date,
        const std::vector<std::string>& factor_names);

    /**
     * @brief Open trading days of an exchange, ascending
     */
    Result<std::vector<Timestamp>> get_trading_calendar(const std::string& exchange,
                                                        const Timestamp& start,
                                                        const Timestamp& end);

private:
    friend class PostgresTransaction;

    Result<void> validate_connection() const;

    // Transaction-scoped helpers; the caller owns txn and holds mutex_
    Result<Task> load_task_for_update(pqxx::work& txn, const std::string& task_id) const;
    Result<void> write_status(pqxx::work& txn, const TaskStatusUpdate& update) const;
    Result<std::string> write_result(pqxx::work& txn, const BacktestResult& result) const;

    static Result<Task> row_to_task(const pqxx::row& row);
    static Result<std::shared_ptr<arrow::Table>> convert_prices_to_arrow(
        const pqxx::result& result);
    static Result<std::shared_ptr<arrow::Table>> convert_factors_to_arrow(
        const pqxx::result& result);

    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace quant_engine
