// src/storage/postgres_database.cpp

#include "quant_engine/storage/postgres_database.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include "quant_engine/core/id_generator.hpp"
#include "quant_engine/core/time_utils.hpp"
#include "quant_engine/task/task_state_machine.hpp"

namespace {

const char* const TASK_COLUMNS =
    "id, batch_id, name, description, stock_code, "
    "to_char(start_date, 'YYYY-MM-DD') AS start_date, "
    "to_char(end_date, 'YYYY-MM-DD') AS end_date, "
    "initial_capital, factor_combination_id, config::text AS config, status, progress, "
    "error_message, result_id, cancel_requested, "
    "to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at, "
    "to_char(updated_at, 'YYYY-MM-DD HH24:MI:SS') AS updated_at, "
    "to_char(started_at, 'YYYY-MM-DD HH24:MI:SS') AS started_at, "
    "to_char(completed_at, 'YYYY-MM-DD HH24:MI:SS') AS completed_at";

// Parse "YYYY-MM-DD HH:MM:SS" written by format_timestamp (UTC)
bool parse_db_timestamp(const std::string& text, quant_engine::Timestamp& out) {
    std::tm time_info{};
    std::istringstream ss(text);
    ss >> std::get_time(&time_info, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(quant_engine::core::safe_timegm(&time_info));
    return true;
}

std::optional<std::string> optional_column(const pqxx::row& row, const char* column) {
    if (row[column].is_null()) {
        return std::nullopt;
    }
    return row[column].as<std::string>();
}

std::optional<std::string> optional_timestamp(const std::optional<quant_engine::Timestamp>& ts) {
    if (!ts) {
        return std::nullopt;
    }
    return quant_engine::core::format_timestamp(*ts);
}

}  // namespace

namespace quant_engine {

// ========== DatabaseConfig ==========

std::string DatabaseConfig::get_connection_string() const {
    std::ostringstream ss;
    ss << "host=" << host << " port=" << port << " dbname=" << name;
    if (!username.empty()) {
        ss << " user=" << username;
    }
    if (!password.empty()) {
        ss << " password=" << password;
    }
    ss << " connect_timeout=" << connect_timeout_seconds;
    if (!application_name.empty()) {
        ss << " application_name=" << application_name;
    }
    return ss.str();
}

nlohmann::json DatabaseConfig::to_json() const {
    nlohmann::json j;
    j["host"] = host;
    j["port"] = port;
    j["name"] = name;
    j["username"] = username;
    j["password"] = password;
    j["connect_timeout_seconds"] = connect_timeout_seconds;
    j["application_name"] = application_name;
    j["version"] = version;
    return j;
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    if (j.contains("host"))
        host = j.at("host").get<std::string>();
    if (j.contains("port"))
        port = j.at("port").get<std::string>();
    if (j.contains("name"))
        name = j.at("name").get<std::string>();
    if (j.contains("username"))
        username = j.at("username").get<std::string>();
    if (j.contains("password"))
        password = j.at("password").get<std::string>();
    if (j.contains("connect_timeout_seconds"))
        connect_timeout_seconds = j.at("connect_timeout_seconds").get<int>();
    if (j.contains("application_name"))
        application_name = j.at("application_name").get<std::string>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> DatabaseConfig::validate() const {
    if (host.empty() || name.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Database host and name are required", "DatabaseConfig");
    }
    if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Database port must be numeric, got '" + port + "'",
                                "DatabaseConfig");
    }
    if (connect_timeout_seconds <= 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "connect_timeout_seconds must be positive", "DatabaseConfig");
    }
    return Result<void>();
}

/**
 * @brief pqxx::work wrapper; aborts on destruction unless committed
 */
class PostgresTransaction : public TaskStoreTransaction {
public:
    PostgresTransaction(PostgresDatabase& db, std::unique_lock<std::mutex> lock)
        : db_(db), lock_(std::move(lock)), txn_(*db.connection_) {}

    Result<std::string> save_result(const BacktestResult& result) override {
        if (committed_) {
            return make_error<std::string>(ErrorCode::DATABASE_ERROR,
                                           "Transaction already committed", "PostgresDatabase");
        }
        return db_.write_result(txn_, result);
    }

    Result<void> update_task_status(const TaskStatusUpdate& update) override {
        if (committed_) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "Transaction already committed",
                                    "PostgresDatabase");
        }
        return db_.write_status(txn_, update);
    }

    Result<void> commit() override {
        if (committed_) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "Transaction already committed",
                                    "PostgresDatabase");
        }
        try {
            txn_.commit();
            committed_ = true;
            return Result<void>();
        } catch (const std::exception& e) {
            return make_error<void>(ErrorCode::DATABASE_ERROR,
                                    "Failed to commit transaction: " + std::string(e.what()),
                                    "PostgresDatabase");
        }
    }

private:
    PostgresDatabase& db_;
    std::unique_lock<std::mutex> lock_;
    pqxx::work txn_;
    bool committed_{false};
};

PostgresDatabase::PostgresDatabase(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {
    Logger::register_component("PostgresDatabase");
}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDatabase");
        }
        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresDatabase::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresDatabase");
    }
    return Result<void>();
}

// ========== Tasks ==========

Result<Task> PostgresDatabase::row_to_task(const pqxx::row& row) {
    Task task;
    task.id = row["id"].as<std::string>();
    task.batch_id = row["batch_id"].is_null() ? "" : row["batch_id"].as<std::string>();
    task.name = row["name"].as<std::string>();
    task.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
    task.stock_code = row["stock_code"].as<std::string>();
    task.initial_capital = row["initial_capital"].as<double>();
    task.factor_combination_id = row["factor_combination_id"].is_null()
                                     ? ""
                                     : row["factor_combination_id"].as<std::string>();
    task.progress = row["progress"].as<double>();
    task.error_message = optional_column(row, "error_message");
    task.result_id = optional_column(row, "result_id");
    task.cancel_requested = row["cancel_requested"].as<bool>();

    auto start = core::parse_date(row["start_date"].as<std::string>());
    if (start.is_error()) {
        return forward_error<Task>(start);
    }
    task.start_date = start.value();
    auto end = core::parse_date(row["end_date"].as<std::string>());
    if (end.is_error()) {
        return forward_error<Task>(end);
    }
    task.end_date = end.value();

    auto status = task_status_from_string(row["status"].as<std::string>());
    if (status.is_error()) {
        return forward_error<Task>(status);
    }
    task.status = status.value();

    auto config = TaskConfig::parse(nlohmann::json::parse(row["config"].as<std::string>()));
    if (config.is_error()) {
        return forward_error<Task>(config);
    }
    task.config = config.value();

    if (!parse_db_timestamp(row["created_at"].as<std::string>(), task.created_at) ||
        !parse_db_timestamp(row["updated_at"].as<std::string>(), task.updated_at)) {
        return make_error<Task>(ErrorCode::CONVERSION_ERROR,
                                "Invalid timestamp on task " + task.id, "PostgresDatabase");
    }
    for (const char* column : {"started_at", "completed_at"}) {
        auto text = optional_column(row, column);
        if (!text) {
            continue;
        }
        Timestamp ts;
        if (!parse_db_timestamp(*text, ts)) {
            return make_error<Task>(ErrorCode::CONVERSION_ERROR,
                                    "Invalid timestamp on task " + task.id, "PostgresDatabase");
        }
        if (std::string(column) == "started_at") {
            task.started_at = ts;
        } else {
            task.completed_at = ts;
        }
    }
    return task;
}

Result<void> PostgresDatabase::create_task(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        std::string query =
            "INSERT INTO backtest_tasks (id, batch_id, name, description, stock_code, "
            "start_date, end_date, initial_capital, factor_combination_id, config, status, "
            "progress, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6::date, $7::date, $8, $9, $10::jsonb, $11, $12, "
            "$13::timestamp, $14::timestamp)";
        std::optional<std::string> batch_id;
        if (!task.batch_id.empty()) {
            batch_id = task.batch_id;
        }
        txn.exec_params(query, task.id, batch_id, task.name, task.description, task.stock_code,
                        core::format_date(task.start_date), core::format_date(task.end_date),
                        task.initial_capital, task.factor_combination_id,
                        task.config.to_json().dump(), task_status_to_string(task.status),
                        task.progress, core::format_timestamp(task.created_at),
                        core::format_timestamp(task.updated_at));
        txn.commit();
        DEBUG("Stored task " << task.id);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to create task: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<Task> PostgresDatabase::get_task_by_id(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<Task>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            std::string("SELECT ") + TASK_COLUMNS + " FROM backtest_tasks WHERE id = $1",
            task_id);
        txn.commit();
        if (result.empty()) {
            return make_error<Task>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                    "PostgresDatabase");
        }
        return row_to_task(result[0]);

    } catch (const std::exception& e) {
        return make_error<Task>(ErrorCode::DATABASE_ERROR,
                                "Failed to load task: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<std::vector<Task>> PostgresDatabase::list_pending_tasks(size_t limit) {
    TaskQuery query;
    query.status = TaskStatus::PENDING;
    query.limit = limit;
    return list_tasks(query);
}

Result<std::vector<Task>> PostgresDatabase::list_tasks(const TaskQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<Task>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        std::string sql = std::string("SELECT ") + TASK_COLUMNS +
                          " FROM backtest_tasks"
                          " WHERE ($1::text IS NULL OR status = $1)"
                          " AND ($2::text IS NULL OR batch_id = $2)"
                          " ORDER BY created_at ASC, seq ASC"
                          " OFFSET $3 LIMIT $4::bigint";

        std::optional<std::string> status;
        if (query.status) {
            status = task_status_to_string(*query.status);
        }
        // A NULL limit returns every row
        std::optional<long long> limit;
        if (query.limit < static_cast<size_t>(std::numeric_limits<long long>::max())) {
            limit = static_cast<long long>(query.limit);
        }
        auto result = txn.exec_params(sql, status, query.batch_id,
                                      static_cast<long long>(query.offset), limit);
        txn.commit();

        std::vector<Task> tasks;
        tasks.reserve(result.size());
        for (const auto& row : result) {
            auto task = row_to_task(row);
            if (task.is_error()) {
                return forward_error<std::vector<Task>>(task);
            }
            tasks.push_back(task.take_value());
        }
        return tasks;

    } catch (const std::exception& e) {
        return make_error<std::vector<Task>>(ErrorCode::DATABASE_ERROR,
                                             "Failed to list tasks: " + std::string(e.what()),
                                             "PostgresDatabase");
    }
}

Result<std::vector<Task>> PostgresDatabase::get_tasks_by_batch(const std::string& batch_id) {
    TaskQuery query;
    query.batch_id = batch_id;
    query.limit = std::numeric_limits<size_t>::max();
    return list_tasks(query);
}

Result<BatchSummary> PostgresDatabase::get_batch_summary(const std::string& batch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<BatchSummary>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT status, COUNT(*) AS n FROM backtest_tasks WHERE batch_id = $1 "
            "GROUP BY status",
            batch_id);
        txn.commit();

        if (result.empty()) {
            return make_error<BatchSummary>(ErrorCode::TASK_NOT_FOUND,
                                            "Batch not found: " + batch_id, "PostgresDatabase");
        }

        BatchSummary summary;
        summary.batch_id = batch_id;
        for (const auto& row : result) {
            auto status = task_status_from_string(row["status"].as<std::string>());
            if (status.is_error()) {
                return forward_error<BatchSummary>(status);
            }
            const int n = row["n"].as<int>();
            for (int i = 0; i < n; ++i) {
                summary.count(status.value());
            }
        }
        return summary;

    } catch (const std::exception& e) {
        return make_error<BatchSummary>(ErrorCode::DATABASE_ERROR,
                                        "Failed to summarize batch: " + std::string(e.what()),
                                        "PostgresDatabase");
    }
}

Result<bool> PostgresDatabase::claim_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<bool>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        const std::string now = core::format_timestamp(std::chrono::system_clock::now());
        auto claimed = txn.exec_params(
            "UPDATE backtest_tasks SET status = 'running', progress = 0, error_message = NULL, "
            "cancel_requested = FALSE, started_at = $2::timestamp, updated_at = $2::timestamp "
            "WHERE id = $1 AND status = 'pending' RETURNING id",
            task_id, now);

        if (claimed.empty()) {
            auto exists = txn.exec_params("SELECT 1 FROM backtest_tasks WHERE id = $1", task_id);
            txn.commit();
            if (exists.empty()) {
                return make_error<bool>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                        "PostgresDatabase");
            }
            return false;
        }

        txn.commit();
        return true;

    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to claim task: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<bool> PostgresDatabase::request_cancel(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<bool>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto flagged = txn.exec_params(
            "UPDATE backtest_tasks SET cancel_requested = TRUE, updated_at = $2::timestamp "
            "WHERE id = $1 AND status = 'running' RETURNING id",
            task_id, core::format_timestamp(std::chrono::system_clock::now()));

        if (flagged.empty()) {
            auto exists = txn.exec_params("SELECT 1 FROM backtest_tasks WHERE id = $1", task_id);
            txn.commit();
            if (exists.empty()) {
                return make_error<bool>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                        "PostgresDatabase");
            }
            return false;
        }

        txn.commit();
        return true;

    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to request cancellation: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<bool> PostgresDatabase::is_cancel_requested(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<bool>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT cancel_requested FROM backtest_tasks WHERE id = $1", task_id);
        txn.commit();
        if (result.empty()) {
            return make_error<bool>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                    "PostgresDatabase");
        }
        return result[0]["cancel_requested"].as<bool>();

    } catch (const std::exception& e) {
        return make_error<bool>(ErrorCode::DATABASE_ERROR,
                                "Failed to read cancellation flag: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::update_task_progress(const std::string& task_id,
                                                    double progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "UPDATE backtest_tasks SET progress = LEAST(GREATEST($2, 0), 100), "
            "updated_at = $3::timestamp WHERE id = $1",
            task_id, progress, core::format_timestamp(std::chrono::system_clock::now()));
        txn.commit();

        if (result.affected_rows() == 0) {
            return make_error<void>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                    "PostgresDatabase");
        }
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to update progress: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::update_task_status(const TaskStatusUpdate& update) {
    auto txn = begin();
    if (txn.is_error()) {
        return forward_error<void>(txn);
    }
    auto staged = txn.value()->update_task_status(update);
    if (staged.is_error()) {
        return staged;
    }
    return txn.value()->commit();
}

Result<Task> PostgresDatabase::load_task_for_update(pqxx::work& txn,
                                                    const std::string& task_id) const {
    auto result = txn.exec_params(
        std::string("SELECT ") + TASK_COLUMNS + " FROM backtest_tasks WHERE id = $1 FOR UPDATE",
        task_id);
    if (result.empty()) {
        return make_error<Task>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                "PostgresDatabase");
    }
    return row_to_task(result[0]);
}

Result<void> PostgresDatabase::write_status(pqxx::work& txn,
                                            const TaskStatusUpdate& update) const {
    try {
        auto loaded = load_task_for_update(txn, update.task_id);
        if (loaded.is_error()) {
            return forward_error<void>(loaded);
        }

        Task task = loaded.take_value();
        auto applied = TaskStateMachine::apply(task, update.status, update.error_message,
                                               std::chrono::system_clock::now());
        if (applied.is_error()) {
            return applied;
        }
        if (update.result_id) {
            task.result_id = update.result_id;
        }
        if (update.progress) {
            task.progress = std::clamp(*update.progress, 0.0, 100.0);
        }

        txn.exec_params(
            "UPDATE backtest_tasks SET status = $2, progress = $3, error_message = $4, "
            "result_id = $5, updated_at = $6::timestamp, started_at = $7::timestamp, "
            "completed_at = $8::timestamp, cancel_requested = $9 WHERE id = $1",
            task.id, task_status_to_string(task.status), task.progress, task.error_message,
            task.result_id, core::format_timestamp(task.updated_at),
            optional_timestamp(task.started_at), optional_timestamp(task.completed_at),
            task.cancel_requested);
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to update task status: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

// ========== Results ==========

Result<std::string> PostgresDatabase::write_result(pqxx::work& txn,
                                                   const BacktestResult& result) const {
    try {
        BacktestResult stored = result;
        if (stored.result_id.empty()) {
            stored.result_id = IdGenerator::generate_result_id(std::chrono::system_clock::now());
        }
        const nlohmann::json payload = stored.to_json();
        const PerformanceReport& perf = stored.performance;

        std::string query =
            "INSERT INTO backtest_results (id, task_id, batch_id, stock_code, start_date, "
            "end_date, backtest_mode, initial_capital, final_value, total_return, "
            "annual_return, sharpe_ratio, sortino_ratio, calmar_ratio, max_drawdown, "
            "volatility, var_95, var_99, win_rate, trade_count, data_point_count, "
            "execution_time, factor_config, payload, created_at) "
            "VALUES ($1, $2, $3, $4, $5::date, $6::date, $7, $8, $9, $10, $11, $12, $13, $14, "
            "$15, $16, $17, $18, $19, $20, $21, $22, $23::jsonb, $24::jsonb, $25::timestamp)";

        std::optional<std::string> batch_id;
        if (!stored.batch_id.empty()) {
            batch_id = stored.batch_id;
        }
        txn.exec_params(query, stored.result_id, stored.task_id, batch_id, stored.stock_code,
                        core::format_date(stored.start_date), core::format_date(stored.end_date),
                        backtest_mode_to_string(stored.mode), stored.initial_capital,
                        perf.final_value, perf.total_return, perf.annual_return,
                        perf.sharpe_ratio, perf.sortino_ratio, perf.calmar_ratio,
                        perf.max_drawdown, perf.volatility, perf.var_95, perf.var_99,
                        perf.win_rate, perf.trade_count,
                        static_cast<long long>(stored.data_point_count),
                        stored.execution_time_seconds,
                        stored.factor_combination.to_json().dump(), payload.dump(),
                        core::format_timestamp(std::chrono::system_clock::now()));

        return stored.result_id;

    } catch (const std::exception& e) {
        return make_error<std::string>(ErrorCode::DATABASE_ERROR,
                                       "Failed to store result: " + std::string(e.what()),
                                       "PostgresDatabase");
    }
}

Result<BacktestResult> PostgresDatabase::get_result(const std::string& result_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<BacktestResult>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT payload::text AS payload FROM backtest_results WHERE id = $1", result_id);
        txn.commit();
        if (result.empty()) {
            return make_error<BacktestResult>(ErrorCode::DATA_NOT_FOUND,
                                              "Result not found: " + result_id,
                                              "PostgresDatabase");
        }
        return BacktestResult::from_json(
            nlohmann::json::parse(result[0]["payload"].as<std::string>()));

    } catch (const std::exception& e) {
        return make_error<BacktestResult>(ErrorCode::DATABASE_ERROR,
                                          "Failed to load result: " + std::string(e.what()),
                                          "PostgresDatabase");
    }
}

Result<std::unique_ptr<TaskStoreTransaction>> PostgresDatabase::begin() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::unique_ptr<TaskStoreTransaction>>(validation);
    }

    try {
        return std::unique_ptr<TaskStoreTransaction>(
            std::make_unique<PostgresTransaction>(*this, std::move(lock)));
    } catch (const std::exception& e) {
        return make_error<std::unique_ptr<TaskStoreTransaction>>(
            ErrorCode::DATABASE_ERROR, "Failed to begin transaction: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

// ========== Factor combinations ==========

Result<FactorCombination> PostgresDatabase::get_combination(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<FactorCombination>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT id, name, description, factors::text AS factors "
            "FROM factor_combinations WHERE id = $1",
            id);
        txn.commit();
        if (result.empty()) {
            return make_error<FactorCombination>(ErrorCode::DATA_NOT_FOUND,
                                                 "Factor combination not found: " + id,
                                                 "PostgresDatabase");
        }

        const auto& row = result[0];
        nlohmann::json j;
        j["id"] = row["id"].as<std::string>();
        j["name"] = row["name"].as<std::string>();
        j["description"] =
            row["description"].is_null() ? "" : row["description"].as<std::string>();
        j["factors"] = nlohmann::json::parse(row["factors"].as<std::string>());
        return FactorCombination::from_json(j);

    } catch (const std::exception& e) {
        return make_error<FactorCombination>(
            ErrorCode::DATABASE_ERROR,
            "Failed to load factor combination: " + std::string(e.what()), "PostgresDatabase");
    }
}

Result<void> PostgresDatabase::save_combination(const FactorCombination& combination) {
    auto report = combination.validate();
    if (!report.is_valid()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, report.errors.front(),
                                "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        const nlohmann::json j = combination.to_json();
        const std::string now = core::format_timestamp(std::chrono::system_clock::now());
        txn.exec_params(
            "INSERT INTO factor_combinations (id, name, description, factors, total_weight, "
            "created_at, updated_at) VALUES ($1, $2, $3, $4::jsonb, $5, $6::timestamp, "
            "$6::timestamp) "
            "ON CONFLICT (id) DO UPDATE SET name = EXCLUDED.name, "
            "description = EXCLUDED.description, factors = EXCLUDED.factors, "
            "total_weight = EXCLUDED.total_weight, updated_at = EXCLUDED.updated_at",
            combination.id(), combination.name(), combination.description(),
            j.at("factors").dump(), combination.total_weight(), now);
        txn.commit();
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to save factor combination: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

// ========== Market data ==========

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_daily_price(
    const std::string& stock_code, const Timestamp& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT to_char(trade_date, 'YYYY-MM-DD') AS trade_date, stock_code, open, high, "
            "low, close, volume, amount, pct_chg FROM stock_daily "
            "WHERE stock_code = $1 AND trade_date = $2::date",
            stock_code, core::format_date(date));
        txn.commit();
        return convert_prices_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Failed to query prices: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::get_factor_values(
    const std::string& stock_code, const Timestamp& date,
    const std::vector<std::string>& factor_names) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        // Latest observation per factor, never later than the requested date
        auto result = txn.exec_params(
            "SELECT DISTINCT ON (factor_name) factor_name, value, "
            "to_char(trade_date, 'YYYY-MM-DD') AS trade_date FROM factor_values "
            "WHERE stock_code = $1 AND trade_date <= $2::date AND factor_name = ANY($3) "
            "ORDER BY factor_name, trade_date DESC",
            stock_code, core::format_date(date), factor_names);
        txn.commit();
        return convert_factors_to_arrow(result);

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::DATABASE_ERROR, "Failed to query factor values: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::vector<Timestamp>> PostgresDatabase::get_trading_calendar(const std::string& exchange,
                                                                      const Timestamp& start,
                                                                      const Timestamp& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<Timestamp>>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT to_char(cal_date, 'YYYY-MM-DD') AS cal_date FROM trade_calendar "
            "WHERE exchange = $1 AND is_open = TRUE AND cal_date BETWEEN $2::date AND $3::date "
            "ORDER BY cal_date ASC",
            exchange, core::format_date(start), core::format_date(end));
        txn.commit();

        std::vector<Timestamp> dates;
        dates.reserve(result.size());
        for (const auto& row : result) {
            auto date = core::parse_date(row["cal_date"].as<std::string>());
            if (date.is_error()) {
                return forward_error<std::vector<Timestamp>>(date);
            }
            dates.push_back(date.value());
        }
        return dates;

    } catch (const std::exception& e) {
        return make_error<std::vector<Timestamp>>(
            ErrorCode::DATABASE_ERROR, "Failed to query trading calendar: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_prices_to_arrow(
    const pqxx::result& result) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::TimestampBuilder date_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::StringBuilder code_builder(pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::DoubleBuilder volume_builder(pool);
    arrow::DoubleBuilder amount_builder(pool);
    arrow::DoubleBuilder pct_chg_builder(pool);

    try {
        for (const auto& row : result) {
            auto date = core::parse_date(row["trade_date"].as<std::string>());
            if (date.is_error()) {
                return forward_error<std::shared_ptr<arrow::Table>>(date);
            }
            const int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                        date.value().time_since_epoch())
                                        .count();

            if (!date_builder.Append(seconds).ok() ||
                !code_builder.Append(row["stock_code"].as<std::string>()).ok() ||
                !open_builder.Append(row["open"].as<double>()).ok() ||
                !high_builder.Append(row["high"].as<double>()).ok() ||
                !low_builder.Append(row["low"].as<double>()).ok() ||
                !close_builder.Append(row["close"].as<double>()).ok() ||
                !volume_builder.Append(row["volume"].as<double>(0.0)).ok() ||
                !amount_builder.Append(row["amount"].as<double>(0.0)).ok() ||
                !pct_chg_builder.Append(row["pct_chg"].as<double>(0.0)).ok()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, "Failed to append price row",
                    "PostgresDatabase");
            }
        }

        std::shared_ptr<arrow::Array> date_array, code_array, open_array, high_array, low_array,
            close_array, volume_array, amount_array, pct_chg_array;
        if (!date_builder.Finish(&date_array).ok() || !code_builder.Finish(&code_array).ok() ||
            !open_builder.Finish(&open_array).ok() || !high_builder.Finish(&high_array).ok() ||
            !low_builder.Finish(&low_array).ok() || !close_builder.Finish(&close_array).ok() ||
            !volume_builder.Finish(&volume_array).ok() ||
            !amount_builder.Finish(&amount_array).ok() ||
            !pct_chg_builder.Finish(&pct_chg_array).ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Failed to finish price arrays", "PostgresDatabase");
        }

        auto schema = arrow::schema({
            arrow::field("trade_date", arrow::timestamp(arrow::TimeUnit::SECOND)),
            arrow::field("stock_code", arrow::utf8()),
            arrow::field("open", arrow::float64()),
            arrow::field("high", arrow::float64()),
            arrow::field("low", arrow::float64()),
            arrow::field("close", arrow::float64()),
            arrow::field("volume", arrow::float64()),
            arrow::field("amount", arrow::float64()),
            arrow::field("pct_chg", arrow::float64()),
        });

        return arrow::Table::Make(schema, {date_array, code_array, open_array, high_array,
                                           low_array, close_array, volume_array, amount_array,
                                           pct_chg_array});

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Error converting prices: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::convert_factors_to_arrow(
    const pqxx::result& result) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::StringBuilder name_builder(pool);
    arrow::DoubleBuilder value_builder(pool);
    arrow::TimestampBuilder date_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);

    try {
        for (const auto& row : result) {
            auto date = core::parse_date(row["trade_date"].as<std::string>());
            if (date.is_error()) {
                return forward_error<std::shared_ptr<arrow::Table>>(date);
            }
            const int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                        date.value().time_since_epoch())
                                        .count();

            arrow::Status status = name_builder.Append(row["factor_name"].as<std::string>());
            if (status.ok()) {
                status = row["value"].is_null() ? value_builder.AppendNull()
                                                : value_builder.Append(row["value"].as<double>());
            }
            if (status.ok()) {
                status = date_builder.Append(seconds);
            }
            if (!status.ok()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR, "Failed to append factor row: " + status.ToString(),
                    "PostgresDatabase");
            }
        }

        std::shared_ptr<arrow::Array> name_array, value_array, date_array;
        if (!name_builder.Finish(&name_array).ok() || !value_builder.Finish(&value_array).ok() ||
            !date_builder.Finish(&date_array).ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Failed to finish factor arrays",
                "PostgresDatabase");
        }

        auto schema = arrow::schema({
            arrow::field("factor_name", arrow::utf8()),
            arrow::field("value", arrow::float64()),
            arrow::field("trade_date", arrow::timestamp(arrow::TimeUnit::SECOND)),
        });
        return arrow::Table::Make(schema, {name_array, value_array, date_array});

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Error converting factor values: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

}  // namespace quant_engine
