#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include "quant_engine/core/logger.hpp"
#include "quant_engine/data/postgres_snapshot_provider.hpp"
#include "quant_engine/data/snapshot_cache.hpp"
#include "quant_engine/orchestrator/backtest_runner.hpp"
#include "quant_engine/orchestrator/engine_config.hpp"
#include "quant_engine/orchestrator/task_orchestrator.hpp"
#include "quant_engine/storage/postgres_database.hpp"

using namespace quant_engine;

namespace {

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
    g_shutdown.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> [--once]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path;
    bool run_once = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--once") == 0) {
            run_once = true;
        } else if (config_path.empty()) {
            config_path = argv[i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        EngineConfig config;
        auto loaded = config.load_from_file(config_path);
        if (loaded.is_error()) {
            std::cerr << "Failed to load configuration: " << loaded.error()->to_string()
                      << std::endl;
            return 1;
        }

        // Keep the password out of the config file when the environment provides it
        if (const char* password = std::getenv("QUANT_ENGINE_DB_PASSWORD")) {
            config.database.password = password;
        }

        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid configuration: " << valid.error()->to_string() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("BacktestScheduler");
        INFO("Starting backtest scheduler with " << config_path);

        auto db = std::make_shared<PostgresDatabase>(config.database.get_connection_string());
        auto connected = db->connect();
        if (connected.is_error()) {
            ERROR("Database connection failed: " << connected.error()->what());
            return 1;
        }

        // Separate connection for market data reads so they never wait on task writes
        auto market_db =
            std::make_shared<PostgresDatabase>(config.database.get_connection_string());
        connected = market_db->connect();
        if (connected.is_error()) {
            ERROR("Market data connection failed: " << connected.error()->what());
            return 1;
        }

        auto provider = std::make_shared<PostgresSnapshotProvider>(market_db);
        std::shared_ptr<SnapshotCache> cache;
        if (config.replay.use_cache) {
            cache = std::make_shared<InMemorySnapshotCache>();
        }
        auto runner = std::make_shared<BacktestRunner>(provider, cache, config.replay,
                                                       config.simulator, config.thresholds,
                                                       config.sizing);
        TaskOrchestrator orchestrator(db, db, runner, config.orchestrator);

        if (run_once) {
            auto summary = orchestrator.poll_and_dispatch();
            if (summary.is_error()) {
                ERROR("Poll cycle failed: " << summary.error()->to_string());
                return 1;
            }
            std::cout << summary.value().to_json().dump(2) << std::endl;
            return 0;
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto started = orchestrator.start();
        if (started.is_error()) {
            ERROR("Failed to start orchestrator: " << started.error()->what());
            return 1;
        }

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        INFO("Shutdown requested, stopping orchestrator");
        orchestrator.stop();
        INFO("Scheduler status: " << orchestrator.status().to_json().dump());
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
