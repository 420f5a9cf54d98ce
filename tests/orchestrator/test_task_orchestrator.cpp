#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "../test_utils.hpp"
#include "quant_engine/orchestrator/task_orchestrator.hpp"
#include "quant_engine/storage/in_memory_task_store.hpp"

using namespace quant_engine;
using namespace quant_engine::testing;

namespace {

std::vector<Timestamp> first_week() {
    return {date(2024, 1, 2), date(2024, 1, 3), date(2024, 1, 4), date(2024, 1, 5)};
}

// Runs a hook before every price lookup
class HookedProvider : public FakeSnapshotProvider {
public:
    std::function<void(const std::string&)> before_price;

    Result<PriceData> get_price_on_date(const std::string& stock_code,
                                        const Timestamp& day) override {
        if (before_price) {
            before_price(stock_code);
        }
        return FakeSnapshotProvider::get_price_on_date(stock_code, day);
    }
};

// Store whose claims always lose the race
class ContendedTaskStore : public InMemoryTaskStore {
public:
    Result<bool> claim_task(const std::string&) override {
        return false;
    }
};

// Store whose next status writes fail with a storage error
class FlakyStatusStore : public InMemoryTaskStore {
public:
    std::atomic<int> failing_status_writes{0};

    Result<void> update_task_status(const TaskStatusUpdate& update) override {
        if (failing_status_writes.load() > 0) {
            --failing_status_writes;
            return make_error<void>(ErrorCode::DATABASE_ERROR, "connection reset",
                                    "FlakyStatusStore");
        }
        return InMemoryTaskStore::update_task_status(update);
    }
};

// Store where the task finishes just before a cancellation request lands
class FinishingTaskStore : public InMemoryTaskStore {
public:
    Result<bool> request_cancel(const std::string& task_id) override {
        TaskStatusUpdate done;
        done.task_id = task_id;
        done.status = TaskStatus::COMPLETED;
        auto written = InMemoryTaskStore::update_task_status(done);
        if (written.is_error()) {
            return forward_error<bool>(written);
        }
        return InMemoryTaskStore::request_cancel(task_id);
    }
};

// Reads the cancel flag before every snapshot and retries status writes without delay
OrchestratorConfig fast_config() {
    OrchestratorConfig config;
    config.cancel_check_interval_ms = 0;
    config.status_retry_delay_ms = 0;
    return config;
}

TaskRequest scenario_request(const std::string& stock_code = "000001.SZ") {
    TaskRequest request;
    request.name = "scenario " + stock_code;
    request.stock_code = stock_code;
    request.start_date = "2024-01-01";
    request.end_date = "2024-01-05";
    request.initial_capital = 1000000.0;
    return request;
}

}  // namespace

class TaskOrchestratorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        provider = std::make_shared<HookedProvider>();
        provider->set_calendar(first_week());
        for (const auto& code : {"000001.SZ", "000002.SZ", "600000.SH"}) {
            provider->add_series(code, first_week(), 10.0, 0.1, "ma_signal", 2.0);
        }
        store = std::make_shared<InMemoryTaskStore>();
        combinations = std::make_shared<InMemoryFactorCombinationStore>();
        build(store);
    }

    void TearDown() override {
        orchestrator.reset();
        TestBase::TearDown();
    }

    void build(std::shared_ptr<TaskStore> task_store,
               OrchestratorConfig config = fast_config()) {
        orchestrator = make_orchestrator(std::move(task_store), config);
    }

    std::unique_ptr<TaskOrchestrator> make_orchestrator(
        std::shared_ptr<TaskStore> task_store, OrchestratorConfig config = fast_config()) {
        auto runner = std::make_shared<BacktestRunner>(
            provider, std::make_shared<InMemorySnapshotCache>());
        return std::make_unique<TaskOrchestrator>(std::move(task_store), combinations, runner,
                                                  config);
    }

    Task submit_ok(const TaskRequest& request) {
        auto submitted = orchestrator->submit(request);
        EXPECT_TRUE(submitted.is_ok()) << submitted.error()->to_string();
        return submitted.take_value();
    }

    Task fetch(const std::string& id) {
        auto task = orchestrator->get_task(id);
        EXPECT_TRUE(task.is_ok());
        return task.take_value();
    }

    size_t stored_tasks() {
        auto tasks = orchestrator->list_tasks(TaskQuery{});
        EXPECT_TRUE(tasks.is_ok());
        return tasks.value().size();
    }

    std::shared_ptr<HookedProvider> provider;
    std::shared_ptr<InMemoryTaskStore> store;
    std::shared_ptr<InMemoryFactorCombinationStore> combinations;
    std::unique_ptr<TaskOrchestrator> orchestrator;
};

TEST_F(TaskOrchestratorTest, RequiresStoreAndRunner) {
    auto runner =
        std::make_shared<BacktestRunner>(provider, std::make_shared<InMemorySnapshotCache>());
    EXPECT_THROW(std::make_unique<TaskOrchestrator>(nullptr, combinations, runner),
                 std::invalid_argument);
    EXPECT_THROW(std::make_unique<TaskOrchestrator>(store, combinations, nullptr),
                 std::invalid_argument);
}

// ========== Submission ==========

TEST_F(TaskOrchestratorTest, SubmitStoresPendingTask) {
    Task task = submit_ok(scenario_request());

    EXPECT_EQ(task.status, TaskStatus::PENDING);
    EXPECT_DOUBLE_EQ(task.progress, 0.0);
    EXPECT_EQ(task.id.rfind("bt_", 0), 0u);
    EXPECT_EQ(task.batch_id.rfind("batch_", 0), 0u);
    EXPECT_EQ(task.start_date, date(2024, 1, 1));
    EXPECT_EQ(task.end_date, date(2024, 1, 5));

    Task stored = fetch(task.id);
    EXPECT_EQ(stored.name, task.name);
    EXPECT_EQ(stored.status, TaskStatus::PENDING);
}

TEST_F(TaskOrchestratorTest, SubmitKeepsGivenBatchId) {
    TaskRequest request = scenario_request();
    request.batch_id = "batch_manual";
    EXPECT_EQ(submit_ok(request).batch_id, "batch_manual");
}

TEST_F(TaskOrchestratorTest, SubmitRejectsInvalidRequests) {
    std::vector<TaskRequest> invalid;

    TaskRequest unnamed = scenario_request();
    unnamed.name.clear();
    invalid.push_back(unnamed);

    for (const auto& code : {"000001", "00001.SZ", "000001.HK", "000001.sz", "A00001.SH"}) {
        TaskRequest request = scenario_request();
        request.stock_code = code;
        invalid.push_back(request);
    }

    TaskRequest same_day = scenario_request();
    same_day.end_date = same_day.start_date;
    invalid.push_back(same_day);

    TaskRequest reversed = scenario_request();
    reversed.start_date = "2024-02-01";
    invalid.push_back(reversed);

    TaskRequest future = scenario_request();
    future.end_date = "2999-01-01";
    invalid.push_back(future);

    TaskRequest malformed = scenario_request();
    malformed.start_date = "2024/01/01";
    invalid.push_back(malformed);

    TaskRequest broke = scenario_request();
    broke.initial_capital = 0.0;
    invalid.push_back(broke);

    for (const auto& request : invalid) {
        auto submitted = orchestrator->submit(request);
        EXPECT_TRUE(submitted.is_error())
            << request.stock_code << " " << request.start_date << " " << request.end_date;
    }
    EXPECT_EQ(stored_tasks(), 0u);
}

TEST_F(TaskOrchestratorTest, SubmitReportsValidationError) {
    TaskRequest request = scenario_request();
    request.stock_code = "123";
    auto submitted = orchestrator->submit(request);
    ASSERT_TRUE(submitted.is_error());
    EXPECT_EQ(submitted.error()->code(), ErrorCode::VALIDATION_ERROR);
}

TEST_F(TaskOrchestratorTest, SubmitRejectsInvalidThresholdOverride) {
    TaskRequest request = scenario_request();
    SignalThresholds thresholds;
    thresholds.buy_threshold = -0.2;
    thresholds.sell_threshold = 0.2;
    request.config.thresholds = thresholds;

    EXPECT_TRUE(orchestrator->submit(request).is_error());
    EXPECT_EQ(stored_tasks(), 0u);
}

TEST_F(TaskOrchestratorTest, BatchSharesIdAndNamesUnnamedTasks) {
    TaskRequest first = scenario_request("000001.SZ");
    first.name.clear();
    TaskRequest second = scenario_request("600000.SH");

    auto batch = orchestrator->submit_batch({first, second}, std::string("weekly"));
    ASSERT_TRUE(batch.is_ok());
    ASSERT_EQ(batch.value().size(), 2u);
    EXPECT_EQ(batch.value()[0].name, "weekly #1");
    EXPECT_EQ(batch.value()[1].name, "scenario 600000.SH");
    EXPECT_EQ(batch.value()[0].batch_id, batch.value()[1].batch_id);

    auto summary = orchestrator->get_batch_summary(batch.value()[0].batch_id);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().total, 2);
    EXPECT_EQ(summary.value().pending, 2);
    EXPECT_FALSE(summary.value().is_finished());
}

TEST_F(TaskOrchestratorTest, BatchIsAllOrNothing) {
    TaskRequest bad = scenario_request();
    bad.stock_code = "bogus";

    auto batch = orchestrator->submit_batch({scenario_request(), bad});
    ASSERT_TRUE(batch.is_error());
    EXPECT_EQ(batch.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(std::string(batch.error()->what()).rfind("Batch task 2: ", 0), 0u);
    EXPECT_EQ(stored_tasks(), 0u);
}

TEST_F(TaskOrchestratorTest, EmptyBatchIsRejected) {
    auto batch = orchestrator->submit_batch({});
    ASSERT_TRUE(batch.is_error());
    EXPECT_EQ(batch.error()->code(), ErrorCode::VALIDATION_ERROR);
}

// ========== Dispatch ==========

TEST_F(TaskOrchestratorTest, ScenarioCompletesWithRetrievableResult) {
    Task task = submit_ok(scenario_request());

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().examined, 1u);
    EXPECT_EQ(cycle.value().claimed, 1u);
    EXPECT_EQ(cycle.value().completed, 1u);
    EXPECT_EQ(cycle.value().failed, 0u);

    Task done = fetch(task.id);
    EXPECT_EQ(done.status, TaskStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(done.progress, 100.0);
    ASSERT_TRUE(done.result_id.has_value());
    EXPECT_TRUE(done.started_at.has_value());
    EXPECT_TRUE(done.completed_at.has_value());
    EXPECT_FALSE(done.error_message.has_value());

    auto result = orchestrator->get_task_result(task.id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().result_id, *done.result_id);
    EXPECT_EQ(result.value().task_id, task.id);
    EXPECT_EQ(result.value().data_point_count, 4u);
    EXPECT_EQ(result.value().nav_series.size(), 4u);
    EXPECT_EQ(store->result_count(), 1u);

    auto summary = orchestrator->get_batch_summary(task.batch_id);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().completed, 1);
    EXPECT_TRUE(summary.value().is_finished());
}

TEST_F(TaskOrchestratorTest, CompletedTaskIsNotRunAgain) {
    submit_ok(scenario_request());
    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());

    auto second = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().examined, 0u);
    EXPECT_EQ(store->result_count(), 1u);
}

TEST_F(TaskOrchestratorTest, RunsTasksInCreationOrder) {
    std::vector<std::string> seen;
    provider->before_price = [&seen](const std::string& code) {
        if (seen.empty() || seen.back() != code) {
            seen.push_back(code);
        }
    };

    submit_ok(scenario_request("600000.SH"));
    submit_ok(scenario_request("000002.SZ"));
    submit_ok(scenario_request("000001.SZ"));

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().completed, 3u);
    EXPECT_EQ(seen, (std::vector<std::string>{"600000.SH", "000002.SZ", "000001.SZ"}));
}

TEST_F(TaskOrchestratorTest, BatchLimitBoundsOneCycle) {
    OrchestratorConfig config = fast_config();
    config.batch_limit = 1;
    build(store, config);

    Task first = submit_ok(scenario_request("000001.SZ"));
    Task second = submit_ok(scenario_request("000002.SZ"));

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().examined, 1u);
    EXPECT_EQ(fetch(first.id).status, TaskStatus::COMPLETED);
    EXPECT_EQ(fetch(second.id).status, TaskStatus::PENDING);

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    EXPECT_EQ(fetch(second.id).status, TaskStatus::COMPLETED);
}

TEST_F(TaskOrchestratorTest, TaskClaimedElsewhereIsSkipped) {
    auto contended = std::make_shared<ContendedTaskStore>();
    build(contended);
    Task task = submit_ok(scenario_request());

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().examined, 1u);
    EXPECT_EQ(cycle.value().claimed, 0u);
    EXPECT_EQ(cycle.value().skipped, 1u);
    EXPECT_EQ(provider->price_calls(), 0u);
    EXPECT_EQ(fetch(task.id).status, TaskStatus::PENDING);
}

TEST_F(TaskOrchestratorTest, MissingDataFailsTask) {
    TaskRequest request = scenario_request("600519.SH");
    Task task = submit_ok(request);

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().failed, 1u);

    Task failed = fetch(task.id);
    EXPECT_EQ(failed.status, TaskStatus::FAILED);
    ASSERT_TRUE(failed.error_message.has_value());
    EXPECT_EQ(failed.error_message->rfind("DATA_NOT_FOUND: ", 0), 0u);
    EXPECT_FALSE(failed.result_id.has_value());
}

TEST_F(TaskOrchestratorTest, ProviderExceptionFailsTask) {
    provider->before_price = [](const std::string&) {
        throw std::runtime_error("feed disconnected");
    };
    Task task = submit_ok(scenario_request());

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());

    Task failed = fetch(task.id);
    EXPECT_EQ(failed.status, TaskStatus::FAILED);
    ASSERT_TRUE(failed.error_message.has_value());
    EXPECT_EQ(*failed.error_message, "EXECUTION_ERROR: feed disconnected");
}

TEST_F(TaskOrchestratorTest, FailedResultWriteLeavesNoResult) {
    store->fail_result_commits(true);
    Task task = submit_ok(scenario_request());

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().failed, 1u);
    EXPECT_EQ(cycle.value().completed, 0u);

    Task failed = fetch(task.id);
    EXPECT_EQ(failed.status, TaskStatus::FAILED);
    EXPECT_FALSE(failed.result_id.has_value());
    EXPECT_EQ(store->result_count(), 0u);
    EXPECT_TRUE(orchestrator->get_task_result(task.id).is_error());
}

TEST_F(TaskOrchestratorTest, FailureWriteIsRetried) {
    auto flaky = std::make_shared<FlakyStatusStore>();
    build(flaky);
    Task task = submit_ok(scenario_request("600519.SH"));
    flaky->failing_status_writes = 1;

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().failed, 1u);

    EXPECT_EQ(fetch(task.id).status, TaskStatus::FAILED);
    EXPECT_EQ(orchestrator->status().unrecorded_updates, 0u);
}

TEST_F(TaskOrchestratorTest, UnrecordedFailureIsWrittenNextCycle) {
    auto flaky = std::make_shared<FlakyStatusStore>();
    OrchestratorConfig config = fast_config();
    config.status_write_attempts = 2;
    build(flaky, config);
    Task task = submit_ok(scenario_request("600519.SH"));
    flaky->failing_status_writes = 2;

    auto first = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().failed, 1u);
    EXPECT_EQ(fetch(task.id).status, TaskStatus::RUNNING);
    EXPECT_EQ(orchestrator->status().unrecorded_updates, 1u);

    auto second = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().examined, 0u);

    Task failed = fetch(task.id);
    EXPECT_EQ(failed.status, TaskStatus::FAILED);
    ASSERT_TRUE(failed.error_message.has_value());
    EXPECT_EQ(failed.error_message->rfind("DATA_NOT_FOUND: ", 0), 0u);
    EXPECT_EQ(orchestrator->status().unrecorded_updates, 0u);
}

TEST_F(TaskOrchestratorTest, UnknownCombinationFailsTask) {
    TaskRequest request = scenario_request();
    request.factor_combination_id = "missing";
    Task task = submit_ok(request);

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    Task failed = fetch(task.id);
    EXPECT_EQ(failed.status, TaskStatus::FAILED);
    EXPECT_EQ(provider->price_calls(), 0u);
}

TEST_F(TaskOrchestratorTest, StoredCombinationIsUsed) {
    std::vector<FactorConfig> factors(2);
    factors[0].name = "momentum";
    factors[0].weight = 0.5;
    factors[1].name = "ma_signal";
    factors[1].weight = 0.5;
    auto combination = FactorCombination::create("combo_1", "Blend", factors);
    ASSERT_TRUE(combination.is_ok());
    ASSERT_TRUE(combinations->save_combination(combination.value()).is_ok());

    TaskRequest request = scenario_request();
    request.factor_combination_id = "combo_1";
    Task task = submit_ok(request);

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    auto result = orchestrator->get_task_result(task.id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().factor_combination.id(), "combo_1");
    EXPECT_EQ(result.value().factor_combination.factors().size(), 2u);
}

TEST_F(TaskOrchestratorTest, ThresholdOverrideSuppressesTrades) {
    TaskRequest request = scenario_request();
    SignalThresholds strict;
    strict.buy_threshold = 0.99;
    strict.sell_threshold = -0.99;
    request.config.thresholds = strict;
    Task task = submit_ok(request);

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    auto result = orchestrator->get_task_result(task.id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().trades.empty());
}

// ========== Cancellation ==========

TEST_F(TaskOrchestratorTest, CancelPendingTask) {
    Task task = submit_ok(scenario_request());
    ASSERT_TRUE(orchestrator->cancel(task.id).is_ok());

    Task cancelled = fetch(task.id);
    EXPECT_EQ(cancelled.status, TaskStatus::CANCELLED);
    ASSERT_TRUE(cancelled.error_message.has_value());
    EXPECT_EQ(*cancelled.error_message, "cancelled by user");

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().examined, 0u);
}

TEST_F(TaskOrchestratorTest, CancelRunningTaskStopsCooperatively) {
    Task task = submit_ok(scenario_request());
    int lookups = 0;
    provider->before_price = [this, &task, &lookups](const std::string&) {
        if (++lookups == 2) {
            EXPECT_TRUE(orchestrator->cancel(task.id).is_ok());
            auto flagged = orchestrator->is_cancel_requested(task.id);
            EXPECT_TRUE(flagged.is_ok() && flagged.value());
        }
    };

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().cancelled, 1u);
    EXPECT_EQ(lookups, 2);

    Task cancelled = fetch(task.id);
    EXPECT_EQ(cancelled.status, TaskStatus::CANCELLED);
    EXPECT_FALSE(cancelled.result_id.has_value());
    EXPECT_EQ(store->result_count(), 0u);
    auto flagged = orchestrator->is_cancel_requested(task.id);
    ASSERT_TRUE(flagged.is_ok());
    EXPECT_FALSE(flagged.value());
}

TEST_F(TaskOrchestratorTest, CancelFromAnotherOrchestratorStopsRun) {
    auto other = make_orchestrator(store);
    Task task = submit_ok(scenario_request());
    int lookups = 0;
    provider->before_price = [&other, &task, &lookups](const std::string&) {
        if (++lookups == 2) {
            EXPECT_TRUE(other->cancel(task.id).is_ok());
        }
    };

    auto cycle = orchestrator->poll_and_dispatch();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().cancelled, 1u);
    EXPECT_EQ(cycle.value().completed, 0u);
    EXPECT_EQ(lookups, 2);

    Task cancelled = fetch(task.id);
    EXPECT_EQ(cancelled.status, TaskStatus::CANCELLED);
    EXPECT_EQ(store->result_count(), 0u);
}

TEST_F(TaskOrchestratorTest, CancelFlagIsReadAtConfiguredInterval) {
    OrchestratorConfig config = fast_config();
    config.cancel_check_interval_ms = 60 * 60 * 1000;
    build(store, config);

    Task task = submit_ok(scenario_request());
    int lookups = 0;
    provider->before_price = [this, &task, &lookups](const std::string&) {
        if (++lookups == 2) {
            EXPECT_TRUE(orchestrator->cancel(task.id).is_ok());
        }
    };

    // Only the check before the first snapshot reaches the store
    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    Task finished = fetch(task.id);
    EXPECT_EQ(finished.status, TaskStatus::COMPLETED);
    EXPECT_FALSE(finished.cancel_requested);
}

TEST_F(TaskOrchestratorTest, CancelLosingRaceWithCompletionIsRejected) {
    auto finishing = std::make_shared<FinishingTaskStore>();
    build(finishing);
    Task task = submit_ok(scenario_request());
    ASSERT_TRUE(finishing->claim_task(task.id).value());

    auto cancelled = orchestrator->cancel(task.id);
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error()->code(), ErrorCode::INVALID_TRANSITION);

    Task done = fetch(task.id);
    EXPECT_EQ(done.status, TaskStatus::COMPLETED);
    EXPECT_FALSE(done.cancel_requested);
}

TEST_F(TaskOrchestratorTest, CancelTerminalTaskIsInvalidTransition) {
    Task task = submit_ok(scenario_request());
    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());

    auto cancelled = orchestrator->cancel(task.id);
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error()->code(), ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(fetch(task.id).status, TaskStatus::COMPLETED);
}

TEST_F(TaskOrchestratorTest, CancelUnknownTaskIsNotFound) {
    auto cancelled = orchestrator->cancel("bt_missing");
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error()->code(), ErrorCode::TASK_NOT_FOUND);
}

// ========== Requeue ==========

TEST_F(TaskOrchestratorTest, RequeueFailedTaskRunsAgain) {
    Task task = submit_ok(scenario_request("600519.SH"));
    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    ASSERT_EQ(fetch(task.id).status, TaskStatus::FAILED);

    provider->add_series("600519.SH", first_week(), 1700.0, 5.0, "ma_signal", 2.0);
    auto requeued = orchestrator->requeue(task.id);
    ASSERT_TRUE(requeued.is_ok());
    EXPECT_EQ(requeued.value().status, TaskStatus::PENDING);
    EXPECT_FALSE(requeued.value().error_message.has_value());
    EXPECT_DOUBLE_EQ(requeued.value().progress, 0.0);

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    EXPECT_EQ(fetch(task.id).status, TaskStatus::COMPLETED);
}

TEST_F(TaskOrchestratorTest, RequeueCancelledTask) {
    Task task = submit_ok(scenario_request());
    ASSERT_TRUE(orchestrator->cancel(task.id).is_ok());

    auto requeued = orchestrator->requeue(task.id);
    ASSERT_TRUE(requeued.is_ok());
    EXPECT_EQ(requeued.value().status, TaskStatus::PENDING);
}

TEST_F(TaskOrchestratorTest, RequeueRejectsPendingAndCompleted) {
    Task task = submit_ok(scenario_request());
    auto pending = orchestrator->requeue(task.id);
    ASSERT_TRUE(pending.is_error());
    EXPECT_EQ(pending.error()->code(), ErrorCode::INVALID_TRANSITION);

    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    auto completed = orchestrator->requeue(task.id);
    ASSERT_TRUE(completed.is_error());
    EXPECT_EQ(completed.error()->code(), ErrorCode::INVALID_TRANSITION);
}

// ========== Queries ==========

TEST_F(TaskOrchestratorTest, ResultOfUnfinishedTaskIsNotFound) {
    Task task = submit_ok(scenario_request());
    auto result = orchestrator->get_task_result(task.id);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(TaskOrchestratorTest, ListTasksFiltersByStatus) {
    Task done = submit_ok(scenario_request("000001.SZ"));
    ASSERT_TRUE(orchestrator->poll_and_dispatch().is_ok());
    Task waiting = submit_ok(scenario_request("000002.SZ"));

    TaskQuery query;
    query.status = TaskStatus::PENDING;
    auto pending = orchestrator->list_tasks(query);
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].id, waiting.id);

    query.status = TaskStatus::COMPLETED;
    auto completed = orchestrator->list_tasks(query);
    ASSERT_TRUE(completed.is_ok());
    ASSERT_EQ(completed.value().size(), 1u);
    EXPECT_EQ(completed.value()[0].id, done.id);
}

// ========== Poll loop ==========

TEST_F(TaskOrchestratorTest, PollLoopProcessesTasksUntilStopped) {
    OrchestratorConfig config;
    config.poll_interval_seconds = 1;
    build(store, config);
    Task task = submit_ok(scenario_request());

    ASSERT_TRUE(orchestrator->start().is_ok());
    EXPECT_TRUE(orchestrator->is_running());
    EXPECT_TRUE(orchestrator->start().is_error());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (fetch(task.id).status != TaskStatus::COMPLETED &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    orchestrator->stop();
    EXPECT_FALSE(orchestrator->is_running());
    EXPECT_EQ(fetch(task.id).status, TaskStatus::COMPLETED);

    OrchestratorStatus status = orchestrator->status();
    EXPECT_FALSE(status.running);
    EXPECT_GE(status.cycles, 1u);
    EXPECT_EQ(status.totals.completed, 1u);
    EXPECT_TRUE(status.last_poll_at.has_value());
}

TEST_F(TaskOrchestratorTest, StartRejectsInvalidConfig) {
    OrchestratorConfig config;
    config.poll_interval_seconds = 0;
    build(store, config);

    auto started = orchestrator->start();
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_FALSE(orchestrator->is_running());
}

TEST_F(TaskOrchestratorTest, StopWithoutStartIsHarmless) {
    orchestrator->stop();
    EXPECT_FALSE(orchestrator->is_running());
    EXPECT_EQ(orchestrator->status().cycles, 0u);
}
