#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include <sys/stat.h>

#include "execution_orchestrator.hpp"
#include "scratch_directory.hpp"
#include "simulation_engine.hpp"
#include "synthetic_market_data_provider.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using pipeline::ExecutionOrchestrator;
using pipeline::ExecutionRecord;
using pipeline::Stage;
using nlohmann::json;

namespace {

    class MockSandboxRunner : public sandbox::ISandboxRunner {
    public:
        MOCK_METHOD(void, validate, (const std::string&), (const, override));
        MOCK_METHOD(sandbox::SandboxRunResult, run,
                    (const std::string&, const core::TimeSeries<core::Candle>&), (override));
    };

    class MockMarketDataProvider : public data::IMarketDataProvider {
    public:
        MOCK_METHOD(core::TimeSeries<core::Candle>, fetchDailyCandles,
                    (const strategy_engine::Asset&, core::Timestamp, core::Timestamp), (override));
    };

    const auto kWait = std::chrono::seconds(60);

    strategy_engine::BacktestParameters scenarioParameters() {
        return strategy_engine::parametersFromJson({{"start_date", "2023-01-01"}, {"end_date", "2023-06-01"}});
    }

    sandbox::SandboxRunResult cannedRun() {
        backtester::SimulationConfig config;
        config.symbol = "BTC";
        std::vector<core::Timestamp> days = {test_helpers::day(0), test_helpers::day(1), test_helpers::day(2)};
        sandbox::SandboxRunResult run;
        run.payload = backtester::SimulationEngine(config)
                          .run(days, {100.0, 105.0, 110.0}, {true, false, false}, {false, false, false})
                          .toJson();
        run.elapsed_seconds = 0.01;
        return run;
    }

    // Index of the first log line containing `text`, or -1
    int logIndex(const ExecutionRecord& record, const std::string& text) {
        for (size_t i = 0; i < record.logs.size(); ++i) {
            if (record.logs[i].message.find(text) != std::string::npos) return static_cast<int>(i);
        }
        return -1;
    }

    class ExecutionOrchestratorTest : public ::testing::Test {
    protected:
        std::shared_ptr<pipeline::SqliteExecutionStore> store_ = std::make_shared<pipeline::SqliteExecutionStore>(
            std::make_shared<data::DatabaseManager>(":memory:"));
        std::shared_ptr<data::IMarketDataProvider> market_data_ = std::make_shared<data::SyntheticMarketDataProvider>();
        std::shared_ptr<const strategy_engine::ISignalCompiler> compiler_ =
            std::make_shared<const strategy_engine::RuleSignalCompiler>();

        std::unique_ptr<ExecutionOrchestrator> orchestratorWith(std::shared_ptr<sandbox::ISandboxRunner> runner) {
            return std::make_unique<ExecutionOrchestrator>(store_, market_data_, std::move(runner), compiler_);
        }

        // Mock whose validate applies the real sandbox policy
        std::shared_ptr<MockSandboxRunner> policyCheckingMock() {
            auto runner = std::make_shared<MockSandboxRunner>();
            ON_CALL(*runner, validate(_)).WillByDefault(Invoke([](const std::string& text) {
                sandbox::SandboxPolicy().validate(text);
            }));
            return runner;
        }

        ExecutionRecord waitFor(ExecutionOrchestrator& orchestrator, const std::string& id) {
            auto record = orchestrator.waitForCompletion(id, kWait);
            EXPECT_TRUE(record.has_value());
            EXPECT_TRUE(record && record->isTerminal()) << "execution " << id << " did not finish";
            return record ? *record : ExecutionRecord{};
        }
    };

} // namespace

TEST_F(ExecutionOrchestratorTest, CompletesCrossoverBacktestInSandbox) {
    core::SandboxSettings settings;
    settings.runner_path = SIGNAL_RUNNER_PATH;
    settings.timeout_seconds = 60;
    auto orchestrator = orchestratorWith(std::make_shared<sandbox::SandboxedRunner>(settings));

    const std::string id = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    ExecutionRecord record = waitFor(*orchestrator, id);

    ASSERT_EQ(record.stage, Stage::Completed) << (record.error ? record.error->message : "");
    EXPECT_FALSE(record.error.has_value());
    ASSERT_TRUE(record.result_id.has_value());
    ASSERT_TRUE(record.started_at.has_value());
    ASSERT_TRUE(record.completed_at.has_value());

    // Stages are logged in pipeline order
    int analyzing = logIndex(record, "Analyzing strategy graph");
    int generating = logIndex(record, "Generating signal logic");
    int validating = logIndex(record, "Validating generated logic");
    int running = logIndex(record, "starting the sandbox");
    int complete = logIndex(record, "Backtest complete");
    EXPECT_GE(analyzing, 0);
    EXPECT_LT(analyzing, generating);
    EXPECT_LT(generating, validating);
    EXPECT_LT(validating, running);
    EXPECT_LT(running, complete);

    json logic = json::parse(orchestrator->getGeneratedLogic(id));
    EXPECT_EQ(logic["asset"]["symbol"], "BTC");

    auto result = orchestrator->getResult(id);
    EXPECT_EQ(result.symbol, "BTC");
    EXPECT_EQ(result.equity_series.size(), 152u);
    EXPECT_EQ(result.metrics.trade_count, static_cast<int>(result.round_trips.size()));

    auto history = orchestrator->getExecutionsForStrategy("btc-cross");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, id);
}

TEST_F(ExecutionOrchestratorTest, MissingEntryConditionFailsWhileAnalyzing) {
    auto runner = std::make_shared<MockSandboxRunner>();
    EXPECT_CALL(*runner, validate(_)).Times(0);
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto orchestrator = orchestratorWith(runner);

    json graph = {
        {"nodes", json::array({
            {{"id", "start"}, {"type", "start"}},
            {{"id", "asset"}, {"type", "category"}, {"meta", {{"category", "BTC"}}}},
            {{"id", "end"}, {"type", "end"}}
        })},
        {"edges", json::array({json::array({"start", "asset"}), json::array({"asset", "end"})})}
    };
    const std::string id = orchestrator->submit("no-entry", scenarioParameters(), graph);
    ExecutionRecord record = waitFor(*orchestrator, id);

    EXPECT_EQ(record.stage, Stage::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, core::ErrorKind::SchemaError);
    EXPECT_EQ(record.error->stage, Stage::Analyzing);
    EXPECT_FALSE(record.generated_logic.has_value());
    EXPECT_THROW(orchestrator->getGeneratedLogic(id), core::NotReadyException);
    EXPECT_THROW(orchestrator->getResult(id), core::NotReadyException);
    // A graph that never validated is not stored
    EXPECT_FALSE(store_->findStrategyGraph("no-entry").has_value());
}

TEST_F(ExecutionOrchestratorTest, ShellCallInRulesFailsValidationWithoutRunning) {
    auto runner = policyCheckingMock();
    EXPECT_CALL(*runner, validate(_)).Times(1);
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto orchestrator = orchestratorWith(runner);

    json graph = test_helpers::makeGraph("BTC", json::array({"system('rm -rf /')"}));
    const std::string id = orchestrator->submit("sneaky", scenarioParameters(), graph);
    ExecutionRecord record = waitFor(*orchestrator, id);

    EXPECT_EQ(record.stage, Stage::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, core::ErrorKind::SecurityError);
    EXPECT_EQ(record.error->stage, Stage::Validating);
    // The logic stays available for inspection
    EXPECT_NE(orchestrator->getGeneratedLogic(id).find("system("), std::string::npos);
    EXPECT_THROW(orchestrator->getResult(id), core::NotReadyException);
}

TEST_F(ExecutionOrchestratorTest, HangingWorkerTimesOut) {
    sandbox::ScratchDirectory scripts;
    std::string worker = scripts.writeFile("hang_worker.sh", "#!/bin/sh\nsleep 30 &\nsleep 30\n");
    ::chmod(worker.c_str(), 0700);

    core::SandboxSettings settings;
    settings.runner_path = worker;
    settings.timeout_seconds = 1;
    auto orchestrator = orchestratorWith(std::make_shared<sandbox::SandboxedRunner>(settings));

    const auto started = std::chrono::steady_clock::now();
    const std::string id = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    ExecutionRecord record = waitFor(*orchestrator, id);

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(20));
    EXPECT_EQ(record.stage, Stage::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, core::ErrorKind::TimeoutError);
    EXPECT_EQ(record.error->stage, Stage::Running);
}

TEST_F(ExecutionOrchestratorTest, CompileErrorsFailWhileAnalyzing) {
    auto runner = std::make_shared<MockSandboxRunner>();
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto orchestrator = orchestratorWith(runner);

    const std::string unsupported = orchestrator->submit(
        "meme", scenarioParameters(), test_helpers::makeGraph("Dogwifhat", json::array({"RSI below 30"})));

    auto reversed = scenarioParameters();
    std::swap(reversed.start_date, reversed.end_date);
    const std::string backwards = orchestrator->submit("btc-cross", reversed, test_helpers::scenarioAGraph());

    for (const auto& id : {unsupported, backwards}) {
        ExecutionRecord record = waitFor(*orchestrator, id);
        EXPECT_EQ(record.stage, Stage::Failed);
        ASSERT_TRUE(record.error.has_value());
        EXPECT_EQ(record.error->kind, core::ErrorKind::CompileError);
        EXPECT_EQ(record.error->stage, Stage::Analyzing);
    }
}

TEST_F(ExecutionOrchestratorTest, MarketDataFailureIsAnExecutionError) {
    auto provider = std::make_shared<MockMarketDataProvider>();
    EXPECT_CALL(*provider, fetchDailyCandles(_, _, _))
        .WillOnce(::testing::Throw(core::ApiRequestException("HTTP 503 from CoinGecko")));
    market_data_ = provider;

    auto runner = policyCheckingMock();
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto orchestrator = orchestratorWith(runner);

    const std::string id = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    ExecutionRecord record = waitFor(*orchestrator, id);

    EXPECT_EQ(record.stage, Stage::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, core::ErrorKind::ExecutionError);
    EXPECT_EQ(record.error->stage, Stage::Running);
    EXPECT_NE(record.error->message.find("HTTP 503"), std::string::npos);
}

TEST_F(ExecutionOrchestratorTest, MalformedWorkerResultIsAnExecutionError) {
    auto runner = policyCheckingMock();
    sandbox::SandboxRunResult junk;
    junk.payload = json{{"unexpected", true}};
    EXPECT_CALL(*runner, run(_, _)).WillOnce(Return(junk));
    auto orchestrator = orchestratorWith(runner);

    const std::string id = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    ExecutionRecord record = waitFor(*orchestrator, id);

    EXPECT_EQ(record.stage, Stage::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, core::ErrorKind::ExecutionError);
    EXPECT_FALSE(record.result_id.has_value());
}

TEST_F(ExecutionOrchestratorTest, ResubmissionReusesStoredGraph) {
    auto runner = policyCheckingMock();
    EXPECT_CALL(*runner, run(_, _)).Times(2).WillRepeatedly(Return(cannedRun()));
    auto orchestrator = orchestratorWith(runner);

    const std::string first = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    ASSERT_EQ(waitFor(*orchestrator, first).stage, Stage::Completed);
    ASSERT_TRUE(store_->findStrategyGraph("btc-cross").has_value());

    const std::string second = orchestrator->submit("btc-cross", scenarioParameters());
    EXPECT_EQ(waitFor(*orchestrator, second).stage, Stage::Completed);
    EXPECT_EQ(orchestrator->getGeneratedLogic(first), orchestrator->getGeneratedLogic(second));

    const std::string unknown = orchestrator->submit("never-seen", scenarioParameters());
    ExecutionRecord failed = waitFor(*orchestrator, unknown);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(failed.error->kind, core::ErrorKind::SchemaError);

    auto history = orchestrator->getExecutionsForStrategy("btc-cross");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, first);
    EXPECT_EQ(history[1].id, second);
}

TEST_F(ExecutionOrchestratorTest, ResubmissionInSandboxReproducesTheResult) {
    core::SandboxSettings settings;
    settings.runner_path = SIGNAL_RUNNER_PATH;
    settings.timeout_seconds = 60;
    auto orchestrator = orchestratorWith(std::make_shared<sandbox::SandboxedRunner>(settings));

    const std::string first = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    ASSERT_EQ(waitFor(*orchestrator, first).stage, Stage::Completed);
    const std::string second = orchestrator->submit("btc-cross", scenarioParameters());
    ASSERT_EQ(waitFor(*orchestrator, second).stage, Stage::Completed);

    auto a = orchestrator->getResult(first);
    auto b = orchestrator->getResult(second);
    EXPECT_EQ(a.metrics.trade_count, b.metrics.trade_count);
    EXPECT_NEAR(a.metrics.total_return_pct, b.metrics.total_return_pct, 1e-9);
    EXPECT_NEAR(a.metrics.sharpe_ratio, b.metrics.sharpe_ratio, 1e-9);
    EXPECT_NEAR(a.metrics.max_drawdown_pct, b.metrics.max_drawdown_pct, 1e-9);
    EXPECT_NEAR(a.metrics.final_equity, b.metrics.final_equity, 1e-6);
    ASSERT_EQ(a.equity_series.size(), b.equity_series.size());
    EXPECT_EQ(a.ledger.size(), b.ledger.size());
}

TEST_F(ExecutionOrchestratorTest, UnusableIndicatorWindowFailsWhileAnalyzing) {
    auto runner = std::make_shared<MockSandboxRunner>();
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto orchestrator = orchestratorWith(runner);

    const std::string id = orchestrator->submit(
        "rsi-one", scenarioParameters(), test_helpers::makeGraph("BTC", json::array({"RSI(1) below 30"})));
    ExecutionRecord record = waitFor(*orchestrator, id);

    EXPECT_EQ(record.stage, Stage::Failed);
    ASSERT_TRUE(record.error.has_value());
    EXPECT_EQ(record.error->kind, core::ErrorKind::CompileError);
    EXPECT_EQ(record.error->stage, Stage::Analyzing);
}

TEST_F(ExecutionOrchestratorTest, SubmissionAfterShutdownIsRecordedAsFailed) {
    auto runner = std::make_shared<MockSandboxRunner>();
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    auto orchestrator = orchestratorWith(runner);
    orchestrator->shutdown();

    EXPECT_THROW(orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph()),
                 core::InternalException);

    auto history = orchestrator->getExecutionsForStrategy("btc-cross");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].stage, Stage::Failed);
    ASSERT_TRUE(history[0].error.has_value());
    EXPECT_EQ(history[0].error->kind, core::ErrorKind::InternalError);
    EXPECT_EQ(history[0].error->stage, Stage::Queued);
    EXPECT_TRUE(history[0].completed_at.has_value());
}

TEST_F(ExecutionOrchestratorTest, ResultIsNotReadyWhileRunning) {
    std::promise<void> pending;
    std::shared_future<void> gate = pending.get_future().share();
    auto runner = policyCheckingMock();
    EXPECT_CALL(*runner, run(_, _)).WillOnce(Invoke([gate](const std::string&, const core::TimeSeries<core::Candle>&) {
        gate.wait();
        return cannedRun();
    }));
    auto orchestrator = orchestratorWith(runner);
    // Destroyed before the orchestrator, so a failed assertion still unblocks the worker
    std::promise<void> release = std::move(pending);

    const std::string id = orchestrator->submit("btc-cross", scenarioParameters(), test_helpers::scenarioAGraph());
    auto snapshot = orchestrator->getExecution(id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_FALSE(snapshot->isTerminal());

    const auto deadline = std::chrono::steady_clock::now() + kWait;
    while (orchestrator->getExecution(id)->stage != Stage::Running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(orchestrator->getExecution(id)->stage, Stage::Running);
    EXPECT_THROW(orchestrator->getResult(id), core::NotReadyException);
    EXPECT_NO_THROW(orchestrator->getGeneratedLogic(id));

    release.set_value();
    EXPECT_EQ(waitFor(*orchestrator, id).stage, Stage::Completed);
    EXPECT_NO_THROW(orchestrator->getResult(id));
}

TEST_F(ExecutionOrchestratorTest, UnknownExecutionIds) {
    auto orchestrator = orchestratorWith(std::make_shared<MockSandboxRunner>());
    EXPECT_FALSE(orchestrator->getExecution("nope").has_value());
    EXPECT_FALSE(orchestrator->waitForCompletion("nope", std::chrono::milliseconds(10)).has_value());
    EXPECT_THROW(orchestrator->getGeneratedLogic("nope"), core::NotFoundException);
    EXPECT_THROW(orchestrator->getResult("nope"), core::NotFoundException);
    EXPECT_TRUE(orchestrator->getExecutionsForStrategy("nope").empty());
}

TEST_F(ExecutionOrchestratorTest, RequiresEveryCollaborator) {
    EXPECT_THROW(ExecutionOrchestrator(nullptr, market_data_, std::make_shared<MockSandboxRunner>(), compiler_),
                 core::ConfigException);
    EXPECT_THROW(ExecutionOrchestrator(store_, market_data_, nullptr, compiler_), core::ConfigException);
}
