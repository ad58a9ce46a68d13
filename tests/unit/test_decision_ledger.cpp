/**
 * @file test_decision_ledger.cpp
 * @brief Unit tests for decision history, statistics and decision sinks.
 */

#include "telemetry/decision_ledger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace workload_router;

// ─── Test Fixtures ───────────────────────────

namespace {

DecisionRecord make_record(const std::string& task, const std::string& node,
                           bool success = true, double latency_ms = 100.0, double cost = 0.01) {
    DecisionRecord record;
    record.decision.task_id = task;
    record.decision.chosen_node = node;
    record.decision.confidence = 0.75;
    record.decision.scores = {CandidateScore{.node_id = node, .score = 0.75}};
    record.decision.rationale = "Routed " + task + " to " + node + ".";
    record.final_stage = success ? DecisionStage::Completed : DecisionStage::Failed;
    record.outcome = ExecutionOutcome{.success = success, .latency_ms = latency_ms, .cost = cost};
    if (!success) record.outcome.error_message = "boom";
    return record;
}

/// Counts calls and optionally fails.
class CountingSink : public IDecisionSink {
public:
    explicit CountingSink(bool fail = false) : fail_(fail) {}

    Result<void> persist(const DecisionRecord& /*record*/) override {
        ++calls;
        if (fail_) return Error{ErrorCode::Io, "disk full"};
        return Result<void>{};
    }

    int calls{0};

private:
    bool fail_;
};

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ─── DecisionLedger ──────────────────────────

TEST(DecisionLedgerTest, HistoryIsNewestFirst) {
    DecisionLedger ledger(10);
    ASSERT_TRUE(ledger.persist(make_record("t1", "Edge-01")).has_value());
    ASSERT_TRUE(ledger.persist(make_record("t2", "Edge-02")).has_value());
    ASSERT_TRUE(ledger.persist(make_record("t3", "Edge-01")).has_value());

    auto history = ledger.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].decision.task_id, "t3");
    EXPECT_EQ(history[2].decision.task_id, "t1");

    auto latest = ledger.history(2);
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[1].decision.task_id, "t2");
}

TEST(DecisionLedgerTest, HistoryFiltersByNode) {
    DecisionLedger ledger(10);
    for (int i = 0; i < 6; ++i) {
        ledger.persist(make_record("t" + std::to_string(i), i % 2 == 0 ? "Edge-01" : "Cloud-AWS-East"));
    }

    auto edge = ledger.history(50, NodeId{"Edge-01"});
    ASSERT_EQ(edge.size(), 3u);
    EXPECT_EQ(edge.front().decision.task_id, "t4");
    for (const auto& record : edge) {
        EXPECT_EQ(record.decision.chosen_node, "Edge-01");
    }

    EXPECT_EQ(ledger.history(2, NodeId{"Edge-01"}).size(), 2u);
    EXPECT_TRUE(ledger.history(50, NodeId{"GPU-Cluster-01"}).empty());
}

TEST(DecisionLedgerTest, EvictsOldestBeyondLimit) {
    DecisionLedger ledger(3);
    EXPECT_EQ(ledger.capacity(), 3u);
    for (int i = 0; i < 5; ++i) {
        ledger.persist(make_record("t" + std::to_string(i), "Edge-01"));
    }
    EXPECT_EQ(ledger.size(), 3u);

    auto history = ledger.history();
    EXPECT_EQ(history.front().decision.task_id, "t4");
    EXPECT_EQ(history.back().decision.task_id, "t2");
}

TEST(DecisionLedgerTest, ZeroLimitKeepsNothing) {
    DecisionLedger ledger(0);
    EXPECT_TRUE(ledger.persist(make_record("t1", "Edge-01")).has_value());
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(ledger.history().empty());
}

TEST(DecisionLedgerTest, Statistics) {
    DecisionLedger ledger(10);
    ledger.persist(make_record("t1", "Edge-01", true, 100.0, 0.01));
    ledger.persist(make_record("t2", "Edge-01", false, 200.0, 0.01));
    ledger.persist(make_record("t3", "GPU-Cluster-01", true, 300.0, 0.05));
    ledger.persist(make_record("t4", "Edge-01", true, 60.0, 0.02));

    auto stats = ledger.statistics();
    EXPECT_EQ(stats.total, 4u);
    EXPECT_EQ(stats.successful, 3u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.75);

    ASSERT_EQ(stats.per_node.size(), 2u);
    const auto& edge = stats.per_node.at("Edge-01");
    EXPECT_EQ(edge.tasks, 3u);
    EXPECT_NEAR(edge.average_latency_ms, 120.0, 1e-9);
    EXPECT_NEAR(edge.total_cost, 0.04, 1e-12);

    const auto& gpu = stats.per_node.at("GPU-Cluster-01");
    EXPECT_EQ(gpu.tasks, 1u);
    EXPECT_DOUBLE_EQ(gpu.average_latency_ms, 300.0);
}

TEST(DecisionLedgerTest, StatisticsSurviveEviction) {
    DecisionLedger ledger(2);
    ledger.persist(make_record("t1", "Edge-01", false, 100.0, 0.01));
    ledger.persist(make_record("t2", "Edge-01", true, 300.0, 0.01));
    ledger.persist(make_record("t3", "Cloud-AWS-East", true, 80.0, 0.025));
    ledger.persist(make_record("t4", "Cloud-AWS-East", true, 120.0, 0.025));
    ASSERT_EQ(ledger.size(), 2u);

    auto stats = ledger.statistics();
    EXPECT_EQ(stats.total, 4u);
    EXPECT_EQ(stats.successful, 3u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.75);
    ASSERT_EQ(stats.per_node.size(), 2u);
    EXPECT_EQ(stats.per_node.at("Edge-01").tasks, 2u);
    EXPECT_NEAR(stats.per_node.at("Edge-01").average_latency_ms, 200.0, 1e-9);
    EXPECT_NEAR(stats.per_node.at("Cloud-AWS-East").total_cost, 0.05, 1e-12);

    DecisionLedger unbuffered(0);
    unbuffered.persist(make_record("t1", "Edge-01"));
    EXPECT_EQ(unbuffered.statistics().total, 1u);
}

TEST(DecisionLedgerTest, EmptyStatistics) {
    DecisionLedger ledger;
    auto stats = ledger.statistics();
    EXPECT_EQ(stats.total, 0u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.0);
    EXPECT_TRUE(stats.per_node.empty());
}

TEST(DecisionLedgerTest, Clear) {
    DecisionLedger ledger(5);
    ledger.persist(make_record("t1", "Edge-01"));
    ledger.clear();
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_EQ(ledger.statistics().total, 0u);
}

// ─── JSON rendering ──────────────────────────

TEST(DecisionJsonTest, RecordRendersAsOneLine) {
    auto record = make_record("task-0001", "Edge-01", false);
    record.decision.rationale = "Routed \"task-0001\".\nDone";
    record.reserved = ResourceAmount{500, 256};

    auto line = to_json(record);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_TRUE(line.starts_with(R"({"event":"routing_decision")"));
    EXPECT_TRUE(contains(line, R"("task":"task-0001")"));
    EXPECT_TRUE(contains(line, R"("node":"Edge-01")"));
    EXPECT_TRUE(contains(line, R"("scores":{"Edge-01":0.75})"));
    EXPECT_TRUE(contains(line, R"("reserved_cpu_m":500)"));
    EXPECT_TRUE(contains(line, R"("stage":"failed")"));
    EXPECT_TRUE(contains(line, R"("success":false)"));
    EXPECT_TRUE(contains(line, R"("error":"boom")"));
    EXPECT_TRUE(contains(line, R"(Routed \"task-0001\".\nDone)"));
    EXPECT_TRUE(line.ends_with("}"));
}

// ─── Sinks ───────────────────────────────────

TEST(DecisionSinkTest, JsonSinkWritesLines) {
    auto memory = std::make_unique<MemorySink>();
    auto* raw = memory.get();
    JsonDecisionSink sink(std::move(memory));

    ASSERT_TRUE(sink.persist(make_record("t1", "Edge-01")).has_value());
    ASSERT_TRUE(sink.persist(make_record("t2", "Edge-02")).has_value());
    ASSERT_EQ(raw->size(), 2u);
    EXPECT_TRUE(contains(raw->lines()[1], R"("task":"t2")"));
}

TEST(DecisionSinkTest, UnhealthyJsonSinkReportsIo) {
    auto memory = std::make_unique<MemorySink>();
    auto* raw = memory.get();
    JsonDecisionSink sink(std::move(memory));
    raw->set_healthy(false);

    auto result = sink.persist(make_record("t1", "Edge-01"));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Io));
    EXPECT_EQ(raw->size(), 0u);
}

TEST(DecisionSinkTest, FanOutReachesEverySink) {
    auto first = std::make_shared<CountingSink>();
    auto failing = std::make_shared<CountingSink>(true);
    auto last = std::make_shared<CountingSink>();

    FanOutDecisionSink fan_out;
    fan_out.add(first);
    fan_out.add(failing);
    fan_out.add(last);
    fan_out.add(nullptr);
    EXPECT_EQ(fan_out.size(), 3u);

    auto result = fan_out.persist(make_record("t1", "Edge-01"));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Io));
    ASSERT_EQ(result.error().details.size(), 1u);
    EXPECT_TRUE(contains(result.error().details.front(), "disk full"));

    EXPECT_EQ(first->calls, 1);
    EXPECT_EQ(failing->calls, 1);
    EXPECT_EQ(last->calls, 1);
}

TEST(DecisionSinkTest, FanOutIntoLedger) {
    auto ledger = std::make_shared<DecisionLedger>(10);
    FanOutDecisionSink fan_out;
    fan_out.add(ledger);

    EXPECT_TRUE(fan_out.persist(make_record("t1", "Edge-01")).has_value());
    EXPECT_EQ(ledger->size(), 1u);
}
