/**
 * @file test_simulation.cpp
 * @brief Unit tests for the telemetry and execution simulators.
 */

#include "simulation/execution_simulator.hpp"
#include "simulation/telemetry_simulator.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <thread>

using namespace workload_router;

// ─── Test Fixtures ───────────────────────────

class TelemetrySimulatorTest : public ::testing::Test {
protected:
    NodeRegistry registry_;
    Logger logger_{std::make_unique<NullSink>()};

    void SetUp() override {
        for (const auto& node : default_fleet()) {
            ASSERT_TRUE(registry_.register_node(node).has_value());
        }
    }
};

// ─── TelemetrySimulator ──────────────────────

TEST_F(TelemetrySimulatorTest, TickUpdatesEveryLiveNode) {
    TelemetrySimulator sim(registry_, logger_, SimulationConfig{.seed = 7});
    auto before = registry_.snapshot();

    EXPECT_EQ(sim.tick(), 5u);
    auto after = registry_.snapshot();
    EXPECT_GT(after.generation, before.generation);
    EXPECT_NE(after.nodes, before.nodes);
}

TEST_F(TelemetrySimulatorTest, SameSeedSameSequence) {
    NodeRegistry twin;
    for (const auto& node : default_fleet()) {
        ASSERT_TRUE(twin.register_node(node).has_value());
    }

    TelemetrySimulator a(registry_, logger_, SimulationConfig{.seed = 99});
    TelemetrySimulator b(twin, logger_, SimulationConfig{.seed = 99});
    a.randomize_initial();
    b.randomize_initial();
    for (int i = 0; i < 25; ++i) {
        a.tick();
        b.tick();
    }
    EXPECT_EQ(registry_.snapshot(), twin.snapshot());
}

TEST_F(TelemetrySimulatorTest, StepsAreBounded) {
    TelemetrySimulator sim(registry_, logger_, SimulationConfig{.seed = 3});
    auto before = registry_.snapshot();
    sim.tick();
    auto after = registry_.snapshot();

    for (size_t i = 0; i < before.nodes.size(); ++i) {
        EXPECT_LE(std::abs(after.nodes[i].cpu_load_percent - before.nodes[i].cpu_load_percent),
                  TelemetrySimulator::kCpuStep);
        EXPECT_LE(std::abs(after.nodes[i].memory_load_percent - before.nodes[i].memory_load_percent),
                  TelemetrySimulator::kMemoryStep);
    }
}

TEST_F(TelemetrySimulatorTest, LoadStaysInRange) {
    ASSERT_TRUE(registry_.update_telemetry("Edge-01",
        TelemetryUpdate{.load = LoadReport{.cpu_percent = 99.0, .memory_percent = 1.0}}).has_value());

    TelemetrySimulator sim(registry_, logger_, SimulationConfig{.seed = 1});
    for (int i = 0; i < 500; ++i) {
        sim.tick();
    }
    for (const auto& node : registry_.snapshot().nodes) {
        EXPECT_GE(node.cpu_load_percent, 0.0) << node.id;
        EXPECT_LE(node.cpu_load_percent, 100.0) << node.id;
        EXPECT_GE(node.memory_load_percent, 0.0) << node.id;
        EXPECT_LE(node.memory_load_percent, 100.0) << node.id;
        EXPECT_GT(node.latency_ms, 0.0) << node.id;
    }
}

TEST_F(TelemetrySimulatorTest, OfflineNodesAreSkipped) {
    ASSERT_TRUE(registry_.update_telemetry("Edge-02",
        TelemetryUpdate{.status = NodeStatus::Offline}).has_value());
    auto before = *registry_.node("Edge-02");

    TelemetrySimulator sim(registry_, logger_, SimulationConfig{.seed = 5});
    EXPECT_EQ(sim.tick(), 4u);
    EXPECT_EQ(*registry_.node("Edge-02"), before);
}

TEST_F(TelemetrySimulatorTest, RandomizeInitialUsesCategoryRanges) {
    TelemetrySimulator sim(registry_, logger_, SimulationConfig{.seed = 21});
    EXPECT_EQ(sim.randomize_initial(), 5u);

    for (const auto& node : registry_.snapshot().nodes) {
        if (node.category == NodeCategory::Edge) {
            EXPECT_GE(node.cpu_load_percent, 10.0);
            EXPECT_LE(node.cpu_load_percent, 40.0);
            EXPECT_GE(node.latency_ms, 5.0);
            EXPECT_LE(node.latency_ms, 20.0);
        } else if (node.category == NodeCategory::Cloud) {
            EXPECT_GE(node.memory_load_percent, 30.0);
            EXPECT_LE(node.memory_load_percent, 70.0);
        }
    }
}

TEST_F(TelemetrySimulatorTest, BaselineLatency) {
    EXPECT_DOUBLE_EQ(TelemetrySimulator::baseline_latency_ms(NodeCategory::Edge), 10.0);
    EXPECT_DOUBLE_EQ(TelemetrySimulator::baseline_latency_ms(NodeCategory::Cloud), 80.0);
    EXPECT_DOUBLE_EQ(TelemetrySimulator::baseline_latency_ms(NodeCategory::Gpu), 80.0);
}

TEST_F(TelemetrySimulatorTest, BackgroundLoopTicksUntilStopped) {
    TelemetrySimulator sim(registry_, logger_, SimulationConfig{.seed = 8, .interval_ms = 5});
    auto start_generation = registry_.generation();

    sim.start();
    EXPECT_TRUE(sim.running());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry_.generation() < start_generation + 15
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    sim.stop();
    EXPECT_FALSE(sim.running());
    EXPECT_GE(registry_.generation(), start_generation + 15);

    auto stopped_at = registry_.generation();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(registry_.generation(), stopped_at);
}

TEST_F(TelemetrySimulatorTest, StopWithoutStartIsSafe) {
    TelemetrySimulator sim(registry_, logger_);
    sim.stop();
    EXPECT_FALSE(sim.running());
}

// ─── ExecutionSimulator ──────────────────────

TEST(ExecutionSimulatorTest, LatencyFollowsCategoryAndTaskType) {
    ExecutionSimulator sim(42);
    TaskDescriptor fraud{.id = "t", .task_type = "fraud_detection"};
    TaskDescriptor training{.id = "t", .task_type = "ml_training"};

    for (int i = 0; i < 100; ++i) {
        auto edge = sim.execute(fraud, NodeCategory::Edge);
        EXPECT_TRUE(edge.success);
        EXPECT_GE(edge.latency_ms, 50.0 * 0.8);
        EXPECT_LE(edge.latency_ms, 150.0 * 0.8);

        auto gpu = sim.execute(training, NodeCategory::Gpu);
        EXPECT_GE(gpu.latency_ms, 300.0 * 0.3);
        EXPECT_LE(gpu.latency_ms, 600.0 * 0.3);
    }
}

TEST(ExecutionSimulatorTest, CostScalesWithMultipliers) {
    ExecutionSimulator sim;
    TaskDescriptor report{.id = "t", .task_type = "daily_report"};

    auto cloud = sim.execute(report, NodeCategory::Cloud, 2.5);
    EXPECT_NEAR(cloud.cost, 0.025 * 0.7 * 2.5, 1e-12);

    TaskDescriptor unknown{.id = "t", .task_type = "batch_export"};
    auto edge = sim.execute(unknown, NodeCategory::Edge);
    EXPECT_NEAR(edge.cost, 0.01, 1e-12);
    EXPECT_GE(edge.latency_ms, 50.0);
    EXPECT_LE(edge.latency_ms, 150.0);
}

TEST(ExecutionSimulatorTest, FailureRateExtremes) {
    TaskDescriptor task{.id = "t", .task_type = "sensor_alert"};

    ExecutionSimulator never(1, 0.0);
    ExecutionSimulator always(1, 1.0);
    ExecutionSimulator clamped(1, 7.0);
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(never.execute(task, NodeCategory::Edge).success);

        auto failed = always.execute(task, NodeCategory::Edge);
        EXPECT_FALSE(failed.success);
        ASSERT_TRUE(failed.error_message.has_value());
        EXPECT_EQ(*failed.error_message, "simulated failure of sensor_alert on edge node");

        EXPECT_FALSE(clamped.execute(task, NodeCategory::Cloud).success);
    }
}

TEST(ExecutionSimulatorTest, Deterministic) {
    ExecutionSimulator a(123, 0.3);
    ExecutionSimulator b(123, 0.3);
    TaskDescriptor task{.id = "t", .task_type = "image_classification"};

    for (int i = 0; i < 50; ++i) {
        auto x = a.execute(task, NodeCategory::Gpu);
        auto y = b.execute(task, NodeCategory::Gpu);
        EXPECT_EQ(x.success, y.success);
        EXPECT_DOUBLE_EQ(x.latency_ms, y.latency_ms);
    }
}

TEST(ExecutionSimulatorTest, Multipliers) {
    EXPECT_DOUBLE_EQ(ExecutionSimulator::task_multiplier("ml_training", NodeCategory::Gpu), 0.3);
    EXPECT_DOUBLE_EQ(ExecutionSimulator::task_multiplier("sensor_alert", NodeCategory::Edge), 0.6);
    EXPECT_DOUBLE_EQ(ExecutionSimulator::task_multiplier("image_classification", NodeCategory::Cloud), 0.9);
    EXPECT_DOUBLE_EQ(ExecutionSimulator::task_multiplier("unknown", NodeCategory::Gpu), 1.0);

    EXPECT_DOUBLE_EQ(ExecutionSimulator::base_cost(NodeCategory::Edge), 0.01);
    EXPECT_DOUBLE_EQ(ExecutionSimulator::base_cost(NodeCategory::Cloud), 0.025);
    EXPECT_DOUBLE_EQ(ExecutionSimulator::base_cost(NodeCategory::Gpu), 0.05);
}
