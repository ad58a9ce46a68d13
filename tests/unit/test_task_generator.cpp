/**
 * @file test_task_generator.cpp
 * @brief Unit tests for synthetic task generation.
 */

#include "engine/decision_engine.hpp"
#include "workload/task_generator.hpp"

#include <gtest/gtest.h>
#include <set>

using namespace workload_router;

TEST(TaskGeneratorTest, IdsAreZeroPadded) {
    std::mt19937 rng(42);
    EXPECT_EQ(TaskGenerator::random_task(rng, 7).id, "task-0007");
    EXPECT_EQ(TaskGenerator::random_task(rng, 1234).id, "task-1234");
    EXPECT_EQ(TaskGenerator::random_task(rng, 12345).id, "task-12345");
}

TEST(TaskGeneratorTest, FraudDetectionProfile) {
    std::mt19937 rng(1);
    for (size_t i = 0; i < 50; ++i) {
        auto task = TaskGenerator::make_task("fraud_detection", rng, i);
        EXPECT_EQ(task.task_type, "fraud_detection");
        EXPECT_GE(task.priority, 7);
        EXPECT_LE(task.priority, 10);
        ASSERT_TRUE(task.latency.has_value());
        EXPECT_EQ(task.latency->kind, LatencyRequirement::Kind::Milliseconds);
        EXPECT_GE(task.latency->value, 20.0);
        EXPECT_LE(task.latency->value, 100.0);
        EXPECT_GE(*task.required_cpu_millicores, 500u);
        EXPECT_LE(*task.required_cpu_millicores, 1000u);
        EXPECT_FALSE(task.requires_gpu);
    }
}

TEST(TaskGeneratorTest, SensorAlertUsesOrdinalLatency) {
    std::mt19937 rng(2);
    for (size_t i = 0; i < 50; ++i) {
        auto task = TaskGenerator::make_task("sensor_alert", rng, i);
        ASSERT_TRUE(task.latency.has_value());
        EXPECT_EQ(task.latency->kind, LatencyRequirement::Kind::Ordinal);
        EXPECT_GE(task.latency_ordinal(), 9);
        EXPECT_GE(task.priority, 8);
        EXPECT_LE(*task.required_memory_mb, 128u);
    }
}

TEST(TaskGeneratorTest, TrainingAlwaysNeedsGpu) {
    std::mt19937 rng(3);
    for (size_t i = 0; i < 50; ++i) {
        auto task = TaskGenerator::make_task("ml_training", rng, i);
        EXPECT_TRUE(task.requires_gpu);
        EXPECT_LE(task.latency_ordinal(), 3);
        EXPECT_GE(*task.required_memory_mb, 8192u);
        EXPECT_GE(task.cost_sensitivity, 4);
        EXPECT_LE(task.cost_sensitivity, 8);
    }
}

TEST(TaskGeneratorTest, ImageClassificationMostlyGpu) {
    std::mt19937 rng(4);
    int gpu = 0;
    constexpr int kSamples = 1000;
    for (int i = 0; i < kSamples; ++i) {
        if (TaskGenerator::make_task("image_classification", rng, static_cast<size_t>(i)).requires_gpu) ++gpu;
    }
    EXPECT_GT(gpu, 700);
    EXPECT_LT(gpu, 900);
}

TEST(TaskGeneratorTest, DailyReportIsCostAverse) {
    std::mt19937 rng(5);
    auto task = TaskGenerator::make_task("daily_report", rng, 0);
    EXPECT_LE(task.priority, 3);
    EXPECT_GE(task.cost_sensitivity, 8);
    EXPECT_GE(*task.latency_ceiling_ms(), 1000.0);
}

TEST(TaskGeneratorTest, UnknownTypeKeepsDefaults) {
    std::mt19937 rng(6);
    auto task = TaskGenerator::make_task("batch_export", rng, 3);
    EXPECT_EQ(task.task_type, "batch_export");
    EXPECT_EQ(task.priority, 5);
    EXPECT_EQ(task.cost_sensitivity, 5);
    EXPECT_FALSE(task.latency.has_value());
    EXPECT_FALSE(task.required_cpu_millicores.has_value());
    EXPECT_FALSE(task.requires_gpu);
}

TEST(TaskGeneratorTest, BatchIsDeterministicPerSeed) {
    std::mt19937 a(77);
    std::mt19937 b(77);
    auto first = TaskGenerator::batch(40, a);
    auto second = TaskGenerator::batch(40, b);
    ASSERT_EQ(first.size(), 40u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.back().id, "task-0039");
}

TEST(TaskGeneratorTest, BatchCoversEveryType) {
    std::mt19937 rng(8);
    std::set<std::string> seen;
    for (const auto& task : TaskGenerator::batch(200, rng)) {
        seen.insert(task.task_type);
    }
    EXPECT_EQ(seen.size(), TaskGenerator::kTaskTypes.size());
}

TEST(TaskGeneratorTest, GeneratedTasksAreValid) {
    std::mt19937 rng(9);
    for (const auto& task : TaskGenerator::batch(300, rng)) {
        auto valid = DecisionEngine::validate_task(task);
        EXPECT_TRUE(valid.has_value()) << valid.error().describe();
    }
}
