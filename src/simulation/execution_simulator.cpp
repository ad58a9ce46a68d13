/**
 * @file execution_simulator.cpp
 * @brief ExecutionSimulator implementation.
 */

#include "simulation/execution_simulator.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace workload_router {

namespace {

struct TaskProfile {
    std::string_view task_type;
    double edge;
    double cloud;
    double gpu;
};

constexpr std::array<TaskProfile, 5> kProfiles = {{
    {"fraud_detection",      0.8, 1.0, 1.2},
    {"sensor_alert",         0.6, 1.3, 1.5},
    {"image_classification", 1.5, 0.9, 0.4},
    {"ml_training",          2.0, 1.1, 0.3},
    {"daily_report",         1.2, 0.7, 1.3},
}};

struct LatencyRange {
    double lo_ms;
    double hi_ms;
};

constexpr LatencyRange base_latency(NodeCategory category) noexcept {
    switch (category) {
        case NodeCategory::Edge:  return {50.0, 150.0};
        case NodeCategory::Cloud: return {200.0, 500.0};
        case NodeCategory::Gpu:   return {300.0, 600.0};
    }
    return {100.0, 300.0};
}

}  // anonymous namespace

ExecutionSimulator::ExecutionSimulator(uint32_t seed, double failure_rate)
    : rng_(seed), failure_rate_(std::clamp(failure_rate, 0.0, 1.0)) {}

double ExecutionSimulator::task_multiplier(std::string_view task_type, NodeCategory category) noexcept {
    for (const auto& profile : kProfiles) {
        if (profile.task_type != task_type) continue;
        switch (category) {
            case NodeCategory::Edge:  return profile.edge;
            case NodeCategory::Cloud: return profile.cloud;
            case NodeCategory::Gpu:   return profile.gpu;
        }
    }
    return 1.0;
}

double ExecutionSimulator::base_cost(NodeCategory category) noexcept {
    switch (category) {
        case NodeCategory::Edge:  return 0.01;
        case NodeCategory::Cloud: return 0.025;
        case NodeCategory::Gpu:   return 0.05;
    }
    return 0.0;
}

ExecutionOutcome ExecutionSimulator::execute(const TaskDescriptor& task, NodeCategory category,
                                             double cost_multiplier) {
    double multiplier = task_multiplier(task.task_type, category);
    auto range = base_latency(category);

    double latency = 0.0;
    bool failed = false;
    {
        std::lock_guard lock(mutex_);
        std::uniform_real_distribution<double> latency_dist(range.lo_ms, range.hi_ms);
        latency = latency_dist(rng_) * multiplier;
        std::bernoulli_distribution failure(failure_rate_);
        failed = failure(rng_);
    }

    ExecutionOutcome outcome{
        .success = !failed,
        .latency_ms = latency,
        .cost = base_cost(category) * multiplier * cost_multiplier,
        .error_message = std::nullopt
    };
    if (failed) {
        outcome.error_message = "simulated failure of " + task.task_type + " on "
                                + std::string{to_string(category)} + " node";
    }
    return outcome;
}

}  // namespace workload_router
