/**
 * @file execution_simulator.hpp
 * @brief Stand-in execution collaborator producing ExecutionOutcomes.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>
#include <random>
#include <string_view>

namespace workload_router {

/**
 * @brief Simulates running a dispatched task on a node of a given category.
 *
 * Latency is drawn from the category's base range (edge 50–150 ms, cloud
 * 200–500 ms, gpu 300–600 ms) and scaled by a per-task-type multiplier; GPU
 * nodes accelerate image_classification and ml_training, edge nodes suit
 * alerting. Cost is the category's base price times the same multiplier and
 * the environment's cost multiplier.
 */
class ExecutionSimulator {
public:
    explicit ExecutionSimulator(uint32_t seed = 42, double failure_rate = 0.0);

    ExecutionOutcome execute(const TaskDescriptor& task, NodeCategory category,
                             double cost_multiplier = 1.0);

    /// 1.0 for task types without a profile.
    [[nodiscard]] static double task_multiplier(std::string_view task_type, NodeCategory category) noexcept;
    [[nodiscard]] static double base_cost(NodeCategory category) noexcept;

private:
    std::mutex mutex_;
    std::mt19937 rng_;
    double failure_rate_;
};

}  // namespace workload_router
