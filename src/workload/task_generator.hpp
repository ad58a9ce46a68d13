/**
 * @file task_generator.hpp
 * @brief Synthetic task streams for demos, tests and benchmarks.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <random>
#include <string_view>
#include <vector>

namespace workload_router {

/**
 * @brief Factory for plausible tasks of the five standard workload types.
 *
 * | type                 | priority | latency        | GPU   | cost sens. |
 * |----------------------|----------|----------------|-------|------------|
 * | fraud_detection      | 7–10     | 20–100 ms      | no    | 3–6        |
 * | sensor_alert         | 8–10     | ordinal 9–10   | no    | 2–5        |
 * | image_classification | 4–7      | 200–800 ms     | 80%   | 3–6        |
 * | ml_training          | 2–5      | ordinal 1–3    | yes   | 4–8        |
 * | daily_report         | 1–3      | 1000–5000 ms   | no    | 8–10       |
 */
class TaskGenerator {
public:
    static constexpr std::array<std::string_view, 5> kTaskTypes = {
        "fraud_detection", "sensor_alert", "image_classification", "ml_training", "daily_report"
    };

    /// Task of a uniformly chosen type, id "task-<index>".
    static TaskDescriptor random_task(std::mt19937& rng, size_t index);

    /// Task of a specific type; unknown types get neutral defaults.
    static TaskDescriptor make_task(std::string_view task_type, std::mt19937& rng, size_t index);

    static std::vector<TaskDescriptor> batch(size_t count, std::mt19937& rng);
};

}  // namespace workload_router
