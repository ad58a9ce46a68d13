/**
 * @file task_generator.cpp
 * @brief TaskGenerator implementation.
 */

#include "workload/task_generator.hpp"

#include <format>

namespace workload_router {

namespace {

int uniform_int(std::mt19937& rng, int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

uint64_t uniform_u64(std::mt19937& rng, uint64_t lo, uint64_t hi) {
    std::uniform_int_distribution<uint64_t> dist(lo, hi);
    return dist(rng);
}

double uniform_real(std::mt19937& rng, double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

}  // anonymous namespace

TaskDescriptor TaskGenerator::make_task(std::string_view task_type, std::mt19937& rng, size_t index) {
    TaskDescriptor task{
        .id = std::format("task-{:04}", index),
        .task_type = std::string{task_type}
    };

    if (task_type == "fraud_detection") {
        task.priority = uniform_int(rng, 7, 10);
        task.latency = LatencyRequirement::milliseconds(uniform_real(rng, 20.0, 100.0));
        task.required_cpu_millicores = uniform_u64(rng, 500, 1000);
        task.required_memory_mb = uniform_u64(rng, 256, 512);
        task.cost_sensitivity = uniform_int(rng, 3, 6);
    } else if (task_type == "sensor_alert") {
        task.priority = uniform_int(rng, 8, 10);
        task.latency = LatencyRequirement::ordinal(uniform_int(rng, 9, 10));
        task.required_cpu_millicores = uniform_u64(rng, 100, 300);
        task.required_memory_mb = uniform_u64(rng, 64, 128);
        task.cost_sensitivity = uniform_int(rng, 2, 5);
    } else if (task_type == "image_classification") {
        task.priority = uniform_int(rng, 4, 7);
        task.latency = LatencyRequirement::milliseconds(uniform_real(rng, 200.0, 800.0));
        task.required_cpu_millicores = uniform_u64(rng, 1000, 2000);
        task.required_memory_mb = uniform_u64(rng, 1024, 4096);
        task.requires_gpu = std::bernoulli_distribution(0.8)(rng);
        task.cost_sensitivity = uniform_int(rng, 3, 6);
    } else if (task_type == "ml_training") {
        task.priority = uniform_int(rng, 2, 5);
        task.latency = LatencyRequirement::ordinal(uniform_int(rng, 1, 3));
        task.required_cpu_millicores = uniform_u64(rng, 4000, 8000);
        task.required_memory_mb = uniform_u64(rng, 8192, 16384);
        task.requires_gpu = true;
        task.cost_sensitivity = uniform_int(rng, 4, 8);
    } else if (task_type == "daily_report") {
        task.priority = uniform_int(rng, 1, 3);
        task.latency = LatencyRequirement::milliseconds(uniform_real(rng, 1000.0, 5000.0));
        task.required_cpu_millicores = uniform_u64(rng, 500, 1500);
        task.required_memory_mb = uniform_u64(rng, 512, 2048);
        task.cost_sensitivity = uniform_int(rng, 8, 10);
    }

    return task;
}

TaskDescriptor TaskGenerator::random_task(std::mt19937& rng, size_t index) {
    auto type_index = static_cast<size_t>(uniform_int(rng, 0, static_cast<int>(kTaskTypes.size()) - 1));
    return make_task(kTaskTypes[type_index], rng, index);
}

std::vector<TaskDescriptor> TaskGenerator::batch(size_t count, std::mt19937& rng) {
    std::vector<TaskDescriptor> tasks;
    tasks.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        tasks.push_back(random_task(rng, i));
    }
    return tasks;
}

}  // namespace workload_router
