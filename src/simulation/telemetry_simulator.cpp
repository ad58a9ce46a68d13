/**
 * @file telemetry_simulator.cpp
 * @brief TelemetrySimulator implementation.
 */

#include "simulation/telemetry_simulator.hpp"

#include <chrono>
#include <condition_variable>

namespace workload_router {

namespace {

struct InitialRange {
    double cpu_lo, cpu_hi;
    double memory_lo, memory_hi;
    double latency_lo, latency_hi;
};

constexpr InitialRange initial_range(NodeCategory category) noexcept {
    switch (category) {
        case NodeCategory::Edge:  return {10, 40, 20, 50, 5, 20};
        case NodeCategory::Cloud: return {20, 60, 30, 70, 50, 150};
        case NodeCategory::Gpu:   return {10, 50, 40, 80, 60, 160};
    }
    return {0, 100, 0, 100, 0, 100};
}

}  // anonymous namespace

TelemetrySimulator::TelemetrySimulator(NodeRegistry& registry, Logger& logger,
                                       SimulationConfig config)
    : registry_(registry), logger_(logger), config_(config), rng_(config.seed) {}

TelemetrySimulator::~TelemetrySimulator() {
    stop();
}

double TelemetrySimulator::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

size_t TelemetrySimulator::tick() {
    auto snapshot = registry_.snapshot();
    size_t applied = 0;

    std::lock_guard lock(rng_mutex_);
    for (const auto& node : snapshot.nodes) {
        if (node.status == NodeStatus::Offline) continue;

        TelemetryUpdate update;
        update.load = LoadReport{
            .mode = LoadReport::Mode::Delta,
            .cpu_percent = uniform(-kCpuStep, kCpuStep),
            .memory_percent = uniform(-kMemoryStep, kMemoryStep)
        };

        std::bernoulli_distribution spike(kSpikeProbability);
        if (spike(rng_)) {
            update.latency_ms = node.latency_ms + uniform(50.0, 200.0);
        } else {
            update.latency_ms = node.latency_ms * kLatencyDecay
                              + baseline_latency_ms(node.category) * (1.0 - kLatencyDecay);
        }

        auto result = registry_.update_telemetry(node.id, update);
        if (result) {
            ++applied;
        } else {
            // Node removed between snapshot and update
            logger_.debug("Telemetry tick skipped " + node.id + ": " + result.error().message);
        }
    }
    return applied;
}

size_t TelemetrySimulator::randomize_initial() {
    auto snapshot = registry_.snapshot();
    size_t applied = 0;

    std::lock_guard lock(rng_mutex_);
    for (const auto& node : snapshot.nodes) {
        auto range = initial_range(node.category);
        TelemetryUpdate update;
        update.load = LoadReport{
            .mode = LoadReport::Mode::Absolute,
            .cpu_percent = uniform(range.cpu_lo, range.cpu_hi),
            .memory_percent = uniform(range.memory_lo, range.memory_hi)
        };
        update.latency_ms = uniform(range.latency_lo, range.latency_hi);

        auto result = registry_.update_telemetry(node.id, update);
        if (result) {
            ++applied;
        } else {
            logger_.debug("Initial telemetry skipped " + node.id + ": " + result.error().message);
        }
    }
    return applied;
}

void TelemetrySimulator::start() {
    if (worker_.joinable()) return;
    logger_.info("Telemetry simulator started: interval=" + std::to_string(config_.interval_ms) + "ms");
    worker_ = std::jthread([this](std::stop_token stop) {
        run_loop(stop);
    });
}

void TelemetrySimulator::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
        worker_ = std::jthread{};
    }
}

void TelemetrySimulator::run_loop(std::stop_token stop) {
    std::mutex wait_mutex;
    std::condition_variable_any wake;
    while (!stop.stop_requested()) {
        tick();
        std::unique_lock lock(wait_mutex);
        wake.wait_for(lock, stop, std::chrono::milliseconds(config_.interval_ms),
                      [] { return false; });
    }
}

}  // namespace workload_router
