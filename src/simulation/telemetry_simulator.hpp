/**
 * @file telemetry_simulator.hpp
 * @brief Synthetic telemetry source driving NodeRegistry updates.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "registry/node_registry.hpp"

#include <mutex>
#include <random>
#include <stop_token>
#include <thread>

namespace workload_router {

/**
 * @brief Bounded random walk over every non-offline node.
 *
 * Per tick: CPU moves by up to ±5 points, memory by up to ±2 points;
 * latency spikes by 50–200 ms with 5% probability, otherwise decays toward
 * a per-category baseline (10 ms edge, 80 ms elsewhere). Seeded, so a given
 * seed and fleet always produce the same sequence when ticked manually.
 */
class TelemetrySimulator {
public:
    static constexpr double kCpuStep = 5.0;
    static constexpr double kMemoryStep = 2.0;
    static constexpr double kSpikeProbability = 0.05;
    static constexpr double kLatencyDecay = 0.9;

    TelemetrySimulator(NodeRegistry& registry, Logger& logger, SimulationConfig config = {});
    ~TelemetrySimulator();

    TelemetrySimulator(const TelemetrySimulator&) = delete;
    TelemetrySimulator& operator=(const TelemetrySimulator&) = delete;

    /// One random-walk step; returns the number of nodes updated.
    size_t tick();

    /// Scatter load and latency across each category's typical range.
    size_t randomize_initial();

    /// Tick every interval_ms on a background thread until stop().
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return worker_.joinable(); }

    [[nodiscard]] static double baseline_latency_ms(NodeCategory category) noexcept {
        return category == NodeCategory::Edge ? 10.0 : 80.0;
    }

private:
    void run_loop(std::stop_token stop);
    double uniform(double lo, double hi);

    NodeRegistry& registry_;
    Logger& logger_;
    SimulationConfig config_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
    std::jthread worker_;
};

static_assert(TelemetrySourceLike<TelemetrySimulator>);

}  // namespace workload_router
