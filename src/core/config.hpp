/**
 * @file config.hpp
 * @brief Router configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace workload_router {

struct EngineConfig {
    ScoringStrategyKind strategy = ScoringStrategyKind::Heuristic;
    double tie_epsilon = 1e-6;
    double reference_latency_ms = 500.0;    ///< Latency ceiling when a task states none
    uint64_t default_cpu_millicores = 500;  ///< Reserved when a task states no CPU
    uint64_t default_memory_mb = 256;       ///< Reserved when a task states no memory

    [[nodiscard]] ResourceAmount default_reservation() const noexcept {
        return ResourceAmount{default_cpu_millicores, default_memory_mb};
    }
};

/**
 * @brief Heuristic scorer weights; must sum to 1.0.
 */
struct ScoringWeights {
    double headroom = 0.30;
    double latency = 0.25;
    double cost = 0.25;
    double affinity = 0.20;

    [[nodiscard]] constexpr double sum() const noexcept {
        return headroom + latency + cost + affinity;
    }

    [[nodiscard]] constexpr double weight(ScoreDimension dimension) const noexcept {
        switch (dimension) {
            case ScoreDimension::Headroom: return headroom;
            case ScoreDimension::Latency:  return latency;
            case ScoreDimension::Cost:     return cost;
            case ScoreDimension::Affinity: return affinity;
            case ScoreDimension::ClassifierProbability: return 0.0;
        }
        return 0.0;
    }
};

struct BlendedScorerConfig {
    double classifier_weight = 0.5;         ///< α in α·classifier + (1−α)·heuristic
};

struct ScorerConfig {
    ScoringWeights weights;
    BlendedScorerConfig blended;
};

struct ClassifierConfig {
    std::filesystem::path artifact_path = "models/router_v1.toml";
};

struct SimulationConfig {
    uint32_t seed = 42;
    uint32_t interval_ms = 2000;
    double failure_rate = 0.02;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    uint32_t decision_history_limit = 1000;
};

/**
 * @brief Top-level router configuration.
 */
struct Config {
    EngineConfig engine;
    ScorerConfig scorer;
    ClassifierConfig classifier;
    EnvironmentSignals environment;
    std::vector<NodeState> nodes;           ///< Seed fleet registered at startup
    SimulationConfig simulation;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Sections that are absent keep their defaults. A file without any
 * [[nodes]] entries leaves the node list empty.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration with the standard five-node fleet.
 */
Config default_config();

/**
 * @brief The standard fleet: two edge nodes, two cloud regions, one GPU cluster.
 */
std::vector<NodeState> default_fleet();

}  // namespace workload_router
