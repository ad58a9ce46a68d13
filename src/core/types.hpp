/**
 * @file types.hpp
 * @brief Fundamental types used throughout WorkloadRouter.
 *
 * Defines identity types, node categories and status, task descriptors,
 * node state and the routing decision record. All types are designed for
 * value semantics so snapshots and decisions can be copied freely.
 */

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workload_router {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// ─────────────────────────────────────────────
// Node Category & Status
// ─────────────────────────────────────────────

enum class NodeCategory : uint8_t {
    Edge,
    Cloud,
    Gpu
};

inline constexpr std::array<NodeCategory, 3> kAllCategories = {
    NodeCategory::Edge, NodeCategory::Cloud, NodeCategory::Gpu
};

[[nodiscard]] constexpr std::string_view to_string(NodeCategory category) noexcept {
    switch (category) {
        case NodeCategory::Edge:  return "edge";
        case NodeCategory::Cloud: return "cloud";
        case NodeCategory::Gpu:   return "gpu";
    }
    return "unknown";
}

/// Accepts "edge", "cloud", "gpu" and the long form "gpu-accelerated".
[[nodiscard]] constexpr std::optional<NodeCategory> parse_node_category(std::string_view text) noexcept {
    if (text == "edge") return NodeCategory::Edge;
    if (text == "cloud") return NodeCategory::Cloud;
    if (text == "gpu" || text == "gpu-accelerated") return NodeCategory::Gpu;
    return std::nullopt;
}

enum class NodeStatus : uint8_t {
    Active,
    Degraded,
    Offline
};

[[nodiscard]] constexpr std::string_view to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Active:   return "active";
        case NodeStatus::Degraded: return "degraded";
        case NodeStatus::Offline:  return "offline";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<NodeStatus> parse_node_status(std::string_view text) noexcept {
    if (text == "active") return NodeStatus::Active;
    if (text == "degraded") return NodeStatus::Degraded;
    if (text == "offline") return NodeStatus::Offline;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Resource Amounts
// ─────────────────────────────────────────────

/**
 * @brief An absolute quantity of CPU and memory.
 *
 * Integer units keep reserve/release arithmetic exact.
 */
struct ResourceAmount {
    uint64_t cpu_millicores{0};
    uint64_t memory_mb{0};

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return cpu_millicores == 0 && memory_mb == 0;
    }

    auto operator<=>(const ResourceAmount&) const = default;
};

// ─────────────────────────────────────────────
// Latency Requirement
// ─────────────────────────────────────────────

/**
 * @brief Maximum acceptable latency, stated either in milliseconds or as an
 *        ordinal sensitivity 1–10 (10 = tightest).
 *
 * Both forms are interchangeable through a fixed bucket table: ordinal N
 * corresponds to the millisecond ceiling of its bucket. Ordinal 1 has no
 * ceiling.
 */
struct LatencyRequirement {
    enum class Kind : uint8_t {
        Milliseconds,
        Ordinal
    };

    Kind kind{Kind::Ordinal};
    double value{5.0};

    struct Bucket {
        int ordinal;
        double ceiling_ms;
    };

    /// Ordered tightest first.
    static constexpr std::array<Bucket, 9> kBuckets = {{
        {10, 10.0}, {9, 25.0}, {8, 50.0}, {7, 100.0}, {6, 200.0},
        {5, 400.0}, {4, 800.0}, {3, 1600.0}, {2, 3200.0}
    }};

    [[nodiscard]] static constexpr LatencyRequirement milliseconds(double ms) noexcept {
        return LatencyRequirement{Kind::Milliseconds, ms};
    }

    [[nodiscard]] static constexpr LatencyRequirement ordinal(int level) noexcept {
        return LatencyRequirement{Kind::Ordinal, static_cast<double>(level)};
    }

    [[nodiscard]] constexpr int as_ordinal() const noexcept {
        if (kind == Kind::Ordinal) {
            return std::clamp(static_cast<int>(value), 1, 10);
        }
        for (const auto& bucket : kBuckets) {
            if (value <= bucket.ceiling_ms) return bucket.ordinal;
        }
        return 1;
    }

    [[nodiscard]] constexpr std::optional<double> ceiling_ms() const noexcept {
        if (kind == Kind::Milliseconds) return value;
        int level = as_ordinal();
        for (const auto& bucket : kBuckets) {
            if (bucket.ordinal == level) return bucket.ceiling_ms;
        }
        return std::nullopt;
    }

    bool operator==(const LatencyRequirement&) const = default;
};

// ─────────────────────────────────────────────
// Task Descriptor
// ─────────────────────────────────────────────

/**
 * @brief A unit of work to be routed. Immutable once submitted.
 */
struct TaskDescriptor {
    TaskId id;
    std::string task_type;
    int priority{5};                                  ///< 1–10, higher = more urgent
    std::optional<LatencyRequirement> latency;
    std::optional<uint64_t> required_cpu_millicores;
    std::optional<uint64_t> required_memory_mb;
    bool requires_gpu{false};
    int cost_sensitivity{5};                          ///< 1–10, higher = more cost-averse

    static constexpr int kDefaultLatencyOrdinal = 5;

    [[nodiscard]] constexpr int latency_ordinal() const noexcept {
        return latency ? latency->as_ordinal() : kDefaultLatencyOrdinal;
    }

    [[nodiscard]] constexpr std::optional<double> latency_ceiling_ms() const noexcept {
        return latency ? latency->ceiling_ms() : std::nullopt;
    }

    /// Resources to reserve at dispatch; unspecified dimensions use the fallback.
    [[nodiscard]] constexpr ResourceAmount requested_resources(ResourceAmount fallback) const noexcept {
        return ResourceAmount{
            .cpu_millicores = required_cpu_millicores.value_or(fallback.cpu_millicores),
            .memory_mb = required_memory_mb.value_or(fallback.memory_mb)
        };
    }

    bool operator==(const TaskDescriptor&) const = default;
};

// ─────────────────────────────────────────────
// Node State
// ─────────────────────────────────────────────

/**
 * @brief Current state of one execution node.
 *
 * Owned by NodeRegistry. Telemetry load is the share reported by the node;
 * `reserved` holds capacity claimed by in-flight dispatches. Effective load
 * is the sum of both.
 */
struct NodeState {
    NodeId id;
    NodeCategory category{NodeCategory::Edge};
    NodeStatus status{NodeStatus::Active};

    uint64_t max_cpu_millicores{0};
    uint64_t max_memory_mb{0};

    double cpu_load_percent{0.0};                     ///< Telemetry [0.0, 100.0]
    double memory_load_percent{0.0};                  ///< Telemetry [0.0, 100.0]
    ResourceAmount reserved{};

    double latency_ms{0.0};                           ///< Current network latency estimate
    double cost_per_task{0.0};
    double cost_per_hour{0.0};
    bool gpu_available{false};
    std::string location;

    [[nodiscard]] double cpu_used_millicores() const noexcept {
        return cpu_load_percent / 100.0 * static_cast<double>(max_cpu_millicores)
               + static_cast<double>(reserved.cpu_millicores);
    }

    [[nodiscard]] double memory_used_mb() const noexcept {
        return memory_load_percent / 100.0 * static_cast<double>(max_memory_mb)
               + static_cast<double>(reserved.memory_mb);
    }

    [[nodiscard]] double cpu_available_millicores() const noexcept {
        return std::max(0.0, static_cast<double>(max_cpu_millicores) - cpu_used_millicores());
    }

    [[nodiscard]] double memory_available_mb() const noexcept {
        return std::max(0.0, static_cast<double>(max_memory_mb) - memory_used_mb());
    }

    [[nodiscard]] double cpu_load_fraction() const noexcept {
        if (max_cpu_millicores == 0) return 1.0;
        return std::clamp(cpu_used_millicores() / static_cast<double>(max_cpu_millicores), 0.0, 1.0);
    }

    [[nodiscard]] double memory_load_fraction() const noexcept {
        if (max_memory_mb == 0) return 1.0;
        return std::clamp(memory_used_mb() / static_cast<double>(max_memory_mb), 0.0, 1.0);
    }

    /// Fraction of unused capacity on the most loaded resource.
    [[nodiscard]] double headroom() const noexcept {
        return 1.0 - std::max(cpu_load_fraction(), memory_load_fraction());
    }

    bool operator==(const NodeState&) const = default;
};

// ─────────────────────────────────────────────
// Environment Signals
// ─────────────────────────────────────────────

/**
 * @brief Ambient values captured alongside node state at decision time.
 */
struct EnvironmentSignals {
    double network_latency_ms{100.0};
    double edge_cost_multiplier{1.0};
    double cloud_cost_multiplier{2.5};
    double gpu_cost_multiplier{5.0};

    [[nodiscard]] constexpr double cost_multiplier(NodeCategory category) const noexcept {
        switch (category) {
            case NodeCategory::Edge:  return edge_cost_multiplier;
            case NodeCategory::Cloud: return cloud_cost_multiplier;
            case NodeCategory::Gpu:   return gpu_cost_multiplier;
        }
        return 1.0;
    }

    bool operator==(const EnvironmentSignals&) const = default;
};

// ─────────────────────────────────────────────
// Scoring Vocabulary
// ─────────────────────────────────────────────

enum class ScoringStrategyKind : uint8_t {
    Heuristic,
    Classifier,
    Blended
};

[[nodiscard]] constexpr std::string_view to_string(ScoringStrategyKind kind) noexcept {
    switch (kind) {
        case ScoringStrategyKind::Heuristic:  return "heuristic";
        case ScoringStrategyKind::Classifier: return "classifier";
        case ScoringStrategyKind::Blended:    return "blended";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ScoringStrategyKind> parse_strategy(std::string_view text) noexcept {
    if (text == "heuristic") return ScoringStrategyKind::Heuristic;
    if (text == "classifier") return ScoringStrategyKind::Classifier;
    if (text == "blended") return ScoringStrategyKind::Blended;
    return std::nullopt;
}

/// Heuristic scoring dimensions, in weight-table order.
enum class ScoreDimension : uint8_t {
    Headroom,
    Latency,
    Cost,
    Affinity,
    ClassifierProbability    ///< Not a heuristic sub-score; classifier and blended margins only
};

inline constexpr std::array<ScoreDimension, 4> kAllDimensions = {
    ScoreDimension::Headroom, ScoreDimension::Latency,
    ScoreDimension::Cost, ScoreDimension::Affinity
};

[[nodiscard]] constexpr std::string_view to_string(ScoreDimension dimension) noexcept {
    switch (dimension) {
        case ScoreDimension::Headroom: return "resource headroom";
        case ScoreDimension::Latency:  return "latency fitness";
        case ScoreDimension::Cost:     return "cost efficiency";
        case ScoreDimension::Affinity: return "priority/category affinity";
        case ScoreDimension::ClassifierProbability: return "classifier probability";
    }
    return "unknown";
}

/**
 * @brief Normalized [0,1] heuristic sub-scores for one candidate.
 */
struct SubScores {
    double headroom{0.0};
    double latency{0.0};
    double cost{0.0};
    double affinity{0.0};

    [[nodiscard]] constexpr double get(ScoreDimension dimension) const noexcept {
        switch (dimension) {
            case ScoreDimension::Headroom: return headroom;
            case ScoreDimension::Latency:  return latency;
            case ScoreDimension::Cost:     return cost;
            case ScoreDimension::Affinity: return affinity;
            case ScoreDimension::ClassifierProbability: return 0.0;
        }
        return 0.0;
    }

    bool operator==(const SubScores&) const = default;
};

struct CandidateScore {
    NodeId node_id;
    NodeCategory category{NodeCategory::Edge};
    double score{0.0};
    SubScores breakdown;
    double probability{0.0};                          ///< Classifier probability of `category`; 0 when unused

    bool operator==(const CandidateScore&) const = default;
};

// ─────────────────────────────────────────────
// Routing Decision
// ─────────────────────────────────────────────

/**
 * @brief The result of routing one task. Immutable once produced.
 *
 * `scores` keeps filtering order.
 */
struct RoutingDecision {
    TaskId task_id;
    NodeId chosen_node;
    NodeCategory chosen_category{NodeCategory::Edge};
    double confidence{0.0};
    std::vector<CandidateScore> scores;
    std::string rationale;
    ScoreDimension decisive_dimension{ScoreDimension::Headroom};
    ScoringStrategyKind strategy{ScoringStrategyKind::Heuristic};
    bool degraded{false};
    uint64_t snapshot_generation{0};
    Timestamp decided_at;

    [[nodiscard]] std::optional<double> score_for(const NodeId& node) const {
        for (const auto& entry : scores) {
            if (entry.node_id == node) return entry.score;
        }
        return std::nullopt;
    }
};

// ─────────────────────────────────────────────
// Decision Lifecycle
// ─────────────────────────────────────────────

enum class DecisionStage : uint8_t {
    Received,      ///< Task accepted for validation
    Featurized,    ///< Feature vector extracted
    Filtered,      ///< Hard constraints applied
    Scored,        ///< Candidates ranked
    Dispatched,    ///< Capacity reserved, handle issued
    Completed,     ///< Execution reported success
    Failed         ///< Terminal failure at any stage
};

[[nodiscard]] constexpr std::string_view to_string(DecisionStage stage) noexcept {
    switch (stage) {
        case DecisionStage::Received:   return "received";
        case DecisionStage::Featurized: return "featurized";
        case DecisionStage::Filtered:   return "filtered";
        case DecisionStage::Scored:     return "scored";
        case DecisionStage::Dispatched: return "dispatched";
        case DecisionStage::Completed:  return "completed";
        case DecisionStage::Failed:     return "failed";
    }
    return "unknown";
}

/**
 * @brief Execution result reported back by the dispatch collaborator.
 */
struct ExecutionOutcome {
    bool success{false};
    double latency_ms{0.0};
    double cost{0.0};
    std::optional<std::string> error_message;
};

}  // namespace workload_router
