/**
 * @file candidate_filter.hpp
 * @brief Hard-constraint filtering of nodes for a task.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/metrics_snapshot.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace workload_router {

enum class Constraint : uint8_t {
    NodeNotActive,
    InsufficientCpu,
    InsufficientMemory,
    GpuUnavailable,
    LatencyTooHigh
};

[[nodiscard]] constexpr std::string_view to_string(Constraint constraint) noexcept {
    switch (constraint) {
        case Constraint::NodeNotActive:      return "node_not_active";
        case Constraint::InsufficientCpu:    return "insufficient_cpu";
        case Constraint::InsufficientMemory: return "insufficient_memory";
        case Constraint::GpuUnavailable:     return "gpu_unavailable";
        case Constraint::LatencyTooHigh:     return "latency_too_high";
    }
    return "unknown";
}

struct ConstraintViolation {
    Constraint constraint;
    std::string detail;
};

struct NodeRejection {
    NodeId node_id;
    std::vector<ConstraintViolation> violations;

    [[nodiscard]] bool violates(Constraint constraint) const noexcept;

    /// "Cloud-01: gpu_unavailable (no GPU available); latency_too_high (...)"
    [[nodiscard]] std::string describe() const;
};

struct FilterOutcome {
    std::vector<NodeState> candidates;                ///< Snapshot order
    std::vector<NodeRejection> rejections;            ///< Snapshot order
};

/**
 * @brief Pure filter: a node survives only if it meets every hard constraint.
 *
 * Constraints: status active; available CPU/memory cover the amount a
 * dispatch would reserve; GPU available when required; latency within the
 * task's ceiling. All unmet constraints are collected per node.
 *
 * The reserved amount is the task's stated requirement per dimension, or
 * `fallback` where the task states none (see TaskDescriptor::requested_resources).
 * A zero amount is not checked.
 */
class CandidateFilter {
public:
    /// Fails with NoEligibleNode, one detail line per rejected node, when nothing survives.
    static Result<FilterOutcome> apply(const TaskDescriptor& task,
                                       const MetricsSnapshot& snapshot,
                                       const ResourceAmount& fallback = {});

    [[nodiscard]] static std::vector<ConstraintViolation> check(const TaskDescriptor& task,
                                                                const NodeState& node,
                                                                const ResourceAmount& fallback = {});
};

}  // namespace workload_router
