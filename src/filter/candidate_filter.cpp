/**
 * @file candidate_filter.cpp
 * @brief CandidateFilter implementation.
 */

#include "filter/candidate_filter.hpp"

#include <algorithm>
#include <format>

namespace workload_router {

bool NodeRejection::violates(Constraint constraint) const noexcept {
    return std::any_of(violations.begin(), violations.end(),
                       [constraint](const ConstraintViolation& v) { return v.constraint == constraint; });
}

std::string NodeRejection::describe() const {
    std::string out = node_id + ": ";
    for (size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) out += "; ";
        out += to_string(violations[i].constraint);
        out += " (";
        out += violations[i].detail;
        out += ")";
    }
    return out;
}

std::vector<ConstraintViolation> CandidateFilter::check(const TaskDescriptor& task,
                                                        const NodeState& node,
                                                        const ResourceAmount& fallback) {
    std::vector<ConstraintViolation> violations;

    if (node.status != NodeStatus::Active) {
        violations.push_back({Constraint::NodeNotActive,
                              std::format("status {}", to_string(node.status))});
    }

    auto demand = task.requested_resources(fallback);

    if (demand.cpu_millicores > 0) {
        double available = node.cpu_available_millicores();
        if (static_cast<double>(demand.cpu_millicores) > available) {
            violations.push_back({Constraint::InsufficientCpu,
                                  std::format("needs {}m, {:.0f}m available",
                                              demand.cpu_millicores, available)});
        }
    }

    if (demand.memory_mb > 0) {
        double available = node.memory_available_mb();
        if (static_cast<double>(demand.memory_mb) > available) {
            violations.push_back({Constraint::InsufficientMemory,
                                  std::format("needs {}MB, {:.0f}MB available",
                                              demand.memory_mb, available)});
        }
    }

    if (task.requires_gpu && !node.gpu_available) {
        violations.push_back({Constraint::GpuUnavailable, "no GPU available"});
    }

    if (auto ceiling = task.latency_ceiling_ms(); ceiling && node.latency_ms > *ceiling) {
        violations.push_back({Constraint::LatencyTooHigh,
                              std::format("{:.1f}ms exceeds {:.1f}ms", node.latency_ms, *ceiling)});
    }

    return violations;
}

Result<FilterOutcome> CandidateFilter::apply(const TaskDescriptor& task,
                                             const MetricsSnapshot& snapshot,
                                             const ResourceAmount& fallback) {
    FilterOutcome outcome;

    for (const auto& node : snapshot.nodes) {
        auto violations = check(task, node, fallback);
        if (violations.empty()) {
            outcome.candidates.push_back(node);
        } else {
            outcome.rejections.push_back(NodeRejection{node.id, std::move(violations)});
        }
    }

    if (outcome.candidates.empty()) {
        std::vector<std::string> details;
        details.reserve(outcome.rejections.size());
        for (const auto& rejection : outcome.rejections) {
            details.push_back(rejection.describe());
        }
        auto message = snapshot.nodes.empty()
            ? std::format("No eligible node for task {}: no nodes registered", task.id)
            : std::format("No eligible node for task {}: all {} node(s) rejected",
                          task.id, snapshot.nodes.size());
        return Error{ErrorCode::NoEligibleNode, std::move(message), std::move(details)};
    }

    return outcome;
}

}  // namespace workload_router
