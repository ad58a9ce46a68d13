/**
 * @file metrics_snapshot.hpp
 * @brief Immutable point-in-time view of every node plus ambient signals.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace workload_router {

/**
 * @brief A deep copy of registry state taken for one decision.
 *
 * Nodes appear in registration order. `generation` increases with every
 * registry mutation, so two snapshots with the same generation are equal.
 */
struct MetricsSnapshot {
    uint64_t generation{0};
    std::vector<NodeState> nodes;
    EnvironmentSignals environment;

    [[nodiscard]] const NodeState* find(const NodeId& id) const noexcept;

    /// Mean effective CPU load percent over non-offline nodes of a category.
    [[nodiscard]] std::optional<double> average_load_percent(NodeCategory category) const noexcept;

    [[nodiscard]] bool has_category(NodeCategory category) const noexcept;
    [[nodiscard]] size_t active_count() const noexcept;

    bool operator==(const MetricsSnapshot&) const = default;
};

}  // namespace workload_router
