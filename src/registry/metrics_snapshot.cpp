/**
 * @file metrics_snapshot.cpp
 * @brief MetricsSnapshot helper method implementations.
 */

#include "registry/metrics_snapshot.hpp"

#include <algorithm>

namespace workload_router {

const NodeState* MetricsSnapshot::find(const NodeId& id) const noexcept {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&id](const NodeState& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

std::optional<double> MetricsSnapshot::average_load_percent(NodeCategory category) const noexcept {
    double total = 0.0;
    size_t count = 0;
    for (const auto& node : nodes) {
        if (node.category != category || node.status == NodeStatus::Offline) continue;
        total += node.cpu_load_fraction() * 100.0;
        ++count;
    }
    if (count == 0) return std::nullopt;
    return total / static_cast<double>(count);
}

bool MetricsSnapshot::has_category(NodeCategory category) const noexcept {
    return std::any_of(nodes.begin(), nodes.end(),
                       [category](const NodeState& n) { return n.category == category; });
}

size_t MetricsSnapshot::active_count() const noexcept {
    return static_cast<size_t>(
        std::count_if(nodes.begin(), nodes.end(),
                      [](const NodeState& n) { return n.status == NodeStatus::Active; }));
}

}  // namespace workload_router
