/**
 * @file node_registry.hpp
 * @brief Thread-safe owner of every known node's state.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/metrics_snapshot.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace workload_router {

/**
 * @brief A telemetry sample for one resource pair.
 *
 * Absolute samples replace the reported load; delta samples adjust it.
 * Either way the result is clamped to [0, 100].
 */
struct LoadReport {
    enum class Mode : uint8_t {
        Absolute,
        Delta
    };

    Mode mode{Mode::Absolute};
    double cpu_percent{0.0};
    double memory_percent{0.0};
};

/**
 * @brief Partial update of a node's mutable fields. Unset fields are left alone.
 */
struct TelemetryUpdate {
    std::optional<LoadReport> load;
    std::optional<double> latency_ms;
    std::optional<NodeStatus> status;
    std::optional<bool> gpu_available;
};

/**
 * @brief Single writer of NodeState.
 *
 * Updated by telemetry sources and by the DecisionEngine's reservations,
 * read through snapshot(). Readers share the lock; every mutation, including
 * reserve and release, takes it exclusively, so a reservation always checks
 * capacity against the latest committed state.
 */
class NodeRegistry {
public:
    Result<void> register_node(NodeState node);

    /// Drops a node; outstanding reservations on it are discarded with it.
    Result<void> remove_node(const NodeId& id);
    Result<void> update_telemetry(const NodeId& id, const TelemetryUpdate& update);
    void set_environment(const EnvironmentSignals& environment);

    /// Claim capacity for a dispatch; fails rather than oversubscribe.
    Result<void> reserve(const NodeId& id, const ResourceAmount& amount);

    /// Return previously reserved capacity; clamps at zero.
    Result<void> release(const NodeId& id, const ResourceAmount& amount);

    [[nodiscard]] MetricsSnapshot snapshot() const;
    [[nodiscard]] std::optional<NodeState> node(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeId> node_ids() const;
    [[nodiscard]] EnvironmentSignals environment() const;
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool contains(const NodeId& id) const;
    [[nodiscard]] uint64_t generation() const noexcept;

private:
    NodeState* find_locked(const NodeId& id);

    mutable std::shared_mutex mutex_;
    std::vector<NodeState> nodes_;                    ///< Registration order
    std::unordered_map<NodeId, size_t> index_;
    EnvironmentSignals environment_;
    uint64_t generation_{0};
};

}  // namespace workload_router
