/**
 * @file dispatch.hpp
 * @brief Dispatch handle and the RAII lease over a capacity reservation.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/node_registry.hpp"

namespace workload_router {

/**
 * @brief Owns one reservation on one node until released.
 *
 * Move-only. Destroying an unreleased lease returns the capacity to the
 * registry, so an abandoned dispatch never leaks a reservation.
 */
class ReservationLease {
public:
    ReservationLease() = default;
    ReservationLease(NodeRegistry& registry, NodeId node, ResourceAmount amount,
                     Logger* logger = nullptr);
    ~ReservationLease();

    ReservationLease(const ReservationLease&) = delete;
    ReservationLease& operator=(const ReservationLease&) = delete;
    ReservationLease(ReservationLease&& other) noexcept;
    ReservationLease& operator=(ReservationLease&& other) noexcept;

    /// Returns the capacity; a second call is a no-op.
    Result<void> release();

    [[nodiscard]] bool active() const noexcept { return registry_ != nullptr; }
    [[nodiscard]] const NodeId& node() const noexcept { return node_; }
    [[nodiscard]] const ResourceAmount& amount() const noexcept { return amount_; }

private:
    void release_quietly() noexcept;

    NodeRegistry* registry_{nullptr};
    NodeId node_;
    ResourceAmount amount_;
    Logger* logger_{nullptr};
};

/**
 * @brief What the engine hands to the execution collaborator.
 */
struct DispatchHandle {
    TaskDescriptor task;
    RoutingDecision decision;
    ResourceAmount reserved;
    ReservationLease lease;
};

}  // namespace workload_router
