/**
 * @file dispatch.cpp
 * @brief ReservationLease implementation.
 */

#include "engine/dispatch.hpp"

#include <exception>
#include <utility>

namespace workload_router {

ReservationLease::ReservationLease(NodeRegistry& registry, NodeId node,
                                   ResourceAmount amount, Logger* logger)
    : registry_(&registry), node_(std::move(node)), amount_(amount), logger_(logger) {}

ReservationLease::~ReservationLease() {
    release_quietly();
}

ReservationLease::ReservationLease(ReservationLease&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr))
    , node_(std::move(other.node_))
    , amount_(other.amount_)
    , logger_(other.logger_) {}

ReservationLease& ReservationLease::operator=(ReservationLease&& other) noexcept {
    if (this != &other) {
        release_quietly();
        registry_ = std::exchange(other.registry_, nullptr);
        node_ = std::move(other.node_);
        amount_ = other.amount_;
        logger_ = other.logger_;
    }
    return *this;
}

Result<void> ReservationLease::release() {
    if (!registry_) return Result<void>{};
    auto* registry = std::exchange(registry_, nullptr);
    return registry->release(node_, amount_);
}

void ReservationLease::release_quietly() noexcept {
    if (!registry_) return;
    try {
        auto result = release();
        if (!result && logger_) {
            logger_->warn("Abandoned reservation on " + node_ + " not returned: "
                          + result.error().describe());
        }
    } catch (const std::exception& ex) {
        if (logger_) {
            logger_->error("Releasing abandoned reservation on " + node_ + " threw: " + ex.what());
        }
    }
}

}  // namespace workload_router
