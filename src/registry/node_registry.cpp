/**
 * @file node_registry.cpp
 * @brief NodeRegistry implementation.
 */

#include "registry/node_registry.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace workload_router {

namespace {

constexpr double kCapacityTolerance = 1e-9;

Error unknown_node(const NodeId& id) {
    return Error{ErrorCode::UnknownNode, "Unknown node: " + id};
}

}  // anonymous namespace

NodeState* NodeRegistry::find_locked(const NodeId& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

Result<void> NodeRegistry::register_node(NodeState node) {
    if (node.id.empty()) {
        return Error{ErrorCode::InvalidConfig, "Node id must not be empty"};
    }
    if (node.max_cpu_millicores == 0 || node.max_memory_mb == 0) {
        return Error{ErrorCode::InvalidConfig,
                     "Node " + node.id + " must have positive capacity ceilings"};
    }

    std::unique_lock lock(mutex_);
    if (index_.count(node.id) > 0) {
        return Error{ErrorCode::DuplicateNode, "Node already registered: " + node.id};
    }

    node.cpu_load_percent = std::clamp(node.cpu_load_percent, 0.0, 100.0);
    node.memory_load_percent = std::clamp(node.memory_load_percent, 0.0, 100.0);
    node.reserved = ResourceAmount{};

    index_.emplace(node.id, nodes_.size());
    nodes_.push_back(std::move(node));
    ++generation_;
    return Result<void>{};
}

Result<void> NodeRegistry::remove_node(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return unknown_node(id);

    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(it->second));
    index_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        index_.emplace(nodes_[i].id, i);
    }
    ++generation_;
    return Result<void>{};
}

Result<void> NodeRegistry::update_telemetry(const NodeId& id, const TelemetryUpdate& update) {
    std::unique_lock lock(mutex_);
    auto* node = find_locked(id);
    if (!node) return unknown_node(id);

    if (update.load) {
        const auto& load = *update.load;
        if (load.mode == LoadReport::Mode::Absolute) {
            node->cpu_load_percent = load.cpu_percent;
            node->memory_load_percent = load.memory_percent;
        } else {
            node->cpu_load_percent += load.cpu_percent;
            node->memory_load_percent += load.memory_percent;
        }
        node->cpu_load_percent = std::clamp(node->cpu_load_percent, 0.0, 100.0);
        node->memory_load_percent = std::clamp(node->memory_load_percent, 0.0, 100.0);
    }
    if (update.latency_ms) {
        node->latency_ms = std::max(0.0, *update.latency_ms);
    }
    if (update.status) {
        node->status = *update.status;
    }
    if (update.gpu_available) {
        node->gpu_available = *update.gpu_available;
    }

    ++generation_;
    return Result<void>{};
}

void NodeRegistry::set_environment(const EnvironmentSignals& environment) {
    std::unique_lock lock(mutex_);
    environment_ = environment;
    ++generation_;
}

Result<void> NodeRegistry::reserve(const NodeId& id, const ResourceAmount& amount) {
    std::unique_lock lock(mutex_);
    auto* node = find_locked(id);
    if (!node) return unknown_node(id);

    std::vector<std::string> shortfalls;
    if (amount.cpu_millicores > 0) {
        double after = node->cpu_used_millicores() + static_cast<double>(amount.cpu_millicores);
        if (after > static_cast<double>(node->max_cpu_millicores) + kCapacityTolerance) {
            shortfalls.push_back(std::format("cpu: requested {}m, available {:.0f}m of {}m",
                                             amount.cpu_millicores,
                                             node->cpu_available_millicores(),
                                             node->max_cpu_millicores));
        }
    }
    if (amount.memory_mb > 0) {
        double after = node->memory_used_mb() + static_cast<double>(amount.memory_mb);
        if (after > static_cast<double>(node->max_memory_mb) + kCapacityTolerance) {
            shortfalls.push_back(std::format("memory: requested {}MB, available {:.0f}MB of {}MB",
                                             amount.memory_mb,
                                             node->memory_available_mb(),
                                             node->max_memory_mb));
        }
    }
    if (!shortfalls.empty()) {
        return Error{ErrorCode::CapacityExceeded,
                     "Reservation would exceed capacity of node " + id,
                     std::move(shortfalls)};
    }

    node->reserved.cpu_millicores += amount.cpu_millicores;
    node->reserved.memory_mb += amount.memory_mb;
    ++generation_;
    return Result<void>{};
}

Result<void> NodeRegistry::release(const NodeId& id, const ResourceAmount& amount) {
    std::unique_lock lock(mutex_);
    auto* node = find_locked(id);
    if (!node) return unknown_node(id);

    auto& reserved = node->reserved;
    reserved.cpu_millicores -= std::min(reserved.cpu_millicores, amount.cpu_millicores);
    reserved.memory_mb -= std::min(reserved.memory_mb, amount.memory_mb);
    ++generation_;
    return Result<void>{};
}

MetricsSnapshot NodeRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return MetricsSnapshot{
        .generation = generation_,
        .nodes = nodes_,
        .environment = environment_
    };
}

std::optional<NodeState> NodeRegistry::node(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return nodes_[it->second];
}

std::vector<NodeId> NodeRegistry::node_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& node : nodes_) ids.push_back(node.id);
    return ids;
}

EnvironmentSignals NodeRegistry::environment() const {
    std::shared_lock lock(mutex_);
    return environment_;
}

size_t NodeRegistry::size() const noexcept {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

bool NodeRegistry::contains(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    return index_.count(id) > 0;
}

uint64_t NodeRegistry::generation() const noexcept {
    std::shared_lock lock(mutex_);
    return generation_;
}

}  // namespace workload_router
