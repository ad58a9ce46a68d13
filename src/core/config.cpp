/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <format>

namespace workload_router {

namespace {

Result<NodeState> parse_node(const toml::table& tbl, size_t index) {
    auto where = std::format("nodes[{}]", index);

    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty()) {
        return Error{ErrorCode::InvalidConfig, where + ": missing node id"};
    }

    auto category_text = tbl["category"].value_or(std::string{});
    auto category = parse_node_category(category_text);
    if (!category) {
        return Error{ErrorCode::InvalidConfig,
                     where + " (" + *id + "): unknown category '" + category_text + "'"};
    }

    auto status_text = tbl["status"].value_or(std::string{"active"});
    auto status = parse_node_status(status_text);
    if (!status) {
        return Error{ErrorCode::InvalidConfig,
                     where + " (" + *id + "): unknown status '" + status_text + "'"};
    }

    auto max_cpu = tbl["max_cpu_millicores"].value_or(int64_t{0});
    auto max_mem = tbl["max_memory_mb"].value_or(int64_t{0});
    if (max_cpu <= 0 || max_mem <= 0) {
        return Error{ErrorCode::InvalidConfig,
                     where + " (" + *id + "): capacity ceilings must be positive"};
    }

    NodeState node;
    node.id = *id;
    node.category = *category;
    node.status = *status;
    node.max_cpu_millicores = static_cast<uint64_t>(max_cpu);
    node.max_memory_mb = static_cast<uint64_t>(max_mem);
    node.cpu_load_percent = tbl["cpu_load_percent"].value_or(0.0);
    node.memory_load_percent = tbl["memory_load_percent"].value_or(0.0);
    node.latency_ms = tbl["latency_ms"].value_or(0.0);
    node.cost_per_task = tbl["cost_per_task"].value_or(0.0);
    node.cost_per_hour = tbl["cost_per_hour"].value_or(0.0);
    node.gpu_available = tbl["gpu_available"].value_or(*category == NodeCategory::Gpu);
    node.location = tbl["location"].value_or(std::string{});
    return node;
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [engine]
    if (auto engine = tbl["engine"]; engine.is_table()) {
        auto strategy_text = engine["strategy"].value_or(std::string{"heuristic"});
        auto strategy = parse_strategy(strategy_text);
        if (!strategy) {
            return Error{ErrorCode::InvalidConfig,
                         "engine.strategy: unknown strategy '" + strategy_text + "'"};
        }
        config.engine.strategy = *strategy;
        config.engine.tie_epsilon = engine["tie_epsilon"].value_or(1e-6);
        config.engine.reference_latency_ms = engine["reference_latency_ms"].value_or(500.0);
        config.engine.default_cpu_millicores = static_cast<uint64_t>(
            engine["default_cpu_millicores"].value_or(int64_t{500}));
        config.engine.default_memory_mb = static_cast<uint64_t>(
            engine["default_memory_mb"].value_or(int64_t{256}));
    }

    // [scorer]
    if (auto scorer = tbl["scorer"]; scorer.is_table()) {
        // [scorer.weights]
        if (auto weights = scorer["weights"]; weights.is_table()) {
            config.scorer.weights.headroom = weights["headroom"].value_or(0.30);
            config.scorer.weights.latency = weights["latency"].value_or(0.25);
            config.scorer.weights.cost = weights["cost"].value_or(0.25);
            config.scorer.weights.affinity = weights["affinity"].value_or(0.20);
        }

        // [scorer.blended]
        if (auto blended = scorer["blended"]; blended.is_table()) {
            config.scorer.blended.classifier_weight =
                blended["classifier_weight"].value_or(0.5);
        }
    }

    // [classifier]
    if (auto classifier = tbl["classifier"]; classifier.is_table()) {
        config.classifier.artifact_path =
            classifier["artifact_path"].value_or(std::string{"models/router_v1.toml"});
    }

    // [environment]
    if (auto env = tbl["environment"]; env.is_table()) {
        config.environment.network_latency_ms = env["network_latency_ms"].value_or(100.0);
        config.environment.edge_cost_multiplier = env["edge_cost_multiplier"].value_or(1.0);
        config.environment.cloud_cost_multiplier = env["cloud_cost_multiplier"].value_or(2.5);
        config.environment.gpu_cost_multiplier = env["gpu_cost_multiplier"].value_or(5.0);
    }

    // [[nodes]]
    if (const auto* nodes = tbl["nodes"].as_array()) {
        size_t index = 0;
        for (const auto& element : *nodes) {
            const auto* node_tbl = element.as_table();
            if (!node_tbl) {
                return Error{ErrorCode::InvalidConfig,
                             std::format("nodes[{}]: expected a table", index)};
            }
            auto node = parse_node(*node_tbl, index);
            if (!node) return node.error();
            config.nodes.push_back(std::move(*node));
            ++index;
        }
    }

    // [simulation]
    if (auto sim = tbl["simulation"]; sim.is_table()) {
        config.simulation.seed = static_cast<uint32_t>(sim["seed"].value_or(int64_t{42}));
        config.simulation.interval_ms = static_cast<uint32_t>(
            sim["interval_ms"].value_or(int64_t{2000}));
        config.simulation.failure_rate = sim["failure_rate"].value_or(0.02);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.decision_history_limit = static_cast<uint32_t>(
            telemetry["decision_history_limit"].value_or(int64_t{1000}));
    }

    return config;
}

NodeState make_node(std::string id, NodeCategory category, std::string location,
                    uint64_t cores, uint64_t ram_gb, double cpu_pct, double mem_pct,
                    double latency_ms, double cost_per_task, double cost_per_hour) {
    NodeState node;
    node.id = std::move(id);
    node.category = category;
    node.status = NodeStatus::Active;
    node.max_cpu_millicores = cores * 1000;
    node.max_memory_mb = ram_gb * 1024;
    node.cpu_load_percent = cpu_pct;
    node.memory_load_percent = mem_pct;
    node.latency_ms = latency_ms;
    node.cost_per_task = cost_per_task;
    node.cost_per_hour = cost_per_hour;
    node.gpu_available = (category == NodeCategory::Gpu);
    node.location = std::move(location);
    return node;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfig,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    Config config;
    config.nodes = default_fleet();
    return config;
}

std::vector<NodeState> default_fleet() {
    return {
        make_node("Edge-01", NodeCategory::Edge, "Factory Floor", 4, 8, 25.0, 35.0, 8.0, 0.01, 0.5),
        make_node("Edge-02", NodeCategory::Edge, "Warehouse", 4, 8, 30.0, 40.0, 14.0, 0.01, 0.5),
        make_node("Cloud-AWS-East", NodeCategory::Cloud, "us-east-1", 16, 64, 40.0, 50.0, 90.0, 0.025, 2.0),
        make_node("Cloud-GCP-West", NodeCategory::Cloud, "us-west1", 16, 64, 45.0, 45.0, 110.0, 0.025, 2.0),
        make_node("GPU-Cluster-01", NodeCategory::Gpu, "Data Center", 32, 128, 30.0, 60.0, 120.0, 0.05, 5.0),
    };
}

}  // namespace workload_router
