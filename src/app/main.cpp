/**
 * @file main.cpp
 * @brief WorkloadRouter daemon entry point.
 *
 * Wires all modules into a routing pipeline:
 *   Config → Logger → NodeRegistry → Classifier → DecisionEngine → Sinks
 *   TelemetrySimulator feeds the registry; ExecutionSimulator closes the loop.
 */

#include "classifier/softmax_classifier.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/decision_engine.hpp"
#include "registry/node_registry.hpp"
#include "simulation/execution_simulator.hpp"
#include "simulation/telemetry_simulator.hpp"
#include "telemetry/decision_ledger.hpp"
#include "telemetry/decision_sink.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/task_generator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace workload_router;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          WorkloadRouter v1.0.0            ║
  ║   Edge / Cloud / GPU Routing Decision     ║
  ║   Engine                                  ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path model_path;
    std::string log_dir;
    bool demo_mode = false;
    size_t demo_tasks = 40;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            args.model_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.demo_tasks = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: workload_router [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --model <path>     Classifier artifact (overrides [classifier])\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --demo             Route a batch of generated tasks, then exit\n"
                      << "  --tasks <n>        Number of tasks in demo mode (default: 40)\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

template <TelemetrySourceLike Source>
void warm_up(Source& source, size_t ticks) {
    for (size_t i = 0; i < ticks; ++i) {
        source.tick();
    }
}

/**
 * @brief Dispatch one task, run it on the simulator and report back.
 *
 * A lost reservation race is retried once against a fresh snapshot.
 */
bool route_and_execute(DecisionEngine& engine, ExecutionSimulator& executor,
                       const EnvironmentSignals& environment, const TaskDescriptor& task,
                       Logger& logger) {
    auto handle = engine.dispatch(task);
    if (!handle && handle.error().is(ErrorCode::CapacityExceeded)) {
        logger.info("Retrying " + task.id + " after capacity conflict");
        handle = engine.dispatch(task);
    }
    if (!handle) {
        return false;
    }

    auto category = handle->decision.chosen_category;
    auto outcome = executor.execute(task, category, environment.cost_multiplier(category));
    auto record = engine.complete(std::move(*handle), outcome);
    return record.final_stage == DecisionStage::Completed;
}

void print_statistics(const DecisionLedger& ledger, const DecisionEngine& engine) {
    auto stats = ledger.statistics();
    auto counters = engine.counters();

    std::cout << std::format("\nDecisions: {} recorded, {} successful ({:.1f}%)\n",
                             stats.total, stats.successful, stats.success_rate * 100.0);
    std::cout << std::format("Engine: routed={} rejected={} fallbacks={} capacity_conflicts={}\n\n",
                             counters.routed, counters.rejected, counters.fallbacks,
                             counters.capacity_conflicts);
    std::cout << std::format("  {:<18} {:>6} {:>12} {:>10}\n", "node", "tasks", "avg ms", "cost");
    for (const auto& [node, node_stats] : stats.per_node) {
        std::cout << std::format("  {:<18} {:>6} {:>12.1f} {:>10.4f}\n", node, node_stats.tasks,
                                 node_stats.average_latency_ms, node_stats.total_cost);
    }

    auto recent = ledger.history(3);
    if (!recent.empty()) {
        std::cout << "\nMost recent rationale:\n  " << recent.front().decision.rationale << "\n";
    }
}

/**
 * @brief Demo: route a generated batch from several concurrent callers.
 */
void run_demo(const Config& config, size_t task_count, DecisionEngine& engine,
              NodeRegistry& registry, TelemetrySimulator& simulator,
              DecisionLedger& ledger, Logger& logger) {
    logger.info("=== Demo Mode ===");

    warm_up(simulator, 3);

    std::mt19937 rng(config.simulation.seed);
    auto tasks = TaskGenerator::batch(task_count, rng);
    ExecutionSimulator executor(config.simulation.seed, config.simulation.failure_rate);
    auto environment = registry.environment();

    constexpr size_t kCallers = 4;
    std::atomic<size_t> next{0};
    std::atomic<size_t> succeeded{0};
    std::atomic<size_t> unrouted{0};
    {
        std::vector<std::jthread> callers;
        for (size_t c = 0; c < kCallers; ++c) {
            callers.emplace_back([&]() {
                for (size_t i = next.fetch_add(1); i < tasks.size(); i = next.fetch_add(1)) {
                    if (route_and_execute(engine, executor, environment, tasks[i], logger)) {
                        succeeded.fetch_add(1);
                    } else {
                        unrouted.fetch_add(1);
                    }
                }
            });
        }
    }

    logger.info(std::format("Demo routed {} task(s): {} succeeded, {} failed or unroutable",
                            tasks.size(), succeeded.load(), unrouted.load()));
    print_statistics(ledger, engine);
    logger.info("=== Demo Complete ===");
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().describe() << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    if (config.nodes.empty()) config.nodes = default_fleet();

    // Apply CLI overrides
    if (!args.model_path.empty()) config.classifier.artifact_path = args.model_path;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "workload_router",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);
    logger.info("WorkloadRouter starting...");
    logger.info(std::format("Strategy: {}", to_string(config.engine.strategy)));

    // ── Node Registry ────────────────────────
    NodeRegistry registry;
    registry.set_environment(config.environment);
    for (const auto& node : config.nodes) {
        auto registered = registry.register_node(node);
        if (!registered) {
            logger.error("Node registration failed: " + registered.error().describe());
            continue;
        }
        logger.info(std::format("Registered {} ({}, {})", node.id, to_string(node.category),
                                node.location.empty() ? "unknown location" : node.location));
    }
    if (registry.size() == 0) {
        std::cerr << "No nodes registered; nothing to route to." << std::endl;
        return 1;
    }

    // ── Classifier ───────────────────────────
    std::shared_ptr<const IRoutingClassifier> classifier;
    auto loaded = load_classifier_artifact(config.classifier.artifact_path);
    if (loaded) {
        classifier = *loaded;
        logger.info(std::format("Classifier loaded: {} (schema v{})", classifier->version(),
                                classifier->schema_version()));
    } else if (config.engine.strategy != ScoringStrategyKind::Heuristic) {
        logger.warn("Classifier artifact unavailable: " + loaded.error().describe());
    }

    // ── Decision Sinks ───────────────────────
    auto ledger = std::make_shared<DecisionLedger>(config.telemetry.decision_history_limit);
    auto fan_out = std::make_shared<FanOutDecisionSink>();
    fan_out->add(ledger);
    if (!config.telemetry.log_dir.empty()) {
        fan_out->add(std::make_shared<JsonDecisionSink>(std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "decisions",
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count)));
    }

    // ── Decision Engine ──────────────────────
    auto engine_result = DecisionEngine::create(registry, logger, DecisionEngine::Options{
        .engine = config.engine,
        .scorer = config.scorer,
        .classifier = classifier,
        .sink = fan_out,
        .stage_observer = {}
    });
    if (!engine_result) {
        std::cerr << "Engine configuration rejected: " << engine_result.error().describe() << std::endl;
        logger.error(engine_result.error().describe());
        return 1;
    }
    auto& engine = **engine_result;
    if (engine.degraded()) {
        std::cerr << "Running in degraded mode (heuristic-only)." << std::endl;
    }

    // ── Telemetry Simulation ─────────────────
    TelemetrySimulator simulator(registry, logger, config.simulation);
    simulator.randomize_initial();

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        run_demo(config, args.demo_tasks, engine, registry, simulator, *ledger, logger);
        logger.flush();
        return 0;
    }

    // ── Main Routing Loop ────────────────────
    simulator.start();
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    std::mt19937 rng(config.simulation.seed);
    ExecutionSimulator executor(config.simulation.seed, config.simulation.failure_rate);
    uint64_t loop_count = 0;
    size_t task_index = 0;
    auto ticks_per_task = std::max<uint64_t>(1, config.simulation.interval_ms / 100);

    while (!g_shutdown_requested) {
        if (loop_count % ticks_per_task == 0) {
            auto task = TaskGenerator::random_task(rng, task_index++);
            route_and_execute(engine, executor, registry.environment(), task, logger);
        }

        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto stats = ledger->statistics();
            auto snapshot = registry.snapshot();
            logger.info(std::format("Status: {} decisions, {:.1f}% success, {} of {} nodes active",
                                    stats.total, stats.success_rate * 100.0,
                                    snapshot.active_count(), snapshot.nodes.size()));
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    simulator.stop();
    print_statistics(*ledger, engine);

    logger.info("WorkloadRouter stopped.");
    logger.flush();
    return 0;
}
