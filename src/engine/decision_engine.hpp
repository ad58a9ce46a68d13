/**
 * @file decision_engine.hpp
 * @brief The routing state machine: validate, featurize, filter, score,
 *        explain, reserve, dispatch, complete.
 *
 * Stages per task:
 *   received → featurized → filtered → scored → dispatched → completed
 *                                    ↘ failed (from any stage)
 *
 * route() is a pure function of (task, snapshot) given the configured
 * strategy; dispatch() adds the single side effect of reserving capacity on
 * the winner; complete() always returns that capacity.
 */

#pragma once

#include "classifier/routing_classifier.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/dispatch.hpp"
#include "registry/node_registry.hpp"
#include "scoring/heuristic_scorer.hpp"
#include "scoring/scorer.hpp"
#include "telemetry/decision_sink.hpp"

#include <atomic>
#include <functional>
#include <memory>

namespace workload_router {

/// Invoked synchronously on every stage transition; must be thread-safe.
using StageObserver = std::function<void(const TaskId&, DecisionStage)>;

struct EngineCounters {
    uint64_t routed{0};
    uint64_t rejected{0};           ///< Invalid task or no eligible node
    uint64_t fallbacks{0};          ///< Decisions scored by the heuristic fallback
    uint64_t dispatched{0};
    uint64_t capacity_conflicts{0};
    uint64_t completed{0};
    uint64_t failed{0};             ///< Executions reported unsuccessful
};

class DecisionEngine {
public:
    struct Options {
        EngineConfig engine;
        ScorerConfig scorer;
        std::shared_ptr<const IRoutingClassifier> classifier;
        std::shared_ptr<IDecisionSink> sink;
        StageObserver stage_observer;
    };

    /**
     * @brief Build an engine over a registry.
     *
     * Invalid weights or engine parameters are InvalidConfig errors. A
     * classifier strategy without a usable classifier is not an error: the
     * engine starts heuristic-only in degraded mode and logs a warning.
     */
    static Result<std::unique_ptr<DecisionEngine>> create(NodeRegistry& registry,
                                                          Logger& logger,
                                                          Options options);

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    /// InvalidTask for missing identity, out-of-range ordinals or nonsensical requirements.
    static Result<void> validate_task(const TaskDescriptor& task);

    /// Decide without reserving anything.
    Result<RoutingDecision> route(const TaskDescriptor& task, const MetricsSnapshot& snapshot) const;

    /// Decide against the registry's current snapshot.
    Result<RoutingDecision> route(const TaskDescriptor& task) const;

    /**
     * @brief Route and reserve capacity on the chosen node.
     *
     * CapacityExceeded means another decision claimed the capacity first;
     * the caller may retry against a fresh snapshot.
     */
    Result<DispatchHandle> dispatch(const TaskDescriptor& task);

    /// Release the reservation, record the outcome and forward it to the sink.
    DecisionRecord complete(DispatchHandle handle, const ExecutionOutcome& outcome);

    [[nodiscard]] bool degraded() const noexcept { return degraded_; }
    [[nodiscard]] ScoringStrategyKind configured_strategy() const noexcept { return options_.engine.strategy; }
    [[nodiscard]] ScoringStrategyKind active_strategy() const noexcept { return primary_->kind(); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return options_.engine; }
    [[nodiscard]] EngineCounters counters() const noexcept;

private:
    DecisionEngine(NodeRegistry& registry, Logger& logger, Options options,
                   std::unique_ptr<IScoringStrategy> primary, HeuristicScorer fallback,
                   bool degraded);

    void notify(const TaskId& task, DecisionStage stage) const;

    NodeRegistry& registry_;
    Logger& logger_;
    Options options_;
    std::unique_ptr<IScoringStrategy> primary_;
    HeuristicScorer fallback_;
    bool degraded_;

    mutable std::atomic<uint64_t> routed_{0};
    mutable std::atomic<uint64_t> rejected_{0};
    mutable std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> capacity_conflicts_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};

}  // namespace workload_router
