/**
 * @file decision_engine.cpp
 * @brief DecisionEngine implementation.
 */

#include "engine/decision_engine.hpp"

#include "explain/explainer.hpp"
#include "features/feature_extractor.hpp"
#include "filter/candidate_filter.hpp"
#include "scoring/classifier_scorer.hpp"
#include "scoring/selection.hpp"

#include <chrono>
#include <cmath>
#include <format>

namespace workload_router {

namespace {

constexpr int kMinOrdinal = 1;
constexpr int kMaxOrdinal = 10;

bool in_ordinal_range(int value) noexcept {
    return value >= kMinOrdinal && value <= kMaxOrdinal;
}

Error invalid_task(const TaskDescriptor& task, std::string reason) {
    auto label = task.id.empty() ? std::string{"<unnamed>"} : task.id;
    return Error{ErrorCode::InvalidTask, "Invalid task " + label + ": " + std::move(reason)};
}

/// Why a configured classifier cannot be used, if it cannot.
std::optional<std::string> classifier_problem(const std::shared_ptr<const IRoutingClassifier>& classifier) {
    if (!classifier) {
        return "no classifier loaded";
    }
    auto compatible = FeatureExtractor::check_compatible(classifier->schema_version(),
                                                         classifier->input_width());
    if (!compatible) {
        return compatible.error().message;
    }
    for (const auto& label : classifier->classes()) {
        if (parse_node_category(label)) return std::nullopt;
    }
    return "classifier has no node-category labels";
}

}  // anonymous namespace

// ── Construction ─────────────────────────────

Result<std::unique_ptr<DecisionEngine>> DecisionEngine::create(NodeRegistry& registry,
                                                               Logger& logger,
                                                               Options options) {
    auto weights_ok = HeuristicScorer::validate_weights(options.scorer.weights);
    if (!weights_ok) return weights_ok.error();

    const auto& engine = options.engine;
    if (!std::isfinite(engine.tie_epsilon) || engine.tie_epsilon < 0.0) {
        return Error{ErrorCode::InvalidConfig, "tie_epsilon must be non-negative"};
    }
    if (!std::isfinite(engine.reference_latency_ms) || engine.reference_latency_ms <= 0.0) {
        return Error{ErrorCode::InvalidConfig, "reference_latency_ms must be positive"};
    }
    double alpha = options.scorer.blended.classifier_weight;
    if (!std::isfinite(alpha) || alpha < 0.0 || alpha > 1.0) {
        return Error{ErrorCode::InvalidConfig,
                     std::format("classifier_weight must lie in [0, 1], got {}", alpha)};
    }

    HeuristicScorer heuristic(options.scorer.weights, engine.reference_latency_ms);
    std::unique_ptr<IScoringStrategy> primary;
    bool degraded = false;

    if (engine.strategy == ScoringStrategyKind::Heuristic) {
        primary = std::make_unique<HeuristicScorer>(heuristic);
    } else if (auto problem = classifier_problem(options.classifier)) {
        logger.warn(std::format("Degraded mode: {} strategy configured but {}; routing heuristic-only",
                                to_string(engine.strategy), *problem));
        primary = std::make_unique<HeuristicScorer>(heuristic);
        degraded = true;
    } else if (engine.strategy == ScoringStrategyKind::Classifier) {
        primary = std::make_unique<ClassifierScorer>(options.classifier, heuristic);
    } else {
        primary = std::make_unique<BlendedScorer>(options.classifier, heuristic, alpha);
    }

    logger.info(std::format("Decision engine ready: strategy={} active={} degraded={}",
                            to_string(engine.strategy), primary->name(), degraded));

    return std::unique_ptr<DecisionEngine>(new DecisionEngine(
        registry, logger, std::move(options), std::move(primary), std::move(heuristic), degraded));
}

DecisionEngine::DecisionEngine(NodeRegistry& registry, Logger& logger, Options options,
                               std::unique_ptr<IScoringStrategy> primary, HeuristicScorer fallback,
                               bool degraded)
    : registry_(registry)
    , logger_(logger)
    , options_(std::move(options))
    , primary_(std::move(primary))
    , fallback_(std::move(fallback))
    , degraded_(degraded) {}

// ── Validation ───────────────────────────────

Result<void> DecisionEngine::validate_task(const TaskDescriptor& task) {
    if (task.id.empty()) {
        return invalid_task(task, "id is required");
    }
    if (task.task_type.empty()) {
        return invalid_task(task, "task_type is required");
    }
    if (!in_ordinal_range(task.priority)) {
        return invalid_task(task, std::format("priority {} outside 1-10", task.priority));
    }
    if (!in_ordinal_range(task.cost_sensitivity)) {
        return invalid_task(task, std::format("cost_sensitivity {} outside 1-10", task.cost_sensitivity));
    }
    if (task.latency) {
        const auto& latency = *task.latency;
        if (!std::isfinite(latency.value)) {
            return invalid_task(task, "latency requirement is not a number");
        }
        if (latency.kind == LatencyRequirement::Kind::Milliseconds && latency.value <= 0.0) {
            return invalid_task(task, std::format("latency ceiling {}ms must be positive", latency.value));
        }
        if (latency.kind == LatencyRequirement::Kind::Ordinal
            && (latency.value != std::floor(latency.value)
                || !in_ordinal_range(static_cast<int>(latency.value)))) {
            return invalid_task(task, std::format("latency ordinal {} outside 1-10", latency.value));
        }
    }
    return Result<void>{};
}

// ── Routing ──────────────────────────────────

void DecisionEngine::notify(const TaskId& task, DecisionStage stage) const {
    if (options_.stage_observer) {
        options_.stage_observer(task, stage);
    }
}

Result<RoutingDecision> DecisionEngine::route(const TaskDescriptor& task,
                                              const MetricsSnapshot& snapshot) const {
    notify(task.id, DecisionStage::Received);
    auto valid = validate_task(task);
    if (!valid) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        logger_.warn(valid.error().describe());
        notify(task.id, DecisionStage::Failed);
        return valid.error();
    }

    auto features = FeatureExtractor::extract(task, snapshot);
    notify(task.id, DecisionStage::Featurized);

    // Same amount dispatch() reserves, so a surviving node can hold the task
    auto filtered = CandidateFilter::apply(task, snapshot, options_.engine.default_reservation());
    if (!filtered) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        logger_.warn(filtered.error().describe());
        notify(task.id, DecisionStage::Failed);
        return filtered.error();
    }
    notify(task.id, DecisionStage::Filtered);

    ScoringContext context{
        .task = task,
        .snapshot = snapshot,
        .candidates = filtered->candidates,
        .features = features
    };

    bool degraded = degraded_;
    auto card = primary_->score(context);
    if (!card) {
        logger_.warn(std::format("Degraded mode: {} scoring failed for task {} ({}); using heuristic",
                                 primary_->name(), task.id, card.error().describe()));
        fallbacks_.fetch_add(1, std::memory_order_relaxed);
        degraded = true;
        card = fallback_.score(context);
        if (!card) {
            logger_.error("Heuristic scoring failed for task " + task.id + ": " + card.error().describe());
            notify(task.id, DecisionStage::Failed);
            return card.error();
        }
    } else if (degraded) {
        fallbacks_.fetch_add(1, std::memory_order_relaxed);
    }

    auto selection = select_winner(card->scores, options_.engine.tie_epsilon);
    if (!selection) {
        notify(task.id, DecisionStage::Failed);
        return selection.error();
    }
    const auto& winner = card->scores[selection->winner_index];

    auto explanation = Explainer::explain(ExplanationInput{
        .task = task,
        .scores = card->scores,
        .winner_index = selection->winner_index,
        .runner_up_index = selection->runner_up_index,
        .rejections = filtered->rejections,
        .strategy = card->strategy,
        .weights = options_.scorer.weights,
        .degraded = degraded,
        .network_latency_ms = snapshot.environment.network_latency_ms,
        .classifier_weight = options_.scorer.blended.classifier_weight,
        .tie_epsilon = options_.engine.tie_epsilon
    });

    RoutingDecision decision{
        .task_id = task.id,
        .chosen_node = winner.node_id,
        .chosen_category = winner.category,
        .confidence = winner.score,
        .scores = card->scores,
        .rationale = std::move(explanation.text),
        .decisive_dimension = explanation.decisive,
        .strategy = card->strategy,
        .degraded = degraded,
        .snapshot_generation = snapshot.generation,
        .decided_at = std::chrono::system_clock::now()
    };

    routed_.fetch_add(1, std::memory_order_relaxed);
    notify(task.id, DecisionStage::Scored);
    logger_.debug(decision.rationale);
    return decision;
}

Result<RoutingDecision> DecisionEngine::route(const TaskDescriptor& task) const {
    return route(task, registry_.snapshot());
}

// ── Dispatch & completion ────────────────────

Result<DispatchHandle> DecisionEngine::dispatch(const TaskDescriptor& task) {
    auto decision = route(task, registry_.snapshot());
    if (!decision) return decision.error();

    auto amount = task.requested_resources(options_.engine.default_reservation());
    auto reserved = registry_.reserve(decision->chosen_node, amount);
    if (!reserved) {
        capacity_conflicts_.fetch_add(1, std::memory_order_relaxed);
        logger_.warn("Dispatch of " + task.id + " aborted: " + reserved.error().describe());
        notify(task.id, DecisionStage::Failed);
        return reserved.error();
    }

    dispatched_.fetch_add(1, std::memory_order_relaxed);
    notify(task.id, DecisionStage::Dispatched);
    logger_.info(std::format("Dispatched {} to {} (confidence {:.2f}, reserved {}m/{}MB)",
                             task.id, decision->chosen_node, decision->confidence,
                             amount.cpu_millicores, amount.memory_mb));

    NodeId node = decision->chosen_node;
    return DispatchHandle{
        .task = task,
        .decision = std::move(*decision),
        .reserved = amount,
        .lease = ReservationLease(registry_, std::move(node), amount, &logger_)
    };
}

DecisionRecord DecisionEngine::complete(DispatchHandle handle, const ExecutionOutcome& outcome) {
    auto released = handle.lease.release();
    if (!released) {
        logger_.warn("Release after " + handle.task.id + " failed: " + released.error().describe());
    }

    auto stage = outcome.success ? DecisionStage::Completed : DecisionStage::Failed;
    if (outcome.success) {
        completed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
        logger_.warn(std::format("Task {} failed on {}: {}", handle.task.id,
                                 handle.decision.chosen_node,
                                 outcome.error_message.value_or("no error message")));
    }
    notify(handle.task.id, stage);

    DecisionRecord record{
        .decision = std::move(handle.decision),
        .reserved = handle.reserved,
        .final_stage = stage,
        .outcome = outcome,
        .completed_at = std::chrono::system_clock::now()
    };

    if (options_.sink) {
        auto persisted = options_.sink->persist(record);
        if (!persisted) {
            logger_.warn("Decision record for " + record.decision.task_id
                         + " not persisted: " + persisted.error().describe());
        }
    }
    return record;
}

EngineCounters DecisionEngine::counters() const noexcept {
    return EngineCounters{
        .routed = routed_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .fallbacks = fallbacks_.load(std::memory_order_relaxed),
        .dispatched = dispatched_.load(std::memory_order_relaxed),
        .capacity_conflicts = capacity_conflicts_.load(std::memory_order_relaxed),
        .completed = completed_.load(std::memory_order_relaxed),
        .failed = failed_.load(std::memory_order_relaxed)
    };
}

}  // namespace workload_router
