/**
 * @file heuristic_scorer.cpp
 * @brief HeuristicScorer implementation.
 */

#include "scoring/heuristic_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace workload_router {

namespace {

constexpr double kWeightSumTolerance = 1e-9;

double latency_fitness(double latency_ms, double ceiling_ms) noexcept {
    if (ceiling_ms <= 0.0) return 0.0;
    return std::clamp(1.0 - latency_ms / ceiling_ms, 0.0, 1.0);
}

}  // anonymous namespace

HeuristicScorer::HeuristicScorer(ScoringWeights weights, double reference_latency_ms)
    : weights_(weights), reference_latency_ms_(reference_latency_ms) {}

Result<void> HeuristicScorer::validate_weights(const ScoringWeights& weights) {
    for (auto dimension : kAllDimensions) {
        double w = weights.weight(dimension);
        if (!std::isfinite(w) || w < 0.0) {
            return Error{ErrorCode::InvalidConfig,
                         std::format("Weight for {} must be non-negative, got {}",
                                     to_string(dimension), w)};
        }
    }
    if (std::abs(weights.sum() - 1.0) > kWeightSumTolerance) {
        return Error{ErrorCode::InvalidConfig,
                     std::format("Heuristic weights must sum to 1.0, got {:.12f}", weights.sum())};
    }
    return Result<void>{};
}

double HeuristicScorer::effective_cost(const NodeState& node,
                                       const EnvironmentSignals& environment) noexcept {
    double base = node.cost_per_task > 0.0 ? node.cost_per_task : node.cost_per_hour;
    return base * environment.cost_multiplier(node.category);
}

double HeuristicScorer::affinity(const TaskDescriptor& task, NodeCategory category) noexcept {
    double value = 0.0;
    switch (category) {
        case NodeCategory::Edge:
            // Urgent, latency-sensitive work belongs close to the source
            value = (task.priority + task.latency_ordinal()) / 20.0;
            break;
        case NodeCategory::Cloud:
            value = (task.cost_sensitivity + 11 - task.priority) / 20.0;
            break;
        case NodeCategory::Gpu:
            value = task.requires_gpu ? 1.0 : 0.25;
            break;
    }
    return std::clamp(value, 0.0, 1.0);
}

double HeuristicScorer::weighted_sum(const SubScores& sub) const noexcept {
    return weights_.headroom * sub.headroom
         + weights_.latency * sub.latency
         + weights_.cost * sub.cost
         + weights_.affinity * sub.affinity;
}

std::vector<SubScores> HeuristicScorer::breakdowns(const ScoringContext& context) const {
    const auto& environment = context.snapshot.environment;
    double ceiling = context.task.latency_ceiling_ms().value_or(reference_latency_ms_);

    // Cheapest positive cost among the candidates anchors cost efficiency
    double cheapest = std::numeric_limits<double>::max();
    for (const auto& node : context.candidates) {
        double cost = effective_cost(node, environment);
        if (cost > 0.0) cheapest = std::min(cheapest, cost);
    }

    std::vector<SubScores> result;
    result.reserve(context.candidates.size());
    for (const auto& node : context.candidates) {
        double cost = effective_cost(node, environment);
        result.push_back(SubScores{
            .headroom = std::clamp(node.headroom(), 0.0, 1.0),
            .latency = latency_fitness(node.latency_ms, ceiling),
            .cost = cost <= 0.0 ? 1.0 : std::clamp(cheapest / cost, 0.0, 1.0),
            .affinity = affinity(context.task, node.category)
        });
    }
    return result;
}

Result<ScoreCard> HeuristicScorer::score(const ScoringContext& context) const {
    auto subs = breakdowns(context);

    ScoreCard card;
    card.strategy = ScoringStrategyKind::Heuristic;
    card.scores.reserve(subs.size());
    for (size_t i = 0; i < subs.size(); ++i) {
        const auto& node = context.candidates[i];
        card.scores.push_back(CandidateScore{
            .node_id = node.id,
            .category = node.category,
            .score = std::clamp(weighted_sum(subs[i]), 0.0, 1.0),
            .breakdown = subs[i]
        });
    }
    return card;
}

}  // namespace workload_router
