/**
 * @file heuristic_scorer.hpp
 * @brief Weighted-sum scoring over four normalized dimensions.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "scoring/scorer.hpp"

namespace workload_router {

static_assert(ScoringWeights{}.sum() > 1.0 - 1e-9 && ScoringWeights{}.sum() < 1.0 + 1e-9,
              "Default heuristic weights must sum to 1.0");

/**
 * @brief Deterministic heuristic strategy.
 *
 *   score(node) = w_headroom * headroom
 *               + w_latency  * latency fitness
 *               + w_cost     * cost efficiency
 *               + w_affinity * priority/category affinity
 *
 * Every sub-score lies in [0, 1], so the final score does too.
 */
class HeuristicScorer : public IScoringStrategy {
public:
    explicit HeuristicScorer(ScoringWeights weights = {}, double reference_latency_ms = 500.0);

    Result<ScoreCard> score(const ScoringContext& context) const override;

    [[nodiscard]] ScoringStrategyKind kind() const noexcept override {
        return ScoringStrategyKind::Heuristic;
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "heuristic"; }

    [[nodiscard]] const ScoringWeights& weights() const noexcept { return weights_; }

    /// Sum 1.0 within 1e-9 and no negative entry, else InvalidConfig.
    static Result<void> validate_weights(const ScoringWeights& weights);

    /// Breakdown for every candidate, in candidate order.
    [[nodiscard]] std::vector<SubScores> breakdowns(const ScoringContext& context) const;

    /// Per-task cost, falling back to hourly cost, times the category multiplier.
    [[nodiscard]] static double effective_cost(const NodeState& node,
                                               const EnvironmentSignals& environment) noexcept;

    [[nodiscard]] static double affinity(const TaskDescriptor& task, NodeCategory category) noexcept;

    [[nodiscard]] double weighted_sum(const SubScores& sub) const noexcept;

private:
    ScoringWeights weights_;
    double reference_latency_ms_;
};

static_assert(ScoringStrategyLike<HeuristicScorer>);

}  // namespace workload_router
