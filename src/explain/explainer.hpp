/**
 * @file explainer.hpp
 * @brief Human-readable rationale for a routing decision.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "filter/candidate_filter.hpp"

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace workload_router {

struct ExplanationInput {
    const TaskDescriptor& task;
    const std::vector<CandidateScore>& scores;
    size_t winner_index;
    std::optional<size_t> runner_up_index;
    const std::vector<NodeRejection>& rejections;
    ScoringStrategyKind strategy;
    const ScoringWeights& weights;
    bool degraded;
    double network_latency_ms;
    double classifier_weight{0.0};                    ///< α of the blended strategy
    double tie_epsilon{1e-6};
};

struct Explanation {
    ScoreDimension decisive{ScoreDimension::Headroom};
    double decisive_contribution{0.0};    ///< Weighted margin (or weighted score) of that dimension
    std::string text;
};

/**
 * @brief Pure rationale builder.
 *
 * The decisive dimension is the one with the largest contribution to the
 * winner's margin over the runner-up, or to the winner's own score when it
 * had no competition. Contributions are measured in the units the strategy
 * ranked by:
 *   heuristic:  weight × Δsub-score
 *   classifier: Δprobability
 *   blended:    α × Δprobability against (1 − α) × weight × Δsub-score
 * When the winner only tied the runner-up, the tie-break (headroom) is named.
 * Ties between dimensions resolve in weight-table order.
 */
class Explainer {
public:
    static constexpr int kHighPriority = 8;
    static constexpr double kHighNetworkLatencyMs = 300.0;
    static constexpr size_t kMaxNotes = 2;

    [[nodiscard]] static Explanation explain(const ExplanationInput& input);

    /// Heuristic sub-scores only.
    [[nodiscard]] static std::pair<ScoreDimension, double> decisive_dimension(
        const SubScores& winner, const SubScores* runner_up, const ScoringWeights& weights) noexcept;

    [[nodiscard]] static std::pair<ScoreDimension, double> decisive_factor(
        const CandidateScore& winner, const CandidateScore* runner_up, ScoringStrategyKind strategy,
        const ScoringWeights& weights, double classifier_weight) noexcept;
};

}  // namespace workload_router
