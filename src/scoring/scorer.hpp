/**
 * @file scorer.hpp
 * @brief Scoring strategy interface and shared scoring types.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "features/feature_extractor.hpp"
#include "registry/metrics_snapshot.hpp"

#include <string_view>
#include <vector>

namespace workload_router {

/**
 * @brief Everything a strategy may read while ranking candidates.
 *
 * All members refer to data owned by the caller for the duration of one
 * decision.
 */
struct ScoringContext {
    const TaskDescriptor& task;
    const MetricsSnapshot& snapshot;
    const std::vector<NodeState>& candidates;
    const FeatureVector& features;
};

/**
 * @brief Ranked candidates from one strategy.
 *
 * `scores` has exactly one entry per candidate, in candidate order. Every
 * entry carries the heuristic sub-score breakdown, whichever strategy
 * produced the final score.
 */
struct ScoreCard {
    std::vector<CandidateScore> scores;
    ScoringStrategyKind strategy{ScoringStrategyKind::Heuristic};
};

/**
 * @brief Abstract interface for scoring strategies (runtime polymorphism).
 *
 * The engine selects a strategy from configuration at startup. Strategies
 * are immutable after construction, so score() may run concurrently.
 */
class IScoringStrategy {
public:
    virtual ~IScoringStrategy() = default;
    virtual Result<ScoreCard> score(const ScoringContext& context) const = 0;
    [[nodiscard]] virtual ScoringStrategyKind kind() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace workload_router
