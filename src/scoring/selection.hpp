/**
 * @file selection.hpp
 * @brief Winner selection with deterministic tie-breaking.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace workload_router {

struct Selection {
    size_t winner_index{0};
    std::optional<size_t> runner_up_index;    ///< Absent with a single candidate
};

/**
 * @brief Pick the highest score.
 *
 * Scores within `epsilon` of the best are tied. Among tied candidates the
 * greater headroom sub-score wins (when it differs by more than epsilon),
 * then the lexicographically smallest node id. Fails with NoEligibleNode on
 * an empty list.
 */
Result<Selection> select_winner(const std::vector<CandidateScore>& scores, double epsilon = 1e-6);

}  // namespace workload_router
