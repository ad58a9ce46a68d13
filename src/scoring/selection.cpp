/**
 * @file selection.cpp
 * @brief select_winner implementation.
 */

#include "scoring/selection.hpp"

#include <algorithm>

namespace workload_router {

namespace {

/// Best entry among `pool` (indices into scores); pool must be non-empty.
size_t pick_best(const std::vector<CandidateScore>& scores,
                 const std::vector<size_t>& pool, double epsilon) {
    double best_score = scores[pool.front()].score;
    for (size_t i : pool) best_score = std::max(best_score, scores[i].score);

    std::vector<size_t> tied;
    for (size_t i : pool) {
        if (scores[i].score >= best_score - epsilon) tied.push_back(i);
    }

    double best_headroom = scores[tied.front()].breakdown.headroom;
    for (size_t i : tied) best_headroom = std::max(best_headroom, scores[i].breakdown.headroom);

    size_t winner = pool.front();
    bool found = false;
    for (size_t i : tied) {
        if (scores[i].breakdown.headroom < best_headroom - epsilon) continue;
        if (!found || scores[i].node_id < scores[winner].node_id) {
            winner = i;
            found = true;
        }
    }
    return winner;
}

}  // anonymous namespace

Result<Selection> select_winner(const std::vector<CandidateScore>& scores, double epsilon) {
    if (scores.empty()) {
        return Error{ErrorCode::NoEligibleNode, "No scored candidates to select from"};
    }

    std::vector<size_t> pool(scores.size());
    for (size_t i = 0; i < pool.size(); ++i) pool[i] = i;

    Selection selection{.winner_index = pick_best(scores, pool, epsilon)};

    std::erase(pool, selection.winner_index);
    if (!pool.empty()) {
        selection.runner_up_index = pick_best(scores, pool, epsilon);
    }
    return selection;
}

}  // namespace workload_router
