/**
 * @file explainer.cpp
 * @brief Explainer implementation.
 */

#include "explain/explainer.hpp"

#include <cmath>
#include <format>
#include <tuple>

namespace workload_router {

std::pair<ScoreDimension, double> Explainer::decisive_dimension(
    const SubScores& winner, const SubScores* runner_up, const ScoringWeights& weights) noexcept {
    ScoreDimension best = kAllDimensions.front();
    double best_contribution = 0.0;
    bool first = true;

    for (auto dimension : kAllDimensions) {
        double delta = winner.get(dimension) - (runner_up ? runner_up->get(dimension) : 0.0);
        double contribution = weights.weight(dimension) * delta;
        if (first || contribution > best_contribution) {
            best = dimension;
            best_contribution = contribution;
            first = false;
        }
    }
    return {best, best_contribution};
}

std::pair<ScoreDimension, double> Explainer::decisive_factor(
    const CandidateScore& winner, const CandidateScore* runner_up, ScoringStrategyKind strategy,
    const ScoringWeights& weights, double classifier_weight) noexcept {
    const SubScores* runner_subs = runner_up ? &runner_up->breakdown : nullptr;
    double probability_delta = winner.probability - (runner_up ? runner_up->probability : 0.0);

    switch (strategy) {
        case ScoringStrategyKind::Heuristic:
            return decisive_dimension(winner.breakdown, runner_subs, weights);

        case ScoringStrategyKind::Classifier:
            return {ScoreDimension::ClassifierProbability, probability_delta};

        case ScoringStrategyKind::Blended: {
            auto [dimension, weighted] = decisive_dimension(winner.breakdown, runner_subs, weights);
            double heuristic_share = (1.0 - classifier_weight) * weighted;
            double classifier_share = classifier_weight * probability_delta;
            if (classifier_share > heuristic_share) {
                return {ScoreDimension::ClassifierProbability, classifier_share};
            }
            return {dimension, heuristic_share};
        }
    }
    return decisive_dimension(winner.breakdown, runner_subs, weights);
}

Explanation Explainer::explain(const ExplanationInput& input) {
    const auto& winner = input.scores.at(input.winner_index);
    const CandidateScore* runner_up = input.runner_up_index
        ? &input.scores.at(*input.runner_up_index) : nullptr;

    bool tied = runner_up && std::abs(winner.score - runner_up->score) <= input.tie_epsilon;

    ScoreDimension decisive{};
    double contribution = 0.0;
    if (tied) {
        decisive = ScoreDimension::Headroom;
        contribution = winner.breakdown.headroom - runner_up->breakdown.headroom;
    } else {
        std::tie(decisive, contribution) = decisive_factor(
            winner, runner_up, input.strategy, input.weights, input.classifier_weight);
    }

    std::string text = std::format("Routed {} to {} ({}) with {:.0f}% confidence via {} scoring.",
                                   input.task.id, winner.node_id, to_string(winner.category),
                                   winner.score * 100.0, to_string(input.strategy));

    if (tied) {
        text += std::format(" Tied with {} at {:.3f}; broken on {}.",
                            runner_up->node_id, runner_up->score,
                            contribution > input.tie_epsilon ? "resource headroom" : "node id");
    } else if (runner_up) {
        text += std::format(" Decisive factor: {} ({:+.3f} weighted over {}).",
                            to_string(decisive), contribution, runner_up->node_id);
    } else {
        text += std::format(" Decisive factor: {} ({:.3f} weighted); sole eligible node.",
                            to_string(decisive), contribution);
    }

    std::vector<std::string> notes;
    if (input.task.priority >= kHighPriority) {
        notes.push_back(std::format("high priority task (P{})", input.task.priority));
    }
    if (input.task.requires_gpu) {
        notes.emplace_back("GPU acceleration required");
    }
    if (input.network_latency_ms > kHighNetworkLatencyMs) {
        notes.push_back(std::format("elevated network latency ({:.0f} ms)", input.network_latency_ms));
    }
    if (notes.size() > kMaxNotes) notes.resize(kMaxNotes);
    if (!notes.empty()) {
        text += " Notes: ";
        for (size_t i = 0; i < notes.size(); ++i) {
            if (i > 0) text += "; ";
            text += notes[i];
        }
        text += ".";
    }

    if (input.degraded) {
        text += " Classifier unavailable, heuristic fallback used.";
    }

    if (!input.rejections.empty()) {
        text += std::format(" Excluded {} node(s):", input.rejections.size());
        for (size_t i = 0; i < input.rejections.size(); ++i) {
            const auto& rejection = input.rejections[i];
            text += i == 0 ? " " : ", ";
            text += rejection.node_id;
            text += " (";
            for (size_t j = 0; j < rejection.violations.size(); ++j) {
                if (j > 0) text += "/";
                text += to_string(rejection.violations[j].constraint);
            }
            text += ")";
        }
        text += ".";
    }

    return Explanation{
        .decisive = decisive,
        .decisive_contribution = contribution,
        .text = std::move(text)
    };
}

}  // namespace workload_router
