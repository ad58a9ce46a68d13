/**
 * @file classifier_scorer.cpp
 * @brief ClassifierScorer and BlendedScorer implementations.
 */

#include "scoring/classifier_scorer.hpp"

#include <algorithm>
#include <format>

namespace workload_router {

ClassifierScorer::ClassifierScorer(std::shared_ptr<const IRoutingClassifier> classifier,
                                   HeuristicScorer heuristic)
    : classifier_(std::move(classifier)), heuristic_(std::move(heuristic)) {}

Result<std::array<double, 3>> ClassifierScorer::category_probabilities(
    const FeatureVector& features) const {
    if (!classifier_) {
        return Error{ErrorCode::ClassifierUnavailable, "No classifier loaded"};
    }
    if (features.schema_version != classifier_->schema_version()) {
        return Error{ErrorCode::SchemaMismatch,
                     std::format("Features are schema v{}, classifier {} expects v{}",
                                 features.schema_version, classifier_->version(),
                                 classifier_->schema_version())};
    }

    auto proba = classifier_->predict_proba(features.values);
    if (!proba) return proba.error();

    const auto& labels = classifier_->classes();
    if (proba->size() != labels.size()) {
        return Error{ErrorCode::ClassifierUnavailable,
                     std::format("Classifier returned {} probabilities for {} classes",
                                 proba->size(), labels.size())};
    }

    std::array<double, 3> by_category{};
    for (size_t i = 0; i < labels.size(); ++i) {
        auto category = parse_node_category(labels[i]);
        if (!category) continue;
        by_category[static_cast<size_t>(*category)] = std::clamp((*proba)[i], 0.0, 1.0);
    }
    return by_category;
}

Result<ScoreCard> ClassifierScorer::score(const ScoringContext& context) const {
    auto probabilities = category_probabilities(context.features);
    if (!probabilities) return probabilities.error();

    auto subs = heuristic_.breakdowns(context);

    ScoreCard card;
    card.strategy = ScoringStrategyKind::Classifier;
    card.scores.reserve(context.candidates.size());
    for (size_t i = 0; i < context.candidates.size(); ++i) {
        const auto& node = context.candidates[i];
        card.scores.push_back(CandidateScore{
            .node_id = node.id,
            .category = node.category,
            .score = (*probabilities)[static_cast<size_t>(node.category)],
            .breakdown = subs[i],
            .probability = (*probabilities)[static_cast<size_t>(node.category)]
        });
    }
    return card;
}

BlendedScorer::BlendedScorer(std::shared_ptr<const IRoutingClassifier> classifier,
                             HeuristicScorer heuristic, double classifier_weight)
    : classifier_(std::move(classifier), heuristic),
      heuristic_(std::move(heuristic)),
      alpha_(std::clamp(classifier_weight, 0.0, 1.0)) {}

Result<ScoreCard> BlendedScorer::score(const ScoringContext& context) const {
    auto learned = classifier_.score(context);
    if (!learned) return learned.error();

    auto heuristic = heuristic_.score(context);
    if (!heuristic) return heuristic.error();

    ScoreCard card;
    card.strategy = ScoringStrategyKind::Blended;
    card.scores = std::move(heuristic->scores);
    for (size_t i = 0; i < card.scores.size(); ++i) {
        double blended = alpha_ * learned->scores[i].score + (1.0 - alpha_) * card.scores[i].score;
        card.scores[i].score = std::clamp(blended, 0.0, 1.0);
        card.scores[i].probability = learned->scores[i].probability;
    }
    return card;
}

}  // namespace workload_router
