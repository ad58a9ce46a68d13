/**
 * @file classifier_scorer.hpp
 * @brief Scoring from a pre-trained category classifier, plus a blend of
 *        classifier and heuristic scores.
 */

#pragma once

#include "classifier/routing_classifier.hpp"
#include "scoring/heuristic_scorer.hpp"

#include <array>
#include <memory>

namespace workload_router {

/**
 * @brief score(node) = P(node.category | features).
 *
 * A category the classifier has no label for scores 0. The heuristic
 * breakdown is still attached to each entry so decisions remain explainable.
 */
class ClassifierScorer : public IScoringStrategy {
public:
    ClassifierScorer(std::shared_ptr<const IRoutingClassifier> classifier,
                     HeuristicScorer heuristic);

    Result<ScoreCard> score(const ScoringContext& context) const override;

    [[nodiscard]] ScoringStrategyKind kind() const noexcept override {
        return ScoringStrategyKind::Classifier;
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "classifier"; }

    /// Probability per category; fails on schema skew or predictor error.
    Result<std::array<double, 3>> category_probabilities(const FeatureVector& features) const;

private:
    std::shared_ptr<const IRoutingClassifier> classifier_;
    HeuristicScorer heuristic_;
};

/**
 * @brief score(node) = α·classifier + (1 − α)·heuristic.
 */
class BlendedScorer : public IScoringStrategy {
public:
    BlendedScorer(std::shared_ptr<const IRoutingClassifier> classifier,
                  HeuristicScorer heuristic, double classifier_weight);

    Result<ScoreCard> score(const ScoringContext& context) const override;

    [[nodiscard]] ScoringStrategyKind kind() const noexcept override {
        return ScoringStrategyKind::Blended;
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "blended"; }

    [[nodiscard]] double classifier_weight() const noexcept { return alpha_; }

private:
    ClassifierScorer classifier_;
    HeuristicScorer heuristic_;
    double alpha_;
};

}  // namespace workload_router
