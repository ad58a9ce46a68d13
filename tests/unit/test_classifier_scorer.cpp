/**
 * @file test_classifier_scorer.cpp
 * @brief Unit tests for classifier-driven and blended scoring.
 */

#include "core/config.hpp"
#include "scoring/classifier_scorer.hpp"

#include <gtest/gtest.h>

using namespace workload_router;

// ─── Test Fixtures ───────────────────────────

namespace {

/// Returns a fixed distribution, or a configured failure.
class FixedClassifier : public IRoutingClassifier {
public:
    FixedClassifier(std::vector<std::string> classes, std::vector<double> proba,
                    uint32_t schema = kFeatureSchemaVersion)
        : classes_(std::move(classes)), proba_(std::move(proba)), schema_(schema) {}

    Result<std::vector<double>> predict_proba(std::span<const double> features) const override {
        if (fail_) return Error{ErrorCode::ClassifierUnavailable, "predictor crashed"};
        if (features.size() != kFeatureWidth) return Error{ErrorCode::SchemaMismatch, "width"};
        return proba_;
    }

    const std::vector<std::string>& classes() const noexcept override { return classes_; }
    uint32_t schema_version() const noexcept override { return schema_; }
    size_t input_width() const noexcept override { return kFeatureWidth; }
    std::string_view version() const noexcept override { return "fixed"; }

    void set_failing(bool fail) { fail_ = fail; }

private:
    std::vector<std::string> classes_;
    std::vector<double> proba_;
    uint32_t schema_;
    bool fail_{false};
};

}  // namespace

class ClassifierScorerTest : public ::testing::Test {
protected:
    TaskDescriptor task_{.id = "t1", .task_type = "generic"};
    MetricsSnapshot snapshot_;
    FeatureVector features_;

    void SetUp() override {
        snapshot_.nodes = default_fleet();
        features_ = FeatureExtractor::extract(task_, snapshot_);
    }

    ScoringContext context() {
        return ScoringContext{
            .task = task_,
            .snapshot = snapshot_,
            .candidates = snapshot_.nodes,
            .features = features_
        };
    }
};

TEST_F(ClassifierScorerTest, ScoreIsCategoryProbability) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3});
    ClassifierScorer scorer(classifier, HeuristicScorer{});

    auto card = scorer.score(context());
    ASSERT_TRUE(card.has_value());
    EXPECT_EQ(card->strategy, ScoringStrategyKind::Classifier);
    ASSERT_EQ(card->scores.size(), 5u);
    EXPECT_DOUBLE_EQ(card->scores[0].score, 0.2);    // Edge-01
    EXPECT_DOUBLE_EQ(card->scores[1].score, 0.2);    // Edge-02
    EXPECT_DOUBLE_EQ(card->scores[2].score, 0.5);    // Cloud-AWS-East
    EXPECT_DOUBLE_EQ(card->scores[4].score, 0.3);    // GPU-Cluster-01
    EXPECT_DOUBLE_EQ(card->scores[2].probability, 0.5);
}

TEST_F(ClassifierScorerTest, BreakdownMatchesHeuristic) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3});
    HeuristicScorer heuristic;
    ClassifierScorer scorer(classifier, heuristic);

    auto card = scorer.score(context());
    auto expected = heuristic.breakdowns(context());
    ASSERT_TRUE(card.has_value());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(card->scores[i].breakdown, expected[i]);
    }
}

TEST_F(ClassifierScorerTest, UnlabeledCategoryScoresZero) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "fpga"}, std::vector<double>{0.3, 0.3, 0.4});
    ClassifierScorer scorer(classifier, HeuristicScorer{});

    auto probabilities = scorer.category_probabilities(features_);
    ASSERT_TRUE(probabilities.has_value());
    EXPECT_DOUBLE_EQ((*probabilities)[static_cast<size_t>(NodeCategory::Gpu)], 0.0);

    auto card = scorer.score(context());
    ASSERT_TRUE(card.has_value());
    EXPECT_DOUBLE_EQ(card->scores[4].score, 0.0);
}

TEST_F(ClassifierScorerTest, LongCategoryLabelAccepted) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu-accelerated"}, std::vector<double>{0.1, 0.1, 0.8});
    ClassifierScorer scorer(classifier, HeuristicScorer{});
    auto probabilities = scorer.category_probabilities(features_);
    ASSERT_TRUE(probabilities.has_value());
    EXPECT_DOUBLE_EQ((*probabilities)[static_cast<size_t>(NodeCategory::Gpu)], 0.8);
}

TEST_F(ClassifierScorerTest, SchemaSkewFails) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3}, 2);
    ClassifierScorer scorer(classifier, HeuristicScorer{});

    auto card = scorer.score(context());
    ASSERT_FALSE(card.has_value());
    EXPECT_TRUE(card.error().is(ErrorCode::SchemaMismatch));
}

TEST_F(ClassifierScorerTest, PredictorFailurePropagates) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3});
    classifier->set_failing(true);
    ClassifierScorer scorer(classifier, HeuristicScorer{});

    auto card = scorer.score(context());
    ASSERT_FALSE(card.has_value());
    EXPECT_TRUE(card.error().is(ErrorCode::ClassifierUnavailable));
}

TEST_F(ClassifierScorerTest, MissingClassifierFails) {
    ClassifierScorer scorer(nullptr, HeuristicScorer{});
    auto card = scorer.score(context());
    ASSERT_FALSE(card.has_value());
    EXPECT_TRUE(card.error().is(ErrorCode::ClassifierUnavailable));
}

TEST_F(ClassifierScorerTest, WrongProbabilityCountFails) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.5, 0.5});
    ClassifierScorer scorer(classifier, HeuristicScorer{});
    EXPECT_FALSE(scorer.score(context()).has_value());
}

// ─── BlendedScorer ───────────────────────────

TEST_F(ClassifierScorerTest, BlendMixesBothStrategies) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3});
    HeuristicScorer heuristic;
    BlendedScorer blended(classifier, heuristic, 0.25);
    EXPECT_DOUBLE_EQ(blended.classifier_weight(), 0.25);

    auto card = blended.score(context());
    auto reference = heuristic.score(context());
    ASSERT_TRUE(card.has_value());
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(card->strategy, ScoringStrategyKind::Blended);

    const std::array<double, 5> learned = {0.2, 0.2, 0.5, 0.5, 0.3};
    for (size_t i = 0; i < learned.size(); ++i) {
        double expected = 0.25 * learned[i] + 0.75 * reference->scores[i].score;
        EXPECT_NEAR(card->scores[i].score, expected, 1e-12) << card->scores[i].node_id;
        EXPECT_DOUBLE_EQ(card->scores[i].probability, learned[i]);
        EXPECT_EQ(card->scores[i].breakdown, reference->scores[i].breakdown);
    }
}

TEST_F(ClassifierScorerTest, BlendEndpoints) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3});
    HeuristicScorer heuristic;

    auto pure_heuristic = BlendedScorer(classifier, heuristic, 0.0).score(context());
    auto reference = heuristic.score(context());
    ASSERT_TRUE(pure_heuristic.has_value());
    for (size_t i = 0; i < reference->scores.size(); ++i) {
        EXPECT_NEAR(pure_heuristic->scores[i].score, reference->scores[i].score, 1e-12);
    }

    auto pure_classifier = BlendedScorer(classifier, heuristic, 1.0).score(context());
    ASSERT_TRUE(pure_classifier.has_value());
    EXPECT_NEAR(pure_classifier->scores[2].score, 0.5, 1e-12);
}

TEST_F(ClassifierScorerTest, BlendFailsWhenClassifierFails) {
    auto classifier = std::make_shared<FixedClassifier>(
        std::vector<std::string>{"edge", "cloud", "gpu"}, std::vector<double>{0.2, 0.5, 0.3});
    classifier->set_failing(true);
    BlendedScorer blended(classifier, HeuristicScorer{}, 0.5);
    EXPECT_FALSE(blended.score(context()).has_value());
}
