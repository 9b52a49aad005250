#include <cmath>

#include <userver/utest/utest.hpp>

#include "ml_model/isolation_forest_model.hpp"
#include "ml_model/logistic_model.hpp"

namespace fraud_fusion {

namespace {

models::IsolationForest SingleSplitForest() {
    models::IsolationForest proto;
    proto.add_feature_names("x");
    proto.set_max_samples(4);
    proto.set_contamination(0.01);
    proto.set_score_threshold(0.6);

    auto* tree = proto.add_trees();
    auto* root = tree->add_nodes();
    root->set_feature(0);
    root->set_threshold(5.0f);
    root->set_left(1);
    root->set_right(2);
    root->set_size(4);

    auto* left = tree->add_nodes();
    left->set_feature(-1);
    left->set_size(1);

    auto* right = tree->add_nodes();
    right->set_feature(-1);
    right->set_size(3);
    return proto;
}

} // anonymous namespace

TEST(IsolationForestModel, AveragePathLength) {
    EXPECT_DOUBLE_EQ(AveragePathLength(0), 0.0);
    EXPECT_DOUBLE_EQ(AveragePathLength(1), 0.0);
    EXPECT_DOUBLE_EQ(AveragePathLength(2), 1.0);
    EXPECT_NEAR(AveragePathLength(256), 10.2448, 1e-4);
}

TEST(IsolationForestModel, ScoresIsolatedPointHigher) {
    const auto model = IsolationForestModel::FromProto(SingleSplitForest());

    const float isolated[] = {1.0f};
    const float crowded[] = {9.0f};
    const double normalizer = AveragePathLength(4);

    EXPECT_NEAR(model.Score(isolated), std::pow(2.0, -1.0 / normalizer), 1e-12);
    EXPECT_NEAR(model.Score(crowded), std::pow(2.0, -(1.0 + AveragePathLength(3)) / normalizer), 1e-12);
    EXPECT_GT(model.Score(isolated), model.Score(crowded));
    EXPECT_TRUE(model.IsOutlier(isolated));
    EXPECT_FALSE(model.IsOutlier(crowded));

    const auto batch = model.ScoreBatch({1.0f, 9.0f}, 1);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_DOUBLE_EQ(batch[0], model.Score(isolated));
}

TEST(IsolationForestModel, RejectsBrokenTrees) {
    auto backwards = SingleSplitForest();
    backwards.mutable_trees(0)->mutable_nodes(0)->set_left(0);
    EXPECT_THROW(IsolationForestModel::FromProto(backwards), std::invalid_argument);

    auto dangling = SingleSplitForest();
    dangling.mutable_trees(0)->mutable_nodes(0)->set_right(7);
    EXPECT_THROW(IsolationForestModel::FromProto(dangling), std::invalid_argument);

    auto bad_feature = SingleSplitForest();
    bad_feature.mutable_trees(0)->mutable_nodes(0)->set_feature(3);
    EXPECT_THROW(IsolationForestModel::FromProto(bad_feature), std::invalid_argument);

    EXPECT_THROW(IsolationForestModel::FromProto(models::IsolationForest{}), std::invalid_argument);
}

TEST(IsolationForestModel, OnlyMinusOneMarksALeaf) {
    auto root_below_leaf = SingleSplitForest();
    root_below_leaf.mutable_trees(0)->mutable_nodes(0)->set_feature(-2);
    EXPECT_THROW(IsolationForestModel::FromProto(root_below_leaf), std::invalid_argument);

    auto child_below_leaf = SingleSplitForest();
    child_below_leaf.mutable_trees(0)->mutable_nodes(2)->set_feature(-7);
    EXPECT_THROW(IsolationForestModel::FromProto(child_below_leaf), std::invalid_argument);
}

TEST(LogisticModel, StandardizesBeforeWeights) {
    models::LogisticModel proto;
    proto.add_feature_names("x");
    proto.add_means(1.0);
    proto.add_scales(2.0);
    proto.add_weights(2.0);
    proto.set_intercept(-1.0);

    const auto model = LogisticModel::FromProto(proto);
    const float row[] = {3.0f};
    EXPECT_DOUBLE_EQ(model.DecisionFunction(row), 1.0);
    EXPECT_DOUBLE_EQ(model.PredictProbability({3.0f}), Sigmoid(1.0));
    EXPECT_EQ(model.Name(), "Logistic Regression");
    EXPECT_THROW(model.PredictBatch({1.0f, 2.0f}, 2), std::invalid_argument);
}

TEST(LogisticModel, RejectsInconsistentArtifact) {
    models::LogisticModel proto;
    proto.add_feature_names("x");
    proto.add_feature_names("y");
    proto.add_means(0.0);
    proto.add_scales(1.0);
    proto.add_weights(1.0);
    EXPECT_THROW(LogisticModel::FromProto(proto), std::invalid_argument);

    models::LogisticModel zero_scale;
    zero_scale.add_feature_names("x");
    zero_scale.add_means(0.0);
    zero_scale.add_scales(0.0);
    zero_scale.add_weights(1.0);
    EXPECT_THROW(LogisticModel::FromProto(zero_scale), std::invalid_argument);
}

TEST(Sigmoid, IsStableAtExtremes) {
    EXPECT_DOUBLE_EQ(Sigmoid(0.0), 0.5);
    EXPECT_NEAR(Sigmoid(800.0), 1.0, 1e-12);
    EXPECT_NEAR(Sigmoid(-800.0), 0.0, 1e-12);
    EXPECT_FALSE(std::isnan(Sigmoid(-800.0)));
}

} // namespace fraud_fusion
