#include <gtest/gtest.h>
#include <cfloat>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include "JointObjective.hpp"
#include "PerformanceEvaluator.hpp"
#include "SensitiveGroups.hpp"

namespace
{

std::vector<std::string> labels(std::initializer_list<const char *> values)
{
    return std::vector<std::string>(values.begin(), values.end());
}

} // namespace

// With one prototype every sample maps to it: reconstruction is the mean
// squared distance to V, the prediction is w and groups cannot differ.
TEST(SensitiveGroups, NumbersGroupsByFirstAppearance)
{
    SensitiveGroups groups(labels({"f", "m", "f", "x", "m"}));

    ASSERT_EQ(groups.getNumGroups(), 3);
    EXPECT_EQ(groups.getGroupLabels()[0], "f");
    EXPECT_EQ(groups.getGroupLabels()[2], "x");
    EXPECT_EQ(groups.getCodes(), std::vector<int>({0, 1, 0, 2, 1}));
    EXPECT_EQ(groups.getMembers(1), std::vector<int>({1, 4}));
    EXPECT_THROW(groups.getMembers(3), std::out_of_range);

    MatrixXd M(5, 1);
    M << 1.0, 2.0, 3.0, 4.0, 6.0;
    MatrixXd means = groups.groupMeans(M);
    EXPECT_DOUBLE_EQ(means(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(means(1, 0), 4.0);
    EXPECT_DOUBLE_EQ(means(2, 0), 4.0);
}

TEST(SensitiveGroups, ParityGapOfPredictions)
{
    SensitiveGroups groups(labels({"a", "a", "b", "b"}));
    VectorXi predictions(4);
    predictions << 1, 1, 0, 1;

    EXPECT_DOUBLE_EQ(PerformanceEvaluator::calculateParityGap(predictions, groups), 0.5);
}

TEST(JointObjective, SinglePrototypeTermsByHand)
{
    MatrixXd X(2, 2);
    X << 0.0, 0.0,
         2.0, 0.0;
    VectorXd y(2);
    y << 0.0, 1.0;
    SensitiveGroups groups(labels({"a", "b"}));
    ParameterLayout layout(1, 2);
    JointObjective objective(X, y, groups, layout, 1.0, 2.0, 3.0);

    PrototypeParameters params;
    params.prototypes = MatrixXd(1, 2);
    params.prototypes << 1.0, 0.0;
    params.predictor_weights = VectorXd::Constant(1, 0.5);
    params.dimension_weights = VectorXd::Ones(2);

    ObjectiveTerms terms = objective.evaluateTerms(params);

    EXPECT_NEAR(terms.reconstruction, 1.0, 1e-12);
    EXPECT_NEAR(terms.classification, std::log(2.0), 1e-12);
    EXPECT_NEAR(terms.fairness, 0.0, 1e-12);
    EXPECT_NEAR(terms.total, 1.0 + 2.0 * std::log(2.0), 1e-12);
    EXPECT_NEAR(objective(layout.pack(params)), terms.total, 1e-12);
}

TEST(JointObjective, FairnessOfTwoSeparatedGroups)
{
    MatrixXd X(2, 1);
    X << 0.0, 10.0;
    VectorXd y(2);
    y << 0.0, 1.0;
    SensitiveGroups groups(labels({"a", "b"}));
    ParameterLayout layout(2, 1);
    JointObjective objective(X, y, groups, layout, 1.0, 1.0, 1.0);

    PrototypeParameters params;
    params.prototypes = MatrixXd(2, 1);
    params.prototypes << 0.0, 10.0;
    params.predictor_weights = VectorXd::Constant(2, 0.5);
    params.dimension_weights = VectorXd::Ones(1);

    // Each group sits on its own prototype with membership p
    double p = 1.0 / (1.0 + std::exp(-10.0));
    ObjectiveTerms terms = objective.evaluateTerms(params);
    EXPECT_NEAR(terms.fairness, 2.0 * p - 1.0, 1e-12);
}

TEST(JointObjective, SingleGroupHasNoFairnessError)
{
    MatrixXd X(3, 2);
    X << 0.0, 1.0,
         5.0, -2.0,
         1.0, 1.0;
    VectorXd y(3);
    y << 1.0, 0.0, 1.0;
    SensitiveGroups groups(labels({"only", "only", "only"}));
    ParameterLayout layout(2, 2);
    JointObjective objective(X, y, groups, layout, 1.0, 1.0, 1.0);

    VectorXd x(layout.totalSize());
    x << 0.0, 1.0, 5.0, -2.0, 0.9, 0.1, 1.0, 1.0;

    EXPECT_DOUBLE_EQ(objective.evaluateTerms(x).fairness, 0.0);
}

TEST(JointObjective, FairnessAveragesOverGroupPairs)
{
    MatrixXd M(3, 2);
    M << 1.0, 0.0,
         0.0, 1.0,
         0.5, 0.5;
    SensitiveGroups groups(labels({"g0", "g1", "g2"}));

    // Pairs (0,1), (0,2), (1,2) differ by 1, 0.5 and 0.5
    EXPECT_NEAR(PerformanceEvaluator::calculateFairnessError(M, groups), 2.0 / 3.0, 1e-12);
}

TEST(JointObjective, ZeroWeightsSilenceTheirTerms)
{
    MatrixXd X(4, 2);
    X << 0.0, 1.0,
         1.0, 0.0,
         0.0, 0.0,
         1.0, 1.0;
    VectorXd y(4);
    y << 0.0, 1.0, 0.0, 1.0;
    SensitiveGroups groups(labels({"0", "0", "1", "1"}));
    ParameterLayout layout(2, 2);

    VectorXd x(layout.totalSize());
    x << 0.2, 0.8, 0.7, 0.1, 0.3, 0.6, 1.0, 2.0;

    JointObjective reconstruction_only(X, y, groups, layout, 1.0, 0.0, 0.0);
    JointObjective fairness_only(X, y, groups, layout, 0.0, 0.0, 1.0);
    ObjectiveTerms terms = reconstruction_only.evaluateTerms(x);

    EXPECT_DOUBLE_EQ(reconstruction_only(x), terms.reconstruction);
    EXPECT_DOUBLE_EQ(fairness_only(x), terms.fairness);
    EXPECT_GE(terms.reconstruction, 0.0);
    EXPECT_GE(terms.classification, 0.0);
    EXPECT_GE(terms.fairness, 0.0);
}

TEST(JointObjective, SaturatedPredictionsStayFinite)
{
    MatrixXd X = MatrixXd::Zero(2, 1);
    VectorXd y(2);
    y << 1.0, 1.0;
    SensitiveGroups groups(labels({"a", "b"}));
    ParameterLayout layout(1, 1);
    JointObjective objective(X, y, groups, layout, 1.0, 1.0, 1.0);

    VectorXd x(3);
    x << 0.0, 0.0, 1.0; // V, w = 0, alpha

    ObjectiveTerms terms = objective.evaluateTerms(x);
    EXPECT_TRUE(std::isfinite(terms.total));
    EXPECT_NEAR(terms.classification, -std::log(DBL_EPSILON), 1e-9);
}

TEST(JointObjective, DegenerateDistanceStaysFinite)
{
    MatrixXd X(3, 2);
    X << 1.0, 2.0,
         -1.0, 0.5,
         3.0, 3.0;
    VectorXd y(3);
    y << 0.0, 1.0, 1.0;
    SensitiveGroups groups(labels({"x", "y", "x"}));
    ParameterLayout layout(3, 2);
    JointObjective objective(X, y, groups, layout, 1.0, 1.0, 1.0);

    // Coinciding prototypes and all-zero alpha
    PrototypeParameters params;
    params.prototypes = MatrixXd::Ones(3, 2);
    params.predictor_weights = VectorXd::Constant(3, 0.5);
    params.dimension_weights = VectorXd::Zero(2);

    EXPECT_TRUE(std::isfinite(objective.evaluateTerms(params).total));
}

TEST(JointObjective, RejectsInconsistentInputs)
{
    MatrixXd X = MatrixXd::Zero(3, 2);
    VectorXd y = VectorXd::Zero(3);
    SensitiveGroups groups(labels({"a", "b", "a"}));

    EXPECT_THROW(JointObjective(X, VectorXd::Zero(2), groups, ParameterLayout(2, 2), 1.0, 1.0, 1.0),
                 std::invalid_argument);
    EXPECT_THROW(JointObjective(X, y, groups, ParameterLayout(2, 3), 1.0, 1.0, 1.0),
                 std::invalid_argument);
    EXPECT_THROW(JointObjective(X, y, groups, ParameterLayout(2, 2), 1.0, -1.0, 1.0),
                 std::invalid_argument);
}
