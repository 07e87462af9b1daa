#include <stdexcept>
#include "JointObjective.hpp"
#include "LatentMapping.hpp"
#include "PerformanceEvaluator.hpp"

using namespace std;

JointObjective::JointObjective(const MatrixXd &X_in, const VectorXd &y_in,
                               const SensitiveGroups &groups_in, const ParameterLayout &layout_in,
                               double Ax, double Ay, double Az)
    : X(X_in), y(y_in), groups(groups_in), layout(layout_in),
      reconstruction_weight(Ax), classification_weight(Ay), fairness_weight(Az)
{
    if (X.rows() != y.size())
    {
        throw std::invalid_argument("X and y must have the same number of rows");
    }
    if (groups.getNumSamples() != X.rows())
    {
        throw std::invalid_argument("Sensitive features must have one entry per sample");
    }
    if (X.cols() != layout.getNumFeatures())
    {
        throw std::invalid_argument("Parameter layout does not match the number of features");
    }
    if (Ax < 0.0 || Ay < 0.0 || Az < 0.0)
    {
        throw std::invalid_argument("Loss weights must be non-negative");
    }
}

double JointObjective::operator()(const VectorXd &x) const
{
    return evaluateTerms(x).total;
}

ObjectiveTerms JointObjective::evaluateTerms(const VectorXd &x) const
{
    return evaluateTerms(layout.unpack(x));
}

ObjectiveTerms JointObjective::evaluateTerms(const PrototypeParameters &params) const
{
    const MatrixXd &V = params.prototypes;
    MatrixXd M = LatentMapping::compute(X, V, params.dimension_weights);

    ObjectiveTerms terms;

    // Soft reconstruction through the prototypes
    MatrixXd X_hat = M * V;
    terms.reconstruction = (X - X_hat).rowwise().squaredNorm().mean();

    terms.fairness = PerformanceEvaluator::calculateFairnessError(M, groups);

    // Rows of M sum to one and w lies in [0, 1], so M w is a probability
    VectorXd y_hat = M * params.predictor_weights;
    terms.classification = PerformanceEvaluator::calculateLogLoss(y_hat, y);

    terms.total = reconstruction_weight * terms.reconstruction +
                  classification_weight * terms.classification +
                  fairness_weight * terms.fairness;
    return terms;
}
