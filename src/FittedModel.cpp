#include <string>
#include "FittedModel.hpp"
#include "LatentMapping.hpp"
#include "LogisticRegression.hpp"
#include "FairRepresentationErrors.hpp"

using namespace std;

// Default constructor
FittedModel::FittedModel() : kind(Kind::Unfitted), n_features(0), n_iterations(0)
{
}

FittedModel::FittedModel(Kind model_kind, const VectorXd &coeffs, int features, int iterations)
    : kind(model_kind), coefficients(coeffs), n_features(features), n_iterations(iterations)
{
}

// Fit from a LogisticRegression object
FittedModel FittedModel::fromLogisticRegression(const LogisticRegression &lr_model)
{
    if (!lr_model.isFitted())
    {
        throw std::invalid_argument("Logistic regression must be fitted");
    }
    return fromLogisticCoefficients(lr_model.getCoefficients(), lr_model.getNumIterations());
}

// Coefficients with the intercept first
FittedModel FittedModel::fromLogisticCoefficients(const VectorXd &coeffs, int iterations)
{
    if (coeffs.size() < 2)
    {
        throw std::invalid_argument("Logistic coefficients need an intercept and at least one slope");
    }
    return FittedModel(Kind::Fallback, coeffs, static_cast<int>(coeffs.size()) - 1, iterations);
}

FittedModel FittedModel::fromPrototypes(const PrototypeParameters &params, int iterations)
{
    if (params.prototypes.rows() != params.predictor_weights.size() ||
        params.prototypes.cols() != params.dimension_weights.size())
    {
        throw std::invalid_argument("Prototype parameters have inconsistent shapes");
    }

    FittedModel model(Kind::Prototypes, params.predictor_weights,
                      static_cast<int>(params.prototypes.cols()), iterations);
    model.prototype = params;
    return model;
}

void FittedModel::requireFitted() const
{
    if (kind == Kind::Unfitted)
    {
        throw NotFittedError("Model has not been fitted yet");
    }
}

void FittedModel::requirePrototypes(const char *what) const
{
    requireFitted();
    if (kind != Kind::Prototypes)
    {
        throw AttributeUnavailableError(
            std::string("No sensitive features provided when fitting. No ") + what + " learned.");
    }
}

VectorXd FittedModel::positiveProbability(const MatrixXd &X) const
{
    requireFitted();

    if (kind == Kind::Fallback)
    {
        return LogisticRegression::probabilities(X, coefficients);
    }

    MatrixXd M = LatentMapping::compute(X, prototype.prototypes, prototype.dimension_weights);
    // M rows sum to one and w lies in [0, 1]; clamp rounding excursions
    return (M * coefficients).cwiseMax(0.0).cwiseMin(1.0);
}

MatrixXd FittedModel::transform(const MatrixXd &X) const
{
    requireFitted();

    if (kind == Kind::Fallback)
    {
        return X;
    }

    MatrixXd M = LatentMapping::compute(X, prototype.prototypes, prototype.dimension_weights);
    return M * prototype.prototypes;
}

// Getters
bool FittedModel::isFitted() const
{
    return kind != Kind::Unfitted;
}

bool FittedModel::usesPrototypes() const
{
    return kind == Kind::Prototypes;
}

VectorXd FittedModel::getCoefficients() const
{
    requireFitted();
    return coefficients;
}

const MatrixXd &FittedModel::getPrototypes() const
{
    requirePrototypes("prototypes were");
    return prototype.prototypes;
}

const VectorXd &FittedModel::getDimensionWeights() const
{
    requirePrototypes("distance was");
    return prototype.dimension_weights;
}

const PrototypeParameters &FittedModel::getPrototypeParameters() const
{
    requirePrototypes("prototypes were");
    return prototype;
}

int FittedModel::getNumFeatures() const
{
    requireFitted();
    return n_features;
}

int FittedModel::getNumIterations() const
{
    requireFitted();
    return n_iterations;
}
