#ifndef FITTED_MODEL_HPP
#define FITTED_MODEL_HPP

#include <Eigen/Dense>
#include "ParameterLayout.hpp"

using namespace Eigen;

class LogisticRegression;

// Learned state of the estimator. Exactly one of the two fitted forms is
// held: a fallback logistic regression, or a prototype representation
// (V, w, alpha). Only the named factories produce a fitted instance.
class FittedModel
{
public:
    enum class Kind
    {
        Unfitted,
        Fallback,
        Prototypes
    };

private:
    Kind kind;
    VectorXd coefficients;         // w for prototypes, [intercept, beta] for fallback
    PrototypeParameters prototype; // empty unless kind == Prototypes
    int n_features;
    int n_iterations;

    FittedModel(Kind model_kind, const VectorXd &coeffs, int features, int iterations);

public:
    // Unfitted
    FittedModel();

    static FittedModel fromLogisticRegression(const LogisticRegression &lr_model);
    static FittedModel fromLogisticCoefficients(const VectorXd &coeffs, int iterations);
    static FittedModel fromPrototypes(const PrototypeParameters &params, int iterations);

    // Positive-class probability for each row of X
    VectorXd positiveProbability(const MatrixXd &X) const;

    // Reconstruction M V, or X itself for the fallback form
    MatrixXd transform(const MatrixXd &X) const;

    // Getters
    bool isFitted() const;
    bool usesPrototypes() const;
    VectorXd getCoefficients() const;
    const MatrixXd &getPrototypes() const;
    const VectorXd &getDimensionWeights() const;
    const PrototypeParameters &getPrototypeParameters() const;
    int getNumFeatures() const;
    int getNumIterations() const;

private:
    void requireFitted() const;
    void requirePrototypes(const char *what) const;
};

#endif // FITTED_MODEL_HPP
