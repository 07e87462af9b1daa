#include <limits>
#include <stdexcept>
#include <string>
#include "ParameterLayout.hpp"

using namespace std;

bool Bounds::contains(const VectorXd &x) const
{
    if (x.size() != lower.size() || x.size() != upper.size())
    {
        return false;
    }
    return (x.array() >= lower.array()).all() && (x.array() <= upper.array()).all();
}

VectorXd Bounds::clip(const VectorXd &x) const
{
    return x.cwiseMax(lower).cwiseMin(upper);
}

ParameterLayout::ParameterLayout(int num_prototypes, int num_features)
    : n_prototypes(num_prototypes), n_features(num_features)
{
    if (n_prototypes < 1)
    {
        throw std::invalid_argument("Number of prototypes must be positive");
    }
    if (n_features < 1)
    {
        throw std::invalid_argument("Number of features must be positive");
    }
}

int ParameterLayout::totalSize() const
{
    return prototypeVectorsSize() + predictorWeightsSize() + dimensionWeightsSize();
}

void ParameterLayout::checkSize(const VectorXd &x) const
{
    if (x.size() != totalSize())
    {
        throw std::invalid_argument("Parameter vector has length " + to_string(x.size()) +
                                    ", expected " + to_string(totalSize()));
    }
}

VectorXd ParameterLayout::pack(const PrototypeParameters &params) const
{
    if (params.prototypes.rows() != n_prototypes || params.prototypes.cols() != n_features)
    {
        throw std::invalid_argument("Prototype matrix must be n_prototypes x n_features");
    }
    if (params.predictor_weights.size() != n_prototypes)
    {
        throw std::invalid_argument("Predictor weights must have one entry per prototype");
    }
    if (params.dimension_weights.size() != n_features)
    {
        throw std::invalid_argument("Dimension weights must have one entry per feature");
    }

    VectorXd x(totalSize());

    // Row-major flattening of V
    for (int j = 0; j < n_prototypes; ++j)
    {
        x.segment(prototypeVectorsOffset() + j * n_features, n_features) =
            params.prototypes.row(j).transpose();
    }
    x.segment(predictorWeightsOffset(), predictorWeightsSize()) = params.predictor_weights;
    x.segment(dimensionWeightsOffset(), dimensionWeightsSize()) = params.dimension_weights;

    return x;
}

PrototypeParameters ParameterLayout::unpack(const VectorXd &x) const
{
    PrototypeParameters params;
    params.prototypes = prototypes(x);
    params.predictor_weights = predictorWeights(x);
    params.dimension_weights = dimensionWeights(x);
    return params;
}

MatrixXd ParameterLayout::prototypes(const VectorXd &x) const
{
    checkSize(x);
    MatrixXd V(n_prototypes, n_features);
    for (int j = 0; j < n_prototypes; ++j)
    {
        V.row(j) = x.segment(prototypeVectorsOffset() + j * n_features, n_features).transpose();
    }
    return V;
}

VectorXd ParameterLayout::predictorWeights(const VectorXd &x) const
{
    checkSize(x);
    return x.segment(predictorWeightsOffset(), predictorWeightsSize());
}

VectorXd ParameterLayout::dimensionWeights(const VectorXd &x) const
{
    checkSize(x);
    return x.segment(dimensionWeightsOffset(), dimensionWeightsSize());
}

Bounds ParameterLayout::bounds() const
{
    const double inf = std::numeric_limits<double>::infinity();

    Bounds b;
    b.lower = VectorXd::Constant(totalSize(), -inf);
    b.upper = VectorXd::Constant(totalSize(), inf);

    b.lower.segment(predictorWeightsOffset(), predictorWeightsSize()).setZero();
    b.upper.segment(predictorWeightsOffset(), predictorWeightsSize()).setOnes();

    b.lower.segment(dimensionWeightsOffset(), dimensionWeightsSize()).setZero();

    return b;
}
