#include <cmath>
#include <stdexcept>
#include <string>
#include "LatentMapping.hpp"

using namespace std;

MatrixXd LatentMapping::compute(const MatrixXd &X, const MatrixXd &prototypes,
                                const VectorXd &dimension_weights)
{
    MatrixXd M = weightedDistances(X, prototypes, dimension_weights);
    softmaxOfNegated(M);
    return M;
}

MatrixXd LatentMapping::weightedDistances(const MatrixXd &X, const MatrixXd &prototypes,
                                          const VectorXd &dimension_weights)
{
    if (prototypes.rows() < 1)
    {
        throw std::invalid_argument("At least one prototype is required");
    }
    if (X.cols() != prototypes.cols())
    {
        throw std::invalid_argument("X has " + to_string(X.cols()) +
                                    " features but prototypes have " +
                                    to_string(prototypes.cols()));
    }
    if (dimension_weights.size() != X.cols())
    {
        throw std::invalid_argument("Dimension weights must have one entry per feature");
    }
    if ((dimension_weights.array() < 0.0).any())
    {
        throw std::invalid_argument("Dimension weights must be non-negative");
    }

    const int n = X.rows();
    const int k = prototypes.rows();
    MatrixXd D(n, k);
    ArrayXd sqrt_weights = dimension_weights.array().sqrt();

    for (int j = 0; j < k; ++j)
    {
        for (int i = 0; i < n; ++i)
        {
            // Halving both sides keeps x - v finite for any finite inputs
            ArrayXd diff = (0.5 * X.row(i).array() - 0.5 * prototypes.row(j).array()).transpose() *
                           sqrt_weights;
            D(i, j) = 2.0 * scaledNorm(diff);
        }
    }

    return D;
}

double LatentMapping::scaledNorm(const ArrayXd &v)
{
    double scale = v.abs().maxCoeff();
    if (scale == 0.0 || !std::isfinite(scale))
    {
        return scale;
    }
    return scale * std::sqrt((v / scale).square().sum());
}

void LatentMapping::softmaxOfNegated(MatrixXd &D)
{
    for (int i = 0; i < D.rows(); ++i)
    {
        double shift = D.row(i).minCoeff();
        if (std::isinf(shift))
        {
            // Every prototype is infinitely far: share the row evenly
            D.row(i).setConstant(1.0 / D.cols());
            continue;
        }
        D.row(i) = (-(D.row(i).array() - shift)).exp().matrix();
        D.row(i) /= D.row(i).sum();
    }
}
