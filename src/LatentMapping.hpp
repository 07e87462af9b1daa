#ifndef LATENT_MAPPING_HPP
#define LATENT_MAPPING_HPP

#include <Eigen/Dense>

using namespace Eigen;

class LatentMapping
{
public:
    // Row-stochastic membership of each sample in each prototype:
    // M(i, j) = softmax_j(-||X_i - V_j||_alpha), where ||.||_alpha is the
    // Euclidean norm with per-dimension weights alpha (alpha >= 0).
    static MatrixXd compute(const MatrixXd &X, const MatrixXd &prototypes,
                            const VectorXd &dimension_weights);

    // Weighted Euclidean distances, n_samples x n_prototypes.
    static MatrixXd weightedDistances(const MatrixXd &X, const MatrixXd &prototypes,
                                      const VectorXd &dimension_weights);

    // In-place softmax of -D along rows. The row minimum is shifted to zero
    // before exponentiating; a row with no finite distance becomes uniform.
    static void softmaxOfNegated(MatrixXd &D);

    // Euclidean norm of v, computed on v / max|v| so squaring cannot overflow
    static double scaledNorm(const ArrayXd &v);
};

#endif // LATENT_MAPPING_HPP
