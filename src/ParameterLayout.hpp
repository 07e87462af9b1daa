#ifndef PARAMETER_LAYOUT_HPP
#define PARAMETER_LAYOUT_HPP

#include <Eigen/Dense>

using namespace Eigen;

// Learned quantities of a prototype representation.
struct PrototypeParameters
{
    MatrixXd prototypes;        // V, n_prototypes x n_features
    VectorXd predictor_weights; // w, n_prototypes, each in [0, 1]
    VectorXd dimension_weights; // alpha, n_features, non-negative
};

// Box constraints, one entry per coordinate. Infinite entries mean unbounded.
struct Bounds
{
    VectorXd lower;
    VectorXd upper;

    int size() const { return static_cast<int>(lower.size()); }
    bool contains(const VectorXd &x) const;
    VectorXd clip(const VectorXd &x) const;
};

// Describes how V, w and alpha are laid out in the flat vector handed to the
// minimizer: [V (row-major), w, alpha]. Packing, unpacking and bounds all go
// through this class so the slices cannot drift apart.
class ParameterLayout
{
private:
    int n_prototypes;
    int n_features;

public:
    ParameterLayout(int num_prototypes, int num_features);

    int getNumPrototypes() const { return n_prototypes; }
    int getNumFeatures() const { return n_features; }

    // Slice sizes
    int prototypeVectorsSize() const { return n_prototypes * n_features; }
    int predictorWeightsSize() const { return n_prototypes; }
    int dimensionWeightsSize() const { return n_features; }
    int totalSize() const;

    // Slice offsets
    int prototypeVectorsOffset() const { return 0; }
    int predictorWeightsOffset() const { return prototypeVectorsSize(); }
    int dimensionWeightsOffset() const { return prototypeVectorsSize() + predictorWeightsSize(); }

    VectorXd pack(const PrototypeParameters &params) const;
    PrototypeParameters unpack(const VectorXd &x) const;

    // Slice views without copying the whole parameter set
    MatrixXd prototypes(const VectorXd &x) const;
    VectorXd predictorWeights(const VectorXd &x) const;
    VectorXd dimensionWeights(const VectorXd &x) const;

    // V unbounded, w in [0, 1], alpha >= 0
    Bounds bounds() const;

private:
    void checkSize(const VectorXd &x) const;
};

#endif // PARAMETER_LAYOUT_HPP
