#ifndef JOINT_OBJECTIVE_HPP
#define JOINT_OBJECTIVE_HPP

#include <Eigen/Dense>
#include "ParameterLayout.hpp"
#include "SensitiveGroups.hpp"

using namespace Eigen;

// The three loss components evaluated at one parameter vector
struct ObjectiveTerms
{
    double reconstruction;
    double classification;
    double fairness;
    double total;
};

// Weighted sum of reconstruction, classification and statistical-parity
// error of a prototype representation:
//
//   L(x) = Ax * mean ||X_i - (M V)_i||^2 + Ay * logloss(y, M w) + Az * fairness(M)
//
// where M = LatentMapping(X, V, alpha) and (V, w, alpha) are read from x
// through the layout. Holds references to the data; the caller keeps X, y
// and groups alive for the lifetime of the objective.
class JointObjective
{
private:
    const MatrixXd &X;
    const VectorXd &y;
    const SensitiveGroups &groups;
    ParameterLayout layout;
    double reconstruction_weight; // Ax
    double classification_weight; // Ay
    double fairness_weight;       // Az

public:
    JointObjective(const MatrixXd &X_in, const VectorXd &y_in,
                   const SensitiveGroups &groups_in, const ParameterLayout &layout_in,
                   double Ax, double Ay, double Az);

    double operator()(const VectorXd &x) const;

    ObjectiveTerms evaluateTerms(const VectorXd &x) const;
    ObjectiveTerms evaluateTerms(const PrototypeParameters &params) const;

    const ParameterLayout &getLayout() const { return layout; }
};

#endif // JOINT_OBJECTIVE_HPP
