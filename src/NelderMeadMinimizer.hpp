#ifndef NELDER_MEAD_MINIMIZER_HPP
#define NELDER_MEAD_MINIMIZER_HPP

#include <vector>
#include "Minimizer.hpp"

// Derivative-free downhill simplex. Every trial point is clipped into the
// bounds. Stops when both the simplex diameter and the spread of objective
// values fall below the tolerance.
class NelderMeadMinimizer : public Minimizer
{
private:
    double reflection;  // rho
    double expansion;   // chi
    double contraction; // psi
    double shrinkage;   // sigma

public:
    NelderMeadMinimizer();

    MinimizeResult minimize(const ObjectiveFunction &f, const VectorXd &x0,
                            const Bounds &bounds, double tol, int max_iter) const override;

    std::string name() const override { return "Nelder-Mead"; }

private:
    std::vector<VectorXd> initialSimplex(const VectorXd &x0, const Bounds &bounds) const;
};

#endif // NELDER_MEAD_MINIMIZER_HPP
