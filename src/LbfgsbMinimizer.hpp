#ifndef LBFGSB_MINIMIZER_HPP
#define LBFGSB_MINIMIZER_HPP

#include "Minimizer.hpp"

// Quasi-Newton bound-constrained minimizer (LBFGSpp's L-BFGS-B). The
// objective is a black box, so the gradient is approximated by finite
// differences: central where both neighbours are feasible, one-sided at
// the bounds.
class LbfgsbMinimizer : public Minimizer
{
private:
    int n_threads;
    int history_size;
    int max_linesearch;

public:
    explicit LbfgsbMinimizer(int threads = 1, int history = 10, int linesearch_steps = 40);

    MinimizeResult minimize(const ObjectiveFunction &f, const VectorXd &x0,
                            const Bounds &bounds, double tol, int max_iter) const override;

    std::string name() const override { return "L-BFGS-B"; }

    // Finite-difference gradient of f at x, staying inside the bounds.
    static VectorXd approximateGradient(const ObjectiveFunction &f, const VectorXd &x,
                                        double fx, const Bounds &bounds, int n_threads = 1);

    // Result after the solver threw: the best point seen, if it is usable.
    // Iterations are reported as 0 since the solver does not expose them.
    static MinimizeResult recoverBestPoint(const VectorXd &best_x, double best_f, int n_parameters,
                                           int evaluations, const std::string &reason);
};

#endif // LBFGSB_MINIMIZER_HPP
