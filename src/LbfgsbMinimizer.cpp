#include <algorithm>
#include <cfloat>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <LBFGSB.h>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "LbfgsbMinimizer.hpp"

using namespace std;

namespace
{
    // Adapts a value-only objective to LBFGSpp's f(x, grad) interface and
    // remembers the best feasible point seen, so a stalled line search still
    // leaves something usable behind.
    class FiniteDifferenceProblem
    {
    private:
        const ObjectiveFunction &f;
        const Bounds &bounds;
        int n_threads;

    public:
        VectorXd best_x;
        double best_f;
        int evaluations;

        FiniteDifferenceProblem(const ObjectiveFunction &f_in, const Bounds &bounds_in, int threads)
            : f(f_in), bounds(bounds_in), n_threads(threads),
              best_f(std::numeric_limits<double>::infinity()), evaluations(0)
        {
        }

        double operator()(const VectorXd &x, VectorXd &grad)
        {
            double fx = f(x);
            evaluations++;
            if (!std::isfinite(fx))
            {
                throw std::runtime_error("objective returned a non-finite value");
            }
            if (fx < best_f)
            {
                best_f = fx;
                best_x = x;
            }
            grad = LbfgsbMinimizer::approximateGradient(f, x, fx, bounds, n_threads);
            evaluations += 2 * static_cast<int>(x.size());
            return fx;
        }
    };
}

LbfgsbMinimizer::LbfgsbMinimizer(int threads, int history, int linesearch_steps)
    : n_threads(threads), history_size(history), max_linesearch(linesearch_steps)
{
    if (history_size < 1)
    {
        throw std::invalid_argument("L-BFGS history size must be positive");
    }
}

VectorXd LbfgsbMinimizer::approximateGradient(const ObjectiveFunction &f, const VectorXd &x,
                                              double fx, const Bounds &bounds, int n_threads)
{
    const int n = x.size();
    const double base_step = std::cbrt(DBL_EPSILON);
    VectorXd grad(n);

#ifdef _OPENMP
#pragma omp parallel for num_threads(n_threads) if (n_threads > 1) schedule(static)
#endif
    for (int i = 0; i < n; ++i)
    {
        double h = base_step * std::max(1.0, std::fabs(x(i)));
        bool can_step_up = x(i) + h <= bounds.upper(i);
        bool can_step_down = x(i) - h >= bounds.lower(i);

        VectorXd xp = x;
        if (can_step_up && can_step_down)
        {
            xp(i) = x(i) + h;
            double f_up = f(xp);
            xp(i) = x(i) - h;
            double f_down = f(xp);
            grad(i) = (f_up - f_down) / (2.0 * h);
        }
        else if (can_step_up)
        {
            xp(i) = x(i) + h;
            grad(i) = (f(xp) - fx) / h;
        }
        else if (can_step_down)
        {
            xp(i) = x(i) - h;
            grad(i) = (fx - f(xp)) / h;
        }
        else
        {
            // Box narrower than the step
            grad(i) = 0.0;
        }
    }

    return grad;
}

MinimizeResult LbfgsbMinimizer::minimize(const ObjectiveFunction &f, const VectorXd &x0,
                                         const Bounds &bounds, double tol, int max_iter) const
{
    if (bounds.size() != x0.size())
    {
        throw std::invalid_argument("Bounds must have one entry per parameter");
    }
    if (!bounds.contains(x0))
    {
        throw std::invalid_argument("Initial point violates the bounds");
    }

    LBFGSpp::LBFGSBParam<double> param;
    param.m = history_size;
    param.epsilon = tol;
    param.epsilon_rel = tol;
    param.past = 1;
    param.delta = tol;
    param.max_iterations = max_iter;
    param.max_linesearch = max_linesearch;

    LBFGSpp::LBFGSBSolver<double> solver(param);
    FiniteDifferenceProblem problem(f, bounds, n_threads);

    MinimizeResult result;
    VectorXd x = x0;
    double fx = 0.0;

    try
    {
        int niter = solver.minimize(problem, x, fx, bounds.lower, bounds.upper);

        result.x = x;
        result.fun = fx;
        result.iterations = niter;
        result.evaluations = problem.evaluations;
        result.success = std::isfinite(fx);
        result.converged = result.success && niter < max_iter;
        result.message = result.converged ? "converged"
                                          : "maximum number of iterations reached";
    }
    catch (const std::exception &e)
    {
        // Line search gave up; keep the lowest point evaluated so far
        result = recoverBestPoint(problem.best_x, problem.best_f, x0.size(),
                                  problem.evaluations, e.what());
    }

    return result;
}

MinimizeResult LbfgsbMinimizer::recoverBestPoint(const VectorXd &best_x, double best_f, int n_parameters,
                                                 int evaluations, const std::string &reason)
{
    MinimizeResult result;
    result.evaluations = evaluations;
    // The solver aborted mid-iteration and does not report how many
    // iterations it completed
    result.iterations = 0;
    result.converged = false;
    result.message = reason + " (stopped after " + std::to_string(evaluations) + " evaluations)";

    if (best_x.size() == n_parameters && std::isfinite(best_f))
    {
        result.x = best_x;
        result.fun = best_f;
        result.success = true;
    }
    return result;
}
