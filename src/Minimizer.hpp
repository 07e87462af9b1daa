#ifndef MINIMIZER_HPP
#define MINIMIZER_HPP

#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <string>
#include "ParameterLayout.hpp"

using namespace Eigen;

typedef std::function<double(const VectorXd &)> ObjectiveFunction;

enum class MinimizerMethod
{
    LBFGSB,
    NelderMead
};

// Outcome of a minimization. success means x holds a usable point (finite
// objective, inside the bounds); converged means the method's stopping
// criterion was met before the iteration cap or a stall.
struct MinimizeResult
{
    VectorXd x;
    double fun;
    bool success;
    bool converged;
    int iterations;
    int evaluations;
    std::string message;

    MinimizeResult()
        : fun(0.0), success(false), converged(false), iterations(0), evaluations(0) {}
};

class Minimizer
{
public:
    virtual ~Minimizer() {}

    // Minimize f over the box, starting from x0 (which must lie inside it).
    // tol is the convergence tolerance, max_iter the iteration cap.
    virtual MinimizeResult minimize(const ObjectiveFunction &f, const VectorXd &x0,
                                    const Bounds &bounds, double tol, int max_iter) const = 0;

    virtual std::string name() const = 0;

    static std::unique_ptr<Minimizer> create(MinimizerMethod method, int n_threads = 1);
};

// "L-BFGS-B" and "Nelder-Mead"
MinimizerMethod parseMinimizerMethod(const std::string &name);
std::string minimizerMethodName(MinimizerMethod method);

#endif // MINIMIZER_HPP
