#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include "NelderMeadMinimizer.hpp"

using namespace std;

NelderMeadMinimizer::NelderMeadMinimizer()
    : reflection(1.0), expansion(2.0), contraction(0.5), shrinkage(0.5)
{
}

std::vector<VectorXd> NelderMeadMinimizer::initialSimplex(const VectorXd &x0, const Bounds &bounds) const
{
    const int n = x0.size();
    std::vector<VectorXd> simplex;
    simplex.push_back(x0);

    for (int i = 0; i < n; ++i)
    {
        VectorXd vertex = x0;
        // 5% step, or a small absolute step at zero
        double step = (x0(i) != 0.0) ? 0.05 * x0(i) : 0.00025;
        vertex(i) = x0(i) + step;
        if (vertex(i) > bounds.upper(i))
        {
            vertex(i) = x0(i) - step;
        }
        simplex.push_back(bounds.clip(vertex));
    }

    return simplex;
}

MinimizeResult NelderMeadMinimizer::minimize(const ObjectiveFunction &f, const VectorXd &x0,
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

    const int n = x0.size();
    MinimizeResult result;

    std::vector<VectorXd> simplex = initialSimplex(x0, bounds);
    std::vector<double> values(n + 1);
    for (int i = 0; i <= n; ++i)
    {
        values[i] = f(simplex[i]);
        result.evaluations++;
    }

    std::vector<int> order(n + 1);
    int iter = 0;

    while (true)
    {
        // Sort vertices by objective value, best first
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(),
                  [&values](int a, int b)
                  {
                      return values[a] < values[b];
                  });
        std::vector<VectorXd> sorted_simplex(n + 1);
        std::vector<double> sorted_values(n + 1);
        for (int i = 0; i <= n; ++i)
        {
            sorted_simplex[i] = simplex[order[i]];
            sorted_values[i] = values[order[i]];
        }
        simplex.swap(sorted_simplex);
        values.swap(sorted_values);

        double x_spread = 0.0;
        double f_spread = 0.0;
        for (int i = 1; i <= n; ++i)
        {
            x_spread = std::max(x_spread, (simplex[i] - simplex[0]).cwiseAbs().maxCoeff());
            f_spread = std::max(f_spread, std::fabs(values[i] - values[0]));
        }
        if (x_spread <= tol && f_spread <= tol)
        {
            result.converged = true;
            break;
        }
        if (iter >= max_iter)
        {
            break;
        }
        iter++;

        VectorXd centroid = VectorXd::Zero(n);
        for (int i = 0; i < n; ++i)
        {
            centroid += simplex[i];
        }
        centroid /= n;

        VectorXd reflected = bounds.clip(centroid + reflection * (centroid - simplex[n]));
        double f_reflected = f(reflected);
        result.evaluations++;

        bool shrink = false;
        if (f_reflected < values[0])
        {
            VectorXd expanded = bounds.clip(centroid + reflection * expansion * (centroid - simplex[n]));
            double f_expanded = f(expanded);
            result.evaluations++;
            if (f_expanded < f_reflected)
            {
                simplex[n] = expanded;
                values[n] = f_expanded;
            }
            else
            {
                simplex[n] = reflected;
                values[n] = f_reflected;
            }
        }
        else if (f_reflected < values[n - 1])
        {
            simplex[n] = reflected;
            values[n] = f_reflected;
        }
        else if (f_reflected < values[n])
        {
            // Outside contraction
            VectorXd contracted = bounds.clip(centroid + contraction * reflection * (centroid - simplex[n]));
            double f_contracted = f(contracted);
            result.evaluations++;
            if (f_contracted <= f_reflected)
            {
                simplex[n] = contracted;
                values[n] = f_contracted;
            }
            else
            {
                shrink = true;
            }
        }
        else
        {
            // Inside contraction
            VectorXd contracted = bounds.clip(centroid - contraction * (centroid - simplex[n]));
            double f_contracted = f(contracted);
            result.evaluations++;
            if (f_contracted < values[n])
            {
                simplex[n] = contracted;
                values[n] = f_contracted;
            }
            else
            {
                shrink = true;
            }
        }

        if (shrink)
        {
            for (int i = 1; i <= n; ++i)
            {
                simplex[i] = bounds.clip(simplex[0] + shrinkage * (simplex[i] - simplex[0]));
                values[i] = f(simplex[i]);
                result.evaluations++;
            }
        }
    }

    result.x = simplex[0];
    result.fun = values[0];
    result.iterations = iter;
    result.success = std::isfinite(result.fun);
    result.message = result.converged ? "converged" : "maximum number of iterations reached";
    if (!result.success)
    {
        result.message = "objective is not finite at the best simplex vertex";
    }

    return result;
}
