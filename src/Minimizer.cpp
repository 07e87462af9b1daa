#include <stdexcept>
#include "Minimizer.hpp"
#include "LbfgsbMinimizer.hpp"
#include "NelderMeadMinimizer.hpp"

std::unique_ptr<Minimizer> Minimizer::create(MinimizerMethod method, int n_threads)
{
    switch (method)
    {
    case MinimizerMethod::LBFGSB:
        return std::unique_ptr<Minimizer>(new LbfgsbMinimizer(n_threads));
    case MinimizerMethod::NelderMead:
        return std::unique_ptr<Minimizer>(new NelderMeadMinimizer());
    }
    throw std::invalid_argument("Unknown minimizer method");
}

MinimizerMethod parseMinimizerMethod(const std::string &name)
{
    if (name == "L-BFGS-B")
        return MinimizerMethod::LBFGSB;
    if (name == "Nelder-Mead")
        return MinimizerMethod::NelderMead;
    throw std::invalid_argument("Unknown optimizer: " + name + ". Use 'L-BFGS-B' or 'Nelder-Mead'");
}

std::string minimizerMethodName(MinimizerMethod method)
{
    switch (method)
    {
    case MinimizerMethod::LBFGSB:
        return "L-BFGS-B";
    case MinimizerMethod::NelderMead:
        return "Nelder-Mead";
    }
    return "unknown";
}
