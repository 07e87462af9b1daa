#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include "LbfgsbMinimizer.hpp"
#include "Minimizer.hpp"
#include "NelderMeadMinimizer.hpp"

namespace
{

const double inf = std::numeric_limits<double>::infinity();

Bounds unbounded(int n)
{
    Bounds b;
    b.lower = VectorXd::Constant(n, -inf);
    b.upper = VectorXd::Constant(n, inf);
    return b;
}

// Minimum at (2, -1); under x0 <= 1, x1 >= 0 it moves to the corner (1, 0)
double shifted_quadratic(const VectorXd &x)
{
    return (x(0) - 2.0) * (x(0) - 2.0) + (x(1) + 1.0) * (x(1) + 1.0);
}

Bounds corner_box()
{
    Bounds b;
    b.lower = VectorXd(2);
    b.upper = VectorXd(2);
    b.lower << 0.0, 0.0;
    b.upper << 1.0, inf;
    return b;
}

} // namespace

TEST(Minimizer, ParsesMethodNames)
{
    EXPECT_EQ(parseMinimizerMethod("L-BFGS-B"), MinimizerMethod::LBFGSB);
    EXPECT_EQ(parseMinimizerMethod("Nelder-Mead"), MinimizerMethod::NelderMead);
    EXPECT_EQ(minimizerMethodName(MinimizerMethod::LBFGSB), "L-BFGS-B");
    EXPECT_EQ(minimizerMethodName(MinimizerMethod::NelderMead), "Nelder-Mead");
    EXPECT_THROW(parseMinimizerMethod("BFGS"), std::invalid_argument);
}

TEST(Minimizer, FactoryBuildsRequestedMethod)
{
    std::unique_ptr<Minimizer> lbfgsb = Minimizer::create(MinimizerMethod::LBFGSB, 2);
    std::unique_ptr<Minimizer> nelder_mead = Minimizer::create(MinimizerMethod::NelderMead);

    EXPECT_EQ(lbfgsb->name(), "L-BFGS-B");
    EXPECT_EQ(nelder_mead->name(), "Nelder-Mead");
}

TEST(LbfgsbMinimizer, UnconstrainedQuadratic)
{
    LbfgsbMinimizer minimizer;
    ObjectiveFunction f = [](const VectorXd &x)
    {
        return (x(0) - 1.0) * (x(0) - 1.0) + 4.0 * (x(1) + 2.0) * (x(1) + 2.0) +
               0.5 * (x(2) - 3.0) * (x(2) - 3.0);
    };

    MinimizeResult result = minimizer.minimize(f, VectorXd::Zero(3), unbounded(3), 1e-8, 200);

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.x(0), 1.0, 1e-3);
    EXPECT_NEAR(result.x(1), -2.0, 1e-3);
    EXPECT_NEAR(result.x(2), 3.0, 1e-3);
    EXPECT_NEAR(result.fun, 0.0, 1e-6);
    EXPECT_GT(result.evaluations, 0);
}

TEST(LbfgsbMinimizer, StopsAtActiveBounds)
{
    LbfgsbMinimizer minimizer;
    VectorXd x0(2);
    x0 << 0.5, 0.5;

    MinimizeResult result = minimizer.minimize(shifted_quadratic, x0, corner_box(), 1e-8, 200);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(corner_box().contains(result.x));
    EXPECT_NEAR(result.x(0), 1.0, 1e-4);
    EXPECT_NEAR(result.x(1), 0.0, 1e-4);
    EXPECT_NEAR(result.fun, 2.0, 1e-4);
}

TEST(LbfgsbMinimizer, GradientIsOneSidedAtTheBound)
{
    Bounds b;
    b.lower = VectorXd::Zero(1);
    b.upper = VectorXd::Constant(1, inf);
    // sqrt is undefined left of zero, so a central difference would be NaN
    ObjectiveFunction f = [](const VectorXd &x)
    {
        return std::sqrt(x(0)) + x(0);
    };

    VectorXd x = VectorXd::Zero(1);
    VectorXd grad = LbfgsbMinimizer::approximateGradient(f, x, f(x), b);
    EXPECT_TRUE(std::isfinite(grad(0)));
    EXPECT_GT(grad(0), 1.0);

    VectorXd interior = VectorXd::Constant(1, 4.0);
    grad = LbfgsbMinimizer::approximateGradient(f, interior, f(interior), b);
    EXPECT_NEAR(grad(0), 1.25, 1e-6);
}

TEST(LbfgsbMinimizer, ParallelGradientMatchesSerial)
{
    ObjectiveFunction f = [](const VectorXd &x)
    {
        return x.squaredNorm() + std::sin(x(0) * x(1));
    };
    VectorXd x(4);
    x << 0.3, -1.2, 2.0, 0.0;

    VectorXd serial = LbfgsbMinimizer::approximateGradient(f, x, f(x), unbounded(4), 1);
    VectorXd parallel = LbfgsbMinimizer::approximateGradient(f, x, f(x), unbounded(4), 4);

    EXPECT_TRUE(serial.isApprox(parallel, 1e-12));
}

TEST(LbfgsbMinimizer, NonFiniteObjectiveIsNotASuccess)
{
    LbfgsbMinimizer minimizer;
    ObjectiveFunction f = [](const VectorXd &)
    {
        return std::numeric_limits<double>::quiet_NaN();
    };

    MinimizeResult result = minimizer.minimize(f, VectorXd::Zero(2), unbounded(2), 1e-6, 50);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.message.empty());
}

TEST(LbfgsbMinimizer, StalledSearchKeepsBestPointWithoutInventingIterations)
{
    VectorXd best(2);
    best << 0.25, -1.0;

    MinimizeResult result = LbfgsbMinimizer::recoverBestPoint(best, 3.5, 2, 57, "line search failed");

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.converged);
    EXPECT_TRUE(result.x == best);
    EXPECT_DOUBLE_EQ(result.fun, 3.5);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_EQ(result.evaluations, 57);
    EXPECT_NE(result.message.find("line search failed"), std::string::npos);
    EXPECT_NE(result.message.find("57 evaluations"), std::string::npos);
}

TEST(LbfgsbMinimizer, StalledSearchWithoutFinitePointFails)
{
    MinimizeResult empty = LbfgsbMinimizer::recoverBestPoint(VectorXd(), 0.0, 2, 1, "no point");
    EXPECT_FALSE(empty.success);

    MinimizeResult infinite = LbfgsbMinimizer::recoverBestPoint(
        VectorXd::Zero(2), std::numeric_limits<double>::infinity(), 2, 3, "no point");
    EXPECT_FALSE(infinite.success);
}

TEST(LbfgsbMinimizer, RejectsInfeasibleStart)
{
    LbfgsbMinimizer minimizer;
    VectorXd x0(2);
    x0 << 1.5, 0.0;

    EXPECT_THROW(minimizer.minimize(shifted_quadratic, x0, corner_box(), 1e-6, 50), std::invalid_argument);
    EXPECT_THROW(minimizer.minimize(shifted_quadratic, VectorXd::Zero(3), corner_box(), 1e-6, 50),
                 std::invalid_argument);
}

TEST(NelderMeadMinimizer, UnconstrainedQuadratic)
{
    NelderMeadMinimizer minimizer;
    VectorXd x0(2);
    x0 << 0.5, 0.5;

    MinimizeResult result = minimizer.minimize(shifted_quadratic, x0, unbounded(2), 1e-10, 5000);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x(0), 2.0, 1e-4);
    EXPECT_NEAR(result.x(1), -1.0, 1e-4);
}

TEST(NelderMeadMinimizer, KeepsIteratesInsideTheBox)
{
    NelderMeadMinimizer minimizer;
    Bounds box = corner_box();
    ObjectiveFunction f = [&box](const VectorXd &x)
    {
        EXPECT_TRUE(box.contains(x));
        return shifted_quadratic(x);
    };
    VectorXd x0(2);
    x0 << 0.5, 0.5;

    MinimizeResult result = minimizer.minimize(f, x0, box, 1e-10, 5000);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(box.contains(result.x));
    EXPECT_NEAR(result.x(0), 1.0, 1e-3);
    EXPECT_NEAR(result.x(1), 0.0, 1e-3);
}

TEST(NelderMeadMinimizer, IterationCapIsReported)
{
    NelderMeadMinimizer minimizer;
    VectorXd x0(2);
    x0 << 10.0, 10.0;

    MinimizeResult result = minimizer.minimize(shifted_quadratic, x0, unbounded(2), 1e-12, 3);

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 3);
    EXPECT_LT(result.fun, shifted_quadratic(x0));
}
