#include <cfloat>    // DBL_EPSILON
#include <cmath>
#include <stdexcept>
#include <algorithm> // std::min
#include "LogisticRegression.hpp"
#include "FairRepresentationErrors.hpp"

using namespace std;

double LogisticRegression::plogis_clip(double t)
{
    double p;
    if (t >= 0)
    {
        p = 1.0 / (1.0 + std::exp(-t));
    }
    else
    {
        double e = std::exp(t);
        p = e / (1.0 + e);
    }
    return std::max(DBL_EPSILON, std::min(p, 1.0 - DBL_EPSILON));
}

MatrixXd LogisticRegression::addInterceptColumn(const MatrixXd &X_raw)
{
    MatrixXd design(X_raw.rows(), X_raw.cols() + 1);
    design.col(0) = VectorXd::Ones(X_raw.rows());
    design.rightCols(X_raw.cols()) = X_raw;
    return design;
}

double LogisticRegression::penalized_deviance(const VectorXd &eta_in, const VectorXd &beta_in) const
{
    // Vectorized deviance computation with clipping
    ArrayXd mu = 1.0 / (1.0 + (-eta_in.array()).exp());
    const double eps = DBL_EPSILON;
    mu = mu.max(eps).min(1.0 - eps);

    ArrayXd y_arr = y.array();
    double dev = ((-2.0) * (y_arr * mu.log() + (1.0 - y_arr) * (1.0 - mu).log())).sum();

    // The intercept is not penalized
    return dev + penalty * beta_in.tail(p - 1).squaredNorm();
}

VectorXd LogisticRegression::irls_proposal_beta_from_eta(const VectorXd &eta_curr) const
{
    // Ensure buffers are allocated
    if (sw.size() != n)
    {
        sw.resize(n);
        z.resize(n);
        zw.resize(n);
    }
    if (Xw.rows() != n || Xw.cols() != p)
    {
        Xw.resize(n, p);
    }

    // Compute working response and sqrt(weights)
    for (int i = 0; i < n; ++i)
    {
        double mu = plogis_clip(eta_curr(i));
        double dmu = mu * (1.0 - mu);
        sw(i) = std::sqrt(dmu);
        z(i) = eta_curr(i) + (y(i) - mu) / dmu;
    }

    Xw = X.array().colwise() * sw.array();
    zw = z.array() * sw.array();

    // Penalized weighted least squares:
    // (X^T W X + lambda P) beta = X^T W z, P = diag(0, 1, ..., 1)
    MatrixXd XtWX = Xw.transpose() * Xw;
    XtWX.diagonal().tail(p - 1).array() += penalty;
    VectorXd XtWz = Xw.transpose() * zw;

    Eigen::LLT<MatrixXd> llt;
    llt.compute(XtWX);

    if (llt.info() != Eigen::Success)
    {
        // Add a tiny ridge and retry
        double max_diag = XtWX.diagonal().cwiseAbs().maxCoeff();
        double ridge = std::max(1e-12, 1e-8 * max_diag);
        XtWX.diagonal().array() += ridge;
        llt.compute(XtWX);
    }

    if (llt.info() != Eigen::Success)
    {
        throw std::runtime_error("Logistic regression normal equations are singular");
    }

    return llt.solve(XtWz);
}

// Initialization
void LogisticRegression::initialize()
{
    beta = VectorXd::Zero(p);
    eta = VectorXd(n);
    for (int i = 0; i < n; ++i)
    {
        double mu0 = (y(i) + 0.5) / 2.0; // mustart for binomial with weights=1
        eta(i) = std::log(mu0 / (1.0 - mu0)); // etastart
    }
}

// Constructor
LogisticRegression::LogisticRegression(const MatrixXd &X_in, const VectorXd &y_in,
                                       int max_iter, double tol, double C)
    : X(addInterceptColumn(X_in)), y(y_in), max_iterations(max_iter), rel_tolerance(tol),
      n_iterations(0), is_fitted(false)
{
    if (X_in.rows() != y_in.size())
    {
        throw std::invalid_argument("X and y must have the same number of rows");
    }
    if (max_iter < 1)
    {
        throw std::invalid_argument("max_iter must be positive");
    }
    if (!(tol > 0.0))
    {
        throw std::invalid_argument("tol must be positive");
    }
    if (!(C > 0.0))
    {
        throw std::invalid_argument("C must be positive");
    }
    for (int i = 0; i < y.size(); ++i)
    {
        if (y(i) != 0.0 && y(i) != 1.0)
        {
            throw std::invalid_argument("y must contain only 0 and 1 values");
        }
    }

    penalty = 1.0 / C;
    n = X.rows();
    p = X.cols();
    beta = VectorXd::Zero(p);
    eta = VectorXd::Zero(n);
}

// Main fitting method
void LogisticRegression::fit()
{
    initialize();
    n_iterations = 0;

    // Use the CURRENT MODEL deviance (beta=0 => mu=0.5) as the baseline
    double dev_old = penalized_deviance(X * beta, beta);

    for (int iter = 0; iter < max_iterations; ++iter)
    {
        VectorXd beta_before = beta;
        // Halving target must pair with beta_before; on the first pass eta
        // still holds the etastart values
        VectorXd eta_before = X * beta_before;

        VectorXd beta_prop = irls_proposal_beta_from_eta(eta);
        VectorXd eta_prop = X * beta_prop;
        double dev_new = penalized_deviance(eta_prop, beta_prop);

        // Step-halving if the penalized deviance didn't drop
        for (int k = 0; k < 30 && !(dev_new < dev_old); ++k)
        {
            beta_prop = 0.5 * (beta_before + beta_prop);
            eta_prop = 0.5 * (eta_before + eta_prop);
            dev_new = penalized_deviance(eta_prop, beta_prop);
        }

        beta = beta_prop;
        eta = eta_prop;
        n_iterations = iter + 1;

        double crit = std::fabs(dev_new - dev_old) / (std::fabs(dev_new) + 0.1);
        dev_old = dev_new;

        if (crit <= rel_tolerance)
        {
            break; // converged
        }
    }

    is_fitted = true;
}

// Getter methods
VectorXd LogisticRegression::getCoefficients() const
{
    return beta;
}

int LogisticRegression::getNumIterations() const
{
    return n_iterations;
}

bool LogisticRegression::isFitted() const
{
    return is_fitted;
}

VectorXd LogisticRegression::probabilities(const MatrixXd &X_new, const VectorXd &coefficients)
{
    if (X_new.cols() + 1 != coefficients.size())
    {
        throw std::invalid_argument("Input matrix columns must match number of coefficients");
    }

    VectorXd eta_new = (X_new * coefficients.tail(coefficients.size() - 1)).array() + coefficients(0);
    VectorXd probs(eta_new.size());
    for (int i = 0; i < eta_new.size(); ++i)
    {
        probs(i) = plogis_clip(eta_new(i));
    }
    return probs;
}

// Prediction
VectorXd LogisticRegression::predict_proba(const MatrixXd &X_new) const
{
    if (!is_fitted)
    {
        throw NotFittedError("Model has not been fitted yet");
    }
    return probabilities(X_new, beta);
}

double LogisticRegression::get_deviance() const
{
    return penalized_deviance(eta, beta) - penalty * beta.tail(p - 1).squaredNorm();
}
