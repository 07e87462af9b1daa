#ifndef LOGISTIC_REGRESSION_HPP
#define LOGISTIC_REGRESSION_HPP

#include <Eigen/Dense>

using namespace Eigen;

// Binary logistic regression with an unpenalized intercept and an L2 penalty
// of strength 1/C on the remaining coefficients, fitted by penalized IRLS.
class LogisticRegression
{
private:
    MatrixXd X; // design matrix, leading column of ones
    VectorXd y; // 0/1 targets
    VectorXd beta; // coefficients, intercept first
    VectorXd eta;  // current linear predictor
    int n, p;
    int max_iterations;
    double rel_tolerance; // epsilon
    double penalty;       // 1/C
    int n_iterations;
    bool is_fitted;

    // Preallocated buffers to reduce per-iteration allocations
    mutable VectorXd sw; // sqrt(weights)
    mutable VectorXd z;  // working response
    mutable MatrixXd Xw; // weighted design
    mutable VectorXd zw; // weighted response

    // Helper methods
    static inline double plogis_clip(double t);
    static MatrixXd addInterceptColumn(const MatrixXd &X_raw);
    double penalized_deviance(const VectorXd &eta_in, const VectorXd &beta_in) const;
    VectorXd irls_proposal_beta_from_eta(const VectorXd &eta_curr) const;
    void initialize();

public:
    // X_in holds the raw features (no intercept column); y_in is 0/1.
    LogisticRegression(const MatrixXd &X_in, const VectorXd &y_in,
                       int max_iter = 100, double tol = 1e-4, double C = 1.0);

    // Main fitting method
    void fit();

    // Getters
    VectorXd getCoefficients() const; // intercept first
    int getNumIterations() const;
    bool isFitted() const;

    // Prediction on raw features
    VectorXd predict_proba(const MatrixXd &X_new) const;

    // Probability of the positive class for given coefficients (intercept first)
    static VectorXd probabilities(const MatrixXd &X_new, const VectorXd &coefficients);

    // Model diagnostics
    double get_deviance() const;
};

#endif // LOGISTIC_REGRESSION_HPP
