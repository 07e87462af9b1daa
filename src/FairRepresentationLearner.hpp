#ifndef FAIR_REPRESENTATION_LEARNER_HPP
#define FAIR_REPRESENTATION_LEARNER_HPP

#include <Eigen/Dense>
#include <functional>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>
#include "FittedModel.hpp"
#include "JointObjective.hpp"
#include "LabelEncoder.hpp"
#include "Minimizer.hpp"
#include "SensitiveGroups.hpp"

using namespace Eigen;

struct LearnerConfig
{
    int n_prototypes = 2;
    double Ax = 1.0; // reconstruction weight
    double Ay = 1.0; // classification weight
    double Az = 1.0; // fairness weight
    int seed = -1;   // -1: non-deterministic
    MinimizerMethod method = MinimizerMethod::LBFGSB;
    double tolerance = 1e-6;
    int max_iterations = 1000;
    int n_threads = 1;
    bool verbose = false;

    void validate() const;
};

typedef std::function<void(const std::string &)> WarningHandler;

// Learns prototypes V, dimension weights alpha and prototype predictions w
// minimizing Ax * reconstruction + Ay * log-loss + Az * statistical parity
// error, after Zemel et al., "Learning Fair Representations" (ICML 2013).
// Without sensitive features it falls back to a plain L2-regularized
// logistic regression.
//
// Not thread-safe: a single instance must not be fitted and used
// concurrently.
class FairRepresentationLearner
{
private:
    LearnerConfig config;
    LabelEncoder label_encoder;
    FittedModel model;
    std::vector<std::string> group_labels;

    WarningHandler warning_handler;
    std::ostream *out;

    void warn(const std::string &message) const;
    void requireFitted() const;
    std::mt19937 makeRandomEngine() const;

public:
    explicit FairRepresentationLearner(const LearnerConfig &learner_config = LearnerConfig());

    // Fallback path: no sensitive features, warns and fits a logistic regression
    FairRepresentationLearner &fit(const MatrixXd &X, const VectorXd &y);
    FairRepresentationLearner &fit(const MatrixXd &X, const VectorXd &y,
                                   const std::vector<std::string> &sensitive_features);

    // Minimize the joint objective; y must already be encoded to {0, 1}.
    FittedModel fitWithGroups(const MatrixXd &X, const VectorXd &y_encoded,
                              const SensitiveGroups &groups, std::mt19937 &rng) const;
    FittedModel fitFallback(const MatrixXd &X, const VectorXd &y_encoded) const;

    MatrixXd transform(const MatrixXd &X) const;
    MatrixXd predict_proba(const MatrixXd &X) const; // [P(negative), P(positive)]
    VectorXd predict(const MatrixXd &X) const;       // original labels

    // Objective terms at the learned parameters on (X, y, sensitive_features)
    ObjectiveTerms lossTerms(const MatrixXd &X, const VectorXd &y,
                             const std::vector<std::string> &sensitive_features) const;

    // Learned quantities
    const MatrixXd &getPrototypes() const;
    const VectorXd &getAlpha() const;
    VectorXd getCoefficients() const;
    VectorXd getClasses() const;
    std::vector<std::string> getGroups() const;
    int getNumIterations() const;
    int getNumFeaturesIn() const;
    bool isFitted() const;
    bool usesPrototypes() const;

    const LearnerConfig &getConfig() const { return config; }

    void setWarningHandler(const WarningHandler &handler);
    void setOutputStream(std::ostream &stream);
};

#endif // FAIR_REPRESENTATION_LEARNER_HPP
