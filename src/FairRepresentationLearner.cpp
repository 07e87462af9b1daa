#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <memory>
#include "FairRepresentationLearner.hpp"
#include "FairRepresentationErrors.hpp"
#include "InputValidation.hpp"
#include "LogisticRegression.hpp"
#include "ParameterLayout.hpp"

using namespace std;

void LearnerConfig::validate() const
{
    if (n_prototypes < 1)
    {
        throw std::invalid_argument("n_prototypes must be a positive integer");
    }
    if (!(Ax >= 0.0) || !(Ay >= 0.0) || !(Az >= 0.0))
    {
        throw std::invalid_argument("Loss weights Ax, Ay and Az must be non-negative");
    }
    if (!(tolerance > 0.0))
    {
        throw std::invalid_argument("tol must be positive");
    }
    if (max_iterations < 1)
    {
        throw std::invalid_argument("max_iter must be a positive integer");
    }
    if (n_threads < 1)
    {
        throw std::invalid_argument("n_threads must be a positive integer");
    }
}

// Constructor
FairRepresentationLearner::FairRepresentationLearner(const LearnerConfig &learner_config)
    : config(learner_config), out(&std::cout)
{
    config.validate();
    warning_handler = [](const std::string &message)
    {
        std::cerr << "Warning: " << message << std::endl;
    };
}

void FairRepresentationLearner::warn(const std::string &message) const
{
    if (warning_handler)
    {
        warning_handler(message);
    }
}

std::mt19937 FairRepresentationLearner::makeRandomEngine() const
{
    if (config.seed != -1)
    {
        return std::mt19937(static_cast<std::mt19937::result_type>(config.seed));
    }
    std::random_device rd;
    return std::mt19937(rd());
}

FairRepresentationLearner &FairRepresentationLearner::fit(const MatrixXd &X, const VectorXd &y)
{
    InputValidation::checkFeatureMatrix(X);
    InputValidation::checkTarget(X, y);

    LabelEncoder encoder;
    encoder.fit(y);
    VectorXd y_encoded = encoder.transform(y);

    warn("No sensitive features provided. Fitting a Logistic Regression.");

    FittedModel fitted = fitFallback(X, y_encoded);

    // Commit only after the whole fit succeeded
    label_encoder = encoder;
    model = fitted;
    group_labels.clear();
    return *this;
}

FairRepresentationLearner &FairRepresentationLearner::fit(const MatrixXd &X, const VectorXd &y,
                                                          const std::vector<std::string> &sensitive_features)
{
    InputValidation::checkFeatureMatrix(X);
    InputValidation::checkTarget(X, y);
    InputValidation::checkSensitiveFeatures(X, sensitive_features);

    LabelEncoder encoder;
    encoder.fit(y);
    VectorXd y_encoded = encoder.transform(y);
    SensitiveGroups groups(sensitive_features);
    std::mt19937 rng = makeRandomEngine();

    FittedModel fitted = fitWithGroups(X, y_encoded, groups, rng);

    label_encoder = encoder;
    model = fitted;
    group_labels = groups.getGroupLabels();
    return *this;
}

FittedModel FairRepresentationLearner::fitWithGroups(const MatrixXd &X, const VectorXd &y_encoded,
                                                     const SensitiveGroups &groups, std::mt19937 &rng) const
{
    ParameterLayout layout(config.n_prototypes, static_cast<int>(X.cols()));
    JointObjective objective(X, y_encoded, groups, layout, config.Ax, config.Ay, config.Az);

    // V and w start uniform on [0, 1); alpha starts at ones, i.e. plain
    // Euclidean distance
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    PrototypeParameters initial;
    initial.prototypes = MatrixXd(layout.getNumPrototypes(), layout.getNumFeatures());
    for (int j = 0; j < initial.prototypes.rows(); ++j)
    {
        for (int f = 0; f < initial.prototypes.cols(); ++f)
        {
            initial.prototypes(j, f) = uniform(rng);
        }
    }
    initial.predictor_weights = VectorXd(layout.getNumPrototypes());
    for (int j = 0; j < initial.predictor_weights.size(); ++j)
    {
        initial.predictor_weights(j) = uniform(rng);
    }
    initial.dimension_weights = VectorXd::Ones(layout.getNumFeatures());

    VectorXd x0 = layout.pack(initial);
    Bounds bounds = layout.bounds();

    std::unique_ptr<Minimizer> minimizer = Minimizer::create(config.method, config.n_threads);
    ObjectiveFunction f = [&objective](const VectorXd &x)
    {
        return objective(x);
    };

    if (config.verbose)
    {
        *out << "Minimizing fair representation loss with " << minimizer->name()
             << " (" << layout.totalSize() << " parameters, "
             << groups.getNumGroups() << " groups)" << std::endl;
    }

    MinimizeResult result;
    try
    {
        result = minimizer->minimize(f, x0, bounds, config.tolerance, config.max_iterations);
    }
    catch (const std::exception &e)
    {
        throw OptimizationError(std::string("The loss minimization failed: ") + e.what());
    }

    if (!result.success)
    {
        throw OptimizationError("The loss minimization failed: " + result.message);
    }
    if (!result.converged)
    {
        warn(minimizer->name() + " did not converge: " + result.message);
    }

    if (config.verbose)
    {
        *out << std::fixed << std::setprecision(6)
             << "Final loss " << result.fun << " after " << result.iterations
             << " iterations (" << result.evaluations << " evaluations)" << std::endl;
    }

    return FittedModel::fromPrototypes(layout.unpack(result.x), result.iterations);
}

// IRLS is deterministic, so no random engine is involved
FittedModel FairRepresentationLearner::fitFallback(const MatrixXd &X, const VectorXd &y_encoded) const
{
    LogisticRegression lr(X, y_encoded, config.max_iterations, config.tolerance);
    lr.fit();

    if (config.verbose)
    {
        *out << "Fitted fallback logistic regression in " << lr.getNumIterations()
             << " iterations, deviance " << lr.get_deviance() << std::endl;
    }

    return FittedModel::fromLogisticRegression(lr);
}

void FairRepresentationLearner::requireFitted() const
{
    if (!model.isFitted())
    {
        throw NotFittedError("This FairRepresentationLearner instance is not fitted yet. "
                             "Call 'fit' with appropriate arguments before using this estimator.");
    }
}

MatrixXd FairRepresentationLearner::transform(const MatrixXd &X) const
{
    requireFitted();
    InputValidation::checkFeatureMatrix(X);
    InputValidation::checkNumFeatures(X, model.getNumFeatures());
    return model.transform(X);
}

MatrixXd FairRepresentationLearner::predict_proba(const MatrixXd &X) const
{
    requireFitted();
    InputValidation::checkFeatureMatrix(X);
    InputValidation::checkNumFeatures(X, model.getNumFeatures());

    VectorXd positive = model.positiveProbability(X);
    MatrixXd proba(X.rows(), 2);
    proba.col(0) = (1.0 - positive.array()).matrix();
    proba.col(1) = positive;
    return proba;
}

VectorXd FairRepresentationLearner::predict(const MatrixXd &X) const
{
    MatrixXd proba = predict_proba(X);
    VectorXi binary(proba.rows());
    for (int i = 0; i < proba.rows(); ++i)
    {
        binary(i) = (proba(i, 1) > 0.5) ? 1 : 0;
    }
    return label_encoder.inverse_transform(binary);
}

ObjectiveTerms FairRepresentationLearner::lossTerms(const MatrixXd &X, const VectorXd &y,
                                                    const std::vector<std::string> &sensitive_features) const
{
    requireFitted();
    InputValidation::checkFeatureMatrix(X);
    InputValidation::checkNumFeatures(X, model.getNumFeatures());
    InputValidation::checkSensitiveFeatures(X, sensitive_features);

    const PrototypeParameters &params = model.getPrototypeParameters();
    VectorXd y_encoded = label_encoder.transform(y);
    SensitiveGroups groups(sensitive_features);
    ParameterLayout layout(static_cast<int>(params.prototypes.rows()),
                           static_cast<int>(params.prototypes.cols()));

    JointObjective objective(X, y_encoded, groups, layout, config.Ax, config.Ay, config.Az);
    return objective.evaluateTerms(params);
}

// Learned quantities
const MatrixXd &FairRepresentationLearner::getPrototypes() const
{
    requireFitted();
    return model.getPrototypes();
}

const VectorXd &FairRepresentationLearner::getAlpha() const
{
    requireFitted();
    return model.getDimensionWeights();
}

VectorXd FairRepresentationLearner::getCoefficients() const
{
    requireFitted();
    return model.getCoefficients();
}

VectorXd FairRepresentationLearner::getClasses() const
{
    requireFitted();
    return label_encoder.getClasses();
}

std::vector<std::string> FairRepresentationLearner::getGroups() const
{
    requireFitted();
    return group_labels;
}

int FairRepresentationLearner::getNumIterations() const
{
    requireFitted();
    return model.getNumIterations();
}

int FairRepresentationLearner::getNumFeaturesIn() const
{
    requireFitted();
    return model.getNumFeatures();
}

bool FairRepresentationLearner::isFitted() const
{
    return model.isFitted();
}

bool FairRepresentationLearner::usesPrototypes() const
{
    return model.usesPrototypes();
}

void FairRepresentationLearner::setWarningHandler(const WarningHandler &handler)
{
    warning_handler = handler;
}

void FairRepresentationLearner::setOutputStream(std::ostream &stream)
{
    out = &stream;
}
