#include <Rcpp.h>
#include <RcppEigen.h>
#include <string>
#include <vector>
#include "FairRepresentationLearner.hpp"
#include "FairRepresentationErrors.hpp"
#include "FittedModel.hpp"
#include "InputValidation.hpp"
#include "LabelEncoder.hpp"
#include "PerformanceEvaluator.hpp"
#include "SensitiveGroups.hpp"

// [[Rcpp::depends(RcppEigen)]]
// [[Rcpp::plugins(cpp11)]]

using namespace Rcpp;
using namespace Eigen;

// Factors by level name, everything else through as.character
static std::vector<std::string> group_labels_from_r(SEXP sensitive_features)
{
    if (Rf_isFactor(sensitive_features))
    {
        return as<std::vector<std::string>>(Rf_asCharacterFactor(sensitive_features));
    }
    return as<std::vector<std::string>>(Rf_coerceVector(sensitive_features, STRSXP));
}

// Labels as seen by the estimator. Numeric labels pass through; factor and
// character labels are replaced by their position in `levels`.
struct LabelCodes
{
    VectorXd values;
    CharacterVector levels; // empty for numeric labels
    std::string type;       // "numeric", "factor" or "character"
};

static LabelCodes label_codes_from_r(SEXP y)
{
    LabelCodes codes;

    if (!Rf_isFactor(y) && !Rf_isString(y))
    {
        codes.type = "numeric";
        codes.values = as<VectorXd>(y);
        return codes;
    }

    std::vector<std::string> labels;
    std::vector<std::string> levels;
    if (Rf_isFactor(y))
    {
        codes.type = "factor";
        labels = as<std::vector<std::string>>(Rf_asCharacterFactor(y));
        levels = as<std::vector<std::string>>(Rf_getAttrib(y, R_LevelsSymbol));
    }
    else
    {
        codes.type = "character";
        labels = as<std::vector<std::string>>(y);
    }

    codes.values = LabelEncoder::encodeStrings(labels, levels);
    codes.levels = wrap(levels);
    return codes;
}

// Rebuild the fitted state from the list returned by fair_representation_fit
static FittedModel fitted_model_from_r(List model_info)
{
    std::string mode = as<std::string>(model_info["mode"]);
    VectorXd coefficients = as<VectorXd>(model_info["coefficients"]);
    int n_iter = as<int>(model_info["n_iter"]);

    if (mode == "fallback")
    {
        return FittedModel::fromLogisticCoefficients(coefficients, n_iter);
    }
    if (mode == "prototypes")
    {
        PrototypeParameters params;
        params.prototypes = as<MatrixXd>(model_info["prototypes"]);
        params.predictor_weights = coefficients;
        params.dimension_weights = as<VectorXd>(model_info["alpha"]);
        return FittedModel::fromPrototypes(params, n_iter);
    }
    stop("Unknown model mode: " + mode);
    return FittedModel();
}

// C++ function for fitting a fair representation
// [[Rcpp::export]]
List fair_representation_fit(
    NumericMatrix X_r,
    SEXP y_r,
    SEXP sensitive_features = R_NilValue,
    int n_prototypes = 2,
    double Ax = 1.0,
    double Ay = 1.0,
    double Az = 1.0,
    int seed = -1,
    std::string optimizer = "L-BFGS-B",
    double tol = 1e-6,
    int max_iter = 1000,
    int n_threads = 1,
    bool verbose = false)
{
    try
    {
        // Convert R objects to Eigen
        Map<MatrixXd> X_eigen(as<Map<MatrixXd>>(X_r));
        MatrixXd X = X_eigen;
        LabelCodes label_codes = label_codes_from_r(y_r);
        VectorXd y = label_codes.values;

        LearnerConfig config;
        config.n_prototypes = n_prototypes;
        config.Ax = Ax;
        config.Ay = Ay;
        config.Az = Az;
        config.seed = seed;
        config.method = parseMinimizerMethod(optimizer);
        config.tolerance = tol;
        config.max_iterations = max_iter;
        config.n_threads = n_threads;
        config.verbose = verbose;

        FairRepresentationLearner learner(config);
        learner.setWarningHandler([](const std::string &message)
                                  {
                                      Rcpp::warning(message);
                                  });
        learner.setOutputStream(Rcpp::Rcout);

        bool has_groups = !Rf_isNull(sensitive_features);
        std::vector<std::string> groups;
        if (has_groups)
        {
            groups = group_labels_from_r(sensitive_features);
            learner.fit(X, y, groups);
        }
        else
        {
            learner.fit(X, y);
        }

        // Training-set diagnostics
        MatrixXd proba = learner.predict_proba(X);
        VectorXd positive = proba.col(1);
        VectorXd classes = learner.getClasses();
        VectorXd y_binary = (y.array() == classes(1)).cast<double>().matrix();
        VectorXi predictions = (positive.array() > 0.5).cast<int>().matrix();

        List metrics = List::create(
            Named("accuracy") = PerformanceEvaluator::calculateAccuracy(predictions, y_binary),
            Named("auc") = PerformanceEvaluator::calculateAUC(positive, y_binary),
            Named("log_loss") = PerformanceEvaluator::calculateLogLoss(positive, y_binary));

        if (has_groups)
        {
            SensitiveGroups partition(groups);
            metrics["parity_gap"] = PerformanceEvaluator::calculateParityGap(predictions, partition);
        }

        List result = List::create(
            Named("mode") = learner.usesPrototypes() ? "prototypes" : "fallback",
            Named("coefficients") = wrap(learner.getCoefficients()),
            Named("classes") = label_codes.type == "numeric" ? RObject(wrap(classes))
                                                             : RObject(label_codes.levels),
            Named("label_type") = label_codes.type,
            Named("n_iter") = learner.getNumIterations(),
            Named("n_features_in") = learner.getNumFeaturesIn(),
            Named("optimizer") = minimizerMethodName(config.method),
            Named("metrics") = metrics);

        if (learner.usesPrototypes())
        {
            ObjectiveTerms terms = learner.lossTerms(X, y, groups);
            result["prototypes"] = wrap(learner.getPrototypes());
            result["alpha"] = wrap(learner.getAlpha());
            result["groups"] = wrap(learner.getGroups());
            result["loss"] = List::create(
                Named("reconstruction") = terms.reconstruction,
                Named("classification") = terms.classification,
                Named("fairness") = terms.fairness,
                Named("total") = terms.total);
        }
        else
        {
            result["prototypes"] = R_NilValue;
            result["alpha"] = R_NilValue;
        }

        return result;
    }
    catch (const std::exception &e)
    {
        stop("C++ error: " + std::string(e.what()));
    }
}

// C++ function for the learned representation
// [[Rcpp::export]]
NumericMatrix fair_representation_transform(List model_info, NumericMatrix X_new)
{
    try
    {
        MatrixXd X = as<Map<MatrixXd>>(X_new);
        FittedModel model = fitted_model_from_r(model_info);

        InputValidation::checkFeatureMatrix(X);
        InputValidation::checkNumFeatures(X, model.getNumFeatures());

        return NumericMatrix(wrap(model.transform(X)));
    }
    catch (const std::exception &e)
    {
        stop("C++ error in transform: " + std::string(e.what()));
    }
}

// C++ function for predictions
// [[Rcpp::export]]
SEXP fair_representation_predict(List model_info, NumericMatrix X_new, std::string type = "class")
{
    try
    {
        MatrixXd X = as<Map<MatrixXd>>(X_new);
        FittedModel model = fitted_model_from_r(model_info);
        RObject classes = model_info["classes"];
        std::string label_type = model_info.containsElementNamed("label_type")
                                     ? as<std::string>(model_info["label_type"])
                                     : std::string("numeric");

        InputValidation::checkFeatureMatrix(X);
        InputValidation::checkNumFeatures(X, model.getNumFeatures());

        VectorXd positive = model.positiveProbability(X);
        int n_obs = X.rows();

        if (type == "prob")
        {
            // Columns: P(classes[1]), P(classes[2])
            NumericMatrix proba(n_obs, 2);
            for (int i = 0; i < n_obs; ++i)
            {
                proba(i, 0) = 1.0 - positive(i);
                proba(i, 1) = positive(i);
            }
            return proba;
        }
        else if (type == "class")
        {
            if (label_type == "numeric")
            {
                NumericVector numeric_classes(classes);
                NumericVector predictions(n_obs);
                for (int i = 0; i < n_obs; ++i)
                {
                    predictions[i] = (positive(i) > 0.5) ? numeric_classes[1] : numeric_classes[0];
                }
                return predictions;
            }

            CharacterVector levels(classes);
            if (label_type == "factor")
            {
                // Integer codes into the stored levels
                IntegerVector predictions(n_obs);
                for (int i = 0; i < n_obs; ++i)
                {
                    predictions[i] = (positive(i) > 0.5) ? 2 : 1;
                }
                predictions.attr("levels") = levels;
                predictions.attr("class") = "factor";
                return predictions;
            }

            CharacterVector predictions(n_obs);
            for (int i = 0; i < n_obs; ++i)
            {
                predictions[i] = (positive(i) > 0.5) ? levels[1] : levels[0];
            }
            return predictions;
        }

        stop("type must be 'class' or 'prob'");
    }
    catch (const std::exception &e)
    {
        stop("C++ error in prediction: " + std::string(e.what()));
    }
    return R_NilValue;
}
