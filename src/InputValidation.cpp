#include <algorithm>
#include <stdexcept>
#include <vector>
#include "InputValidation.hpp"

using namespace std;

void InputValidation::checkFeatureMatrix(const MatrixXd &X)
{
    if (X.rows() < 1)
    {
        throw std::invalid_argument("Found array with 0 samples; at least 1 is required");
    }
    if (X.cols() < 1)
    {
        throw std::invalid_argument("Found array with 0 features; at least 1 is required");
    }
    if (!X.allFinite())
    {
        throw std::invalid_argument("Input X contains NaN or infinity");
    }
}

void InputValidation::checkTarget(const MatrixXd &X, const VectorXd &y)
{
    if (X.rows() != y.size())
    {
        throw std::invalid_argument("X and y must have the same number of rows");
    }
    if (!y.allFinite())
    {
        throw std::invalid_argument("Input y contains NaN or infinity");
    }

    std::string y_type = typeOfTarget(y);
    if (y_type != "binary")
    {
        throw std::invalid_argument("Unknown label type: " + y_type +
                                    ". Only binary classification is supported.");
    }
}

void InputValidation::checkSensitiveFeatures(const MatrixXd &X,
                                             const std::vector<std::string> &sensitive_features)
{
    if (static_cast<int>(sensitive_features.size()) != X.rows())
    {
        throw std::invalid_argument("Sensitive features must have the same number of rows as X");
    }
}

void InputValidation::checkNumFeatures(const MatrixXd &X, int n_features_expected)
{
    if (X.cols() != n_features_expected)
    {
        throw std::invalid_argument("X has " + to_string(X.cols()) + " features, but the model is expecting " +
                                    to_string(n_features_expected) + " features as input");
    }
}

std::string InputValidation::typeOfTarget(const VectorXd &y)
{
    int n_unique = uniqueValues(y).size();
    if (n_unique == 2)
        return "binary";
    if (n_unique < 2)
        return "unary";
    return "multiclass";
}

VectorXd InputValidation::uniqueValues(const VectorXd &values)
{
    std::vector<double> sorted(values.data(), values.data() + values.size());
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    VectorXd unique(sorted.size());
    for (size_t i = 0; i < sorted.size(); ++i)
    {
        unique(i) = sorted[i];
    }
    return unique;
}
