#ifndef INPUT_VALIDATION_HPP
#define INPUT_VALIDATION_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

using namespace Eigen;

// Checks run on user input before any fitting or prediction. All of them
// throw std::invalid_argument naming the violated constraint.
class InputValidation
{
public:
    static void checkFeatureMatrix(const MatrixXd &X);
    static void checkTarget(const MatrixXd &X, const VectorXd &y);
    static void checkSensitiveFeatures(const MatrixXd &X, const std::vector<std::string> &sensitive_features);
    static void checkNumFeatures(const MatrixXd &X, int n_features_expected);

    // "binary", "unary" or "multiclass", by number of distinct values
    static std::string typeOfTarget(const VectorXd &y);

    // Sorted distinct values
    static VectorXd uniqueValues(const VectorXd &values);
};

#endif // INPUT_VALIDATION_HPP
