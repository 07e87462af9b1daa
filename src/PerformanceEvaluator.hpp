#ifndef PERFORMANCE_EVALUATOR_HPP
#define PERFORMANCE_EVALUATOR_HPP

#include <Eigen/Dense>
#include <vector>
#include "SensitiveGroups.hpp"

using namespace Eigen;

class PerformanceEvaluator
{
public:
    // Core metric calculations
    static double calculateAccuracy(const VectorXi &predictions, const VectorXd &true_labels);
    static double calculateAUC(const VectorXd &probabilities, const VectorXd &true_labels);

    // Mean binary cross-entropy; probabilities are clipped to
    // [DBL_EPSILON, 1 - DBL_EPSILON] before taking logarithms.
    static double calculateLogLoss(const VectorXd &probabilities, const VectorXd &true_labels);

    // Statistical-parity error of a membership matrix: the mean absolute
    // difference of group-mean rows, averaged over all unordered group pairs.
    // Zero when there is a single group.
    static double calculateFairnessError(const MatrixXd &M, const SensitiveGroups &groups);

    // Largest difference in predicted positive rate between any two groups.
    static double calculateParityGap(const VectorXi &predictions, const SensitiveGroups &groups);
};

#endif // PERFORMANCE_EVALUATOR_HPP
