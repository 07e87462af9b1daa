#include <stdexcept>
#include <vector>
#include <algorithm>
#include <cmath>
#include <cfloat>
#include "PerformanceEvaluator.hpp"

using namespace std;

// Calculate classification accuracy
double PerformanceEvaluator::calculateAccuracy(const VectorXi &predictions, const VectorXd &true_labels)
{
    if (predictions.size() != true_labels.size())
    {
        throw std::invalid_argument("Predictions and true labels must have the same size");
    }

    int correct = 0;
    for (int i = 0; i < predictions.size(); ++i)
    {
        if (predictions(i) == (int)true_labels(i))
        {
            correct++;
        }
    }

    return (double)correct / predictions.size();
}

// Calculate Area Under the ROC Curve (AUC)
double PerformanceEvaluator::calculateAUC(const VectorXd &probabilities, const VectorXd &true_labels)
{
    if (probabilities.size() != true_labels.size())
    {
        throw std::invalid_argument("Probabilities and true labels must have the same size");
    }

    int n = probabilities.size();

    // Create pairs of (probability, true_label) for sorting
    vector<pair<double, int>> prob_label_pairs;
    for (int i = 0; i < n; ++i)
    {
        prob_label_pairs.push_back({probabilities(i), (int)true_labels(i)});
    }

    // Sort by probability in descending order
    sort(prob_label_pairs.begin(), prob_label_pairs.end(),
         [](const pair<double, int> &a, const pair<double, int> &b)
         {
             return a.first > b.first; // Higher probability first
         });

    // Count positive and negative cases
    int n_pos = 0, n_neg = 0;
    for (int i = 0; i < n; ++i)
    {
        if ((int)true_labels(i) == 1)
            n_pos++;
        else
            n_neg++;
    }

    // Handle edge cases
    if (n_pos == 0 || n_neg == 0)
    {
        return 0.5; // Random classifier when all labels are the same
    }

    // Calculate AUC; tied probabilities are handled as a block, each
    // positive-negative pair within a tie counting one half
    double auc = 0.0;
    int tp = 0; // positives ranked strictly above the current block

    int i = 0;
    while (i < n)
    {
        int block_pos = 0, block_neg = 0;
        int j = i;
        while (j < n && prob_label_pairs[j].first == prob_label_pairs[i].first)
        {
            if (prob_label_pairs[j].second == 1)
                block_pos++;
            else
                block_neg++;
            j++;
        }

        auc += block_neg * (tp + 0.5 * block_pos) / n_pos / n_neg;
        tp += block_pos;
        i = j;
    }

    return auc;
}

// Calculate mean log-loss
double PerformanceEvaluator::calculateLogLoss(const VectorXd &probabilities, const VectorXd &true_labels)
{
    if (probabilities.size() != true_labels.size())
    {
        throw std::invalid_argument("Probabilities and true labels must have the same size");
    }
    if (true_labels.size() == 0)
    {
        throw std::invalid_argument("Log-loss needs at least one sample");
    }

    ArrayXd p = probabilities.array().max(DBL_EPSILON).min(1.0 - DBL_EPSILON);
    ArrayXd y = true_labels.array();
    return -(y * p.log() + (1.0 - y) * (1.0 - p).log()).mean();
}

// Mean pairwise difference of group-mean memberships
double PerformanceEvaluator::calculateFairnessError(const MatrixXd &M, const SensitiveGroups &groups)
{
    int n_groups = groups.getNumGroups();
    if (n_groups < 2)
    {
        return 0.0;
    }

    MatrixXd means = groups.groupMeans(M);

    double total = 0.0;
    int n_pairs = 0;
    for (int a = 0; a < n_groups; ++a)
    {
        for (int b = a + 1; b < n_groups; ++b)
        {
            total += (means.row(a) - means.row(b)).cwiseAbs().mean();
            n_pairs++;
        }
    }

    return total / n_pairs;
}

// Largest gap in positive prediction rate between groups
double PerformanceEvaluator::calculateParityGap(const VectorXi &predictions, const SensitiveGroups &groups)
{
    if (predictions.size() != groups.getNumSamples())
    {
        throw std::invalid_argument("Predictions and sensitive features must have the same size");
    }

    double min_rate = 1.0;
    double max_rate = 0.0;
    for (int g = 0; g < groups.getNumGroups(); ++g)
    {
        const std::vector<int> &idx = groups.getMembers(g);
        int positives = 0;
        for (size_t i = 0; i < idx.size(); ++i)
        {
            if (predictions(idx[i]) == 1)
                positives++;
        }
        double rate = (double)positives / idx.size();
        min_rate = std::min(min_rate, rate);
        max_rate = std::max(max_rate, rate);
    }

    return groups.getNumGroups() < 2 ? 0.0 : max_rate - min_rate;
}
