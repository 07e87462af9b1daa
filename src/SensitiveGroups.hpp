#ifndef SENSITIVE_GROUPS_HPP
#define SENSITIVE_GROUPS_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

using namespace Eigen;

// Partition of samples by the value of a sensitive attribute. Groups are
// numbered in order of first appearance.
class SensitiveGroups
{
private:
    std::vector<std::string> group_labels;
    std::vector<int> codes;                // group number of each sample
    std::vector<std::vector<int>> members; // sample indices of each group

public:
    SensitiveGroups();
    explicit SensitiveGroups(const std::vector<std::string> &sensitive_features);

    int getNumGroups() const { return static_cast<int>(group_labels.size()); }
    int getNumSamples() const { return static_cast<int>(codes.size()); }
    const std::vector<std::string> &getGroupLabels() const { return group_labels; }
    const std::vector<int> &getCodes() const { return codes; }
    const std::vector<int> &getMembers(int group) const;

    // Row means of M restricted to each group, n_groups x M.cols()
    MatrixXd groupMeans(const MatrixXd &M) const;
};

#endif // SENSITIVE_GROUPS_HPP
