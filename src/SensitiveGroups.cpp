#include <map>
#include <stdexcept>
#include "SensitiveGroups.hpp"

using namespace std;

SensitiveGroups::SensitiveGroups()
{
}

SensitiveGroups::SensitiveGroups(const std::vector<std::string> &sensitive_features)
{
    if (sensitive_features.empty())
    {
        throw std::invalid_argument("Sensitive features cannot be empty");
    }

    std::map<std::string, int> lookup;
    codes.reserve(sensitive_features.size());

    for (size_t i = 0; i < sensitive_features.size(); ++i)
    {
        std::map<std::string, int>::const_iterator it = lookup.find(sensitive_features[i]);
        int code;
        if (it == lookup.end())
        {
            code = static_cast<int>(group_labels.size());
            lookup[sensitive_features[i]] = code;
            group_labels.push_back(sensitive_features[i]);
            members.push_back(std::vector<int>());
        }
        else
        {
            code = it->second;
        }
        codes.push_back(code);
        members[code].push_back(static_cast<int>(i));
    }
}

const std::vector<int> &SensitiveGroups::getMembers(int group) const
{
    if (group < 0 || group >= getNumGroups())
    {
        throw std::out_of_range("Group index out of range");
    }
    return members[group];
}

MatrixXd SensitiveGroups::groupMeans(const MatrixXd &M) const
{
    if (M.rows() != getNumSamples())
    {
        throw std::invalid_argument("Matrix rows must match the number of samples");
    }

    MatrixXd means = MatrixXd::Zero(getNumGroups(), M.cols());
    for (int g = 0; g < getNumGroups(); ++g)
    {
        const std::vector<int> &idx = members[g];
        for (size_t i = 0; i < idx.size(); ++i)
        {
            means.row(g) += M.row(idx[i]);
        }
        means.row(g) /= static_cast<double>(idx.size());
    }
    return means;
}
