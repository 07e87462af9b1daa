#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include "LabelEncoder.hpp"
#include "InputValidation.hpp"
#include "FairRepresentationErrors.hpp"

using namespace std;

LabelEncoder::LabelEncoder() : is_fitted(false)
{
}

void LabelEncoder::fit(const VectorXd &labels)
{
    VectorXd unique = InputValidation::uniqueValues(labels);
    if (unique.size() != 2)
    {
        throw std::invalid_argument("LabelEncoder needs exactly two distinct labels, got " +
                                    to_string(unique.size()));
    }
    classes = unique;
    is_fitted = true;
}

VectorXd LabelEncoder::transform(const VectorXd &labels) const
{
    if (!is_fitted)
    {
        throw NotFittedError("LabelEncoder has not been fitted yet");
    }

    VectorXd encoded(labels.size());
    for (int i = 0; i < labels.size(); ++i)
    {
        if (labels(i) == classes(0))
        {
            encoded(i) = 0.0;
        }
        else if (labels(i) == classes(1))
        {
            encoded(i) = 1.0;
        }
        else
        {
            std::ostringstream msg;
            msg << "y contains previously unseen label " << labels(i);
            throw std::invalid_argument(msg.str());
        }
    }
    return encoded;
}

VectorXd LabelEncoder::inverse_transform(const VectorXi &encoded) const
{
    if (!is_fitted)
    {
        throw NotFittedError("LabelEncoder has not been fitted yet");
    }

    VectorXd labels(encoded.size());
    for (int i = 0; i < encoded.size(); ++i)
    {
        if (encoded(i) != 0 && encoded(i) != 1)
        {
            throw std::invalid_argument("Encoded labels must be 0 or 1");
        }
        labels(i) = classes(encoded(i));
    }
    return labels;
}

VectorXd LabelEncoder::encodeStrings(const std::vector<std::string> &labels,
                                     std::vector<std::string> &levels)
{
    std::set<std::string> present(labels.begin(), labels.end());

    std::vector<std::string> ordered;
    if (levels.empty())
    {
        ordered.assign(present.begin(), present.end());
    }
    else
    {
        for (size_t i = 0; i < levels.size(); ++i)
        {
            if (present.count(levels[i]))
                ordered.push_back(levels[i]);
        }
        if (ordered.size() != present.size())
        {
            throw std::invalid_argument("Labels contain values outside the given levels");
        }
    }

    std::map<std::string, int> position;
    for (size_t i = 0; i < ordered.size(); ++i)
    {
        position[ordered[i]] = static_cast<int>(i);
    }

    VectorXd codes(labels.size());
    for (size_t i = 0; i < labels.size(); ++i)
    {
        codes(i) = position[labels[i]];
    }

    levels = ordered;
    return codes;
}

VectorXd LabelEncoder::getClasses() const
{
    return classes;
}

bool LabelEncoder::isFitted() const
{
    return is_fitted;
}
