#ifndef LABEL_ENCODER_HPP
#define LABEL_ENCODER_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

using namespace Eigen;

// Maps a two-valued label vector to {0, 1} and back. Classes are kept in
// ascending order; the smaller label becomes 0.
class LabelEncoder
{
private:
    VectorXd classes;
    bool is_fitted;

public:
    LabelEncoder();

    void fit(const VectorXd &labels);
    VectorXd transform(const VectorXd &labels) const;
    VectorXd inverse_transform(const VectorXi &encoded) const;

    // Numeric codes for string labels: the position of each label among the
    // levels that occur. `levels` gives the order (all distinct labels
    // sorted when empty) and is replaced by the levels actually present.
    static VectorXd encodeStrings(const std::vector<std::string> &labels,
                                  std::vector<std::string> &levels);

    VectorXd getClasses() const;
    bool isFitted() const;
};

#endif // LABEL_ENCODER_HPP
