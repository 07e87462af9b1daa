#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "ParameterLayout.hpp"

namespace
{

PrototypeParameters two_by_two()
{
    PrototypeParameters params;
    params.prototypes = MatrixXd(2, 2);
    params.prototypes << 1.0, 2.0,
                         3.0, 4.0;
    params.predictor_weights = VectorXd(2);
    params.predictor_weights << 5.0, 6.0;
    params.dimension_weights = VectorXd(2);
    params.dimension_weights << 7.0, 8.0;
    return params;
}

} // namespace

TEST(ParameterLayout, SliceSizesAndOffsets)
{
    ParameterLayout layout(3, 2);

    EXPECT_EQ(layout.prototypeVectorsSize(), 6);
    EXPECT_EQ(layout.predictorWeightsSize(), 3);
    EXPECT_EQ(layout.dimensionWeightsSize(), 2);
    EXPECT_EQ(layout.totalSize(), 11);

    EXPECT_EQ(layout.prototypeVectorsOffset(), 0);
    EXPECT_EQ(layout.predictorWeightsOffset(), 6);
    EXPECT_EQ(layout.dimensionWeightsOffset(), 9);
}

TEST(ParameterLayout, PackFlattensPrototypesRowMajorThenWeights)
{
    ParameterLayout layout(2, 2);
    VectorXd x = layout.pack(two_by_two());

    ASSERT_EQ(x.size(), 8);
    for (int i = 0; i < 8; ++i)
    {
        EXPECT_DOUBLE_EQ(x(i), i + 1.0);
    }
}

TEST(ParameterLayout, UnpackRecoversEverySlice)
{
    ParameterLayout layout(2, 2);
    PrototypeParameters original = two_by_two();
    PrototypeParameters back = layout.unpack(layout.pack(original));

    EXPECT_TRUE(back.prototypes == original.prototypes);
    EXPECT_TRUE(back.predictor_weights == original.predictor_weights);
    EXPECT_TRUE(back.dimension_weights == original.dimension_weights);
}

TEST(ParameterLayout, BoundsPerSlice)
{
    const double inf = std::numeric_limits<double>::infinity();
    ParameterLayout layout(2, 3);
    Bounds b = layout.bounds();

    ASSERT_EQ(b.size(), layout.totalSize());
    for (int i = 0; i < layout.prototypeVectorsSize(); ++i)
    {
        EXPECT_EQ(b.lower(i), -inf);
        EXPECT_EQ(b.upper(i), inf);
    }
    for (int i = 0; i < layout.predictorWeightsSize(); ++i)
    {
        EXPECT_EQ(b.lower(layout.predictorWeightsOffset() + i), 0.0);
        EXPECT_EQ(b.upper(layout.predictorWeightsOffset() + i), 1.0);
    }
    for (int i = 0; i < layout.dimensionWeightsSize(); ++i)
    {
        EXPECT_EQ(b.lower(layout.dimensionWeightsOffset() + i), 0.0);
        EXPECT_EQ(b.upper(layout.dimensionWeightsOffset() + i), inf);
    }
}

TEST(ParameterLayout, ClipProjectsIntoTheBox)
{
    ParameterLayout layout(1, 1);
    Bounds b = layout.bounds();

    VectorXd x(3);
    x << -50.0, 1.5, -2.0; // V, w, alpha
    EXPECT_FALSE(b.contains(x));

    VectorXd clipped = b.clip(x);
    EXPECT_TRUE(b.contains(clipped));
    EXPECT_DOUBLE_EQ(clipped(0), -50.0);
    EXPECT_DOUBLE_EQ(clipped(1), 1.0);
    EXPECT_DOUBLE_EQ(clipped(2), 0.0);
}

TEST(ParameterLayout, RejectsWrongSizes)
{
    EXPECT_THROW(ParameterLayout(0, 2), std::invalid_argument);
    EXPECT_THROW(ParameterLayout(2, 0), std::invalid_argument);

    ParameterLayout layout(2, 2);
    EXPECT_THROW(layout.unpack(VectorXd::Zero(7)), std::invalid_argument);

    PrototypeParameters params = two_by_two();
    params.dimension_weights = VectorXd::Ones(3);
    EXPECT_THROW(layout.pack(params), std::invalid_argument);
}
