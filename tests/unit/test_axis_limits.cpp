#include <bubblepie/errors.hpp>
#include <bubblepie/limits.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace bubblepie;

// --- Tight fit ---

TEST(AxisLimits, ExtremesPinnedToRadius)
{
    std::vector<double> pos   = {0.0, 10.0};
    std::vector<double> diams = {20.0, 20.0};
    auto                lim   = solve_axis_limits(pos, diams, 300.0);

    EXPECT_NEAR(data_to_pixel(0.0, lim, 300.0), 10.0, 1e-9);
    EXPECT_NEAR(data_to_pixel(10.0, lim, 300.0), 290.0, 1e-9);
}

TEST(AxisLimits, ScalarDiameterMatchesVector)
{
    std::vector<double> pos   = {-3.0, 1.5, 8.0};
    std::vector<double> diams = {40.0, 40.0, 40.0};

    auto a = solve_axis_limits(pos, diams, 500.0);
    auto b = solve_axis_limits(pos, 40.0, 500.0);
    EXPECT_EQ(a, b);
}

TEST(AxisLimits, LargestDiameterDrivesMargin)
{
    std::vector<double> pos   = {0.0, 5.0, 10.0};
    std::vector<double> diams = {10.0, 60.0, 4.0};
    auto                lim   = solve_axis_limits(pos, diams, 400.0);

    EXPECT_NEAR(data_to_pixel(0.0, lim, 400.0), 30.0, 1e-9);
    EXPECT_NEAR(data_to_pixel(10.0, lim, 400.0), 370.0, 1e-9);
}

TEST(AxisLimits, SymmetricAroundDataCenter)
{
    std::vector<double> pos = {2.0, 6.0};
    auto                lim = solve_axis_limits(pos, 50.0, 200.0);

    EXPECT_NEAR((lim.min + lim.max) / 2.0, 4.0, 1e-12);
    EXPECT_LT(lim.min, 2.0);
    EXPECT_GT(lim.max, 6.0);
}

TEST(AxisLimits, ZeroDiameterIsDataRange)
{
    std::vector<double> pos = {1.0, 4.0};
    auto                lim = solve_axis_limits(pos, 0.0, 100.0);

    EXPECT_NEAR(lim.min, 1.0, 1e-12);
    EXPECT_NEAR(lim.max, 4.0, 1e-12);
}

TEST(AxisLimits, OrderOfPositionsIrrelevant)
{
    std::vector<double> a = {9.0, -1.0, 3.0};
    std::vector<double> b = {-1.0, 3.0, 9.0};
    EXPECT_EQ(solve_axis_limits(a, 30.0, 250.0), solve_axis_limits(b, 30.0, 250.0));
}

// --- Radius cap ---

TEST(AxisLimits, OversizedPieCappedAtThirdOfViewport)
{
    std::vector<double> pos = {0.0, 1.0};
    auto                lim = solve_axis_limits(pos, 1000.0, 300.0);

    // Radius capped to 100 px
    EXPECT_NEAR(data_to_pixel(0.0, lim, 300.0), 100.0, 1e-9);
    EXPECT_NEAR(data_to_pixel(1.0, lim, 300.0), 200.0, 1e-9);
    EXPECT_LT(lim.min, lim.max);
}

// --- Coincident positions ---

TEST(AxisLimits, CoincidentPositionsWidened)
{
    std::vector<double> pos = {5.0, 5.0};
    auto                lim = solve_axis_limits(pos, 20.0, 300.0);

    EXPECT_LT(lim.min, lim.max);
    EXPECT_TRUE(lim.contains(5.0));
    // The widened range [4, 6] is what gets pinned
    EXPECT_NEAR(data_to_pixel(4.0, lim, 300.0), 10.0, 1e-9);
    EXPECT_NEAR(data_to_pixel(6.0, lim, 300.0), 290.0, 1e-9);
}

TEST(AxisLimits, SinglePoint)
{
    std::vector<double> pos = {-2.5};
    auto                lim = solve_axis_limits(pos, 50.0, 400.0);

    EXPECT_LT(lim.min, -2.5);
    EXPECT_GT(lim.max, -2.5);
}

// --- Purity ---

TEST(AxisLimits, RepeatedCallsBitIdentical)
{
    std::vector<double> pos   = {0.1, 0.7, 0.3, 12.9};
    std::vector<double> diams = {13.0, 27.5, 50.0, 8.0};

    auto a = solve_axis_limits(pos, diams, 437.0);
    auto b = solve_axis_limits(pos, diams, 437.0);
    EXPECT_EQ(a.min, b.min);
    EXPECT_EQ(a.max, b.max);
}

// --- Errors ---

TEST(AxisLimits, EmptyPositionsRejected)
{
    std::vector<double> pos;
    EXPECT_THROW((void)solve_axis_limits(pos, 10.0, 100.0), std::invalid_argument);
}

TEST(AxisLimits, EmptyDiametersRejected)
{
    std::vector<double> pos = {1.0, 2.0};
    std::vector<double> diams;
    EXPECT_THROW((void)solve_axis_limits(pos, diams, 100.0), std::invalid_argument);
}

TEST(AxisLimits, NonPositiveExtentRejected)
{
    std::vector<double> pos = {1.0, 2.0};
    EXPECT_THROW((void)solve_axis_limits(pos, 10.0, 0.0), std::invalid_argument);
    EXPECT_THROW((void)solve_axis_limits(pos, 10.0, -5.0), std::invalid_argument);
}

TEST(AxisLimits, NegativeDiameterRejected)
{
    std::vector<double> pos = {0.0, 10.0};
    EXPECT_THROW((void)solve_axis_limits(pos, -20.0, 300.0), std::invalid_argument);

    std::vector<double> diams = {10.0, -1.0};
    EXPECT_THROW((void)solve_axis_limits(pos, diams, 300.0), std::invalid_argument);
}

TEST(AxisLimits, NonFiniteDiameterRejected)
{
    std::vector<double> pos = {0.0, 10.0};
    EXPECT_THROW((void)solve_axis_limits(pos, std::numeric_limits<double>::quiet_NaN(), 300.0),
                 std::invalid_argument);
    EXPECT_THROW((void)solve_axis_limits(pos, std::numeric_limits<double>::infinity(), 300.0),
                 std::invalid_argument);
}

TEST(AxisLimits, NonFinitePositionIsDegenerate)
{
    std::vector<double> pos = {1.0, std::numeric_limits<double>::infinity()};
    EXPECT_THROW((void)solve_axis_limits(pos, 10.0, 100.0), DegenerateLimitsError);
}

// --- data_to_pixel ---

TEST(DataToPixel, EndpointsMapToViewportEdges)
{
    AxisLimits lim{-2.0, 8.0};
    EXPECT_DOUBLE_EQ(data_to_pixel(-2.0, lim, 640.0), 0.0);
    EXPECT_DOUBLE_EQ(data_to_pixel(8.0, lim, 640.0), 640.0);
    EXPECT_DOUBLE_EQ(data_to_pixel(3.0, lim, 640.0), 320.0);
}
