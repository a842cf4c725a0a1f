#include <gtest/gtest.h>

// Internal headers — tests add src/ to their include path
#include <cmath>

#include "core/transform.hpp"

using namespace bubblepie;

// --- device_to_data_scale ---

TEST(DeviceToDataScale, SpanOverExtent)
{
    EXPECT_DOUBLE_EQ(device_to_data_scale(AxisLimits{0.0, 10.0}, 200.0), 0.05);
    EXPECT_DOUBLE_EQ(device_to_data_scale(AxisLimits{-5.0, 5.0}, 100.0), 0.1);
}

TEST(DeviceToDataScale, ZeroExtentFallback)
{
    double s = device_to_data_scale(AxisLimits{0.0, 10.0}, 0.0);
    EXPECT_FALSE(std::isnan(s));
    EXPECT_FALSE(std::isinf(s));
}

// --- pie_transform ---

TEST(PieTransform, TranslatesToCenter)
{
    auto t = pie_transform({3.0, -2.0}, 40.0, {0.0, 10.0}, {-5.0, 5.0}, 400.0, 200.0);
    auto c = t.apply({0.0, 0.0});
    EXPECT_DOUBLE_EQ(c.x, 3.0);
    EXPECT_DOUBLE_EQ(c.y, -2.0);
}

TEST(PieTransform, RadiusInDataUnitsPerAxis)
{
    // 40 device units across -> radius 20; x: 10/400 per unit, y: 10/200 per unit
    auto t = pie_transform({0.0, 0.0}, 40.0, {0.0, 10.0}, {-5.0, 5.0}, 400.0, 200.0);
    EXPECT_DOUBLE_EQ(t.sx, 0.5);
    EXPECT_DOUBLE_EQ(t.sy, 1.0);

    auto right = t.apply({1.0, 0.0});
    auto top   = t.apply({0.0, 1.0});
    EXPECT_DOUBLE_EQ(right.x, 0.5);
    EXPECT_DOUBLE_EQ(top.y, 1.0);
}

TEST(PieTransform, RoundOnScreen)
{
    // Unequal data aspect, but the pie radius is the same number of pixels on both axes
    AxisLimits xl{0.0, 100.0};
    AxisLimits yl{0.0, 1.0};
    Rect       vp{0.0, 0.0, 500.0, 300.0};
    auto       t = pie_transform({50.0, 0.5}, 60.0, xl, yl, vp.w, vp.h);

    auto c     = data_to_screen(t.apply({0.0, 0.0}), xl, yl, vp);
    auto right = data_to_screen(t.apply({1.0, 0.0}), xl, yl, vp);
    auto top   = data_to_screen(t.apply({0.0, 1.0}), xl, yl, vp);
    EXPECT_NEAR(right.x - c.x, 30.0, 1e-9);
    EXPECT_NEAR(c.y - top.y, 30.0, 1e-9);
}

// --- data_to_screen ---

TEST(DataToScreen, CornersWithFlippedY)
{
    Rect       vp{50.0, 20.0, 400.0, 300.0};
    AxisLimits xl{0.0, 10.0};
    AxisLimits yl{0.0, 10.0};

    auto bl = data_to_screen({0.0, 0.0}, xl, yl, vp);
    EXPECT_DOUBLE_EQ(bl.x, 50.0);
    EXPECT_DOUBLE_EQ(bl.y, 320.0);

    auto tr = data_to_screen({10.0, 10.0}, xl, yl, vp);
    EXPECT_DOUBLE_EQ(tr.x, 450.0);
    EXPECT_DOUBLE_EQ(tr.y, 20.0);
}

TEST(DataToScreen, Center)
{
    Rect vp{0.0, 0.0, 800.0, 600.0};
    auto v = data_to_screen({5.0, 5.0}, {0.0, 10.0}, {0.0, 10.0}, vp);
    EXPECT_DOUBLE_EQ(v.x, 400.0);
    EXPECT_DOUBLE_EQ(v.y, 300.0);
}
