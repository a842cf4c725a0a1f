#include "transform.hpp"

namespace bubblepie
{

double device_to_data_scale(const AxisLimits& limits, double extent)
{
    // Avoid division by zero
    if (extent == 0.0)
        return 0.0;
    return limits.span() / extent;
}

PieTransform pie_transform(Vec2              center,
                           double            diameter,
                           const AxisLimits& x_limits,
                           const AxisLimits& y_limits,
                           double            width,
                           double            height)
{
    // Unit pies have radius 1, the size is a diameter
    const double radius = diameter / 2.0;
    return {.tx = center.x,
            .ty = center.y,
            .sx = radius * device_to_data_scale(x_limits, width),
            .sy = radius * device_to_data_scale(y_limits, height)};
}

Vec2 data_to_screen(Vec2 p, const AxisLimits& x_limits, const AxisLimits& y_limits, const Rect& viewport)
{
    return {viewport.x + data_to_pixel(p.x, x_limits, viewport.w),
            viewport.y + viewport.h - data_to_pixel(p.y, y_limits, viewport.h)};
}

}   // namespace bubblepie
