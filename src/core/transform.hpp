#pragma once

#include <bubblepie/chart.hpp>
#include <bubblepie/limits.hpp>
#include <bubblepie/pie_geometry.hpp>

namespace bubblepie
{

// Data units covered by one device unit along an axis of `extent` device units.
double device_to_data_scale(const AxisLimits& limits, double extent);

// Transform placing a unit-circle pie at `center` with the given diameter in
// device units. Each axis scales independently so the pie stays round on
// screen whatever the data aspect ratio.
PieTransform pie_transform(Vec2              center,
                           double            diameter,
                           const AxisLimits& x_limits,
                           const AxisLimits& y_limits,
                           double            width,
                           double            height);

// Data-space point to screen coordinates inside `viewport`.
// Screen y grows downward, so data y_max maps to viewport.y.
Vec2 data_to_screen(Vec2 p, const AxisLimits& x_limits, const AxisLimits& y_limits, const Rect& viewport);

}   // namespace bubblepie
