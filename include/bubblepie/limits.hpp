#pragma once

#include <span>

namespace bubblepie
{

// Data-space range of one axis. A solved range always has min < max.
struct AxisLimits
{
    double min = 0.0;
    double max = 1.0;

    double span() const { return max - min; }
    bool   contains(double v) const { return v >= min && v <= max; }

    bool operator==(const AxisLimits&) const = default;
};

// Tightest limits for one axis that keep every pie fully inside the viewport.
//
// `positions` are the pie centers in data units, `diameters` the pie sizes in
// device units (same units as `viewport_extent`, the viewport's pixel width or
// height). The largest radius is capped at a third of the viewport. The
// result maps min(positions) to exactly that radius in pixels and
// max(positions) to viewport_extent minus it. Coincident positions are
// widened by one data unit on each side first.
//
// Positions and diameters are assumed to be validated against each other by
// the caller; only their own emptiness is checked here.
//
// Throws std::invalid_argument for empty inputs or a non-positive extent, and
// DegenerateLimitsError if the solve does not produce min < max.
[[nodiscard]] AxisLimits solve_axis_limits(std::span<const double> positions,
                                           std::span<const double> diameters,
                                           double                  viewport_extent);

// Scalar-size overload: the same diameter for every pie.
[[nodiscard]] AxisLimits solve_axis_limits(std::span<const double> positions,
                                           double                  diameter,
                                           double                  viewport_extent);

// Affine data -> pixel map along one axis: limits.min -> 0, limits.max -> extent.
double data_to_pixel(double value, const AxisLimits& limits, double viewport_extent);

}   // namespace bubblepie
