#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace bubblepie
{

// Default upper bound on arc samples across a whole pie.
inline constexpr int DEFAULT_PIE_RESOLUTION = 100;

struct Vec2
{
    double x = 0.0;
    double y = 0.0;
};

// One slice of a pie inscribed in the unit circle at the origin.
// `points` is the closed boundary: origin, arc samples, origin.
// Angles are in radians, counter-clockwise from +x.
struct Wedge
{
    size_t            category    = 0;
    double            start_angle = 0.0;
    double            sweep       = 0.0;
    std::vector<Vec2> points;

    double end_angle() const { return start_angle + sweep; }

    // Number of arc samples, excluding the two center points.
    size_t arc_point_count() const { return points.size() >= 2 ? points.size() - 2 : 0; }
};

// Build the wedges of a pie from one composition vector.
//
// The composition is normalized to sum 1 (the input is not modified). Slices
// start at 12 o'clock and run counter-clockwise in category order. Each slice
// gets max(1, ceil(resolution * share)) arc segments, so large slices are
// smoother than slivers and the total stays close to `resolution`.
//
// Exactly composition.size() wedges are returned; zero-valued categories
// produce zero-sweep wedges so wedge index always equals category index.
//
// Throws DegenerateCompositionError if the composition sums to zero, and
// std::invalid_argument for negative or non-finite entries.
[[nodiscard]] std::vector<Wedge> build_pie_wedges(std::span<const double> composition,
                                                  int resolution = DEFAULT_PIE_RESOLUTION);

// Sum of the sweeps of all wedges (2*pi for any valid pie).
double total_sweep(std::span<const Wedge> wedges);

}   // namespace bubblepie
