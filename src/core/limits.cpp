#include <algorithm>
#include <bubblepie/errors.hpp>
#include <bubblepie/limits.hpp>
#include <bubblepie/logger.hpp>
#include <cmath>
#include <stdexcept>

namespace bubblepie
{

AxisLimits solve_axis_limits(std::span<const double> positions,
                             std::span<const double> diameters,
                             double                  viewport_extent)
{
    if (positions.empty())
        throw std::invalid_argument("solve_axis_limits: no positions");
    if (diameters.empty())
        throw std::invalid_argument("solve_axis_limits: no diameters");
    if (!(viewport_extent > 0.0))
        throw std::invalid_argument("solve_axis_limits: viewport extent must be positive");
    for (double d : diameters)
    {
        if (!std::isfinite(d) || d < 0.0)
            throw std::invalid_argument("solve_axis_limits: diameters must be finite and non-negative");
    }

    auto [min_it, max_it] = std::minmax_element(positions.begin(), positions.end());
    double min_v          = *min_it;
    double max_v          = *max_it;
    if (min_v == max_v)
    {
        min_v -= 1.0;
        max_v += 1.0;
    }

    const double E = viewport_extent;
    const double r = std::min(*std::max_element(diameters.begin(), diameters.end()) / 2.0, E / 3.0);

    // Pin min_v to pixel r and max_v to pixel E - r:
    //   [E - r    r  ] [lo]   [min_v * E]
    //   [  r    E - r] [hi] = [max_v * E]
    const double a   = E - r;
    const double det = a * a - r * r;
    const double b1  = min_v * E;
    const double b2  = max_v * E;

    AxisLimits lim{(a * b1 - r * b2) / det, (a * b2 - r * b1) / det};

    if (!std::isfinite(lim.min) || !std::isfinite(lim.max) || !(lim.min < lim.max))
    {
        BUBBLEPIE_LOG_ERROR("limits",
                            "degenerate limits [{}, {}] for data [{}, {}], radius {} px of {} px",
                            lim.min,
                            lim.max,
                            min_v,
                            max_v,
                            r,
                            E);
        throw DegenerateLimitsError("solve_axis_limits: limits are not increasing", lim.min, lim.max);
    }

    BUBBLEPIE_LOG_DEBUG("limits",
                        "data [{}, {}] radius {} px of {} px -> [{}, {}]",
                        min_v,
                        max_v,
                        r,
                        E,
                        lim.min,
                        lim.max);
    return lim;
}

AxisLimits solve_axis_limits(std::span<const double> positions,
                             double                  diameter,
                             double                  viewport_extent)
{
    return solve_axis_limits(positions, std::span<const double>(&diameter, 1), viewport_extent);
}

double data_to_pixel(double value, const AxisLimits& limits, double viewport_extent)
{
    double range = limits.span();
    if (range == 0.0)
        range = 1.0;
    return viewport_extent * (value - limits.min) / range;
}

}   // namespace bubblepie
