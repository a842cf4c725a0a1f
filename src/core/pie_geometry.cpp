#include <algorithm>
#include <bubblepie/errors.hpp>
#include <bubblepie/logger.hpp>
#include <bubblepie/pie_geometry.hpp>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace bubblepie
{

static constexpr double TWO_PI = 2.0 * std::numbers::pi;

std::vector<Wedge> build_pie_wedges(std::span<const double> composition, int resolution)
{
    double sum     = 0.0;
    double largest = 0.0;
    for (double v : composition)
    {
        if (!std::isfinite(v) || v < 0.0)
            throw std::invalid_argument("pie composition entries must be finite and non-negative");
        sum += v;
        largest = std::max(largest, v);
    }
    if (sum == 0.0)
        throw DegenerateCompositionError("pie composition sums to zero");

    // Entries near DBL_MAX overflow the sum; normalize against the largest entry instead
    double scale = 1.0;
    if (!std::isfinite(sum))
    {
        scale = largest;
        sum   = 0.0;
        for (double v : composition)
            sum += v / scale;
    }

    resolution = std::max(resolution, 1);

    std::vector<Wedge> wedges;
    wedges.reserve(composition.size());

    double start     = std::numbers::pi / 2.0;
    size_t total_arc = 0;
    for (size_t i = 0; i < composition.size(); ++i)
    {
        const double share = composition[i] / scale / sum;
        const int    n     = std::max(1, static_cast<int>(std::ceil(resolution * share)));

        Wedge w;
        w.category    = i;
        w.start_angle = start;
        w.points.reserve(static_cast<size_t>(n) + 3);
        w.points.push_back({0.0, 0.0});

        // The next slice starts at the largest sampled angle, not at an
        // accumulated sum, so round-off never opens a gap between slices.
        double max_angle = start;
        for (int k = 0; k <= n; ++k)
        {
            double theta = start + share * (static_cast<double>(k) / n) * TWO_PI;
            max_angle    = std::max(max_angle, theta);
            w.points.push_back({std::cos(theta), std::sin(theta)});
        }
        w.points.push_back({0.0, 0.0});
        w.sweep = max_angle - start;

        total_arc += static_cast<size_t>(n) + 1;
        start = max_angle;
        wedges.push_back(std::move(w));
    }

    BUBBLEPIE_LOG_TRACE("pie",
                        "built {} wedges with {} arc samples (resolution {})",
                        wedges.size(),
                        total_arc,
                        resolution);
    return wedges;
}

double total_sweep(std::span<const Wedge> wedges)
{
    double total = 0.0;
    for (const auto& w : wedges)
        total += w.sweep;
    return total;
}

}   // namespace bubblepie
