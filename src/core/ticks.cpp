#include "ticks.hpp"

#include <cmath>
#include <cstdio>

namespace bubblepie
{

static double nice_number(double x, bool round_flag)
{
    double exp_v = std::floor(std::log10(x));
    double frac  = x / std::pow(10.0, exp_v);
    double nice;
    if (round_flag)
    {
        if (frac < 1.5)
            nice = 1.0;
        else if (frac < 3.0)
            nice = 2.0;
        else if (frac < 7.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    else
    {
        if (frac <= 1.0)
            nice = 1.0;
        else if (frac <= 2.0)
            nice = 2.0;
        else if (frac <= 5.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    return nice * std::pow(10.0, exp_v);
}

static std::string format_tick(double value, double spacing)
{
    // Snap near-zero to exactly zero to avoid "-0"
    if (std::abs(value) < spacing * 1e-6)
        return "0";

    int decimals = static_cast<int>(std::ceil(-std::log10(spacing) - 1e-9));
    if (decimals < 0)
        decimals = 0;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

TickResult compute_ticks(const AxisLimits& limits, int target_ticks)
{
    TickResult result;

    double range = limits.span();
    if (!(range > 0.0) || !std::isfinite(range) || target_ticks < 2)
        return result;

    double spacing = nice_number(nice_number(range, false) / (target_ticks - 1), true);
    if (!(spacing > 0.0) || !std::isfinite(spacing))
        return result;

    double first = std::ceil(limits.min / spacing) * spacing;

    // Safety: cap iterations to avoid runaway loops on extreme ranges
    int max_iters = target_ticks * 3;
    for (int i = 0; i < max_iters; ++i)
    {
        double v = first + i * spacing;
        if (v > limits.max + spacing * 1e-9)
            break;
        if (std::abs(v) < spacing * 1e-6)
            v = 0.0;
        result.positions.push_back(v);
        result.labels.push_back(format_tick(v, spacing));
    }
    return result;
}

}   // namespace bubblepie
