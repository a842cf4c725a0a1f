#pragma once

#include <bubblepie/limits.hpp>
#include <string>
#include <vector>

namespace bubblepie
{

struct TickResult
{
    std::vector<double>      positions;
    std::vector<std::string> labels;
};

// "Nice" tick positions (1, 2 or 5 x 10^n spacing) inside `limits`,
// aiming for roughly `target_ticks` ticks.
TickResult compute_ticks(const AxisLimits& limits, int target_ticks = 6);

}   // namespace bubblepie
