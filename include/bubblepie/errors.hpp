#pragma once

#include <stdexcept>
#include <string>

namespace bubblepie
{

// Thrown when a composition vector sums to zero: every slice would have
// zero angular extent, so the pie is undefined.
class DegenerateCompositionError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Thrown when the limit solve produces a non-increasing (lo, hi) pair.
// Only reachable if the radius cap upstream has been violated.
class DegenerateLimitsError : public std::runtime_error
{
   public:
    DegenerateLimitsError(const std::string& what, double lo, double hi)
        : std::runtime_error(what), lo_(lo), hi_(hi)
    {
    }

    double lo() const { return lo_; }
    double hi() const { return hi_; }

   private:
    double lo_;
    double hi_;
};

}   // namespace bubblepie
