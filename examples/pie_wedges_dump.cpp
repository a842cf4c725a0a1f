#include <bubblepie/errors.hpp>
#include <bubblepie/pie_geometry.hpp>
#include <cstdio>
#include <cstdlib>
#include <numbers>
#include <stdexcept>
#include <vector>

// Prints the wedges of one pie: pie_wedges_dump 3 1 0 2
int main(int argc, char** argv)
{
    std::vector<double> comp;
    for (int i = 1; i < argc; ++i)
        comp.push_back(std::strtod(argv[i], nullptr));
    if (comp.empty())
        comp = {1.0, 1.0, 1.0, 1.0};

    std::vector<bubblepie::Wedge> wedges;
    try
    {
        wedges = bubblepie::build_pie_wedges(comp);
    }
    catch (const bubblepie::DegenerateCompositionError& e)
    {
        std::fprintf(stderr, "pie_wedges_dump: %s\n", e.what());
        return 1;
    }
    catch (const std::invalid_argument& e)
    {
        std::fprintf(stderr, "pie_wedges_dump: %s\n", e.what());
        return 1;
    }

    constexpr double deg = 180.0 / std::numbers::pi;
    for (const auto& w : wedges)
    {
        std::printf("category %zu: start %7.2f deg, sweep %7.2f deg, %zu arc points\n",
                    w.category,
                    w.start_angle * deg,
                    w.sweep * deg,
                    w.arc_point_count());
    }
    std::printf("total sweep %.6f deg\n", bubblepie::total_sweep(wedges) * deg);
    return 0;
}
