#include <bubblepie/bubblepie.hpp>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    using namespace bubblepie;

    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    std::string path = argc > 1 ? argv[1] : "bubble_pie_basic.svg";

    // Sales by region: position = (price index, volume), slices = product mix
    std::vector<double>              x = {1.0, 2.0, 2.5, 4.0, 5.5};
    std::vector<double>              y = {3.0, 1.0, 4.5, 2.0, 3.5};
    std::vector<std::vector<double>> p = {
        {10, 4, 6},
        {2, 2, 1},
        {7, 0, 9},
        {3, 8, 2},
        {12, 6, 10},
    };

    BubblePieChart chart({.width = 560, .height = 420});
    chart.set_data(x, y, p)
        .labels({"Hardware", "Services", "Licenses"})
        .title("Revenue mix by region")
        .subtitle("pie size proportional to total")
        .xlabel("Price index")
        .ylabel("Volume")
        .line_style("-");

    try
    {
        if (!SvgExporter::write_svg(path, chart))
            return 1;
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "bubble_pie_basic: %s\n", e.what());
        return 1;
    }

    auto layout = chart.layout();
    std::printf("x limits [%.4f, %.4f], y limits [%.4f, %.4f]\n",
                layout.x_limits.min,
                layout.x_limits.max,
                layout.y_limits.min,
                layout.y_limits.max);
    return 0;
}
