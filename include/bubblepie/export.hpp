#pragma once

#include <bubblepie/fwd.hpp>
#include <string>

namespace bubblepie
{

class SvgExporter
{
   public:
    // Render a chart to SVG: plot frame, ticks, one polygon per wedge,
    // title, axis labels and a legend when category labels are set.
    // Computes the layout first (which may build wedges).
    static std::string to_string(BubblePieChart& chart);

    // Render from an already computed layout.
    static std::string to_string(const BubblePieChart& chart, const ChartLayout& layout);

    // Write SVG to a file. Returns false if the file cannot be written.
    static bool write_svg(const std::string& path, BubblePieChart& chart);
};

}   // namespace bubblepie
