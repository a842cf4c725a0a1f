#pragma once

#include <bubblepie/chart.hpp>
#include <bubblepie/color.hpp>
#include <bubblepie/errors.hpp>
#include <bubblepie/export.hpp>
#include <bubblepie/fwd.hpp>
#include <bubblepie/limits.hpp>
#include <bubblepie/logger.hpp>
#include <bubblepie/pie_geometry.hpp>
#include <bubblepie/plot_style.hpp>

// ─── bubblepie ───────────────────────────────────────────────────────────────
// Scatter plots whose markers are pie charts.
//
//   std::vector<double> x = {1, 2, 3}, y = {2, 4, 1};
//   std::vector<std::vector<double>> p = {{1, 2}, {3, 1}, {1, 1}};
//
//   bubblepie::BubblePieChart chart;
//   chart.set_data(x, y, p).labels({"A", "B"}).title("Mix");
//   bubblepie::SvgExporter::write_svg("mix.svg", chart);
//
// Lower level: build_pie_wedges() for slice polygons, solve_axis_limits() for
// limits that keep every pie inside the viewport.
