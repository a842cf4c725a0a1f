#pragma once

#include <bubblepie/color.hpp>
#include <bubblepie/fwd.hpp>
#include <bubblepie/limits.hpp>
#include <bubblepie/pie_geometry.hpp>
#include <bubblepie/plot_style.hpp>
#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bubblepie
{

enum class LimitsMode
{
    Auto,     // Solved from positions and pie sizes on every layout
    Manual,   // User-specified limits only
};

struct Rect
{
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

struct ChartConfig
{
    // Plot area size in device units (points). Pie sizes use the same unit.
    double width  = 560.0;
    double height = 420.0;

    double    default_size = 50.0;   // largest auto-sized pie diameter
    int       resolution   = DEFAULT_PIE_RESOLUTION;
    LineStyle line_style   = LineStyle::Solid;

    // Space around the plot area in exported images
    double margin_top    = 50.0;
    double margin_bottom = 50.0;
    double margin_left   = 60.0;
    double margin_right  = 140.0;
};

// Maps unit-circle wedge coordinates into data space: scale, then translate.
struct PieTransform
{
    double tx = 0.0;
    double ty = 0.0;
    double sx = 1.0;
    double sy = 1.0;

    Vec2 apply(Vec2 p) const { return {tx + sx * p.x, ty + sy * p.y}; }
};

struct PlacedPie
{
    size_t       index    = 0;
    Vec2         center;
    double       diameter = 0.0;   // device units
    PieTransform transform;
    bool         in_legend = false;   // only the first pie feeds the legend

    std::shared_ptr<const std::vector<Wedge>> wedges;
};

struct ChartLayout
{
    bool                   visible = false;
    Rect                   viewport;
    AxisLimits             x_limits;
    AxisLimits             y_limits;
    std::vector<PlacedPie> pies;
};

// Scatter chart of pies. Owns the data, presentation settings, limit modes and
// the wedge cache; geometry and limits come from build_pie_wedges() and
// solve_axis_limits().
class BubblePieChart
{
   public:
    BubblePieChart() = default;
    explicit BubblePieChart(const ChartConfig& config);

    // Positions and pies; sizes scale with each pie's total so the largest
    // pie gets config().default_size.
    BubblePieChart& set_data(std::span<const double>                x,
                             std::span<const double>                y,
                             const std::vector<std::vector<double>>& pies);
    // Positions, pies and per-point sizes (scalar broadcast if one value).
    BubblePieChart& set_data(std::span<const double>                x,
                             std::span<const double>                y,
                             const std::vector<std::vector<double>>& pies,
                             std::span<const double>                sizes);

    BubblePieChart& x_data(std::span<const double> x);
    BubblePieChart& y_data(std::span<const double> y);
    BubblePieChart& pie_data(std::vector<std::vector<double>> rows);
    BubblePieChart& size_data(double diameter);
    BubblePieChart& size_data(std::span<const double> diameters);

    const std::vector<double>&              x_data() const { return x_; }
    const std::vector<double>&              y_data() const { return y_; }
    const std::vector<std::vector<double>>& pie_data() const { return pies_; }
    const std::vector<double>&              size_data() const { return sizes_; }
    size_t                                  point_count() const { return x_.size(); }
    size_t                                  category_count() const;

    // Diameter of pie i, resolving a scalar size.
    double diameter(size_t i) const;

    // ── Presentation ──
    BubblePieChart& labels(std::vector<std::string> names);
    BubblePieChart& title(const std::string& t);
    BubblePieChart& subtitle(const std::string& t);
    BubblePieChart& xlabel(const std::string& lbl);
    BubblePieChart& ylabel(const std::string& lbl);
    BubblePieChart& line_style(LineStyle s);
    // MATLAB specifier; throws std::invalid_argument if unrecognized.
    BubblePieChart& line_style(std::string_view spec);
    BubblePieChart& color_order(std::vector<Color> colors);

    const std::vector<std::string>& labels() const { return labels_; }
    const std::string&              title() const { return title_; }
    const std::string&              subtitle() const { return subtitle_; }
    const std::string&              xlabel() const { return xlabel_; }
    const std::string&              ylabel() const { return ylabel_; }
    LineStyle                       line_style() const { return config_.line_style; }
    const std::vector<Color>&       color_order() const { return color_order_; }

    // One color per category, cycling the color order.
    std::vector<Color> colormap() const;

    // ── Viewport and limits ──
    void               set_viewport(double width, double height);
    const ChartConfig& config() const { return config_; }

    // Manual limits; require min < max (std::invalid_argument otherwise).
    // Switches the axis to LimitsMode::Manual.
    void xlim(double min, double max);
    void ylim(double min, double max);

    void       x_limits_mode(LimitsMode mode);
    void       y_limits_mode(LimitsMode mode);
    LimitsMode x_limits_mode() const { return x_mode_; }
    LimitsMode y_limits_mode() const { return y_mode_; }

    // Return both axes to automatic limits ("restore view").
    void auto_fit();

    // Current limits. Auto axes are solved from the data; with invalid or
    // empty data the last manual value (or [0, 1]) is returned.
    AxisLimits x_limits() const;
    AxisLimits y_limits() const;

    // ── Layout ──

    // True when x, y, pies and sizes agree in length and every size is a
    // finite non-negative diameter. Logs a warning naming the first problem
    // otherwise.
    bool verify_data() const;

    // Limits plus one placed pie per point. Wedge sets are rebuilt only for
    // rows whose values changed since the previous layout.
    // Propagates DegenerateCompositionError for an all-zero row.
    ChartLayout layout();

    // Number of wedge sets built so far (cache misses).
    size_t wedge_builds() const { return wedge_builds_; }

   private:
    struct CacheEntry
    {
        size_t                                    key = 0;
        std::vector<double>                       composition;
        std::shared_ptr<const std::vector<Wedge>> wedges;
    };

    void refresh_wedge_cache();

    ChartConfig                      config_;
    std::vector<double>              x_;
    std::vector<double>              y_;
    std::vector<std::vector<double>> pies_;
    std::vector<double>              sizes_{50.0};

    std::vector<std::string> labels_;
    std::string              title_;
    std::string              subtitle_;
    std::string              xlabel_;
    std::string              ylabel_;
    std::vector<Color>       color_order_{std::begin(palette::default_order),
                                    std::end(palette::default_order)};

    LimitsMode x_mode_ = LimitsMode::Auto;
    LimitsMode y_mode_ = LimitsMode::Auto;
    AxisLimits xlim_;
    AxisLimits ylim_;

    std::vector<CacheEntry> cache_;
    bool                    pies_dirty_   = true;
    size_t                  wedge_builds_ = 0;
};

}   // namespace bubblepie
