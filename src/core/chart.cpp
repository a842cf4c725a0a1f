#include <algorithm>
#include <bubblepie/chart.hpp>
#include <bubblepie/logger.hpp>
#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>

#include "transform.hpp"

namespace bubblepie
{

namespace
{

size_t composition_key(std::span<const double> values, int resolution)
{
    size_t seed = std::hash<int>{}(resolution);
    for (double v : values)
        seed ^= std::hash<double>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

// Diameters proportional to pie totals, the largest one `largest`.
std::vector<double> auto_sizes(const std::vector<std::vector<double>>& pies, double largest)
{
    std::vector<double> totals;
    totals.reserve(pies.size());
    for (const auto& row : pies)
        totals.push_back(std::accumulate(row.begin(), row.end(), 0.0));

    double max_total = totals.empty() ? 0.0 : *std::max_element(totals.begin(), totals.end());
    if (!(max_total > 0.0))
        return {largest};

    for (auto& t : totals)
        t = largest * t / max_total;
    return totals;
}

void check_limits(double min, double max)
{
    if (!(min < max))
        throw std::invalid_argument("limits must be two increasing values");
}

}   // namespace

BubblePieChart::BubblePieChart(const ChartConfig& config) : config_(config), sizes_{config.default_size}
{
}

// --- Data ---

BubblePieChart& BubblePieChart::set_data(std::span<const double>                x,
                                         std::span<const double>                y,
                                         const std::vector<std::vector<double>>& pies)
{
    x_data(x);
    y_data(y);
    pie_data(pies);
    sizes_ = auto_sizes(pies_, config_.default_size);
    return *this;
}

BubblePieChart& BubblePieChart::set_data(std::span<const double>                x,
                                         std::span<const double>                y,
                                         const std::vector<std::vector<double>>& pies,
                                         std::span<const double>                sizes)
{
    x_data(x);
    y_data(y);
    pie_data(pies);
    size_data(sizes);
    return *this;
}

BubblePieChart& BubblePieChart::x_data(std::span<const double> x)
{
    x_.assign(x.begin(), x.end());
    return *this;
}

BubblePieChart& BubblePieChart::y_data(std::span<const double> y)
{
    y_.assign(y.begin(), y.end());
    return *this;
}

BubblePieChart& BubblePieChart::pie_data(std::vector<std::vector<double>> rows)
{
    pies_       = std::move(rows);
    pies_dirty_ = true;
    return *this;
}

BubblePieChart& BubblePieChart::size_data(double diameter)
{
    sizes_.assign(1, diameter);
    return *this;
}

BubblePieChart& BubblePieChart::size_data(std::span<const double> diameters)
{
    sizes_.assign(diameters.begin(), diameters.end());
    return *this;
}

size_t BubblePieChart::category_count() const
{
    size_t n = 0;
    for (const auto& row : pies_)
        n = std::max(n, row.size());
    return n;
}

double BubblePieChart::diameter(size_t i) const
{
    if (sizes_.size() == 1)
        return sizes_.front();
    return i < sizes_.size() ? sizes_[i] : 0.0;
}

// --- Presentation ---

BubblePieChart& BubblePieChart::labels(std::vector<std::string> names)
{
    labels_ = std::move(names);
    return *this;
}

BubblePieChart& BubblePieChart::title(const std::string& t)
{
    title_ = t;
    return *this;
}

BubblePieChart& BubblePieChart::subtitle(const std::string& t)
{
    subtitle_ = t;
    return *this;
}

BubblePieChart& BubblePieChart::xlabel(const std::string& lbl)
{
    xlabel_ = lbl;
    return *this;
}

BubblePieChart& BubblePieChart::ylabel(const std::string& lbl)
{
    ylabel_ = lbl;
    return *this;
}

BubblePieChart& BubblePieChart::line_style(LineStyle s)
{
    config_.line_style = s;
    return *this;
}

BubblePieChart& BubblePieChart::line_style(std::string_view spec)
{
    auto parsed = parse_line_style(spec);
    if (!parsed)
        throw std::invalid_argument("unknown line style '" + std::string(spec) + "'");
    config_.line_style = *parsed;
    return *this;
}

BubblePieChart& BubblePieChart::color_order(std::vector<Color> colors)
{
    color_order_ = std::move(colors);
    return *this;
}

std::vector<Color> BubblePieChart::colormap() const
{
    return category_colormap(color_order_, category_count());
}

// --- Viewport and limits ---

void BubblePieChart::set_viewport(double width, double height)
{
    if (!(width > 0.0) || !(height > 0.0))
        throw std::invalid_argument("viewport size must be positive");
    config_.width  = width;
    config_.height = height;
}

void BubblePieChart::xlim(double min, double max)
{
    check_limits(min, max);
    xlim_   = AxisLimits{min, max};
    x_mode_ = LimitsMode::Manual;
}

void BubblePieChart::ylim(double min, double max)
{
    check_limits(min, max);
    ylim_   = AxisLimits{min, max};
    y_mode_ = LimitsMode::Manual;
}

void BubblePieChart::x_limits_mode(LimitsMode mode)
{
    // Switching to Manual freezes the current limits so they stay put
    if (mode == LimitsMode::Manual && x_mode_ == LimitsMode::Auto)
        xlim_ = x_limits();
    x_mode_ = mode;
}

void BubblePieChart::y_limits_mode(LimitsMode mode)
{
    if (mode == LimitsMode::Manual && y_mode_ == LimitsMode::Auto)
        ylim_ = y_limits();
    y_mode_ = mode;
}

void BubblePieChart::auto_fit()
{
    x_mode_ = LimitsMode::Auto;
    y_mode_ = LimitsMode::Auto;
}

AxisLimits BubblePieChart::x_limits() const
{
    if (x_mode_ == LimitsMode::Manual || x_.empty() || !verify_data())
        return xlim_;
    return solve_axis_limits(x_, sizes_, config_.width);
}

AxisLimits BubblePieChart::y_limits() const
{
    if (y_mode_ == LimitsMode::Manual || y_.empty() || !verify_data())
        return ylim_;
    return solve_axis_limits(y_, sizes_, config_.height);
}

// --- Layout ---

bool BubblePieChart::verify_data() const
{
    if (x_.size() != y_.size())
    {
        BUBBLEPIE_LOG_WARN("chart",
                           "x data ({}) and y data ({}) must be the same length",
                           x_.size(),
                           y_.size());
        return false;
    }
    if (pies_.size() != x_.size())
    {
        BUBBLEPIE_LOG_WARN("chart",
                           "pie data has {} rows but there are {} points",
                           pies_.size(),
                           x_.size());
        return false;
    }
    if (sizes_.size() != 1 && sizes_.size() != x_.size())
    {
        BUBBLEPIE_LOG_WARN("chart",
                           "size data must be a scalar or have {} values, got {}",
                           x_.size(),
                           sizes_.size());
        return false;
    }
    for (double s : sizes_)
    {
        if (!std::isfinite(s) || s < 0.0)
        {
            BUBBLEPIE_LOG_WARN("chart", "pie sizes must be finite and non-negative, got {}", s);
            return false;
        }
    }
    return true;
}

void BubblePieChart::refresh_wedge_cache()
{
    if (!pies_dirty_ && cache_.size() == pies_.size())
        return;

    cache_.resize(pies_.size());
    for (size_t i = 0; i < pies_.size(); ++i)
    {
        auto& entry = cache_[i];
        auto  key   = composition_key(pies_[i], config_.resolution);
        if (entry.wedges && entry.key == key && entry.composition == pies_[i])
            continue;

        entry.wedges      = std::make_shared<const std::vector<Wedge>>(
            build_pie_wedges(pies_[i], config_.resolution));
        entry.key         = key;
        entry.composition = pies_[i];
        ++wedge_builds_;
    }
    pies_dirty_ = false;
    BUBBLEPIE_LOG_DEBUG("chart", "wedge cache holds {} pies, {} builds so far", cache_.size(), wedge_builds_);
}

ChartLayout BubblePieChart::layout()
{
    ChartLayout out;
    out.viewport = Rect{0.0, 0.0, config_.width, config_.height};

    if (x_.empty() || !verify_data())
    {
        out.x_limits = xlim_;
        out.y_limits = ylim_;
        return out;
    }

    refresh_wedge_cache();

    out.visible  = true;
    out.x_limits = x_limits();
    out.y_limits = y_limits();

    out.pies.reserve(x_.size());
    for (size_t i = 0; i < x_.size(); ++i)
    {
        PlacedPie pie;
        pie.index     = i;
        pie.center    = {x_[i], y_[i]};
        pie.diameter  = diameter(i);
        pie.transform = pie_transform(
            pie.center, pie.diameter, out.x_limits, out.y_limits, config_.width, config_.height);
        pie.in_legend = (i == 0);
        pie.wedges    = cache_[i].wedges;
        out.pies.push_back(std::move(pie));
    }
    return out;
}

}   // namespace bubblepie
