#include <algorithm>
#include <bubblepie/chart.hpp>
#include <bubblepie/export.hpp>
#include <bubblepie/logger.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "core/ticks.hpp"
#include "core/transform.hpp"

namespace bubblepie
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(c.r * 255.0f + 0.5f),
                  static_cast<int>(c.g * 255.0f + 0.5f),
                  static_cast<int>(c.b * 255.0f + 0.5f));
    return buf;
}

// Compact number formatting (no trailing zeros)
std::string fmt(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", v);
    return buf;
}

std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Stroke attributes for wedge outlines
std::string stroke_attrs(LineStyle style)
{
    if (style == LineStyle::None)
        return "stroke=\"none\"";

    std::string attrs = "stroke=\"#000\" stroke-width=\"0.5\" stroke-linejoin=\"round\"";
    DashPattern p     = get_dash_pattern(style);
    if (p.count > 0)
    {
        attrs += " stroke-dasharray=\"";
        for (int i = 0; i < p.count; ++i)
        {
            if (i > 0)
                attrs += ",";
            attrs += fmt(p.segments[i]);
        }
        attrs += "\"";
    }
    return attrs;
}

void emit_ticks(std::ostringstream& svg, const ChartLayout& layout, const Rect& vp)
{
    auto x_ticks = compute_ticks(layout.x_limits);
    auto y_ticks = compute_ticks(layout.y_limits);

    constexpr double tick_len     = 5.0;
    constexpr double label_offset = 16.0;

    svg << "    <g class=\"ticks\" font-family=\"sans-serif\" font-size=\"10\" fill=\"#333\">\n";
    for (size_t i = 0; i < x_ticks.positions.size(); ++i)
    {
        double sx = vp.x + data_to_pixel(x_ticks.positions[i], layout.x_limits, vp.w);
        double bottom = vp.y + vp.h;
        svg << "      <line x1=\"" << fmt(sx) << "\" y1=\"" << fmt(bottom) << "\" x2=\"" << fmt(sx)
            << "\" y2=\"" << fmt(bottom + tick_len) << "\" stroke=\"#000\"/>\n";
        svg << "      <text x=\"" << fmt(sx) << "\" y=\"" << fmt(bottom + label_offset)
            << "\" text-anchor=\"middle\">" << xml_escape(x_ticks.labels[i]) << "</text>\n";
    }
    for (size_t i = 0; i < y_ticks.positions.size(); ++i)
    {
        double sy = vp.y + vp.h - data_to_pixel(y_ticks.positions[i], layout.y_limits, vp.h);
        svg << "      <line x1=\"" << fmt(vp.x - tick_len) << "\" y1=\"" << fmt(sy) << "\" x2=\""
            << fmt(vp.x) << "\" y2=\"" << fmt(sy) << "\" stroke=\"#000\"/>\n";
        svg << "      <text x=\"" << fmt(vp.x - tick_len - 3.0) << "\" y=\"" << fmt(sy + 3.5)
            << "\" text-anchor=\"end\">" << xml_escape(y_ticks.labels[i]) << "</text>\n";
    }
    svg << "    </g>\n";
}

void emit_pies(std::ostringstream&   svg,
               const BubblePieChart& chart,
               const ChartLayout&    layout,
               const Rect&           vp)
{
    auto        colors = chart.colormap();
    std::string stroke = stroke_attrs(chart.line_style());

    svg << "    <g class=\"pies\">\n";
    for (const auto& pie : layout.pies)
    {
        if (!pie.wedges)
            continue;
        for (const auto& wedge : *pie.wedges)
        {
            svg << "      <polygon points=\"";
            for (size_t k = 0; k < wedge.points.size(); ++k)
            {
                Vec2 s = data_to_screen(pie.transform.apply(wedge.points[k]),
                                        layout.x_limits,
                                        layout.y_limits,
                                        vp);
                if (k > 0)
                    svg << ' ';
                svg << fmt(s.x) << ',' << fmt(s.y);
            }
            svg << "\" fill=\"" << svg_color(category_color(colors, wedge.category)) << "\" "
                << stroke << "/>\n";
        }
    }
    svg << "    </g>\n";
}

void emit_labels(std::ostringstream& svg, const BubblePieChart& chart, const Rect& vp)
{
    double cx = vp.x + vp.w * 0.5;
    double cy = vp.y + vp.h * 0.5;

    if (!chart.title().empty())
    {
        double ty = chart.subtitle().empty() ? vp.y - 12.0 : vp.y - 26.0;
        svg << "  <text x=\"" << fmt(cx) << "\" y=\"" << fmt(ty)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"14\" "
               "font-weight=\"bold\">"
            << xml_escape(chart.title()) << "</text>\n";
    }
    if (!chart.subtitle().empty())
    {
        svg << "  <text x=\"" << fmt(cx) << "\" y=\"" << fmt(vp.y - 10.0)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"11\">"
            << xml_escape(chart.subtitle()) << "</text>\n";
    }
    if (!chart.xlabel().empty())
    {
        svg << "  <text x=\"" << fmt(cx) << "\" y=\"" << fmt(vp.y + vp.h + 36.0)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\">"
            << xml_escape(chart.xlabel()) << "</text>\n";
    }
    if (!chart.ylabel().empty())
    {
        double lx = vp.x - 42.0;
        svg << "  <text x=\"" << fmt(lx) << "\" y=\"" << fmt(cy) << "\" transform=\"rotate(-90,"
            << fmt(lx) << "," << fmt(cy)
            << ")\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\">"
            << xml_escape(chart.ylabel()) << "</text>\n";
    }
}

// One entry per wedge of the pie flagged for the legend, named by category label
void emit_legend(std::ostringstream&   svg,
                 const BubblePieChart& chart,
                 const ChartLayout&    layout,
                 const Rect&           vp)
{
    const auto& labels = chart.labels();
    if (labels.empty())
        return;

    auto key = std::find_if(layout.pies.begin(),
                            layout.pies.end(),
                            [](const PlacedPie& p) { return p.in_legend && p.wedges; });
    if (key == layout.pies.end())
        return;

    auto             colors = chart.colormap();
    constexpr double swatch = 10.0;
    constexpr double row_h  = 16.0;
    double           x      = vp.x + vp.w + 12.0;
    double           ry     = vp.y;

    svg << "  <g class=\"legend\" font-family=\"sans-serif\" font-size=\"11\">\n";
    for (const auto& wedge : *key->wedges)
    {
        if (wedge.category >= labels.size())
            continue;
        svg << "    <rect x=\"" << fmt(x) << "\" y=\"" << fmt(ry) << "\" width=\"" << fmt(swatch)
            << "\" height=\"" << fmt(swatch) << "\" fill=\""
            << svg_color(category_color(colors, wedge.category)) << "\"/>\n";
        svg << "    <text x=\"" << fmt(x + swatch + 5.0) << "\" y=\"" << fmt(ry + swatch - 1.0)
            << "\">" << xml_escape(labels[wedge.category]) << "</text>\n";
        ry += row_h;
    }
    svg << "  </g>\n";
}

}   // anonymous namespace

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::to_string(BubblePieChart& chart)
{
    auto layout = chart.layout();
    return to_string(chart, layout);
}

std::string SvgExporter::to_string(const BubblePieChart& chart, const ChartLayout& layout)
{
    const auto& cfg = chart.config();
    Rect        vp{cfg.margin_left, cfg.margin_top, layout.viewport.w, layout.viewport.h};
    double      w = cfg.margin_left + vp.w + cfg.margin_right;
    double      h = cfg.margin_top + vp.h + cfg.margin_bottom;

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << fmt(w) << "\" height=\""
        << fmt(h) << "\" viewBox=\"0 0 " << fmt(w) << " " << fmt(h) << "\">\n";
    svg << "  <rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";

    svg << "  <g class=\"axes\">\n";
    if (layout.visible)
    {
        emit_pies(svg, chart, layout, vp);
        emit_ticks(svg, layout, vp);
    }
    svg << "    <rect x=\"" << fmt(vp.x) << "\" y=\"" << fmt(vp.y) << "\" width=\"" << fmt(vp.w)
        << "\" height=\"" << fmt(vp.h) << "\" fill=\"none\" stroke=\"#000\" stroke-width=\"1\"/>\n";
    svg << "  </g>\n";

    emit_labels(svg, chart, vp);
    if (layout.visible)
        emit_legend(svg, chart, layout, vp);

    svg << "</svg>\n";
    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path, BubblePieChart& chart)
{
    std::string content = to_string(chart);

    std::ofstream file(path);
    if (!file.is_open())
    {
        BUBBLEPIE_LOG_ERROR("svg", "cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    if (!file.good())
    {
        BUBBLEPIE_LOG_ERROR("svg", "failed writing '{}'", path);
        return false;
    }
    BUBBLEPIE_LOG_INFO("svg", "wrote {} pies to '{}'", chart.point_count(), path);
    return true;
}

}   // namespace bubblepie
