#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bubblepie
{

// ─── Line Styles ─────────────────────────────────────────────────────────────
// Outline style of the wedge polygons. Matches MATLAB line style specifiers.

enum class LineStyle : uint8_t
{
    None,      // 'none'  no outline
    Solid,     // '-'     ────────────
    Dashed,    // '--'    ── ── ── ──
    Dotted,    // ':'     ··············
    DashDot,   // '-.'    ──·──·──·──
};

constexpr const char* line_style_name(LineStyle s)
{
    switch (s)
    {
        case LineStyle::None:
            return "None";
        case LineStyle::Solid:
            return "Solid";
        case LineStyle::Dashed:
            return "Dashed";
        case LineStyle::Dotted:
            return "Dotted";
        case LineStyle::DashDot:
            return "Dash-Dot";
    }
    return "Unknown";
}

constexpr const char* line_style_symbol(LineStyle s)
{
    switch (s)
    {
        case LineStyle::None:
            return "none";
        case LineStyle::Solid:
            return "-";
        case LineStyle::Dashed:
            return "--";
        case LineStyle::Dotted:
            return ":";
        case LineStyle::DashDot:
            return "-.";
    }
    return "";
}

// Parse a MATLAB line style specifier ("-", "--", ":", "-.", "none").
// Returns nullopt for anything else.
constexpr std::optional<LineStyle> parse_line_style(std::string_view spec)
{
    if (spec == "-")
        return LineStyle::Solid;
    if (spec == "--")
        return LineStyle::Dashed;
    if (spec == ":")
        return LineStyle::Dotted;
    if (spec == "-.")
        return LineStyle::DashDot;
    if (spec == "none")
        return LineStyle::None;
    return std::nullopt;
}

// ─── Dash Pattern ────────────────────────────────────────────────────────────
// Alternating on/off lengths in pixels, scaled by the stroke width.

struct DashPattern
{
    float segments[4]{};
    int   count = 0;   // 0 = continuous
};

constexpr DashPattern get_dash_pattern(LineStyle style, float line_width = 1.0f)
{
    DashPattern p;
    float       w = line_width;
    switch (style)
    {
        case LineStyle::Solid:
        case LineStyle::None:
            break;
        case LineStyle::Dashed:
            p.segments[0] = 6.0f * w;
            p.segments[1] = 3.0f * w;
            p.count       = 2;
            break;
        case LineStyle::Dotted:
            p.segments[0] = 1.0f * w;
            p.segments[1] = 2.0f * w;
            p.count       = 2;
            break;
        case LineStyle::DashDot:
            p.segments[0] = 6.0f * w;
            p.segments[1] = 2.5f * w;
            p.segments[2] = 1.0f * w;
            p.segments[3] = 2.5f * w;
            p.count       = 4;
            break;
    }
    return p;
}

}   // namespace bubblepie
