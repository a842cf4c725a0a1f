#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace bubblepie
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
inline constexpr Color light_gray{0.75f, 0.75f, 0.75f};
}   // namespace colors

// Default category colors (MATLAB factory axes color order)
namespace palette
{
inline constexpr Color default_order[] = {
    {0.000f, 0.447f, 0.741f},   // blue
    {0.850f, 0.325f, 0.098f},   // orange
    {0.929f, 0.694f, 0.125f},   // yellow
    {0.494f, 0.184f, 0.556f},   // purple
    {0.466f, 0.674f, 0.188f},   // green
    {0.301f, 0.745f, 0.933f},   // light blue
    {0.635f, 0.078f, 0.184f},   // dark red
};
inline constexpr size_t default_order_size = sizeof(default_order) / sizeof(default_order[0]);
}   // namespace palette

// Color for category `index`, cycling through `order` when there are more
// categories than colors. An empty order falls back to the default palette.
Color category_color(std::span<const Color> order, size_t index);

// Colormap with one entry per category.
std::vector<Color> category_colormap(std::span<const Color> order, size_t category_count);

}   // namespace bubblepie
