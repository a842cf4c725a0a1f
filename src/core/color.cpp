#include <bubblepie/color.hpp>

namespace bubblepie
{

Color category_color(std::span<const Color> order, size_t index)
{
    if (order.empty())
        return palette::default_order[index % palette::default_order_size];
    return order[index % order.size()];
}

std::vector<Color> category_colormap(std::span<const Color> order, size_t category_count)
{
    std::vector<Color> map;
    map.reserve(category_count);
    for (size_t i = 0; i < category_count; ++i)
        map.push_back(category_color(order, i));
    return map;
}

}   // namespace bubblepie
