#pragma once

#include <cstddef>

namespace bubblepie
{

class BubblePieChart;
class Logger;
class SvgExporter;

struct AxisLimits;
struct ChartConfig;
struct ChartLayout;
struct Color;
struct PieTransform;
struct PlacedPie;
struct Rect;
struct Vec2;
struct Wedge;

}   // namespace bubblepie
