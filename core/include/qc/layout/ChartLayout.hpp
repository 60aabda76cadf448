#pragma once
#include "qc/viewport/Viewport.hpp"
#include <algorithm>
#include <array>

namespace qc {

// Canvas size and the plot area inside it, in pixels, origin top-left.
struct ChartLayout {
  double canvasW{0}, canvasH{0};
  double plotX{0}, plotY{0};
  double plotW{0}, plotH{0};

  PlotRect plotRect() const { return PlotRect{plotX, plotY, plotW, plotH}; }
};

enum class LegendPosition { Top, Bottom, Float };

// Top, right, bottom, left.
using Padding = std::array<double, 4>;

inline constexpr Padding kDefaultPadding{20.0, 20.0, 20.0, 20.0};
inline constexpr double kYLabelWidth = 50.0;
inline constexpr double kXLabelHeight = 30.0;
inline constexpr double kAxisTitleSize = 20.0;
inline constexpr double kMinPlotSize = 10.0;

// Reserve room for axis labels, titles and the legend, then give the rest
// to the plot. A floating legend takes no space.
inline ChartLayout computeLayout(double width, double height,
                                 const Padding& padding = kDefaultPadding,
                                 bool hasXTitle = false, bool hasYTitle = false,
                                 double legendHeight = 0.0,
                                 LegendPosition legendPosition = LegendPosition::Bottom) {
  const double pt = padding[0], pr = padding[1], pb = padding[2], pl = padding[3];

  const double yLabelWidth = kYLabelWidth + (hasYTitle ? kAxisTitleSize : 0.0);
  const double xLabelHeight = kXLabelHeight + (hasXTitle ? kAxisTitleSize : 0.0);

  double topExtra = 0.0;
  double bottomExtra = 0.0;
  if (legendPosition == LegendPosition::Top) topExtra = legendHeight;
  else if (legendPosition == LegendPosition::Bottom) bottomExtra = legendHeight;

  ChartLayout l;
  l.canvasW = width;
  l.canvasH = height;
  l.plotX = pl + yLabelWidth;
  l.plotY = pt + topExtra;
  l.plotW = std::max(width - l.plotX - pr, kMinPlotSize);
  l.plotH = std::max(height - l.plotY - pb - xLabelHeight - bottomExtra, kMinPlotSize);
  return l;
}

} // namespace qc
