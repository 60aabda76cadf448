#include "qc/viewport/Viewport.hpp"
#include <algorithm>

namespace qc {

AxisRange applyZoomToRange(const ZoomRange& zoom, double dataMin, double dataMax, Axis axis) {
  const double range = dataMax - dataMin;
  if (axis == Axis::X) {
    return AxisRange{dataMin + range * zoom.xMin, dataMin + range * zoom.xMax};
  }
  return AxisRange{dataMin + range * zoom.yMin, dataMin + range * zoom.yMax};
}

PlotExtent effectivePlotExtent(const ZoomRange& zoom, const PlotRect& plot, Axis axis) {
  if (axis == Axis::X) {
    double span = zoom.xMax - zoom.xMin;
    if (span <= 0.0) span = 1.0;
    const double size = plot.width / span;
    return PlotExtent{plot.x - zoom.xMin * size, size};
  }
  double span = zoom.yMax - zoom.yMin;
  if (span <= 0.0) span = 1.0;
  const double size = plot.height / span;
  return PlotExtent{plot.y - (1.0 - zoom.yMax) * size, size};
}

void clampPanPair(double& lo, double& hi) {
  if (lo < 0.0) {
    hi -= lo;
    lo = 0.0;
  }
  if (hi > 1.0) {
    lo -= hi - 1.0;
    hi = 1.0;
  }
  lo = std::max(0.0, lo);
  hi = std::min(1.0, hi);
}

} // namespace qc
