#pragma once

namespace qc {

// Visible window as fractions of the full data range on each axis.
// Invariant: 0 <= min < max <= 1.
struct ZoomRange {
  double xMin{0}, xMax{1}, yMin{0}, yMax{1};
};

inline constexpr ZoomRange kNoZoom{0.0, 1.0, 0.0, 1.0};

inline bool operator==(const ZoomRange& a, const ZoomRange& b) {
  return a.xMin == b.xMin && a.xMax == b.xMax && a.yMin == b.yMin && a.yMax == b.yMax;
}
inline bool operator!=(const ZoomRange& a, const ZoomRange& b) { return !(a == b); }

enum class Axis { X, Y };

struct AxisRange {
  double min{0}, max{1};
};

// Plot area in canvas pixels, origin top-left.
struct PlotRect {
  double x{0}, y{0}, width{0}, height{0};

  // Edges are inclusive.
  bool contains(double px, double py) const {
    return px >= x && px <= x + width && py >= y && py <= y + height;
  }
};

// Virtual extent of a zoomed axis: content laid out over [start, start+size]
// and clipped to the plot rect.
struct PlotExtent {
  double start{0}, size{0};
};

// Pixel-space rectangle of an in-progress selection drag.
struct SelectionRect {
  double x{0}, y{0}, width{0}, height{0};
};

// Zoomed sub-range of [dataMin, dataMax] on the given axis.
AxisRange applyZoomToRange(const ZoomRange& zoom, double dataMin, double dataMax, Axis axis);

// Category axes: where the whole axis would lie if it were not clipped.
// Pixel Y grows downward, so the Y extent is anchored on yMax.
PlotExtent effectivePlotExtent(const ZoomRange& zoom, const PlotRect& plot, Axis axis);

// Shift [lo, hi] back inside [0, 1], keeping its span when the span fits,
// then clamp each end.
void clampPanPair(double& lo, double& hi);

} // namespace qc
