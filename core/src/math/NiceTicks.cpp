#include "qc/math/NiceTicks.hpp"
#include <cmath>
#include <cstdio>
#include <utility>

namespace qc {

static constexpr std::size_t kMaxTicks = 1000;

TickSet computeTicks(double dataMin, double dataMax,
                     const AxisConfig& axis, int tickCountHint) {
  TickSet result;
  double lo = axis.min ? *axis.min : dataMin;
  double hi = axis.max ? *axis.max : dataMax;
  int count = axis.tickCount ? *axis.tickCount : tickCountHint;
  if (count < 1) count = 1;

  if (lo == hi) {
    lo -= 1.0;
    hi += 1.0;
  }
  if (hi < lo) std::swap(lo, hi);

  double range = hi - lo;
  double rawStep = range / static_cast<double>(count);

  // Snap to nice step: {1, 2, 5, 10} x 10^n
  double mag = std::pow(10.0, std::floor(std::log10(rawStep)));
  double residual = rawStep / mag;

  double niceStep;
  if (residual <= 1.5)      niceStep = 1.0 * mag;
  else if (residual <= 3.0) niceStep = 2.0 * mag;
  else if (residual <= 7.0) niceStep = 5.0 * mag;
  else                      niceStep = 10.0 * mag;

  if (!axis.min) lo = std::floor(lo / niceStep) * niceStep;
  if (!axis.max) hi = std::ceil(hi / niceStep) * niceStep;

  result.min = lo;
  result.max = hi;
  result.step = niceStep;

  for (double v = lo; v <= hi + niceStep * 0.0001; v += niceStep) {
    result.values.push_back(std::round(v * 1e10) / 1e10);
    if (result.values.size() >= kMaxTicks) break;
  }
  return result;
}

std::string formatTick(double v) {
  char buf[64];
  if (std::isfinite(v) && v == std::trunc(v)) {
    if (std::fabs(v) < 1e15) std::snprintf(buf, sizeof(buf), "%.0f", v);
    else std::snprintf(buf, sizeof(buf), "%g", v);
  } else if (std::fabs(v) >= 1.0) {
    std::snprintf(buf, sizeof(buf), "%.1f", v);
  } else {
    std::snprintf(buf, sizeof(buf), "%#.3g", v);
  }
  return buf;
}

double mapValue(double value, double dataMin, double dataMax,
                double pixelStart, double pixelLength) {
  double span = dataMax - dataMin;
  if (span == 0.0) span = 1.0;
  return pixelStart + (value - dataMin) / span * pixelLength;
}

} // namespace qc
