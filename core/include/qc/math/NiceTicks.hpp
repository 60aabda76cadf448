#pragma once
#include <optional>
#include <string>
#include <vector>

namespace qc {

// Per-axis overrides. Unset fields are derived from the data.
struct AxisConfig {
  std::optional<double> min;
  std::optional<double> max;
  std::optional<int> tickCount;
  std::string title;
};

struct TickSet {
  double min{0}, max{1}, step{1};
  std::vector<double> values;
};

// Nice tick values covering [dataMin, dataMax].
// Steps snap to {1, 2, 5, 10} x 10^n. Ends not pinned by the axis config
// are widened outward to a multiple of the step. An empty range is widened
// by 1 on each side.
TickSet computeTicks(double dataMin, double dataMax,
                     const AxisConfig& axis = {}, int tickCountHint = 6);

// Integers print plainly, |v| >= 1 with one decimal, smaller values with
// three significant digits.
std::string formatTick(double v);

// Linear map of `value` from [dataMin, dataMax] onto
// [pixelStart, pixelStart + pixelLength]. An empty data range maps as if it
// were 1 wide.
double mapValue(double value, double dataMin, double dataMax,
                double pixelStart, double pixelLength);

} // namespace qc
