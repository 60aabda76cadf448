#include "qc/recipe/BarRecipe.hpp"
#include <algorithm>
#include <utility>
#include <cmath>

namespace qc {

static constexpr double kHiddenThreshold = 0.001;
static constexpr double kMinBarExtent = 0.1;

BarRecipe::BarRecipe(BarRecipeConfig config)
  : config_(std::move(config)) {
  // The zero line is always in range.
  for (const auto& s : config_.series) {
    for (double v : s.values) {
      dataMin_ = std::min(dataMin_, v);
      dataMax_ = std::max(dataMax_, v);
    }
  }
}

std::vector<SeriesInfo> BarRecipe::seriesInfoList() const {
  std::vector<SeriesInfo> out;
  out.reserve(config_.series.size());
  for (std::size_t i = 0; i < config_.series.size(); i++) {
    out.push_back(SeriesInfo{config_.series[i].name, seriesColor(config_.series[i].color, i)});
  }
  return out;
}

RecipeFrame BarRecipe::build(const FrameContext& ctx) const {
  RecipeFrame frame;
  const ChartLayout& lay = ctx.layout;
  const bool vertical = config_.orientation == BarOrientation::Vertical;
  const std::size_t nCats = config_.labels.size();
  const std::size_t nSeries = config_.series.size();

  AxisRange valueRange = applyZoomToRange(ctx.zoom, dataMin_, dataMax_,
                                          vertical ? Axis::Y : Axis::X);
  frame.valueTicks = computeTicks(valueRange.min, valueRange.max,
                                  config_.valueAxis, ctx.tickCountHint);
  const double vMin = frame.valueTicks.min;
  const double vMax = frame.valueTicks.max;

  if (nCats == 0 || nSeries == 0) return frame;

  const PlotExtent eff = effectivePlotExtent(ctx.zoom, lay.plotRect(),
                                             vertical ? Axis::X : Axis::Y);
  const double groupSize = eff.size / static_cast<double>(nCats);
  const double barSize = groupSize * kGroupFill / static_cast<double>(nSeries);
  const double groupPad = groupSize * kGroupPad;

  // Value axis pixel mapping: vertical charts grow upward from the bottom.
  const double valueStart = vertical ? lay.plotY + lay.plotH : lay.plotX;
  const double valueLength = vertical ? -lay.plotH : lay.plotW;
  const double baseline = mapValue(0.0, vMin, vMax, valueStart, valueLength);

  for (std::size_t si = 0; si < nSeries; si++) {
    const double vis = ctx.visibilityOf(si);
    if (vis <= kHiddenThreshold) continue;
    const BarSeries& s = config_.series[si];
    const std::string color = seriesColor(s.color, si);
    const double animFactor = ctx.enterProgress * vis;

    for (std::size_t ci = 0; ci < nCats; ci++) {
      const double val = ci < s.values.size() ? s.values[ci] : 0.0;
      const double along = eff.start + static_cast<double>(ci) * groupSize + groupPad +
                           static_cast<double>(si) * barSize;
      const double target = mapValue(val, vMin, vMax, valueStart, valueLength);
      const double animated = baseline + (target - baseline) * animFactor;
      const double lo = std::min(baseline, animated);
      const double extent = std::fabs(animated - baseline);
      if (extent <= kMinBarExtent) continue;

      HitRegion hit;
      hit.series = si;
      hit.index = ci;
      if (vertical) {
        hit.x = along; hit.y = lo; hit.w = barSize; hit.h = extent;
      } else {
        hit.x = lo; hit.y = along; hit.w = extent; hit.h = barSize;
      }

      Rect r;
      r.x = static_cast<float>(hit.x);
      r.y = static_cast<float>(hit.y);
      r.w = static_cast<float>(hit.w);
      r.h = static_cast<float>(hit.h);
      r.color = color;
      frame.batch.rects.push_back(std::move(r));
      frame.hits.push_back(hit);
    }
  }
  return frame;
}

} // namespace qc
