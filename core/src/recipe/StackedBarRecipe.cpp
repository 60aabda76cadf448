#include "qc/recipe/StackedBarRecipe.hpp"
#include <algorithm>
#include <utility>
#include <cmath>

namespace qc {

static constexpr double kHiddenThreshold = 0.001;
static constexpr double kMinBarExtent = 0.1;

static double stackValue(const BarSeries& s, std::size_t ci) {
  return ci < s.values.size() ? std::max(0.0, s.values[ci]) : 0.0;
}

StackedBarRecipe::StackedBarRecipe(StackedBarRecipeConfig config)
  : config_(std::move(config)) {
  for (std::size_t ci = 0; ci < config_.labels.size(); ci++) {
    double total = 0.0;
    for (const auto& s : config_.series) total += stackValue(s, ci);
    stackedMax_ = std::max(stackedMax_, total);
  }
}

std::vector<SeriesInfo> StackedBarRecipe::seriesInfoList() const {
  std::vector<SeriesInfo> out;
  out.reserve(config_.series.size());
  for (std::size_t i = 0; i < config_.series.size(); i++) {
    out.push_back(SeriesInfo{config_.series[i].name, seriesColor(config_.series[i].color, i)});
  }
  return out;
}

RecipeFrame StackedBarRecipe::build(const FrameContext& ctx) const {
  RecipeFrame frame;
  const ChartLayout& lay = ctx.layout;
  const bool vertical = config_.orientation == BarOrientation::Vertical;
  const std::size_t nCats = config_.labels.size();
  const std::size_t nSeries = config_.series.size();

  AxisRange valueRange = applyZoomToRange(ctx.zoom, 0.0, stackedMax_,
                                          vertical ? Axis::Y : Axis::X);
  frame.valueTicks = computeTicks(valueRange.min, valueRange.max,
                                  config_.valueAxis, ctx.tickCountHint);
  const double vMin = frame.valueTicks.min;
  const double vMax = frame.valueTicks.max;

  if (nCats == 0 || nSeries == 0) return frame;

  const PlotExtent eff = effectivePlotExtent(ctx.zoom, lay.plotRect(),
                                             vertical ? Axis::X : Axis::Y);
  const double groupSize = eff.size / static_cast<double>(nCats);
  const double barSize = groupSize * BarRecipe::kGroupFill;
  const double groupPad = groupSize * BarRecipe::kGroupPad;

  const double valueStart = vertical ? lay.plotY + lay.plotH : lay.plotX;
  const double valueLength = vertical ? -lay.plotH : lay.plotW;

  std::vector<std::string> colors(nSeries);
  for (std::size_t si = 0; si < nSeries; si++) {
    colors[si] = seriesColor(config_.series[si].color, si);
  }

  for (std::size_t ci = 0; ci < nCats; ci++) {
    const double along = eff.start + static_cast<double>(ci) * groupSize + groupPad;
    double cumulative = 0.0;

    for (std::size_t si = 0; si < nSeries; si++) {
      const double vis = ctx.visibilityOf(si);
      if (vis <= kHiddenThreshold) continue;
      const double val = stackValue(config_.series[si], ci) * ctx.enterProgress * vis;

      const double from = mapValue(cumulative, vMin, vMax, valueStart, valueLength);
      const double to = mapValue(cumulative + val, vMin, vMax, valueStart, valueLength);
      cumulative += val;
      const double extent = std::fabs(to - from);
      if (extent <= kMinBarExtent) continue;

      HitRegion hit;
      hit.series = si;
      hit.index = ci;
      if (vertical) {
        hit.x = along; hit.y = std::min(from, to); hit.w = barSize; hit.h = extent;
      } else {
        hit.x = std::min(from, to); hit.y = along; hit.w = extent; hit.h = barSize;
      }

      Rect r;
      r.x = static_cast<float>(hit.x);
      r.y = static_cast<float>(hit.y);
      r.w = static_cast<float>(hit.w);
      r.h = static_cast<float>(hit.h);
      r.color = colors[si];
      frame.batch.rects.push_back(std::move(r));
      frame.hits.push_back(hit);
    }
  }
  return frame;
}

} // namespace qc
