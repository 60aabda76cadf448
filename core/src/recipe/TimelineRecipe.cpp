#include "qc/recipe/TimelineRecipe.hpp"
#include "qc/render/Color.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>

namespace qc {

static constexpr double kHiddenThreshold = 0.001;
static constexpr double kMinBarExtent = 0.1;

static std::string darken(const std::string& css, double factor) {
  Rgba c = parseColor(css);
  const double k = 1.0 - factor;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "rgba(%d,%d,%d,%.4g)",
                static_cast<int>(std::lround(c.r * 255.0 * k)),
                static_cast<int>(std::lround(c.g * 255.0 * k)),
                static_cast<int>(std::lround(c.b * 255.0 * k)),
                static_cast<double>(c.a));
  return buf;
}

TimelineRecipe::TimelineRecipe(TimelineRecipeConfig config)
  : config_(std::move(config)) {
  const double inf = std::numeric_limits<double>::infinity();
  double lo = inf, hi = -inf;
  for (const auto& it : config_.items) {
    lo = std::min(lo, std::min(it.start, it.end));
    hi = std::max(hi, std::max(it.start, it.end));
  }
  if (lo < hi) {
    minTime_ = lo;
    maxTime_ = hi;
  } else if (lo == hi) {
    minTime_ = lo;
    maxTime_ = lo + 1.0;
  }
}

std::vector<SeriesInfo> TimelineRecipe::seriesInfoList() const {
  return {SeriesInfo{config_.name, seriesColor(config_.barColor, 0)}};
}

std::string TimelineRecipe::itemColor(std::size_t index) const {
  const TimelineItem& it = config_.items[index];
  if (!it.color.empty()) return it.color;
  if (!config_.barColor.empty()) return config_.barColor;
  return seriesColor("", index);
}

TickSet TimelineRecipe::timeTicks(const FrameContext& ctx) const {
  AxisRange r = applyZoomToRange(ctx.zoom, minTime_, maxTime_, Axis::X);
  return computeTicks(r.min, r.max, config_.timeAxis, ctx.tickCountHint);
}

RecipeFrame TimelineRecipe::build(const FrameContext& ctx) const {
  RecipeFrame frame;
  const ChartLayout& lay = ctx.layout;
  frame.valueTicks = timeTicks(ctx);
  const double tMin = frame.valueTicks.min;
  const double tMax = frame.valueTicks.max;

  const std::size_t nRows = config_.items.size();
  if (nRows == 0) return frame;

  const double vis = ctx.visibilityOf(0);
  if (vis <= kHiddenThreshold) return frame;
  const double animFactor = ctx.enterProgress * vis;

  const PlotExtent eff = effectivePlotExtent(ctx.zoom, lay.plotRect(), Axis::Y);
  const double rowSize = eff.size / static_cast<double>(nRows);
  const double barSize = rowSize * config_.barHeightRatio;
  const double barOffset = (rowSize - barSize) / 2.0;

  for (std::size_t i = 0; i < nRows; i++) {
    const TimelineItem& it = config_.items[i];
    const double x0 = mapValue(std::min(it.start, it.end), tMin, tMax, lay.plotX, lay.plotW);
    const double x1 = mapValue(std::max(it.start, it.end), tMin, tMax, lay.plotX, lay.plotW);
    const double w = (x1 - x0) * animFactor;
    if (w <= kMinBarExtent) continue;
    const double y = eff.start + static_cast<double>(i) * rowSize + barOffset;

    const std::string color = itemColor(i);
    Rect bar;
    bar.x = static_cast<float>(x0);
    bar.y = static_cast<float>(y);
    bar.w = static_cast<float>(w);
    bar.h = static_cast<float>(barSize);
    bar.color = color;
    frame.batch.rects.push_back(std::move(bar));

    if (it.progress >= 0.0) {
      const double pw = w * std::min(it.progress, 1.0);
      if (pw > kMinBarExtent) {
        Rect done;
        done.x = static_cast<float>(x0);
        done.y = static_cast<float>(y);
        done.w = static_cast<float>(pw);
        done.h = static_cast<float>(barSize);
        done.color = config_.progressColor.empty() ? darken(color, kProgressDarken)
                                                   : config_.progressColor;
        frame.batch.rects.push_back(std::move(done));
      }
    }

    HitRegion hit;
    hit.series = 0;
    hit.index = i;
    hit.x = x0; hit.y = y; hit.w = w; hit.h = barSize;
    frame.hits.push_back(hit);
  }
  return frame;
}

} // namespace qc
