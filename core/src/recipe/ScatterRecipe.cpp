#include "qc/recipe/ScatterRecipe.hpp"
#include <algorithm>
#include <utility>
#include <limits>

namespace qc {

static constexpr double kHiddenThreshold = 0.001;
static constexpr double kMinRadius = 0.1;

ScatterRecipe::ScatterRecipe(ScatterRecipeConfig config)
  : config_(std::move(config)) {
  const double inf = std::numeric_limits<double>::infinity();
  double x0 = inf, x1 = -inf, y0 = inf, y1 = -inf;
  for (const auto& s : config_.series) {
    for (const auto& p : s.points) {
      x0 = std::min(x0, p.x);
      x1 = std::max(x1, p.x);
      y0 = std::min(y0, p.y);
      y1 = std::max(y1, p.y);
    }
  }
  if (x0 <= x1) {
    xMin_ = x0; xMax_ = x1;
    yMin_ = y0; yMax_ = y1;
  }
}

std::vector<SeriesInfo> ScatterRecipe::seriesInfoList() const {
  std::vector<SeriesInfo> out;
  out.reserve(config_.series.size());
  for (std::size_t i = 0; i < config_.series.size(); i++) {
    out.push_back(SeriesInfo{config_.series[i].name, seriesColor(config_.series[i].color, i)});
  }
  return out;
}

TickSet ScatterRecipe::xTicks(const FrameContext& ctx) const {
  AxisRange r = applyZoomToRange(ctx.zoom, xMin_, xMax_, Axis::X);
  return computeTicks(r.min, r.max, config_.xAxis, ctx.tickCountHint);
}

RecipeFrame ScatterRecipe::build(const FrameContext& ctx) const {
  RecipeFrame frame;
  const ChartLayout& lay = ctx.layout;

  const TickSet xt = xTicks(ctx);
  AxisRange yr = applyZoomToRange(ctx.zoom, yMin_, yMax_, Axis::Y);
  frame.valueTicks = computeTicks(yr.min, yr.max, config_.yAxis, ctx.tickCountHint);
  const TickSet& yt = frame.valueTicks;

  for (std::size_t si = 0; si < config_.series.size(); si++) {
    const double vis = ctx.visibilityOf(si);
    if (vis <= kHiddenThreshold) continue;
    const ScatterSeries& s = config_.series[si];
    const std::string color = seriesColor(s.color, si);
    const double r = s.pointRadius * ctx.enterProgress * vis;

    for (std::size_t pi = 0; pi < s.points.size(); pi++) {
      const double cx = mapValue(s.points[pi].x, xt.min, xt.max, lay.plotX, lay.plotW);
      const double cy = mapValue(s.points[pi].y, yt.min, yt.max, lay.plotY + lay.plotH, -lay.plotH);
      if (r > kMinRadius) {
        Disk d;
        d.cx = static_cast<float>(cx);
        d.cy = static_cast<float>(cy);
        d.r = static_cast<float>(r);
        d.color = color;
        frame.batch.disks.push_back(std::move(d));
      }
      HitRegion hit;
      hit.shape = HitRegion::Shape::Circle;
      hit.cx = cx;
      hit.cy = cy;
      hit.r = s.pointRadius + kHitSlop;
      hit.series = si;
      hit.index = pi;
      frame.hits.push_back(hit);
    }
  }
  return frame;
}

} // namespace qc
