#include "qc/recipe/LineRecipe.hpp"
#include "qc/render/Color.hpp"
#include <algorithm>
#include <utility>
#include <limits>

namespace qc {

static constexpr double kHiddenThreshold = 0.001;
static constexpr double kMinRadius = 0.1;

LineRecipe::LineRecipe(LineRecipeConfig config)
  : config_(std::move(config)) {
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (const auto& s : config_.series) {
    for (double v : s.values) {
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }
  if (lo <= hi) {
    dataMin_ = lo;
    dataMax_ = hi;
  }
}

std::vector<SeriesInfo> LineRecipe::seriesInfoList() const {
  std::vector<SeriesInfo> out;
  out.reserve(config_.series.size());
  for (std::size_t i = 0; i < config_.series.size(); i++) {
    out.push_back(SeriesInfo{config_.series[i].name, seriesColor(config_.series[i].color, i)});
  }
  return out;
}

RecipeFrame LineRecipe::build(const FrameContext& ctx) const {
  RecipeFrame frame;
  const ChartLayout& lay = ctx.layout;

  AxisRange yRange = applyZoomToRange(ctx.zoom, dataMin_, dataMax_, Axis::Y);
  frame.valueTicks = computeTicks(yRange.min, yRange.max, config_.yAxis, ctx.tickCountHint);
  const double yMin = frame.valueTicks.min;
  const double yMax = frame.valueTicks.max;

  const std::size_t nCats = config_.labels.size();
  if (nCats == 0) return frame;

  const double bottom = lay.plotY + lay.plotH;
  const double baselineVal = std::max(yMin, std::min(yMax, 0.0));
  const double baselineY = mapValue(baselineVal, yMin, yMax, bottom, -lay.plotH);
  const PlotExtent effX = effectivePlotExtent(ctx.zoom, lay.plotRect(), Axis::X);
  const double step = effX.size / static_cast<double>(nCats);

  std::vector<double> xs;
  std::vector<double> ys;
  for (std::size_t si = 0; si < config_.series.size(); si++) {
    const double vis = ctx.visibilityOf(si);
    if (vis <= kHiddenThreshold) continue;
    const LineSeries& s = config_.series[si];
    // Toggled series fade rather than collapse.
    const std::string base = seriesColor(s.color, si);
    const std::string color = vis < 1.0 ? scaleAlpha(base, vis) : base;
    const double animFactor = ctx.enterProgress;

    xs.clear();
    ys.clear();
    for (std::size_t ci = 0; ci < s.values.size(); ci++) {
      const double target = mapValue(s.values[ci], yMin, yMax, bottom, -lay.plotH);
      xs.push_back(effX.start + (static_cast<double>(ci) + 0.5) * step);
      ys.push_back(baselineY + (target - baselineY) * animFactor);
    }

    for (std::size_t i = 0; i + 1 < xs.size(); i++) {
      Segment seg;
      seg.x1 = static_cast<float>(xs[i]);
      seg.y1 = static_cast<float>(ys[i]);
      seg.x2 = static_cast<float>(xs[i + 1]);
      seg.y2 = static_cast<float>(ys[i + 1]);
      seg.color = color;
      seg.width = static_cast<float>(s.lineWidth);
      frame.batch.segments.push_back(std::move(seg));
    }

    for (std::size_t ci = 0; ci < xs.size(); ci++) {
      HitRegion hit;
      hit.shape = HitRegion::Shape::Circle;
      hit.cx = xs[ci];
      hit.cy = ys[ci];
      hit.series = si;
      hit.index = ci;

      if (s.showPoints) {
        const double r = s.pointRadius * animFactor;
        if (r > kMinRadius) {
          Disk d;
          d.cx = static_cast<float>(xs[ci]);
          d.cy = static_cast<float>(ys[ci]);
          d.r = static_cast<float>(r);
          d.color = color;
          frame.batch.disks.push_back(std::move(d));
        }
        hit.r = s.pointRadius + kHitSlop;
      } else {
        hit.r = kHiddenPointHitRadius;
      }
      frame.hits.push_back(hit);
    }
  }
  return frame;
}

} // namespace qc
