#pragma once
#include "qc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace qc {

struct ScatterPoint {
  double x{0}, y{0};
};

struct ScatterSeries {
  std::string name;
  std::vector<ScatterPoint> points;
  std::string color;            // empty = palette
  double pointRadius{4.0};
};

struct ScatterRecipeConfig {
  std::vector<ScatterSeries> series;
  AxisConfig xAxis;
  AxisConfig yAxis;
};

// One disk per point on two value axes, both of them zoomable.
// Radii scale with enterProgress * visibility.
class ScatterRecipe : public Recipe {
public:
  explicit ScatterRecipe(ScatterRecipeConfig config);

  std::size_t seriesCount() const override { return config_.series.size(); }
  std::vector<SeriesInfo> seriesInfoList() const override;

  RecipeFrame build(const FrameContext& ctx) const override;

  // Horizontal axis ticks for `ctx`. RecipeFrame::valueTicks holds the Y axis.
  TickSet xTicks(const FrameContext& ctx) const;

  static constexpr double kHitSlop = 4.0;

private:
  ScatterRecipeConfig config_;
  double xMin_{0}, xMax_{1};
  double yMin_{0}, yMax_{1};
};

} // namespace qc
