#pragma once
#include "qc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace qc {

struct LineSeries {
  std::string name;
  std::vector<double> values;   // one per category
  std::string color;            // empty = palette
  double lineWidth{2.0};
  bool showPoints{true};
  double pointRadius{4.0};
};

struct LineRecipeConfig {
  std::vector<std::string> labels;
  std::vector<LineSeries> series;
  AxisConfig yAxis;
};

// One segment per consecutive pair of points, optional disks on the points.
// Points rise from the (clamped) zero line as the entrance runs; a series
// being toggled fades its alpha with its visibility.
class LineRecipe : public Recipe {
public:
  explicit LineRecipe(LineRecipeConfig config);

  std::size_t seriesCount() const override { return config_.series.size(); }
  std::vector<SeriesInfo> seriesInfoList() const override;

  RecipeFrame build(const FrameContext& ctx) const override;

  const LineRecipeConfig& config() const { return config_; }

  static constexpr double kHitSlop = 4.0;          // added to the point radius
  static constexpr double kHiddenPointHitRadius = 8.0;

private:
  LineRecipeConfig config_;
  double dataMin_{0};
  double dataMax_{1};
};

} // namespace qc
