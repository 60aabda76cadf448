#pragma once
#include "qc/recipe/BarRecipe.hpp"
#include <string>
#include <vector>

namespace qc {

struct StackedBarRecipeConfig {
  std::vector<std::string> labels;
  std::vector<BarSeries> series;    // stacked in order, first at the baseline
  BarOrientation orientation{BarOrientation::Vertical};
  AxisConfig valueAxis;
};

// One bar per category made of per-series segments laid end to end.
// Each segment is grown by enterProgress * visibility, so hiding a series
// collapses its segment and the ones above it slide down.
// Negative values count as 0.
class StackedBarRecipe : public Recipe {
public:
  explicit StackedBarRecipe(StackedBarRecipeConfig config);

  std::size_t seriesCount() const override { return config_.series.size(); }
  std::vector<SeriesInfo> seriesInfoList() const override;

  RecipeFrame build(const FrameContext& ctx) const override;

  // Largest category total; the value axis spans [0, stackedMax].
  double stackedMax() const { return stackedMax_; }

private:
  StackedBarRecipeConfig config_;
  double stackedMax_{0};
};

} // namespace qc
