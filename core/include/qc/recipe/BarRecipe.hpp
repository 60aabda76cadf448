#pragma once
#include "qc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace qc {

struct BarSeries {
  std::string name;
  std::vector<double> values;   // one per category; missing values count as 0
  std::string color;            // empty = palette
};

enum class BarOrientation { Vertical, Horizontal };

struct BarRecipeConfig {
  std::vector<std::string> labels;
  std::vector<BarSeries> series;
  BarOrientation orientation{BarOrientation::Vertical};
  AxisConfig valueAxis;
};

// Grouped bars. The category axis spans the zoomed virtual extent and is
// clipped to the plot; the value axis is the zoomed data range.
// Bars grow out of the zero line by enterProgress * visibility.
class BarRecipe : public Recipe {
public:
  explicit BarRecipe(BarRecipeConfig config);

  std::size_t seriesCount() const override { return config_.series.size(); }
  std::vector<SeriesInfo> seriesInfoList() const override;

  RecipeFrame build(const FrameContext& ctx) const override;

  const BarRecipeConfig& config() const { return config_; }

  static constexpr double kGroupFill = 0.7;   // share of a category used by bars
  static constexpr double kGroupPad = 0.15;   // leading gap per category

private:
  BarRecipeConfig config_;
  double dataMin_{0};
  double dataMax_{0};
};

} // namespace qc
