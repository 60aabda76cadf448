#pragma once
#include "qc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace qc {

// One task row. Times are plain numbers (e.g. epoch milliseconds).
struct TimelineItem {
  std::string label;
  double start{0};
  double end{0};
  double progress{-1};          // [0, 1]; negative = no progress bar
  std::string color;            // empty = barColor, else palette by row
};

struct TimelineRecipeConfig {
  std::vector<TimelineItem> items;
  std::string name{"Tasks"};    // legend entry
  std::string barColor;
  std::string progressColor;    // empty = bar color darkened
  double barHeightRatio{0.6};   // share of a row used by the bar
  AxisConfig timeAxis;
};

// Gantt-style rows: items are categories on Y (first row on top), bars span
// [start, end] on a zoomable time axis. The row axis spans the zoomed
// virtual extent like bar categories. Bar widths grow from `start` by
// enterProgress * visibility. The whole chart is a single series.
class TimelineRecipe : public Recipe {
public:
  explicit TimelineRecipe(TimelineRecipeConfig config);

  std::size_t seriesCount() const override { return 1; }
  std::vector<SeriesInfo> seriesInfoList() const override;

  // RecipeFrame::valueTicks holds the time axis.
  RecipeFrame build(const FrameContext& ctx) const override;

  TickSet timeTicks(const FrameContext& ctx) const;

  double minTime() const { return minTime_; }
  double maxTime() const { return maxTime_; }

  static constexpr double kProgressDarken = 0.35;

private:
  std::string itemColor(std::size_t index) const;

  TimelineRecipeConfig config_;
  double minTime_{0}, maxTime_{1};
};

} // namespace qc
