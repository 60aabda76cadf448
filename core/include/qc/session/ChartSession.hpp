#pragma once
#include "qc/anim/AnimationScheduler.hpp"
#include "qc/debug/Stats.hpp"
#include "qc/gl/Renderer.hpp"
#include "qc/layout/ChartLayout.hpp"
#include "qc/recipe/Recipe.hpp"
#include "qc/session/ChartOptions.hpp"
#include "qc/viewport/InputRouter.hpp"
#include "qc/viewport/ZoomPanController.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace qc {

// Wires one chart together: the recipe builds primitives from the animation
// values and the zoom window, and the renderer draws them, clipped to the
// plot while zoomed. The session does not own the renderer.
class ChartSession {
public:
  explicit ChartSession(FrameClock& clock, const ChartOptions& options = {});
  ~ChartSession();

  ChartSession(const ChartSession&) = delete;
  ChartSession& operator=(const ChartSession&) = delete;

  // nullptr or a renderer that is not ready keeps the chart idle.
  void setRenderer(Renderer* renderer);
  void setRecipe(std::unique_ptr<Recipe> recipe);
  void setOptions(const ChartOptions& options);
  // Canvas size in pixels; should match the renderer's surface.
  void setCanvasSize(int width, int height);

  // Pointer input in canvas pixels. Returns true if consumed.
  bool handlePointer(const PointerEvent& ev);

  // Legend toggle. Each call hands the scheduler a new hidden set.
  void toggleSeries(std::size_t index);
  void setHiddenSeries(HiddenSeriesSet hidden);
  bool seriesHidden(std::size_t index) const;

  // Render now with the current animation values.
  void drawOnce();

  void dispose();

  bool ready() const { return renderer_ && renderer_->ready() && !disposed_; }

  const ChartLayout& layout() const { return layout_; }
  const ChartOptions& options() const { return options_; }
  ZoomPanController& zoom() { return zoom_; }
  const ZoomPanController& zoom() const { return zoom_; }
  AnimationScheduler& animation() { return anim_; }
  InputRouter& router() { return router_; }
  const Recipe* recipe() const { return recipe_.get(); }

  const RecipeFrame& lastFrame() const { return lastFrame_; }
  const FrameStats& lastStats() const { return lastStats_; }
  std::uint64_t framesRendered() const { return framesRendered_; }

  // Hit region under the pointer after the last move, if any.
  const std::optional<HitRegion>& hover() const { return hover_; }

private:
  ChartOptions options_;
  Renderer* renderer_{nullptr};
  std::unique_ptr<Recipe> recipe_;

  ChartLayout layout_{};
  ZoomPanController zoom_;
  AnimationScheduler anim_;
  InputRouter router_;

  HiddenSetPtr hidden_;
  RecipeFrame lastFrame_;
  FrameStats lastStats_{};
  std::uint64_t framesRendered_{0};
  std::optional<HitRegion> hover_;
  bool disposed_{false};

  void relayout();
  void sync();
  void renderFrame(double enterProgress, const std::vector<double>& visibility);
  bool handleChartPointer(const PointerEvent& ev);
};

} // namespace qc
