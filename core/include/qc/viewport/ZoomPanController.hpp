#pragma once
#include "qc/render/Primitives.hpp"
#include "qc/viewport/InputState.hpp"
#include "qc/viewport/Viewport.hpp"
#include <optional>
#include <string>

namespace qc {

struct ZoomPanConfig {
  double directionLockPx{5.0};   // drag distance before a selection picks an axis
  double minSelectionPx{8.0};    // shorter selections are discarded on release
  std::string overlayColor{"rgba(128,128,128,0.3)"};
  int overlayZIndex{5};
};

// Describes the translucent rectangle drawn over the plot while selecting.
// Purely presentational: it never receives pointer events.
struct SelectionOverlayStyle {
  double left{0}, top{0}, width{0}, height{0};
  std::string color;
  int zIndex{0};
};

enum class DragMode { None, Select, Pan };
enum class AxisLock { Undecided, X, Y };

struct DragSession {
  DragMode mode{DragMode::None};
  AxisLock axisLock{AxisLock::Undecided};
  double startX{0}, startY{0};
  double lastX{0}, lastY{0};
  ZoomRange zoomAtStart{};
};

// Pointer gestures to a fractional zoom window:
//   primary drag    -> axis-locked range selection, zoom on release
//   secondary drag  -> pan (only while zoomed)
//   double click    -> reset
// Each handler returns true when it consumed the event.
class ZoomPanController {
public:
  ZoomPanController() = default;
  explicit ZoomPanController(const ZoomPanConfig& cfg) : config_(cfg) {}

  void setConfig(const ZoomPanConfig& cfg) { config_ = cfg; }
  const ZoomPanConfig& config() const { return config_; }

  // Layout changes do not affect the zoom fractions.
  void setPlotRect(const PlotRect& plot) { plot_ = plot; }
  const PlotRect& plotRect() const { return plot_; }

  bool onPointerDown(const PointerEvent& ev);
  bool onPointerMove(const PointerEvent& ev);
  bool onPointerUp(const PointerEvent& ev);
  bool onPointerLeave(const PointerEvent& ev);
  bool onWindowPointerUp(const PointerEvent& ev);
  bool onDoubleClick(const PointerEvent& ev);

  // True when the host should suppress its context menu.
  bool onContextMenu(const PointerEvent& ev);

  // Dispatch by event type.
  bool handle(const PointerEvent& ev);

  // Abort the drag in progress. Zoom is unchanged.
  void cancelDrag();

  void reset();

  // All handlers become inert.
  void dispose();
  bool disposed() const { return disposed_; }

  const ZoomRange& zoom() const { return zoom_; }
  bool isZoomed() const { return zoom_ != kNoZoom; }

  const std::optional<SelectionRect>& selection() const { return selection_; }
  std::optional<SelectionOverlayStyle> selectionOverlay() const;

  // The overlay as a primitive the chart can append to its frame.
  std::optional<Rect> selectionOverlayRect() const;

  AxisRange applyToRange(double dataMin, double dataMax, Axis axis) const {
    return applyZoomToRange(zoom_, dataMin, dataMax, axis);
  }
  PlotExtent effectivePlot(Axis axis) const {
    return effectivePlotExtent(zoom_, plot_, axis);
  }

  // Plot rect as a scissor clip while zoomed.
  std::optional<ClipRect> clipRect() const;

  const DragSession& drag() const { return drag_; }

  // Bumped whenever zoom() changes value.
  unsigned revision() const { return revision_; }

private:
  ZoomPanConfig config_{};
  PlotRect plot_{};
  ZoomRange zoom_{kNoZoom};
  DragSession drag_{};
  std::optional<SelectionRect> selection_;
  bool disposed_{false};
  unsigned revision_{0};

  void setZoom(const ZoomRange& z);
  void endDrag();
  SelectionRect selectionFor(double px, double py) const;
  void commitSelection(double px, double py);
};

} // namespace qc
