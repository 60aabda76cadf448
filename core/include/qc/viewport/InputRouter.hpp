#pragma once
#include "qc/viewport/InputState.hpp"
#include <functional>
#include <vector>

namespace qc {

class ZoomPanController;

// Sends each pointer event to the zoom/pan controller first; events it does
// not consume go to the chart's own handler (hover, tooltips, clicks).
class InputRouter {
public:
  using ChartHandler = std::function<bool(const PointerEvent&)>;

  void setController(ZoomPanController* controller) { controller_ = controller; }
  void setChartHandler(ChartHandler handler) { chartHandler_ = std::move(handler); }

  // Returns true if anything consumed the event.
  bool route(const PointerEvent& ev);

  // Route a batch. Returns true if any event was consumed.
  bool routeAll(const std::vector<PointerEvent>& events);

  // Whether the host should suppress its default context menu for the last
  // ContextMenu event routed.
  bool contextMenuSuppressed() const { return suppressContextMenu_; }

  // Number of events each consumer has taken.
  unsigned controllerConsumed() const { return controllerConsumed_; }
  unsigned chartConsumed() const { return chartConsumed_; }

private:
  ZoomPanController* controller_{nullptr};
  ChartHandler chartHandler_;
  bool suppressContextMenu_{false};
  unsigned controllerConsumed_{0};
  unsigned chartConsumed_{0};
};

} // namespace qc
