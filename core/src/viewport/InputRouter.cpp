#include "qc/viewport/InputRouter.hpp"
#include "qc/viewport/ZoomPanController.hpp"

namespace qc {

bool InputRouter::route(const PointerEvent& ev) {
  if (controller_ && controller_->handle(ev)) {
    controllerConsumed_++;
    if (ev.type == PointerEventType::ContextMenu) suppressContextMenu_ = true;
    return true;
  }
  if (ev.type == PointerEventType::ContextMenu) suppressContextMenu_ = false;

  // A release outside the container only ends drags.
  if (ev.type == PointerEventType::WindowUp) return false;

  if (chartHandler_ && chartHandler_(ev)) {
    chartConsumed_++;
    return true;
  }
  return false;
}

bool InputRouter::routeAll(const std::vector<PointerEvent>& events) {
  bool any = false;
  for (const auto& ev : events) {
    if (route(ev)) any = true;
  }
  return any;
}

} // namespace qc
