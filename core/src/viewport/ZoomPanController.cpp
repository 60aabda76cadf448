#include "qc/viewport/ZoomPanController.hpp"
#include <algorithm>
#include <cmath>

namespace qc {

void ZoomPanController::setZoom(const ZoomRange& z) {
  if (z == zoom_) return;
  zoom_ = z;
  revision_++;
}

void ZoomPanController::endDrag() {
  drag_.mode = DragMode::None;
  drag_.axisLock = AxisLock::Undecided;
  selection_.reset();
}

bool ZoomPanController::onPointerDown(const PointerEvent& ev) {
  if (disposed_) return false;
  if (!plot_.contains(ev.x, ev.y)) return false;

  if (ev.button == PointerButton::Primary) {
    drag_ = DragSession{DragMode::Select, AxisLock::Undecided,
                        ev.x, ev.y, ev.x, ev.y, zoom_};
    return true;
  }
  if (ev.button == PointerButton::Secondary && isZoomed()) {
    drag_ = DragSession{DragMode::Pan, AxisLock::Undecided,
                        ev.x, ev.y, ev.x, ev.y, zoom_};
    return true;
  }
  return false;
}

SelectionRect ZoomPanController::selectionFor(double px, double py) const {
  if (drag_.axisLock == AxisLock::X) {
    double x1 = std::max(plot_.x, std::min(px, drag_.startX));
    double x2 = std::min(plot_.x + plot_.width, std::max(px, drag_.startX));
    return SelectionRect{x1, plot_.y, x2 - x1, plot_.height};
  }
  double y1 = std::max(plot_.y, std::min(py, drag_.startY));
  double y2 = std::min(plot_.y + plot_.height, std::max(py, drag_.startY));
  return SelectionRect{plot_.x, y1, plot_.width, y2 - y1};
}

bool ZoomPanController::onPointerMove(const PointerEvent& ev) {
  if (disposed_ || drag_.mode == DragMode::None) return false;

  drag_.lastX = ev.x;
  drag_.lastY = ev.y;

  if (drag_.mode == DragMode::Select) {
    if (drag_.axisLock == AxisLock::Undecided) {
      double dx = std::fabs(ev.x - drag_.startX);
      double dy = std::fabs(ev.y - drag_.startY);
      if (dx < config_.directionLockPx && dy < config_.directionLockPx) {
        return true;  // consumed, nothing shown yet
      }
      drag_.axisLock = (dx >= dy) ? AxisLock::X : AxisLock::Y;
    }
    selection_ = selectionFor(ev.x, ev.y);
    return true;
  }

  // Pan: offsets are measured from the drag start, so every move
  // recomputes from zoomAtStart.
  const ZoomRange& zs = drag_.zoomAtStart;
  const double plotW = plot_.width > 0.0 ? plot_.width : 1.0;
  const double plotH = plot_.height > 0.0 ? plot_.height : 1.0;
  const double dfx = -((ev.x - drag_.startX) / plotW) * (zs.xMax - zs.xMin);
  const double dfy = ((ev.y - drag_.startY) / plotH) * (zs.yMax - zs.yMin);

  ZoomRange next{zs.xMin + dfx, zs.xMax + dfx, zs.yMin + dfy, zs.yMax + dfy};
  clampPanPair(next.xMin, next.xMax);
  clampPanPair(next.yMin, next.yMax);
  setZoom(next);
  return true;
}

void ZoomPanController::commitSelection(double px, double py) {
  SelectionRect sel = selectionFor(px, py);
  ZoomRange next = zoom_;

  if (drag_.axisLock == AxisLock::X) {
    if (sel.width <= 0.0 || sel.width < config_.minSelectionPx) return;
    double fracLeft = (sel.x - plot_.x) / plot_.width;
    double fracRight = (sel.x + sel.width - plot_.x) / plot_.width;
    double span = zoom_.xMax - zoom_.xMin;
    next.xMin = zoom_.xMin + fracLeft * span;
    next.xMax = zoom_.xMin + fracRight * span;
  } else {
    if (sel.height <= 0.0 || sel.height < config_.minSelectionPx) return;
    double fracTop = (sel.y - plot_.y) / plot_.height;
    double fracBottom = (sel.y + sel.height - plot_.y) / plot_.height;
    double span = zoom_.yMax - zoom_.yMin;
    // Pixel top is the high end of the data range.
    next.yMax = zoom_.yMax - fracTop * span;
    next.yMin = zoom_.yMax - fracBottom * span;
  }
  setZoom(next);
}

bool ZoomPanController::onPointerUp(const PointerEvent& ev) {
  if (disposed_ || drag_.mode == DragMode::None) return false;

  if (drag_.mode == DragMode::Select && drag_.axisLock != AxisLock::Undecided) {
    commitSelection(ev.x, ev.y);
  }
  endDrag();
  return true;
}

bool ZoomPanController::onPointerLeave(const PointerEvent& /*ev*/) {
  if (disposed_ || drag_.mode == DragMode::None) return false;
  endDrag();
  return true;
}

bool ZoomPanController::onWindowPointerUp(const PointerEvent& /*ev*/) {
  if (disposed_ || drag_.mode == DragMode::None) return false;
  endDrag();
  return true;
}

bool ZoomPanController::onDoubleClick(const PointerEvent& ev) {
  if (disposed_ || ev.button != PointerButton::Primary) return false;
  if (!isZoomed() || !plot_.contains(ev.x, ev.y)) return false;
  setZoom(kNoZoom);
  return true;
}

bool ZoomPanController::onContextMenu(const PointerEvent& ev) {
  if (disposed_) return false;
  return plot_.contains(ev.x, ev.y);
}

bool ZoomPanController::handle(const PointerEvent& ev) {
  switch (ev.type) {
    case PointerEventType::Down:        return onPointerDown(ev);
    case PointerEventType::Move:        return onPointerMove(ev);
    case PointerEventType::Up:          return onPointerUp(ev);
    case PointerEventType::Leave:       return onPointerLeave(ev);
    case PointerEventType::WindowUp:    return onWindowPointerUp(ev);
    case PointerEventType::DoubleClick: return onDoubleClick(ev);
    case PointerEventType::ContextMenu: return onContextMenu(ev);
  }
  return false;
}

void ZoomPanController::cancelDrag() {
  if (disposed_) return;
  endDrag();
}

void ZoomPanController::reset() {
  if (disposed_) return;
  endDrag();
  setZoom(kNoZoom);
}

void ZoomPanController::dispose() {
  endDrag();
  disposed_ = true;
}

std::optional<SelectionOverlayStyle> ZoomPanController::selectionOverlay() const {
  if (!selection_) return std::nullopt;
  SelectionOverlayStyle style;
  style.left = selection_->x;
  style.top = selection_->y;
  style.width = selection_->width;
  style.height = selection_->height;
  style.color = config_.overlayColor;
  style.zIndex = config_.overlayZIndex;
  return style;
}

std::optional<Rect> ZoomPanController::selectionOverlayRect() const {
  if (!selection_) return std::nullopt;
  Rect r;
  r.x = static_cast<float>(selection_->x);
  r.y = static_cast<float>(selection_->y);
  r.w = static_cast<float>(selection_->width);
  r.h = static_cast<float>(selection_->height);
  r.color = config_.overlayColor;
  return r;
}

std::optional<ClipRect> ZoomPanController::clipRect() const {
  if (!isZoomed()) return std::nullopt;
  return ClipRect{static_cast<float>(plot_.x), static_cast<float>(plot_.y),
                  static_cast<float>(plot_.width), static_cast<float>(plot_.height)};
}

} // namespace qc
