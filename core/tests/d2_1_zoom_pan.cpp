// D2.1 — ZoomPanController: selection zoom, pan clamp, reset, dispose (pure C++)

#include "qc/viewport/ZoomPanController.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static qc::PointerEvent ev(qc::PointerEventType t, double x, double y,
                           qc::PointerButton b = qc::PointerButton::Primary) {
  qc::PointerEvent e;
  e.type = t;
  e.button = b;
  e.x = x;
  e.y = y;
  return e;
}

static qc::PointerEvent down(double x, double y, qc::PointerButton b = qc::PointerButton::Primary) {
  return ev(qc::PointerEventType::Down, x, y, b);
}
static qc::PointerEvent move(double x, double y) { return ev(qc::PointerEventType::Move, x, y); }
static qc::PointerEvent up(double x, double y, qc::PointerButton b = qc::PointerButton::Primary) {
  return ev(qc::PointerEventType::Up, x, y, b);
}

// Drag with the primary button from (x0,y0) to (x1,y1).
static void dragSelect(qc::ZoomPanController& zc, double x0, double y0, double x1, double y1) {
  requireTrue(zc.onPointerDown(down(x0, y0)), "select down consumed");
  zc.onPointerMove(move(x1, y1));
  zc.onPointerUp(up(x1, y1));
}

int main() {
  constexpr double TOL = 1e-9;
  const qc::PlotRect plot{50, 20, 400, 300};

  // ---- Test 1: Horizontal selection commits an X zoom ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);

    requireTrue(zc.onPointerDown(down(100, 100)), "down inside plot consumed");
    requireTrue(zc.drag().mode == qc::DragMode::Select, "select mode");
    requireTrue(zc.onPointerMove(move(250, 100)), "move consumed");
    requireTrue(zc.drag().axisLock == qc::AxisLock::X, "locked to X");
    requireTrue(zc.selection().has_value(), "selection visible");
    requireClose(zc.selection()->x, 100, TOL, "selection x");
    requireClose(zc.selection()->width, 150, TOL, "selection width");
    requireClose(zc.selection()->y, 20, TOL, "selection spans plot height (y)");
    requireClose(zc.selection()->height, 300, TOL, "selection spans plot height (h)");

    requireTrue(zc.onPointerUp(up(250, 100)), "up consumed");
    requireClose(zc.zoom().xMin, 0.125, TOL, "xMin");
    requireClose(zc.zoom().xMax, 0.5, TOL, "xMax");
    requireClose(zc.zoom().yMin, 0.0, TOL, "yMin untouched");
    requireClose(zc.zoom().yMax, 1.0, TOL, "yMax untouched");
    requireTrue(!zc.selection().has_value(), "selection cleared");
    requireTrue(zc.drag().mode == qc::DragMode::None, "session cleared");
    requireTrue(zc.isZoomed(), "zoomed");
    std::printf("  Test 1 (x selection): PASS\n");
  }

  // ---- Test 2: Zoom composes with the current window ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);

    // Middle 50% of the plot width.
    dragSelect(zc, 150, 100, 350, 100);
    requireClose(zc.zoom().xMin, 0.25, TOL, "first xMin");
    requireClose(zc.zoom().xMax, 0.75, TOL, "first xMax");

    dragSelect(zc, 150, 100, 350, 100);
    requireClose(zc.zoom().xMin, 0.375, TOL, "composed xMin");
    requireClose(zc.zoom().xMax, 0.625, TOL, "composed xMax");
    std::printf("  Test 2 (composition): PASS\n");
  }

  // ---- Test 3: Vertical selection; pixel top is the high end ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);

    // Top quarter of the plot: y 20..95
    dragSelect(zc, 200, 20, 201, 95);
    requireClose(zc.zoom().yMax, 1.0, TOL, "yMax stays at top");
    requireClose(zc.zoom().yMin, 0.75, TOL, "yMin from bottom edge of selection");
    requireClose(zc.zoom().xMin, 0.0, TOL, "x untouched");

    // Bottom half of the zoomed window.
    dragSelect(zc, 200, 170, 200, 320);
    requireClose(zc.zoom().yMax, 0.875, TOL, "composed yMax");
    requireClose(zc.zoom().yMin, 0.75, TOL, "composed yMin");
    std::printf("  Test 3 (y selection): PASS\n");
  }

  // ---- Test 4: Direction lock threshold and tie-breaking ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);

    zc.onPointerDown(down(200, 200));
    requireTrue(zc.onPointerMove(move(203, 204)), "small move consumed");
    requireTrue(zc.drag().axisLock == qc::AxisLock::Undecided, "below threshold undecided");
    requireTrue(!zc.selection().has_value(), "no selection while undecided");

    zc.onPointerMove(move(206, 206));
    requireTrue(zc.drag().axisLock == qc::AxisLock::X, "tie locks to X");
    zc.onPointerMove(move(206, 260));
    requireTrue(zc.drag().axisLock == qc::AxisLock::X, "lock is sticky");
    zc.onPointerUp(up(206, 260));

    zc.onPointerDown(down(200, 200));
    zc.onPointerMove(move(202, 210));
    requireTrue(zc.drag().axisLock == qc::AxisLock::Y, "vertical drag locks to Y");
    requireClose(zc.selection()->x, plot.x, TOL, "y selection spans plot width");
    zc.cancelDrag();

    // Released before a lock: nothing happens.
    qc::ZoomRange before = zc.zoom();
    zc.onPointerDown(down(200, 200));
    zc.onPointerMove(move(202, 202));
    zc.onPointerUp(up(300, 200));
    requireTrue(zc.zoom() == before, "undecided release leaves zoom");
    std::printf("  Test 4 (direction lock): PASS\n");
  }

  // ---- Test 5: Selections under 8px are discarded ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);
    dragSelect(zc, 200, 100, 207, 100);
    requireTrue(!zc.isZoomed(), "7px selection ignored");
    dragSelect(zc, 200, 100, 208, 100);
    requireTrue(zc.isZoomed(), "8px selection commits");

    // Selection clamped at the plot edge is measured after clamping.
    qc::ZoomPanController zc2;
    zc2.setPlotRect(plot);
    zc2.onPointerDown(down(446, 100));
    zc2.onPointerMove(move(600, 100));
    requireClose(zc2.selection()->width, 4, TOL, "clamped to plot right edge");
    zc2.onPointerUp(up(600, 100));
    requireTrue(!zc2.isZoomed(), "clamped selection under threshold ignored");
    std::printf("  Test 5 (min selection): PASS\n");
  }

  // ---- Test 6: Pan keeps the span and stays inside [0, 1] ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);

    requireTrue(!zc.onPointerDown(down(200, 100, qc::PointerButton::Secondary)),
                "secondary does not pan when not zoomed");

    dragSelect(zc, 150, 100, 350, 100);        // x [0.25, 0.75]
    dragSelect(zc, 200, 95, 200, 245);          // y: middle half
    const double spanX = zc.zoom().xMax - zc.zoom().xMin;
    const double spanY = zc.zoom().yMax - zc.zoom().yMin;

    requireTrue(zc.onPointerDown(down(250, 170, qc::PointerButton::Secondary)), "pan starts");
    requireTrue(zc.drag().mode == qc::DragMode::Pan, "pan mode");

    // Drag right by 100px: view moves left by 100/400 * 0.5 = 0.125.
    zc.onPointerMove(move(350, 170));
    requireClose(zc.zoom().xMin, 0.125, TOL, "pan xMin");
    requireClose(zc.zoom().xMax, 0.625, TOL, "pan xMax");

    // Offsets are relative to the drag start, not cumulative.
    zc.onPointerMove(move(350, 170));
    requireClose(zc.zoom().xMin, 0.125, TOL, "repeat move idempotent");

    const double moves[][2] = {{2000, 170}, {-3000, 170}, {250, 5000},
                               {250, -5000}, {-777, 1234}, {123, -45}};
    for (const auto& m : moves) {
      zc.onPointerMove(move(m[0], m[1]));
      const qc::ZoomRange& z = zc.zoom();
      requireTrue(z.xMin >= 0 && z.xMin < z.xMax && z.xMax <= 1, "x inside [0,1]");
      requireTrue(z.yMin >= 0 && z.yMin < z.yMax && z.yMax <= 1, "y inside [0,1]");
      requireClose(z.xMax - z.xMin, spanX, 1e-12, "x span preserved");
      requireClose(z.yMax - z.yMin, spanY, 1e-12, "y span preserved");
    }

    // Far right drag pins the window to the left edge.
    zc.onPointerMove(move(5000, 170));
    requireClose(zc.zoom().xMin, 0.0, TOL, "pinned left");
    // Dragging down reveals higher values.
    zc.onPointerMove(move(250, 5000));
    requireClose(zc.zoom().yMax, 1.0, TOL, "pinned top");

    requireTrue(zc.onPointerUp(up(250, 5000, qc::PointerButton::Secondary)), "pan ends");
    requireTrue(zc.drag().mode == qc::DragMode::None, "pan session cleared");
    std::printf("  Test 6 (pan clamp): PASS\n");
  }

  // ---- Test 7: Double click, context menu, leave, window up ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);

    requireTrue(!zc.onDoubleClick(ev(qc::PointerEventType::DoubleClick, 100, 100)),
                "double click ignored when not zoomed");
    dragSelect(zc, 150, 100, 350, 100);
    requireTrue(!zc.onDoubleClick(ev(qc::PointerEventType::DoubleClick, 10, 10)),
                "double click outside plot ignored");
    requireTrue(zc.isZoomed(), "still zoomed");
    requireTrue(zc.onDoubleClick(ev(qc::PointerEventType::DoubleClick, 100, 100)),
                "double click resets");
    requireTrue(zc.zoom() == qc::kNoZoom, "identity after reset");

    requireTrue(zc.onContextMenu(ev(qc::PointerEventType::ContextMenu, 100, 100,
                                    qc::PointerButton::Secondary)), "menu suppressed in plot");
    requireTrue(!zc.onContextMenu(ev(qc::PointerEventType::ContextMenu, 10, 10,
                                     qc::PointerButton::Secondary)), "menu allowed outside");

    zc.onPointerDown(down(100, 100));
    zc.onPointerMove(move(300, 100));
    requireTrue(zc.selection().has_value(), "selecting");
    requireTrue(zc.onPointerLeave(ev(qc::PointerEventType::Leave, 460, 100)), "leave cancels");
    requireTrue(!zc.selection().has_value() && !zc.isZoomed(), "leave: no zoom, no overlay");

    zc.onPointerDown(down(100, 100));
    zc.onPointerMove(move(300, 100));
    requireTrue(zc.onWindowPointerUp(ev(qc::PointerEventType::WindowUp, 900, 100)),
                "window up cancels");
    requireTrue(!zc.isZoomed(), "window up does not commit");
    requireTrue(!zc.onPointerUp(up(300, 100)), "no session left to end");

    requireTrue(!zc.onPointerDown(down(10, 10)), "down outside plot not consumed");
    requireTrue(!zc.onPointerMove(move(20, 20)), "move without drag not consumed");
    std::printf("  Test 7 (reset + cancel): PASS\n");
  }

  // ---- Test 8: Queries ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);
    requireTrue(!zc.clipRect().has_value(), "no clip when not zoomed");

    zc.onPointerDown(down(100, 100));
    zc.onPointerMove(move(250, 100));
    auto style = zc.selectionOverlay();
    requireTrue(style.has_value(), "overlay while selecting");
    requireTrue(style->color == "rgba(128,128,128,0.3)", "overlay color");
    requireTrue(style->zIndex == 5, "overlay z-index");
    requireClose(style->left, 100, TOL, "overlay left");
    auto rect = zc.selectionOverlayRect();
    requireTrue(rect.has_value() && rect->w == 150.0f, "overlay rect primitive");
    zc.onPointerUp(up(250, 100));
    requireTrue(!zc.selectionOverlay().has_value(), "overlay gone after release");

    auto clip = zc.clipRect();
    requireTrue(clip.has_value(), "clip while zoomed");
    requireTrue(clip->x == 50.0f && clip->width == 400.0f, "clip is plot rect");

    qc::AxisRange r = zc.applyToRange(0, 200, qc::Axis::X);
    requireClose(r.min, 25, TOL, "applyToRange min");
    requireClose(r.max, 100, TOL, "applyToRange max");

    qc::PlotExtent ex = zc.effectivePlot(qc::Axis::X);
    requireClose(ex.size, 400 / 0.375, 1e-9, "effective x size");
    requireClose(ex.start, 50 - 0.125 * ex.size, 1e-9, "effective x start");
    std::printf("  Test 8 (queries): PASS\n");
  }

  // ---- Test 9: dispose() makes every handler inert ----
  {
    qc::ZoomPanController zc;
    zc.setPlotRect(plot);
    zc.onPointerDown(down(100, 100));
    zc.onPointerMove(move(250, 100));
    zc.dispose();
    requireTrue(!zc.selection().has_value(), "dispose clears overlay");
    requireTrue(!zc.onPointerUp(up(250, 100)), "up inert");
    requireTrue(!zc.onPointerDown(down(100, 100)), "down inert");
    requireTrue(!zc.onContextMenu(ev(qc::PointerEventType::ContextMenu, 100, 100)), "menu inert");
    requireTrue(!zc.handle(move(300, 100)), "handle inert");
    requireTrue(!zc.isZoomed(), "zoom unchanged");
    std::printf("  Test 9 (dispose): PASS\n");
  }

  // ---- Test 10: Zero-extent selection never commits, whatever the threshold ----
  {
    qc::ZoomPanConfig cfg;
    cfg.minSelectionPx = 0.0;
    qc::ZoomPanController zc(cfg);
    zc.setPlotRect(plot);

    zc.onPointerDown(down(100, 100));
    zc.onPointerMove(move(110, 100));
    requireTrue(zc.drag().axisLock == qc::AxisLock::X, "locked to X");
    zc.onPointerUp(up(100, 100));
    requireTrue(!zc.isZoomed(), "empty X selection discarded");
    requireTrue(zc.revision() == 0, "zoom never changed");

    zc.onPointerDown(down(100, 100));
    zc.onPointerMove(move(100, 110));
    requireTrue(zc.drag().axisLock == qc::AxisLock::Y, "locked to Y");
    zc.onPointerUp(up(100, 100));
    requireTrue(!zc.isZoomed(), "empty Y selection discarded");

    // A 1px selection is still honoured with the threshold off.
    dragSelect(zc, 100, 100, 110, 100);
    zc.onPointerDown(down(300, 100));
    zc.onPointerMove(move(310, 100));
    zc.onPointerUp(up(301, 100));
    requireTrue(zc.zoom().xMin < zc.zoom().xMax, "window stays non-empty");
    std::printf("  Test 10 (zero-extent selection): PASS\n");
  }

  std::printf("\nD2.1 zoom/pan PASS\n");
  return 0;
}
