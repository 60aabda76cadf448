// QuickCharts demo
// GLFW: interactive chart. Left-drag selects a range to zoom, right-drag pans
// while zoomed, double-click resets, keys 1-9 toggle series, R resets zoom.
// OSMesa fallback: animates headlessly and writes PPM frames.
//
// Usage: chart_demo [bar|hbar|stacked|line|scatter|timeline] [options.json]

#include "qc/anim/FrameClock.hpp"
#include "qc/gl/GlContext.hpp"
#include "qc/gl/Renderer.hpp"
#include "qc/recipe/BarRecipe.hpp"
#include "qc/recipe/LineRecipe.hpp"
#include "qc/recipe/ScatterRecipe.hpp"
#include "qc/recipe/StackedBarRecipe.hpp"
#include "qc/recipe/TimelineRecipe.hpp"
#include "qc/session/ChartOptions.hpp"
#include "qc/session/ChartSession.hpp"

#ifdef QC_HAS_GLFW
#include "qc/gl/GlfwContext.hpp"
#endif
#ifdef QC_HAS_OSMESA
#include "qc/gl/OsMesaContext.hpp"
#endif

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// ---- Helpers ----

static void writePPM(const char* filename, const std::vector<std::uint8_t>& pixels,
                     int w, int h) {
  FILE* f = std::fopen(filename, "wb");
  if (!f) {
    std::fprintf(stderr, "Cannot open %s for writing\n", filename);
    return;
  }
  std::fprintf(f, "P6\n%d %d\n255\n", w, h);
  for (int y = h - 1; y >= 0; y--) {
    for (int x = 0; x < w; x++) {
      std::size_t idx = static_cast<std::size_t>((y * w + x) * 4);
      std::fputc(pixels[idx + 0], f);
      std::fputc(pixels[idx + 1], f);
      std::fputc(pixels[idx + 2], f);
    }
  }
  std::fclose(f);
  std::printf("Wrote %s (%dx%d)\n", filename, w, h);
}

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

static std::unique_ptr<qc::Recipe> makeRecipe(const std::string& kind) {
  std::vector<std::string> labels(std::begin(kMonths), std::end(kMonths));

  if (kind == "line") {
    qc::LineRecipeConfig cfg;
    cfg.labels = labels;
    for (int s = 0; s < 3; s++) {
      qc::LineSeries series;
      series.name = "Region " + std::to_string(s + 1);
      for (int i = 0; i < 12; i++) {
        series.values.push_back(40.0 + 25.0 * std::sin(i * 0.5 + s) + 10.0 * s);
      }
      series.showPoints = (s != 2);
      cfg.series.push_back(series);
    }
    return std::make_unique<qc::LineRecipe>(cfg);
  }

  if (kind == "scatter") {
    qc::ScatterRecipeConfig cfg;
    for (int s = 0; s < 2; s++) {
      qc::ScatterSeries series;
      series.name = s == 0 ? "Control" : "Treatment";
      for (int i = 0; i < 80; i++) {
        double t = i * 0.37 + s * 1.3;
        series.points.push_back({i * 1.25, 50.0 + 30.0 * std::sin(t) + 8.0 * std::cos(t * 3.1) + s * 12.0});
      }
      series.pointRadius = 3.0 + s;
      cfg.series.push_back(series);
    }
    return std::make_unique<qc::ScatterRecipe>(cfg);
  }

  if (kind == "stacked") {
    qc::StackedBarRecipeConfig cfg;
    cfg.labels = labels;
    const char* names[] = {"Online", "Retail", "Wholesale"};
    for (int s = 0; s < 3; s++) {
      qc::BarSeries series;
      series.name = names[s];
      for (int i = 0; i < 12; i++) {
        series.values.push_back(12.0 + 8.0 * std::sin(i * 0.6 + s * 1.7) + 4.0 * s);
      }
      cfg.series.push_back(series);
    }
    return std::make_unique<qc::StackedBarRecipe>(cfg);
  }

  if (kind == "timeline") {
    qc::TimelineRecipeConfig cfg;
    const char* tasks[] = {"Research", "Design", "Prototype", "Build", "Test", "Launch"};
    double start = 0.0;
    for (int i = 0; i < 6; i++) {
      qc::TimelineItem item;
      item.label = tasks[i];
      item.start = start;
      item.end = start + 5.0 + 3.0 * (i % 3);
      item.progress = i < 3 ? 1.0 : (i == 3 ? 0.4 : -1.0);
      cfg.items.push_back(item);
      start += 3.5;
    }
    return std::make_unique<qc::TimelineRecipe>(cfg);
  }

  qc::BarRecipeConfig cfg;
  cfg.labels = labels;
  cfg.orientation = (kind == "hbar") ? qc::BarOrientation::Horizontal
                                     : qc::BarOrientation::Vertical;
  const char* names[] = {"Product A", "Product B", "Product C"};
  for (int s = 0; s < 3; s++) {
    qc::BarSeries series;
    series.name = names[s];
    for (int i = 0; i < 12; i++) {
      series.values.push_back(20.0 + 15.0 * std::sin(i * 0.7 + s * 2.0) + 5.0 * s - (i == 4 ? 40.0 : 0.0));
    }
    cfg.series.push_back(series);
  }
  return std::make_unique<qc::BarRecipe>(cfg);
}

static void printFallbackNotice() {
  std::printf("GPU rendering is not available on this system; "
              "the chart cannot be displayed.\n");
}

int main(int argc, char** argv) {
  constexpr int W = 960, H = 600;
  const std::string kind = argc > 1 ? argv[1] : "bar";

  qc::ChartOptions options;
  if (argc > 2) {
    std::string json, err;
    if (!readFile(argv[2], json)) {
      std::fprintf(stderr, "Cannot read %s\n", argv[2]);
      return 1;
    }
    if (!qc::parseChartOptions(json, options, &err)) {
      std::fprintf(stderr, "Invalid options in %s: %s\n", argv[2], err.c_str());
      return 1;
    }
  }

  // 1. Create GL context
  std::unique_ptr<qc::GlContext> glCtx;
  bool isGlfw = false;
#ifdef QC_HAS_GLFW
  { auto g = std::make_unique<qc::GlfwContext>();
    if (g->init(W, H)) { glCtx = std::move(g); isGlfw = true; } }
#endif
#ifdef QC_HAS_OSMESA
  if (!glCtx) {
    auto m = std::make_unique<qc::OsMesaContext>();
    if (m->init(W, H)) {
      glCtx = std::move(m);
      std::printf("Using OSMesa (headless)\n");
    }
  }
#endif
  if (!glCtx) {
    std::fprintf(stderr, "No GL context\n");
    printFallbackNotice();
    return 1;
  }

  // 2. Renderer
  qc::Renderer renderer;
  if (!renderer.init(*glCtx)) {
    printFallbackNotice();
    return 1;
  }

  if (!isGlfw) {
    // Headless: drive the animation with a manual clock.
    qc::ManualFrameClock clock;
    qc::ChartSession session(clock, options);
    session.setCanvasSize(glCtx->width(), glCtx->height());
    session.setRecipe(makeRecipe(kind));
    session.setRenderer(&renderer);

    for (int i = 0; i < 10 && clock.pending() > 0; i++) clock.advance(100.0);
    writePPM("chart_demo_enter.ppm", glCtx->readPixels(), glCtx->width(), glCtx->height());

    // Zoom into the middle half of the plot.
    const qc::PlotRect plot = session.layout().plotRect();
    const double y = plot.y + plot.height * 0.5;
    session.handlePointer({qc::PointerEventType::Down, qc::PointerButton::Primary,
                           plot.x + plot.width * 0.25, y});
    session.handlePointer({qc::PointerEventType::Move, qc::PointerButton::Primary,
                           plot.x + plot.width * 0.75, y});
    session.handlePointer({qc::PointerEventType::Up, qc::PointerButton::Primary,
                           plot.x + plot.width * 0.75, y});
    const qc::ZoomRange& z = session.zoom().zoom();
    std::printf("Zoom x [%.3f, %.3f] y [%.3f, %.3f]\n", z.xMin, z.xMax, z.yMin, z.yMax);
    writePPM("chart_demo_zoomed.ppm", glCtx->readPixels(), glCtx->width(), glCtx->height());

    // Hide the first series and let the fade finish.
    session.toggleSeries(0);
    for (int i = 0; i < 10 && clock.pending() > 0; i++) clock.advance(100.0);
    writePPM("chart_demo_toggled.ppm", glCtx->readPixels(), glCtx->width(), glCtx->height());

    std::printf("Chart demo complete (%llu frames, %u vertices in last frame)\n",
                static_cast<unsigned long long>(session.framesRendered()),
                session.lastStats().vertexCount);
    session.dispose();
    renderer.destroy();
    return 0;
  }

#ifdef QC_HAS_GLFW
  // GLFW interactive loop
  auto* glfwCtx = static_cast<qc::GlfwContext*>(glCtx.get());
  qc::SteadyFrameClock clock;
  qc::ChartSession session(clock, options);
  session.setCanvasSize(glfwCtx->width(), glfwCtx->height());
  session.setRecipe(makeRecipe(kind));
  session.setRenderer(&renderer);

  std::printf("Interactive mode: drag to zoom, right-drag to pan, double-click "
              "or R to reset, 1-9 toggle series, Esc to quit\n");

  std::uint64_t presented = 0;
  std::size_t lastHoverSeries = static_cast<std::size_t>(-1);
  std::size_t lastHoverIndex = static_cast<std::size_t>(-1);

  while (!glfwCtx->shouldClose()) {
    qc::InputState is = glfwCtx->pollInput();
    if (is.shouldClose) break;

    bool quit = false;
    for (qc::KeyCode key : is.keys) {
      if (key == qc::KeyCode::Escape) {
        quit = true;
      } else if (key == qc::KeyCode::R) {
        session.zoom().reset();
        session.drawOnce();
      } else if (key >= qc::KeyCode::Num1 && key <= qc::KeyCode::Num9) {
        std::size_t idx = static_cast<std::size_t>(key) - static_cast<std::size_t>(qc::KeyCode::Num1);
        if (session.recipe() && idx < session.recipe()->seriesCount()) {
          session.toggleSeries(idx);
        }
      }
    }
    if (quit) break;

    if (is.resized) {
      session.setCanvasSize(glfwCtx->width(), glfwCtx->height());
    }

    for (const auto& ev : is.pointerEvents) {
      session.handlePointer(ev);
    }

    const auto& hover = session.hover();
    if (hover && (hover->series != lastHoverSeries || hover->index != lastHoverIndex)) {
      auto info = session.recipe()->seriesInfoList();
      std::printf("%s #%zu\n", info[hover->series].name.c_str(), hover->index);
      lastHoverSeries = hover->series;
      lastHoverIndex = hover->index;
    } else if (!hover) {
      lastHoverSeries = lastHoverIndex = static_cast<std::size_t>(-1);
    }

    clock.pump();

    if (session.framesRendered() != presented) {
      presented = session.framesRendered();
      glfwCtx->swapBuffers();
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  session.dispose();
  renderer.destroy();
#endif

  return 0;
}
