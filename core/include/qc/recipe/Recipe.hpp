#pragma once
#include "qc/layout/ChartLayout.hpp"
#include "qc/math/NiceTicks.hpp"
#include "qc/render/Primitives.hpp"
#include "qc/viewport/Viewport.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qc {

inline constexpr std::size_t kPaletteSize = 10;
extern const char* const kDefaultPalette[kPaletteSize];

// `color` if set, else the palette entry for `index` (wrapping).
std::string seriesColor(const std::string& color, std::size_t index);

// Series metadata for legend display + visibility control.
struct SeriesInfo {
  std::string name;
  std::string color;
};

// Pointer target produced while building a frame. Coordinates in canvas
// pixels, matching what was drawn.
struct HitRegion {
  enum class Shape { Rect, Circle };

  Shape shape{Shape::Rect};
  double x{0}, y{0}, w{0}, h{0};   // Rect
  double cx{0}, cy{0}, r{0};       // Circle
  std::size_t series{0};
  std::size_t index{0};            // category or point index

  bool contains(double px, double py) const;
};

// First region containing (x, y), in build order.
std::optional<HitRegion> hitTest(const std::vector<HitRegion>& regions, double x, double y);

// Everything a recipe needs to lay out one animation frame.
struct FrameContext {
  ChartLayout layout;
  ZoomRange zoom{kNoZoom};
  double enterProgress{1.0};
  std::vector<double> visibility;   // per series; missing entries count as 1
  int tickCountHint{6};

  double visibilityOf(std::size_t series) const {
    return series < visibility.size() ? visibility[series] : 1.0;
  }
};

struct RecipeFrame {
  PrimitiveBatch batch;
  std::vector<HitRegion> hits;

  // Value axis ticks, for the text overlay.
  TickSet valueTicks;
};

// Turns chart data plus the current animation/zoom state into primitives.
// Recipes hold no GL state and are rebuilt from scratch every frame.
class Recipe {
public:
  virtual ~Recipe() = default;

  virtual std::size_t seriesCount() const = 0;
  virtual std::vector<SeriesInfo> seriesInfoList() const = 0;

  virtual RecipeFrame build(const FrameContext& ctx) const = 0;

  // Whether zoom/pan applies to this chart.
  virtual bool zoomable() const { return true; }
};

} // namespace qc
