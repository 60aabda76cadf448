#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace qc {

// Normalized RGBA, each channel in [0, 1].
struct Rgba {
  float r{0.0f}, g{0.0f}, b{0.0f}, a{1.0f};
};

// All primitive coordinates are canvas pixels, origin top-left.
// Colors are CSS color strings, resolved by the batcher.

struct Rect {
  float x{0}, y{0}, w{0}, h{0};
  std::string color;
};

struct Segment {
  float x1{0}, y1{0}, x2{0}, y2{0};
  std::string color;
  float width{1.0f};
};

struct Disk {
  float cx{0}, cy{0}, r{0};
  std::string color;
  int segments{24};
};

// Pixel-space clip rectangle, origin top-left.
struct ClipRect {
  float x{0}, y{0}, width{0}, height{0};
};

// Interleaved vertex: vec2 position (NDC) + vec4 color.
struct Vertex {
  float x, y;
  float r, g, b, a;
};

static_assert(sizeof(Vertex) == 6 * sizeof(float), "Vertex must be 6 packed floats");

// One frame's worth of primitives, as assembled by a chart recipe.
struct PrimitiveBatch {
  std::vector<Rect> rects;
  std::vector<Segment> segments;
  std::vector<Disk> disks;

  bool empty() const { return rects.empty() && segments.empty() && disks.empty(); }
  void clear() {
    rects.clear();
    segments.clear();
    disks.clear();
  }
};

} // namespace qc
