#pragma once
#include "qc/render/Color.hpp"
#include "qc/render/Primitives.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qc {

inline constexpr int kFloatsPerVertex = 6;
inline constexpr int kDefaultDiskSegments = 24;

// Pixel <-> normalized device coordinates for a canvas of width x height.
// Pixel origin is top-left, device origin is bottom-left (Y flipped).
struct NdcTransform {
  float width{1.0f};
  float height{1.0f};

  float x(float px) const { return px / width * 2.0f - 1.0f; }
  float y(float py) const { return 1.0f - py / height * 2.0f; }

  float pixelX(float nx) const { return (nx + 1.0f) * 0.5f * width; }
  float pixelY(float ny) const { return (1.0f - ny) * 0.5f * height; }
};

// Scissor box in GL window coordinates (origin bottom-left).
struct ScissorBox {
  int x{0}, y{0}, width{0}, height{0};
};

// Round and clamp a top-left pixel clip rect to the canvas, then flip it
// into GL window coordinates. Returns false when the clamped rect is empty,
// in which case no scissor should be applied.
bool computeScissor(const ClipRect& clip, int canvasW, int canvasH, ScissorBox& out);

// Number of vertices a frame expands to.
std::size_t expandedVertexCount(const std::vector<Rect>& rects,
                                const std::vector<Segment>& segments,
                                const std::vector<Disk>& disks);

// Expands rects, segments and disks into one flat triangle list.
// The vertex storage is reused across frames; its content is rebuilt on
// every begin().
class PrimitiveBatcher {
public:
  void begin(int canvasW, int canvasH);

  void addRect(const Rect& r);
  void addSegment(const Segment& s);
  void addDisk(const Disk& d);

  void addAll(const std::vector<Rect>& rects,
              const std::vector<Segment>& segments,
              const std::vector<Disk>& disks);

  const std::vector<Vertex>& vertices() const { return verts_; }
  std::size_t vertexCount() const { return verts_.size(); }
  std::size_t byteSize() const { return verts_.size() * sizeof(Vertex); }
  bool empty() const { return verts_.empty(); }

  const NdcTransform& transform() const { return ndc_; }
  const ColorCache& colors() const { return colors_; }

private:
  void pushTri(float x0, float y0, float x1, float y1, float x2, float y2,
               const Rgba& c);

  NdcTransform ndc_;
  ColorCache colors_;
  std::vector<Vertex> verts_;
};

} // namespace qc
