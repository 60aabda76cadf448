#include "qc/render/Batcher.hpp"

#include <algorithm>
#include <cmath>

namespace qc {

static constexpr float kTwoPi = 6.28318530717958647692f;

static int diskSegments(const Disk& d) {
  return d.segments < 3 ? 3 : d.segments;
}

bool computeScissor(const ClipRect& clip, int canvasW, int canvasH, ScissorBox& out) {
  int cx = std::max(0, static_cast<int>(std::lround(clip.x)));
  int cy = std::max(0, static_cast<int>(std::lround(clip.y)));
  int cw = std::min(canvasW - cx, static_cast<int>(std::lround(clip.width)));
  int ch = std::min(canvasH - cy, static_cast<int>(std::lround(clip.height)));
  if (cw <= 0 || ch <= 0) return false;

  out.x = cx;
  out.y = canvasH - (cy + ch);
  out.width = cw;
  out.height = ch;
  return true;
}

std::size_t expandedVertexCount(const std::vector<Rect>& rects,
                                const std::vector<Segment>& segments,
                                const std::vector<Disk>& disks) {
  std::size_t n = rects.size() * 6 + segments.size() * 6;
  for (const auto& d : disks) {
    n += static_cast<std::size_t>(diskSegments(d)) * 3;
  }
  return n;
}

void PrimitiveBatcher::begin(int canvasW, int canvasH) {
  ndc_.width = static_cast<float>(canvasW > 0 ? canvasW : 1);
  ndc_.height = static_cast<float>(canvasH > 0 ? canvasH : 1);
  verts_.clear();
}

void PrimitiveBatcher::pushTri(float x0, float y0, float x1, float y1,
                               float x2, float y2, const Rgba& c) {
  verts_.push_back({x0, y0, c.r, c.g, c.b, c.a});
  verts_.push_back({x1, y1, c.r, c.g, c.b, c.a});
  verts_.push_back({x2, y2, c.r, c.g, c.b, c.a});
}

void PrimitiveBatcher::addRect(const Rect& r) {
  const Rgba& c = colors_.resolve(r.color);
  float x0 = ndc_.x(r.x);
  float y0 = ndc_.y(r.y);
  float x1 = ndc_.x(r.x + r.w);
  float y1 = ndc_.y(r.y + r.h);
  pushTri(x0, y0, x1, y0, x0, y1, c);
  pushTri(x1, y0, x1, y1, x0, y1, c);
}

void PrimitiveBatcher::addSegment(const Segment& s) {
  const Rgba& c = colors_.resolve(s.color);
  float hw = s.width / 2.0f;
  float dx = s.x2 - s.x1;
  float dy = s.y2 - s.y1;
  float len = std::sqrt(dx * dx + dy * dy);
  if (len == 0.0f) len = 1.0f;

  // Perpendicular offset in pixels.
  float px = (-dy / len) * hw;
  float py = (dx / len) * hw;

  float ax = ndc_.x(s.x1 + px), ay = ndc_.y(s.y1 + py);
  float bx = ndc_.x(s.x1 - px), by = ndc_.y(s.y1 - py);
  float cx = ndc_.x(s.x2 - px), cy = ndc_.y(s.y2 - py);
  float ex = ndc_.x(s.x2 + px), ey = ndc_.y(s.y2 + py);

  pushTri(ax, ay, bx, by, cx, cy, c);
  pushTri(ax, ay, ex, ey, cx, cy, c);
}

void PrimitiveBatcher::addDisk(const Disk& d) {
  const Rgba& c = colors_.resolve(d.color);
  const int seg = diskSegments(d);
  float cxN = ndc_.x(d.cx);
  float cyN = ndc_.y(d.cy);
  for (int i = 0; i < seg; i++) {
    float a0 = static_cast<float>(i) / static_cast<float>(seg) * kTwoPi;
    float a1 = static_cast<float>(i + 1) / static_cast<float>(seg) * kTwoPi;
    pushTri(cxN, cyN,
            ndc_.x(d.cx + std::cos(a0) * d.r), ndc_.y(d.cy + std::sin(a0) * d.r),
            ndc_.x(d.cx + std::cos(a1) * d.r), ndc_.y(d.cy + std::sin(a1) * d.r),
            c);
  }
}

void PrimitiveBatcher::addAll(const std::vector<Rect>& rects,
                              const std::vector<Segment>& segments,
                              const std::vector<Disk>& disks) {
  verts_.reserve(verts_.size() + expandedVertexCount(rects, segments, disks));
  for (const auto& r : rects) addRect(r);
  for (const auto& s : segments) addSegment(s);
  for (const auto& d : disks) addDisk(d);
}

} // namespace qc
