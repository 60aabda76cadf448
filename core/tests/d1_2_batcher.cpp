// D1.2 — Primitive expansion into one triangle list (pure C++)
// Tests: vertex counts, rect/segment/disk geometry, NDC round trip, scissor.

#include "qc/render/Batcher.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n",
                 msg, a, b, eps);
    std::exit(1);
  }
}

int main() {
  constexpr double EPS = 1e-5;

  // ---- Test 1: Vertex count for mixed frames ----
  {
    std::vector<qc::Rect> rects(3, qc::Rect{0, 0, 10, 10, "#ff0000"});
    std::vector<qc::Segment> segs(2, qc::Segment{0, 0, 10, 10, "#00ff00", 2});
    std::vector<qc::Disk> disks(4, qc::Disk{50, 50, 5, "#0000ff", 24});

    qc::PrimitiveBatcher b;
    b.begin(200, 100);
    b.addAll(rects, segs, disks);

    std::size_t expected = 6 * 3 + 6 * 2 + 3 * 24 * 4;
    requireTrue(b.vertexCount() == expected, "6N + 6M + 3*seg*K vertices");
    requireTrue(qc::expandedVertexCount(rects, segs, disks) == expected, "expandedVertexCount");
    requireTrue(b.byteSize() == expected * qc::kFloatsPerVertex * sizeof(float), "6 floats each");

    // Disk segments clamp to 3.
    std::vector<qc::Disk> tiny(1, qc::Disk{10, 10, 2, "red", 1});
    requireTrue(qc::expandedVertexCount({}, {}, tiny) == 9, "segments < 3 clamp to 3");

    b.begin(200, 100);
    requireTrue(b.empty(), "begin() clears previous frame");
    std::printf("  Test 1 (vertex count): PASS\n");
  }

  // ---- Test 2: Rect corners and color ----
  {
    qc::PrimitiveBatcher b;
    b.begin(100, 100);
    b.addRect(qc::Rect{0, 0, 10, 10, "#ff0000"});
    const auto& v = b.vertices();
    requireTrue(v.size() == 6, "rect -> 6 vertices");

    // (x0,y0) (x1,y0) (x0,y1) / (x1,y0) (x1,y1) (x0,y1)
    const float x0 = -1.0f, x1 = -0.8f, y0 = 1.0f, y1 = 0.8f;
    const float ex[6] = {x0, x1, x0, x1, x1, x0};
    const float ey[6] = {y0, y0, y1, y0, y1, y1};
    for (int i = 0; i < 6; i++) {
      requireNear(v[i].x, ex[i], EPS, "rect vertex x");
      requireNear(v[i].y, ey[i], EPS, "rect vertex y");
      requireNear(v[i].r, 1.0, EPS, "rect red");
      requireNear(v[i].g, 0.0, EPS, "rect green");
      requireNear(v[i].b, 0.0, EPS, "rect blue");
      requireNear(v[i].a, 1.0, EPS, "rect alpha");
    }
    std::printf("  Test 2 (rect): PASS\n");
  }

  // ---- Test 3: Horizontal segment is a quad of the given width ----
  {
    qc::PrimitiveBatcher b;
    b.begin(100, 100);
    b.addSegment(qc::Segment{10, 50, 90, 50, "black", 4});
    const auto& v = b.vertices();
    const auto& ndc = b.transform();
    requireTrue(v.size() == 6, "segment -> 6 vertices");

    // a = p1 + n, b = p1 - n, c = p2 - n; n = (0, 2) for a left-to-right line
    requireNear(ndc.pixelX(v[0].x), 10, 1e-3, "a.x");
    requireNear(ndc.pixelY(v[0].y), 52, 1e-3, "a.y");
    requireNear(ndc.pixelY(v[1].y), 48, 1e-3, "b.y");
    requireNear(ndc.pixelX(v[2].x), 90, 1e-3, "c.x");
    requireNear(ndc.pixelY(v[2].y), 48, 1e-3, "c.y");
    requireNear(ndc.pixelX(v[4].x), 90, 1e-3, "e.x");
    requireNear(ndc.pixelY(v[4].y), 52, 1e-3, "e.y");

    // Zero-length segment stays finite.
    b.begin(100, 100);
    b.addSegment(qc::Segment{20, 20, 20, 20, "black", 3});
    for (const auto& vert : b.vertices()) {
      requireTrue(std::isfinite(vert.x) && std::isfinite(vert.y), "zero-length finite");
    }
    std::printf("  Test 3 (segment): PASS\n");
  }

  // ---- Test 4: Disk fan ----
  {
    qc::PrimitiveBatcher b;
    b.begin(200, 200);
    b.addDisk(qc::Disk{100, 100, 10, "#00f", 8});
    const auto& v = b.vertices();
    const auto& ndc = b.transform();
    requireTrue(v.size() == 24, "8 segments -> 24 vertices");
    for (std::size_t t = 0; t < 8; t++) {
      requireNear(v[t * 3].x, 0.0, EPS, "fan center x");
      requireNear(v[t * 3].y, 0.0, EPS, "fan center y");
      for (int k = 1; k <= 2; k++) {
        double dx = ndc.pixelX(v[t * 3 + k].x) - 100.0;
        double dy = ndc.pixelY(v[t * 3 + k].y) - 100.0;
        requireNear(std::sqrt(dx * dx + dy * dy), 10.0, 1e-3, "rim on radius");
      }
    }
    // First rim vertex at angle 0.
    requireNear(ndc.pixelX(v[1].x), 110.0, 1e-3, "rim(0).x");
    std::printf("  Test 4 (disk): PASS\n");
  }

  // ---- Test 5: NDC round trip ----
  {
    const int sizes[][2] = {{800, 600}, {1, 1}, {1920, 1080}, {333, 77}};
    for (const auto& sz : sizes) {
      qc::NdcTransform t{static_cast<float>(sz[0]), static_cast<float>(sz[1])};
      for (int i = 0; i <= 10; i++) {
        float px = sz[0] * i / 10.0f;
        float py = sz[1] * (10 - i) / 10.0f;
        requireNear(t.pixelX(t.x(px)), px, 1e-3 * sz[0], "round trip x");
        requireNear(t.pixelY(t.y(py)), py, 1e-3 * sz[1], "round trip y");
      }
      requireNear(t.x(0), -1.0, EPS, "left edge");
      requireNear(t.y(0), 1.0, EPS, "top edge");
    }
    std::printf("  Test 5 (NDC round trip): PASS\n");
  }

  // ---- Test 6: Scissor rounding, clamping and flip ----
  {
    qc::ScissorBox box;
    requireTrue(qc::computeScissor(qc::ClipRect{50.4f, 20.6f, 400, 300}, 500, 400, box), "inside");
    requireTrue(box.x == 50 && box.width == 400, "x rounded");
    requireTrue(box.height == 300 && box.y == 400 - (21 + 300), "y flipped to bottom-left");

    requireTrue(qc::computeScissor(qc::ClipRect{-10, 0, 1000, 50}, 200, 100, box), "clamped");
    requireTrue(box.x == 0 && box.width == 200, "clamped to canvas width");

    requireTrue(!qc::computeScissor(qc::ClipRect{10, 10, 0, 20}, 100, 100, box), "zero width");
    requireTrue(!qc::computeScissor(qc::ClipRect{150, 10, 20, 20}, 100, 100, box), "off canvas");
    std::printf("  Test 6 (scissor): PASS\n");
  }

  // ---- Test 7: Fading colors do not grow the color cache ----
  {
    qc::PrimitiveBatcher b;
    for (int fade = 0; fade < 200; fade++) {
      for (int frame = 0; frame < 37; frame++) {
        double vis = 1.0 - frame / 36.0;
        b.begin(100, 100);
        b.addRect(qc::Rect{0, 0, 10, 10, qc::scaleAlpha("#4e79a7", vis)});
        requireTrue(b.colors().size() <= qc::ColorCache::kDefaultCapacity, "cache bounded");
      }
    }
    requireTrue(b.vertexCount() == 6, "last frame only");
    requireTrue(std::fabs(b.vertices()[0].a) < 1e-6f, "last frame fully faded");
    requireTrue(std::fabs(b.vertices()[0].b - 167.0f / 255.0f) < 0.002f, "color kept while fading");
    std::printf("  Test 7 (fade cache): PASS\n");
  }

  std::printf("\nD1.2 batcher PASS\n");
  return 0;
}
