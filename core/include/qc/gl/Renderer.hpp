#pragma once
#include "qc/debug/Stats.hpp"
#include "qc/gl/GlContext.hpp"
#include "qc/gl/MsaaTarget.hpp"
#include "qc/gl/ShaderProgram.hpp"
#include "qc/render/Batcher.hpp"
#include "qc/render/Primitives.hpp"
#include <glad/gl.h>
#include <vector>

namespace qc {

struct RendererConfig {
  int sampleCount{4};
};

// Batches every primitive of a frame into one triangle list and draws it
// with a single call into a multisampled target, which is then resolved to
// the surface's default framebuffer.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Requires the surface's GL context to be current. On failure fallback()
  // becomes true and false is returned. A second call returns the result of
  // the first.
  bool init(GlContext& surface, const RendererConfig& config = {});

  bool ready() const { return ready_; }
  bool fallback() const { return fallback_; }

  FrameStats draw(const std::vector<Rect>& rects,
                  const std::vector<Segment>& segments,
                  const std::vector<Disk>& disks,
                  const Rgba& background,
                  const ClipRect* clip = nullptr);

  FrameStats draw(const PrimitiveBatch& batch, const Rgba& background,
                  const ClipRect* clip = nullptr);

  // Release GPU resources. Later draw() calls do nothing.
  void destroy();

  const MsaaTarget& target() const { return target_; }

private:
  GlContext* surface_{nullptr};
  RendererConfig config_{};
  ShaderProgram program_;
  MsaaTarget target_;
  PrimitiveBatcher batcher_;
  GLuint vao_{0};
  bool attempted_{false};
  bool ready_{false};
  bool fallback_{false};
  bool destroyed_{false};

  bool fail(const char* what);
};

} // namespace qc
