#include "qc/gl/Renderer.hpp"
#include <cstddef>
#include <cstdio>

namespace qc {

static const char* kPrimitiveVert = R"GLSL(
#version 330 core
layout(location = 0) in vec2 a_pos;
layout(location = 1) in vec4 a_color;
out vec4 v_color;
void main() {
    gl_Position = vec4(a_pos, 0.0, 1.0);
    v_color = a_color;
}
)GLSL";

static const char* kPrimitiveFrag = R"GLSL(
#version 330 core
in vec4 v_color;
out vec4 outColor;
void main() {
    outColor = v_color;
}
)GLSL";

Renderer::~Renderer() {
  destroy();
}

bool Renderer::fail(const char* what) {
  std::fprintf(stderr, "Renderer::init: %s\n", what);
  fallback_ = true;
  ready_ = false;
  return false;
}

bool Renderer::init(GlContext& surface, const RendererConfig& config) {
  if (attempted_) return ready_;
  attempted_ = true;
  if (destroyed_) return fail("renderer was destroyed");

  surface_ = &surface;
  config_ = config;

  // Loaded 3.3 core entry points stand in for a graphics adapter.
  if (!GLAD_GL_VERSION_3_3) {
    return fail("no OpenGL 3.3 core context available");
  }

  GLint maxSamples = 0;
  glGetIntegerv(GL_MAX_SAMPLES, &maxSamples);
  if (maxSamples < config_.sampleCount) {
    std::fprintf(stderr, "Renderer::init: %d samples requested, device supports %d\n",
                 config_.sampleCount, maxSamples);
    return fail("multisampling unsupported");
  }

  if (!program_.build(kPrimitiveVert, kPrimitiveFrag)) {
    return fail("failed to build primitive shader");
  }

  glGenVertexArrays(1, &vao_);
  glEnable(GL_BLEND);
  glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA,
                      GL_ONE, GL_ONE_MINUS_SRC_ALPHA);

  ready_ = true;
  return true;
}

FrameStats Renderer::draw(const PrimitiveBatch& batch, const Rgba& background,
                          const ClipRect* clip) {
  return draw(batch.rects, batch.segments, batch.disks, background, clip);
}

FrameStats Renderer::draw(const std::vector<Rect>& rects,
                          const std::vector<Segment>& segments,
                          const std::vector<Disk>& disks,
                          const Rgba& background,
                          const ClipRect* clip) {
  FrameStats stats;
  if (!ready_ || !surface_) return stats;

  const int w = surface_->width();
  const int h = surface_->height();
  if (w <= 0 || h <= 0) return stats;

  batcher_.begin(w, h);
  batcher_.addAll(rects, segments, disks);

  if (!target_.ensure(w, h, config_.sampleCount)) {
    std::fprintf(stderr, "Renderer::draw: no multisample target for %dx%d\n", w, h);
    return stats;
  }
  stats.targetWidth = target_.width();
  stats.targetHeight = target_.height();

  target_.bindForDraw();
  glViewport(0, 0, w, h);
  glDisable(GL_SCISSOR_TEST);
  glClearColor(background.r, background.g, background.b, background.a);
  glClear(GL_COLOR_BUFFER_BIT);
  stats.passes = 1;

  if (!batcher_.empty()) {
    const GLsizei stride = static_cast<GLsizei>(sizeof(Vertex));
    GLuint vbo = 0;
    glGenBuffers(1, &vbo);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(batcher_.byteSize()),
                 batcher_.vertices().data(), GL_STREAM_DRAW);

    program_.use();
    glBindVertexArray(vao_);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride,
                          reinterpret_cast<const void*>(offsetof(Vertex, x)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, stride,
                          reinterpret_cast<const void*>(offsetof(Vertex, r)));

    glEnable(GL_BLEND);
    glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA,
                        GL_ONE, GL_ONE_MINUS_SRC_ALPHA);

    ScissorBox box;
    if (clip && computeScissor(*clip, w, h, box)) {
      glEnable(GL_SCISSOR_TEST);
      glScissor(box.x, box.y, box.width, box.height);
      stats.scissored = true;
    }

    glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(batcher_.vertexCount()));
    stats.drawCalls = 1;
    stats.vertexCount = static_cast<std::uint32_t>(batcher_.vertexCount());
    stats.uploadedBytes = batcher_.byteSize();

    // Blits are scissored too.
    glDisable(GL_SCISSOR_TEST);
    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glDeleteBuffers(1, &vbo);
  }

  target_.resolveTo(0);
  glFlush();
  return stats;
}

void Renderer::destroy() {
  if (destroyed_) return;
  destroyed_ = true;
  if (ready_) {
    target_.release();
    if (vao_) {
      glDeleteVertexArrays(1, &vao_);
      vao_ = 0;
    }
    program_.release();
  }
  ready_ = false;
  surface_ = nullptr;
}

} // namespace qc
