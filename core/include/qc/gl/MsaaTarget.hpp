#pragma once
#include <glad/gl.h>
#include <cstdint>

namespace qc {

// Multisampled offscreen color target. It always matches the canvas size:
// when the requested size changes the old framebuffer and renderbuffer are
// deleted and new ones created.
class MsaaTarget {
public:
  MsaaTarget() = default;
  ~MsaaTarget();

  MsaaTarget(const MsaaTarget&) = delete;
  MsaaTarget& operator=(const MsaaTarget&) = delete;

  // (Re)create for width x height if needed. Returns false if the
  // framebuffer is incomplete.
  bool ensure(int width, int height, int samples);

  void bindForDraw() const;

  // Blit the multisampled color buffer into `dstFbo` (0 = default).
  void resolveTo(GLuint dstFbo) const;

  void release();

  bool valid() const { return fbo_ != 0; }
  int width() const { return width_; }
  int height() const { return height_; }
  int samples() const { return samples_; }

  // Incremented every time the target is recreated.
  std::uint32_t generation() const { return generation_; }

private:
  GLuint fbo_{0};
  GLuint colorRb_{0};
  int width_{0};
  int height_{0};
  int samples_{0};
  std::uint32_t generation_{0};
};

} // namespace qc
