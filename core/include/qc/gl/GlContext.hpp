#pragma once
#include <cstdint>
#include <vector>

namespace qc {

// The drawing surface a Renderer targets. width()/height() are the canvas
// pixel size the renderer reads at the start of every frame.
class GlContext {
public:
  virtual ~GlContext() = default;

  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  // Change the canvas pixel size. The context stays current.
  virtual bool resize(int width, int height) = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Read back RGBA pixels from the default framebuffer (bottom row first).
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace qc
