#include "qc/gl/OsMesaContext.hpp"
#include <cstdio>

namespace qc {

OsMesaContext::OsMesaContext() = default;

OsMesaContext::~OsMesaContext() {
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
  }
}

bool OsMesaContext::init(int width, int height) {
  static const int attribs[] = {
    OSMESA_FORMAT,            OSMESA_RGBA,
    OSMESA_DEPTH_BITS,        0,
    OSMESA_STENCIL_BITS,      0,
    OSMESA_PROFILE,           OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "[OsMesaContext] OSMesaCreateContextAttribs failed\n");
    return false;
  }

  if (!resize(width, height)) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  // Load GL function pointers via GLAD, using OSMesa's loader.
  int version = gladLoadGL((GLADloadfunc)OSMesaGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "[OsMesaContext] gladLoadGL failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  return true;
}

bool OsMesaContext::resize(int width, int height) {
  if (!ctx_ || width <= 0 || height <= 0) return false;

  // The bound buffer must outlive the binding: swap only once the new one
  // is current, so a failure leaves the old buffer and size in place.
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(width) * height * 4, 0);
  if (!OSMesaMakeCurrent(ctx_, buf.data(), GL_UNSIGNED_BYTE, width, height)) {
    std::fprintf(stderr, "[OsMesaContext] OSMesaMakeCurrent failed (%dx%d)\n",
                 width, height);
    if (!framebuf_.empty()) {
      OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width_, height_);
    }
    return false;
  }
  framebuf_.swap(buf);
  width_  = width;
  height_ = height;
  return true;
}

void OsMesaContext::swapBuffers() {
  glFinish();
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

} // namespace qc
