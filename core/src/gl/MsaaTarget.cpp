#include "qc/gl/MsaaTarget.hpp"
#include <cstdio>

namespace qc {

MsaaTarget::~MsaaTarget() {
  release();
}

bool MsaaTarget::ensure(int width, int height, int samples) {
  if (fbo_ && width == width_ && height == height_ && samples == samples_) {
    return true;
  }
  release();
  if (width <= 0 || height <= 0) return false;

  glGenRenderbuffers(1, &colorRb_);
  glBindRenderbuffer(GL_RENDERBUFFER, colorRb_);
  glRenderbufferStorageMultisample(GL_RENDERBUFFER, samples, GL_RGBA8, width, height);
  glBindRenderbuffer(GL_RENDERBUFFER, 0);

  glGenFramebuffers(1, &fbo_);
  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0,
                            GL_RENDERBUFFER, colorRb_);
  GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);

  if (status != GL_FRAMEBUFFER_COMPLETE) {
    std::fprintf(stderr, "[MsaaTarget] framebuffer incomplete (0x%x) at %dx%d x%d\n",
                 status, width, height, samples);
    release();
    return false;
  }

  width_ = width;
  height_ = height;
  samples_ = samples;
  generation_++;
  return true;
}

void MsaaTarget::bindForDraw() const {
  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
}

void MsaaTarget::resolveTo(GLuint dstFbo) const {
  glBindFramebuffer(GL_READ_FRAMEBUFFER, fbo_);
  glBindFramebuffer(GL_DRAW_FRAMEBUFFER, dstFbo);
  glBlitFramebuffer(0, 0, width_, height_, 0, 0, width_, height_,
                    GL_COLOR_BUFFER_BIT, GL_NEAREST);
  glBindFramebuffer(GL_FRAMEBUFFER, dstFbo);
}

void MsaaTarget::release() {
  if (fbo_) {
    glDeleteFramebuffers(1, &fbo_);
    fbo_ = 0;
  }
  if (colorRb_) {
    glDeleteRenderbuffers(1, &colorRb_);
    colorRb_ = 0;
  }
  width_ = 0;
  height_ = 0;
  samples_ = 0;
}

} // namespace qc
