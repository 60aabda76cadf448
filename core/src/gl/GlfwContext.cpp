#ifdef QC_HAS_GLFW

#include "qc/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cmath>
#include <cstdio>

namespace qc {

static constexpr double kDoubleClickSeconds = 0.4;
static constexpr double kDoubleClickSlopPx = 4.0;

GlfwContext::GlfwContext() = default;

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "[GlfwContext] glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, "QuickCharts", nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "[GlfwContext] glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "[GlfwContext] gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetCursorEnterCallback(window_, cursorEnterCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);

  double wx = 0, wy = 0;
  glfwGetCursorPos(window_, &wx, &wy);
  toCanvas(wx, wy, cursorX_, cursorY_);

  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

bool GlfwContext::resize(int width, int height) {
  if (!window_ || width <= 0 || height <= 0) return false;
  glfwSetWindowSize(window_, width, height);
  glfwGetFramebufferSize(window_, &width_, &height_);
  return true;
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

InputState GlfwContext::pollInput() {
  glfwPollEvents();

  InputState state = std::move(pending_);
  pending_ = InputState{};
  state.shouldClose = shouldClose();
  return state;
}

void GlfwContext::toCanvas(double wx, double wy, double& px, double& py) const {
  int winW = 0, winH = 0;
  if (window_) glfwGetWindowSize(window_, &winW, &winH);
  double sx = (winW > 0) ? static_cast<double>(width_) / winW : 1.0;
  double sy = (winH > 0) ? static_cast<double>(height_) / winH : 1.0;
  px = wx * sx;
  py = wy * sy;
}

void GlfwContext::pushPointer(PointerEventType type, PointerButton button) {
  PointerEvent ev;
  ev.type = type;
  ev.button = button;
  ev.x = cursorX_;
  ev.y = cursorY_;
  pending_.pointerEvents.push_back(ev);
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->toCanvas(x, y, self->cursorX_, self->cursorY_);
  self->pushPointer(PointerEventType::Move, PointerButton::Primary);
}

void GlfwContext::cursorEnterCallback(GLFWwindow* w, int entered) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->cursorInside_ = (entered == GLFW_TRUE);
  if (!self->cursorInside_) {
    self->pushPointer(PointerEventType::Leave, PointerButton::Primary);
  }
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  PointerButton pb;
  if (button == GLFW_MOUSE_BUTTON_LEFT) pb = PointerButton::Primary;
  else if (button == GLFW_MOUSE_BUTTON_RIGHT) pb = PointerButton::Secondary;
  else if (button == GLFW_MOUSE_BUTTON_MIDDLE) pb = PointerButton::Middle;
  else return;

  if (action == GLFW_PRESS) {
    self->pushPointer(PointerEventType::Down, pb);
    if (pb == PointerButton::Secondary) {
      self->pushPointer(PointerEventType::ContextMenu, pb);
    }
    return;
  }

  if (action != GLFW_RELEASE) return;

  bool inside = self->cursorX_ >= 0 && self->cursorY_ >= 0 &&
                self->cursorX_ < self->width_ && self->cursorY_ < self->height_;
  self->pushPointer(inside ? PointerEventType::Up : PointerEventType::WindowUp, pb);

  // GLFW has no double-click event; synthesize one from two quick primary clicks.
  if (pb == PointerButton::Primary && inside) {
    double now = glfwGetTime();
    bool near = std::fabs(self->cursorX_ - self->lastClickX_) <= kDoubleClickSlopPx &&
                std::fabs(self->cursorY_ - self->lastClickY_) <= kDoubleClickSlopPx;
    if (self->lastClickTime_ >= 0.0 && now - self->lastClickTime_ <= kDoubleClickSeconds && near) {
      self->pushPointer(PointerEventType::DoubleClick, pb);
      self->lastClickTime_ = -1.0;
    } else {
      self->lastClickTime_ = now;
      self->lastClickX_ = self->cursorX_;
      self->lastClickY_ = self->cursorY_;
    }
  }
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || action != GLFW_PRESS) return;

  KeyCode code = KeyCode::None;
  if (key == GLFW_KEY_ESCAPE) code = KeyCode::Escape;
  else if (key == GLFW_KEY_R) code = KeyCode::R;
  else if (key >= GLFW_KEY_1 && key <= GLFW_KEY_9) {
    code = static_cast<KeyCode>(static_cast<int>(KeyCode::Num1) + (key - GLFW_KEY_1));
  }
  if (code != KeyCode::None) self->pending_.keys.push_back(code);
}

void GlfwContext::framebufferSizeCallback(GLFWwindow* w, int width, int height) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->width_ = width;
  self->height_ = height;
  self->pending_.resized = true;
}

} // namespace qc

#endif // QC_HAS_GLFW
