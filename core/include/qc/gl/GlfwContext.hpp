#pragma once
#include "qc/gl/GlContext.hpp"
#include "qc/viewport/InputState.hpp"

#ifdef QC_HAS_GLFW

#include <vector>

struct GLFWwindow;

namespace qc {

// Events gathered since the previous poll.
struct InputState {
  std::vector<PointerEvent> pointerEvents;
  std::vector<KeyCode> keys;
  bool resized{false};
  bool shouldClose{false};
};

class GlfwContext : public GlContext {
public:
  GlfwContext();
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;
  bool resize(int width, int height) override;

  // Framebuffer size in pixels (may differ from window size on HiDPI).
  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  InputState pollInput();
  bool shouldClose() const;

private:
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};

  // Accumulated by callbacks, drained by pollInput().
  InputState pending_;
  double cursorX_{0};
  double cursorY_{0};
  bool cursorInside_{false};
  double lastClickTime_{-1.0};
  double lastClickX_{0};
  double lastClickY_{0};

  void toCanvas(double wx, double wy, double& px, double& py) const;
  void pushPointer(PointerEventType type, PointerButton button);

  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void cursorEnterCallback(GLFWwindow* w, int entered);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void framebufferSizeCallback(GLFWwindow* w, int width, int height);
};

} // namespace qc

#endif // QC_HAS_GLFW
