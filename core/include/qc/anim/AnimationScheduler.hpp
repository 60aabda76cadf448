#pragma once
#include "qc/anim/FrameClock.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <vector>

namespace qc {

struct AnimationConfig {
  double durationMs{600.0};   // <= 0 means instantaneous
  bool enabled{true};
};

// Indices of hidden series. A toggle is signalled by handing the scheduler a
// new set object: changes are detected by pointer identity, not contents.
using HiddenSeriesSet = std::set<std::size_t>;
using HiddenSetPtr = std::shared_ptr<const HiddenSeriesSet>;

// enterProgress in [0, 1]; visibility has one entry per series in [0, 1].
using RenderFn = std::function<void(double enterProgress,
                                    const std::vector<double>& visibility)>;

// Two tracks on one frame loop:
//   entrance    0 -> 1 once, when the chart first becomes ready
//   visibility  per series, towards 0 (hidden) or 1 (shown)
// Every tick updates both tracks, then calls the render function once.
// The loop stops itself when all tracks have converged.
class AnimationScheduler {
public:
  explicit AnimationScheduler(FrameClock& clock, const AnimationConfig& config = {});
  ~AnimationScheduler();

  AnimationScheduler(const AnimationScheduler&) = delete;
  AnimationScheduler& operator=(const AnimationScheduler&) = delete;

  // The latest function is used by every later tick.
  void setRenderFn(RenderFn fn) { renderFn_ = std::move(fn); }

  // Takes effect at the next update()/tick.
  void setConfig(const AnimationConfig& config) { config_ = config; }
  const AnimationConfig& config() const { return config_; }

  // Call whenever the chart's inputs may have changed.
  void update(std::size_t seriesCount, HiddenSetPtr hidden, bool ready);

  // Render one frame with the current values. Does not start the loop.
  void drawOnce();

  // Cancel the pending frame. No callback runs afterwards.
  void dispose();

  bool running() const { return running_; }
  bool disposed() const { return disposed_; }
  double enterProgress() const { return enterProgress_; }
  const std::vector<double>& visibility() const { return visCurrent_; }

  // Render function invocations so far.
  std::uint64_t renderCount() const { return renderCount_; }

private:
  FrameClock& clock_;
  AnimationConfig config_;
  RenderFn renderFn_;

  bool running_{false};
  bool disposed_{false};
  FrameRequestId pending_{0};
  std::uint64_t renderCount_{0};

  // Entrance
  bool hasEntered_{false};
  bool lastReady_{false};
  bool lastEnabled_{true};
  double enterStart_{0.0};
  double enterProgress_{0.0};

  // Visibility
  std::vector<double> visCurrent_;
  std::vector<double> visFrom_;
  std::vector<double> visTo_;
  double visStart_{0.0};
  bool hiddenObserved_{false};
  HiddenSetPtr lastHidden_;

  void resizeVisibility(std::size_t seriesCount, const HiddenSetPtr& hidden);
  void startLoop();
  void tick();
  void render();
  double normalizedTime(double start, double now) const;
};

} // namespace qc
