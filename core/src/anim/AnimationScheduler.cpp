#include "qc/anim/AnimationScheduler.hpp"
#include "qc/anim/Easing.hpp"
#include <algorithm>
#include <cmath>

namespace qc {

static constexpr double kSnapEpsilon = 1e-3;

static bool isHidden(const HiddenSetPtr& hidden, std::size_t i) {
  return hidden && hidden->count(i) != 0;
}

AnimationScheduler::AnimationScheduler(FrameClock& clock, const AnimationConfig& config)
  : clock_(clock), config_(config),
    lastEnabled_(config.enabled),
    enterProgress_(config.enabled ? 0.0 : 1.0) {}

AnimationScheduler::~AnimationScheduler() {
  dispose();
}

double AnimationScheduler::normalizedTime(double start, double now) const {
  if (config_.durationMs <= 0.0) return 1.0;
  return std::max(0.0, (now - start) / config_.durationMs);
}

void AnimationScheduler::resizeVisibility(std::size_t seriesCount,
                                          const HiddenSetPtr& hidden) {
  if (visCurrent_.size() == seriesCount) return;

  std::vector<double> next(seriesCount);
  for (std::size_t i = 0; i < seriesCount; i++) {
    if (i < visCurrent_.size()) next[i] = visCurrent_[i];
    else next[i] = isHidden(hidden, i) ? 0.0 : 1.0;
  }
  visCurrent_ = std::move(next);
  visFrom_ = visCurrent_;
  visTo_ = visCurrent_;
}

void AnimationScheduler::update(std::size_t seriesCount, HiddenSetPtr hidden, bool ready) {
  if (disposed_) return;

  resizeVisibility(seriesCount, hidden);

  // Entrance: runs once, the first time the chart is ready with animation
  // enabled. Any later trigger pins progress at 1.
  bool enterTrigger = ready && (!lastReady_ || config_.enabled != lastEnabled_);
  lastReady_ = ready;
  lastEnabled_ = config_.enabled;
  if (enterTrigger) {
    if (!hasEntered_ && config_.enabled) {
      hasEntered_ = true;
      enterStart_ = clock_.now();
      enterProgress_ = 0.0;
      startLoop();
    } else {
      enterProgress_ = 1.0;
    }
  }

  if (!ready) return;

  // The first set seen is the baseline, not a toggle.
  if (!hiddenObserved_) {
    hiddenObserved_ = true;
    lastHidden_ = std::move(hidden);
    return;
  }
  if (hidden == lastHidden_) return;
  lastHidden_ = hidden;

  visFrom_ = visCurrent_;
  for (std::size_t i = 0; i < visTo_.size(); i++) {
    visTo_[i] = isHidden(hidden, i) ? 0.0 : 1.0;
  }
  visStart_ = clock_.now();

  if (config_.enabled) {
    startLoop();
  } else {
    visCurrent_ = visTo_;
    render();
  }
}

void AnimationScheduler::startLoop() {
  if (running_ || disposed_) return;
  running_ = true;
  pending_ = clock_.requestFrame([this] { tick(); });
}

void AnimationScheduler::tick() {
  pending_ = 0;
  if (disposed_) return;

  const double now = clock_.now();
  bool allDone = true;

  if (enterProgress_ < 1.0) {
    enterProgress_ = std::min(1.0, easeOutCubic(normalizedTime(enterStart_, now)));
    if (enterProgress_ < 1.0) allDone = false;
  }

  const double visT = std::min(1.0, easeOutCubic(normalizedTime(visStart_, now)));
  for (std::size_t i = 0; i < visCurrent_.size(); i++) {
    const double from = visFrom_[i];
    const double to = visTo_[i];
    if (std::fabs(from - to) < kSnapEpsilon) {
      visCurrent_[i] = to;
      continue;
    }
    const double val = from + (to - from) * visT;
    if (std::fabs(val - to) < kSnapEpsilon) {
      visCurrent_[i] = to;
    } else {
      visCurrent_[i] = val;
      allDone = false;
    }
  }

  render();

  // The render function may have disposed the scheduler.
  if (disposed_) return;
  if (allDone) {
    running_ = false;
    return;
  }
  pending_ = clock_.requestFrame([this] { tick(); });
}

void AnimationScheduler::render() {
  renderCount_++;
  if (renderFn_) renderFn_(enterProgress_, visCurrent_);
}

void AnimationScheduler::drawOnce() {
  if (disposed_) return;
  render();
}

void AnimationScheduler::dispose() {
  if (disposed_) return;
  disposed_ = true;
  if (pending_) {
    clock_.cancelFrame(pending_);
    pending_ = 0;
  }
  running_ = false;
}

} // namespace qc
