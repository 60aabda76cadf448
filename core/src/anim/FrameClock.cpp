#include "qc/anim/FrameClock.hpp"

namespace qc {

FrameRequestId QueuedFrameClock::requestFrame(FrameCallback cb) {
  FrameRequestId id = nextId_++;
  queue_.emplace_back(id, std::move(cb));
  return id;
}

void QueuedFrameClock::cancelFrame(FrameRequestId id) {
  if (id == 0) return;
  for (auto& entry : queue_) {
    if (entry.first == id) entry.second = nullptr;
  }
  for (auto& entry : running_) {
    if (entry.first == id) entry.second = nullptr;
  }
}

std::size_t QueuedFrameClock::pending() const {
  std::size_t n = 0;
  for (const auto& entry : queue_) {
    if (entry.second) n++;
  }
  return n;
}

std::size_t QueuedFrameClock::runQueued() {
  running_.clear();
  running_.swap(queue_);

  std::size_t fired = 0;
  for (std::size_t i = 0; i < running_.size(); i++) {
    if (!running_[i].second) continue;
    FrameCallback cb = std::move(running_[i].second);
    running_[i].second = nullptr;
    cb();
    fired++;
  }
  running_.clear();
  return fired;
}

std::size_t ManualFrameClock::advance(double ms) {
  nowMs_ += ms;
  return runQueued();
}

SteadyFrameClock::SteadyFrameClock()
  : origin_(std::chrono::steady_clock::now()) {}

double SteadyFrameClock::now() const {
  auto d = std::chrono::steady_clock::now() - origin_;
  return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace qc
