#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace qc {

using FrameRequestId = std::uint64_t;   // 0 is never issued
using FrameCallback = std::function<void()>;

// Source of time and of "next display frame" callbacks.
class FrameClock {
public:
  virtual ~FrameClock() = default;

  // Milliseconds, monotonic.
  virtual double now() const = 0;

  // Run `cb` once at the next frame.
  virtual FrameRequestId requestFrame(FrameCallback cb) = 0;

  // Drop a pending request. Unknown or already fired ids are ignored.
  virtual void cancelFrame(FrameRequestId id) = 0;
};

// Shared request queue. Callbacks requested while frames are being run wait
// for the next run.
class QueuedFrameClock : public FrameClock {
public:
  FrameRequestId requestFrame(FrameCallback cb) override;
  void cancelFrame(FrameRequestId id) override;

  std::size_t pending() const;

protected:
  // Fire everything queued before this call. Returns the number fired.
  std::size_t runQueued();

private:
  std::vector<std::pair<FrameRequestId, FrameCallback>> queue_;
  std::vector<std::pair<FrameRequestId, FrameCallback>> running_;
  FrameRequestId nextId_{1};
};

// Time only moves when told to. Used by tests and offline rendering.
class ManualFrameClock : public QueuedFrameClock {
public:
  double now() const override { return nowMs_; }

  void setNow(double ms) { nowMs_ = ms; }

  // Move time forward by `ms`, then fire the queued frame callbacks.
  std::size_t advance(double ms);

private:
  double nowMs_{0.0};
};

// Wall-clock time; the host loop calls pump() once per iteration.
class SteadyFrameClock : public QueuedFrameClock {
public:
  SteadyFrameClock();

  double now() const override;

  std::size_t pump() { return runQueued(); }

private:
  std::chrono::steady_clock::time_point origin_;
};

} // namespace qc
