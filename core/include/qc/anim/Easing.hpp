#pragma once

namespace qc {

// Fast start, gentle deceleration. t is clamped to [0, 1].
inline double easeOutCubic(double t) {
  if (t <= 0.0) return 0.0;
  if (t >= 1.0) return 1.0;
  double u = 1.0 - t;
  return 1.0 - u * u * u;
}

} // namespace qc
