#pragma once
#include "qc/render/Primitives.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace qc {

// Neutral gray returned when a color string cannot be parsed.
inline constexpr Rgba kFallbackGray{0.5f, 0.5f, 0.5f, 1.0f};

// Parse a CSS color string: #rgb, #rgba, #rrggbb, #rrggbbaa, rgb()/rgba(),
// hsl()/hsla(), "transparent" and named colors. Returns false on failure
// and leaves `out` untouched.
bool tryParseColor(const std::string& css, Rgba& out);

// Same as tryParseColor but falls back to kFallbackGray.
Rgba parseColor(const std::string& css);

// `css` as an rgba() string with its alpha multiplied by `alphaScale`
// (clamped to [0, 1]). Unparseable input fades the fallback gray.
std::string scaleAlpha(const std::string& css, double alphaScale);

// Memoizes parsed colors. Chart palettes repeat the same few strings for
// thousands of primitives per frame. Animated colors (fades) produce a new
// string per frame, so the cache is dropped once it reaches `capacity`.
// A reference returned by resolve() is valid until the next resolve().
class ColorCache {
public:
  static constexpr std::size_t kDefaultCapacity = 256;

  explicit ColorCache(std::size_t capacity = kDefaultCapacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

  const Rgba& resolve(const std::string& css);
  void clear() { cache_.clear(); }
  std::size_t size() const { return cache_.size(); }
  std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  std::unordered_map<std::string, Rgba> cache_;
};

} // namespace qc
