#include "qc/recipe/Recipe.hpp"

namespace qc {

const char* const kDefaultPalette[kPaletteSize] = {
  "#4e79a7", "#f28e2b", "#e15759", "#76b7b2", "#59a14f",
  "#edc948", "#b07aa1", "#ff9da7", "#9c755f", "#bab0ac",
};

std::string seriesColor(const std::string& color, std::size_t index) {
  if (!color.empty()) return color;
  return kDefaultPalette[index % kPaletteSize];
}

bool HitRegion::contains(double px, double py) const {
  if (shape == Shape::Circle) {
    double dx = px - cx;
    double dy = py - cy;
    return dx * dx + dy * dy <= r * r;
  }
  return px >= x && px <= x + w && py >= y && py <= y + h;
}

std::optional<HitRegion> hitTest(const std::vector<HitRegion>& regions, double x, double y) {
  for (const auto& region : regions) {
    if (region.contains(x, y)) return region;
  }
  return std::nullopt;
}

} // namespace qc
