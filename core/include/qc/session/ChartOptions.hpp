#pragma once
#include "qc/anim/AnimationScheduler.hpp"
#include "qc/layout/ChartLayout.hpp"
#include "qc/render/Primitives.hpp"
#include "qc/viewport/ZoomPanController.hpp"
#include <string>

namespace qc {

struct LegendOptions {
  bool visible{true};
  LegendPosition position{LegendPosition::Bottom};
  double height{28.0};
};

// Host-facing chart configuration. Every field has a default.
struct ChartOptions {
  AnimationConfig animation;
  std::string background{"#ffffff"};
  ZoomPanConfig zoom;
  Padding padding{kDefaultPadding};
  int tickCount{6};
  LegendOptions legend;
  bool hasXTitle{false};
  bool hasYTitle{false};

  Rgba backgroundRgba() const;
};

// Parse a JSON options object:
//   {"animation": {"enabled": true, "duration": 600},
//    "background": "#ffffff",
//    "zoom": {"directionLockPx": 5, "minSelectionPx": 8,
//             "overlayColor": "rgba(128,128,128,0.3)"},
//    "padding": [20, 20, 20, 20],
//    "tickCount": 6,
//    "legend": {"visible": true, "position": "bottom"},
//    "axes": {"xTitle": "...", "yTitle": "..."}}
// Absent fields keep the values already in `out`; unknown fields are
// ignored. On error returns false, leaves `out` untouched and describes the
// problem in `*err` when given.
bool parseChartOptions(const std::string& json, ChartOptions& out,
                       std::string* err = nullptr);

} // namespace qc
