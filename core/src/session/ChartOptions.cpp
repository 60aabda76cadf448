#include "qc/session/ChartOptions.hpp"
#include "qc/render/Color.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdio>

namespace qc {

Rgba ChartOptions::backgroundRgba() const {
  return parseColor(background);
}

static bool fail(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

static bool readColor(const rapidjson::Value& v, const char* field,
                      std::string& out, std::string* err) {
  if (!v.IsString()) return fail(err, std::string(field) + ": expected a color string");
  Rgba parsed;
  if (!tryParseColor(v.GetString(), parsed)) {
    return fail(err, std::string(field) + ": unrecognized color '" + v.GetString() + "'");
  }
  out = v.GetString();
  return true;
}

static bool readAtLeast(const rapidjson::Value& v, const char* field, double minValue,
                        double& out, std::string* err) {
  if (!v.IsNumber() || v.GetDouble() < minValue) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", minValue);
    return fail(err, std::string(field) + ": expected a number >= " + buf);
  }
  out = v.GetDouble();
  return true;
}

bool parseChartOptions(const std::string& json, ChartOptions& out, std::string* err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "JSON parse error at offset %u: %s",
                  static_cast<unsigned>(doc.GetErrorOffset()),
                  rapidjson::GetParseError_En(doc.GetParseError()));
    return fail(err, buf);
  }
  if (!doc.IsObject()) return fail(err, "options must be a JSON object");

  ChartOptions opts = out;

  // Animation
  if (doc.HasMember("animation")) {
    const auto& a = doc["animation"];
    if (!a.IsObject()) return fail(err, "animation: expected an object");
    if (a.HasMember("enabled")) {
      if (!a["enabled"].IsBool()) return fail(err, "animation.enabled: expected a boolean");
      opts.animation.enabled = a["enabled"].GetBool();
    }
    if (a.HasMember("duration")) {
      if (!a["duration"].IsNumber()) return fail(err, "animation.duration: expected a number");
      opts.animation.durationMs = a["duration"].GetDouble();
    }
  }

  if (doc.HasMember("background")) {
    if (!readColor(doc["background"], "background", opts.background, err)) return false;
  }

  // Zoom
  if (doc.HasMember("zoom")) {
    const auto& z = doc["zoom"];
    if (!z.IsObject()) return fail(err, "zoom: expected an object");
    if (z.HasMember("directionLockPx") &&
        !readAtLeast(z["directionLockPx"], "zoom.directionLockPx", 0.0,
                     opts.zoom.directionLockPx, err)) {
      return false;
    }
    if (z.HasMember("minSelectionPx") &&
        !readAtLeast(z["minSelectionPx"], "zoom.minSelectionPx", 1.0,
                     opts.zoom.minSelectionPx, err)) {
      return false;
    }
    if (z.HasMember("overlayColor") &&
        !readColor(z["overlayColor"], "zoom.overlayColor", opts.zoom.overlayColor, err)) {
      return false;
    }
  }

  // Padding: [top, right, bottom, left]
  if (doc.HasMember("padding")) {
    const auto& p = doc["padding"];
    if (!p.IsArray() || p.Size() != 4) return fail(err, "padding: expected [top, right, bottom, left]");
    for (rapidjson::SizeType i = 0; i < 4; i++) {
      if (!p[i].IsNumber()) return fail(err, "padding: entries must be numbers");
      opts.padding[i] = p[i].GetDouble();
    }
  }

  if (doc.HasMember("tickCount")) {
    const auto& t = doc["tickCount"];
    if (!t.IsInt() || t.GetInt() < 1) return fail(err, "tickCount: expected a positive integer");
    opts.tickCount = t.GetInt();
  }

  // Legend
  if (doc.HasMember("legend")) {
    const auto& l = doc["legend"];
    if (!l.IsObject()) return fail(err, "legend: expected an object");
    if (l.HasMember("visible")) {
      if (!l["visible"].IsBool()) return fail(err, "legend.visible: expected a boolean");
      opts.legend.visible = l["visible"].GetBool();
    }
    if (l.HasMember("position")) {
      const auto& pos = l["position"];
      if (pos.IsObject()) {
        // Explicit coordinates: the legend floats over the chart.
        opts.legend.position = LegendPosition::Float;
      } else if (pos.IsString() && std::string(pos.GetString()) == "top") {
        opts.legend.position = LegendPosition::Top;
      } else if (pos.IsString() && std::string(pos.GetString()) == "bottom") {
        opts.legend.position = LegendPosition::Bottom;
      } else {
        return fail(err, "legend.position: expected \"top\", \"bottom\" or an object");
      }
    }
  }

  // Axis titles only reserve layout space here.
  if (doc.HasMember("axes")) {
    const auto& ax = doc["axes"];
    if (!ax.IsObject()) return fail(err, "axes: expected an object");
    if (ax.HasMember("xTitle") && ax["xTitle"].IsString())
      opts.hasXTitle = ax["xTitle"].GetStringLength() > 0;
    if (ax.HasMember("yTitle") && ax["yTitle"].IsString())
      opts.hasYTitle = ax["yTitle"].GetStringLength() > 0;
  }

  out = opts;
  return true;
}

} // namespace qc
