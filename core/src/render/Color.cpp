#include "qc/render/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace qc {

struct NamedColor {
  const char* name;
  unsigned rgb;
};

static const NamedColor kNamedColors[] = {
  {"black", 0x000000},       {"white", 0xffffff},        {"red", 0xff0000},
  {"lime", 0x00ff00},        {"blue", 0x0000ff},         {"yellow", 0xffff00},
  {"cyan", 0x00ffff},        {"aqua", 0x00ffff},         {"magenta", 0xff00ff},
  {"fuchsia", 0xff00ff},     {"silver", 0xc0c0c0},       {"gray", 0x808080},
  {"grey", 0x808080},        {"maroon", 0x800000},       {"olive", 0x808000},
  {"green", 0x008000},       {"purple", 0x800080},       {"teal", 0x008080},
  {"navy", 0x000080},        {"orange", 0xffa500},       {"pink", 0xffc0cb},
  {"brown", 0xa52a2a},       {"gold", 0xffd700},         {"indigo", 0x4b0082},
  {"violet", 0xee82ee},      {"coral", 0xff7f50},        {"salmon", 0xfa8072},
  {"tomato", 0xff6347},      {"crimson", 0xdc143c},      {"orchid", 0xda70d6},
  {"plum", 0xdda0dd},        {"khaki", 0xf0e68c},        {"beige", 0xf5f5dc},
  {"ivory", 0xfffff0},       {"lavender", 0xe6e6fa},     {"turquoise", 0x40e0d0},
  {"tan", 0xd2b48c},         {"chocolate", 0xd2691e},    {"sienna", 0xa0522d},
  {"steelblue", 0x4682b4},   {"skyblue", 0x87ceeb},      {"slategray", 0x708090},
  {"slategrey", 0x708090},   {"darkgray", 0xa9a9a9},     {"darkgrey", 0xa9a9a9},
  {"lightgray", 0xd3d3d3},   {"lightgrey", 0xd3d3d3},    {"dimgray", 0x696969},
  {"dimgrey", 0x696969},     {"gainsboro", 0xdcdcdc},    {"whitesmoke", 0xf5f5f5},
  {"darkblue", 0x00008b},    {"darkred", 0x8b0000},      {"darkgreen", 0x006400},
  {"darkorange", 0xff8c00},  {"darkviolet", 0x9400d3},   {"darkcyan", 0x008b8b},
  {"lightblue", 0xadd8e6},   {"lightgreen", 0x90ee90},   {"lightpink", 0xffb6c1},
  {"royalblue", 0x4169e1},   {"dodgerblue", 0x1e90ff},   {"deepskyblue", 0x00bfff},
  {"seagreen", 0x2e8b57},    {"forestgreen", 0x228b22},  {"limegreen", 0x32cd32},
  {"firebrick", 0xb22222},   {"goldenrod", 0xdaa520},    {"hotpink", 0xff69b4},
  {"deeppink", 0xff1493},    {"midnightblue", 0x191970}, {"rebeccapurple", 0x663399},
};

static std::string lowerTrim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  std::string out = s.substr(b, e - b);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

static float clamp01(float v) {
  return std::min(1.0f, std::max(0.0f, v));
}

static Rgba fromRgb24(unsigned rgb) {
  return Rgba{static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
              static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
              static_cast<float>(rgb & 0xFF) / 255.0f,
              1.0f};
}

// `hex` excludes the leading '#'.
static bool parseHex(const std::string& hex, Rgba& out) {
  const std::size_t n = hex.size();
  if (n != 3 && n != 4 && n != 6 && n != 8) return false;

  int digits[8] = {0};
  for (std::size_t i = 0; i < n; i++) {
    digits[i] = hexDigit(hex[i]);
    if (digits[i] < 0) return false;
  }

  float ch[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  if (n == 3 || n == 4) {
    for (std::size_t i = 0; i < n; i++) {
      ch[i] = static_cast<float>(digits[i] * 17) / 255.0f;
    }
  } else {
    for (std::size_t i = 0; i < n / 2; i++) {
      ch[i] = static_cast<float>(digits[2 * i] * 16 + digits[2 * i + 1]) / 255.0f;
    }
  }
  out = Rgba{ch[0], ch[1], ch[2], ch[3]};
  return true;
}

struct CssNumber {
  double value{0};
  bool percent{false};
};

static bool parseCssNumber(const std::string& tok, CssNumber& out) {
  if (tok.empty()) return false;
  std::string t = tok;
  bool percent = false;
  if (t.back() == '%') {
    percent = true;
    t.pop_back();
  } else if (t.size() > 3 && t.compare(t.size() - 3, 3, "deg") == 0) {
    t.resize(t.size() - 3);
  }
  if (t.empty()) return false;

  char* end = nullptr;
  double v = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  out.value = v;
  out.percent = percent;
  return true;
}

// Splits the argument list of rgb()/hsl(). Commas, slashes and whitespace
// are all treated as separators.
static bool functionArgs(const std::string& s, std::size_t open,
                         std::vector<CssNumber>& args) {
  std::size_t close = s.find(')', open);
  if (close == std::string::npos || close != s.size() - 1) return false;

  std::string inner = s.substr(open + 1, close - open - 1);
  for (auto& c : inner) {
    if (c == ',' || c == '/') c = ' ';
  }

  std::size_t i = 0;
  while (i < inner.size()) {
    while (i < inner.size() && std::isspace(static_cast<unsigned char>(inner[i]))) i++;
    if (i >= inner.size()) break;
    std::size_t j = i;
    while (j < inner.size() && !std::isspace(static_cast<unsigned char>(inner[j]))) j++;
    CssNumber num;
    if (!parseCssNumber(inner.substr(i, j - i), num)) return false;
    args.push_back(num);
    i = j;
  }
  return args.size() == 3 || args.size() == 4;
}

static float alphaOf(const std::vector<CssNumber>& args) {
  if (args.size() < 4) return 1.0f;
  const auto& a = args[3];
  return clamp01(static_cast<float>(a.percent ? a.value / 100.0 : a.value));
}

static float hueToRgb(float p, float q, float t) {
  if (t < 0.0f) t += 1.0f;
  if (t > 1.0f) t -= 1.0f;
  if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
  if (t < 0.5f) return q;
  if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
  return p;
}

static Rgba hslToRgba(double hDeg, double sPct, double lPct, float alpha) {
  double h = std::fmod(hDeg, 360.0);
  if (h < 0.0) h += 360.0;
  float hf = static_cast<float>(h / 360.0);
  float s = clamp01(static_cast<float>(sPct / 100.0));
  float l = clamp01(static_cast<float>(lPct / 100.0));

  if (s <= 0.0f) return Rgba{l, l, l, alpha};

  float q = (l < 0.5f) ? l * (1.0f + s) : l + s - l * s;
  float p = 2.0f * l - q;
  return Rgba{hueToRgb(p, q, hf + 1.0f / 3.0f),
              hueToRgb(p, q, hf),
              hueToRgb(p, q, hf - 1.0f / 3.0f),
              alpha};
}

bool tryParseColor(const std::string& css, Rgba& out) {
  // Fast paths for the two colors every chart background uses.
  if (css == "#ffffff" || css == "#fff" || css == "#FFFFFF" || css == "#FFF") {
    out = Rgba{1.0f, 1.0f, 1.0f, 1.0f};
    return true;
  }
  if (css == "#000000" || css == "#000") {
    out = Rgba{0.0f, 0.0f, 0.0f, 1.0f};
    return true;
  }

  const std::string s = lowerTrim(css);
  if (s.empty()) return false;

  if (s[0] == '#') return parseHex(s.substr(1), out);

  if (s == "transparent") {
    out = Rgba{0.0f, 0.0f, 0.0f, 0.0f};
    return true;
  }

  std::size_t open = s.find('(');
  if (open != std::string::npos) {
    const std::string fn = s.substr(0, open);
    std::vector<CssNumber> args;
    if (!functionArgs(s, open, args)) return false;

    if (fn == "rgb" || fn == "rgba") {
      float ch[3];
      for (int i = 0; i < 3; i++) {
        const auto& a = args[static_cast<std::size_t>(i)];
        ch[i] = clamp01(static_cast<float>(a.percent ? a.value / 100.0 : a.value / 255.0));
      }
      out = Rgba{ch[0], ch[1], ch[2], alphaOf(args)};
      return true;
    }
    if (fn == "hsl" || fn == "hsla") {
      out = hslToRgba(args[0].value, args[1].value, args[2].value, alphaOf(args));
      return true;
    }
    return false;
  }

  for (const auto& nc : kNamedColors) {
    if (s == nc.name) {
      out = fromRgb24(nc.rgb);
      return true;
    }
  }
  return false;
}

Rgba parseColor(const std::string& css) {
  Rgba c = kFallbackGray;
  if (!tryParseColor(css, c)) return kFallbackGray;
  return c;
}

std::string scaleAlpha(const std::string& css, double alphaScale) {
  Rgba c = parseColor(css);
  const float k = clamp01(static_cast<float>(alphaScale));
  char buf[64];
  std::snprintf(buf, sizeof(buf), "rgba(%d,%d,%d,%.4g)",
                static_cast<int>(std::lround(c.r * 255.0f)),
                static_cast<int>(std::lround(c.g * 255.0f)),
                static_cast<int>(std::lround(c.b * 255.0f)),
                static_cast<double>(c.a * k));
  return buf;
}

const Rgba& ColorCache::resolve(const std::string& css) {
  auto it = cache_.find(css);
  if (it != cache_.end()) return it->second;
  if (cache_.size() >= capacity_) cache_.clear();
  return cache_.emplace(css, parseColor(css)).first->second;
}

} // namespace qc
