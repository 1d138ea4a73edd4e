#pragma once
#include <string>

namespace cm {

// RGBA, components in [0,1].
struct Color {
  float r{1.0f}, g{1.0f}, b{1.0f}, a{1.0f};

  bool operator==(const Color& o) const {
    return r == o.r && g == o.g && b == o.b && a == o.a;
  }
  bool operator!=(const Color& o) const { return !(*this == o); }
};

inline Color rgba(float r, float g, float b, float a = 1.0f) {
  return Color{r, g, b, a};
}

// Parses "#rrggbb" or "#rrggbbaa". Returns false on malformed input.
bool parseHexColor(const std::string& hex, Color& out);

// "#rrggbb", or "#rrggbbaa" when alpha is below 1.
std::string toHexColor(const Color& c);

// Same colour with alpha multiplied by `opacity`.
Color withOpacity(const Color& c, float opacity);

} // namespace cm
