#include "cm/annotation/Color.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cm {

namespace {

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseByte(const std::string& s, std::size_t pos, float& out) {
  int hi = hexDigit(s[pos]);
  int lo = hexDigit(s[pos + 1]);
  if (hi < 0 || lo < 0) return false;
  out = static_cast<float>(hi * 16 + lo) / 255.0f;
  return true;
}

int toByte(float v) {
  float c = std::min(1.0f, std::max(0.0f, v));
  return static_cast<int>(std::lround(c * 255.0f));
}

} // namespace

bool parseHexColor(const std::string& hex, Color& out) {
  if (hex.size() != 7 && hex.size() != 9) return false;
  if (hex[0] != '#') return false;

  Color c;
  if (!parseByte(hex, 1, c.r)) return false;
  if (!parseByte(hex, 3, c.g)) return false;
  if (!parseByte(hex, 5, c.b)) return false;
  c.a = 1.0f;
  if (hex.size() == 9 && !parseByte(hex, 7, c.a)) return false;

  out = c;
  return true;
}

std::string toHexColor(const Color& c) {
  char buf[16];
  int a = toByte(c.a);
  if (a < 255) {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
                  toByte(c.r), toByte(c.g), toByte(c.b), a);
  } else {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                  toByte(c.r), toByte(c.g), toByte(c.b));
  }
  return buf;
}

Color withOpacity(const Color& c, float opacity) {
  Color out = c;
  out.a = c.a * std::min(1.0f, std::max(0.0f, opacity));
  return out;
}

} // namespace cm
