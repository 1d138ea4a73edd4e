#include "cm/geometry/Geometry.hpp"

#include <algorithm>
#include <cmath>

namespace cm {

PixelBox boxFromCorners(const PixelPoint& a, const PixelPoint& b) {
  PixelBox box;
  box.minX = std::min(a.x, b.x);
  box.maxX = std::max(a.x, b.x);
  box.minY = std::min(a.y, b.y);
  box.maxY = std::max(a.y, b.y);
  return box;
}

PixelBox inflateBox(const PixelBox& box, double pad) {
  return PixelBox{box.minX - pad, box.minY - pad, box.maxX + pad, box.maxY + pad};
}

double distance(const PixelPoint& a, const PixelPoint& b) {
  return std::hypot(b.x - a.x, b.y - a.y);
}

double distancePointToSegment(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double lenSq = dx * dx + dy * dy;
  if (lenSq <= 0.0) return distance(p, a);

  double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
  t = std::max(0.0, std::min(1.0, t));
  PixelPoint proj{a.x + t * dx, a.y + t * dy};
  return distance(p, proj);
}

bool pointInBox(const PixelPoint& p, const PixelBox& box) {
  return p.x >= box.minX && p.x <= box.maxX &&
         p.y >= box.minY && p.y <= box.maxY;
}

void extendSegment(const PixelPoint& a, const PixelPoint& b,
                   double xLeft, double xRight,
                   bool extendLeft, bool extendRight,
                   PixelPoint& outA, PixelPoint& outB) {
  outA = a;
  outB = b;
  double dx = b.x - a.x;
  if (std::fabs(dx) < 1e-9) return;

  double slope = (b.y - a.y) / dx;
  double intercept = a.y - slope * a.x;

  PixelPoint& left = (a.x <= b.x) ? outA : outB;
  PixelPoint& right = (a.x <= b.x) ? outB : outA;
  if (extendLeft) {
    left.x = xLeft;
    left.y = slope * xLeft + intercept;
  }
  if (extendRight) {
    right.x = xRight;
    right.y = slope * xRight + intercept;
  }
}

std::size_t utf8Length(const std::string& text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

double approxTextWidth(const std::string& text, double fontSize) {
  return static_cast<double>(utf8Length(text)) * fontSize * 0.6;
}

} // namespace cm
