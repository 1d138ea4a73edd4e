#pragma once

#include <cstddef>
#include <string>

namespace cm {

// Pixel-space primitives. Origin top-left, y grows downwards.
struct PixelPoint {
  double x{0}, y{0};
};

struct PixelBox {
  double minX{0}, minY{0}, maxX{0}, maxY{0};

  double width() const { return maxX - minX; }
  double height() const { return maxY - minY; }
};

PixelBox boxFromCorners(const PixelPoint& a, const PixelPoint& b);
PixelBox inflateBox(const PixelBox& box, double pad);

double distance(const PixelPoint& a, const PixelPoint& b);

// Projection-and-clamp distance. A zero-length segment degrades to the
// point-to-point distance.
double distancePointToSegment(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b);

// Inclusive on all edges.
bool pointInBox(const PixelPoint& p, const PixelBox& box);

// Extends the line through a-b along its slope: the left end to x = xLeft,
// the right end to x = xRight. A vertical segment is returned unchanged.
void extendSegment(const PixelPoint& a, const PixelPoint& b,
                   double xLeft, double xRight,
                   bool extendLeft, bool extendRight,
                   PixelPoint& outA, PixelPoint& outB);

// Code points in a UTF-8 string (continuation bytes are not counted).
std::size_t utf8Length(const std::string& text);

// Width estimate without a font: 0.6 em per code point.
double approxTextWidth(const std::string& text, double fontSize);

} // namespace cm
