#pragma once
#include "cm/annotation/Annotation.hpp"
#include "cm/annotation/Color.hpp"
#include "cm/geometry/Geometry.hpp"

#include <string>

namespace cm {

struct StrokeStyle {
  Color color;
  float width{1.0f};
  LineStyle dash{LineStyle::Solid};
};

inline StrokeStyle stroke(const Color& color, float width, LineStyle dash = LineStyle::Solid) {
  StrokeStyle s;
  s.color = color;
  s.width = width;
  s.dash = dash;
  return s;
}

// 2D target layered above the host chart. Pixel coordinates, origin top-left.
// setAlpha() multiplies every following operation's colour alpha.
class PaintSurface {
public:
  virtual ~PaintSurface() = default;

  virtual double width() const = 0;
  virtual double height() const = 0;

  virtual void clear() = 0;
  virtual void setAlpha(float alpha) = 0;

  virtual void strokeLine(const PixelPoint& a, const PixelPoint& b, const StrokeStyle& style) = 0;
  virtual void strokeRect(const PixelBox& box, const StrokeStyle& style) = 0;
  virtual void fillRect(const PixelBox& box, const Color& color) = 0;
  virtual void fillTriangle(const PixelPoint& a, const PixelPoint& b, const PixelPoint& c,
                            const Color& color) = 0;
  // (x, y) is the left end of the text baseline.
  virtual void fillText(const std::string& text, double x, double y, float fontSize,
                        const Color& color) = 0;
  virtual double measureText(const std::string& text, float fontSize) const = 0;
};

} // namespace cm
