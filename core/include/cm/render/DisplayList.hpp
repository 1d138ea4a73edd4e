#pragma once
#include "cm/render/PaintSurface.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cm {

enum class PaintOpKind : std::uint8_t {
  Clear = 0, StrokeLine, StrokeRect, FillRect, FillTriangle, FillText
};

const char* paintOpKindName(PaintOpKind kind);

struct PaintOp {
  PaintOpKind kind{PaintOpKind::Clear};
  PixelPoint p0, p1, p2;   // line: p0-p1, rect: p0 = min, p1 = max, triangle: all three
  Color color;             // alpha already multiplied by the surface alpha
  float width{0};
  LineStyle dash{LineStyle::Solid};
  std::string text;
  float fontSize{0};
};

// PaintSurface that records operations. Used headless, in tests, and to
// ship a frame to a front end as JSON. Text width is estimated as
// 0.6 * fontSize per character.
class DisplayList : public PaintSurface {
public:
  DisplayList(double width = 800, double height = 600);

  void resize(double width, double height);

  double width() const override { return width_; }
  double height() const override { return height_; }

  void clear() override;
  void setAlpha(float alpha) override { alpha_ = alpha; }
  float alpha() const { return alpha_; }

  void strokeLine(const PixelPoint& a, const PixelPoint& b, const StrokeStyle& style) override;
  void strokeRect(const PixelBox& box, const StrokeStyle& style) override;
  void fillRect(const PixelBox& box, const Color& color) override;
  void fillTriangle(const PixelPoint& a, const PixelPoint& b, const PixelPoint& c,
                    const Color& color) override;
  void fillText(const std::string& text, double x, double y, float fontSize,
                const Color& color) override;
  double measureText(const std::string& text, float fontSize) const override;

  const std::vector<PaintOp>& ops() const { return ops_; }
  std::size_t count(PaintOpKind kind) const;
  // First FillText op whose text contains `needle`, or nullptr.
  const PaintOp* findText(const std::string& needle) const;

  // {"width":..,"height":..,"ops":[{"op":"strokeLine","x0":..,...}, ...]}
  std::string toJSON() const;

private:
  Color faded(const Color& c) const;

  double width_;
  double height_;
  float alpha_{1.0f};
  std::vector<PaintOp> ops_;
};

} // namespace cm
