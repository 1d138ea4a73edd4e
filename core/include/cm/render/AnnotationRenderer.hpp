#pragma once
#include "cm/annotation/Annotation.hpp"
#include "cm/geometry/CoordinateMapper.hpp"
#include "cm/interaction/InteractionController.hpp"
#include "cm/render/OverlayTheme.hpp"
#include "cm/render/PaintSurface.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cm {

struct RenderStats {
  std::size_t drawn{0};
  std::size_t hidden{0};   // visible == false
  std::size_t skipped{0};  // points did not resolve at the current scale
};

// Paints the annotation overlay of one surface. Pure function of its inputs:
// reads the annotations, selection and preview, writes only to the surface.
class AnnotationRenderer {
public:
  explicit AnnotationRenderer(const OverlayTheme& theme = darkOverlayTheme()) : theme_(theme) {}

  void setTheme(const OverlayTheme& theme) { theme_ = theme; }
  const OverlayTheme& theme() const { return theme_; }

  // Clears the surface, then paints every visible annotation in creation
  // order, handles for `selectedId`, and the in-progress preview if any.
  RenderStats render(PaintSurface& surface, const CoordinateMapper& mapper,
                     const std::vector<Annotation>& annotations,
                     const AnnotationId& selectedId,
                     const InteractionPreview* preview) const;

  // False (and nothing painted) when a required point does not resolve.
  bool renderAnnotation(PaintSurface& surface, const CoordinateMapper& mapper,
                        const Annotation& a, bool selected) const;

  void renderPreview(PaintSurface& surface, const CoordinateMapper& mapper,
                     const InteractionPreview& preview) const;

private:
  bool renderHorizontalLine(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;
  bool renderVerticalLine(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;
  bool renderTrendline(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;
  bool renderRectangle(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;
  bool renderFibonacci(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;
  bool renderArrow(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;
  bool renderText(PaintSurface& s, const CoordinateMapper& m, const Annotation& a, bool selected) const;

  void drawLabel(PaintSurface& s, const std::string& text, double x, double y, const Color& color) const;
  void drawHandles(PaintSurface& s, const std::vector<PixelPoint>& points) const;

  OverlayTheme theme_;
};

// Thousands separators, at most `maxDecimals` decimals, trailing zeros
// dropped: 55800 -> "55,800", 101.250 -> "101.25".
std::string formatPrice(double value, int maxDecimals);

// "61.8%" or "61.8% (55,120)".
std::string formatFibLabel(double level, double price, bool showPrice);

} // namespace cm
