#include "cm/render/AnnotationRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cm {

namespace {

bool isEmphasisLevel(double level) {
  return std::fabs(level - 0.5) < 1e-9 || std::fabs(level - 0.618) < 1e-9;
}

PixelBox squareAround(const PixelPoint& p, double half) {
  return PixelBox{p.x - half, p.y - half, p.x + half, p.y + half};
}

} // namespace

std::string formatPrice(double value, int maxDecimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", std::max(0, maxDecimals), std::fabs(value));
  std::string s = buf;

  std::string intPart = s;
  std::string frac;
  auto dot = s.find('.');
  if (dot != std::string::npos) {
    intPart = s.substr(0, dot);
    frac = s.substr(dot + 1);
  }
  while (!frac.empty() && frac.back() == '0') frac.pop_back();

  std::string grouped;
  const std::size_t n = intPart.size();
  for (std::size_t i = 0; i < n; ++i) {
    grouped.push_back(intPart[i]);
    std::size_t rest = n - 1 - i;
    if (rest > 0 && rest % 3 == 0) grouped.push_back(',');
  }

  std::string out;
  if (value < 0 && (grouped != "0" || !frac.empty())) out = "-";
  out += grouped;
  if (!frac.empty()) out += "." + frac;
  return out;
}

std::string formatFibLabel(double level, double price, bool showPrice) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", level * 100.0);
  std::string label = buf;
  if (showPrice) label += " (" + formatPrice(price, 0) + ")";
  return label;
}

// -------------------- Frame --------------------

RenderStats AnnotationRenderer::render(PaintSurface& surface, const CoordinateMapper& mapper,
                                       const std::vector<Annotation>& annotations,
                                       const AnnotationId& selectedId,
                                       const InteractionPreview* preview) const {
  RenderStats stats;
  surface.clear();
  surface.setAlpha(1.0f);

  const Annotation* dragged = preview ? preview->dragged : nullptr;

  for (const auto& stored : annotations) {
    if (!stored.visible) {
      stats.hidden++;
      continue;
    }
    const Annotation& a = (dragged && dragged->id == stored.id) ? *dragged : stored;
    if (renderAnnotation(surface, mapper, a, a.id == selectedId)) {
      stats.drawn++;
    } else {
      stats.skipped++;
    }
  }

  if (preview) renderPreview(surface, mapper, *preview);
  return stats;
}

bool AnnotationRenderer::renderAnnotation(PaintSurface& surface, const CoordinateMapper& mapper,
                                          const Annotation& a, bool selected) const {
  switch (a.type) {
    case AnnotationType::HorizontalLine: return renderHorizontalLine(surface, mapper, a, selected);
    case AnnotationType::VerticalLine:   return renderVerticalLine(surface, mapper, a, selected);
    case AnnotationType::Trendline:      return renderTrendline(surface, mapper, a, selected);
    case AnnotationType::Rectangle:      return renderRectangle(surface, mapper, a, selected);
    case AnnotationType::Fibonacci:      return renderFibonacci(surface, mapper, a, selected);
    case AnnotationType::Arrow:          return renderArrow(surface, mapper, a, selected);
    case AnnotationType::Text:           return renderText(surface, mapper, a, selected);
  }
  return false;
}

// -------------------- Variants --------------------

bool AnnotationRenderer::renderHorizontalLine(PaintSurface& s, const CoordinateMapper& m,
                                              const Annotation& a, bool selected) const {
  double y;
  if (!m.priceToY(a.price, y)) return false;

  const double w = s.width();
  const double left = a.extendLeft ? 0.0 : theme_.lineInsetPx;
  const double right = a.extendRight ? w - theme_.priceScaleReservePx
                                     : w - theme_.shortLineReservePx;

  s.strokeLine({left, y}, {right, y}, stroke(a.color, a.thickness, a.lineStyle));

  if (!a.label.empty()) drawLabel(s, a.label, left + 4.0, y - 6.0, a.color);

  // Price tag at the right end
  std::string tag = formatPrice(a.price, 2);
  double tagW = s.measureText(tag, theme_.priceTagFontSize);
  s.fillText(tag, right - tagW - 4.0, y - 4.0, theme_.priceTagFontSize, a.color);

  if (selected) drawHandles(s, {{left, y}, {right, y}});
  return true;
}

bool AnnotationRenderer::renderVerticalLine(PaintSurface& s, const CoordinateMapper& m,
                                            const Annotation& a, bool selected) const {
  double x;
  if (!m.timeToX(a.time, x)) return false;

  const double bottom = s.height() - theme_.timeScaleReservePx;
  s.strokeLine({x, 0.0}, {x, bottom}, stroke(a.color, a.thickness, a.lineStyle));

  if (!a.label.empty()) drawLabel(s, a.label, x + 4.0, 16.0, a.color);
  if (selected) drawHandles(s, {{x, 10.0}, {x, bottom - 10.0}});
  return true;
}

bool AnnotationRenderer::renderTrendline(PaintSurface& s, const CoordinateMapper& m,
                                         const Annotation& a, bool selected) const {
  PixelPoint start, end;
  if (!m.domainToPixel(a.startPoint, start) || !m.domainToPixel(a.endPoint, end)) return false;

  PixelPoint p0, p1;
  extendSegment(start, end, 0.0, s.width() - theme_.priceScaleReservePx,
                a.extendLeft, a.extendRight, p0, p1);
  s.strokeLine(p0, p1, stroke(a.color, a.thickness, a.lineStyle));

  if (!a.label.empty()) {
    double midX = (start.x + end.x) / 2.0;
    double midY = (start.y + end.y) / 2.0;
    drawLabel(s, a.label, midX, midY - 10.0, a.color);
  }
  if (selected) drawHandles(s, {start, end});
  return true;
}

bool AnnotationRenderer::renderRectangle(PaintSurface& s, const CoordinateMapper& m,
                                         const Annotation& a, bool selected) const {
  PixelPoint start, end;
  if (!m.domainToPixel(a.startPoint, start) || !m.domainToPixel(a.endPoint, end)) return false;

  PixelBox box = boxFromCorners(start, end);
  s.fillRect(box, withOpacity(a.color, a.fillOpacity));
  s.strokeRect(box, stroke(a.color, a.thickness, a.borderStyle));

  if (!a.label.empty()) drawLabel(s, a.label, box.minX + 4.0, box.minY + 14.0, a.color);
  if (selected) {
    drawHandles(s, {{box.minX, box.minY}, {box.maxX, box.minY},
                    {box.minX, box.maxY}, {box.maxX, box.maxY}});
  }
  return true;
}

bool AnnotationRenderer::renderFibonacci(PaintSurface& s, const CoordinateMapper& m,
                                         const Annotation& a, bool selected) const {
  PixelPoint start, end;
  if (!m.domainToPixel(a.startPoint, start) || !m.domainToPixel(a.endPoint, end)) return false;

  std::vector<double> levels = a.levels;
  if (a.showExtensions) {
    levels.insert(levels.end(), a.extensionLevels.begin(), a.extensionLevels.end());
  }

  const double range = a.startPoint.price - a.endPoint.price;
  const double left = std::min(start.x, end.x);
  const double right = s.width() - theme_.priceScaleReservePx;

  for (double level : levels) {
    double price = a.endPoint.price + range * level;
    double y;
    if (!m.priceToY(price, y)) continue; // level off-scale; the rest still draw

    Color c = resolveLevelColor(a, level);
    float width = isEmphasisLevel(level) ? 2.0f : 1.0f;
    LineStyle dash = level > 1.0 ? LineStyle::Dashed : LineStyle::Solid;
    s.strokeLine({left, y}, {right, y}, stroke(c, width, dash));
    s.fillText(formatFibLabel(level, price, a.showPrices), left + 4.0, y - 3.0,
               theme_.fibLabelFontSize, c);
  }

  // Guide between the anchor points
  s.strokeLine(start, end, stroke(a.color, 1.0f, LineStyle::Dotted));

  if (selected) drawHandles(s, {start, end});
  return true;
}

bool AnnotationRenderer::renderArrow(PaintSurface& s, const CoordinateMapper& m,
                                     const Annotation& a, bool selected) const {
  PixelPoint pos;
  if (!m.domainToPixel(a.point, pos)) return false;

  const double size = arrowSizePx(a.size);
  const double half = size / 2.0;
  const bool up = a.direction == ArrowDirection::Up;

  if (up) {
    s.fillTriangle({pos.x, pos.y - half}, {pos.x - half, pos.y + half},
                   {pos.x + half, pos.y + half}, a.color);
  } else {
    s.fillTriangle({pos.x, pos.y + half}, {pos.x - half, pos.y - half},
                   {pos.x + half, pos.y - half}, a.color);
  }

  if (!a.label.empty()) {
    double labelY = up ? pos.y - half - 8.0 : pos.y + half + 14.0;
    drawLabel(s, a.label, pos.x - 10.0, labelY, a.color);
  }
  if (selected) {
    s.strokeRect(squareAround(pos, half + 2.0), stroke(theme_.selectionOutline, 2.0f));
  }
  return true;
}

bool AnnotationRenderer::renderText(PaintSurface& s, const CoordinateMapper& m,
                                    const Annotation& a, bool selected) const {
  PixelPoint pos;
  if (!m.domainToPixel(a.point, pos)) return false;

  const double pad = theme_.textPaddingPx;
  const double font = a.fontSize;
  const double textW = s.measureText(a.text, a.fontSize);

  PixelBox bg;
  bg.minX = pos.x - pad;
  bg.minY = pos.y - font - pad / 2.0;
  bg.maxX = bg.minX + textW + pad * 2.0;
  bg.maxY = bg.minY + font + pad * 2.0;

  s.fillRect(bg, withOpacity(a.backgroundColor, a.backgroundOpacity));
  s.fillText(a.text, pos.x, pos.y, a.fontSize, a.color);

  if (selected) s.strokeRect(inflateBox(bg, 1.0), stroke(theme_.selectionOutline, 1.0f));
  return true;
}

// -------------------- Preview --------------------

void AnnotationRenderer::renderPreview(PaintSurface& s, const CoordinateMapper& m,
                                       const InteractionPreview& preview) const {
  if (preview.phase != InteractionPhase::AwaitingSecondPoint &&
      preview.phase != InteractionPhase::TextEntryPending) {
    return;
  }

  // The anchor may have scrolled out of range; fall back to where it was clicked.
  PixelPoint anchor;
  if (!m.domainToPixel(preview.anchor, anchor)) {
    if (!preview.anchor.hasPixel) return;
    anchor = PixelPoint{preview.anchor.x, preview.anchor.y};
  }

  s.setAlpha(theme_.previewAlpha);
  const StrokeStyle style = stroke(theme_.previewColor, theme_.previewLineWidth, LineStyle::Dashed);

  if (preview.phase == InteractionPhase::TextEntryPending) {
    // Caret where the text will be placed
    s.strokeLine({anchor.x, anchor.y - 14.0}, {anchor.x, anchor.y}, stroke(theme_.previewColor, 1.0f));
    s.setAlpha(1.0f);
    return;
  }

  if (!preview.hasPointer) {
    s.setAlpha(1.0f);
    return;
  }
  const PixelPoint cur = preview.pointer;

  switch (preview.tool) {
    case ActiveTool::Trendline:
    case ActiveTool::Fibonacci:
      s.strokeLine(anchor, cur, style);
      break;
    case ActiveTool::Rectangle:
      s.strokeRect(boxFromCorners(anchor, cur), style);
      break;
    case ActiveTool::None:
    case ActiveTool::Select:
    case ActiveTool::Delete:
    case ActiveTool::HorizontalLine:
    case ActiveTool::VerticalLine:
    case ActiveTool::Arrow:
    case ActiveTool::Text:
      break;
  }
  s.setAlpha(1.0f);
}

// -------------------- Decorations --------------------

void AnnotationRenderer::drawLabel(PaintSurface& s, const std::string& text, double x, double y,
                                   const Color& color) const {
  const double pad = 3.0;
  const double textW = s.measureText(text, theme_.labelFontSize);
  s.fillRect(PixelBox{x - pad, y - 11.0, x + textW + pad, y + 3.0}, theme_.labelBackground);
  s.fillText(text, x, y, theme_.labelFontSize, color);
}

void AnnotationRenderer::drawHandles(PaintSurface& s, const std::vector<PixelPoint>& points) const {
  const double half = theme_.handleSizePx / 2.0;
  for (const auto& p : points) {
    PixelBox box = squareAround(p, half);
    s.fillRect(box, theme_.handleFill);
    s.strokeRect(box, stroke(theme_.handleStroke, 2.0f));
  }
}

} // namespace cm
