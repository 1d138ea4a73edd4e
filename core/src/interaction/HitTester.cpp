#include "cm/interaction/HitTester.hpp"

#include <cmath>

namespace cm {

namespace {

bool resolveEndpoints(const Annotation& a, const CoordinateMapper& mapper,
                      PixelPoint& start, PixelPoint& end) {
  return mapper.domainToPixel(a.startPoint, start) &&
         mapper.domainToPixel(a.endPoint, end);
}

} // namespace

bool dragHandlePoints(const Annotation& a, const CoordinateMapper& mapper,
                      std::vector<HandlePoint>& out) {
  out.clear();
  switch (a.type) {
    case AnnotationType::Trendline:
    case AnnotationType::Fibonacci: {
      PixelPoint s, e;
      if (!resolveEndpoints(a, mapper, s, e)) return false;
      out.push_back({DragHandle::Start, s});
      out.push_back({DragHandle::End, e});
      return true;
    }

    case AnnotationType::Rectangle: {
      PixelPoint s, e;
      if (!resolveEndpoints(a, mapper, s, e)) return false;
      PixelBox box = boxFromCorners(s, e);
      out.push_back({DragHandle::TopLeft,     {box.minX, box.minY}});
      out.push_back({DragHandle::TopRight,    {box.maxX, box.minY}});
      out.push_back({DragHandle::BottomLeft,  {box.minX, box.maxY}});
      out.push_back({DragHandle::BottomRight, {box.maxX, box.maxY}});
      return true;
    }

    case AnnotationType::HorizontalLine:
    case AnnotationType::VerticalLine:
    case AnnotationType::Arrow:
    case AnnotationType::Text:
      return true;
  }
  return false;
}

AnnotationHit HitTester::hitTest(const std::vector<Annotation>& annotations,
                                 double x, double y) const {
  AnnotationHit result;
  for (std::size_t i = annotations.size(); i-- > 0;) {
    const Annotation& a = annotations[i];
    if (!a.visible) continue;
    if (hits(a, x, y)) {
      result.hit = true;
      result.id = a.id;
      result.index = i;
      return result;
    }
  }
  return result;
}

bool HitTester::hits(const Annotation& a, double x, double y) const {
  const double tol = config_.tolerancePx;
  const PixelPoint p{x, y};

  switch (a.type) {
    case AnnotationType::HorizontalLine: {
      double lineY;
      if (!mapper_.priceToY(a.price, lineY)) return false;
      return std::fabs(y - lineY) <= tol;
    }

    case AnnotationType::VerticalLine: {
      double lineX;
      if (!mapper_.timeToX(a.time, lineX)) return false;
      return std::fabs(x - lineX) <= tol;
    }

    case AnnotationType::Rectangle: {
      PixelPoint s, e;
      if (!resolveEndpoints(a, mapper_, s, e)) return false;
      return pointInBox(p, boxFromCorners(s, e));
    }

    case AnnotationType::Trendline:
    case AnnotationType::Fibonacci: {
      PixelPoint s, e;
      if (!resolveEndpoints(a, mapper_, s, e)) return false;
      return distancePointToSegment(p, s, e) <= tol;
    }

    case AnnotationType::Arrow: {
      PixelPoint pos;
      if (!mapper_.domainToPixel(a.point, pos)) return false;
      double size = arrowSizePx(a.size);
      return std::fabs(x - pos.x) <= size && std::fabs(y - pos.y) <= size;
    }

    case AnnotationType::Text: {
      PixelPoint pos;
      if (!mapper_.domainToPixel(a.point, pos)) return false;
      // Approximate glyph footprint; text is drawn from its baseline.
      double width = approxTextWidth(a.text, a.fontSize);
      double height = a.fontSize + 12.0;
      PixelBox box{pos.x - 6.0, pos.y - height, pos.x + width, pos.y + 6.0};
      return pointInBox(p, box);
    }
  }
  return false;
}

DragHandle HitTester::hitHandle(const Annotation& a, double x, double y) const {
  std::vector<HandlePoint> handles;
  if (dragHandlePoints(a, mapper_, handles)) {
    const double reach = config_.handleSizePx;
    for (const auto& h : handles) {
      if (std::fabs(x - h.px.x) <= reach && std::fabs(y - h.px.y) <= reach) {
        return h.handle;
      }
    }
  }
  return hits(a, x, y) ? DragHandle::Body : DragHandle::None;
}

} // namespace cm
