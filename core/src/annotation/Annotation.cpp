#include "cm/annotation/Annotation.hpp"

#include <algorithm>
#include <cmath>

namespace cm {

namespace {

Color hex(const char* s) {
  Color c;
  parseHexColor(s, c);
  return c;
}

void dropPixel(DomainPoint& p) {
  p.hasPixel = false;
  p.x = 0;
  p.y = 0;
}

bool requireTime(const DomainPoint& p, const char* what, std::string& reason) {
  if (!p.time.isValid()) {
    reason = std::string(what) + " has no time";
    return false;
  }
  if (!std::isfinite(p.price)) {
    reason = std::string(what) + " has a non-finite price";
    return false;
  }
  return true;
}

} // namespace

// -------------------- Names --------------------

const char* annotationTypeName(AnnotationType type) {
  switch (type) {
    case AnnotationType::HorizontalLine: return "horizontal_line";
    case AnnotationType::VerticalLine:   return "vertical_line";
    case AnnotationType::Trendline:      return "trendline";
    case AnnotationType::Rectangle:      return "rectangle";
    case AnnotationType::Fibonacci:      return "fibonacci";
    case AnnotationType::Arrow:          return "arrow";
    case AnnotationType::Text:           return "text";
  }
  return "";
}

bool parseAnnotationType(const std::string& name, AnnotationType& out) {
  static const AnnotationType all[] = {
    AnnotationType::HorizontalLine, AnnotationType::VerticalLine,
    AnnotationType::Trendline, AnnotationType::Rectangle,
    AnnotationType::Fibonacci, AnnotationType::Arrow, AnnotationType::Text
  };
  for (AnnotationType t : all) {
    if (name == annotationTypeName(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

const char* lineStyleName(LineStyle style) {
  switch (style) {
    case LineStyle::Solid:  return "solid";
    case LineStyle::Dashed: return "dashed";
    case LineStyle::Dotted: return "dotted";
  }
  return "solid";
}

bool parseLineStyle(const std::string& name, LineStyle& out) {
  if (name == "solid")  { out = LineStyle::Solid;  return true; }
  if (name == "dashed") { out = LineStyle::Dashed; return true; }
  if (name == "dotted") { out = LineStyle::Dotted; return true; }
  return false;
}

const char* arrowDirectionName(ArrowDirection dir) {
  return dir == ArrowDirection::Up ? "up" : "down";
}

bool parseArrowDirection(const std::string& name, ArrowDirection& out) {
  if (name == "up")   { out = ArrowDirection::Up;   return true; }
  if (name == "down") { out = ArrowDirection::Down; return true; }
  return false;
}

const char* arrowSizeName(ArrowSize size) {
  switch (size) {
    case ArrowSize::Small:  return "small";
    case ArrowSize::Medium: return "medium";
    case ArrowSize::Large:  return "large";
  }
  return "medium";
}

bool parseArrowSize(const std::string& name, ArrowSize& out) {
  if (name == "small")  { out = ArrowSize::Small;  return true; }
  if (name == "medium") { out = ArrowSize::Medium; return true; }
  if (name == "large")  { out = ArrowSize::Large;  return true; }
  return false;
}

// -------------------- Variant helpers --------------------

bool hasTwoEndpoints(AnnotationType type) {
  return type == AnnotationType::Trendline ||
         type == AnnotationType::Rectangle ||
         type == AnnotationType::Fibonacci;
}

bool hasSinglePoint(AnnotationType type) {
  return type == AnnotationType::Arrow || type == AnnotationType::Text;
}

float arrowSizePx(ArrowSize size) {
  switch (size) {
    case ArrowSize::Small:  return 12.0f;
    case ArrowSize::Medium: return 18.0f;
    case ArrowSize::Large:  return 26.0f;
  }
  return 18.0f;
}

Color resolveLevelColor(const Annotation& a, double level) {
  for (const auto& lc : a.levelColors) {
    if (std::fabs(lc.level - level) < 1e-9) return lc.color;
  }
  return a.color;
}

std::vector<double> defaultFibonacciLevels() {
  return {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
}

std::vector<double> defaultFibonacciExtensions() {
  return {1.272, 1.618, 2.0, 2.618};
}

Color bullColor() { return hex("#22c55e"); }
Color bearColor() { return hex("#ef4444"); }

Annotation annotationDefaults(AnnotationType type) {
  Annotation a;
  a.type = type;

  switch (type) {
    case AnnotationType::HorizontalLine:
      a.color = hex("#6b7280");
      a.thickness = 2.0f;
      a.extendLeft = true;
      a.extendRight = true;
      a.lineStyle = LineStyle::Solid;
      break;

    case AnnotationType::VerticalLine:
      a.color = hex("#6b7280");
      a.thickness = 1.0f;
      a.lineStyle = LineStyle::Dashed;
      break;

    case AnnotationType::Trendline:
      a.color = hex("#ffffff");
      a.thickness = 2.0f;
      a.extendLeft = false;
      a.extendRight = false;
      a.lineStyle = LineStyle::Solid;
      break;

    case AnnotationType::Rectangle:
      a.color = hex("#fbbf24");
      a.thickness = 2.0f;
      a.fillOpacity = 0.2f;
      a.borderStyle = LineStyle::Solid;
      break;

    case AnnotationType::Fibonacci:
      a.color = hex("#a855f7");
      a.thickness = 1.0f;
      a.levels = defaultFibonacciLevels();
      a.showExtensions = false;
      a.extensionLevels = defaultFibonacciExtensions();
      a.showPrices = true;
      a.levelColors = {
        {0.0,   hex("#ef4444")},
        {0.236, hex("#f97316")},
        {0.382, hex("#eab308")},
        {0.5,   hex("#22c55e")},
        {0.618, hex("#06b6d4")},
        {0.786, hex("#3b82f6")},
        {1.0,   hex("#8b5cf6")},
        {1.272, hex("#d946ef")},
        {1.618, hex("#ec4899")}
      };
      break;

    case AnnotationType::Arrow:
      a.color = bullColor();
      a.thickness = 2.0f;
      a.direction = ArrowDirection::Up;
      a.size = ArrowSize::Medium;
      break;

    case AnnotationType::Text:
      a.color = hex("#ffffff");
      a.thickness = 1.0f;
      a.fontSize = 14.0f;
      a.backgroundColor = hex("#1e222d");
      a.backgroundOpacity = 0.9f;
      break;
  }
  return a;
}

// -------------------- Constructors --------------------

Annotation makeHorizontalLine(double price) {
  Annotation a = annotationDefaults(AnnotationType::HorizontalLine);
  a.price = price;
  return a;
}

Annotation makeVerticalLine(const TimeValue& time) {
  Annotation a = annotationDefaults(AnnotationType::VerticalLine);
  a.time = time;
  return a;
}

Annotation makeTrendline(const DomainPoint& start, const DomainPoint& end) {
  Annotation a = annotationDefaults(AnnotationType::Trendline);
  a.startPoint = makePoint(start.time, start.price);
  a.endPoint = makePoint(end.time, end.price);
  return a;
}

Annotation makeRectangle(const DomainPoint& start, const DomainPoint& end) {
  Annotation a = annotationDefaults(AnnotationType::Rectangle);
  a.startPoint = makePoint(start.time, start.price);
  a.endPoint = makePoint(end.time, end.price);
  return a;
}

Annotation makeFibonacci(const DomainPoint& start, const DomainPoint& end) {
  Annotation a = annotationDefaults(AnnotationType::Fibonacci);
  a.startPoint = makePoint(start.time, start.price);
  a.endPoint = makePoint(end.time, end.price);
  return a;
}

Annotation makeArrow(const DomainPoint& point, ArrowDirection direction) {
  Annotation a = annotationDefaults(AnnotationType::Arrow);
  a.point = makePoint(point.time, point.price);
  a.direction = direction;
  a.color = direction == ArrowDirection::Up ? bullColor() : bearColor();
  return a;
}

Annotation makeText(const DomainPoint& point, const std::string& text) {
  Annotation a = annotationDefaults(AnnotationType::Text);
  a.point = makePoint(point.time, point.price);
  a.text = text;
  return a;
}

// -------------------- Validation --------------------

bool validateAnnotation(const Annotation& a, std::string& reason) {
  switch (a.type) {
    case AnnotationType::HorizontalLine:
      if (!std::isfinite(a.price)) {
        reason = "price is not finite";
        return false;
      }
      return true;

    case AnnotationType::VerticalLine:
      if (!a.time.isValid()) {
        reason = "vertical line has no time";
        return false;
      }
      return true;

    case AnnotationType::Trendline:
    case AnnotationType::Rectangle:
    case AnnotationType::Fibonacci:
      if (!requireTime(a.startPoint, "startPoint", reason)) return false;
      if (!requireTime(a.endPoint, "endPoint", reason)) return false;
      if (a.startPoint.time.kind != a.endPoint.time.kind) {
        reason = "endpoints mix epoch and date times";
        return false;
      }
      return true;

    case AnnotationType::Arrow:
      return requireTime(a.point, "point", reason);

    case AnnotationType::Text:
      if (!requireTime(a.point, "point", reason)) return false;
      if (a.text.empty()) {
        reason = "text is empty";
        return false;
      }
      return true;
  }
  reason = "unknown type";
  return false;
}

void normalizeAnnotation(Annotation& a) {
  a.fillOpacity = std::min(1.0f, std::max(0.0f, a.fillOpacity));
  a.backgroundOpacity = std::min(1.0f, std::max(0.0f, a.backgroundOpacity));
  a.thickness = std::max(0.5f, a.thickness);
  a.fontSize = std::max(1.0f, a.fontSize);
  dropPixel(a.startPoint);
  dropPixel(a.endPoint);
  dropPixel(a.point);
}

} // namespace cm
