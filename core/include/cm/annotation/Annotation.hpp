#pragma once
#include "cm/annotation/Color.hpp"
#include "cm/annotation/TimeValue.hpp"
#include "cm/ids/AnnotationId.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cm {

// Annotation model: user-created chart objects anchored in domain space.
// One record type with an explicit discriminant; each variant reads only the
// fields listed next to it below. Render and hit-test code switch over
// `type` without a default so a new variant is a compile-time warning.
enum class AnnotationType : std::uint8_t {
  HorizontalLine = 1, // price
  VerticalLine = 2,   // time
  Trendline = 3,      // startPoint, endPoint, extendLeft/Right, lineStyle
  Rectangle = 4,      // startPoint, endPoint, fillOpacity, borderStyle
  Fibonacci = 5,      // startPoint, endPoint, levels, extensions, showPrices, levelColors
  Arrow = 6,          // point, direction, size
  Text = 7            // point, text, fontSize, backgroundColor, backgroundOpacity
};

enum class LineStyle : std::uint8_t { Solid = 0, Dashed, Dotted };
enum class ArrowDirection : std::uint8_t { Up = 0, Down };
enum class ArrowSize : std::uint8_t { Small = 0, Medium, Large };

struct LevelColor {
  double level{0};
  Color color;
};

struct Annotation {
  // Base record
  AnnotationId id;
  AnnotationType type{AnnotationType::HorizontalLine};
  Color color;
  float thickness{2.0f};
  std::string label;          // empty = no label
  bool visible{true};
  bool locked{false};
  std::int64_t createdAt{0};  // ms, stamped by the store
  std::int64_t updatedAt{0};

  // HorizontalLine
  double price{0};
  // VerticalLine
  TimeValue time;
  // Trendline / Rectangle / Fibonacci
  DomainPoint startPoint;
  DomainPoint endPoint;
  // Arrow / Text
  DomainPoint point;

  bool extendLeft{false};
  bool extendRight{false};
  LineStyle lineStyle{LineStyle::Solid};

  float fillOpacity{0.2f};
  LineStyle borderStyle{LineStyle::Solid};

  std::vector<double> levels;
  bool showExtensions{false};
  std::vector<double> extensionLevels;
  bool showPrices{true};
  std::vector<LevelColor> levelColors;

  ArrowDirection direction{ArrowDirection::Up};
  ArrowSize size{ArrowSize::Medium};

  std::string text;
  float fontSize{14.0f};
  Color backgroundColor;
  float backgroundOpacity{0.9f};
};

// ---- Names (persisted and used by the command surface) ----

const char* annotationTypeName(AnnotationType type);
bool parseAnnotationType(const std::string& name, AnnotationType& out);

const char* lineStyleName(LineStyle style);
bool parseLineStyle(const std::string& name, LineStyle& out);

const char* arrowDirectionName(ArrowDirection dir);
bool parseArrowDirection(const std::string& name, ArrowDirection& out);

const char* arrowSizeName(ArrowSize size);
bool parseArrowSize(const std::string& name, ArrowSize& out);

// ---- Variant helpers ----

bool hasTwoEndpoints(AnnotationType type);
bool hasSinglePoint(AnnotationType type);

// Arrow glyph edge length in pixels: 12 / 18 / 26.
float arrowSizePx(ArrowSize size);

// Colour of a Fibonacci level; falls back to the annotation's base colour.
Color resolveLevelColor(const Annotation& a, double level);

std::vector<double> defaultFibonacciLevels();
std::vector<double> defaultFibonacciExtensions();

// Palette
Color bullColor();
Color bearColor();

// Variant defaults (colour, thickness, style flags) with no geometry.
Annotation annotationDefaults(AnnotationType type);

// ---- Convenience constructors: payloads for AnnotationStore::create ----

Annotation makeHorizontalLine(double price);
Annotation makeVerticalLine(const TimeValue& time);
Annotation makeTrendline(const DomainPoint& start, const DomainPoint& end);
Annotation makeRectangle(const DomainPoint& start, const DomainPoint& end);
Annotation makeFibonacci(const DomainPoint& start, const DomainPoint& end);
Annotation makeArrow(const DomainPoint& point, ArrowDirection direction);
Annotation makeText(const DomainPoint& point, const std::string& text);

// Checks the variant's required geometry. On failure `reason` names the problem.
bool validateAnnotation(const Annotation& a, std::string& reason);

// Clamps ranged fields and drops cached pixels.
void normalizeAnnotation(Annotation& a);

} // namespace cm
