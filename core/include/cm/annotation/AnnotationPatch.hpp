#pragma once
#include "cm/annotation/Annotation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cm {

// Partial update for AnnotationStore::update. Unset fields are left alone.
// id, type and createdAt are not patchable.
struct AnnotationPatch {
  std::optional<Color> color;
  std::optional<float> thickness;
  std::optional<std::string> label;  // "" clears the label
  std::optional<bool> visible;
  std::optional<bool> locked;

  std::optional<double> price;
  std::optional<TimeValue> time;
  std::optional<DomainPoint> startPoint;
  std::optional<DomainPoint> endPoint;
  std::optional<DomainPoint> point;

  std::optional<bool> extendLeft;
  std::optional<bool> extendRight;
  std::optional<LineStyle> lineStyle;

  std::optional<float> fillOpacity;
  std::optional<LineStyle> borderStyle;

  std::optional<std::vector<double>> levels;
  std::optional<bool> showExtensions;
  std::optional<std::vector<double>> extensionLevels;
  std::optional<bool> showPrices;
  std::optional<std::vector<LevelColor>> levelColors;

  std::optional<ArrowDirection> direction;
  std::optional<ArrowSize> size;

  std::optional<std::string> text;
  std::optional<float> fontSize;
  std::optional<Color> backgroundColor;
  std::optional<float> backgroundOpacity;

  bool empty() const;
};

// Writes every set field of `patch` into `a`. Does not touch timestamps.
void applyPatch(Annotation& a, const AnnotationPatch& patch);

} // namespace cm
