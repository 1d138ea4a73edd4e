#pragma once
#include "cm/annotation/Annotation.hpp"
#include "cm/annotation/AnnotationPatch.hpp"
#include "cm/storage/AnnotationStore.hpp"

namespace cm {

// Form model behind an annotation's property dialog. Only the fields the
// annotation's type exposes are read back by toPatch().
struct EditableProperties {
  AnnotationType type{AnnotationType::HorizontalLine};

  std::string label;
  Color color;
  float thickness{2.0f};

  bool extendLeft{false};                 // horizontal line, trendline
  bool extendRight{false};
  LineStyle lineStyle{LineStyle::Solid};  // lines; border style for rectangles
  float fillOpacity{0.2f};                // rectangle
  bool showExtensions{false};             // fibonacci
  bool showPrices{true};
  ArrowSize arrowSize{ArrowSize::Medium}; // arrow
  float fontSize{14.0f};                  // text
};

EditableProperties loadEditable(const Annotation& a);

// Type-appropriate patch: label, colour and thickness always, plus the
// fields the type exposes.
AnnotationPatch toPatch(const EditableProperties& props);

// loadEditable/toPatch round through the store. nullptr if `id` is unknown
// or the store rejects the patch.
const Annotation* applyProperties(AnnotationStore& store, const AnnotationId& id,
                                  const EditableProperties& props);

} // namespace cm
