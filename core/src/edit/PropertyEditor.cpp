#include "cm/edit/PropertyEditor.hpp"

namespace cm {

EditableProperties loadEditable(const Annotation& a) {
  EditableProperties p;
  p.type = a.type;
  p.label = a.label;
  p.color = a.color;
  p.thickness = a.thickness;

  switch (a.type) {
    case AnnotationType::HorizontalLine:
    case AnnotationType::Trendline:
      p.extendLeft = a.extendLeft;
      p.extendRight = a.extendRight;
      p.lineStyle = a.lineStyle;
      break;
    case AnnotationType::VerticalLine:
      p.lineStyle = a.lineStyle;
      break;
    case AnnotationType::Rectangle:
      p.fillOpacity = a.fillOpacity;
      p.lineStyle = a.borderStyle;
      break;
    case AnnotationType::Fibonacci:
      p.showExtensions = a.showExtensions;
      p.showPrices = a.showPrices;
      break;
    case AnnotationType::Arrow:
      p.arrowSize = a.size;
      break;
    case AnnotationType::Text:
      p.fontSize = a.fontSize;
      break;
  }
  return p;
}

AnnotationPatch toPatch(const EditableProperties& props) {
  AnnotationPatch patch;
  patch.label = props.label;
  patch.color = props.color;
  patch.thickness = props.thickness;

  switch (props.type) {
    case AnnotationType::HorizontalLine:
    case AnnotationType::Trendline:
      patch.extendLeft = props.extendLeft;
      patch.extendRight = props.extendRight;
      patch.lineStyle = props.lineStyle;
      break;
    case AnnotationType::VerticalLine:
      patch.lineStyle = props.lineStyle;
      break;
    case AnnotationType::Rectangle:
      patch.fillOpacity = props.fillOpacity;
      patch.borderStyle = props.lineStyle;
      break;
    case AnnotationType::Fibonacci:
      patch.showExtensions = props.showExtensions;
      patch.showPrices = props.showPrices;
      break;
    case AnnotationType::Arrow:
      patch.size = props.arrowSize;
      break;
    case AnnotationType::Text:
      patch.fontSize = props.fontSize;
      break;
  }
  return patch;
}

const Annotation* applyProperties(AnnotationStore& store, const AnnotationId& id,
                                  const EditableProperties& props) {
  const Annotation* current = store.get(id);
  if (!current || current->type != props.type) return nullptr;
  return store.update(id, toPatch(props));
}

} // namespace cm
