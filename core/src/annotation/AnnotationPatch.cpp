#include "cm/annotation/AnnotationPatch.hpp"

namespace cm {

bool AnnotationPatch::empty() const {
  return !color && !thickness && !label && !visible && !locked &&
         !price && !time && !startPoint && !endPoint && !point &&
         !extendLeft && !extendRight && !lineStyle &&
         !fillOpacity && !borderStyle &&
         !levels && !showExtensions && !extensionLevels && !showPrices &&
         !levelColors && !direction && !size &&
         !text && !fontSize && !backgroundColor && !backgroundOpacity;
}

void applyPatch(Annotation& a, const AnnotationPatch& p) {
  if (p.color)             a.color = *p.color;
  if (p.thickness)         a.thickness = *p.thickness;
  if (p.label)             a.label = *p.label;
  if (p.visible)           a.visible = *p.visible;
  if (p.locked)            a.locked = *p.locked;

  if (p.price)             a.price = *p.price;
  if (p.time)              a.time = *p.time;
  if (p.startPoint)        a.startPoint = *p.startPoint;
  if (p.endPoint)          a.endPoint = *p.endPoint;
  if (p.point)             a.point = *p.point;

  if (p.extendLeft)        a.extendLeft = *p.extendLeft;
  if (p.extendRight)       a.extendRight = *p.extendRight;
  if (p.lineStyle)         a.lineStyle = *p.lineStyle;

  if (p.fillOpacity)       a.fillOpacity = *p.fillOpacity;
  if (p.borderStyle)       a.borderStyle = *p.borderStyle;

  if (p.levels)            a.levels = *p.levels;
  if (p.showExtensions)    a.showExtensions = *p.showExtensions;
  if (p.extensionLevels)   a.extensionLevels = *p.extensionLevels;
  if (p.showPrices)        a.showPrices = *p.showPrices;
  if (p.levelColors)       a.levelColors = *p.levelColors;

  if (p.direction)         a.direction = *p.direction;
  if (p.size)              a.size = *p.size;

  if (p.text)              a.text = *p.text;
  if (p.fontSize)          a.fontSize = *p.fontSize;
  if (p.backgroundColor)   a.backgroundColor = *p.backgroundColor;
  if (p.backgroundOpacity) a.backgroundOpacity = *p.backgroundOpacity;
}

} // namespace cm
