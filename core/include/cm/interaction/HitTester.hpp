#pragma once
#include "cm/annotation/Annotation.hpp"
#include "cm/geometry/CoordinateMapper.hpp"
#include "cm/interaction/InteractionState.hpp"

#include <cstddef>
#include <vector>

namespace cm {

struct HitTestConfig {
  double tolerancePx{8.0};
  double handleSizePx{8.0};
};

struct AnnotationHit {
  bool hit{false};
  AnnotationId id;
  std::size_t index{0};  // position in the list passed to hitTest
};

struct HandlePoint {
  DragHandle handle{DragHandle::None};
  PixelPoint px;
};

// Grabbable handles of an annotation at the current scale. Lines with
// endpoints yield Start/End, rectangles their four corners, everything else
// none. False when the annotation's points do not resolve.
bool dragHandlePoints(const Annotation& a, const CoordinateMapper& mapper,
                      std::vector<HandlePoint>& out);

class HitTester {
public:
  explicit HitTester(const CoordinateMapper& mapper) : mapper_(mapper) {}

  void setConfig(const HitTestConfig& cfg) { config_ = cfg; }
  const HitTestConfig& config() const { return config_; }

  // Topmost visible annotation under (x, y). Later entries win.
  AnnotationHit hitTest(const std::vector<Annotation>& annotations, double x, double y) const;

  // Per-variant test, ignoring visibility.
  bool hits(const Annotation& a, double x, double y) const;

  // Handle under the pointer, else Body if the annotation is hit, else None.
  DragHandle hitHandle(const Annotation& a, double x, double y) const;

private:
  const CoordinateMapper& mapper_;
  HitTestConfig config_;
};

} // namespace cm
