#pragma once
#include "cm/annotation/TimeValue.hpp"

#include <functional>

namespace cm {

// Coordinate primitives the host chart exposes for one drawing surface.
// Every conversion returns false when the value cannot be resolved at the
// current scale (outside the plot, outside the visible range, no data).
class HostSurface {
public:
  using RangeListener = std::function<void()>;

  virtual ~HostSurface() = default;

  virtual bool priceToPixel(double price, double& y) const = 0;
  virtual bool pixelToPrice(double y, double& price) const = 0;

  virtual bool timeToPixel(const TimeValue& time, double& x) const = 0;
  virtual bool pixelToTime(double x, TimeValue& out) const = 0;

  // Fallback for x outside the bar range: time of the closest bar.
  virtual bool pixelToNearestBarTime(double x, TimeValue& out) const = 0;

  // Fired after pan/zoom/resize. Returns an unsubscribe function.
  virtual std::function<void()> onVisibleRangeChanged(RangeListener cb) = 0;

  // Size of the drawing surface in pixels.
  virtual double plotWidth() const = 0;
  virtual double plotHeight() const = 0;
};

} // namespace cm
