#pragma once
#include "cm/annotation/TimeValue.hpp"
#include "cm/geometry/Geometry.hpp"
#include "cm/host/HostSurface.hpp"

namespace cm {

// Pixel <-> domain conversion for one surface. Stateless: every call reads
// the host's current scale.
class CoordinateMapper {
public:
  explicit CoordinateMapper(const HostSurface& host) : host_(host) {}

  // Fails when no price resolves at y. An x outside the bar range clamps to
  // the nearest bar time instead of failing. The result caches (x, y).
  bool pixelToDomain(double x, double y, DomainPoint& out) const;

  // Fails when the price or time is outside the visible range.
  bool domainToPixel(const DomainPoint& p, PixelPoint& out) const;

  // Single-axis forms. pixelToTime clamps to the nearest bar like pixelToDomain.
  bool pixelToTime(double x, TimeValue& out) const;
  bool pixelToPrice(double y, double& price) const { return host_.pixelToPrice(y, price); }

  bool priceToY(double price, double& y) const { return host_.priceToPixel(price, y); }
  bool timeToX(const TimeValue& t, double& x) const { return host_.timeToPixel(t, x); }

  const HostSurface& host() const { return host_; }

private:
  const HostSurface& host_;
};

} // namespace cm
