#include "cm/geometry/CoordinateMapper.hpp"

namespace cm {

bool CoordinateMapper::pixelToDomain(double x, double y, DomainPoint& out) const {
  double price;
  if (!host_.pixelToPrice(y, price)) return false;

  TimeValue time;
  if (!pixelToTime(x, time)) return false;

  out.time = time;
  out.price = price;
  out.hasPixel = true;
  out.x = x;
  out.y = y;
  return true;
}

bool CoordinateMapper::pixelToTime(double x, TimeValue& out) const {
  if (host_.pixelToTime(x, out)) return true;
  return host_.pixelToNearestBarTime(x, out);
}

bool CoordinateMapper::domainToPixel(const DomainPoint& p, PixelPoint& out) const {
  double x, y;
  if (!host_.timeToPixel(p.time, x)) return false;
  if (!host_.priceToPixel(p.price, y)) return false;
  out.x = x;
  out.y = y;
  return true;
}

} // namespace cm
