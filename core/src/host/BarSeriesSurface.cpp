#include "cm/host/BarSeriesSurface.hpp"

#include <algorithm>
#include <cmath>

namespace cm {

namespace {

bool lessTime(const Bar& bar, const TimeValue& t) {
  return compareTimes(bar.time, t) < 0;
}

} // namespace

void BarSeriesSurface::setBars(std::vector<Bar> bars) {
  bars_ = std::move(bars);
  notifyRange();
}

void BarSeriesSurface::setVisibleLogicalRange(double from, double to) {
  from_ = from;
  to_ = to;
  notifyRange();
}

void BarSeriesSurface::setPriceRange(double priceMin, double priceMax) {
  priceMin_ = priceMin;
  priceMax_ = priceMax;
  notifyRange();
}

void BarSeriesSurface::setPlotSize(double width, double height) {
  width_ = width;
  height_ = height;
  notifyRange();
}

void BarSeriesSurface::fitContent() {
  if (bars_.empty()) return;

  double lo = bars_.front().low;
  double hi = bars_.front().high;
  for (const auto& b : bars_) {
    lo = std::min(lo, b.low);
    hi = std::max(hi, b.high);
  }
  double pad = (hi > lo) ? (hi - lo) * 0.05 : 1.0;

  from_ = -0.5;
  to_ = static_cast<double>(bars_.size()) - 0.5;
  priceMin_ = lo - pad;
  priceMax_ = hi + pad;
  notifyRange();
}

void BarSeriesSurface::pan(double dxPixels, double dyPixels) {
  if (width_ <= 0.0 || height_ <= 0.0) return;

  double logicalDx = dxPixels / width_ * (to_ - from_);
  double priceDy = dyPixels / height_ * (priceMax_ - priceMin_);

  from_ -= logicalDx;
  to_ -= logicalDx;
  priceMin_ += priceDy;
  priceMax_ += priceDy;
  notifyRange();
}

void BarSeriesSurface::zoom(double factor, double pivotPx) {
  if (width_ <= 0.0) return;

  double pivot = from_ + pivotPx / width_ * (to_ - from_);
  double scale = 1.0 / (1.0 + factor);
  from_ = pivot + (from_ - pivot) * scale;
  to_ = pivot + (to_ - pivot) * scale;
  notifyRange();
}

// -------------------- Price axis --------------------

bool BarSeriesSurface::priceToPixel(double price, double& y) const {
  double span = priceMax_ - priceMin_;
  if (!(span > 0.0) || height_ <= 0.0 || !std::isfinite(price)) return false;

  double py = (priceMax_ - price) / span * height_;
  if (py < -1e-6 || py > height_ + 1e-6) return false;
  y = py;
  return true;
}

bool BarSeriesSurface::pixelToPrice(double y, double& price) const {
  double span = priceMax_ - priceMin_;
  if (!(span > 0.0) || height_ <= 0.0) return false;
  if (y < 0.0 || y > height_) return false;

  price = priceMax_ - y / height_ * span;
  return true;
}

// -------------------- Time axis --------------------

bool BarSeriesSurface::timeToLogical(const TimeValue& time, double& logical) const {
  const std::size_t n = bars_.size();
  if (n == 0 || !time.isValid()) return false;
  if (time.kind != bars_.front().time.kind) return false;

  auto it = std::lower_bound(bars_.begin(), bars_.end(), time, lessTime);
  std::size_t i = static_cast<std::size_t>(it - bars_.begin());

  if (i < n && bars_[i].time == time) {
    logical = static_cast<double>(i);
    return true;
  }
  if (time.isDate() || n < 2) return false;

  // Epoch seconds between (or just outside) bars: interpolate along the
  // neighbouring interval.
  std::size_t lo;
  if (i == 0) lo = 0;
  else if (i >= n) lo = n - 2;
  else lo = i - 1;

  double t0 = static_cast<double>(bars_[lo].time.epoch);
  double t1 = static_cast<double>(bars_[lo + 1].time.epoch);
  if (!(t1 > t0)) return false;

  double l = static_cast<double>(lo) + (static_cast<double>(time.epoch) - t0) / (t1 - t0);
  if (l < -0.5 || l > static_cast<double>(n) - 0.5) return false;
  logical = l;
  return true;
}

bool BarSeriesSurface::logicalToTime(double logical, TimeValue& out) const {
  const std::size_t n = bars_.size();
  if (n == 0) return false;
  if (logical < -0.5 || logical > static_cast<double>(n) - 0.5) return false;

  if (bars_.front().time.isDate() || n < 2) {
    long idx = std::lround(logical);
    idx = std::max(0L, std::min(static_cast<long>(n) - 1, idx));
    out = bars_[static_cast<std::size_t>(idx)].time;
    return true;
  }

  long lo = static_cast<long>(std::floor(logical));
  lo = std::max(0L, std::min(static_cast<long>(n) - 2, lo));
  double t0 = static_cast<double>(bars_[static_cast<std::size_t>(lo)].time.epoch);
  double t1 = static_cast<double>(bars_[static_cast<std::size_t>(lo) + 1].time.epoch);
  double t = t0 + (logical - static_cast<double>(lo)) * (t1 - t0);
  out = TimeValue::fromEpoch(static_cast<std::int64_t>(std::llround(t)));
  return true;
}

bool BarSeriesSurface::logicalToPixel(double logical, double& x) const {
  double span = to_ - from_;
  if (!(span > 0.0) || width_ <= 0.0) return false;

  double px = (logical - from_) / span * width_;
  if (px < -1e-6 || px > width_ + 1e-6) return false;
  x = px;
  return true;
}

bool BarSeriesSurface::pixelToLogical(double x, double& logical) const {
  double span = to_ - from_;
  if (!(span > 0.0) || width_ <= 0.0) return false;
  if (x < 0.0 || x > width_) return false;

  logical = from_ + x / width_ * span;
  return true;
}

bool BarSeriesSurface::timeToPixel(const TimeValue& time, double& x) const {
  double logical;
  if (!timeToLogical(time, logical)) return false;
  return logicalToPixel(logical, x);
}

bool BarSeriesSurface::pixelToTime(double x, TimeValue& out) const {
  double logical;
  if (!pixelToLogical(x, logical)) return false;
  return logicalToTime(logical, out);
}

bool BarSeriesSurface::pixelToNearestBarTime(double x, TimeValue& out) const {
  const std::size_t n = bars_.size();
  double span = to_ - from_;
  if (n == 0 || !(span > 0.0) || width_ <= 0.0) return false;

  double logical = from_ + x / width_ * span;
  long idx = std::lround(logical);
  idx = std::max(0L, std::min(static_cast<long>(n) - 1, idx));
  out = bars_[static_cast<std::size_t>(idx)].time;
  return true;
}

// -------------------- Listeners --------------------

std::function<void()> BarSeriesSurface::onVisibleRangeChanged(RangeListener cb) {
  std::uint32_t token = nextToken_++;
  listeners_->push_back(ListenerSlot{token, std::move(cb)});

  std::weak_ptr<ListenerList> weak = listeners_;
  return [weak, token]() {
    auto list = weak.lock();
    if (!list) return;
    list->erase(std::remove_if(list->begin(), list->end(),
                               [token](const ListenerSlot& s) { return s.token == token; }),
                list->end());
  };
}

void BarSeriesSurface::notifyRange() {
  ListenerList snapshot = *listeners_;
  for (const auto& slot : snapshot) {
    if (slot.fn) slot.fn();
  }
}

} // namespace cm
