#pragma once
#include "cm/host/HostSurface.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace cm {

struct Bar {
  TimeValue time;
  double open{0}, high{0}, low{0}, close{0};
  double volume{0};
};

// HostSurface over an ordered bar list. The x axis is a logical bar index
// (bar i centred on logical i), the y axis a linear price range.
//   x = (logical - from) / (to - from) * width
//   y = (priceMax - price) / (priceMax - priceMin) * height
// Epoch times interpolate between neighbouring bars; date times only resolve
// to an existing bar.
class BarSeriesSurface : public HostSurface {
public:
  void setBars(std::vector<Bar> bars);
  void setVisibleLogicalRange(double from, double to);
  void setPriceRange(double priceMin, double priceMax);
  void setPlotSize(double width, double height);

  // Shows all bars with the price range padded 5% around low/high.
  void fitContent();

  // Dragging right reveals earlier bars; dragging down reveals higher prices.
  void pan(double dxPixels, double dyPixels);
  // factor > 0 zooms in around the pivot column.
  void zoom(double factor, double pivotPx);

  // HostSurface
  bool priceToPixel(double price, double& y) const override;
  bool pixelToPrice(double y, double& price) const override;
  bool timeToPixel(const TimeValue& time, double& x) const override;
  bool pixelToTime(double x, TimeValue& out) const override;
  bool pixelToNearestBarTime(double x, TimeValue& out) const override;
  std::function<void()> onVisibleRangeChanged(RangeListener cb) override;
  double plotWidth() const override { return width_; }
  double plotHeight() const override { return height_; }

  bool timeToLogical(const TimeValue& time, double& logical) const;
  bool logicalToPixel(double logical, double& x) const;
  bool pixelToLogical(double x, double& logical) const;

  const std::vector<Bar>& bars() const { return bars_; }
  double visibleFrom() const { return from_; }
  double visibleTo() const { return to_; }
  double priceMin() const { return priceMin_; }
  double priceMax() const { return priceMax_; }

private:
  struct ListenerSlot {
    std::uint32_t token;
    RangeListener fn;
  };
  using ListenerList = std::vector<ListenerSlot>;

  bool logicalToTime(double logical, TimeValue& out) const;
  void notifyRange();

  std::vector<Bar> bars_;
  double from_{0}, to_{1};
  double priceMin_{0}, priceMax_{1};
  double width_{800}, height_{600};

  std::shared_ptr<ListenerList> listeners_{std::make_shared<ListenerList>()};
  std::uint32_t nextToken_{1};
};

} // namespace cm
