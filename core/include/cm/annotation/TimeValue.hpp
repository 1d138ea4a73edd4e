#pragma once
#include <cstdint>
#include <string>

namespace cm {

// A bar time: epoch seconds for intraday series, "YYYY-MM-DD" for daily+.
// The two kinds are never mixed inside one annotation.
struct TimeValue {
  enum class Kind : std::uint8_t { None = 0, Epoch, Date };

  Kind kind{Kind::None};
  std::int64_t epoch{0};
  std::string date;

  static TimeValue fromEpoch(std::int64_t seconds);
  static TimeValue fromDate(const std::string& isoDate);

  bool isValid() const { return kind != Kind::None; }
  bool isEpoch() const { return kind == Kind::Epoch; }
  bool isDate() const { return kind == Kind::Date; }

  std::string toString() const;

  bool operator==(const TimeValue& o) const;
  bool operator!=(const TimeValue& o) const { return !(*this == o); }
};

// Orders two times of the same kind. Returns <0, 0, >0.
// Times of different kinds compare by kind.
int compareTimes(const TimeValue& a, const TimeValue& b);

// A position in domain space. x/y cache the pixel the point was resolved
// from during an in-progress draw; they are never persisted.
struct DomainPoint {
  TimeValue time;
  double price{0};

  bool hasPixel{false};
  double x{0}, y{0};

  // Domain equality only; cached pixels are ignored.
  bool sameDomain(const DomainPoint& o) const {
    return time == o.time && price == o.price;
  }
};

inline DomainPoint makePoint(const TimeValue& t, double price) {
  DomainPoint p;
  p.time = t;
  p.price = price;
  return p;
}

} // namespace cm
