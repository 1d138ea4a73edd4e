#include "cm/annotation/TimeValue.hpp"

namespace cm {

TimeValue TimeValue::fromEpoch(std::int64_t seconds) {
  TimeValue t;
  t.kind = Kind::Epoch;
  t.epoch = seconds;
  return t;
}

TimeValue TimeValue::fromDate(const std::string& isoDate) {
  TimeValue t;
  if (isoDate.empty()) return t;
  t.kind = Kind::Date;
  t.date = isoDate;
  return t;
}

std::string TimeValue::toString() const {
  switch (kind) {
    case Kind::Epoch: return std::to_string(epoch);
    case Kind::Date:  return date;
    case Kind::None:  break;
  }
  return {};
}

bool TimeValue::operator==(const TimeValue& o) const {
  if (kind != o.kind) return false;
  switch (kind) {
    case Kind::Epoch: return epoch == o.epoch;
    case Kind::Date:  return date == o.date;
    case Kind::None:  return true;
  }
  return false;
}

int compareTimes(const TimeValue& a, const TimeValue& b) {
  if (a.kind != b.kind) {
    return static_cast<int>(a.kind) < static_cast<int>(b.kind) ? -1 : 1;
  }
  if (a.kind == TimeValue::Kind::Epoch) {
    if (a.epoch < b.epoch) return -1;
    return a.epoch > b.epoch ? 1 : 0;
  }
  // ISO dates order lexicographically.
  int c = a.date.compare(b.date);
  if (c < 0) return -1;
  return c > 0 ? 1 : 0;
}

} // namespace cm
