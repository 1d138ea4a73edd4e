#pragma once
#include <cstdint>

namespace cm {

// Millisecond wall clock used for createdAt/updatedAt stamps and click timing.
class Clock {
public:
  virtual ~Clock() = default;
  virtual std::int64_t nowMs() const = 0;
};

class SystemClock : public Clock {
public:
  std::int64_t nowMs() const override;
};

// Test clock: time only moves when told to.
class ManualClock : public Clock {
public:
  explicit ManualClock(std::int64_t startMs = 0) : now_(startMs) {}

  std::int64_t nowMs() const override { return now_; }
  void set(std::int64_t ms) { now_ = ms; }
  void advance(std::int64_t ms) { now_ += ms; }

private:
  std::int64_t now_;
};

} // namespace cm
