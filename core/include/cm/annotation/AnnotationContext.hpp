#pragma once
#include <string>

namespace cm {

// (instrument, timeframe, surface): selects one independent annotation set.
struct AnnotationContext {
  std::string symbol;     // e.g. "AAPL"
  std::string timeframe;  // e.g. "1D", "5m"
  std::string surfaceId;  // "main", "rsi", "macd", ...

  bool operator==(const AnnotationContext& o) const {
    return symbol == o.symbol && timeframe == o.timeframe && surfaceId == o.surfaceId;
  }
  bool operator!=(const AnnotationContext& o) const { return !(*this == o); }

  // Deterministic key without prefix: "<symbol>_<timeframe>_<surfaceId>".
  std::string key() const { return symbol + "_" + timeframe + "_" + surfaceId; }
};

inline std::string storageKeyFor(const AnnotationContext& ctx, const std::string& prefix) {
  return prefix + "_" + ctx.key();
}

} // namespace cm
