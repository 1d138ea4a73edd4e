#pragma once
#include <cstdint>
#include <random>
#include <string>

namespace cm {

using AnnotationId = std::string;

// Generates opaque ids of the form "<ms>-<9 base36 chars>".
class AnnotationIdGenerator {
public:
  AnnotationIdGenerator();
  explicit AnnotationIdGenerator(std::uint64_t seed);

  AnnotationId next(std::int64_t nowMs);

private:
  std::mt19937_64 rng_;
};

} // namespace cm
