#include "cm/ids/AnnotationId.hpp"

namespace cm {

AnnotationIdGenerator::AnnotationIdGenerator() {
  std::random_device rd;
  rng_.seed((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

AnnotationIdGenerator::AnnotationIdGenerator(std::uint64_t seed) : rng_(seed) {}

AnnotationId AnnotationIdGenerator::next(std::int64_t nowMs) {
  static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<int> pick(0, 35);

  std::string id = std::to_string(nowMs);
  id.push_back('-');
  for (int i = 0; i < 9; ++i) id.push_back(kDigits[pick(rng_)]);
  return id;
}

} // namespace cm
