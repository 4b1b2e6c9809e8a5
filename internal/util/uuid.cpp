#include "uuid.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <random>

namespace timebank::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  uint64_t high = rng();
  uint64_t low  = rng();
  high          = (high & ~uint64_t{0xF000}) | uint64_t{0x4000};               // version 4
  low           = (low & ~(uint64_t{0xC} << 60)) | (uint64_t{0x8} << 60);      // RFC4122 variant

  char text[37];
  std::snprintf(text, sizeof(text), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%012" PRIx64, high >> 32,
                (high >> 16) & 0xFFFF, high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL);
  return text;
}

} // namespace timebank::util
