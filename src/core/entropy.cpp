#include "tuid/core/entropy.hpp"

#include <random>

#ifdef __linux__
#include <sys/random.h>
#endif

namespace tuid::core {

std::uint32_t secureRandomUint32() {
#ifdef __linux__
  std::uint32_t value = 0;
  if (getrandom(&value, sizeof(value), 0) == static_cast<ssize_t>(sizeof(value))) {
    return value;
  }
#endif

  // Fallback to the implementation's non-deterministic source
  static thread_local std::random_device rd;
  static_assert(sizeof(std::random_device::result_type) >= sizeof(std::uint32_t));
  return static_cast<std::uint32_t>(rd());
}

}  // namespace tuid::core
