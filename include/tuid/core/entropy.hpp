#pragma once

#include <cstdint>

namespace tuid::core {

// Uniformly distributed 32-bit value from the operating system's secure
// random source. Safe to call from multiple threads.
std::uint32_t secureRandomUint32();

}  // namespace tuid::core
