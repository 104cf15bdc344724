#pragma once

#include <cstdint>

#include "tuid/core/base62.hpp"

namespace tuid::core {

// Number of low-order bits holding the entropy field
inline constexpr unsigned kEntropyBits = 32;

// (timestamp_nanos << 32) | entropy
BigInt pack(std::int64_t timestamp_nanos, std::uint32_t entropy);

// Arithmetic right shift by 32, truncated to a signed 64-bit value
std::int64_t unpackTimestamp(const BigInt& value);

// Low 32 bits
std::uint32_t unpackEntropy(const BigInt& value);

}  // namespace tuid::core
