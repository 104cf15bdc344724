#include "tuid/core/packing.hpp"

#include <limits>

namespace tuid::core {

namespace {

const BigInt& entropyMask() {
  static const BigInt mask{std::numeric_limits<std::uint32_t>::max()};
  return mask;
}

const BigInt& low64Mask() {
  static const BigInt mask{std::numeric_limits<std::uint64_t>::max()};
  return mask;
}

}  // namespace

BigInt pack(std::int64_t timestamp_nanos, std::uint32_t entropy) {
  BigInt value{timestamp_nanos};
  value <<= kEntropyBits;
  value += entropy;
  return value;
}

std::int64_t unpackTimestamp(const BigInt& value) {
  BigInt shifted = value >> kEntropyBits;
  // Keep only the low 64 bits, the way a two's complement truncation would
  auto low = static_cast<BigInt>(shifted & low64Mask()).convert_to<std::uint64_t>();
  return static_cast<std::int64_t>(low);
}

std::uint32_t unpackEntropy(const BigInt& value) {
  return static_cast<BigInt>(value & entropyMask()).convert_to<std::uint32_t>();
}

}  // namespace tuid::core
