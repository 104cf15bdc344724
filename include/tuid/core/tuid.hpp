#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "tuid/common.hpp"
#include "tuid/core/base62.hpp"

namespace tuid::core {

// First identifier at 2000-01-01T00:00:00Z
inline constexpr std::string_view kMinId = "5Hr02eJHAfTt1tTM";

// First identifier at 2100-01-01T00:00:00Z
inline constexpr std::string_view kMaxId = "MuklDY5bgW1s9Ev2";

// Timestamps embedded in kMinId and kMaxId
Timestamp minTimestamp();
Timestamp maxTimestamp();

struct TuidInfo;

// TUID (Time-based Unique Identifier), e.g. 91Mq07yx9IxHCi5Y
// A base-62 big integer whose high bits are nanoseconds since the Unix epoch
// and whose low 32 bits are random entropy. Identifiers from the same era have
// 16 digits and sort chronologically as plain strings.
// The zero value is the empty string.
class Tuid {
 public:
  // Create new TUID with current timestamp
  static Tuid generate();

  // Create TUID with specific timestamp and random entropy
  static Tuid generate(Timestamp timestamp);

  // Create TUID from a timestamp and entropy, e.g. to rebuild one from its info()
  static Tuid generate(Timestamp timestamp, std::uint32_t entropy);

  // TUID with zero entropy: sorts at or before every TUID with the same
  // timestamp, so it works as an inclusive lower bound for range queries
  static Tuid firstAt(Timestamp timestamp);

  // Strict parse: only accepts strings for which isValid() holds
  static Result<Tuid> parse(std::string_view str);

  // Default constructor creates the zero (empty) TUID
  Tuid() = default;

  // Wrap an arbitrary string without checking it
  explicit Tuid(std::string id);

  // Get string representation
  const std::string& toString() const noexcept;

  bool empty() const noexcept;

  // Decoded integer value
  Result<BigInt> toInt() const;

  // Embedded timestamp
  Result<Timestamp> timestamp() const;

  // Random low 32 bits
  Result<std::uint32_t> entropy() const;

  // Timestamp and entropy from a single decode
  Result<TuidInfo> info() const;

  // Decodes and lies within [kMinId, kMaxId]
  bool isValid() const;

  // Comparison operators
  bool operator==(const Tuid& other) const noexcept;
  bool operator!=(const Tuid& other) const noexcept;
  bool operator<(const Tuid& other) const noexcept;
  bool operator<=(const Tuid& other) const noexcept;
  bool operator>(const Tuid& other) const noexcept;
  bool operator>=(const Tuid& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Tuid& id) const noexcept;
  };

 private:
  std::string id_;
};

struct TuidInfo {
  Tuid id;
  Timestamp timestamp;
  std::uint32_t entropy = 0;

  bool operator==(const TuidInfo& other) const = default;
};

// Checks that the TUID has valid digits and a timestamp between 2000 and 2100.
// Non-canonical strings (extra leading zeros) that land in range are accepted.
bool isValid(const Tuid& id);

// Lexicographic comparison: -1, 0 or +1. Chronological for TUIDs of equal
// length, which holds for every valid TUID.
int compare(const Tuid& lhs, const Tuid& rhs) noexcept;

// stop.timestamp - start.timestamp, saturated at nanoseconds::min()/max()
Result<std::chrono::nanoseconds> durationBetween(const Tuid& start, const Tuid& stop);

// JSON: {"id": "...", "timestamp": "<RFC3339 nano>", "entropy": n}
void to_json(nlohmann::json& j, const TuidInfo& info);
void from_json(const nlohmann::json& j, TuidInfo& info);

}  // namespace tuid::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<tuid::core::Tuid> : tuid::core::Tuid::Hash {};
}  // namespace std
