#pragma once

#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "tuid/common.hpp"

namespace tuid::core {

// Arbitrary-precision signed integer. Encoded values are never negative, but
// the codec rejects negative input instead of assuming it away.
using BigInt = boost::multiprecision::cpp_int;

// Digit order is significant: identifiers already stored depend on it
inline constexpr std::string_view kBase62Alphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
inline constexpr unsigned kBase = 62;

// Value of a base-62 digit, or -1 for characters outside the alphabet
int digitValue(char c) noexcept;

// Encode a non-negative integer, most significant digit first.
// encode(0) == "0"; negative values fail with kEncodingError.
Result<std::string> encode(const BigInt& value);

// Decode a base-62 string. Fails with kDecodingError for an empty string or
// for any character outside the alphabet. Leading zero digits are accepted.
Result<BigInt> decode(std::string_view text);

}  // namespace tuid::core
