#include "tuid/core/base62.hpp"

#include <algorithm>

namespace tuid::core {

int digitValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
  if (c >= 'a' && c <= 'z') return c - 'a' + 36;
  return -1;
}

Result<std::string> encode(const BigInt& value) {
  if (value.sign() < 0) {
    return makeErrorResult<std::string>(ErrorCode::kEncodingError,
                                        "base 62 encoding error: positive value required");
  }

  if (value.is_zero()) {
    return std::string(1, kBase62Alphabet[0]);
  }

  // Digits come out least significant first
  std::string result;
  BigInt remaining = value;
  BigInt quotient;
  BigInt remainder;
  while (remaining.sign() > 0) {
    boost::multiprecision::divide_qr(remaining, BigInt(kBase), quotient, remainder);
    result += kBase62Alphabet[remainder.convert_to<unsigned>()];
    remaining = quotient;
  }
  std::reverse(result.begin(), result.end());

  return result;
}

Result<BigInt> decode(std::string_view text) {
  if (text.empty()) {
    return makeErrorResult<BigInt>(ErrorCode::kDecodingError,
                                   "base 62 decoding error: no digits");
  }

  BigInt result = 0;
  BigInt power = 1;

  // Examine digits from right to left
  for (auto it = text.rbegin(); it != text.rend(); ++it) {
    int value = digitValue(*it);
    if (value < 0) {
      return makeErrorResult<BigInt>(
          ErrorCode::kDecodingError,
          "base 62 decoding error: invalid digit `" + std::string(1, *it) + "` in " +
              std::string(text));
    }
    result += power * value;
    power *= kBase;
  }

  return result;
}

}  // namespace tuid::core
