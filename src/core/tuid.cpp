#include "tuid/core/tuid.hpp"

#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "tuid/core/entropy.hpp"
#include "tuid/core/packing.hpp"
#include "tuid/util/time.hpp"

namespace tuid::core {

namespace {

// Pack and encode. Instants before the Unix epoch have no base-62 form and
// yield the zero TUID.
Tuid encodeFields(Timestamp timestamp, std::uint32_t entropy) {
  auto encoded = encode(pack(timestamp.time_since_epoch().count(), entropy));
  if (!encoded.has_value()) {
    return Tuid{};
  }
  return Tuid(std::move(*encoded));
}

Timestamp toTimestamp(const BigInt& value) {
  return Timestamp{std::chrono::nanoseconds(unpackTimestamp(value))};
}

// Integer bounds decoded once; both literals are known-good
const BigInt& minInt() {
  static const BigInt value = decode(kMinId).value();
  return value;
}

const BigInt& maxInt() {
  static const BigInt value = decode(kMaxId).value();
  return value;
}

}  // namespace

Timestamp minTimestamp() {
  return toTimestamp(minInt());
}

Timestamp maxTimestamp() {
  return toTimestamp(maxInt());
}

Tuid Tuid::generate() {
  return generate(util::Time::now());
}

Tuid Tuid::generate(Timestamp timestamp) {
  return encodeFields(timestamp, secureRandomUint32());
}

Tuid Tuid::generate(Timestamp timestamp, std::uint32_t entropy) {
  return encodeFields(timestamp, entropy);
}

Tuid Tuid::firstAt(Timestamp timestamp) {
  return encodeFields(timestamp, 0);
}

Result<Tuid> Tuid::parse(std::string_view str) {
  Tuid id{std::string(str)};
  if (!id.isValid()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid TUID: " + std::string(str)));
  }
  return id;
}

Tuid::Tuid(std::string id) : id_(std::move(id)) {}

const std::string& Tuid::toString() const noexcept {
  return id_;
}

bool Tuid::empty() const noexcept {
  return id_.empty();
}

Result<BigInt> Tuid::toInt() const {
  return decode(id_);
}

Result<Timestamp> Tuid::timestamp() const {
  return decode(id_).transform(toTimestamp);
}

Result<std::uint32_t> Tuid::entropy() const {
  return decode(id_).transform(unpackEntropy);
}

Result<TuidInfo> Tuid::info() const {
  auto value = decode(id_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }
  return TuidInfo{*this, toTimestamp(*value), unpackEntropy(*value)};
}

bool Tuid::isValid() const {
  auto value = decode(id_);
  if (!value.has_value()) {
    return false;
  }
  return *value >= minInt() && *value <= maxInt();
}

bool Tuid::operator==(const Tuid& other) const noexcept {
  return id_ == other.id_;
}

bool Tuid::operator!=(const Tuid& other) const noexcept {
  return !(*this == other);
}

bool Tuid::operator<(const Tuid& other) const noexcept {
  return id_ < other.id_;
}

bool Tuid::operator<=(const Tuid& other) const noexcept {
  return id_ <= other.id_;
}

bool Tuid::operator>(const Tuid& other) const noexcept {
  return id_ > other.id_;
}

bool Tuid::operator>=(const Tuid& other) const noexcept {
  return id_ >= other.id_;
}

std::size_t Tuid::Hash::operator()(const Tuid& id) const noexcept {
  return std::hash<std::string>{}(id.id_);
}

bool isValid(const Tuid& id) {
  return id.isValid();
}

int compare(const Tuid& lhs, const Tuid& rhs) noexcept {
  if (lhs == rhs) {
    return 0;
  }
  return lhs < rhs ? -1 : +1;
}

Result<std::chrono::nanoseconds> durationBetween(const Tuid& start, const Tuid& stop) {
  auto start_time = start.timestamp();
  if (!start_time.has_value()) {
    return std::unexpected(start_time.error());
  }
  auto stop_time = stop.timestamp();
  if (!stop_time.has_value()) {
    return std::unexpected(stop_time.error());
  }

  // Saturate instead of overflowing when the timestamps are far apart
  constexpr auto kMax = std::numeric_limits<std::chrono::nanoseconds::rep>::max();
  constexpr auto kMin = std::numeric_limits<std::chrono::nanoseconds::rep>::min();
  auto stop_ns = stop_time->time_since_epoch().count();
  auto start_ns = start_time->time_since_epoch().count();
  if (start_ns < 0 && stop_ns > kMax + start_ns) {
    return std::chrono::nanoseconds::max();
  }
  if (start_ns > 0 && stop_ns < kMin + start_ns) {
    return std::chrono::nanoseconds::min();
  }
  return std::chrono::nanoseconds(stop_ns - start_ns);
}

void to_json(nlohmann::json& j, const TuidInfo& info) {
  j = nlohmann::json{{"id", info.id.toString()},
                     {"timestamp", util::Time::toRfc3339Nano(info.timestamp)},
                     {"entropy", info.entropy}};
}

void from_json(const nlohmann::json& j, TuidInfo& info) {
  info.id = Tuid(j.at("id").get<std::string>());
  auto timestamp = util::Time::fromRfc3339(j.at("timestamp").get<std::string>());
  if (!timestamp.has_value()) {
    throw std::invalid_argument(timestamp.error().message());
  }
  info.timestamp = *timestamp;
  info.entropy = j.at("entropy").get<std::uint32_t>();
}

}  // namespace tuid::core
