#pragma once
// TimeCodec.hpp – Absolute (MJD + UTC) and relative time fields.
//
// Absolute time, ETSI EN 301 234 clause 6.2.4.1:
//   ValidityFlag(1) MJD(17) Rfu(2) UTCFlag(1) Hours(5) Minutes(6)
//     [ Seconds(6) Milliseconds(10) ]                       ← UTCFlag = 1
//   4 zero bytes mean "now".
//
// Relative time, clause 6.2.4.2 – one byte, Granularity(2) Interval(6):
//   0 → 2 minute steps   1 → 30 minute steps
//   2 → 2 hour steps     3 → 1 day steps

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace mot {

using TimePoint = std::chrono::sys_time<std::chrono::milliseconds>;

// MJD of the Unix epoch, 1970-01-01.
inline constexpr int32_t kUnixEpochMjd = 40587;

// std::nullopt encodes as "now" (4 zero bytes). Seconds of zero select the
// 4-byte short form, in which case milliseconds are not transmitted.
[[nodiscard]] std::vector<uint8_t> encodeAbsoluteTime(const std::optional<TimePoint>& tp);

// Accepts 4 or 6 bytes. All-zero input decodes to std::nullopt.
// Throws ValidationError on a bad length or out-of-range field.
[[nodiscard]] std::optional<TimePoint> decodeAbsoluteTime(std::span<const uint8_t> data);

// Picks the finest granularity that can express the duration; the interval
// is rounded down to that granularity's step. Throws ValidationError for
// negative durations and for anything beyond 63 days.
[[nodiscard]] uint8_t encodeRelativeTime(std::chrono::seconds offset);

[[nodiscard]] std::chrono::minutes decodeRelativeTime(uint8_t data);

// Step of each granularity band, indexed by the 2-bit granularity value.
[[nodiscard]] std::chrono::minutes relativeTimeStep(uint8_t granularity);

} // namespace mot
