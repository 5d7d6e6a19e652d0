// TimeCodec.cpp – MJD/UTC and granularity-banded relative time.

#include "MOTCodec/TimeCodec.hpp"
#include "MOTCodec/BitStream.hpp"
#include "MOTCodec/Errors.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace mot {

using namespace std::chrono;

// ─────────────────────────────────────────────────────────────────────────────
//  Absolute time
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> encodeAbsoluteTime(const std::optional<TimePoint>& tp) {
    if (!tp) return std::vector<uint8_t>(4, 0);

    const sys_days day  = std::chrono::floor<days>(*tp);
    const auto     tod  = hh_mm_ss<milliseconds>{*tp - day};
    const int64_t  mjd  = day.time_since_epoch().count() + kUnixEpochMjd;
    if (mjd < 0 || mjd >= (int64_t{1} << 17))
        throw ValidationError("absolute time outside the 17-bit MJD range (MJD " +
                              std::to_string(mjd) + ")");

    const bool long_form = tod.seconds().count() != 0;

    BitWriter bw;
    bw.writeBit(true);                                    // ValidityFlag
    bw.writeU(static_cast<uint64_t>(mjd), 17);            // MJD
    bw.writeU(0, 2);                                      // Rfu
    bw.writeBit(long_form);                               // UTCFlag
    bw.writeU(static_cast<uint64_t>(tod.hours().count()), 5);
    bw.writeU(static_cast<uint64_t>(tod.minutes().count()), 6);
    if (long_form) {
        bw.writeU(static_cast<uint64_t>(tod.seconds().count()), 6);
        bw.writeU(static_cast<uint64_t>(tod.subseconds().count()), 10);
    }
    return bw.take();
}

std::optional<TimePoint> decodeAbsoluteTime(std::span<const uint8_t> data) {
    if (data.size() != 4 && data.size() != 6)
        throw ValidationError("absolute time must be 4 or 6 bytes, got " +
                              std::to_string(data.size()));

    if (std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; }))
        return std::nullopt;

    BitReader br{data};
    br.skip(1);                                           // ValidityFlag
    const auto mjd       = static_cast<int64_t>(br.readU(17));
    br.skip(2);                                           // Rfu
    const bool long_form = br.readBit();
    const auto hour      = br.readU(5);
    const auto minute    = br.readU(6);
    uint64_t second = 0, millis = 0;
    if (long_form) {
        if (data.size() != 6)
            throw ValidationError("absolute time: UTC long form needs 6 bytes");
        second = br.readU(6);
        millis = br.readU(10);
    }

    if (hour > 23 || minute > 59 || second > 59 || millis > 999)
        throw ValidationError("absolute time: field out of range");

    const sys_days day{days{mjd - kUnixEpochMjd}};
    return TimePoint{day} + hours{hour} + minutes{minute} +
           seconds{second} + milliseconds{millis};
}

// ─────────────────────────────────────────────────────────────────────────────
//  Relative time
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::array<minutes, 4> kSteps{minutes{2}, minutes{30}, hours{2}, days{1}};

// Exclusive upper bound of each band (63 steps plus the rounding slack).
constexpr std::array<seconds, 3> kBandLimits{minutes{127}, minutes{1891}, hours{127}};

constexpr days kMaxRelative{63};

} // namespace

minutes relativeTimeStep(uint8_t granularity) {
    return kSteps.at(granularity & 0x03u);
}

uint8_t encodeRelativeTime(seconds offset) {
    if (offset < seconds::zero())
        throw ValidationError("relative time must not be negative");
    if (offset > kMaxRelative)
        throw ValidationError("relative time " + std::to_string(offset.count()) +
                              "s exceeds the maximum of 63 days");

    uint8_t granularity = 3;
    for (uint8_t g = 0; g < kBandLimits.size(); ++g) {
        if (offset < kBandLimits[g]) { granularity = g; break; }
    }

    const auto interval = std::chrono::floor<minutes>(offset) / kSteps[granularity];
    return static_cast<uint8_t>((granularity << 6) | (interval & 0x3F));
}

minutes decodeRelativeTime(uint8_t data) {
    return relativeTimeStep(static_cast<uint8_t>(data >> 6)) * static_cast<int>(data & 0x3Fu);
}

} // namespace mot
