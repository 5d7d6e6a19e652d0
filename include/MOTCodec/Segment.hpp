#pragma once
// Segment.hpp – Segment framing and the MOT header.
//
//   segment      = RepetitionCount(3) SegmentSize(13) SegmentData
//   MOT header   = core header + header extension (parameters)
//   core header  = BodySize(28) HeaderSize(13) ContentType(6) ContentSubType(9)
//
// HeaderSize counts the whole header, core header included.

#include "ContentType.hpp"
#include "MotObject.hpp"
#include "Parameter.hpp"
#include "ParameterRegistry.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mot {

class BitReader;
class BitWriter;

// ─── Segment preamble ─────────────────────────────────────────────────────────

struct SegmentHeader {
    static constexpr size_t   kSize    = 2;
    static constexpr uint16_t kMaxSize = 0x1FFF;

    uint8_t  repetition{0}; // 3 bits
    uint16_t size{0};       // 13 bits, SegmentData length in bytes

    friend bool operator==(const SegmentHeader&, const SegmentHeader&) = default;
};

struct Segment {
    SegmentHeader            header;
    std::span<const uint8_t> data; // exactly header.size bytes
};

// Throws MalformedSegment if `buf` is shorter than the preamble or than the
// SegmentSize it declares.
[[nodiscard]] Segment splitSegment(std::span<const uint8_t> buf);

// Prefix `data` with its preamble. Throws ValidationError if it does not fit.
[[nodiscard]] std::vector<uint8_t> encodeSegment(std::span<const uint8_t> data,
                                                 uint8_t repetition = 0);

// ─── Core header ──────────────────────────────────────────────────────────────

struct CoreHeader {
    static constexpr size_t   kSize          = 7;
    static constexpr uint32_t kMaxBodySize   = (1u << 28) - 1;
    static constexpr uint16_t kMaxHeaderSize = (1u << 13) - 1;

    uint32_t    body_size{0};
    uint16_t    header_size{0};
    ContentType content_type;

    friend bool operator==(const CoreHeader&, const CoreHeader&) = default;
};

[[nodiscard]] CoreHeader readCoreHeader(BitReader& br);
void writeCoreHeader(BitWriter& bw, const CoreHeader& core);

// ─── MOT header ───────────────────────────────────────────────────────────────

struct DecodedHeader {
    CoreHeader             core;
    std::vector<Parameter> params;
    std::vector<uint8_t>   skipped_ids; // unknown ParamIds stepped over
};

// Decode a complete MOT header (core header + parameters up to HeaderSize).
// Unknown parameters are skipped and listed; every other failure throws:
// MalformedSegment for framing, MalformedPreamble / ValidationError from the
// parameters.
[[nodiscard]] DecodedHeader decodeHeader(std::span<const uint8_t> data,
                                         const ParameterRegistry& registry);

// Encode the parameters of a header extension, ContentName first.
[[nodiscard]] std::vector<uint8_t> encodeHeaderParameters(const std::vector<Parameter>& params);

// Core header + parameters for `object`. Throws ValidationError if the body
// or the header does not fit its size field.
[[nodiscard]] std::vector<uint8_t> encodeHeader(const MotObject& object);

} // namespace mot
