// Segment.cpp – Segment preamble, core header and MOT header codec.

#include "MOTCodec/Segment.hpp"
#include "MOTCodec/BitStream.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/Log.hpp"
#include "MOTCodec/ParameterCodec.hpp"

#include <string>

namespace mot {

// ─────────────────────────────────────────────────────────────────────────────
//  Segment preamble
// ─────────────────────────────────────────────────────────────────────────────

Segment splitSegment(std::span<const uint8_t> buf) {
    if (buf.size() < SegmentHeader::kSize)
        throw MalformedSegment("segment shorter than its 2-byte preamble");

    BitReader br{buf};
    Segment seg;
    seg.header.repetition = static_cast<uint8_t>(br.readU(3));
    seg.header.size       = static_cast<uint16_t>(br.readU(13));

    if (seg.header.size > buf.size() - SegmentHeader::kSize)
        throw MalformedSegment("segment declares " + std::to_string(seg.header.size) +
                               " bytes, " + std::to_string(buf.size() - SegmentHeader::kSize) +
                               " present");
    seg.data = buf.subspan(SegmentHeader::kSize, seg.header.size);
    return seg;
}

std::vector<uint8_t> encodeSegment(std::span<const uint8_t> data, uint8_t repetition) {
    if (data.size() > SegmentHeader::kMaxSize)
        throw ValidationError("segment of " + std::to_string(data.size()) +
                              " bytes exceeds the 13-bit SegmentSize");
    if (repetition > 7)
        throw ValidationError("repetition count must fit in 3 bits");

    BitWriter bw;
    bw.writeU(repetition, 3);
    bw.writeU(data.size(), 13);
    bw.writeBytes(data);
    return bw.take();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Core header
// ─────────────────────────────────────────────────────────────────────────────

CoreHeader readCoreHeader(BitReader& br) {
    CoreHeader core;
    core.body_size            = static_cast<uint32_t>(br.readU(28));
    core.header_size          = static_cast<uint16_t>(br.readU(13));
    core.content_type.type    = static_cast<uint8_t>(br.readU(6));
    core.content_type.subtype = static_cast<uint16_t>(br.readU(9));
    return core;
}

void writeCoreHeader(BitWriter& bw, const CoreHeader& core) {
    bw.writeU(core.body_size, 28);
    bw.writeU(core.header_size, 13);
    bw.writeU(core.content_type.type, 6);
    bw.writeU(core.content_type.subtype, 9);
}

// ─────────────────────────────────────────────────────────────────────────────
//  MOT header
// ─────────────────────────────────────────────────────────────────────────────

DecodedHeader decodeHeader(std::span<const uint8_t> data, const ParameterRegistry& registry) {
    if (data.size() < CoreHeader::kSize)
        throw MalformedSegment("MOT header shorter than its 7-byte core header");

    BitReader br{data};
    DecodedHeader out;
    out.core = readCoreHeader(br);
    logDebug("core header: body={} bytes, header={} bytes, content type={}",
             out.core.body_size, out.core.header_size, toString(out.core.content_type));

    if (out.core.header_size < CoreHeader::kSize)
        throw MalformedSegment("HeaderSize " + std::to_string(out.core.header_size) +
                               " is smaller than the core header");
    if (out.core.header_size > data.size())
        throw MalformedSegment("HeaderSize " + std::to_string(out.core.header_size) +
                               " exceeds the " + std::to_string(data.size()) +
                               " bytes of header data");
    if (out.core.header_size < data.size())
        logDebug("ignoring {} bytes after the declared header end",
                 data.size() - out.core.header_size);

    const auto extension = data.subspan(CoreHeader::kSize,
                                        out.core.header_size - CoreHeader::kSize);
    size_t pos = 0;
    while (pos < extension.size()) {
        try {
            DecodedParameter dp = registry.decode(extension.subspan(pos));
            out.params.push_back(std::move(dp.param));
            pos += dp.consumed;
        } catch (const UnknownParameter& ex) {
            logWarning("unknown header parameter 0x{:02x} at offset {}",
                       ex.paramId(), CoreHeader::kSize + pos);
            out.skipped_ids.push_back(ex.paramId());
            pos += ex.consumed();
        }
    }
    return out;
}

std::vector<uint8_t> encodeHeaderParameters(const std::vector<Parameter>& params) {
    std::vector<uint8_t> out;
    auto append = [&out](const Parameter& p) {
        const auto bytes = encodeParameter(p);
        out.insert(out.end(), bytes.begin(), bytes.end());
    };
    for (const auto& p : params)
        if (kindOf(p) == ParameterKind::ContentName) append(p);
    for (const auto& p : params)
        if (kindOf(p) != ParameterKind::ContentName) append(p);
    return out;
}

std::vector<uint8_t> encodeHeader(const MotObject& object) {
    const auto extension = encodeHeaderParameters(object.parameters());

    if (object.body().size() > CoreHeader::kMaxBodySize)
        throw ValidationError("body of " + std::to_string(object.body().size()) +
                              " bytes exceeds the 28-bit BodySize");
    const size_t header_size = CoreHeader::kSize + extension.size();
    if (header_size > CoreHeader::kMaxHeaderSize)
        throw ValidationError("header of " + std::to_string(header_size) +
                              " bytes exceeds the 13-bit HeaderSize");

    BitWriter bw;
    writeCoreHeader(bw, CoreHeader{static_cast<uint32_t>(object.body().size()),
                                   static_cast<uint16_t>(header_size),
                                   object.contentType()});
    bw.writeBytes(extension);
    return bw.take();
}

} // namespace mot
