// Directory.cpp – MOT directory decode (best effort per entry) and encode.

#include "MOTCodec/Directory.hpp"
#include "MOTCodec/BitStream.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/Log.hpp"
#include "MOTCodec/ParameterCodec.hpp"

#include <string>

namespace mot {

namespace {
// Everything before the DirectoryExtension.
constexpr size_t kDirectoryHeaderSize = 13;
constexpr size_t kMaxDirectorySize    = (1u << 28) - 1;
constexpr uint32_t kMaxCarouselPeriod = (1u << 24) - 1;
}

const DirectoryEntry* Directory::find(uint16_t transport_id) const {
    auto it = entries.find(transport_id);
    return it == entries.end() ? nullptr : &it->second;
}

bool Directory::valid() const {
    if (!extension_valid) return false;
    for (const auto& [tid, entry] : entries)
        if (!entry.valid) return false;
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

Directory decodeDirectory(std::span<const uint8_t> data,
                          const ParameterRegistry& header_params,
                          const ParameterRegistry& directory_params) {
    logDebug("decoding directory from {} bytes", data.size());
    if (data.size() < kDirectoryHeaderSize)
        throw MalformedSegment("directory shorter than its 13-byte header");

    Directory dir;
    BitReader br{data};
    br.skip(4);                                                 // Rfu
    dir.directory_size  = static_cast<uint32_t>(br.readU(28));
    dir.object_count    = static_cast<uint16_t>(br.readU(16));
    dir.carousel_period = static_cast<uint32_t>(br.readU(24));
    br.skip(3);                                                 // Rfu
    dir.segment_size    = static_cast<uint16_t>(br.readU(13));
    const auto ext_len  = static_cast<size_t>(br.readU(16));

    if (dir.directory_size != data.size())
        logDebug("DirectorySize {} differs from the {} bytes received",
                 dir.directory_size, data.size());
    if (dir.carousel_period > 0)
        logDebug("directory: {} objects, carousel period {:.1f}s, segment size {}",
                 dir.object_count, dir.carousel_period / 10.0, dir.segment_size);
    else
        logDebug("directory: {} objects, carousel period undefined, segment size {}",
                 dir.object_count, dir.segment_size);

    // ── Directory extension ─────────────────────────────────────────────────
    {
        const auto ext_bytes = br.readSpan(ext_len);
        DecodedParameterList ext = directory_params.decodeAll(ext_bytes);
        dir.extension       = std::move(ext.params);
        dir.extension_valid = ext.valid;
        dir.extension_error = std::move(ext.error);
        if (!dir.extension_valid)
            logError("directory extension: {}", dir.extension_error);
    }

    // ── Header entries ──────────────────────────────────────────────────────
    for (uint16_t n = 0; n < dir.object_count; ++n) {
        DirectoryEntry entry;
        entry.transport_id = static_cast<uint16_t>(br.readU(16));

        const size_t core_start = br.bytesRead();
        entry.core = readCoreHeader(br);

        if (entry.core.header_size < CoreHeader::kSize)
            throw MalformedSegment("directory entry for transport id " +
                                   std::to_string(entry.transport_id) + ": HeaderSize " +
                                   std::to_string(entry.core.header_size) +
                                   " is smaller than the core header");
        if (core_start + entry.core.header_size > data.size())
            throw MalformedSegment("directory entry for transport id " +
                                   std::to_string(entry.transport_id) +
                                   " runs past the end of the directory");

        const auto param_bytes = br.readSpan(entry.core.header_size - CoreHeader::kSize);
        DecodedParameterList params = header_params.decodeAll(param_bytes);
        entry.params      = std::move(params.params);
        entry.skipped_ids = std::move(params.skipped_ids);
        entry.valid       = params.valid;
        entry.error       = std::move(params.error);
        if (!entry.valid)
            logError("directory entry for transport id {}: {} – skipping rest of its parameters",
                     entry.transport_id, entry.error);

        logDebug("directory entry: transport id {}, {} parameters, content type {}",
                 entry.transport_id, entry.params.size(), toString(entry.core.content_type));

        if (dir.entries.count(entry.transport_id))
            logWarning("directory lists transport id {} twice, keeping the last entry",
                       entry.transport_id);
        dir.entries.insert_or_assign(entry.transport_id, std::move(entry));
    }

    if (!br.atEnd())
        logDebug("{} bytes after the last directory entry", br.bytesAvailable());

    return dir;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> encodeDirectory(const DirectoryLayout& layout,
                                     const std::vector<MotObject>& objects) {
    if (objects.size() > 0xFFFF)
        throw ValidationError("a directory holds at most 65535 objects");
    if (layout.carousel_period > kMaxCarouselPeriod)
        throw ValidationError("carousel period does not fit in 24 bits");
    if (layout.segment_size > SegmentHeader::kMaxSize)
        throw ValidationError("segment size does not fit in 13 bits");

    std::vector<uint8_t> extension;
    for (const auto& p : layout.extension) {
        if (scopeOf(p) != ParameterScope::Directory)
            throw ValidationError(std::string(kindName(kindOf(p))) +
                                  " is not a directory parameter");
        const auto bytes = encodeParameter(p);
        extension.insert(extension.end(), bytes.begin(), bytes.end());
    }
    if (extension.size() > 0xFFFF)
        throw ValidationError("directory extension exceeds 65535 bytes");

    BitWriter entries;
    for (const auto& object : objects) {
        entries.writeU(object.transportId(), 16);
        entries.writeBytes(encodeHeader(object));
    }

    const size_t total = kDirectoryHeaderSize + extension.size() + entries.buffer().size();
    if (total > kMaxDirectorySize)
        throw ValidationError("directory of " + std::to_string(total) +
                              " bytes exceeds the 28-bit DirectorySize");

    BitWriter bw;
    bw.writeU(0, 4);                                            // Rfu
    bw.writeU(total, 28);
    bw.writeU(objects.size(), 16);
    bw.writeU(layout.carousel_period, 24);
    bw.writeU(0, 3);                                            // Rfu
    bw.writeU(layout.segment_size, 13);
    bw.writeU(extension.size(), 16);
    bw.writeBytes(extension);
    bw.writeBytes(entries.buffer());
    return bw.take();
}

} // namespace mot
