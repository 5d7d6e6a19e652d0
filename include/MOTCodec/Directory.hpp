#pragma once
// Directory.hpp – MOT directory decode / encode (ETSI EN 301 234 clause 7.2).
//
// Directory segment data:
//   Rfu(4) DirectorySize(28) NumberOfObjects(16) DataCarouselPeriod(24)
//   Rfu(3) SegmentSize(13) DirectoryExtensionLength(16)
//   DirectoryExtension          ← directory parameters
//   NumberOfObjects × { TransportId(16) core header, header parameters }
//
// DataCarouselPeriod is in tenths of a second, 0 meaning "undefined".

#include "MotObject.hpp"
#include "Parameter.hpp"
#include "ParameterRegistry.hpp"
#include "Segment.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace mot {

struct DirectoryEntry {
    uint16_t               transport_id{0};
    CoreHeader             core;
    std::vector<Parameter> params;      // decoded before any failure
    std::vector<uint8_t>   skipped_ids; // unknown ParamIds stepped over
    bool                   valid{true};
    std::string            error;
};

struct Directory {
    uint32_t directory_size{0};
    uint16_t object_count{0};
    uint32_t carousel_period{0}; // 1/10 s, 0 = undefined
    uint16_t segment_size{0};

    std::vector<Parameter> extension;
    bool                   extension_valid{true};
    std::string            extension_error;

    std::map<uint16_t, DirectoryEntry> entries;

    // nullptr if the transport id is not in the directory.
    [[nodiscard]] const DirectoryEntry* find(uint16_t transport_id) const;

    // True if the extension and every entry decoded cleanly.
    [[nodiscard]] bool valid() const;
};

// Decode a directory segment's data (preamble already stripped).
// Parameter failures are recorded per entry and decoding resumes at the
// entry's declared HeaderSize boundary; truncated framing throws
// MalformedSegment.
[[nodiscard]] Directory decodeDirectory(std::span<const uint8_t> data,
                                        const ParameterRegistry& header_params,
                                        const ParameterRegistry& directory_params);

struct DirectoryLayout {
    uint32_t               carousel_period{0};
    uint16_t               segment_size{0};
    std::vector<Parameter> extension;   // directory parameters
};

// Render a directory describing `objects`. DirectorySize and
// NumberOfObjects are computed.
[[nodiscard]] std::vector<uint8_t> encodeDirectory(const DirectoryLayout& layout,
                                                   const std::vector<MotObject>& objects);

} // namespace mot
