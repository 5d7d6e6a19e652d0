#pragma once
// Datagroup.hpp – One MSC datagroup as handed over by the transport layer.
//
// The transport layer has already stripped the datagroup and session
// headers, the CRC and the 2-byte segment preamble: `data` is the
// SegmentData of one header, body or directory segment.

#include <cstdint>
#include <vector>

namespace mot {

// MSC datagroup types carrying MOT (EN 300 401 clause 5.3.3.1).
enum class DatagroupType : uint8_t {
    Header    = 3,
    Body      = 4,
    Directory = 6,
};

struct Datagroup {
    uint8_t              type{0};            // see DatagroupType; others reserved
    uint16_t             transport_id{0};
    uint32_t             segment_index{0};
    bool                 last{false};
    std::vector<uint8_t> data;

    [[nodiscard]] bool is(DatagroupType t) const noexcept {
        return type == static_cast<uint8_t>(t);
    }

    friend bool operator==(const Datagroup&, const Datagroup&) = default;
};

} // namespace mot
