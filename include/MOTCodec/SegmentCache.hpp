#pragma once
// SegmentCache.hpp – Datagroups buffered per transport id, and the
// completeness rule that decides when an object can be compiled.
//
// A transport id is complete when
//   • its body segments run 0, 1, …, n without gaps and segment n is last,
//   • AND either its header segments satisfy the same rule, or some entry in
//     the cache holds a complete directory (directory mode: one directory
//     stands in for the headers of every object in the carousel).
// The header is checked before the directory, so header-mode objects never
// wait on directory timing.

#include "Datagroup.hpp"
#include "Directory.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace mot {

class SegmentCache {
public:
    using Entry = std::vector<Datagroup>; // sorted by (type, segment_index)

    // Store a datagroup under its transport id. A datagroup equal to one
    // already stored is dropped. Returns whether it was new.
    bool ingest(Datagroup dg);

    [[nodiscard]] bool isComplete(uint16_t transport_id) const;

    // True if `entry` holds segments 0…n of `type` with segment n flagged last.
    [[nodiscard]] static bool hasCompleteRun(const Entry& entry, DatagroupType type);

    [[nodiscard]] bool   contains(uint16_t transport_id) const { return entries_.count(transport_id) != 0; }
    [[nodiscard]] size_t size()  const noexcept { return entries_.size(); }
    [[nodiscard]] bool   empty() const noexcept { return entries_.empty(); }

    // Ascending.
    [[nodiscard]] std::vector<uint16_t> transportIds() const;

    // nullptr if nothing is stored for the transport id.
    [[nodiscard]] const Entry* entry(uint16_t transport_id) const;

    // SegmentData of every stored segment of `type`, in segment order.
    [[nodiscard]] std::vector<uint8_t> assemble(uint16_t transport_id, DatagroupType type) const;

    // Transport id of the first entry holding a complete directory.
    [[nodiscard]] std::optional<uint16_t> completeDirectoryId() const;

    // The decoded directory, once somebody has decoded it. Set at most once
    // per cache lifetime.
    [[nodiscard]] const Directory* directory() const noexcept {
        return directory_ ? &*directory_ : nullptr;
    }
    void setDirectory(Directory dir);

    // Remove a transport id's datagroups. Returns whether it was present.
    bool erase(uint16_t transport_id);

    // Eviction hook for stale partial objects; the policy belongs to the
    // caller. Returns the number of transport ids removed.
    size_t evictIf(const std::function<bool(uint16_t, const Entry&)>& pred);

private:
    std::map<uint16_t, Entry> entries_;
    std::optional<Directory>  directory_;
};

} // namespace mot
