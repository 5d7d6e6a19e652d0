// SegmentCache.cpp – Datagroup buffering and the completeness check.

#include "MOTCodec/SegmentCache.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/Log.hpp"

#include <algorithm>
#include <tuple>

namespace mot {

bool SegmentCache::ingest(Datagroup dg) {
    Entry& entry = entries_[dg.transport_id];
    if (std::find(entry.begin(), entry.end(), dg) != entry.end()) {
        logDebug("duplicate datagroup: type {} transport id {} segment {}",
                 dg.type, dg.transport_id, dg.segment_index);
        return false;
    }

    // Insert after any equal (type, index) key so arrival order is kept.
    auto pos = std::upper_bound(entry.begin(), entry.end(), dg,
        [](const Datagroup& a, const Datagroup& b) {
            return std::tie(a.type, a.segment_index) < std::tie(b.type, b.segment_index);
        });
    logDebug("cached datagroup: type {} transport id {} segment {}{}",
             dg.type, dg.transport_id, dg.segment_index, dg.last ? " (last)" : "");
    entry.insert(pos, std::move(dg));
    return true;
}

bool SegmentCache::hasCompleteRun(const Entry& entry, DatagroupType type) {
    const Datagroup* previous = nullptr;
    for (const auto& dg : entry) {
        if (!dg.is(type)) continue;
        if (previous == nullptr) {
            if (dg.segment_index != 0) return false;
        } else if (dg.segment_index == previous->segment_index) {
            continue; // retransmission with different payload; first copy wins
        } else if (dg.segment_index != previous->segment_index + 1) {
            return false;
        }
        previous = &dg;
    }
    return previous != nullptr && previous->last;
}

std::optional<uint16_t> SegmentCache::completeDirectoryId() const {
    for (const auto& [tid, entry] : entries_) {
        if (hasCompleteRun(entry, DatagroupType::Directory)) return tid;
    }
    return std::nullopt;
}

bool SegmentCache::isComplete(uint16_t transport_id) const {
    const Entry* e = entry(transport_id);
    if (e == nullptr) return false;

    if (!hasCompleteRun(*e, DatagroupType::Body)) {
        logDebug("bodies for transport id {} are not complete", transport_id);
        return false;
    }
    if (hasCompleteRun(*e, DatagroupType::Header)) return true;
    if (completeDirectoryId()) return true;

    logDebug("no complete header and no directory for transport id {}", transport_id);
    return false;
}

std::vector<uint16_t> SegmentCache::transportIds() const {
    std::vector<uint16_t> ids;
    ids.reserve(entries_.size());
    for (const auto& [tid, entry] : entries_) ids.push_back(tid);
    return ids;
}

const SegmentCache::Entry* SegmentCache::entry(uint16_t transport_id) const {
    auto it = entries_.find(transport_id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<uint8_t> SegmentCache::assemble(uint16_t transport_id, DatagroupType type) const {
    std::vector<uint8_t> out;
    const Entry* e = entry(transport_id);
    if (e == nullptr) return out;
    const Datagroup* previous = nullptr;
    for (const auto& dg : *e) {
        if (!dg.is(type)) continue;
        if (previous != nullptr && previous->segment_index == dg.segment_index) continue;
        out.insert(out.end(), dg.data.begin(), dg.data.end());
        previous = &dg;
    }
    return out;
}

void SegmentCache::setDirectory(Directory dir) {
    if (directory_)
        throw std::logic_error("SegmentCache: directory already set");
    directory_ = std::move(dir);
}

bool SegmentCache::erase(uint16_t transport_id) {
    return entries_.erase(transport_id) != 0;
}

size_t SegmentCache::evictIf(const std::function<bool(uint16_t, const Entry&)>& pred) {
    return std::erase_if(entries_, [&](const auto& item) {
        if (!pred(item.first, item.second)) return false;
        logInfo("evicting {} datagroups of transport id {}", item.second.size(), item.first);
        return true;
    });
}

} // namespace mot
