// ObjectDecoder.cpp – Object compilation and the datagroup-driven pipeline.

#include "MOTCodec/ObjectDecoder.hpp"
#include "MOTCodec/Directory.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/Log.hpp"
#include "MOTCodec/Segment.hpp"

#include <exception>
#include <string>

namespace mot {

// ─────────────────────────────────────────────────────────────────────────────
//  ObjectCompiler
// ─────────────────────────────────────────────────────────────────────────────

ObjectCompiler::ObjectCompiler(ParameterRegistry header_params,
                               ParameterRegistry directory_params)
    : header_params_(std::move(header_params)),
      directory_params_(std::move(directory_params)) {}

const Directory& ObjectCompiler::directoryOf(SegmentCache& cache) const {
    if (const Directory* dir = cache.directory()) return *dir;

    const auto dir_tid = cache.completeDirectoryId();
    if (!dir_tid)
        throw MalformedSegment("no complete directory in the cache");

    logDebug("decoding directory carried on transport id {}", *dir_tid);
    const auto data = cache.assemble(*dir_tid, DatagroupType::Directory);
    try {
        cache.setDirectory(decodeDirectory(data, header_params_, directory_params_));
    } catch (const MotError& ex) {
        // Drop the bad copy so the next carousel repetition can replace it.
        logWarning("directory on transport id {} is unusable: {}", *dir_tid, ex.what());
        cache.erase(*dir_tid);
        throw;
    }
    return *cache.directory();
}

MotObject ObjectCompiler::compile(uint16_t transport_id, SegmentCache& cache) const {
    logDebug("compiling object with transport id {}", transport_id);

    ContentType            content_type;
    std::vector<Parameter> params;

    const SegmentCache::Entry* entry = cache.entry(transport_id);
    if (entry == nullptr)
        throw MalformedSegment("transport id " + std::to_string(transport_id) + " is not cached");

    if (SegmentCache::hasCompleteRun(*entry, DatagroupType::Header)) {
        const auto header = cache.assemble(transport_id, DatagroupType::Header);
        DecodedHeader decoded = decodeHeader(header, header_params_);
        content_type = decoded.core.content_type;
        params       = std::move(decoded.params);
    } else {
        const Directory& dir = directoryOf(cache);
        const DirectoryEntry* dir_entry = dir.find(transport_id);
        if (dir_entry == nullptr)
            throw DirectoryLookupFailure(transport_id);
        if (!dir_entry->valid)
            logWarning("transport id {}: directory entry is incomplete ({})",
                       transport_id, dir_entry->error);
        content_type = dir_entry->core.content_type;
        params       = dir_entry->params;
    }

    const ContentName* name = nullptr;
    for (const auto& p : params) {
        if (const auto* cn = std::get_if<ContentName>(&p)) {
            if (name != nullptr)
                throw ValidationError("transport id " + std::to_string(transport_id) +
                                      ": more than one ContentName");
            name = cn;
        }
    }
    if (name == nullptr)
        throw MissingMandatoryParameter("transport id " + std::to_string(transport_id) +
                                        ": no ContentName parameter");

    MotObject object{*name, cache.assemble(transport_id, DatagroupType::Body),
                     content_type, transport_id};
    for (auto& p : params) {
        if (kindOf(p) != ParameterKind::ContentName) object.addParameter(std::move(p));
    }

    cache.erase(transport_id);
    if (logEnabled(LogLevel::Info))
        logInfo("compiled object {} ({} bytes, {})", object.toString(), object.body().size(),
                toString(content_type));
    return object;
}

// ─────────────────────────────────────────────────────────────────────────────
//  ObjectDecoder
// ─────────────────────────────────────────────────────────────────────────────

const char* decodeErrorKindName(DecodeErrorKind kind) noexcept {
    switch (kind) {
    case DecodeErrorKind::MissingMandatoryParameter: return "missing mandatory parameter";
    case DecodeErrorKind::DirectoryLookupFailure:    return "directory lookup failure";
    case DecodeErrorKind::MalformedSegment:          return "malformed segment";
    case DecodeErrorKind::MalformedPreamble:         return "malformed preamble";
    case DecodeErrorKind::ValidationError:           return "validation error";
    case DecodeErrorKind::Other:                     return "error";
    }
    return "?";
}

ObjectDecoder::ObjectDecoder()
    : ObjectDecoder(ParameterRegistry::headerParameters(),
                    ParameterRegistry::directoryParameters()) {}

ObjectDecoder::ObjectDecoder(ParameterRegistry header_params,
                             ParameterRegistry directory_params)
    : compiler_(std::move(header_params), std::move(directory_params)) {}

void ObjectDecoder::report(DecodeError err) {
    ++errors_;
    if (on_error_) {
        on_error_(err);
        return;
    }
    logError("transport id {}: {}: {}", err.transport_id,
             decodeErrorKindName(err.kind), err.message);
}

std::vector<MotObject> ObjectDecoder::push(Datagroup dg) {
    std::vector<MotObject> out;
    cache_.ingest(std::move(dg));

    for (uint16_t tid : cache_.transportIds()) {
        if (!cache_.isComplete(tid)) continue;

        DecodeError err{tid, DecodeErrorKind::Other, {}};
        try {
            out.push_back(compiler_.compile(tid, cache_));
            ++emitted_;
            continue;
        } catch (const MissingMandatoryParameter& ex) {
            err.kind = DecodeErrorKind::MissingMandatoryParameter; err.message = ex.what();
        } catch (const DirectoryLookupFailure& ex) {
            err.kind = DecodeErrorKind::DirectoryLookupFailure; err.message = ex.what();
        } catch (const MalformedSegment& ex) {
            err.kind = DecodeErrorKind::MalformedSegment; err.message = ex.what();
        } catch (const MalformedPreamble& ex) {
            err.kind = DecodeErrorKind::MalformedPreamble; err.message = ex.what();
        } catch (const ValidationError& ex) {
            err.kind = DecodeErrorKind::ValidationError; err.message = ex.what();
        } catch (const std::exception& ex) {
            err.message = ex.what();
        }

        // The object is dropped; its transport id starts over.
        cache_.erase(tid);
        report(std::move(err));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  DecodeStream
// ─────────────────────────────────────────────────────────────────────────────

DecodeStream::DecodeStream(Source source, ObjectDecoder decoder)
    : source_(std::move(source)), decoder_(std::move(decoder)) {}

std::optional<MotObject> DecodeStream::next() {
    while (pending_.empty() && !exhausted_) {
        std::optional<Datagroup> dg = source_();
        if (!dg) {
            exhausted_ = true;
            logDebug("datagroup source exhausted, {} transport ids left incomplete",
                     decoder_.cache().size());
            break;
        }
        for (auto& obj : decoder_.push(std::move(*dg)))
            pending_.push_back(std::move(obj));
    }

    if (pending_.empty()) return std::nullopt;
    MotObject obj = std::move(pending_.front());
    pending_.pop_front();
    return obj;
}

std::vector<MotObject> decodeObjects(const std::vector<Datagroup>& datagroups,
                                     ObjectDecoder::ErrorHandler on_error) {
    ObjectDecoder decoder;
    decoder.setErrorHandler(std::move(on_error));

    std::vector<MotObject> out;
    for (const auto& dg : datagroups) {
        for (auto& obj : decoder.push(dg)) out.push_back(std::move(obj));
    }
    return out;
}

} // namespace mot
