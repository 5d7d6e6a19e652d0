#pragma once
// ObjectDecoder.hpp – Turns a stream of datagroups into MOT objects.
//
// Usage example:
//   ObjectDecoder decoder;
//   decoder.setErrorHandler([](const DecodeError& e) { ... });
//   for (;;) {
//       Datagroup dg = source.next();
//       for (MotObject& obj : decoder.push(std::move(dg)))
//           present(obj);
//   }
//
// In header mode objects come out one at a time as their last segment
// arrives; in directory mode a directory can complete many buffered bodies
// at once and push() returns them together.

#include "Datagroup.hpp"
#include "MotObject.hpp"
#include "ParameterRegistry.hpp"
#include "SegmentCache.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mot {

// ─────────────────────────────────────────────────────────────────────────────
//  ObjectCompiler
// ─────────────────────────────────────────────────────────────────────────────
// Assembles one complete transport id from the cache.
class ObjectCompiler {
public:
    ObjectCompiler(ParameterRegistry header_params, ParameterRegistry directory_params);

    // Build the object for `transport_id` and remove its datagroups from the
    // cache. The header comes from the transport id's own header segments
    // when they are complete, else from the cache's directory (decoded on
    // first use). Throws DirectoryLookupFailure, MissingMandatoryParameter,
    // MalformedSegment, MalformedPreamble or ValidationError, in which case
    // the transport id's datagroups stay in the cache. A directory that
    // fails to decode is erased so a later repetition can take its place.
    [[nodiscard]] MotObject compile(uint16_t transport_id, SegmentCache& cache) const;

    [[nodiscard]] const ParameterRegistry& headerParameters()    const noexcept { return header_params_; }
    [[nodiscard]] const ParameterRegistry& directoryParameters() const noexcept { return directory_params_; }

private:
    ParameterRegistry header_params_;
    ParameterRegistry directory_params_;

    const Directory& directoryOf(SegmentCache& cache) const;
};

// ─────────────────────────────────────────────────────────────────────────────
//  ObjectDecoder
// ─────────────────────────────────────────────────────────────────────────────

enum class DecodeErrorKind {
    MissingMandatoryParameter,
    DirectoryLookupFailure,
    MalformedSegment,
    MalformedPreamble,
    ValidationError,
    Other,
};

struct DecodeError {
    uint16_t        transport_id{0};
    DecodeErrorKind kind{DecodeErrorKind::Other};
    std::string     message;
};

[[nodiscard]] const char* decodeErrorKindName(DecodeErrorKind kind) noexcept;

// One decode run: owns the cache, so one instance per broadcast channel.
class ObjectDecoder {
public:
    using ErrorHandler = std::function<void(const DecodeError&)>;

    ObjectDecoder();
    ObjectDecoder(ParameterRegistry header_params, ParameterRegistry directory_params);

    // Ingest one datagroup, then compile every transport id that is now
    // complete, in ascending transport id order. An object that fails to
    // compile, for any std::exception including one thrown by a registered
    // decoder, is reported to the error handler (or logged) and dropped.
    [[nodiscard]] std::vector<MotObject> push(Datagroup dg);

    void setErrorHandler(ErrorHandler handler) { on_error_ = std::move(handler); }

    [[nodiscard]] const SegmentCache& cache() const noexcept { return cache_; }
    [[nodiscard]] SegmentCache&       cache()       noexcept { return cache_; }

    [[nodiscard]] size_t objectsEmitted() const noexcept { return emitted_; }
    [[nodiscard]] size_t errorCount()     const noexcept { return errors_; }

private:
    ObjectCompiler compiler_;
    SegmentCache   cache_;
    ErrorHandler   on_error_;
    size_t         emitted_{0};
    size_t         errors_{0};

    void report(DecodeError err);
};

// ─────────────────────────────────────────────────────────────────────────────
//  DecodeStream
// ─────────────────────────────────────────────────────────────────────────────
// Pull-based view over a datagroup source: next() reads datagroups until an
// object is available or the source is exhausted. Not restartable.
class DecodeStream {
public:
    // Returns std::nullopt when there are no more datagroups.
    using Source = std::function<std::optional<Datagroup>()>;

    explicit DecodeStream(Source source, ObjectDecoder decoder = ObjectDecoder());

    [[nodiscard]] std::optional<MotObject> next();

    [[nodiscard]] ObjectDecoder&       decoder()       noexcept { return decoder_; }
    [[nodiscard]] const ObjectDecoder& decoder() const noexcept { return decoder_; }

private:
    Source                source_;
    ObjectDecoder         decoder_;
    std::deque<MotObject> pending_;
    bool                  exhausted_{false};
};

// Decode a finite list of datagroups eagerly.
[[nodiscard]] std::vector<MotObject> decodeObjects(const std::vector<Datagroup>& datagroups,
                                                   ObjectDecoder::ErrorHandler on_error = {});

} // namespace mot
