#pragma once
// ParameterRegistry.hpp – ParamId → DataField decoder dispatch table.
//
// Usage example:
//   auto headers = ParameterRegistry::headerParameters();
//   headers.registerDecoder(0x25, [](std::span<const uint8_t> d) -> Parameter {
//       return makeExtensionParameter(0x25, "ScopeStart", ParameterScope::Header,
//                                     ExtensionEncoding::AbsoluteTime, d);
//   });
//   DecodedParameter p = headers.decode(segment_bytes);
//
// A registry is a plain value: build one per scope at start-up, extend it,
// then hand it to the decoder that needs it.

#include "Parameter.hpp"
#include "ParameterCodec.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace mot {

using ParameterDecoder = std::function<Parameter(std::span<const uint8_t>)>;

struct DecodedParameter {
    Parameter param;
    size_t    consumed{0}; // bytes, preamble included
};

// Result of decoding a run of parameters best-effort.
struct DecodedParameterList {
    std::vector<Parameter> params;
    std::vector<uint8_t>   skipped_ids; // unknown ParamIds stepped over
    bool        valid{true};
    std::string error;                  // first hard failure, if any
};

class ParameterRegistry {
public:
    explicit ParameterRegistry(ParameterScope scope) noexcept : scope_(scope) {}

    // Registries pre-loaded with the core parameters of each scope.
    [[nodiscard]] static ParameterRegistry headerParameters();
    [[nodiscard]] static ParameterRegistry directoryParameters();

    // Install (or replace) the decoder for a ParamId. Throws ValidationError
    // for ids above 63 or an empty decoder.
    void registerDecoder(uint8_t param_id, ParameterDecoder decoder);

    [[nodiscard]] bool contains(uint8_t param_id) const noexcept {
        return param_id <= kMaxParameterId && static_cast<bool>(decoders_[param_id]);
    }

    [[nodiscard]] ParameterScope scope() const noexcept { return scope_; }

    // Decode the parameter at the start of `buf`.
    // Throws MalformedPreamble, UnknownParameter (with the consumed length),
    // or whatever the DataField decoder throws (usually ValidationError).
    [[nodiscard]] DecodedParameter decode(std::span<const uint8_t> buf) const;

    // Decode parameters until `buf` is exhausted. Unknown ids are skipped;
    // any other failure stops the run and is reported in .valid / .error
    // with the parameters decoded so far.
    [[nodiscard]] DecodedParameterList decodeAll(std::span<const uint8_t> buf) const;

private:
    ParameterScope scope_;
    std::array<ParameterDecoder, kMaxParameterId + 1> decoders_{};
};

} // namespace mot
