// ParameterRegistry.cpp – Core decoder tables and parameter-run decoding.

#include "MOTCodec/ParameterRegistry.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/Log.hpp"

#include <exception>
#include <string>

namespace mot {

// ─────────────────────────────────────────────────────────────────────────────
//  Core tables
// ─────────────────────────────────────────────────────────────────────────────

ParameterRegistry ParameterRegistry::headerParameters() {
    ParameterRegistry r{ParameterScope::Header};
    r.registerDecoder(ContentName::param_id,        decodeContentName);
    r.registerDecoder(MimeType::param_id,           decodeMimeType);
    r.registerDecoder(RelativeExpiration::param_id, decodeExpiration);
    r.registerDecoder(Compression::param_id,        decodeCompression);
    r.registerDecoder(Priority::param_id,           decodePriority);
    return r;
}

ParameterRegistry ParameterRegistry::directoryParameters() {
    ParameterRegistry r{ParameterScope::Directory};
    r.registerDecoder(SortedHeaderInformation::param_id,       decodeSortedHeaderInformation);
    r.registerDecoder(DefaultPermitOutdatedVersions::param_id, decodeDefaultPermitOutdatedVersions);
    r.registerDecoder(DefaultRelativeExpiration::param_id,     decodeDefaultExpiration);
    return r;
}

void ParameterRegistry::registerDecoder(uint8_t param_id, ParameterDecoder decoder) {
    if (param_id > kMaxParameterId)
        throw ValidationError("cannot register parameter id " + std::to_string(param_id) +
                              ": ids are 6 bits");
    if (!decoder)
        throw ValidationError("cannot register an empty decoder for parameter id " +
                              std::to_string(param_id));
    if (decoders_[param_id])
        logDebug("replacing decoder for parameter id {}", param_id);
    decoders_[param_id] = std::move(decoder);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

DecodedParameter ParameterRegistry::decode(std::span<const uint8_t> buf) const {
    const RawParameter raw = readParameter(buf);

    const auto& decoder = decoders_[raw.param_id];
    if (!decoder)
        throw UnknownParameter(raw.param_id, raw.consumed);

    DecodedParameter out{decoder(raw.payload), raw.consumed};
    if (logEnabled(LogLevel::Debug))
        logDebug("decoded {} ({} bytes)", describe(out.param), out.consumed);
    return out;
}

DecodedParameterList ParameterRegistry::decodeAll(std::span<const uint8_t> buf) const {
    DecodedParameterList out;
    size_t pos = 0;

    while (pos < buf.size()) {
        try {
            DecodedParameter dp = decode(buf.subspan(pos));
            out.params.push_back(std::move(dp.param));
            pos += dp.consumed;
        } catch (const UnknownParameter& ex) {
            logWarning("unknown parameter 0x{:02x} at offset {}, skipping {} bytes",
                       ex.paramId(), pos, ex.consumed());
            out.skipped_ids.push_back(ex.paramId());
            pos += ex.consumed();
        } catch (const std::exception& ex) {
            // Codec errors and whatever a registered decoder throws.
            out.valid = false;
            out.error = "parameter at offset " + std::to_string(pos) + ": " + ex.what();
            break;
        }
    }

    return out;
}

} // namespace mot
