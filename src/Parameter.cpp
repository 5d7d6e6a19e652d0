// Parameter.cpp – DataField encode / decode for the concrete parameters.

#include "MOTCodec/Parameter.hpp"
#include "MOTCodec/Errors.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>

namespace mot {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

CharacterSet toCharacterSet(uint8_t v) {
    switch (v) {
    case 0: case 1: case 2: case 3: case 4: case 15:
        return static_cast<CharacterSet>(v);
    default:
        throw ValidationError("ContentName: unknown character set " + std::to_string(v));
    }
}

void requireSize(std::span<const uint8_t> data, size_t n, const char* what) {
    if (data.size() != n)
        throw ValidationError(std::string(what) + ": expected " + std::to_string(n) +
                              " byte(s), got " + std::to_string(data.size()));
}

std::string describeTime(const std::optional<TimePoint>& tp) {
    if (!tp) return "now";
    const auto ms = (tp->time_since_epoch() % std::chrono::seconds{1}).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z",
                       fmt::gmtime(std::chrono::system_clock::to_time_t(*tp)), ms);
}

// Header-scope PLI 2 pads short DataFields with zero bytes; a name never
// ends in NUL, so those bytes are dropped.
std::string stripZeroPadding(std::span<const uint8_t> data) {
    size_t n = data.size();
    while (n > 0 && data[n - 1] == 0) --n;
    return std::string(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<uint8_t> absoluteTimePayload(const std::optional<TimePoint>& tp) {
    return encodeAbsoluteTime(tp);
}

} // namespace

Priority::Priority(unsigned value) {
    if (value < 1 || value > 255)
        throw ValidationError("Priority must be between 1 and 255, got " +
                              std::to_string(value));
    value_ = static_cast<uint8_t>(value);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Kind / id / scope
// ─────────────────────────────────────────────────────────────────────────────

ParameterKind kindOf(const Parameter& p) noexcept {
    return static_cast<ParameterKind>(p.index());
}

ParameterKey keyOf(const Parameter& p) noexcept {
    if (const auto* ext = std::get_if<ExtensionParameter>(&p))
        return {ParameterKind::Extension, ext->id};
    return {kindOf(p), 0};
}

uint8_t paramIdOf(const Parameter& p) noexcept {
    return std::visit(overloaded{
        [](const ExtensionParameter& e) { return e.id; },
        [](const auto& v) { return std::decay_t<decltype(v)>::param_id; },
    }, p);
}

ParameterScope scopeOf(const Parameter& p) noexcept {
    switch (kindOf(p)) {
    case ParameterKind::SortedHeaderInformation:
    case ParameterKind::DefaultPermitOutdatedVersions:
    case ParameterKind::DefaultRelativeExpiration:
    case ParameterKind::DefaultAbsoluteExpiration:
        return ParameterScope::Directory;
    case ParameterKind::Extension:
        return std::get<ExtensionParameter>(p).scope;
    default:
        return ParameterScope::Header;
    }
}

const char* kindName(ParameterKind kind) noexcept {
    switch (kind) {
    case ParameterKind::ContentName:                   return "ContentName";
    case ParameterKind::MimeType:                      return "MimeType";
    case ParameterKind::RelativeExpiration:            return "RelativeExpiration";
    case ParameterKind::AbsoluteExpiration:            return "AbsoluteExpiration";
    case ParameterKind::Compression:                   return "Compression";
    case ParameterKind::Priority:                      return "Priority";
    case ParameterKind::SortedHeaderInformation:       return "SortedHeaderInformation";
    case ParameterKind::DefaultPermitOutdatedVersions: return "DefaultPermitOutdatedVersions";
    case ParameterKind::DefaultRelativeExpiration:     return "DefaultRelativeExpiration";
    case ParameterKind::DefaultAbsoluteExpiration:     return "DefaultAbsoluteExpiration";
    case ParameterKind::Extension:                     return "Extension";
    }
    return "?";
}

std::string describe(const Parameter& p) {
    const char* kind = kindName(kindOf(p));
    return std::visit(overloaded{
        [&](const ContentName& v)   { return fmt::format("{} \"{}\" (charset {})", kind, v.name,
                                                         static_cast<int>(v.charset)); },
        [&](const MimeType& v)      { return fmt::format("{} \"{}\"", kind, v.mime); },
        [&](const RelativeExpiration& v)        { return fmt::format("{} {}", kind, v.offset); },
        [&](const DefaultRelativeExpiration& v) { return fmt::format("{} {}", kind, v.offset); },
        [&](const AbsoluteExpiration& v)        { return fmt::format("{} {}", kind, describeTime(v.time)); },
        [&](const DefaultAbsoluteExpiration& v) { return fmt::format("{} {}", kind, describeTime(v.time)); },
        [&](const Compression& v)   { return fmt::format("{} {}", kind,
                                                         v.type == CompressionType::Gzip ? "gzip" : "reserved"); },
        [&](const Priority& v)      { return fmt::format("{} {}", kind, v.value()); },
        [&](const SortedHeaderInformation&)        { return std::string(kind); },
        [&](const DefaultPermitOutdatedVersions& v) { return fmt::format("{} {}", kind, v.permit); },
        [&](const ExtensionParameter& v) {
            switch (v.encoding) {
            case ExtensionEncoding::String:
                return fmt::format("{} \"{}\"", v.name, std::string(v.data.begin(), v.data.end()));
            case ExtensionEncoding::UInt8:
                return fmt::format("{} {}", v.name, v.data.at(0));
            case ExtensionEncoding::AbsoluteTime:
                return fmt::format("{} {}", v.name, describeTime(decodeAbsoluteTime(v.data)));
            case ExtensionEncoding::RelativeTime:
                return fmt::format("{} {}", v.name, decodeRelativeTime(v.data.at(0)));
            case ExtensionEncoding::Raw:
                break;
            }
            return fmt::format("{} 0x{:02x} {} [{} bytes]", kind, v.id, v.name, v.data.size());
        },
    }, p);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> encodePayload(const Parameter& p) {
    return std::visit(overloaded{
        [](const ContentName& v) {
            std::vector<uint8_t> out;
            out.reserve(1 + v.name.size());
            out.push_back(static_cast<uint8_t>(static_cast<uint8_t>(v.charset) << 4)); // charset(4) rfa(4)
            out.insert(out.end(), v.name.begin(), v.name.end());
            return out;
        },
        [](const MimeType& v) {
            return std::vector<uint8_t>(v.mime.begin(), v.mime.end());
        },
        [](const RelativeExpiration& v) {
            return std::vector<uint8_t>{encodeRelativeTime(v.offset)};
        },
        [](const AbsoluteExpiration& v) { return absoluteTimePayload(v.time); },
        [](const Compression& v) {
            return std::vector<uint8_t>{static_cast<uint8_t>(v.type)};
        },
        [](const Priority& v) { return std::vector<uint8_t>{v.value()}; },
        [](const SortedHeaderInformation&) { return std::vector<uint8_t>{}; },
        [](const DefaultPermitOutdatedVersions& v) {
            return std::vector<uint8_t>{static_cast<uint8_t>(v.permit ? 1 : 0)};
        },
        [](const DefaultRelativeExpiration& v) {
            return std::vector<uint8_t>{encodeRelativeTime(v.offset)};
        },
        [](const DefaultAbsoluteExpiration& v) { return absoluteTimePayload(v.time); },
        [](const ExtensionParameter& v) { return v.data; },
    }, p);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

Parameter decodeContentName(std::span<const uint8_t> data) {
    if (data.empty())
        throw ValidationError("ContentName: empty DataField");
    ContentName cn;
    cn.charset = toCharacterSet(static_cast<uint8_t>(data[0] >> 4));
    cn.name = stripZeroPadding(data.subspan(1));
    return cn;
}

Parameter decodeMimeType(std::span<const uint8_t> data) {
    return MimeType{stripZeroPadding(data)};
}

// The DataField size selects the flavour.
Parameter decodeExpiration(std::span<const uint8_t> data) {
    switch (data.size()) {
    case 1:
        return RelativeExpiration{decodeRelativeTime(data[0])};
    case 4:
    case 6:
        return AbsoluteExpiration{decodeAbsoluteTime(data)};
    default:
        throw ValidationError("Expiration: unsupported DataField size " +
                              std::to_string(data.size()));
    }
}

Parameter decodeCompression(std::span<const uint8_t> data) {
    requireSize(data, 1, "Compression");
    if (data[0] > static_cast<uint8_t>(CompressionType::Gzip))
        throw ValidationError("Compression: unknown type " + std::to_string(data[0]));
    return Compression{static_cast<CompressionType>(data[0])};
}

Parameter decodePriority(std::span<const uint8_t> data) {
    requireSize(data, 1, "Priority");
    return Priority{data[0]};
}

Parameter decodeSortedHeaderInformation(std::span<const uint8_t> data) {
    requireSize(data, 0, "SortedHeaderInformation");
    return SortedHeaderInformation{};
}

Parameter decodeDefaultPermitOutdatedVersions(std::span<const uint8_t> data) {
    requireSize(data, 1, "DefaultPermitOutdatedVersions");
    return DefaultPermitOutdatedVersions{data[0] != 0};
}

Parameter decodeDefaultExpiration(std::span<const uint8_t> data) {
    switch (data.size()) {
    case 1:
        return DefaultRelativeExpiration{decodeRelativeTime(data[0])};
    case 4:
    case 6:
        return DefaultAbsoluteExpiration{decodeAbsoluteTime(data)};
    default:
        throw ValidationError("DefaultExpiration: unsupported DataField size " +
                              std::to_string(data.size()));
    }
}

ExtensionParameter makeExtensionParameter(uint8_t id, std::string name,
                                          ParameterScope scope,
                                          ExtensionEncoding encoding,
                                          std::span<const uint8_t> data) {
    switch (encoding) {
    case ExtensionEncoding::Raw:
    case ExtensionEncoding::String:
        break;
    case ExtensionEncoding::UInt8:
        requireSize(data, 1, name.c_str());
        break;
    case ExtensionEncoding::AbsoluteTime:
        (void)decodeAbsoluteTime(data); // throws on malformed time
        break;
    case ExtensionEncoding::RelativeTime:
        requireSize(data, 1, name.c_str());
        break;
    }
    return ExtensionParameter{id, std::move(name), scope, encoding,
                              std::vector<uint8_t>(data.begin(), data.end())};
}

} // namespace mot
