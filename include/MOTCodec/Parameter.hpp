#pragma once
// Parameter.hpp – The concrete MOT header and directory parameters.
//
// A Parameter is a tagged variant; each alternative knows its 6-bit
// ParamId and how to render / parse its DataField. The PLI preamble around
// the DataField is added by ParameterCodec.
//
//   header parameters (TS 101 756 / EN 301 234 clause 6.2)
//     ContentName            12   charset(4) rfa(4) name bytes
//     MimeType               16   MIME string
//     Relative/AbsoluteExp.   4   relative (1 B) or absolute (4/6 B) time
//     Compression            17   1 byte
//     Priority               10   1 byte, 1–255
//   directory parameters (clause 7.2.7)
//     SortedHeaderInformation        0   empty
//     DefaultPermitOutdatedVersions  1   1 byte boolean
//     DefaultRelative/AbsoluteExp.   9   relative or absolute time

#include "TimeCodec.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace mot {

// Parameters live in two separate id spaces.
enum class ParameterScope { Header, Directory };

enum class CharacterSet : uint8_t {
    EbuLatin           = 0,
    EbuLatinCommonCore = 1,
    EbuLatinCore       = 2,
    IsoLatin2          = 3,
    IsoLatin1          = 4,
    IsoIec10646        = 15,
};

enum class CompressionType : uint8_t {
    Reserved = 0,
    Gzip     = 1,
};

// ─── Header parameters ────────────────────────────────────────────────────────

struct ContentName {
    static constexpr uint8_t param_id = 12;

    std::string  name;                          // raw bytes in `charset`
    CharacterSet charset{CharacterSet::IsoLatin1};

    friend bool operator==(const ContentName&, const ContentName&) = default;
};

struct MimeType {
    static constexpr uint8_t param_id = 16;

    std::string mime;

    friend bool operator==(const MimeType&, const MimeType&) = default;
};

// How long the object stays valid after reception loss.
struct RelativeExpiration {
    static constexpr uint8_t param_id = 4;

    std::chrono::minutes offset{0};

    friend bool operator==(const RelativeExpiration&, const RelativeExpiration&) = default;
};

// UTC instant after which the object must no longer be presented.
// std::nullopt is the "now" encoding.
struct AbsoluteExpiration {
    static constexpr uint8_t param_id = 4;

    std::optional<TimePoint> time;

    friend bool operator==(const AbsoluteExpiration&, const AbsoluteExpiration&) = default;
};

struct Compression {
    static constexpr uint8_t param_id = 17;

    CompressionType type{CompressionType::Gzip};

    friend bool operator==(const Compression&, const Compression&) = default;
};

// Storage priority; 1 is the highest.
class Priority {
public:
    static constexpr uint8_t param_id = 10;

    // Throws ValidationError unless 1 ≤ value ≤ 255.
    explicit Priority(unsigned value);

    [[nodiscard]] uint8_t value() const noexcept { return value_; }

    friend bool operator==(const Priority&, const Priority&) = default;

private:
    uint8_t value_;
};

// ─── Directory parameters ─────────────────────────────────────────────────────

struct SortedHeaderInformation {
    static constexpr uint8_t param_id = 0;

    friend bool operator==(const SortedHeaderInformation&, const SortedHeaderInformation&) = default;
};

struct DefaultPermitOutdatedVersions {
    static constexpr uint8_t param_id = 1;

    bool permit{false};

    friend bool operator==(const DefaultPermitOutdatedVersions&,
                           const DefaultPermitOutdatedVersions&) = default;
};

struct DefaultRelativeExpiration {
    static constexpr uint8_t param_id = 9;

    std::chrono::minutes offset{0};

    friend bool operator==(const DefaultRelativeExpiration&,
                           const DefaultRelativeExpiration&) = default;
};

struct DefaultAbsoluteExpiration {
    static constexpr uint8_t param_id = 9;

    std::optional<TimePoint> time;

    friend bool operator==(const DefaultAbsoluteExpiration&,
                           const DefaultAbsoluteExpiration&) = default;
};

// ─── Extension parameters ─────────────────────────────────────────────────────

// Payload interpretation for parameters registered by an extension profile.
enum class ExtensionEncoding { Raw, String, UInt8, AbsoluteTime, RelativeTime };

// A parameter whose id was registered at run time (e.g. the EPG ScopeStart,
// ScopeEnd and ScopeId header parameters). The payload is kept verbatim and
// has already been validated against `encoding`.
struct ExtensionParameter {
    uint8_t               id{0};
    std::string           name;
    ParameterScope        scope{ParameterScope::Header};
    ExtensionEncoding     encoding{ExtensionEncoding::Raw};
    std::vector<uint8_t>  data;

    friend bool operator==(const ExtensionParameter&, const ExtensionParameter&) = default;
};

// ─── The variant ──────────────────────────────────────────────────────────────

// Alternative order defines ParameterKind.
using Parameter = std::variant<ContentName,
                               MimeType,
                               RelativeExpiration,
                               AbsoluteExpiration,
                               Compression,
                               Priority,
                               SortedHeaderInformation,
                               DefaultPermitOutdatedVersions,
                               DefaultRelativeExpiration,
                               DefaultAbsoluteExpiration,
                               ExtensionParameter>;

enum class ParameterKind : uint8_t {
    ContentName,
    MimeType,
    RelativeExpiration,
    AbsoluteExpiration,
    Compression,
    Priority,
    SortedHeaderInformation,
    DefaultPermitOutdatedVersions,
    DefaultRelativeExpiration,
    DefaultAbsoluteExpiration,
    Extension,
};

static_assert(std::variant_size_v<Parameter> ==
              static_cast<size_t>(ParameterKind::Extension) + 1);

// An object holds at most one parameter per key. Extension parameters are
// distinguished by id, every other kind has ext_id 0.
struct ParameterKey {
    ParameterKind kind{ParameterKind::ContentName};
    uint8_t       ext_id{0};

    friend bool operator==(const ParameterKey&, const ParameterKey&) = default;
    friend auto operator<=>(const ParameterKey&, const ParameterKey&) = default;
};

[[nodiscard]] ParameterKind  kindOf(const Parameter& p) noexcept;
[[nodiscard]] ParameterKey   keyOf(const Parameter& p) noexcept;
[[nodiscard]] uint8_t        paramIdOf(const Parameter& p) noexcept;
[[nodiscard]] ParameterScope scopeOf(const Parameter& p) noexcept;
[[nodiscard]] const char*    kindName(ParameterKind kind) noexcept;

// Short human-readable rendering, e.g. `ContentName "TEST"`.
[[nodiscard]] std::string describe(const Parameter& p);

// ─── DataField codecs ─────────────────────────────────────────────────────────

// Render the DataField (payload only, no preamble).
[[nodiscard]] std::vector<uint8_t> encodePayload(const Parameter& p);

// Payload parsers used by the core registries. Each throws ValidationError
// if the payload does not fit the parameter.
[[nodiscard]] Parameter decodeContentName(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodeMimeType(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodeExpiration(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodeCompression(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodePriority(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodeSortedHeaderInformation(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodeDefaultPermitOutdatedVersions(std::span<const uint8_t> data);
[[nodiscard]] Parameter decodeDefaultExpiration(std::span<const uint8_t> data);

// Validate `data` against `encoding` and wrap it.
[[nodiscard]] ExtensionParameter makeExtensionParameter(uint8_t id, std::string name,
                                                        ParameterScope scope,
                                                        ExtensionEncoding encoding,
                                                        std::span<const uint8_t> data);

} // namespace mot
