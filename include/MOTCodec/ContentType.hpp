#pragma once
// ContentType.hpp – MOT content type / subtype pair and its name catalog.
//
// Content types as per ETSI TS 101 756 table 17. The pair is a plain value:
// any (type, subtype) combination is valid on the wire, the catalog only
// attaches human-readable names to the ones somebody has registered.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mot {

struct ContentType {
    uint8_t  type{0};     // 6 bits on the wire
    uint16_t subtype{0};  // 9 bits on the wire

    friend bool operator==(const ContentType&, const ContentType&) = default;
    friend auto operator<=>(const ContentType&, const ContentType&) = default;
};

// "[type:subtype]"
std::string toString(ContentType ct);

namespace content_types {
// General data
inline constexpr ContentType GeneralObjectTransfer{0, 0};
inline constexpr ContentType GeneralMimeHttp{0, 1};
// Text
inline constexpr ContentType TextAscii{1, 0};
inline constexpr ContentType TextIso{1, 1};
inline constexpr ContentType TextHtml{1, 2};
// Image
inline constexpr ContentType ImageGif{2, 0};
inline constexpr ContentType ImageJfif{2, 1};
inline constexpr ContentType ImageBmp{2, 2};
inline constexpr ContentType ImagePng{2, 3};
// Audio
inline constexpr ContentType AudioMpeg1Layer1{3, 0};
inline constexpr ContentType AudioMpeg1Layer2{3, 1};
inline constexpr ContentType AudioMpeg1Layer3{3, 2};
inline constexpr ContentType AudioMpeg2Layer1{3, 3};
inline constexpr ContentType AudioMpeg2Layer2{3, 4};
inline constexpr ContentType AudioMpeg2Layer3{3, 5};
inline constexpr ContentType AudioPcm{3, 6};
inline constexpr ContentType AudioAiff{3, 7};
inline constexpr ContentType AudioAtrac{3, 8};
inline constexpr ContentType AudioAtrac2{3, 9};
inline constexpr ContentType AudioMpeg4{3, 10};
// Video
inline constexpr ContentType VideoMpeg1{4, 0};
inline constexpr ContentType VideoMpeg2{4, 1};
inline constexpr ContentType VideoMpeg4{4, 2};
inline constexpr ContentType VideoH263{4, 3};
// MOT transport
inline constexpr ContentType MotHeaderUpdate{5, 0};
// System
inline constexpr ContentType SystemMheg{6, 0};
inline constexpr ContentType SystemJava{6, 1};
} // namespace content_types

// Names for known content types. wellKnown() holds the TS 101 756 catalog;
// extension profiles (e.g. EPG, type 7) add to it.
class ContentTypeCatalog {
public:
    static ContentTypeCatalog wellKnown();

    // Add or rename an entry.
    void add(ContentType ct, std::string name);

    [[nodiscard]] bool contains(ContentType ct) const { return names_.count(ct) != 0; }

    // Empty if the content type is not cataloged.
    [[nodiscard]] std::string_view name(ContentType ct) const;

    // Catalog name if known, "[type:subtype]" otherwise.
    [[nodiscard]] std::string describe(ContentType ct) const;

    [[nodiscard]] size_t size() const noexcept { return names_.size(); }

private:
    std::map<ContentType, std::string> names_;
};

} // namespace mot

template <>
struct std::hash<mot::ContentType> {
    size_t operator()(const mot::ContentType& ct) const noexcept {
        return (static_cast<size_t>(ct.type) << 9) | ct.subtype;
    }
};
