#pragma once
// ParameterCodec.hpp – The PLI preamble shared by header and directory
// parameters (ETSI EN 301 234 clause 6.1, figure 9).
//
//   PLI  DataField length       preamble
//   0    none                   PLI(2) ParamId(6)
//   1    1 byte                 PLI(2) ParamId(6)
//   2    4 bytes                PLI(2) ParamId(6)
//   3    Ext=0: 1–127 bytes     PLI(2) ParamId(6) Ext(1) DataFieldLength(7)
//        Ext=1: up to 32767     PLI(2) ParamId(6) Ext(1) DataFieldLength(15)

#include "Parameter.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mot {

inline constexpr size_t kMaxParameterId     = 63;
inline constexpr size_t kMaxShortDataLength = 127;
inline constexpr size_t kMaxDataLength      = 32767;

// Wrap a DataField in its preamble. Payloads of 2–4 bytes take PLI 2; in
// header scope they are zero-padded to the 4 bytes PLI 2 implies, in
// directory scope they are written as-is. Throws ValidationError for an id
// above 63 or a payload above 32767 bytes.
[[nodiscard]] std::vector<uint8_t> encodeParameter(uint8_t param_id,
                                                   std::span<const uint8_t> payload,
                                                   ParameterScope scope);

// Preamble + DataField of a concrete parameter, in the parameter's own scope.
[[nodiscard]] std::vector<uint8_t> encodeParameter(const Parameter& p);

// One parameter as it sits on the wire, before dispatch on its id.
struct RawParameter {
    uint8_t                  param_id{0};
    uint8_t                  pli{0};
    std::span<const uint8_t> payload;    // view into the input buffer
    size_t                   consumed{0}; // preamble + DataField, in bytes

    [[nodiscard]] size_t consumedBits() const noexcept { return consumed * 8; }
};

// Read the preamble at the start of `buf` and slice out its DataField.
// Throws MalformedPreamble if `buf` is shorter than the preamble or than the
// length it signals.
[[nodiscard]] RawParameter readParameter(std::span<const uint8_t> buf);

} // namespace mot
