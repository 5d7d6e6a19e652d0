// ParameterCodec.cpp – PLI preamble encode / decode.

#include "MOTCodec/ParameterCodec.hpp"
#include "MOTCodec/BitStream.hpp"
#include "MOTCodec/Errors.hpp"

#include <string>

namespace mot {

std::vector<uint8_t> encodeParameter(uint8_t param_id,
                                     std::span<const uint8_t> payload,
                                     ParameterScope scope) {
    if (param_id > kMaxParameterId)
        throw ValidationError("parameter id " + std::to_string(param_id) +
                              " does not fit in 6 bits");
    const size_t len = payload.size();
    if (len > kMaxDataLength)
        throw ValidationError("parameter " + std::to_string(param_id) + " DataField of " +
                              std::to_string(len) + " bytes exceeds " +
                              std::to_string(kMaxDataLength));

    BitWriter bw;
    if (len == 0) {
        bw.writeU(0, 2);                       // PLI=0
        bw.writeU(param_id, 6);
    } else if (len == 1) {
        bw.writeU(1, 2);                       // PLI=1
        bw.writeU(param_id, 6);
    } else if (len <= 4) {
        bw.writeU(2, 2);                       // PLI=2
        bw.writeU(param_id, 6);
    } else if (len <= kMaxShortDataLength) {
        bw.writeU(3, 2);                       // PLI=3
        bw.writeU(param_id, 6);
        bw.writeBit(false);                    // Ext=0
        bw.writeU(len, 7);
    } else {
        bw.writeU(3, 2);                       // PLI=3
        bw.writeU(param_id, 6);
        bw.writeBit(true);                     // Ext=1
        bw.writeU(len, 15);
    }

    bw.writeBytes(payload);
    if (len > 1 && len < 4 && scope == ParameterScope::Header) {
        for (size_t i = len; i < 4; ++i) bw.writeByte(0);
    }
    return bw.take();
}

std::vector<uint8_t> encodeParameter(const Parameter& p) {
    const auto payload = encodePayload(p);
    return encodeParameter(paramIdOf(p), payload, scopeOf(p));
}

RawParameter readParameter(std::span<const uint8_t> buf) {
    if (buf.empty())
        throw MalformedPreamble("parameter preamble: empty buffer");

    RawParameter raw;
    raw.pli      = static_cast<uint8_t>(buf[0] >> 6);
    raw.param_id = static_cast<uint8_t>(buf[0] & 0x3Fu);

    size_t header_len = 1;
    size_t data_len   = 0;
    switch (raw.pli) {
    case 0: data_len = 0; break;
    case 1: data_len = 1; break;
    case 2: data_len = 4; break;
    case 3:
        if (buf.size() < 2)
            throw MalformedPreamble("parameter " + std::to_string(raw.param_id) +
                                    ": truncated PLI=3 length field");
        if (buf[1] & 0x80u) {
            if (buf.size() < 3)
                throw MalformedPreamble("parameter " + std::to_string(raw.param_id) +
                                        ": truncated 15-bit length field");
            header_len = 3;
            data_len   = (static_cast<size_t>(buf[1] & 0x7Fu) << 8) | buf[2];
        } else {
            header_len = 2;
            data_len   = buf[1] & 0x7Fu;
        }
        break;
    }

    if (buf.size() - header_len < data_len)
        throw MalformedPreamble("parameter " + std::to_string(raw.param_id) +
                                ": signalled DataField of " + std::to_string(data_len) +
                                " bytes, only " + std::to_string(buf.size() - header_len) +
                                " available");

    raw.payload  = buf.subspan(header_len, data_len);
    raw.consumed = header_len + data_len;
    return raw;
}

} // namespace mot
