#pragma once
// BitStream.hpp – MSB-first bit-level I/O for MOT segments and parameters.
//
// MOT wire format rules (ETSI EN 301 234 / TS 101 756):
//   • Multi-byte fields are big-endian.
//   • Sub-byte fields are packed MSB-first: the 2-bit PLI of a parameter
//     preamble occupies the top two bits of its first byte.
//   • Parameter payloads and segment boundaries are always byte-aligned;
//     only the fixed headers (core header, directory header) straddle bytes.

#include "Errors.hpp"

#include <algorithm>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mot {

// ─────────────────────────────────────────────────────────────────────────────
//  BitReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads bits sequentially from a read-only byte span. Running off the end of
// the span means the segment is shorter than its own fields claim, which is
// reported as MalformedSegment.
//
// Example – the first byte of a ContentName preamble, 0xCC:
//   readU(2) → 3 (PLI)   readU(6) → 12 (ParamId)
class BitReader {
public:
    explicit BitReader(std::span<const uint8_t> buf) noexcept
        : buf_(buf), pos_(0) {}

    [[nodiscard]] size_t bytesRead()     const noexcept { return pos_ / 8; }
    [[nodiscard]] size_t bitsAvailable() const noexcept {
        return buf_.size() * 8 - pos_;
    }
    [[nodiscard]] size_t bytesAvailable() const noexcept { return bitsAvailable() / 8; }
    [[nodiscard]] bool byteAligned() const noexcept { return (pos_ % 8) == 0; }
    [[nodiscard]] bool canRead(size_t n) const noexcept {
        return bitsAvailable() >= n;
    }
    [[nodiscard]] bool atEnd() const noexcept { return bitsAvailable() == 0; }

    // Read n bits (1 ≤ n ≤ 64) as an unsigned integer, MSB of the field first.
    [[nodiscard]] uint64_t readU(size_t n) {
        boundsCheck(n);
        uint64_t result = 0;
        size_t   left   = n;
        while (left > 0) {
            const size_t bit_in_byte = pos_ % 8;
            const size_t avail       = 8 - bit_in_byte;
            const size_t chunk       = std::min(left, avail);

            const uint8_t shift = static_cast<uint8_t>(avail - chunk);
            const uint8_t mask  = static_cast<uint8_t>(((1u << chunk) - 1u) << shift);
            const uint8_t bits  = (buf_[pos_ / 8] & mask) >> shift;

            result = (result << chunk) | bits;
            pos_  += chunk;
            left  -= chunk;
        }
        return result;
    }

    [[nodiscard]] bool readBit() { return readU(1) != 0; }

    void skip(size_t n) {
        if (!canRead(n))
            throw MalformedSegment("BitReader: skip past end of buffer");
        pos_ += n;
    }

    // Read n whole bytes from a byte-aligned position, as a view into the
    // underlying buffer.
    [[nodiscard]] std::span<const uint8_t> readSpan(size_t n) {
        requireAligned("readSpan");
        if (n > bytesAvailable())
            throw MalformedSegment("BitReader: " + std::to_string(n) +
                                   " bytes requested, " +
                                   std::to_string(bytesAvailable()) + " available");
        const size_t start = pos_ / 8;
        pos_ += n * 8;
        return buf_.subspan(start, n);
    }

private:
    std::span<const uint8_t> buf_;
    size_t pos_{0};

    void boundsCheck(size_t n) const {
        if (n == 0 || n > 64)
            throw std::invalid_argument("BitReader: bit count must be 1–64");
        if (!canRead(n))
            throw MalformedSegment("BitReader: read past end of buffer");
    }

    void requireAligned(const char* where) const {
        if (!byteAligned())
            throw std::logic_error(
                std::string("BitReader::") + where + " – not byte-aligned");
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  BitWriter
// ─────────────────────────────────────────────────────────────────────────────
// Appends bits MSB-first into a growing byte buffer. Reserved (RFU) fields
// are written explicitly as zero so that every field of the layout shows up
// at the call site.
class BitWriter {
public:
    BitWriter() = default;

    // Write the low n bits of value, MSB first.
    void writeU(uint64_t value, size_t n) {
        if (n == 0 || n > 64)
            throw std::invalid_argument("BitWriter: bit count must be 1–64");
        if (n < 64) value &= (uint64_t{1} << n) - 1u;

        size_t left = n;
        while (left > 0) {
            if ((pos_ % 8) == 0)
                buf_.push_back(0);

            const size_t avail = 8 - (pos_ % 8);
            const size_t chunk = std::min(left, avail);

            const uint8_t bits = static_cast<uint8_t>(
                (value >> (left - chunk)) & ((1u << chunk) - 1u));
            buf_.back() |= static_cast<uint8_t>(bits << (avail - chunk));

            pos_  += chunk;
            left  -= chunk;
        }
    }

    void writeBit(bool b) { writeU(b ? 1u : 0u, 1); }

    void writeByte(uint8_t b) { writeU(b, 8); }

    void writeBytes(std::span<const uint8_t> data) {
        if (!byteAligned()) {
            for (uint8_t b : data) writeU(b, 8);
            return;
        }
        buf_.insert(buf_.end(), data.begin(), data.end());
        pos_ += data.size() * 8;
    }

    [[nodiscard]] const std::vector<uint8_t>& buffer() const noexcept { return buf_; }
    [[nodiscard]] std::vector<uint8_t>        take()         noexcept { return std::move(buf_); }
    [[nodiscard]] bool   byteAligned() const noexcept { return (pos_ % 8) == 0; }

private:
    std::vector<uint8_t> buf_;
    size_t pos_{0};
};

} // namespace mot
