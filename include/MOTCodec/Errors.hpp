#pragma once
// Errors.hpp – Exception hierarchy for MOT decode / encode failures.
//
// Every error thrown by the library derives from MotError, so callers that
// only care about "this object failed" can catch a single type.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mot {

class MotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A parameter preamble signals more payload than the buffer holds.
class MalformedPreamble : public MotError {
public:
    using MotError::MotError;
};

// Segment-level framing (segment preamble, core header, directory header)
// is truncated or inconsistent.
class MalformedSegment : public MotError {
public:
    using MotError::MotError;
};

// A field value is out of range (priority 0, relative time > 63 days, ...).
class ValidationError : public MotError {
public:
    using MotError::MotError;
};

// No decoder is registered for a parameter id. The preamble was readable,
// so consumed() tells the caller how many bytes to skip.
class UnknownParameter : public MotError {
public:
    UnknownParameter(uint8_t param_id, size_t consumed)
        : MotError("Unknown parameter 0x" + toHex(param_id) + " (" +
                   std::to_string(consumed) + " bytes)"),
          param_id_(param_id), consumed_(consumed) {}

    [[nodiscard]] uint8_t paramId()  const noexcept { return param_id_; }
    [[nodiscard]] size_t  consumed() const noexcept { return consumed_; }

private:
    uint8_t param_id_;
    size_t  consumed_;

    static std::string toHex(uint8_t v) {
        static const char digits[] = "0123456789abcdef";
        return {digits[v >> 4], digits[v & 0x0Fu]};
    }
};

// The compiled header carries no ContentName.
class MissingMandatoryParameter : public MotError {
public:
    using MotError::MotError;
};

// Directory mode: the transport id is not described by the directory.
class DirectoryLookupFailure : public MotError {
public:
    explicit DirectoryLookupFailure(uint16_t transport_id)
        : MotError("Transport id " + std::to_string(transport_id) +
                   " not found in directory"),
          transport_id_(transport_id) {}

    [[nodiscard]] uint16_t transportId() const noexcept { return transport_id_; }

private:
    uint16_t transport_id_;
};

} // namespace mot
