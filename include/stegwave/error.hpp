#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stegwave {

// Failure taxonomy shared by every codec stage
enum class ErrorCode : uint8_t {
    BAD_MAGIC,              // Header magic mismatch - not a stego carrier
    HEADER_CORRUPT,         // Header checksum mismatch
    UNKNOWN_ALGORITHM,      // Algorithm ID outside 1..4
    INVALID_PARAMETERS,     // Parameter out of range or not representable in 16 bits
    INSUFFICIENT_CAPACITY,  // Carrier too short for header + payload
    INCOMPLETE_BITS,        // Bit count not a multiple of 8
};

const char* errorCodeToString(ErrorCode code);

/**
 * Exception raised by every stage of the codec.
 *
 * Errors propagate to the caller unmodified: the dispatcher never
 * catches, retries or returns a partial payload.
 */
class StegoError : public std::runtime_error {
public:
    StegoError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace stegwave
