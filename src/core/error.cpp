#include "stegwave/error.hpp"

namespace stegwave {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::BAD_MAGIC:             return "BadMagic";
        case ErrorCode::HEADER_CORRUPT:        return "HeaderCorrupt";
        case ErrorCode::UNKNOWN_ALGORITHM:     return "UnknownAlgorithm";
        case ErrorCode::INVALID_PARAMETERS:    return "InvalidParameters";
        case ErrorCode::INSUFFICIENT_CAPACITY: return "InsufficientCapacity";
        case ErrorCode::INCOMPLETE_BITS:       return "IncompleteBits";
        default:                               return "Unknown";
    }
}

StegoError::StegoError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(errorCodeToString(code)) + ": " + detail)
    , code_(code) {}

} // namespace stegwave
