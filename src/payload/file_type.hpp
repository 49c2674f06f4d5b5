#pragma once

#include "stegwave/types.hpp"

namespace stegwave {
namespace payload {

struct FileType {
    const char* extension;      // With leading dot, e.g. ".png"
    const char* description;
};

// Generic fallback when nothing matches
constexpr FileType BINARY_FILE = {".bin", "Binary Data"};

/**
 * Guess a file type from leading magic bytes.
 *
 * Falls back to ".txt" when the first 100 bytes are printable ASCII
 * (plus tab/CR/LF), and to BINARY_FILE otherwise. Presentation only:
 * the codec never looks inside the payload.
 */
FileType detectFileType(ByteSpan data);

} // namespace payload
} // namespace stegwave
