#pragma once

#include "stegwave/types.hpp"
#include <string>

namespace stegwave {
namespace io {

struct WavAudio {
    uint32_t sample_rate = 44100;
    uint16_t source_channels = 1;       // Channel count before mono reduction
    uint16_t source_bits = 16;          // Bit depth before conversion
    Samples samples;                    // Mono 16-bit PCM
};

/**
 * Read a RIFF/WAVE file into mono 16-bit PCM.
 *
 * Accepts integer PCM (8/16/24/32 bit) and 32-bit IEEE float. Unknown
 * chunks are skipped. Multi-channel audio keeps the first channel; other
 * depths are converted to 16 bit. Throws std::runtime_error.
 */
WavAudio readWav(const std::string& filename);

// Write mono 16-bit PCM. Throws std::runtime_error.
void writeWav(const std::string& filename, const WavAudio& audio);

} // namespace io
} // namespace stegwave
