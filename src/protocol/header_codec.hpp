#pragma once

#include "stegwave/stego.hpp"

namespace stegwave {
namespace protocol {

/**
 * Header <-> carrier LSBs
 *
 * The 15 serialized header bytes become 120 bits (MSB first), one per
 * sample LSB: sample = (sample & ~1) | bit. Nothing past sample 119 is
 * read or written.
 */
class HeaderCodec {
public:
    // samples.size() must be >= HEADER_SAMPLES, else INSUFFICIENT_CAPACITY
    static void encode(const Header& header, MutableSampleSpan samples);

    // Throws BAD_MAGIC, HEADER_CORRUPT, UNKNOWN_ALGORITHM or INSUFFICIENT_CAPACITY
    static Header decode(SampleSpan samples);
};

} // namespace protocol
} // namespace stegwave
