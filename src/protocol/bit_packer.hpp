#pragma once

#include "stegwave/types.hpp"

namespace stegwave {
namespace protocol {

// Expand bytes to bits, most significant bit first, byte order preserved
Bits bytesToBits(ByteSpan bytes);

// Inverse of bytesToBits. Throws StegoError(INCOMPLETE_BITS) unless
// bits.size() is a multiple of 8.
Bytes bitsToBytes(BitSpan bits);

} // namespace protocol
} // namespace stegwave
