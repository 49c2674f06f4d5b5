#include "bit_packer.hpp"
#include "stegwave/error.hpp"
#include <string>

namespace stegwave {
namespace protocol {

Bits bytesToBits(ByteSpan bytes) {
    Bits bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t byte : bytes) {
        for (int b = 7; b >= 0; --b) {
            bits.push_back((byte >> b) & 1);
        }
    }
    return bits;
}

Bytes bitsToBytes(BitSpan bits) {
    if (bits.size() % 8 != 0) {
        throw StegoError(ErrorCode::INCOMPLETE_BITS,
                         std::to_string(bits.size()) + " bits is not a whole number of bytes");
    }

    Bytes bytes(bits.size() / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        bytes[i / 8] = static_cast<uint8_t>((bytes[i / 8] << 1) | (bits[i] & 1));
    }
    return bytes;
}

} // namespace protocol
} // namespace stegwave
