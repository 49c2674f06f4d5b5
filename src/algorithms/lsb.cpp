#include "lsb.hpp"
#include "stegwave/error.hpp"
#include "stegwave/logging.hpp"
#include <string>

namespace stegwave {

LsbCodec::LsbCodec(const LsbParams& params) {
    params.validate();
}

void LsbCodec::embed(MutableSampleSpan region, BitSpan bits) const {
    if (bits.size() > capacityBits(region.size())) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "LSB needs " + std::to_string(bits.size()) + " samples, " +
                         std::to_string(region.size()) + " available");
    }

    for (size_t i = 0; i < bits.size(); ++i) {
        region[i] = static_cast<Sample>((region[i] & ~1) | (bits[i] & 1));
    }

    LOG_EMBED(DEBUG, "LSB: %zu bits", bits.size());
}

Bits LsbCodec::extract(SampleSpan region, size_t bit_count) const {
    if (bit_count > capacityBits(region.size())) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "LSB needs " + std::to_string(bit_count) + " samples, " +
                         std::to_string(region.size()) + " available");
    }

    Bits bits(bit_count);
    for (size_t i = 0; i < bit_count; ++i) {
        bits[i] = region[i] & 1;
    }

    LOG_EXTRACT(DEBUG, "LSB: %zu bits", bit_count);
    return bits;
}

} // namespace stegwave
