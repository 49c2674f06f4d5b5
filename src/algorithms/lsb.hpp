#pragma once

#include "stegwave/params.hpp"

namespace stegwave {

/**
 * LSB replacement
 *
 * Bit i replaces the least significant bit of region[i]. Lossless as
 * long as the carrier is not post-processed. Capacity: 1 bit/sample.
 */
class LsbCodec {
public:
    explicit LsbCodec(const LsbParams& params = {});

    // region is the payload area (carrier from sample 1000 on)
    void embed(MutableSampleSpan region, BitSpan bits) const;
    Bits extract(SampleSpan region, size_t bit_count) const;

    size_t capacityBits(size_t region_samples) const { return region_samples; }
};

} // namespace stegwave
