#pragma once

#include "stegwave/params.hpp"

namespace stegwave {

/**
 * Direct-sequence spread spectrum
 *
 * Each payload bit is spread over one frame of frame_size samples by
 * adding (bit 1) or subtracting (bit 0) alpha times a +/-1 PN sequence.
 * The decoder regenerates the sequence from the seed and takes the sign
 * of the normalized correlation.
 */
class DsssCodec {
public:
    // Throws StegoError(INVALID_PARAMETERS). Generates the PN sequence once.
    explicit DsssCodec(const DsssParams& params);

    void embed(MutableSampleSpan region, BitSpan bits) const;
    Bits extract(SampleSpan region, size_t bit_count) const;

    size_t capacityBits(size_t region_samples) const {
        return region_samples / params_.frame_size;
    }

    const std::vector<int8_t>& sequence() const { return sequence_; }
    const DsssParams& params() const { return params_; }

private:
    DsssParams params_;
    std::vector<int8_t> sequence_;  // Immutable after construction
};

} // namespace stegwave
