#pragma once

#include "stegwave/params.hpp"

namespace stegwave {

/**
 * Phase coding
 *
 * The payload area is cut into segments of segment_size samples, each
 * carrying bits_per_segment bits in consecutive FFT bins starting at
 * start_bin. Bit 0 sets the bin phase to -90 degrees, bit 1 to +90; the
 * bin magnitude is kept but raised to min_magnitude so the phase survives
 * 16-bit requantization. Segments are processed independently (no
 * overlap-add) so the absolute phase is preserved.
 */
class PhaseCodec {
public:
    // Throws StegoError(INVALID_PARAMETERS)
    explicit PhaseCodec(const PhaseParams& params);

    void embed(MutableSampleSpan region, BitSpan bits) const;
    Bits extract(SampleSpan region, size_t bit_count) const;

    size_t capacityBits(size_t region_samples) const {
        return (region_samples / params_.segment_size) * params_.bits_per_segment;
    }

    // Segments needed for bit_count bits (last one may be partial)
    size_t segmentsFor(size_t bit_count) const {
        return (bit_count + params_.bits_per_segment - 1) / params_.bits_per_segment;
    }

    const PhaseParams& params() const { return params_; }

private:
    PhaseParams params_;
};

} // namespace stegwave
