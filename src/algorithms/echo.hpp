#pragma once

#include "stegwave/params.hpp"

namespace stegwave {

/**
 * Echo hiding
 *
 * One payload bit per chunk of chunk_size samples. The chunk is convolved
 * with an impulse of height alpha at delay0 (bit 0) or delay1 (bit 1)
 * and the delayed copy is added back:
 *
 *   y[n] = x[n] + alpha * x[n - d]     for d <= n < chunk_size
 *
 * Decoding compares the real cepstrum at both lags; an echo at lag d
 * shows up as a cepstral peak at d.
 */
class EchoCodec {
public:
    // Throws StegoError(INVALID_PARAMETERS)
    explicit EchoCodec(const EchoParams& params);

    void embed(MutableSampleSpan region, BitSpan bits) const;
    Bits extract(SampleSpan region, size_t bit_count) const;

    size_t capacityBits(size_t region_samples) const {
        return region_samples / params_.chunk_size;
    }

    // Decision rule. Ties go to 0.
    static uint8_t decideBit(Real cepstrum_d0, Real cepstrum_d1) {
        return cepstrum_d0 >= cepstrum_d1 ? 0 : 1;
    }

    const EchoParams& params() const { return params_; }

private:
    EchoParams params_;
};

} // namespace stegwave
