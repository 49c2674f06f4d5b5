#include "echo.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/error.hpp"
#include "stegwave/logging.hpp"
#include <string>

namespace stegwave {

EchoCodec::EchoCodec(const EchoParams& params) : params_(params) {
    params_.validate();
}

void EchoCodec::embed(MutableSampleSpan region, BitSpan bits) const {
    const size_t chunk = params_.chunk_size;
    if (bits.size() > capacityBits(region.size())) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "echo needs " + std::to_string(bits.size()) + " chunks of " +
                         std::to_string(chunk) + ", " +
                         std::to_string(capacityBits(region.size())) + " available");
    }

    // Each chunk only reads its own original samples
    std::vector<Real> original(chunk);
    for (size_t b = 0; b < bits.size(); ++b) {
        MutableSampleSpan seg = region.subspan(b * chunk, chunk);
        const size_t delay = bits[b] ? params_.delay1 : params_.delay0;

        for (size_t n = 0; n < chunk; ++n) {
            original[n] = seg[n];
        }
        for (size_t n = delay; n < chunk; ++n) {
            seg[n] = dsp::toPcm16(original[n] + params_.alpha * original[n - delay]);
        }
    }

    LOG_EMBED(DEBUG, "Echo: %zu bits, chunk=%u d0=%u d1=%u alpha=%.2f",
              bits.size(), params_.chunk_size, params_.delay0, params_.delay1, params_.alpha);
}

Bits EchoCodec::extract(SampleSpan region, size_t bit_count) const {
    const size_t chunk = params_.chunk_size;
    if (bit_count > capacityBits(region.size())) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "echo needs " + std::to_string(bit_count) + " chunks of " +
                         std::to_string(chunk) + ", " +
                         std::to_string(capacityBits(region.size())) + " available");
    }

    FFT fft(chunk);
    std::vector<Real> cepstrum;
    Bits bits(bit_count);

    for (size_t b = 0; b < bit_count; ++b) {
        dsp::realCepstrum(fft, region.subspan(b * chunk, chunk), cepstrum);

        const Real c0 = cepstrum[params_.delay0];
        const Real c1 = cepstrum[params_.delay1];
        bits[b] = decideBit(c0, c1);

        LOG_DSP(TRACE, "Echo chunk %zu: c[%u]=%.4f c[%u]=%.4f -> %d",
                b, params_.delay0, c0, params_.delay1, c1, bits[b]);
    }

    LOG_EXTRACT(DEBUG, "Echo: %zu bits, chunk=%u d0=%u d1=%u",
                bit_count, params_.chunk_size, params_.delay0, params_.delay1);
    return bits;
}

} // namespace stegwave
