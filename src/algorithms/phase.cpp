#include "phase.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/error.hpp"
#include "stegwave/logging.hpp"
#include <algorithm>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace stegwave {

PhaseCodec::PhaseCodec(const PhaseParams& params) : params_(params) {
    params_.validate();
}

void PhaseCodec::embed(MutableSampleSpan region, BitSpan bits) const {
    const size_t seg_size = params_.segment_size;
    const size_t segments = segmentsFor(bits.size());
    if (segments > region.size() / seg_size) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "phase needs " + std::to_string(segments) + " segments of " +
                         std::to_string(seg_size) + ", " +
                         std::to_string(region.size() / seg_size) + " available");
    }

    FFT fft(seg_size);
    std::vector<Real> time(seg_size);
    std::vector<Complex> spectrum(seg_size / 2 + 1);

    size_t bit_index = 0;
    for (size_t s = 0; s < segments; ++s) {
        MutableSampleSpan seg = region.subspan(s * seg_size, seg_size);
        for (size_t n = 0; n < seg_size; ++n) {
            time[n] = seg[n];
        }

        fft.forwardReal(time.data(), spectrum.data());

        for (size_t j = 0; j < params_.bits_per_segment && bit_index < bits.size(); ++j, ++bit_index) {
            const size_t bin = params_.start_bin + j;
            const Real magnitude = std::max(std::abs(spectrum[bin]), params_.min_magnitude);
            const Real phase = bits[bit_index] ? M_PI / 2 : -M_PI / 2;
            spectrum[bin] = std::polar(magnitude, phase);
        }

        fft.inverseReal(spectrum.data(), time.data());

        for (size_t n = 0; n < seg_size; ++n) {
            seg[n] = dsp::toPcm16(time[n]);
        }
    }

    LOG_EMBED(DEBUG, "Phase: %zu bits in %zu segments (bins %u..%u)",
              bits.size(), segments, params_.start_bin,
              params_.start_bin + params_.bits_per_segment - 1);
}

Bits PhaseCodec::extract(SampleSpan region, size_t bit_count) const {
    const size_t seg_size = params_.segment_size;
    const size_t segments = segmentsFor(bit_count);
    if (segments > region.size() / seg_size) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "phase needs " + std::to_string(segments) + " segments of " +
                         std::to_string(seg_size) + ", " +
                         std::to_string(region.size() / seg_size) + " available");
    }

    FFT fft(seg_size);
    std::vector<Real> time(seg_size);
    std::vector<Complex> spectrum(seg_size / 2 + 1);
    Bits bits;
    bits.reserve(bit_count);

    for (size_t s = 0; s < segments; ++s) {
        SampleSpan seg = region.subspan(s * seg_size, seg_size);
        for (size_t n = 0; n < seg_size; ++n) {
            time[n] = seg[n];
        }

        fft.forwardReal(time.data(), spectrum.data());

        for (size_t j = 0; j < params_.bits_per_segment && bits.size() < bit_count; ++j) {
            const Real angle = std::arg(spectrum[params_.start_bin + j]);
            bits.push_back(angle > 0 ? 1 : 0);
        }
    }

    LOG_EXTRACT(DEBUG, "Phase: %zu bits from %zu segments", bit_count, segments);
    return bits;
}

} // namespace stegwave
