#include "stegwave/dsp.hpp"
#include "stegwave/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace stegwave {

namespace dsp {

// Keeps log() finite on empty bins
constexpr Real LOG_FLOOR = 1e-8;

Sample toPcm16(Real value) {
    Real rounded = std::round(value);
    if (rounded < PCM16_MIN) return static_cast<Sample>(PCM16_MIN);
    if (rounded > PCM16_MAX) return static_cast<Sample>(PCM16_MAX);
    return static_cast<Sample>(rounded);
}

void realCepstrum(FFT& fft, SampleSpan x, std::vector<Real>& cepstrum) {
    const size_t n = fft.size();
    if (x.size() != n) throw std::invalid_argument("Input size mismatch");

    std::vector<Complex> time(n);
    std::vector<Complex> spectrum(n);
    for (size_t i = 0; i < n; ++i) {
        time[i] = Complex(static_cast<Real>(x[i]), 0.0);
    }

    fft.forward(time, spectrum);
    for (size_t k = 0; k < n; ++k) {
        spectrum[k] = Complex(std::log(std::abs(spectrum[k]) + LOG_FLOOR), 0.0);
    }
    fft.inverse(spectrum, time);

    cepstrum.resize(n);
    for (size_t i = 0; i < n; ++i) {
        cepstrum[i] = std::abs(time[i]);
    }
}

Real normalizedCorrelation(SampleSpan frame, std::span<const int8_t> sequence) {
    if (frame.empty()) return 0;
    if (frame.size() != sequence.size()) throw std::invalid_argument("Sequence length mismatch");

    Real sum = 0;
    for (size_t i = 0; i < frame.size(); ++i) {
        sum += static_cast<Real>(frame[i]) * sequence[i];
    }
    return sum / static_cast<Real>(frame.size());
}

Real snrDb(SampleSpan original, SampleSpan modified) {
    const size_t n = std::min(original.size(), modified.size());
    Real signal = 0;
    Real noise = 0;
    for (size_t i = 0; i < n; ++i) {
        Real s = original[i];
        Real d = static_cast<Real>(modified[i]) - s;
        signal += s * s;
        noise += d * d;
    }
    if (noise == 0) return 200.0;  // Identical buffers
    if (signal == 0) return -200.0;
    return 10.0 * std::log10(signal / noise);
}

} // namespace dsp

} // namespace stegwave
