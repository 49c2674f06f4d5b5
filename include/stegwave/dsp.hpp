#pragma once

#include "types.hpp"
#include <cmath>
#include <memory>

namespace stegwave {

/**
 * FFT wrapper
 *
 * Abstracts FFTW3 (if available) or fallback implementation.
 * Provides both complex and real FFTs. Sizes must be a power of 2.
 * Not thread-safe: each instance owns its plans and work buffers.
 */
class FFT {
public:
    explicit FFT(size_t size);
    ~FFT();

    // Complex forward FFT: time -> frequency
    void forward(const Complex* in, Complex* out);
    void forward(const std::vector<Complex>& in, std::vector<Complex>& out);

    // Complex inverse FFT: frequency -> time (scaled by 1/N)
    void inverse(const Complex* in, Complex* out);
    void inverse(const std::vector<Complex>& in, std::vector<Complex>& out);

    // Real forward FFT: N real -> N/2+1 complex
    void forwardReal(const Real* in, Complex* out);

    // Real inverse FFT: N/2+1 complex -> N real
    void inverseReal(const Complex* in, Real* out);

    size_t size() const { return size_; }

private:
    size_t size_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Utility functions
namespace dsp {

// Round and saturate to the 16-bit PCM range
Sample toPcm16(Real value);

// Real cepstrum |IFFT(log(|FFT(x)| + eps))|, one value per lag.
// x.size() must equal fft.size().
void realCepstrum(FFT& fft, SampleSpan x, std::vector<Real>& cepstrum);

// Dot product of a frame with a +/-1 sequence divided by the frame length
Real normalizedCorrelation(SampleSpan frame, std::span<const int8_t> sequence);

// Signal-to-distortion ratio of a modified buffer against its original
Real snrDb(SampleSpan original, SampleSpan modified);

// PN sequence generator revision. Bump if generatePnSequence() output changes;
// carriers encoded with another revision will not decode.
constexpr int PN_GENERATOR_VERSION = 1;

// Deterministic +/-1 sequence. Uses raw std::mt19937 draws (the engine is
// specified bit-exactly by the standard); <random> distributions are not.
std::vector<int8_t> generatePnSequence(size_t length, uint32_t seed);

} // namespace dsp

} // namespace stegwave
