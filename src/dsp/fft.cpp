#include "stegwave/dsp.hpp"
#define _USE_MATH_DEFINES
#include <cmath>
#include <algorithm>
#include <cstring>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#ifdef STEGWAVE_HAS_FFTW
#include <fftw3.h>
#endif

namespace stegwave {

#ifdef STEGWAVE_HAS_FFTW

// Plans run in place on buffer / real_buffer; callers copy in and out
struct FFT::Impl {
    size_t n = 0;
    fftw_plan complex_fwd = nullptr;
    fftw_plan complex_inv = nullptr;
    fftw_plan r2c = nullptr;
    fftw_plan c2r = nullptr;    // Overwrites buffer
    fftw_complex* buffer = nullptr;
    double* real_buffer = nullptr;

    explicit Impl(size_t size) : n(size) {
        const int len = static_cast<int>(size);
        buffer = fftw_alloc_complex(size);
        real_buffer = fftw_alloc_real(size);
        complex_fwd = fftw_plan_dft_1d(len, buffer, buffer, FFTW_FORWARD, FFTW_MEASURE);
        complex_inv = fftw_plan_dft_1d(len, buffer, buffer, FFTW_BACKWARD, FFTW_MEASURE);
        r2c = fftw_plan_dft_r2c_1d(len, real_buffer, buffer, FFTW_MEASURE);
        c2r = fftw_plan_dft_c2r_1d(len, buffer, real_buffer, FFTW_MEASURE);
    }

    ~Impl() {
        for (fftw_plan p : {complex_fwd, complex_inv, r2c, c2r}) {
            if (p) fftw_destroy_plan(p);
        }
        if (buffer) fftw_free(buffer);
        if (real_buffer) fftw_free(real_buffer);
    }

    void complexTransform(const Complex* in, Complex* out, bool inverse) {
        std::memcpy(buffer, in, n * sizeof(fftw_complex));
        fftw_execute(inverse ? complex_inv : complex_fwd);
        const double scale = inverse ? 1.0 / static_cast<double>(n) : 1.0;
        for (size_t i = 0; i < n; ++i) {
            out[i] = Complex(buffer[i][0] * scale, buffer[i][1] * scale);
        }
    }

    void realForward(const Real* in, Complex* out) {
        std::memcpy(real_buffer, in, n * sizeof(double));
        fftw_execute(r2c);
        for (size_t k = 0; k <= n / 2; ++k) {
            out[k] = Complex(buffer[k][0], buffer[k][1]);
        }
    }

    void realInverse(const Complex* in, Real* out) {
        for (size_t k = 0; k <= n / 2; ++k) {
            buffer[k][0] = in[k].real();
            buffer[k][1] = in[k].imag();
        }
        fftw_execute(c2r);
        const double scale = 1.0 / static_cast<double>(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = real_buffer[i] * scale;
        }
    }
};

#else

// Built-in radix-2 decimation-in-time transform
struct FFT::Impl {
    size_t n = 0;
    std::vector<Complex> twiddles;  // exp(-2*pi*i*k/n), k < n/2
    std::vector<Complex> scratch;   // Full spectrum for the real transforms

    explicit Impl(size_t size) : n(size), twiddles(size / 2), scratch(size) {
        for (size_t k = 0; k < size / 2; ++k) {
            twiddles[k] = std::polar(1.0, -2.0 * M_PI * static_cast<double>(k) / static_cast<double>(size));
        }
    }

    void run(Complex* data, bool inverse) const {
        for (size_t i = 1, j = 0; i < n; ++i) {
            size_t bit = n >> 1;
            for (; j & bit; bit >>= 1) j ^= bit;
            j ^= bit;
            if (i < j) std::swap(data[i], data[j]);
        }

        for (size_t len = 2; len <= n; len <<= 1) {
            const size_t half = len / 2;
            const size_t stride = n / len;
            for (size_t start = 0; start < n; start += len) {
                for (size_t k = 0; k < half; ++k) {
                    const Complex w = inverse ? std::conj(twiddles[k * stride]) : twiddles[k * stride];
                    const Complex odd = w * data[start + k + half];
                    data[start + k + half] = data[start + k] - odd;
                    data[start + k] += odd;
                }
            }
        }

        if (inverse) {
            const double scale = 1.0 / static_cast<double>(n);
            for (size_t i = 0; i < n; ++i) data[i] *= scale;
        }
    }

    void complexTransform(const Complex* in, Complex* out, bool inverse) const {
        std::copy(in, in + n, out);
        run(out, inverse);
    }

    void realForward(const Real* in, Complex* out) {
        for (size_t i = 0; i < n; ++i) scratch[i] = Complex(in[i], 0.0);
        run(scratch.data(), false);
        std::copy(scratch.begin(), scratch.begin() + n / 2 + 1, out);
    }

    // Rebuilds the Hermitian upper half from bins 0..n/2
    void realInverse(const Complex* in, Real* out) {
        for (size_t k = 0; k <= n / 2; ++k) scratch[k] = in[k];
        for (size_t k = 1; k < n / 2; ++k) scratch[n - k] = std::conj(in[k]);
        run(scratch.data(), true);
        for (size_t i = 0; i < n; ++i) out[i] = scratch[i].real();
    }
};

#endif

FFT::FFT(size_t size) : size_(size) {
    if (size < 2 || (size & (size - 1)) != 0) {
        throw std::invalid_argument("FFT size must be power of 2");
    }
    impl_ = std::make_unique<Impl>(size);
}

FFT::~FFT() = default;

void FFT::forward(const Complex* in, Complex* out) {
    impl_->complexTransform(in, out, false);
}

void FFT::forward(const std::vector<Complex>& in, std::vector<Complex>& out) {
    if (in.size() != size_) throw std::invalid_argument("Input size mismatch");
    out.resize(size_);
    forward(in.data(), out.data());
}

void FFT::inverse(const Complex* in, Complex* out) {
    impl_->complexTransform(in, out, true);
}

void FFT::inverse(const std::vector<Complex>& in, std::vector<Complex>& out) {
    if (in.size() != size_) throw std::invalid_argument("Input size mismatch");
    out.resize(size_);
    inverse(in.data(), out.data());
}

void FFT::forwardReal(const Real* in, Complex* out) {
    impl_->realForward(in, out);
}

void FFT::inverseReal(const Complex* in, Real* out) {
    impl_->realInverse(in, out);
}

} // namespace stegwave
