#pragma once

#include <complex>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>
#include <array>

namespace stegwave {

// Core types
using Sample = int16_t;                        // Mono 16-bit PCM sample
using Real = double;                           // Working precision for DSP
using Complex = std::complex<double>;          // Spectrum bin
using Samples = std::vector<Sample>;           // Audio buffer
using Bytes = std::vector<uint8_t>;            // Payload
using Bits = std::vector<uint8_t>;             // One bit (0/1) per element

// Spans for zero-copy operations
using SampleSpan = std::span<const Sample>;
using MutableSampleSpan = std::span<Sample>;
using ByteSpan = std::span<const uint8_t>;
using BitSpan = std::span<const uint8_t>;

// 16-bit PCM range
constexpr int32_t PCM16_MIN = -32768;
constexpr int32_t PCM16_MAX = 32767;

// Embedding algorithms (values are the on-carrier algorithm IDs)
enum class AlgorithmId : uint8_t {
    LSB   = 1,   // Amplitude domain, 1 bit/sample - highest capacity, fragile
    ECHO  = 2,   // Echo hiding, decoded from the real cepstrum
    PHASE = 3,   // Phase coding, 8 bits per 256-sample segment
    DSSS  = 4,   // Direct-sequence spread spectrum, 1 bit per frame
};

// Raw header param1..param3 slots
using HeaderFields = std::array<uint16_t, 3>;

inline bool isKnownAlgorithm(uint8_t id) {
    return id >= static_cast<uint8_t>(AlgorithmId::LSB) &&
           id <= static_cast<uint8_t>(AlgorithmId::DSSS);
}

inline const char* algorithmIdToString(AlgorithmId id) {
    switch (id) {
        case AlgorithmId::LSB:   return "LSB";
        case AlgorithmId::ECHO:  return "Echo";
        case AlgorithmId::PHASE: return "Phase";
        case AlgorithmId::DSSS:  return "DSSS";
        default:                 return "UNKNOWN";
    }
}

} // namespace stegwave
