#pragma once

#include "types.hpp"
#include "error.hpp"
#include <string>
#include <variant>

namespace stegwave {

// Plain LSB replacement has no tunables; its header slots are zero
struct LsbParams {
    void validate() const {}
    HeaderFields toHeaderFields() const { return {0, 0, 0}; }
    static LsbParams fromHeaderFields(const HeaderFields&) { return {}; }
};

// Echo hiding configuration
// param1 = chunk_size, param2 = delay0, param3 = delay1. alpha is encoder-only.
struct EchoParams {
    static constexpr uint32_t MIN_CHUNK = 256;
    static constexpr uint32_t MAX_CHUNK = 8192;
    static constexpr uint32_t MIN_DELAY0 = 10;
    static constexpr uint32_t MAX_DELAY0 = 500;
    static constexpr uint32_t MIN_DELAY1 = 50;
    static constexpr uint32_t MAX_DELAY1 = 1000;
    static constexpr double MIN_ALPHA = 0.1;
    static constexpr double MAX_ALPHA = 1.0;

    uint32_t chunk_size = 2048;     // Samples per payload bit (power of 2 for the FFT)
    uint32_t delay0 = 50;           // Echo lag for bit 0
    uint32_t delay1 = 200;          // Echo lag for bit 1
    double alpha = 0.5;             // Echo amplitude

    // Throws StegoError(INVALID_PARAMETERS)
    void validate() const;
    HeaderFields toHeaderFields() const;
    static EchoParams fromHeaderFields(const HeaderFields& fields);
};

// Phase coding configuration
// param1 = segment_size, param2 = start_bin, param3 = bits_per_segment
struct PhaseParams {
    uint32_t segment_size = 256;
    uint32_t start_bin = 20;        // First target bin (bins 20..27)
    uint32_t bits_per_segment = 8;
    double min_magnitude = 500.0;   // Target bins are boosted to at least this

    void validate() const;
    HeaderFields toHeaderFields() const;
    static PhaseParams fromHeaderFields(const HeaderFields& fields);
};

// Spread spectrum configuration
// param1 = frame_size, param2 = seed, param3 = alpha (whole number)
struct DsssParams {
    uint32_t frame_size = 8192;     // Samples per payload bit
    uint32_t seed = 12345;          // PN generator seed
    double alpha = 500.0;           // Chip amplitude in PCM units

    void validate() const;
    HeaderFields toHeaderFields() const;
    static DsssParams fromHeaderFields(const HeaderFields& fields);
};

// Closed set of algorithms; the active alternative selects the algorithm ID
using AlgorithmParams = std::variant<LsbParams, EchoParams, PhaseParams, DsssParams>;

// Algorithm ID carried by a parameter set
AlgorithmId algorithmOf(const AlgorithmParams& params);

// Validate whichever alternative is active
void validateParams(const AlgorithmParams& params);

// Pack into / unpack from the header's param1..param3 slots
// fromHeaderFields validates the result
HeaderFields toHeaderFields(const AlgorithmParams& params);
AlgorithmParams paramsFromHeader(AlgorithmId id, const HeaderFields& fields);

namespace presets {

inline LsbParams lsb() { return LsbParams{}; }

inline EchoParams echo() { return EchoParams{}; }

inline PhaseParams phase() { return PhaseParams{}; }

inline DsssParams dsss() { return DsssParams{}; }

// Default parameters for an algorithm. Throws StegoError(UNKNOWN_ALGORITHM)
// for IDs outside 1..4.
inline AlgorithmParams forAlgorithm(AlgorithmId id) {
    switch (id) {
        case AlgorithmId::LSB:   return lsb();
        case AlgorithmId::ECHO:  return echo();
        case AlgorithmId::PHASE: return phase();
        case AlgorithmId::DSSS:  return dsss();
    }
    throw StegoError(ErrorCode::UNKNOWN_ALGORITHM,
                     "algorithm id " + std::to_string(static_cast<int>(id)));
}

} // namespace presets

} // namespace stegwave
