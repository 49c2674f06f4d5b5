#include "stegwave/params.hpp"
#include "stegwave/error.hpp"
#include <cmath>
#include <string>

namespace stegwave {

namespace {

[[noreturn]] void invalid(const std::string& what) {
    throw StegoError(ErrorCode::INVALID_PARAMETERS, what);
}

bool isPowerOfTwo(uint32_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

uint16_t toField(uint32_t value, const char* name) {
    if (value > 0xFFFF) {
        invalid(std::string(name) + " = " + std::to_string(value) + " does not fit a 16-bit header field");
    }
    return static_cast<uint16_t>(value);
}

void checkRange(uint32_t value, uint32_t lo, uint32_t hi, const char* name) {
    if (value < lo || value > hi) {
        invalid(std::string(name) + " = " + std::to_string(value) + " outside " +
                std::to_string(lo) + ".." + std::to_string(hi));
    }
}

} // namespace

// ============================================================================
// EchoParams
// ============================================================================

void EchoParams::validate() const {
    checkRange(chunk_size, MIN_CHUNK, MAX_CHUNK, "chunk_size");
    if (!isPowerOfTwo(chunk_size)) {
        invalid("chunk_size = " + std::to_string(chunk_size) + " is not a power of 2");
    }
    checkRange(delay0, MIN_DELAY0, MAX_DELAY0, "delay0");
    checkRange(delay1, MIN_DELAY1, MAX_DELAY1, "delay1");
    if (delay0 == delay1) {
        invalid("delay0 and delay1 must differ");
    }
    if (delay0 >= chunk_size || delay1 >= chunk_size) {
        invalid("echo delays must be shorter than chunk_size");
    }
    if (!(alpha >= MIN_ALPHA && alpha <= MAX_ALPHA)) {
        invalid("alpha = " + std::to_string(alpha) + " outside 0.1..1.0");
    }
}

HeaderFields EchoParams::toHeaderFields() const {
    return {toField(chunk_size, "chunk_size"), toField(delay0, "delay0"), toField(delay1, "delay1")};
}

EchoParams EchoParams::fromHeaderFields(const HeaderFields& fields) {
    EchoParams p;
    p.chunk_size = fields[0];
    p.delay0 = fields[1];
    p.delay1 = fields[2];
    p.validate();
    return p;
}

// ============================================================================
// PhaseParams
// ============================================================================

void PhaseParams::validate() const {
    if (!isPowerOfTwo(segment_size) || segment_size < 16 || segment_size > 0x8000) {
        invalid("segment_size = " + std::to_string(segment_size) + " must be a power of 2 in 16..32768");
    }
    if (bits_per_segment == 0) {
        invalid("bits_per_segment must be positive");
    }
    // Target bins must sit strictly between DC and Nyquist
    if (start_bin == 0 || start_bin + bits_per_segment > segment_size / 2) {
        invalid("bins " + std::to_string(start_bin) + ".." +
                std::to_string(start_bin + bits_per_segment - 1) +
                " outside 1.." + std::to_string(segment_size / 2 - 1));
    }
    if (!(min_magnitude >= 0)) {
        invalid("min_magnitude must be non-negative");
    }
}

HeaderFields PhaseParams::toHeaderFields() const {
    return {toField(segment_size, "segment_size"), toField(start_bin, "start_bin"),
            toField(bits_per_segment, "bits_per_segment")};
}

PhaseParams PhaseParams::fromHeaderFields(const HeaderFields& fields) {
    PhaseParams p;
    p.segment_size = fields[0];
    p.start_bin = fields[1];
    p.bits_per_segment = fields[2];
    p.validate();
    return p;
}

// ============================================================================
// DsssParams
// ============================================================================

void DsssParams::validate() const {
    if (frame_size == 0) {
        invalid("frame_size must be positive");
    }
    if (!(alpha >= 1.0 && alpha <= PCM16_MAX) || std::floor(alpha) != alpha) {
        invalid("alpha = " + std::to_string(alpha) + " must be a whole number in 1..32767");
    }
}

HeaderFields DsssParams::toHeaderFields() const {
    return {toField(frame_size, "frame_size"), toField(seed, "seed"),
            toField(static_cast<uint32_t>(alpha), "alpha")};
}

DsssParams DsssParams::fromHeaderFields(const HeaderFields& fields) {
    DsssParams p;
    p.frame_size = fields[0];
    p.seed = fields[1];
    p.alpha = fields[2];
    p.validate();
    return p;
}

// ============================================================================
// Variant helpers
// ============================================================================

AlgorithmId algorithmOf(const AlgorithmParams& params) {
    // Alternatives are declared in algorithm ID order
    return static_cast<AlgorithmId>(params.index() + 1);
}

void validateParams(const AlgorithmParams& params) {
    std::visit([](const auto& p) { p.validate(); }, params);
}

HeaderFields toHeaderFields(const AlgorithmParams& params) {
    return std::visit([](const auto& p) { return p.toHeaderFields(); }, params);
}

AlgorithmParams paramsFromHeader(AlgorithmId id, const HeaderFields& fields) {
    switch (id) {
        case AlgorithmId::LSB:   return LsbParams::fromHeaderFields(fields);
        case AlgorithmId::ECHO:  return EchoParams::fromHeaderFields(fields);
        case AlgorithmId::PHASE: return PhaseParams::fromHeaderFields(fields);
        case AlgorithmId::DSSS:  return DsssParams::fromHeaderFields(fields);
    }
    throw StegoError(ErrorCode::UNKNOWN_ALGORITHM,
                     "algorithm id " + std::to_string(static_cast<int>(id)));
}

} // namespace stegwave
