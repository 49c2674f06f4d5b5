#pragma once

#include "types.hpp"
#include "params.hpp"
#include "error.hpp"
#include <array>

namespace stegwave {

// ============================================================================
// Carrier layout
// ============================================================================
//
// ┌──────────────────┬──────────────────┬──────────────────────────────┐
// │ HEADER (LSBs)    │ GUARD            │ PAYLOAD (algorithm specific) │
// │ samples 0..119   │ samples 120..999 │ samples 1000..               │
// └──────────────────┴──────────────────┴──────────────────────────────┘
//
// Header bytes (little-endian fields, bits MSB first into sample LSBs):
// ┌────────┬──────┬────────┬────────┬────────┬─────────────┬──────────┐
// │ MAGIC  │ ALGO │ PARAM1 │ PARAM2 │ PARAM3 │ PAYLOAD_LEN │ CHECKSUM │
// │  2B    │  1B  │   2B   │   2B   │   2B   │     4B      │    2B    │
// └────────┴──────┴────────┴────────┴────────┴─────────────┴──────────┘
namespace protocol {

constexpr uint8_t MAGIC_0 = 0x73;  // 's'
constexpr uint8_t MAGIC_1 = 0x74;  // 't'

constexpr size_t HEADER_BYTES = 15;
constexpr size_t HEADER_SAMPLES = HEADER_BYTES * 8;  // One bit per sample
constexpr size_t PAYLOAD_OFFSET = 1000;              // First payload sample

} // namespace protocol

// Decoded header contents
struct Header {
    AlgorithmId algorithm = AlgorithmId::LSB;
    HeaderFields params = {0, 0, 0};
    uint32_t payload_len = 0;       // Bytes

    using Serialized = std::array<uint8_t, protocol::HEADER_BYTES>;

    // 15-byte wire form, checksum included
    Serialized serialize() const;

    // Parse and validate: BAD_MAGIC, then HEADER_CORRUPT, then UNKNOWN_ALGORITHM
    static Header deserialize(ByteSpan data);

    // (sum of bytes) & 0xFFFF
    static uint16_t calculateChecksum(const uint8_t* data, size_t len);
};

struct DecodeResult {
    AlgorithmId algorithm = AlgorithmId::LSB;
    Header header;
    Bytes payload;
};

/**
 * Hide a payload in a carrier.
 *
 * Returns a new buffer of the carrier's length: header in samples 0..119,
 * payload embedded from sample 1000 with the algorithm selected by the
 * active alternative of params. Throws StegoError.
 */
Samples encode(SampleSpan carrier, ByteSpan payload, const AlgorithmParams& params);

// Same, with the default parameters of the given algorithm
Samples encode(SampleSpan carrier, ByteSpan payload, AlgorithmId algorithm);

/**
 * Recover a payload. Reads and validates the header, checks that the
 * carrier can hold payload_len bytes, then extracts. Either returns the
 * whole payload or throws StegoError.
 */
DecodeResult decode(SampleSpan stego);

// Read and validate the header only
Header readHeader(SampleSpan stego);

// Payload capacity of a carrier of num_samples samples (0 below the header size)
size_t capacityBits(const AlgorithmParams& params, size_t num_samples);
size_t capacityBytes(const AlgorithmParams& params, size_t num_samples);

} // namespace stegwave
