#include "header_codec.hpp"
#include "bit_packer.hpp"
#include "stegwave/logging.hpp"
#include <string>

namespace stegwave {

// ============================================================================
// Header wire format
// ============================================================================

uint16_t Header::calculateChecksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; i++) {
        sum += data[i];
    }
    return static_cast<uint16_t>(sum & 0xFFFF);
}

Header::Serialized Header::serialize() const {
    Serialized out{};
    size_t idx = 0;

    out[idx++] = protocol::MAGIC_0;
    out[idx++] = protocol::MAGIC_1;
    out[idx++] = static_cast<uint8_t>(algorithm);

    for (uint16_t field : params) {
        out[idx++] = field & 0xFF;
        out[idx++] = (field >> 8) & 0xFF;
    }

    out[idx++] = payload_len & 0xFF;
    out[idx++] = (payload_len >> 8) & 0xFF;
    out[idx++] = (payload_len >> 16) & 0xFF;
    out[idx++] = (payload_len >> 24) & 0xFF;

    uint16_t checksum = calculateChecksum(out.data(), idx);
    out[idx++] = checksum & 0xFF;
    out[idx++] = (checksum >> 8) & 0xFF;

    return out;
}

Header Header::deserialize(ByteSpan data) {
    if (data.size() < protocol::HEADER_BYTES) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "header needs " + std::to_string(protocol::HEADER_BYTES) + " bytes");
    }

    if (data[0] != protocol::MAGIC_0 || data[1] != protocol::MAGIC_1) {
        LOG_HEADER(DEBUG, "Bad magic 0x%02X 0x%02X", data[0], data[1]);
        throw StegoError(ErrorCode::BAD_MAGIC, "no stego header found");
    }

    uint16_t stored = data[13] | (static_cast<uint16_t>(data[14]) << 8);
    uint16_t calculated = calculateChecksum(data.data(), 13);
    if (stored != calculated) {
        LOG_HEADER(DEBUG, "Checksum mismatch: stored 0x%04X, calculated 0x%04X", stored, calculated);
        throw StegoError(ErrorCode::HEADER_CORRUPT, "header checksum mismatch");
    }

    if (!isKnownAlgorithm(data[2])) {
        throw StegoError(ErrorCode::UNKNOWN_ALGORITHM,
                         "algorithm id " + std::to_string(data[2]));
    }

    Header h;
    h.algorithm = static_cast<AlgorithmId>(data[2]);
    for (size_t i = 0; i < h.params.size(); ++i) {
        h.params[i] = data[3 + 2 * i] | (static_cast<uint16_t>(data[4 + 2 * i]) << 8);
    }
    h.payload_len = data[9] |
                    (static_cast<uint32_t>(data[10]) << 8) |
                    (static_cast<uint32_t>(data[11]) << 16) |
                    (static_cast<uint32_t>(data[12]) << 24);
    return h;
}

namespace protocol {

// ============================================================================
// HeaderCodec
// ============================================================================

void HeaderCodec::encode(const Header& header, MutableSampleSpan samples) {
    if (samples.size() < HEADER_SAMPLES) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "carrier has " + std::to_string(samples.size()) +
                         " samples, header needs " + std::to_string(HEADER_SAMPLES));
    }

    auto bytes = header.serialize();
    Bits bits = bytesToBits(bytes);

    for (size_t i = 0; i < HEADER_SAMPLES; ++i) {
        samples[i] = static_cast<Sample>((samples[i] & ~1) | bits[i]);
    }

    LOG_HEADER(DEBUG, "Wrote header: algo=%s params=[%u,%u,%u] len=%u",
               algorithmIdToString(header.algorithm),
               header.params[0], header.params[1], header.params[2], header.payload_len);
}

Header HeaderCodec::decode(SampleSpan samples) {
    if (samples.size() < HEADER_SAMPLES) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "carrier has " + std::to_string(samples.size()) +
                         " samples, header needs " + std::to_string(HEADER_SAMPLES));
    }

    Bits bits(HEADER_SAMPLES);
    for (size_t i = 0; i < HEADER_SAMPLES; ++i) {
        bits[i] = samples[i] & 1;
    }

    Bytes bytes = bitsToBytes(bits);
    Header header = Header::deserialize(bytes);

    LOG_HEADER(DEBUG, "Read header: algo=%s params=[%u,%u,%u] len=%u",
               algorithmIdToString(header.algorithm),
               header.params[0], header.params[1], header.params[2], header.payload_len);
    return header;
}

} // namespace protocol
} // namespace stegwave
