#include "stegwave/stego.hpp"
#include "stegwave/logging.hpp"
#include "algorithms/lsb.hpp"
#include "algorithms/echo.hpp"
#include "algorithms/phase.hpp"
#include "algorithms/dsss.hpp"
#include "protocol/bit_packer.hpp"
#include "protocol/header_codec.hpp"
#include <limits>
#include <string>

namespace stegwave {

namespace {

// Samples from PAYLOAD_OFFSET on; empty for carriers that end before it
MutableSampleSpan payloadRegion(MutableSampleSpan samples) {
    if (samples.size() <= protocol::PAYLOAD_OFFSET) return {};
    return samples.subspan(protocol::PAYLOAD_OFFSET);
}

SampleSpan payloadRegion(SampleSpan samples) {
    if (samples.size() <= protocol::PAYLOAD_OFFSET) return {};
    return samples.subspan(protocol::PAYLOAD_OFFSET);
}

void embedPayload(const AlgorithmParams& params, MutableSampleSpan region, BitSpan bits) {
    switch (algorithmOf(params)) {
        case AlgorithmId::LSB:
            LsbCodec(std::get<LsbParams>(params)).embed(region, bits);
            break;
        case AlgorithmId::ECHO:
            EchoCodec(std::get<EchoParams>(params)).embed(region, bits);
            break;
        case AlgorithmId::PHASE:
            PhaseCodec(std::get<PhaseParams>(params)).embed(region, bits);
            break;
        case AlgorithmId::DSSS:
            DsssCodec(std::get<DsssParams>(params)).embed(region, bits);
            break;
    }
}

Bits extractPayload(const AlgorithmParams& params, SampleSpan region, size_t bit_count) {
    switch (algorithmOf(params)) {
        case AlgorithmId::LSB:
            return LsbCodec(std::get<LsbParams>(params)).extract(region, bit_count);
        case AlgorithmId::ECHO:
            return EchoCodec(std::get<EchoParams>(params)).extract(region, bit_count);
        case AlgorithmId::PHASE:
            return PhaseCodec(std::get<PhaseParams>(params)).extract(region, bit_count);
        case AlgorithmId::DSSS:
            return DsssCodec(std::get<DsssParams>(params)).extract(region, bit_count);
    }
    throw StegoError(ErrorCode::UNKNOWN_ALGORITHM, "unhandled algorithm");
}

size_t regionCapacity(const AlgorithmParams& params, size_t region_samples) {
    switch (algorithmOf(params)) {
        case AlgorithmId::LSB:
            return LsbCodec(std::get<LsbParams>(params)).capacityBits(region_samples);
        case AlgorithmId::ECHO:
            return EchoCodec(std::get<EchoParams>(params)).capacityBits(region_samples);
        case AlgorithmId::PHASE:
            return PhaseCodec(std::get<PhaseParams>(params)).capacityBits(region_samples);
        case AlgorithmId::DSSS: {
            // Capacity does not need the PN sequence
            const auto& p = std::get<DsssParams>(params);
            p.validate();
            return region_samples / p.frame_size;
        }
    }
    return 0;
}

} // namespace

// ============================================================================
// Capacity
// ============================================================================

size_t capacityBits(const AlgorithmParams& params, size_t num_samples) {
    if (num_samples < protocol::HEADER_SAMPLES) return 0;
    size_t region = num_samples > protocol::PAYLOAD_OFFSET ? num_samples - protocol::PAYLOAD_OFFSET : 0;
    return regionCapacity(params, region);
}

size_t capacityBytes(const AlgorithmParams& params, size_t num_samples) {
    return capacityBits(params, num_samples) / 8;
}

// ============================================================================
// Encode
// ============================================================================

Samples encode(SampleSpan carrier, ByteSpan payload, const AlgorithmParams& params) {
    const AlgorithmId algorithm = algorithmOf(params);
    validateParams(params);

    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw StegoError(ErrorCode::INVALID_PARAMETERS, "payload length does not fit 32 bits");
    }
    if (carrier.size() < protocol::HEADER_SAMPLES) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "carrier has " + std::to_string(carrier.size()) +
                         " samples, header needs " + std::to_string(protocol::HEADER_SAMPLES));
    }

    const size_t needed = payload.size() * 8;
    const size_t available = capacityBits(params, carrier.size());
    if (needed > available) {
        LOG_EMBED(WARN, "%s: payload needs %zu bits, carrier holds %zu",
                  algorithmIdToString(algorithm), needed, available);
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         std::string(algorithmIdToString(algorithm)) + " payload needs " +
                         std::to_string(needed) + " bits, carrier holds " + std::to_string(available));
    }

    Header header;
    header.algorithm = algorithm;
    header.params = toHeaderFields(params);
    header.payload_len = static_cast<uint32_t>(payload.size());

    Bits bits = protocol::bytesToBits(payload);

    Samples out(carrier.begin(), carrier.end());
    MutableSampleSpan samples(out);

    protocol::HeaderCodec::encode(header, samples.first(protocol::HEADER_SAMPLES));
    embedPayload(params, payloadRegion(samples), bits);

    LOG_INFO("STEGO", "Encoded %zu bytes with %s (%zu of %zu bits used)",
             payload.size(), algorithmIdToString(algorithm), needed, available);
    return out;
}

Samples encode(SampleSpan carrier, ByteSpan payload, AlgorithmId algorithm) {
    return encode(carrier, payload, presets::forAlgorithm(algorithm));
}

// ============================================================================
// Decode
// ============================================================================

Header readHeader(SampleSpan stego) {
    return protocol::HeaderCodec::decode(stego);
}

DecodeResult decode(SampleSpan stego) {
    Header header = readHeader(stego);
    AlgorithmParams params = paramsFromHeader(header.algorithm, header.params);

    const size_t bit_count = static_cast<size_t>(header.payload_len) * 8;
    const size_t available = capacityBits(params, stego.size());
    if (bit_count > available) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "header announces " + std::to_string(header.payload_len) +
                         " bytes, carrier holds " + std::to_string(available / 8));
    }

    Bits bits = extractPayload(params, payloadRegion(stego), bit_count);

    DecodeResult result;
    result.algorithm = header.algorithm;
    result.header = header;
    result.payload = protocol::bitsToBytes(bits);

    LOG_INFO("STEGO", "Decoded %zu bytes with %s",
             result.payload.size(), algorithmIdToString(result.algorithm));
    return result;
}

} // namespace stegwave
