#include "dsss.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/error.hpp"
#include "stegwave/logging.hpp"
#include <string>

namespace stegwave {

DsssCodec::DsssCodec(const DsssParams& params) : params_(params) {
    params_.validate();
    sequence_ = dsp::generatePnSequence(params_.frame_size, params_.seed);
}

void DsssCodec::embed(MutableSampleSpan region, BitSpan bits) const {
    const size_t frame = params_.frame_size;
    if (bits.size() > capacityBits(region.size())) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "DSSS needs " + std::to_string(bits.size()) + " frames of " +
                         std::to_string(frame) + ", " +
                         std::to_string(capacityBits(region.size())) + " available");
    }

    for (size_t b = 0; b < bits.size(); ++b) {
        MutableSampleSpan seg = region.subspan(b * frame, frame);
        const Real amplitude = bits[b] ? params_.alpha : -params_.alpha;
        for (size_t i = 0; i < frame; ++i) {
            seg[i] = dsp::toPcm16(seg[i] + amplitude * sequence_[i]);
        }
    }

    LOG_EMBED(DEBUG, "DSSS: %zu bits, frame=%u seed=%u alpha=%.0f",
              bits.size(), params_.frame_size, params_.seed, params_.alpha);
}

Bits DsssCodec::extract(SampleSpan region, size_t bit_count) const {
    const size_t frame = params_.frame_size;
    if (bit_count > capacityBits(region.size())) {
        throw StegoError(ErrorCode::INSUFFICIENT_CAPACITY,
                         "DSSS needs " + std::to_string(bit_count) + " frames of " +
                         std::to_string(frame) + ", " +
                         std::to_string(capacityBits(region.size())) + " available");
    }

    Bits bits(bit_count);
    for (size_t b = 0; b < bit_count; ++b) {
        Real corr = dsp::normalizedCorrelation(region.subspan(b * frame, frame), sequence_);
        bits[b] = corr > 0 ? 1 : 0;
        LOG_DSP(TRACE, "DSSS frame %zu: corr=%.2f -> %d", b, corr, bits[b]);
    }

    LOG_EXTRACT(DEBUG, "DSSS: %zu bits, frame=%u seed=%u", bit_count, params_.frame_size, params_.seed);
    return bits;
}

} // namespace stegwave
