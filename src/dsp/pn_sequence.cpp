#include "stegwave/dsp.hpp"
#include "stegwave/logging.hpp"
#include <random>

namespace stegwave {

namespace dsp {

// Revision 1: chip i is +1 when the top bit of the i-th 32-bit mt19937 draw
// is set, -1 otherwise
std::vector<int8_t> generatePnSequence(size_t length, uint32_t seed) {
    static_assert(PN_GENERATOR_VERSION == 1, "PN generator revision changed");

    std::mt19937 rng(seed);
    std::vector<int8_t> sequence(length);
    for (size_t i = 0; i < length; ++i) {
        sequence[i] = (rng() & 0x80000000u) ? 1 : -1;
    }

    LOG_DSP(TRACE, "PN sequence v%d: %zu chips, seed %u", PN_GENERATOR_VERSION, length, seed);
    return sequence;
}

} // namespace dsp

} // namespace stegwave
