#include <iostream>
#include <cassert>
#include "stegwave/stego.hpp"
#include "stegwave/dsp.hpp"
#include "stegwave/logging.hpp"
#include "algorithms/dsss.hpp"
#include "test_signals.hpp"

using namespace stegwave;

int tests_passed = 0;
int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try

#define PASS() \
    std::cout << "PASS\n"; \
    tests_passed++;

#define FAIL(msg) \
    std::cout << "FAIL: " << msg << "\n"; \
    tests_failed++;
template <typename Fn>
bool throwsCode(Fn fn, ErrorCode expected) {
    try {
        fn();
    } catch (const StegoError& e) {
        return e.code() == expected;
    }
    return false;
}

DsssParams fastDsss() {
    DsssParams p;
    p.frame_size = 512;
    p.seed = 4242;
    p.alpha = 500;
    return p;
}

void test_sequence_from_seed() {
    TEST("codec PN sequence matches generator") {
        DsssCodec codec(presets::dsss());
        assert(codec.sequence().size() == 8192);
        assert(codec.sequence() == dsp::generatePnSequence(8192, 12345));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_chip_amplitude() {
    TEST("each sample moves by exactly +/-alpha") {
        DsssParams p = fastDsss();
        DsssCodec codec(p);
        Samples region = test::noiseCarrier(512 * 2, 61, 2000);
        Samples original = region;
        codec.embed(region, Bits({1, 0}));

        for (size_t i = 0; i < 512; ++i) {
            assert(region[i] - original[i] == 500 * codec.sequence()[i]);
            assert(region[512 + i] - original[512 + i] == -500 * codec.sequence()[i]);
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_silent_carrier() {
    TEST("DSSS on an all-zero carrier") {
        DsssCodec codec(fastDsss());
        Samples region(512 * 16, 0);
        Bits bits = test::randomBits(16, 62);
        codec.embed(region, bits);
        assert(codec.extract(region, bits.size()) == bits);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_region_multi_kb() {
    TEST("DSSS 1024-byte payload, frame 512") {
        DsssCodec codec(fastDsss());
        Bits bits = test::randomBits(1024 * 8, 63);
        Samples region = test::noiseCarrier(512 * bits.size(), 64, 2000);

        codec.embed(region, bits);
        Bits recovered = codec.extract(region, bits.size());

        size_t errors = 0;
        for (size_t i = 0; i < bits.size(); ++i) {
            if (recovered[i] != bits[i]) errors++;
        }
        std::cout << "(" << errors << " bit errors) ";
        assert(errors == 0);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_default_params() {
    TEST("DSSS default parameters through encode/decode") {
        Bytes payload = {'d', 's', 's', 's'};
        Samples carrier = test::noiseCarrier(1000 + payload.size() * 8 * 8192, 65);

        Samples stego = encode(carrier, payload, AlgorithmId::DSSS);
        DecodeResult result = decode(stego);

        assert(result.algorithm == AlgorithmId::DSSS);
        assert(result.header.params == HeaderFields({8192, 12345, 500}));
        assert(result.payload == payload);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_full_codec_multi_kb() {
    TEST("DSSS 2048-byte payload through encode/decode, frame 256") {
        DsssParams p;
        p.frame_size = 256;
        p.seed = 777;
        p.alpha = 500;

        Bytes payload = test::randomBytes(2048, 67);
        // Quieter carrier: correlation noise is amplitude / sqrt(3 * 256)
        Samples carrier = test::noiseCarrier(1000 + payload.size() * 8 * 256, 68, 1000);
        assert(capacityBytes(p, carrier.size()) == payload.size());

        Samples stego = encode(carrier, payload, p);
        DecodeResult result = decode(stego);

        assert(result.algorithm == AlgorithmId::DSSS);
        assert(result.header.params == HeaderFields({256, 777, 500}));
        assert(result.header.payload_len == 2048);
        assert(result.payload == payload);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_capacity() {
    TEST("DSSS capacity") {
        assert(capacityBits(presets::dsss(), 1000 + 8192 * 8) == 8);
        assert(capacityBits(presets::dsss(), 1000 + 8192 * 8 - 1) == 7);
        assert(capacityBytes(presets::dsss(), 1000 + 8192 * 8 - 1) == 0);

        Samples carrier = test::noiseCarrier(1000 + 8192 * 8 - 1, 66);
        Bytes payload = {0x42};
        assert(throwsCode([&] { (void)encode(carrier, payload, AlgorithmId::DSSS); },
                          ErrorCode::INSUFFICIENT_CAPACITY));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_invalid_params() {
    TEST("DSSS parameter validation") {
        DsssParams p = presets::dsss();
        p.frame_size = 0;
        assert(throwsCode([&] { DsssCodec codec(p); }, ErrorCode::INVALID_PARAMETERS));

        p = presets::dsss();
        p.alpha = 0.5;
        assert(throwsCode([&] { DsssCodec codec(p); }, ErrorCode::INVALID_PARAMETERS));

        p = presets::dsss();
        p.alpha = 250.5;                // Header carries whole numbers only
        assert(throwsCode([&] { DsssCodec codec(p); }, ErrorCode::INVALID_PARAMETERS));

        // Seed must fit its 16-bit header slot
        p = presets::dsss();
        p.frame_size = 512;
        p.seed = 70000;
        Samples carrier(1000 + 512 * 8, 0);
        Bytes payload = {0x01};
        assert(throwsCode([&] { (void)encode(carrier, payload, p); },
                          ErrorCode::INVALID_PARAMETERS));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

int main() {
    setLogLevel(LogLevel::WARN);
    std::cout << "=== DSSS Tests ===\n\n";

    test_sequence_from_seed();
    test_chip_amplitude();
    test_silent_carrier();
    test_region_multi_kb();
    test_default_params();
    test_full_codec_multi_kb();
    test_capacity();
    test_invalid_params();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "\n";
    std::cout << "Failed: " << tests_failed << "\n";

    return tests_failed > 0 ? 1 : 0;
}
