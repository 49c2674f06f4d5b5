#include <iostream>
#include <cassert>
#include <string>
#include "stegwave/stego.hpp"
#include "stegwave/logging.hpp"
#include "protocol/header_codec.hpp"
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

const AlgorithmId ALL_ALGORITHMS[] = {
    AlgorithmId::LSB, AlgorithmId::ECHO, AlgorithmId::PHASE, AlgorithmId::DSSS
};

void test_zero_carrier_example() {
    TEST("20000 zero samples, LSB, payload 0xA5") {
        Samples carrier(20000, 0);
        Bytes payload = {0xA5};

        Samples stego = encode(carrier, payload, AlgorithmId::LSB);
        DecodeResult result = decode(stego);

        assert(result.algorithm == AlgorithmId::LSB);
        assert(static_cast<int>(result.algorithm) == 1);
        assert(result.payload == payload);

        // 0xA5 = 10100101 in the LSBs of samples 1000..1007
        Samples expected = {1, 0, 1, 0, 0, 1, 0, 1};
        assert(Samples(stego.begin() + 1000, stego.begin() + 1008) == expected);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_carrier_not_modified() {
    TEST("encode returns a new buffer") {
        Samples carrier = test::noiseCarrier(3000, 71);
        Samples copy = carrier;
        Bytes payload = {1, 2, 3};
        Samples stego = encode(carrier, payload, AlgorithmId::LSB);

        assert(carrier == copy);
        assert(stego.size() == carrier.size());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_empty_payload() {
    TEST("empty payload, every algorithm") {
        Samples carrier = test::noiseCarrier(20000, 72);
        for (AlgorithmId id : ALL_ALGORITHMS) {
            Samples stego = encode(carrier, Bytes{}, id);
            DecodeResult result = decode(stego);
            assert(result.algorithm == id);
            assert(result.header.payload_len == 0);
            assert(result.payload.empty());

            // Nothing past the header changes
            for (size_t i = protocol::HEADER_SAMPLES; i < carrier.size(); ++i) {
                assert(stego[i] == carrier[i]);
            }
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_single_byte() {
    TEST("1-byte payload, every algorithm") {
        // Large enough for 8 DSSS frames of 8192
        Samples carrier = test::noiseCarrier(1000 + 8 * 8192, 73);
        Bytes payload = {0x5C};
        for (AlgorithmId id : ALL_ALGORITHMS) {
            DecodeResult result = decode(encode(carrier, payload, id));
            assert(result.algorithm == id);
            assert(result.payload == payload);
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_header_bit_flips() {
    TEST("single LSB flip in header region never decodes") {
        Samples carrier = test::noiseCarrier(4000, 74);
        Bytes payload = test::randomBytes(100, 75);
        Samples stego = encode(carrier, payload, AlgorithmId::LSB);

        for (size_t i = 0; i < protocol::HEADER_SAMPLES; ++i) {
            Samples corrupted = stego;
            corrupted[i] ^= 1;
            bool rejected = false;
            try {
                (void)decode(corrupted);
            } catch (const StegoError& e) {
                rejected = e.code() == ErrorCode::BAD_MAGIC ||
                           e.code() == ErrorCode::HEADER_CORRUPT;
            }
            assert(rejected);
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_plain_audio() {
    TEST("decode of audio without a header") {
        Samples silence(20000, 0);
        assert(throwsCode([&] { (void)decode(silence); }, ErrorCode::BAD_MAGIC));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_short_carrier() {
    TEST("carrier shorter than the header") {
        Samples tiny(100, 0);
        assert(capacityBits(presets::lsb(), tiny.size()) == 0);
        assert(throwsCode([&] { (void)encode(tiny, Bytes{}, AlgorithmId::LSB); },
                          ErrorCode::INSUFFICIENT_CAPACITY));
        assert(throwsCode([&] { (void)decode(tiny); },
                          ErrorCode::INSUFFICIENT_CAPACITY));

        // Header fits, payload region does not exist
        Samples header_only(500, 0);
        assert(capacityBits(presets::lsb(), header_only.size()) == 0);
        Samples stego = encode(header_only, Bytes{}, AlgorithmId::LSB);
        assert(decode(stego).payload.empty());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_truncated_stego() {
    TEST("truncated stego audio") {
        Samples carrier = test::noiseCarrier(1000 + 64 * 8, 76);
        Bytes payload = test::randomBytes(64, 77);
        Samples stego = encode(carrier, payload, AlgorithmId::LSB);
        stego.resize(stego.size() - 1);

        assert(throwsCode([&] { (void)decode(stego); }, ErrorCode::INSUFFICIENT_CAPACITY));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

// Write a checksummed header by hand
Samples stegoWithHeader(uint8_t algorithm, HeaderFields params, uint32_t length) {
    Header::Serialized bytes = {};
    bytes[0] = protocol::MAGIC_0;
    bytes[1] = protocol::MAGIC_1;
    bytes[2] = algorithm;
    for (int i = 0; i < 3; ++i) {
        bytes[3 + 2 * i] = params[i] & 0xFF;
        bytes[4 + 2 * i] = params[i] >> 8;
    }
    for (int i = 0; i < 4; ++i) {
        bytes[9 + i] = (length >> (8 * i)) & 0xFF;
    }
    uint16_t checksum = Header::calculateChecksum(bytes.data(), 13);
    bytes[13] = checksum & 0xFF;
    bytes[14] = checksum >> 8;

    Samples samples(20000, 0);
    for (size_t i = 0; i < protocol::HEADER_SAMPLES; ++i) {
        samples[i] = (bytes[i / 8] >> (7 - i % 8)) & 1;
    }
    return samples;
}

void test_hand_written_header() {
    TEST("decoder trusts only the header") {
        Samples ok = stegoWithHeader(1, {0, 0, 0}, 0);
        assert(decode(ok).payload.empty());

        Samples unknown = stegoWithHeader(9, {0, 0, 0}, 0);
        assert(throwsCode([&] { (void)decode(unknown); }, ErrorCode::UNKNOWN_ALGORITHM));

        // Echo with identical delays
        Samples same_delays = stegoWithHeader(2, {2048, 100, 100}, 1);
        assert(throwsCode([&] { (void)decode(same_delays); }, ErrorCode::INVALID_PARAMETERS));

        // Payload length beyond the carrier
        Samples too_long = stegoWithHeader(1, {0, 0, 0}, 0xFFFFFFFF);
        assert(throwsCode([&] { (void)decode(too_long); }, ErrorCode::INSUFFICIENT_CAPACITY));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_unknown_algorithm_id() {
    TEST("encode rejects algorithm IDs outside 1..4") {
        Samples carrier(20000, 0);
        Bytes payload = {0xA5};
        for (uint8_t raw : {0, 5, 200}) {
            const AlgorithmId id = static_cast<AlgorithmId>(raw);
            assert(throwsCode([&] { (void)encode(carrier, payload, id); },
                              ErrorCode::UNKNOWN_ALGORITHM));
            assert(throwsCode([&] { (void)presets::forAlgorithm(id); },
                              ErrorCode::UNKNOWN_ALGORITHM));
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_capacity_table() {
    TEST("capacity per algorithm") {
        const size_t n = 1000 + 65536;
        assert(capacityBits(presets::lsb(), n) == 65536);
        assert(capacityBits(presets::echo(), n) == 32);
        assert(capacityBits(presets::phase(), n) == 256 * 8);
        assert(capacityBits(presets::dsss(), n) == 8);
        assert(capacityBytes(presets::lsb(), n) == 8192);

        for (AlgorithmId id : ALL_ALGORITHMS) {
            assert(capacityBits(presets::forAlgorithm(id), 119) == 0);
            assert(capacityBits(presets::forAlgorithm(id), 1000) == 0);
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_error_names() {
    TEST("error codes carry their names") {
        StegoError e(ErrorCode::HEADER_CORRUPT, "checksum 0x1234 != 0x4321");
        assert(e.code() == ErrorCode::HEADER_CORRUPT);
        assert(std::string(e.what()).find("HeaderCorrupt") != std::string::npos);
        assert(std::string(errorCodeToString(ErrorCode::INCOMPLETE_BITS)) == "IncompleteBits");

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

int main() {
    setLogLevel(LogLevel::WARN);
    std::cout << "=== Dispatcher Tests ===\n\n";

    test_zero_carrier_example();
    test_carrier_not_modified();
    test_empty_payload();
    test_single_byte();
    test_header_bit_flips();
    test_plain_audio();
    test_short_carrier();
    test_truncated_stego();
    test_hand_written_header();
    test_unknown_algorithm_id();
    test_capacity_table();
    test_error_names();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "\n";
    std::cout << "Failed: " << tests_failed << "\n";

    return tests_failed > 0 ? 1 : 0;
}
