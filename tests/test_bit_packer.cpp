#include <iostream>
#include <cassert>
#include "stegwave/error.hpp"
#include "protocol/bit_packer.hpp"

using namespace stegwave;
using namespace stegwave::protocol;

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

void test_msb_first() {
    TEST("bytes expand MSB first") {
        Bytes data = {0xA5};
        Bits bits = bytesToBits(data);
        Bits expected = {1, 0, 1, 0, 0, 1, 0, 1};
        assert(bits == expected);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_byte_order() {
    TEST("byte order preserved") {
        Bytes data = {0x80, 0x01};
        Bits bits = bytesToBits(data);
        assert(bits.size() == 16);
        assert(bits[0] == 1);
        for (size_t i = 1; i < 15; ++i) assert(bits[i] == 0);
        assert(bits[15] == 1);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_empty() {
    TEST("empty input") {
        assert(bytesToBits(Bytes{}).empty());
        assert(bitsToBytes(Bits{}).empty());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_reassemble() {
    TEST("bits reassemble to the original bytes") {
        Bytes data;
        for (int i = 0; i < 256; ++i) data.push_back(static_cast<uint8_t>(i));
        Bytes back = bitsToBytes(bytesToBits(data));
        assert(back == data);

        Bits bits = {0, 1, 1, 1, 0, 0, 1, 1,  0, 1, 1, 1, 0, 1, 0, 0};
        Bytes st = bitsToBytes(bits);
        assert(st.size() == 2);
        assert(st[0] == 0x73);  // 's'
        assert(st[1] == 0x74);  // 't'

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_incomplete_bits() {
    TEST("non byte-aligned bit count rejected") {
        for (size_t n : {1, 7, 9, 15}) {
            Bits bits(n, 1);
            bool threw = false;
            try {
                bitsToBytes(bits);
            } catch (const StegoError& e) {
                threw = (e.code() == ErrorCode::INCOMPLETE_BITS);
            }
            assert(threw);
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

int main() {
    std::cout << "=== BitPacker Tests ===\n\n";

    test_msb_first();
    test_byte_order();
    test_empty();
    test_reassemble();
    test_incomplete_bits();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "\n";
    std::cout << "Failed: " << tests_failed << "\n";

    return tests_failed > 0 ? 1 : 0;
}
