#include "ferry/Varint.hpp"

#include "doctest/doctest.h"

#include <array>
#include <cstdint>
#include <limits>
#include <vector>

namespace {

std::vector<uint8_t> encodeU(uint64_t value) {
    std::array<uint8_t, ferry::kMaxVarint64Length> buffer;
    auto length = ferry::encodeUnsigned(value, buffer.data());
    return std::vector<uint8_t>(buffer.begin(), buffer.begin() + length);
}

std::vector<uint8_t> encodeS(int64_t value) {
    std::array<uint8_t, ferry::kMaxVarint64Length> buffer;
    auto length = ferry::encodeSigned(value, buffer.data());
    return std::vector<uint8_t>(buffer.begin(), buffer.begin() + length);
}

} // namespace

namespace ferry {

TEST_CASE("encodeUnsigned") {
    SUBCASE("zero is a single zero byte") { CHECK_EQ(encodeU(0), std::vector<uint8_t>{ 0x00 }); }
    SUBCASE("single byte values") {
        CHECK_EQ(encodeU(1), std::vector<uint8_t>{ 0x01 });
        CHECK_EQ(encodeU(127), std::vector<uint8_t>{ 0x7f });
    }
    SUBCASE("multi byte values") {
        CHECK_EQ(encodeU(128), std::vector<uint8_t>{ 0x80, 0x01 });
        CHECK_EQ(encodeU(300), std::vector<uint8_t>{ 0xac, 0x02 });
        CHECK_EQ(encodeU(624485), std::vector<uint8_t>{ 0xe5, 0x8e, 0x26 });
        CHECK_EQ(encodeU(0xffffffff), std::vector<uint8_t>{ 0xff, 0xff, 0xff, 0xff, 0x0f });
        CHECK_EQ(encodeU(std::numeric_limits<uint64_t>::max()),
                 std::vector<uint8_t>{ 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01 });
    }
    SUBCASE("minimal length") {
        for (uint64_t value : { 1ull, 127ull, 128ull, 16383ull, 16384ull, 0xffffffffull, 0x123456789abcull }) {
            auto bytes = encodeU(value);
            CHECK_NE(bytes.back(), 0);
            CHECK_EQ(bytes.size(), unsignedLength(value));
        }
        CHECK_EQ(unsignedLength(0), 1);
    }
}

TEST_CASE("encodeSigned") {
    CHECK_EQ(encodeS(0), std::vector<uint8_t>{ 0x00 });
    CHECK_EQ(encodeS(-1), std::vector<uint8_t>{ 0x7f });
    CHECK_EQ(encodeS(63), std::vector<uint8_t>{ 0x3f });
    CHECK_EQ(encodeS(64), std::vector<uint8_t>{ 0xc0, 0x00 });
    CHECK_EQ(encodeS(-64), std::vector<uint8_t>{ 0x40 });
    CHECK_EQ(encodeS(-65), std::vector<uint8_t>{ 0xbf, 0x7f });
    CHECK_EQ(encodeS(-123456), std::vector<uint8_t>{ 0xc0, 0xbb, 0x78 });
    CHECK_EQ(encodeS(std::numeric_limits<int32_t>::min()), std::vector<uint8_t>{ 0x80, 0x80, 0x80, 0x80, 0x78 });
    CHECK_EQ(encodeS(std::numeric_limits<int64_t>::min()),
             std::vector<uint8_t>{ 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x7f });
    CHECK_EQ(signedLength(64), 2);
    CHECK_EQ(signedLength(-64), 1);
    CHECK_EQ(signedLength(std::numeric_limits<int64_t>::max()), kMaxVarint64Length);
}

TEST_CASE("decodeUnsigned round trip") {
    for (uint64_t value : { 0ull, 1ull, 63ull, 64ull, 127ull, 128ull, 300ull, 0xffffffffull, 0x100000000ull,
                            0x7fffffffffffffffull, 0xffffffffffffffffull }) {
        auto bytes = encodeU(value);
        uint64_t decoded = 0;
        size_t length = 0;
        REQUIRE(decodeUnsigned(bytes.data(), bytes.size(), decoded, length));
        CHECK_EQ(decoded, value);
        CHECK_EQ(length, bytes.size());
    }
}

TEST_CASE("decodeSigned round trip") {
    for (int64_t value : { int64_t(0), int64_t(-1), int64_t(63), int64_t(64), int64_t(-64), int64_t(-65),
                           int64_t(8191), int64_t(-8193), std::numeric_limits<int64_t>::max(),
                           std::numeric_limits<int64_t>::min() }) {
        auto bytes = encodeS(value);
        int64_t decoded = 0;
        size_t length = 0;
        REQUIRE(decodeSigned(bytes.data(), bytes.size(), decoded, length));
        CHECK_EQ(decoded, value);
        CHECK_EQ(length, bytes.size());
    }
}

TEST_CASE("32-bit decoders") {
    SUBCASE("unsigned round trip") {
        for (uint32_t value : { 0u, 1u, 128u, 0x7fffffffu, 0xffffffffu }) {
            auto bytes = encodeU(value);
            uint32_t decoded = 1;
            size_t length = 0;
            REQUIRE(decodeUnsigned32(bytes.data(), bytes.size(), decoded, length));
            CHECK_EQ(decoded, value);
        }
    }
    SUBCASE("signed round trip") {
        for (int32_t value : { 0, -1, 63, 64, -64, -65, std::numeric_limits<int32_t>::max(),
                               std::numeric_limits<int32_t>::min() }) {
            auto bytes = encodeS(value);
            int32_t decoded = 1;
            size_t length = 0;
            REQUIRE(decodeSigned32(bytes.data(), bytes.size(), decoded, length));
            CHECK_EQ(decoded, value);
        }
    }
    SUBCASE("value wider than 32 bits rejected") {
        auto bytes = encodeU(0x100000000ull);
        uint32_t decoded = 0;
        size_t length = 0;
        CHECK_FALSE(decodeUnsigned32(bytes.data(), bytes.size(), decoded, length));
    }
    SUBCASE("signed value out of range rejected") {
        auto bytes = encodeS(int64_t(std::numeric_limits<int32_t>::min()) - 1);
        int32_t decoded = 0;
        size_t length = 0;
        CHECK_FALSE(decodeSigned32(bytes.data(), bytes.size(), decoded, length));
    }
}

TEST_CASE("malformed input rejected") {
    SUBCASE("empty input") {
        uint64_t value = 42;
        size_t length = 7;
        CHECK_FALSE(decodeUnsigned(nullptr, 0, value, length));
        CHECK_EQ(value, 42);
        CHECK_EQ(length, 7);
    }
    SUBCASE("truncated before terminating byte") {
        std::vector<uint8_t> bytes { 0x80, 0x80 };
        uint64_t value = 0;
        size_t length = 0;
        CHECK_FALSE(decodeUnsigned(bytes.data(), bytes.size(), value, length));
        int64_t signedValue = 0;
        CHECK_FALSE(decodeSigned(bytes.data(), bytes.size(), signedValue, length));
    }
    SUBCASE("caller boundary respected") {
        auto bytes = encodeU(300);
        uint64_t value = 0;
        size_t length = 0;
        CHECK_FALSE(decodeUnsigned(bytes.data(), 1, value, length));
    }
    SUBCASE("too many continuation bytes") {
        std::vector<uint8_t> bytes(11, 0x80);
        bytes.back() = 0x00;
        uint64_t value = 0;
        size_t length = 0;
        CHECK_FALSE(decodeUnsigned(bytes.data(), bytes.size(), value, length));
    }
    SUBCASE("final byte overflows 64 bits") {
        std::vector<uint8_t> bytes { 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x02 };
        uint64_t value = 0;
        size_t length = 0;
        CHECK_FALSE(decodeUnsigned(bytes.data(), bytes.size(), value, length));
    }
    SUBCASE("trailing bytes are left unread") {
        std::vector<uint8_t> bytes { 0xac, 0x02, 0xff };
        uint64_t value = 0;
        size_t length = 0;
        REQUIRE(decodeUnsigned(bytes.data(), bytes.size(), value, length));
        CHECK_EQ(value, 300);
        CHECK_EQ(length, 2);
    }
}

} // namespace ferry
