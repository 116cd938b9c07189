#include "ferry/Wire.hpp"

#include "ferry/Trap.hpp"
#include "ferry/library/LibraryTestFixture.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace ferry {

TEST_CASE("WireWriter") {
    WireWriter writer;

    SUBCASE("integers") {
        writer.writeUnsigned(624485);
        writer.writeSigned(-123456);
        std::vector<uint8_t> expected = { 0xe5, 0x8e, 0x26, 0xc0, 0xbb, 0x78 };
        CHECK_EQ(writer.buffer(), expected);
    }

    SUBCASE("text") {
        writer.writeText("hi");
        writer.writeText("");
        std::vector<uint8_t> expected = { 0x02, 'h', 'i', 0x00 };
        CHECK_EQ(writer.buffer(), expected);
        auto buffer = writer.takeBuffer();
        CHECK_EQ(buffer.size(), 4);
    }
}

TEST_CASE_FIXTURE(LibraryTestFixture, "WireReader") {
    REQUIRE(initialized());

    SUBCASE("integers") {
        std::vector<uint8_t> input = { 0xe5, 0x8e, 0x26, 0xc0, 0xbb, 0x78 };
        WireReader reader(input.data(), input.size());
        uint64_t unsignedValue = 0;
        REQUIRE(reader.readUnsigned(unsignedValue));
        CHECK_EQ(unsignedValue, 624485);
        CHECK_EQ(reader.position(), 3);
        int64_t signedValue = 0;
        REQUIRE(reader.readSigned(signedValue));
        CHECK_EQ(signedValue, -123456);
        CHECK(reader.atEnd());
        CHECK(!reader.readUnsigned(unsignedValue));
    }

    SUBCASE("blob vector round trip") {
        auto blobs = library::TypedArray<library::Blob>::typedAlloc(context(), 3);
        blobs.typedPut(0, library::Blob::fromView(context(), "alpha"));
        blobs.typedPut(1, library::Blob::fromView(context(), ""));
        blobs.typedPut(2, library::Blob::fromView(context(), "gamma"));
        WireWriter writer;
        writer.writeBlobVector(blobs);
        writer.writeUnsigned(7);

        WireReader reader(writer.buffer().data(), writer.buffer().size());
        library::TypedArray<library::Blob> decoded;
        REQUIRE(reader.readBlobVector(context(), decoded));
        REQUIRE_EQ(decoded.size(), 3);
        CHECK_EQ(decoded.typedAt(0).view(), "alpha");
        CHECK_EQ(decoded.typedAt(1).size(), 0);
        CHECK_EQ(decoded.typedAt(2).view(), "gamma");
        CHECK_EQ(reader.expectUnsigned(), 7);
        CHECK(reader.atEnd());
    }

    SUBCASE("truncated blob") {
        std::vector<uint8_t> input = { 0x05, 'a', 'b' };
        WireReader reader(input.data(), input.size());
        library::Blob blob;
        CHECK(!reader.readBlob(context(), blob));
        CHECK_EQ(reader.position(), 0);
        CHECK(blob.isNull());
    }

    SUBCASE("vector count larger than input is rejected before allocating") {
        // A count of 2^28 with only two bytes of input behind it.
        std::vector<uint8_t> input = { 0x80, 0x80, 0x80, 0x80, 0x01, 0x00, 0x00 };
        WireReader reader(input.data(), input.size());
        auto allocated = context()->heap->allocatedBytes();
        library::TypedArray<library::Blob> blobs;
        CHECK(!reader.readBlobVector(context(), blobs));
        CHECK_EQ(context()->heap->allocatedBytes(), allocated);
        CHECK_EQ(reader.position(), 0);
    }

    SUBCASE("expect traps with IDL prefix") {
        std::vector<uint8_t> input = { 0x03, 'x' };
        WireReader reader(input.data(), input.size());
        bool trapped = false;
        try {
            reader.expectBlob(context());
        } catch (const Trap& trap) {
            trapped = true;
            CHECK_EQ(trap.prefix(), kIDLTrapPrefix);
        }
        CHECK(trapped);

        std::vector<uint8_t> truncated = { 0x80 };
        WireReader truncatedReader(truncated.data(), truncated.size());
        CHECK_THROWS_AS(truncatedReader.expectUnsigned(), Trap);
        CHECK_THROWS_AS(truncatedReader.expectBlobVector(context()), Trap);
    }

    SUBCASE("expect through runMessage") {
        std::vector<uint8_t> input = { 0x02, 0x01, 'a' };
        CHECK(!runtime()->runMessage([&input](ThreadContext* context) {
            WireReader reader(input.data(), input.size());
            reader.expectBlobVector(context);
        }));
        CHECK_EQ(runtime()->lastTrap().substr(0, kIDLTrapPrefix.size()), kIDLTrapPrefix);
    }
}

} // namespace ferry
