#include "ferry/Heap.hpp"

#include "ferry/Trap.hpp"

#include "doctest/doctest.h"

#include <cstring>

namespace ferry {

TEST_CASE("Heap blobs") {
    Heap heap;
    REQUIRE(heap.map());
    CHECK_EQ(heap.allocatedBytes(), 0);

    SUBCASE("zero length") {
        auto blob = heap.allocateBlob(0);
        REQUIRE(!blob.isNull());
        CHECK_EQ(heap.tag(blob), kTagBlob);
        CHECK_EQ(heap.blobLength(blob), 0);
        CHECK_EQ(heap.allocatedBytes(), sizeof(BlobHeader));
    }

    SUBCASE("payload rounds up to whole words") {
        auto blob = heap.allocateBlob(5);
        CHECK_EQ(heap.blobLength(blob), 5);
        CHECK_EQ(heap.allocatedBytes(), sizeof(BlobHeader) + 2 * kWordSize);
        std::memcpy(heap.blobPayload(blob), "abcde", 5);

        auto next = heap.allocateBlob(4);
        CHECK_EQ(next.address(), blob.address() + sizeof(BlobHeader) + 2 * kWordSize);
        CHECK_EQ(std::memcmp(heap.blobPayload(blob), "abcde", 5), 0);
    }

    SUBCASE("references are skewed") {
        auto blob = heap.allocateBlob(1);
        CHECK_EQ(blob.address(), Heap::kHeapBase);
        CHECK_EQ(blob.bits(), Heap::kHeapBase - 1);
        CHECK(heap.resolve(blob) == heap.blobPayload(blob) - sizeof(BlobHeader));
        CHECK_EQ(heap.refer(heap.resolve(blob)), blob);
        CHECK(heap.resolve(ObjectRef()) == nullptr);
        CHECK(heap.refer(nullptr).isNull());
    }

    SUBCASE("mapping again keeps live objects") {
        auto blob = heap.allocateBlob(4);
        std::memcpy(heap.blobPayload(blob), "ferr", 4);
        auto heapPointer = heap.heapPointer();
        CHECK(heap.map());
        CHECK_EQ(heap.heapPointer(), heapPointer);
        auto next = heap.allocateBlob(4);
        CHECK_NE(next.address(), blob.address());
        CHECK_EQ(std::memcmp(heap.blobPayload(blob), "ferr", 4), 0);
    }

    SUBCASE("allocate returns the payload") {
        auto payload = heap.allocate(3);
        REQUIRE(payload);
        auto blob = heap.refer(payload - sizeof(BlobHeader));
        CHECK_EQ(heap.tag(blob), kTagBlob);
        CHECK_EQ(heap.blobLength(blob), 3);
    }
}

TEST_CASE("Heap arrays") {
    Heap heap;
    REQUIRE(heap.map());

    SUBCASE("zero length") {
        auto array = heap.allocateArray(0);
        CHECK_EQ(heap.tag(array), kTagArray);
        CHECK_EQ(heap.arrayLength(array), 0);
        CHECK_EQ(heap.allocatedBytes(), sizeof(ArrayHeader));
    }

    SUBCASE("elements") {
        auto array = heap.allocateArray(3);
        auto element = heap.allocateBlob(8);
        CHECK_EQ(heap.arrayLength(array), 3);
        heap.arrayPut(array, 1, element);
        heap.arrayPut(array, 2, ObjectRef());
        CHECK_EQ(heap.arrayAt(array, 1), element);
        CHECK(heap.arrayAt(array, 2).isNull());
    }

    SUBCASE("maximum length") {
        auto array = heap.allocateArray(kMaxArrayLength);
        CHECK_EQ(heap.arrayLength(array), kMaxArrayLength);
        CHECK_EQ(heap.allocatedBytes(), sizeof(ArrayHeader) + static_cast<uint64_t>(kMaxArrayLength) * kWordSize);
    }

    SUBCASE("over maximum length traps") {
        auto heapPointer = heap.heapPointer();
        bool trapped = false;
        try {
            heap.allocateArray(kMaxArrayLength + 1);
        } catch (const Trap& trap) {
            trapped = true;
            CHECK_EQ(trap.prefix(), kRTSTrapPrefix);
            CHECK_EQ(std::string(trap.what()), "RTS error: Array allocation too large");
        }
        CHECK(trapped);
        CHECK_EQ(heap.heapPointer(), heapPointer);
    }

    SUBCASE("largest count traps") {
        CHECK_THROWS_AS(heap.allocateArray(0xffffffff), Trap);
    }
}

TEST_CASE("Heap exhaustion") {
    Heap heap(2 * LinearMemory::kGrowthUnit);
    REQUIRE(heap.map());
    auto blob = heap.allocateBlob(LinearMemory::kGrowthUnit);
    CHECK_EQ(heap.blobLength(blob), LinearMemory::kGrowthUnit);

    bool trapped = false;
    try {
        heap.allocateBlob(LinearMemory::kGrowthUnit);
    } catch (const Trap& trap) {
        trapped = true;
        CHECK_EQ(trap.message(), "Cannot grow memory");
        CHECK_EQ(trap.prefix(), kRTSTrapPrefix);
    }
    CHECK(trapped);

    heap.resetHeapPointer(Heap::kHeapBase);
    CHECK_EQ(heap.allocatedBytes(), 0);
    CHECK_NOTHROW(heap.allocateBlob(LinearMemory::kGrowthUnit));
}

} // namespace ferry
