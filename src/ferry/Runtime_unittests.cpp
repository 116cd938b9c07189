#include "ferry/Runtime.hpp"

#include "ferry/Heap.hpp"
#include "ferry/ThreadContext.hpp"
#include "ferry/Trap.hpp"
#include "ferry/library/Array.hpp"
#include "ferry/library/Blob.hpp"

#include "doctest/doctest.h"

namespace ferry {

TEST_CASE("Runtime runMessage") {
    Runtime runtime;
    REQUIRE(runtime.initialize());
    auto heap = runtime.context()->heap;
    REQUIRE(heap);

    ObjectRef kept;
    CHECK(runtime.runMessage([&kept](ThreadContext* context) {
        kept = library::Blob::fromView(context, "survives").ref();
    }));
    CHECK(runtime.lastTrap().empty());
    auto heapPointer = heap->heapPointer();
    CHECK_GT(heapPointer, Heap::kHeapBase);

    SUBCASE("trap rolls back allocations") {
        CHECK(!runtime.runMessage([](ThreadContext* context) {
            library::Blob::fromView(context, "discarded");
            library::Array::alloc(context, kMaxArrayLength + 1);
        }));
        CHECK_EQ(runtime.lastTrap(), "RTS error: Array allocation too large");
        CHECK_EQ(heap->heapPointer(), heapPointer);
        CHECK_EQ(library::Blob(runtime.context(), kept).view(), "survives");
    }

    SUBCASE("IDL trap") {
        CHECK(!runtime.runMessage([](ThreadContext*) { idlTrapWith("bad input"); }));
        CHECK_EQ(runtime.lastTrap(), "IDL error: bad input");
    }

    SUBCASE("instance usable after a trap") {
        CHECK(!runtime.runMessage([](ThreadContext*) { rtsTrapWith("first"); }));
        CHECK(runtime.runMessage([](ThreadContext* context) {
            auto array = library::Array::newClear(context, 4);
            CHECK_EQ(array.size(), 4);
        }));
        CHECK_GT(heap->heapPointer(), heapPointer);
    }
}

TEST_CASE("Runtime instances are independent") {
    Runtime first(1024 * 1024);
    Runtime second(1024 * 1024);
    REQUIRE(first.initialize());
    REQUIRE(second.initialize());

    ObjectRef firstRef;
    ObjectRef secondRef;
    CHECK(first.runMessage([&firstRef](ThreadContext* context) {
        firstRef = library::Blob::fromView(context, "first").ref();
    }));
    CHECK(second.runMessage([&secondRef](ThreadContext* context) {
        secondRef = library::Blob::fromView(context, "second").ref();
    }));

    // Both heaps hand out the same first address, backed by different memory.
    CHECK_EQ(firstRef, secondRef);
    CHECK_EQ(library::Blob(first.context(), firstRef).view(), "first");
    CHECK_EQ(library::Blob(second.context(), secondRef).view(), "second");
}

TEST_CASE("Trap") {
    Trap trap(kIDLTrapPrefix, "unexpected end of input");
    CHECK_EQ(trap.prefix(), "IDL error: ");
    CHECK_EQ(trap.message(), "unexpected end of input");
    CHECK_EQ(std::string(trap.what()), "IDL error: unexpected end of input");
    CHECK_THROWS_WITH_AS(rtsTrapWith("oops"), "RTS error: oops", Trap);
}

} // namespace ferry
