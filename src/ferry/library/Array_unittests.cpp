#include "ferry/library/Array.hpp"

#include "ferry/library/Blob.hpp"
#include "ferry/library/LibraryTestFixture.hpp"

#include "doctest/doctest.h"

namespace ferry {

TEST_CASE_FIXTURE(LibraryTestFixture, "Array") {
    REQUIRE(initialized());

    SUBCASE("empty") {
        auto array = library::Array::alloc(context(), 0);
        REQUIRE(array);
        CHECK_EQ(array.size(), 0);
        CHECK_EQ(context()->heap->tag(array.ref()), kTagArray);
    }

    SUBCASE("newClear") {
        auto array = library::Array::newClear(context(), 5);
        REQUIRE_EQ(array.size(), 5);
        for (uint32_t i = 0; i < 5; ++i) {
            CHECK(array.at(i).isNull());
        }
    }

    SUBCASE("put and at") {
        auto array = library::Array::newClear(context(), 3);
        auto first = library::Array::alloc(context(), 0);
        auto second = library::Blob::fromView(context(), "abc");
        array.put(0, first.ref());
        array.put(2, second.ref());
        CHECK_EQ(array.at(0), first.ref());
        CHECK(array.at(1).isNull());
        CHECK_EQ(array.at(2), second.ref());
    }

    SUBCASE("null wrapper") {
        library::Array array;
        CHECK(array.isNull());
        CHECK(!array);
        CHECK_EQ(array.size(), 0);
    }

    SUBCASE("typed") {
        auto array = library::TypedArray<library::Blob>::typedAlloc(context(), 2);
        array.typedPut(0, library::Blob::fromView(context(), "one"));
        array.typedPut(1, library::Blob::fromView(context(), "two"));
        CHECK_EQ(array.typedAt(0).view(), "one");
        CHECK_EQ(array.typedAt(1).view(), "two");
    }
}

TEST_CASE_FIXTURE(LibraryTestFixture, "Blob") {
    REQUIRE(initialized());

    SUBCASE("fromView") {
        auto blob = library::Blob::fromView(context(), "hello, world");
        REQUIRE(blob);
        CHECK_EQ(blob.size(), 12);
        CHECK_EQ(blob.view(), "hello, world");
        CHECK_EQ(context()->heap->tag(blob.ref()), kTagBlob);
    }

    SUBCASE("empty") {
        auto blob = library::Blob::fromView(context(), "");
        REQUIRE(blob);
        CHECK_EQ(blob.size(), 0);
        CHECK(blob.view().empty());
    }

    SUBCASE("wrap existing reference") {
        auto ref = context()->heap->allocateBlob(4);
        library::Blob blob(context(), ref);
        CHECK_EQ(blob.size(), 4);
        auto unsafe = library::Blob::wrapUnsafe(context(), ref);
        CHECK_EQ(unsafe.ref(), ref);
    }
}

} // namespace ferry
