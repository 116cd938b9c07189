#include "ferry/Label.hpp"

#include "doctest/doctest.h"

namespace ferry {

TEST_CASE("Label numeric passthrough") {
    auto label = Label::fromNumber(7);
    CHECK(label.isNumber());
    CHECK_EQ(label.id(), 7);
    CHECK_EQ(label.displayName(), "7");

    auto zero = Label::fromNumber(0);
    CHECK_EQ(zero.id(), 0);
    CHECK_EQ(zero.displayName(), "0");

    auto big = Label::fromNumber(4294967295u);
    CHECK_EQ(big.id(), 4294967295u);
    CHECK_EQ(big.displayName(), "4294967295");
}

TEST_CASE("Label textual hashing") {
    auto label = Label::fromName("foo");
    CHECK_FALSE(label.isNumber());
    CHECK_EQ(label.id(), 5097222);
    CHECK_EQ(label.displayName(), "foo");
    CHECK_EQ(Label::fromName("foo").id(), label.id());
    CHECK_NE(Label::fromName("bar").id(), label.id());
}

TEST_CASE("Label unescape") {
    SUBCASE("plain identifiers") {
        CHECK_EQ(Label::unescape("name"), Label::fromName("name"));
        CHECK_EQ(Label::unescape("_"), Label::fromName("_"));
        CHECK_EQ(Label::unescape("_private"), Label::fromName("_private"));
    }
    SUBCASE("trailing underscore dropped") {
        CHECK_EQ(Label::unescape("type_"), Label::fromName("type"));
        CHECK_EQ(Label::unescape("query_"), Label::fromName("query"));
        CHECK_EQ(Label::unescape("__"), Label::fromName("_"));
    }
    SUBCASE("numeric escapes") {
        CHECK_EQ(Label::unescape("_7_"), Label::fromNumber(7));
        CHECK_EQ(Label::unescape("_0_"), Label::fromNumber(0));
        CHECK_EQ(Label::unescape("_4294967295_"), Label::fromNumber(4294967295u));
    }
    SUBCASE("not quite numeric") {
        CHECK_EQ(Label::unescape("_7a_"), Label::fromName("_7a"));
        CHECK_EQ(Label::unescape("_4294967296_"), Label::fromName("_4294967296"));
    }
}

} // namespace ferry
