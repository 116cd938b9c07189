#include "ferry/Type.hpp"

#include "doctest/doctest.h"

namespace ferry {

TEST_CASE("ConstructorTable") {
    type::ConstructorTable table;
    auto list = table.add("List", type::Constructor::kDefinition);
    REQUIRE(list);
    CHECK_EQ(list->name, "List");
    CHECK_EQ(list->kind, type::Constructor::kDefinition);
    CHECK(!list->body);

    auto t = table.add("T", type::Constructor::kAbstract);
    REQUIRE(t);
    CHECK(!table.add("List", type::Constructor::kAbstract));

    CHECK_EQ(table.size(), 2);
    CHECK_EQ(table.find("List"), list);
    CHECK_EQ(table.find("T"), t);
    CHECK(table.find("Missing") == nullptr);
    CHECK_EQ(table.constructors()[0].get(), list);
    CHECK_EQ(table.constructors()[1].get(), t);
}

TEST_CASE("describeKind") {
    type::ObjectType actor(type::kActorObject);
    CHECK_EQ(type::describeKind(&actor), "actor type");
    type::ObjectType moduleObject(type::kModuleObject);
    CHECK_EQ(type::describeKind(&moduleObject), "module type");
    type::MutType mut(std::make_unique<type::PrimType>(type::kNat));
    CHECK_EQ(type::describeKind(&mut), "mutable type");
    type::PreType pre;
    CHECK_EQ(type::describeKind(&pre), "pre-type");
}

} // namespace ferry
