#include "ferry/TranslationEnvironment.hpp"

#include "doctest/doctest.h"

namespace {
ferry::Hash collidingHash(std::string_view name) { return static_cast<ferry::Hash>(name.size()); }
} // namespace

namespace ferry {

TEST_CASE("TranslationEnvironment states") {
    TranslationEnvironment environment;
    CHECK_EQ(environment.state("A"), TranslationEnvironment::kAbsent);
    CHECK(!environment.collides("A"));

    environment.addPlaceholder("A");
    CHECK_EQ(environment.state("A"), TranslationEnvironment::kPlaceholder);
    CHECK_EQ(environment.placeholderCount(), 1);

    environment.addPlaceholder("B");
    environment.resolve("B", std::make_unique<idl::PrimType>(idl::kNat));
    environment.resolve("A", std::make_unique<idl::VarType>("B"));
    CHECK_EQ(environment.state("A"), TranslationEnvironment::kResolved);
    CHECK_EQ(environment.state("B"), TranslationEnvironment::kResolved);
    CHECK_EQ(environment.placeholderCount(), 0);
    CHECK_EQ(environment.size(), 2);

    // Resolution order doesn't change first-encountered order.
    auto declarations = environment.takeDeclarations();
    REQUIRE_EQ(declarations.size(), 2);
    CHECK_EQ(declarations[0].name, "A");
    CHECK_EQ(declarations[0].type->kind, idl::kVar);
    CHECK_EQ(declarations[1].name, "B");
    CHECK_EQ(declarations[1].type->kind, idl::kPrim);

    CHECK_EQ(environment.size(), 0);
    CHECK_EQ(environment.state("A"), TranslationEnvironment::kAbsent);
}

TEST_CASE("TranslationEnvironment collisions") {
    TranslationEnvironment environment(collidingHash);
    environment.addPlaceholder("ab");
    CHECK(!environment.collides("ab"));
    CHECK(environment.collides("cd"));
    CHECK_EQ(environment.state("cd"), TranslationEnvironment::kAbsent);
    CHECK(!environment.collides("abc"));
}

} // namespace ferry
