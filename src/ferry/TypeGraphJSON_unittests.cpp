#include "ferry/TypeGraphJSON.hpp"

#include "ferry/ErrorReporter.hpp"
#include "ferry/Translator.hpp"

#include "doctest/doctest.h"

namespace ferry {

TEST_CASE("TypeGraphJSON cyclic constructors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeGraphJSON loader(errorReporter);
    REQUIRE(loader.parse(R"({
        "constructors": [
            { "name": "Tree", "kind": "def", "line": 1, "column": 6,
              "body": { "kind": "opt", "element": { "kind": "con", "name": "Node" } } },
            { "name": "Node", "kind": "def", "line": 2, "column": 6,
              "body": { "kind": "object", "sort": "object", "fields": [
                  { "label": "left", "type": { "kind": "con", "name": "Tree" } },
                  { "label": "value", "type": { "kind": "prim", "prim": "Nat", "line": 2, "column": 30 } },
                  { "label": "right", "type": { "kind": "con", "name": "Tree" } } ] } }
        ]
    })"));
    CHECK(errorReporter->ok());

    const auto& table = loader.constructors();
    REQUIRE_EQ(table.size(), 2);
    auto tree = table.find("Tree");
    auto node = table.find("Node");
    REQUIRE(tree);
    REQUIRE(node);
    CHECK_EQ(tree->location.lineNumber, 1);
    CHECK_EQ(tree->location.characterNumber, 6);

    REQUIRE(tree->body);
    REQUIRE_EQ(tree->body->kind, type::kOptional);
    auto element = static_cast<const type::OptionalType*>(tree->body.get())->element.get();
    REQUIRE_EQ(element->kind, type::kCon);
    CHECK_EQ(static_cast<const type::ConType*>(element)->constructor, node);

    REQUIRE_EQ(node->body->kind, type::kObject);
    auto object = static_cast<const type::ObjectType*>(node->body.get());
    REQUIRE_EQ(object->fields.size(), 3);
    CHECK_EQ(object->fields[0].label, Label::fromName("left"));
    CHECK_EQ(static_cast<const type::ConType*>(object->fields[0].type.get())->constructor, tree);
    CHECK_EQ(object->fields[1].type->location.lineNumber, 2);
    CHECK_EQ(object->fields[1].type->location.characterNumber, 30);

    CHECK(loader.entryPoints().empty());
    CHECK(!loader.actor());

    Translator translator(errorReporter);
    auto program = translator.translateProgram(table, { tree }, nullptr);
    REQUIRE(program);
    REQUIRE_EQ(program->declarations.size(), 2);
    CHECK_EQ(program->declarations[0].name, "Tree");
    CHECK_EQ(program->declarations[1].name, "Node");
}

TEST_CASE("TypeGraphJSON labels") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeGraphJSON loader(errorReporter);
    REQUIRE(loader.parse(R"({
        "constructors": [
            { "name": "V", "kind": "def", "body": { "kind": "variant", "fields": [
                { "label": 3, "type": { "kind": "prim", "prim": "Null" } },
                { "label": "_7_", "type": { "kind": "prim", "prim": "Null" } },
                { "label": "type_", "type": { "kind": "prim", "prim": "Text" } },
                { "label": "plain", "type": { "kind": "prim", "prim": "Char" } } ] } }
        ]
    })"));
    auto variant = static_cast<const type::VariantType*>(loader.constructors().find("V")->body.get());
    REQUIRE_EQ(variant->fields.size(), 4);
    CHECK_EQ(variant->fields[0].label, Label::fromNumber(3));
    CHECK_EQ(variant->fields[1].label, Label::fromNumber(7));
    CHECK_EQ(variant->fields[2].label, Label::fromName("type"));
    CHECK_EQ(variant->fields[3].label, Label::fromName("plain"));
}

TEST_CASE("TypeGraphJSON actor and entry points") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeGraphJSON loader(errorReporter);
    REQUIRE(loader.parse(R"({
        "constructors": [
            { "name": "Id", "kind": "def", "body": { "kind": "prim", "prim": "Nat64" } },
            { "name": "T", "kind": "abstract" },
            { "name": "Box", "kind": "def", "params": [ "T" ],
              "body": { "kind": "array", "element": { "kind": "var", "name": "T", "index": 0 } } }
        ],
        "entryPoints": [ "Id" ],
        "actor": { "kind": "object", "sort": "actor", "fields": [
            { "label": "fetch", "type": { "kind": "func", "sort": "query", "control": "promises",
                "args": [ { "kind": "con", "name": "Id" } ],
                "results": [ { "kind": "async", "element": { "kind": "tuple", "elements": [] } } ] } } ] }
    })"));

    REQUIRE_EQ(loader.entryPoints().size(), 1);
    CHECK_EQ(loader.entryPoints()[0]->name, "Id");
    auto abstract = loader.constructors().find("T");
    REQUIRE(abstract);
    CHECK_EQ(abstract->kind, type::Constructor::kAbstract);
    CHECK(!abstract->body);
    auto box = loader.constructors().find("Box");
    REQUIRE_EQ(box->typeParameters.size(), 1);
    CHECK_EQ(box->typeParameters[0], "T");

    REQUIRE(loader.actor());
    REQUIRE_EQ(loader.actor()->kind, type::kObject);
    auto actor = static_cast<const type::ObjectType*>(loader.actor());
    CHECK_EQ(actor->sort, type::kActorObject);
    REQUIRE_EQ(actor->fields.size(), 1);
    REQUIRE_EQ(actor->fields[0].type->kind, type::kFunction);
    auto function = static_cast<const type::FunctionType*>(actor->fields[0].type.get());
    CHECK_EQ(function->sort, type::kQueryFunction);
    CHECK_EQ(function->control, type::kPromises);
    CHECK_EQ(function->arguments.size(), 1);
    CHECK_EQ(function->results.size(), 1);
    CHECK(errorReporter->ok());
}

TEST_CASE("TypeGraphJSON errors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeGraphJSON loader(errorReporter);

    SUBCASE("malformed JSON") {
        CHECK(!loader.parse("{\n  \"constructors\": [\n  ,\n]}"));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kJSONParse);
        CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 3);
    }

    SUBCASE("not an object") {
        CHECK(!loader.parse("[]"));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kMalformedTypeGraph);
    }

    SUBCASE("missing constructors") {
        CHECK(!loader.parse("{}"));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kMalformedTypeGraph);
    }

    SUBCASE("unknown kind") {
        CHECK(!loader.parse(R"({ "constructors": [
            { "name": "A", "kind": "def", "body": { "kind": "bogus", "line": 9, "column": 4 } } ] })"));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kMalformedTypeGraph);
        CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 9);
        CHECK_EQ(errorReporter->errors()[0].location.characterNumber, 4);
    }

    SUBCASE("unknown primitive") {
        CHECK(!loader.parse(R"({ "constructors": [
            { "name": "A", "kind": "def", "body": { "kind": "prim", "prim": "Real" } } ] })"));
        CHECK_EQ(errorReporter->errorCount(), 1);
    }

    SUBCASE("unknown constructor") {
        CHECK(!loader.parse(R"({ "constructors": [
            { "name": "A", "kind": "def", "body": { "kind": "con", "name": "B", "line": 3, "column": 1 } } ] })"));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kMalformedTypeGraph);
        CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 3);
    }

    SUBCASE("duplicate constructor") {
        CHECK(!loader.parse(R"({ "constructors": [
            { "name": "A", "kind": "def", "body": { "kind": "pre" } },
            { "name": "A", "kind": "def", "body": { "kind": "pre" } } ] })"));
        CHECK_EQ(errorReporter->errorCount(), 1);
    }

    SUBCASE("definition without a body") {
        CHECK(!loader.parse(R"({ "constructors": [ { "name": "A", "kind": "def" } ] })"));
        CHECK_EQ(errorReporter->errorCount(), 1);
    }

    SUBCASE("unknown entry point") {
        CHECK(!loader.parse(R"({ "constructors": [], "entryPoints": [ "Main" ] })"));
        CHECK_EQ(errorReporter->errorCount(), 1);
    }

    SUBCASE("bad label") {
        CHECK(!loader.parse(R"({ "constructors": [
            { "name": "A", "kind": "def", "body": { "kind": "variant", "fields": [
                { "label": -1, "type": { "kind": "pre" } } ] } } ] })"));
        CHECK_EQ(errorReporter->errorCount(), 1);
    }
}

} // namespace ferry
