#include "ferry/SchemaEmitter.hpp"

#include "ferry/ErrorReporter.hpp"
#include "ferry/Translator.hpp"

#include "doctest/doctest.h"

namespace {

std::unique_ptr<ferry::idl::Type> prim(ferry::idl::PrimKind p) { return std::make_unique<ferry::idl::PrimType>(p); }

ferry::idl::Field field(ferry::Hash id, std::string name, std::unique_ptr<ferry::idl::Type> type) {
    return ferry::idl::Field { id, std::move(name), std::move(type) };
}

} // namespace

namespace ferry {

TEST_CASE("SchemaEmitter names") {
    CHECK(SchemaEmitter::isIdentifier("foo"));
    CHECK(SchemaEmitter::isIdentifier("_private1"));
    CHECK(SchemaEmitter::isIdentifier("List"));
    CHECK(!SchemaEmitter::isIdentifier(""));
    CHECK(!SchemaEmitter::isIdentifier("1st"));
    CHECK(!SchemaEmitter::isIdentifier("kebab-case"));
    CHECK(!SchemaEmitter::isIdentifier("record"));
    CHECK(!SchemaEmitter::isIdentifier("nat"));

    CHECK_EQ(SchemaEmitter::quoteName("foo"), "foo");
    CHECK_EQ(SchemaEmitter::quoteName("service"), "\"service\"");
    CHECK_EQ(SchemaEmitter::quoteName("a b"), "\"a b\"");
    CHECK_EQ(SchemaEmitter::quoteName("say \"hi\""), "\"say \\\"hi\\\"\"");
    CHECK_EQ(SchemaEmitter::quoteName("tab\t"), "\"tab\\09\"");
}

TEST_CASE("SchemaEmitter types") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaEmitter emitter(errorReporter);
    std::string text;

    SUBCASE("primitives") {
        auto type = prim(idl::kFloat64);
        REQUIRE(emitter.emitType(type.get(), text));
        CHECK_EQ(text, "float64");
    }

    SUBCASE("tuple short form") {
        idl::RecordType record;
        record.fields.emplace_back(field(0, "0", prim(idl::kNat)));
        record.fields.emplace_back(field(1, "1", prim(idl::kText)));
        REQUIRE(emitter.emitType(&record, text));
        CHECK_EQ(text, "record { nat; text }");
    }

    SUBCASE("record") {
        idl::RecordType record;
        record.fields.emplace_back(field(7, "7", prim(idl::kBool)));
        record.fields.emplace_back(field(23515, "id", prim(idl::kNat)));
        record.fields.emplace_back(field(1224700491, "name", std::make_unique<idl::OptionalType>(prim(idl::kText))));
        REQUIRE(emitter.emitType(&record, text));
        CHECK_EQ(text, "record { 7 : bool; id : nat; name : opt text }");
    }

    SUBCASE("record with a textual label that looks numeric") {
        idl::RecordType record;
        record.fields.emplace_back(field(idlHash("2"), "2", prim(idl::kNat)));
        REQUIRE(emitter.emitType(&record, text));
        CHECK_EQ(text, "record { \"2\" : nat }");
    }

    SUBCASE("empty record") {
        idl::RecordType record;
        REQUIRE(emitter.emitType(&record, text));
        CHECK_EQ(text, "record {}");
    }

    SUBCASE("variant") {
        idl::VariantType variant;
        variant.fields.emplace_back(field(4895187, "bar", std::make_unique<idl::VectorType>(prim(idl::kNat8))));
        variant.fields.emplace_back(field(5097222, "foo", prim(idl::kNull)));
        REQUIRE(emitter.emitType(&variant, text));
        CHECK_EQ(text, "variant { bar : vec nat8; foo }");
    }

    SUBCASE("functions") {
        idl::FunctionType function;
        function.arguments.emplace_back(field(0, "0", prim(idl::kText)));
        function.arguments.emplace_back(field(1, "1", std::make_unique<idl::VarType>("List")));
        function.results.emplace_back(field(0, "0", prim(idl::kInt)));
        function.modes.emplace_back(idl::kQuery);
        REQUIRE(emitter.emitType(&function, text));
        CHECK_EQ(text, "func (text, List) -> (int) query");
    }

    SUBCASE("oneway function") {
        idl::FunctionType function;
        function.modes.emplace_back(idl::kOneway);
        REQUIRE(emitter.emitType(&function, text));
        CHECK_EQ(text, "func () -> () oneway");
    }

    SUBCASE("placeholder") {
        idl::OptionalType optional(std::make_unique<idl::PreType>());
        CHECK(!emitter.emitType(&optional, text));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kInternal);
    }
}

TEST_CASE("SchemaEmitter program") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaEmitter emitter(errorReporter);

    idl::Program program;
    auto list = std::make_unique<idl::RecordType>();
    list->fields.emplace_back(field(1158359328, "head", prim(idl::kNat)));
    list->fields.emplace_back(field(1291237008, "tail", std::make_unique<idl::VarType>("List")));
    program.declarations.emplace_back(
        idl::TypeDeclaration { "List", std::make_unique<idl::OptionalType>(std::move(list)) });

    auto service = std::make_unique<idl::ServiceType>();
    auto push = std::make_unique<idl::FunctionType>();
    push->arguments.emplace_back(field(0, "0", std::make_unique<idl::VarType>("List")));
    push->modes.emplace_back(idl::kOneway);
    service->methods.emplace_back(idl::Method { "push", std::move(push) });
    auto top = std::make_unique<idl::FunctionType>();
    top->results.emplace_back(field(0, "0", prim(idl::kNat)));
    service->methods.emplace_back(idl::Method { "top", std::move(top) });
    service->methods.emplace_back(idl::Method { "query", std::make_unique<idl::VarType>("Getter") });
    program.declarations.emplace_back(idl::TypeDeclaration { "Server", std::move(service) });
    program.actor = std::make_unique<idl::VarType>("Server");

    std::string text;
    REQUIRE(emitter.emit(&program, text));
    CHECK_EQ(text,
             "type List = opt record { head : nat; tail : List };\n"
             "type Server = service {\n"
             "  push : (List) -> () oneway;\n"
             "  top : () -> (nat);\n"
             "  \"query\" : Getter;\n"
             "};\n"
             "service : Server\n");
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaEmitter translated program") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    type::ConstructorTable table;

    // type Tree = variant { leaf; node : { left : Tree; value : Int; right : Tree } }
    auto tree = table.add("Tree", type::Constructor::kDefinition);
    auto node = std::make_unique<type::ObjectType>(type::kPlainObject);
    node->addField(Label::fromName("left"), std::make_unique<type::ConType>(tree));
    node->addField(Label::fromName("value"), std::make_unique<type::PrimType>(type::kInt));
    node->addField(Label::fromName("right"), std::make_unique<type::ConType>(tree));
    auto body = std::make_unique<type::VariantType>();
    body->addField(Label::fromName("leaf"), std::make_unique<type::PrimType>(type::kNull));
    body->addField(Label::fromName("node"), std::move(node));
    tree->body = std::move(body);

    auto actor = std::make_unique<type::ObjectType>(type::kActorObject);
    auto insert = std::make_unique<type::FunctionType>(type::kSharedFunction, type::kReturns);
    insert->arguments.emplace_back(std::make_unique<type::PrimType>(type::kInt));
    actor->addField(Label::fromName("insert"), std::move(insert));
    auto snapshot = std::make_unique<type::FunctionType>(type::kQueryFunction, type::kPromises);
    snapshot->results.emplace_back(std::make_unique<type::AsyncType>(std::make_unique<type::ConType>(tree)));
    actor->addField(Label::fromName("snapshot"), std::move(snapshot));
    auto pair = std::make_unique<type::FunctionType>(type::kSharedFunction, type::kPromises);
    auto both = std::make_unique<type::TupleType>();
    both->elements.emplace_back(std::make_unique<type::PrimType>(type::kNat));
    both->elements.emplace_back(std::make_unique<type::PrimType>(type::kText));
    pair->results.emplace_back(std::make_unique<type::AsyncType>(std::move(both)));
    actor->addField(Label::fromName("pair"), std::move(pair));
    auto ping = std::make_unique<type::FunctionType>(type::kSharedFunction, type::kPromises);
    ping->results.emplace_back(std::make_unique<type::AsyncType>(std::make_unique<type::TupleType>()));
    actor->addField(Label::fromName("ping"), std::move(ping));

    Translator translator(errorReporter);
    auto program = translator.translateProgram(table, {}, actor.get());
    REQUIRE(program);

    SchemaEmitter emitter(errorReporter);
    std::string text;
    REQUIRE(emitter.emit(program.get(), text));
    // idlHash: leaf < node, and value < left < right.
    CHECK_EQ(text,
             "type Tree = variant { leaf; node : record { value : int; left : Tree; right : Tree } };\n"
             "service : service {\n"
             "  insert : (int) -> () oneway;\n"
             "  snapshot : () -> (Tree) query;\n"
             "  pair : () -> (record { nat; text });\n"
             "  ping : () -> (record {});\n"
             "}\n");
    CHECK(errorReporter->ok());
}

} // namespace ferry
