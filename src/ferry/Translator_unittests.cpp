#include "ferry/Translator.hpp"

#include "ferry/ErrorReporter.hpp"
#include "ferry/Hash.hpp"

#include "doctest/doctest.h"

namespace {

std::unique_ptr<ferry::type::Type> prim(ferry::type::PrimKind p) {
    return std::make_unique<ferry::type::PrimType>(p);
}

std::unique_ptr<ferry::type::Type> con(const ferry::type::Constructor* c) {
    return std::make_unique<ferry::type::ConType>(c);
}

std::unique_ptr<ferry::type::Type> located(std::unique_ptr<ferry::type::Type> t, int32_t line, int32_t column) {
    t->location = ferry::Location { line, column };
    return t;
}

std::unique_ptr<ferry::type::FunctionType> sharedFunction(std::unique_ptr<ferry::type::Type> argument,
                                                          std::unique_ptr<ferry::type::Type> promised) {
    auto function = std::make_unique<ferry::type::FunctionType>(ferry::type::kSharedFunction, ferry::type::kPromises);
    if (argument) {
        function->arguments.emplace_back(std::move(argument));
    }
    function->results.emplace_back(std::make_unique<ferry::type::AsyncType>(std::move(promised)));
    return function;
}

ferry::Hash constantHash(std::string_view) { return 42; }

} // namespace

namespace ferry {

TEST_CASE("Translator primitives") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);

    struct Mapping {
        type::PrimKind from;
        idl::PrimKind to;
    };
    Mapping mappings[] = {
        { type::kNull, idl::kNull },     { type::kBool, idl::kBool },       { type::kNat, idl::kNat },
        { type::kNat8, idl::kNat8 },     { type::kNat16, idl::kNat16 },     { type::kNat32, idl::kNat32 },
        { type::kNat64, idl::kNat64 },   { type::kInt, idl::kInt },         { type::kInt8, idl::kInt8 },
        { type::kInt16, idl::kInt16 },   { type::kInt32, idl::kInt32 },     { type::kInt64, idl::kInt64 },
        { type::kWord8, idl::kNat8 },    { type::kWord16, idl::kNat16 },    { type::kWord32, idl::kNat32 },
        { type::kWord64, idl::kNat64 },  { type::kFloat, idl::kFloat64 },   { type::kChar, idl::kNat32 },
        { type::kText, idl::kText },     { type::kAny, idl::kReserved },    { type::kNon, idl::kEmpty }
    };

    for (const auto& mapping : mappings) {
        auto source = prim(mapping.from);
        auto result = translator.translate(source.get());
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kPrim);
        CHECK_EQ(static_cast<const idl::PrimType*>(result.get())->prim, mapping.to);
    }
    CHECK(errorReporter->ok());
    CHECK_EQ(translator.environment().size(), 0);
}

TEST_CASE("Translator structural types") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);

    SUBCASE("tuple") {
        type::TupleType tuple;
        tuple.elements.emplace_back(prim(type::kNat));
        tuple.elements.emplace_back(prim(type::kText));
        tuple.elements.emplace_back(prim(type::kBool));
        auto result = translator.translate(&tuple);
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kRecord);
        auto record = static_cast<const idl::RecordType*>(result.get());
        REQUIRE_EQ(record->fields.size(), 3);
        for (size_t i = 0; i < 3; ++i) {
            CHECK_EQ(record->fields[i].id, i);
        }
        CHECK_EQ(record->fields[0].name, "0");
        CHECK_EQ(record->fields[2].name, "2");
        CHECK(record->isTuple());
    }

    SUBCASE("empty tuple") {
        type::TupleType tuple;
        auto result = translator.translate(&tuple);
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kRecord);
        CHECK(static_cast<const idl::RecordType*>(result.get())->fields.empty());
    }

    SUBCASE("array and option") {
        type::ArrayType array(std::make_unique<type::OptionalType>(prim(type::kInt)));
        auto result = translator.translate(&array);
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kVector);
        auto element = static_cast<const idl::VectorType*>(result.get())->element.get();
        REQUIRE_EQ(element->kind, idl::kOptional);
        auto inner = static_cast<const idl::OptionalType*>(element)->element.get();
        REQUIRE_EQ(inner->kind, idl::kPrim);
        CHECK_EQ(static_cast<const idl::PrimType*>(inner)->prim, idl::kInt);
    }

    SUBCASE("record fields sorted by id") {
        type::ObjectType object(type::kPlainObject);
        object.addField(Label::fromName("name"), prim(type::kText));
        object.addField(Label::fromName("id"), prim(type::kNat));
        object.addField(Label::fromNumber(7), prim(type::kBool));
        auto result = translator.translate(&object);
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kRecord);
        auto record = static_cast<const idl::RecordType*>(result.get());
        REQUIRE_EQ(record->fields.size(), 3);
        CHECK_EQ(record->fields[0].id, 7);
        CHECK_EQ(record->fields[0].name, "7");
        CHECK_EQ(record->fields[1].id, 23515);
        CHECK_EQ(record->fields[1].name, "id");
        CHECK_EQ(record->fields[2].id, 1224700491);
        CHECK_EQ(record->fields[2].name, "name");
        CHECK(!record->isTuple());
    }

    SUBCASE("variant fields sorted by id") {
        type::VariantType variant;
        variant.addField(Label::fromName("foo"), prim(type::kNull));
        variant.addField(Label::fromName("bar"), prim(type::kNat));
        auto result = translator.translate(&variant);
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kVariant);
        auto fields = &static_cast<const idl::VariantType*>(result.get())->fields;
        REQUIRE_EQ(fields->size(), 2);
        CHECK_EQ(fields->at(0).name, "bar");
        CHECK_EQ(fields->at(0).id, 4895187);
        CHECK_EQ(fields->at(1).name, "foo");
        CHECK_EQ(fields->at(1).id, 5097222);
    }

    CHECK(errorReporter->ok());
}

TEST_CASE("Translator field id collision") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);

    // The numeric label equals the hash of "foo".
    type::ObjectType object(type::kPlainObject);
    object.location = Location { 4, 9 };
    object.addField(Label::fromName("foo"), prim(type::kNat));
    object.addField(Label::fromNumber(5097222), prim(type::kNat));
    CHECK(!translator.translate(&object));
    REQUIRE_EQ(errorReporter->errorCount(), 1);
    CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kFieldIdCollision);
    CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 4);
    CHECK_EQ(errorReporter->errors()[0].location.characterNumber, 9);
}

TEST_CASE("Translator constructors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);
    type::ConstructorTable table;

    SUBCASE("self-referential") {
        // type List = ?{ head : Nat; tail : List }
        auto list = table.add("List", type::Constructor::kDefinition);
        auto node = std::make_unique<type::ObjectType>(type::kPlainObject);
        node->addField(Label::fromName("head"), prim(type::kNat));
        node->addField(Label::fromName("tail"), con(list));
        list->body = std::make_unique<type::OptionalType>(std::move(node));

        auto reference = con(list);
        auto result = translator.translate(reference.get());
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kVar);
        CHECK_EQ(static_cast<const idl::VarType*>(result.get())->name, "List");
        CHECK_EQ(translator.environment().size(), 1);
        CHECK_EQ(translator.environment().state("List"), TranslationEnvironment::kResolved);
        CHECK_EQ(translator.environment().placeholderCount(), 0);
    }

    SUBCASE("self-reference inside its own declaration") {
        // type A = { x : A; y : Int }
        auto a = table.add("A", type::Constructor::kDefinition);
        auto body = std::make_unique<type::ObjectType>(type::kPlainObject);
        body->addField(Label::fromName("x"), con(a));
        body->addField(Label::fromName("y"), prim(type::kInt));
        a->body = std::move(body);

        auto program = translator.translateProgram(table, { a }, nullptr);
        REQUIRE(program);
        REQUIRE_EQ(program->declarations.size(), 1);
        CHECK_EQ(program->declarations[0].name, "A");
        REQUIRE_EQ(program->declarations[0].type->kind, idl::kRecord);
        auto record = static_cast<const idl::RecordType*>(program->declarations[0].type.get());
        REQUIRE_EQ(record->fields.size(), 2);
        const idl::Field* x = nullptr;
        for (const auto& field : record->fields) {
            if (field.id == idlHash("x")) {
                x = &field;
            }
        }
        REQUIRE(x);
        REQUIRE_EQ(x->type->kind, idl::kVar);
        CHECK_EQ(static_cast<const idl::VarType*>(x->type.get())->name, "A");
    }

    SUBCASE("mutually recursive") {
        auto a = table.add("A", type::Constructor::kDefinition);
        auto b = table.add("B", type::Constructor::kDefinition);
        a->body = std::make_unique<type::OptionalType>(con(b));
        b->body = std::make_unique<type::ArrayType>(con(a));

        auto reference = con(a);
        REQUIRE(translator.translate(reference.get()));
        REQUIRE(translator.translate(reference.get()));
        CHECK_EQ(translator.environment().size(), 2);

        type::ObjectType actor(type::kActorObject);
        auto program = translator.translateProgram(table, { a }, &actor);
        REQUIRE(program);
        REQUIRE_EQ(program->declarations.size(), 2);
        CHECK_EQ(program->declarations[0].name, "A");
        CHECK_EQ(program->declarations[1].name, "B");
        REQUIRE_EQ(program->declarations[0].type->kind, idl::kOptional);
        REQUIRE_EQ(program->declarations[1].type->kind, idl::kVector);
    }

    SUBCASE("reached twice") {
        // { x : A; y : Int; z : A }
        auto a = table.add("A", type::Constructor::kDefinition);
        a->body = prim(type::kText);
        type::ObjectType object(type::kPlainObject);
        object.addField(Label::fromName("x"), con(a));
        object.addField(Label::fromName("y"), prim(type::kInt));
        object.addField(Label::fromName("z"), con(a));
        auto result = translator.translate(&object);
        REQUIRE(result);
        auto record = static_cast<const idl::RecordType*>(result.get());
        REQUIRE_EQ(record->fields.size(), 3);
        CHECK_EQ(record->fields[0].type->kind, idl::kVar);
        CHECK_EQ(record->fields[1].type->kind, idl::kPrim);
        CHECK_EQ(record->fields[2].type->kind, idl::kVar);
        CHECK_EQ(translator.environment().size(), 1);
    }

    SUBCASE("failed body") {
        // type A = { bad : mut Nat }
        auto a = table.add("A", type::Constructor::kDefinition);
        auto body = std::make_unique<type::ObjectType>(type::kPlainObject);
        body->addField(Label::fromName("bad"), std::make_unique<type::MutType>(prim(type::kNat)));
        a->body = std::move(body);

        auto reference = con(a);
        CHECK(!translator.translate(reference.get()));
        CHECK(translator.failed());
        CHECK_EQ(translator.environment().placeholderCount(), 1);
        CHECK(!translator.translate(reference.get()));
        CHECK(!translator.translateConstructor(a, a->location));
        CHECK(!translator.translateProgram(table, { a }, nullptr));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kUnrepresentableType);
    }

    SUBCASE("undefined body") {
        auto a = table.add("A", type::Constructor::kDefinition);
        auto reference = con(a);
        CHECK(!translator.translate(reference.get()));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kMalformedTypeGraph);
    }
}

TEST_CASE("Translator symbol collision") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter, constantHash);
    type::ConstructorTable table;
    auto a = table.add("A", type::Constructor::kDefinition);
    a->body = prim(type::kNat);
    auto b = table.add("B", type::Constructor::kDefinition);
    b->body = prim(type::kNat);

    auto first = con(a);
    REQUIRE(translator.translate(first.get()));
    auto second = located(con(b), 12, 3);
    CHECK(!translator.translate(second.get()));
    REQUIRE_EQ(errorReporter->errorCount(), 1);
    CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kSymbolCollision);
    CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 12);
}

TEST_CASE("Translator functions") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);

    SUBCASE("oneway") {
        type::FunctionType function(type::kSharedFunction, type::kReturns);
        function.arguments.emplace_back(prim(type::kText));
        auto result = translator.translate(&function);
        REQUIRE(result);
        REQUIRE_EQ(result->kind, idl::kFunction);
        auto func = static_cast<const idl::FunctionType*>(result.get());
        REQUIRE_EQ(func->arguments.size(), 1);
        CHECK_EQ(func->arguments[0].id, 0);
        CHECK(func->results.empty());
        REQUIRE_EQ(func->modes.size(), 1);
        CHECK_EQ(func->modes[0], idl::kOneway);
    }

    SUBCASE("promise of one value") {
        auto function = sharedFunction(prim(type::kNat), prim(type::kText));
        auto result = translator.translate(function.get());
        REQUIRE(result);
        auto func = static_cast<const idl::FunctionType*>(result.get());
        CHECK_EQ(func->arguments.size(), 1);
        REQUIRE_EQ(func->results.size(), 1);
        CHECK_EQ(func->results[0].type->kind, idl::kPrim);
        CHECK(func->modes.empty());
    }

    SUBCASE("promise of a tuple") {
        auto tuple = std::make_unique<type::TupleType>();
        tuple->elements.emplace_back(prim(type::kNat));
        tuple->elements.emplace_back(prim(type::kText));
        auto function = sharedFunction(nullptr, std::move(tuple));
        auto result = translator.translate(function.get());
        REQUIRE(result);
        auto func = static_cast<const idl::FunctionType*>(result.get());
        CHECK(func->arguments.empty());
        REQUIRE_EQ(func->results.size(), 1);
        CHECK_EQ(func->results[0].id, 0);
        CHECK_EQ(func->results[0].name, "0");
        REQUIRE_EQ(func->results[0].type->kind, idl::kRecord);
        auto record = static_cast<const idl::RecordType*>(func->results[0].type.get());
        REQUIRE_EQ(record->fields.size(), 2);
        CHECK_EQ(record->fields[1].id, 1);
        CHECK(record->isTuple());
    }

    SUBCASE("promise of unit") {
        auto function = sharedFunction(nullptr, std::make_unique<type::TupleType>());
        auto result = translator.translate(function.get());
        REQUIRE(result);
        auto func = static_cast<const idl::FunctionType*>(result.get());
        REQUIRE_EQ(func->results.size(), 1);
        REQUIRE_EQ(func->results[0].type->kind, idl::kRecord);
        CHECK(static_cast<const idl::RecordType*>(func->results[0].type.get())->fields.empty());
        CHECK(func->modes.empty());
    }

    SUBCASE("query") {
        auto function = sharedFunction(nullptr, prim(type::kNat));
        function->sort = type::kQueryFunction;
        auto result = translator.translate(function.get());
        REQUIRE(result);
        auto func = static_cast<const idl::FunctionType*>(result.get());
        REQUIRE_EQ(func->modes.size(), 1);
        CHECK_EQ(func->modes[0], idl::kQuery);
    }

    CHECK(errorReporter->ok());
}

TEST_CASE("Translator actors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);
    type::ConstructorTable table;

    auto entry = table.add("Entry", type::Constructor::kDefinition);
    auto entryBody = std::make_unique<type::ObjectType>(type::kPlainObject);
    entryBody->addField(Label::fromName("key"), prim(type::kText));
    entry->body = std::move(entryBody);

    auto server = table.add("Server", type::Constructor::kDefinition);
    auto actor = std::make_unique<type::ObjectType>(type::kActorObject);
    actor->addField(Label::fromName("put"), sharedFunction(con(entry), std::make_unique<type::TupleType>()));
    actor->addField(Label::fromName("Entry"), std::make_unique<type::TypType>(entry));
    actor->addField(Label::fromName("get"), sharedFunction(prim(type::kText), con(entry)));
    server->body = std::move(actor);

    // Not an actor, so not an entry point by default.
    auto unused = table.add("Unused", type::Constructor::kDefinition);
    unused->body = prim(type::kNat);

    auto program = translator.translateProgram(table, {}, nullptr);
    REQUIRE(program);
    CHECK(!program->actor);
    REQUIRE_EQ(program->declarations.size(), 2);
    CHECK_EQ(program->declarations[0].name, "Server");
    CHECK_EQ(program->declarations[1].name, "Entry");

    REQUIRE_EQ(program->declarations[0].type->kind, idl::kService);
    auto service = static_cast<const idl::ServiceType*>(program->declarations[0].type.get());
    REQUIRE_EQ(service->methods.size(), 2);
    // Source order, not hash order: idlHash("get") < idlHash("put").
    CHECK_EQ(service->methods[0].name, "put");
    CHECK_EQ(service->methods[1].name, "get");
    CHECK(errorReporter->ok());
}

TEST_CASE("Translator top-level actor") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);
    type::ConstructorTable table;

    type::ObjectType actor(type::kActorObject);
    actor.addField(Label::fromName("ping"), std::make_unique<type::FunctionType>(type::kSharedFunction,
                                                                                type::kReturns));
    auto program = translator.translateProgram(table, {}, &actor);
    REQUIRE(program);
    CHECK(program->declarations.empty());
    REQUIRE(program->actor);
    CHECK_EQ(program->actor->kind, idl::kService);

    SUBCASE("actor member that is not a function") {
        type::ObjectType badActor(type::kActorObject);
        badActor.addField(Label::fromName("count"), located(prim(type::kNat), 5, 2));
        CHECK(!translator.translateProgram(table, {}, &badActor));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kUnrepresentableType);
        CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 5);
    }
}

TEST_CASE("Translator defects") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Translator translator(errorReporter);
    type::ConstructorTable table;

    std::unique_ptr<type::Type> defect;

    SUBCASE("type variable") { defect = std::make_unique<type::VarType>("T", 0); }
    SUBCASE("async") { defect = std::make_unique<type::AsyncType>(prim(type::kNat)); }
    SUBCASE("mutable") { defect = std::make_unique<type::MutType>(prim(type::kNat)); }
    SUBCASE("serialized") { defect = std::make_unique<type::SerializedType>(prim(type::kNat)); }
    SUBCASE("pre-type") { defect = std::make_unique<type::PreType>(); }
    SUBCASE("module") { defect = std::make_unique<type::ObjectType>(type::kModuleObject); }
    SUBCASE("type definition outside an actor") {
        auto c = table.add("C", type::Constructor::kDefinition);
        c->body = prim(type::kNat);
        defect = std::make_unique<type::TypType>(c);
    }
    SUBCASE("local function") {
        defect = std::make_unique<type::FunctionType>(type::kLocalFunction, type::kReturns);
    }
    SUBCASE("generic function") {
        auto function = std::make_unique<type::FunctionType>(type::kSharedFunction, type::kReturns);
        function->typeParameters.emplace_back("T");
        defect = std::move(function);
    }
    SUBCASE("returns with results") {
        auto function = std::make_unique<type::FunctionType>(type::kSharedFunction, type::kReturns);
        function->results.emplace_back(prim(type::kNat));
        defect = std::move(function);
    }
    SUBCASE("promises without async") {
        auto function = std::make_unique<type::FunctionType>(type::kSharedFunction, type::kPromises);
        function->results.emplace_back(prim(type::kNat));
        defect = std::move(function);
    }
    SUBCASE("promises with two results") {
        auto function = sharedFunction(nullptr, prim(type::kNat));
        function->results.emplace_back(std::make_unique<type::AsyncType>(prim(type::kNat)));
        defect = std::move(function);
    }
    SUBCASE("type arguments") {
        auto c = table.add("C", type::Constructor::kDefinition);
        c->body = prim(type::kNat);
        auto reference = std::make_unique<type::ConType>(c);
        reference->arguments.emplace_back(prim(type::kNat));
        defect = std::move(reference);
    }
    SUBCASE("abstract constructor") {
        auto c = table.add("C", type::Constructor::kAbstract);
        defect = con(c);
    }
    SUBCASE("parameterized constructor") {
        auto c = table.add("C", type::Constructor::kDefinition);
        c->typeParameters.emplace_back("T");
        c->body = prim(type::kNat);
        defect = con(c);
    }

    REQUIRE(defect);
    defect->location = Location { 17, 23 };
    // Nested inside other types, the defect still fails the whole translation.
    auto outer = std::make_unique<type::ObjectType>(type::kPlainObject);
    outer->addField(Label::fromName("inner"), std::make_unique<type::OptionalType>(std::move(defect)));
    CHECK(!translator.translate(outer.get()));
    REQUIRE_EQ(errorReporter->errorCount(), 1);
    CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kUnrepresentableType);
    CHECK_EQ(errorReporter->errors()[0].location.lineNumber, 17);
    CHECK_EQ(errorReporter->errors()[0].location.characterNumber, 23);
}

} // namespace ferry
