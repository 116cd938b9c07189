#include "ferry/Translator.hpp"

#include "ferry/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>

namespace ferry {

Translator::Translator(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) { }

Translator::Translator(std::shared_ptr<ErrorReporter> errorReporter,
                       TranslationEnvironment::HashFunction hashFunction):
    m_errorReporter(errorReporter), m_environment(hashFunction) { }

std::unique_ptr<idl::Type> Translator::translate(const type::Type* type) {
    assert(type);
    if (m_failed) {
        return nullptr;
    }
    switch (type->kind) {
    case type::kPrim:
        return translatePrim(static_cast<const type::PrimType*>(type));

    case type::kCon:
        return translateReference(static_cast<const type::ConType*>(type));

    case type::kTuple: {
        auto record = std::make_unique<idl::RecordType>();
        if (!translateTuple(static_cast<const type::TupleType*>(type)->elements, record->fields)) {
            return nullptr;
        }
        return record;
    }

    case type::kArray: {
        auto element = translate(static_cast<const type::ArrayType*>(type)->element.get());
        if (!element) {
            return nullptr;
        }
        return std::make_unique<idl::VectorType>(std::move(element));
    }

    case type::kObject: {
        auto object = static_cast<const type::ObjectType*>(type);
        switch (object->sort) {
        case type::kPlainObject:
            return translateRecord(object);
        case type::kActorObject:
            return translateService(object);
        case type::kModuleObject:
            return unrepresentable(type);
        }
    } break;

    case type::kVariant:
        return translateVariant(static_cast<const type::VariantType*>(type));

    case type::kFunction:
        return translateFunction(static_cast<const type::FunctionType*>(type));

    case type::kOptional: {
        auto element = translate(static_cast<const type::OptionalType*>(type)->element.get());
        if (!element) {
            return nullptr;
        }
        return std::make_unique<idl::OptionalType>(std::move(element));
    }

    // A type definition member is only meaningful directly inside an actor, which translateService() handles.
    case type::kTyp:
    case type::kVar:
    case type::kAsync:
    case type::kMut:
    case type::kSerialized:
    case type::kPre:
        return unrepresentable(type);
    }

    m_errorReporter->addError(ErrorReporter::kInternal, type->location, "Unknown type kind in translator.");
    return nullptr;
}

bool Translator::translateConstructor(const type::Constructor* constructor, Location location) {
    if (m_failed) {
        return false;
    }
    if (constructor->kind == type::Constructor::kAbstract) {
        m_errorReporter->addUnrepresentableTypeError(location,
                                                     fmt::format("abstract type '{}'", constructor->name));
        return false;
    }
    if (constructor->typeParameters.size()) {
        m_errorReporter->addUnrepresentableTypeError(location,
                                                     fmt::format("parameterized type '{}'", constructor->name));
        return false;
    }
    if (m_environment.collides(constructor->name)) {
        m_errorReporter->addError(
            ErrorReporter::kSymbolCollision, location,
            fmt::format("Type name '{}' collides with another type name in the symbol table.", constructor->name));
        return false;
    }

    // A placeholder means |constructor| is already being expanded further up the stack; the reference to it is all
    // that's needed here.
    if (m_environment.state(constructor->name) != TranslationEnvironment::kAbsent) {
        return true;
    }

    if (!constructor->body) {
        m_errorReporter->addError(ErrorReporter::kMalformedTypeGraph, constructor->location,
                                  fmt::format("Type '{}' has no definition.", constructor->name));
        return false;
    }

    SPDLOG_DEBUG("Translating type '{}'", constructor->name);
    m_environment.addPlaceholder(constructor->name);
    auto body = translate(constructor->body.get());
    if (!body) {
        // The placeholder stays behind, so later references to |constructor| would name a declaration that never
        // gets a body.
        m_failed = true;
        return false;
    }
    m_environment.resolve(constructor->name, std::move(body));
    return true;
}

std::unique_ptr<idl::Program> Translator::translateProgram(const type::ConstructorTable& table,
                                                           const std::vector<const type::Constructor*>& entryPoints,
                                                           const type::Type* actor) {
    if (m_failed) {
        return nullptr;
    }
    std::vector<const type::Constructor*> roots = entryPoints;
    if (roots.empty()) {
        for (const auto& constructor : table.constructors()) {
            if (constructor->kind == type::Constructor::kDefinition && constructor->typeParameters.empty()
                && constructor->body && constructor->body->kind == type::kObject
                && static_cast<const type::ObjectType*>(constructor->body.get())->sort == type::kActorObject) {
                roots.emplace_back(constructor.get());
            }
        }
    }

    for (auto root : roots) {
        if (!translateConstructor(root, root->location)) {
            return nullptr;
        }
    }

    auto program = std::make_unique<idl::Program>();
    if (actor) {
        program->actor = translate(actor);
        if (!program->actor) {
            return nullptr;
        }
        if (program->actor->kind != idl::kService && program->actor->kind != idl::kVar) {
            m_errorReporter->addUnrepresentableTypeError(actor->location,
                                                         fmt::format("top-level {}", type::describeKind(actor)));
            return nullptr;
        }
    }

    assert(m_environment.placeholderCount() == 0);
    program->declarations = m_environment.takeDeclarations();
    return program;
}

std::unique_ptr<idl::Type> Translator::translatePrim(const type::PrimType* prim) {
    switch (prim->prim) {
    case type::kNull:
        return std::make_unique<idl::PrimType>(idl::kNull);
    case type::kBool:
        return std::make_unique<idl::PrimType>(idl::kBool);
    case type::kNat:
        return std::make_unique<idl::PrimType>(idl::kNat);
    case type::kNat8:
    case type::kWord8:
        return std::make_unique<idl::PrimType>(idl::kNat8);
    case type::kNat16:
    case type::kWord16:
        return std::make_unique<idl::PrimType>(idl::kNat16);
    case type::kNat32:
    case type::kWord32:
    case type::kChar:
        return std::make_unique<idl::PrimType>(idl::kNat32);
    case type::kNat64:
    case type::kWord64:
        return std::make_unique<idl::PrimType>(idl::kNat64);
    case type::kInt:
        return std::make_unique<idl::PrimType>(idl::kInt);
    case type::kInt8:
        return std::make_unique<idl::PrimType>(idl::kInt8);
    case type::kInt16:
        return std::make_unique<idl::PrimType>(idl::kInt16);
    case type::kInt32:
        return std::make_unique<idl::PrimType>(idl::kInt32);
    case type::kInt64:
        return std::make_unique<idl::PrimType>(idl::kInt64);
    case type::kFloat:
        return std::make_unique<idl::PrimType>(idl::kFloat64);
    case type::kText:
        return std::make_unique<idl::PrimType>(idl::kText);
    case type::kAny:
        return std::make_unique<idl::PrimType>(idl::kReserved);
    case type::kNon:
        return std::make_unique<idl::PrimType>(idl::kEmpty);
    }

    m_errorReporter->addError(ErrorReporter::kInternal, prim->location, "Unknown primitive type in translator.");
    return nullptr;
}

std::unique_ptr<idl::Type> Translator::translateReference(const type::ConType* con) {
    assert(con->constructor);
    if (con->arguments.size()) {
        m_errorReporter->addUnrepresentableTypeError(
            con->location, fmt::format("application of type '{}' to type arguments", con->constructor->name));
        return nullptr;
    }
    if (!translateConstructor(con->constructor, con->location)) {
        return nullptr;
    }
    return std::make_unique<idl::VarType>(con->constructor->name);
}

std::unique_ptr<idl::Type> Translator::translateRecord(const type::ObjectType* object) {
    auto record = std::make_unique<idl::RecordType>();
    if (!translateFields(object->fields, object->location, record->fields)) {
        return nullptr;
    }
    return record;
}

std::unique_ptr<idl::Type> Translator::translateVariant(const type::VariantType* variant) {
    auto result = std::make_unique<idl::VariantType>();
    if (!translateFields(variant->fields, variant->location, result->fields)) {
        return nullptr;
    }
    return result;
}

std::unique_ptr<idl::Type> Translator::translateService(const type::ObjectType* actor) {
    auto service = std::make_unique<idl::ServiceType>();
    for (const auto& field : actor->fields) {
        if (field.type->kind == type::kTyp) {
            auto typ = static_cast<const type::TypType*>(field.type.get());
            if (!translateConstructor(typ->constructor, typ->location)) {
                return nullptr;
            }
            continue;
        }

        auto method = translate(field.type.get());
        if (!method) {
            return nullptr;
        }
        if (method->kind != idl::kFunction && method->kind != idl::kVar) {
            m_errorReporter->addUnrepresentableTypeError(
                field.type->location, fmt::format("actor member '{}' of {}", field.label.displayName(),
                                                  type::describeKind(field.type.get())));
            return nullptr;
        }
        service->methods.emplace_back(idl::Method { field.label.displayName(), std::move(method) });
    }
    return service;
}

std::unique_ptr<idl::Type> Translator::translateFunction(const type::FunctionType* function) {
    if (function->sort == type::kLocalFunction) {
        return unrepresentable(function);
    }
    if (function->typeParameters.size()) {
        m_errorReporter->addUnrepresentableTypeError(function->location, "generic shared function type");
        return nullptr;
    }

    auto result = std::make_unique<idl::FunctionType>();
    if (!translateTuple(function->arguments, result->arguments)) {
        return nullptr;
    }

    // One-way: fire and forget, nothing comes back.
    if (function->control == type::kReturns) {
        if (function->sort == type::kSharedFunction && function->results.empty()) {
            result->modes.emplace_back(idl::kOneway);
            return result;
        }
        m_errorReporter->addUnrepresentableTypeError(
            function->location,
            fmt::format("{} function returning {} results without a promise",
                        function->sort == type::kQueryFunction ? "query" : "shared", function->results.size()));
        return nullptr;
    }

    if (function->results.size() != 1 || function->results[0]->kind != type::kAsync) {
        m_errorReporter->addUnrepresentableTypeError(function->location,
                                                     "shared function whose result is not a single async type");
        return nullptr;
    }

    // The promised value is always one positional result, even when it is itself a tuple.
    auto promised = translate(static_cast<const type::AsyncType*>(function->results[0].get())->element.get());
    if (!promised) {
        return nullptr;
    }
    result->results.emplace_back(idl::Field { 0, "0", std::move(promised) });

    if (function->sort == type::kQueryFunction) {
        result->modes.emplace_back(idl::kQuery);
    }
    return result;
}

bool Translator::translateTuple(const std::vector<std::unique_ptr<type::Type>>& elements,
                                std::vector<idl::Field>& fields) {
    fields.reserve(fields.size() + elements.size());
    for (size_t i = 0; i < elements.size(); ++i) {
        auto element = translate(elements[i].get());
        if (!element) {
            return false;
        }
        fields.emplace_back(idl::Field { static_cast<Hash>(i), fmt::format("{}", i), std::move(element) });
    }
    return true;
}

bool Translator::translateFields(const std::vector<type::Field>& source, Location location,
                                 std::vector<idl::Field>& fields) {
    fields.reserve(fields.size() + source.size());
    for (const auto& field : source) {
        auto fieldType = translate(field.type.get());
        if (!fieldType) {
            return false;
        }
        fields.emplace_back(idl::Field { field.label.id(), field.label.displayName(), std::move(fieldType) });
    }

    std::stable_sort(fields.begin(), fields.end(),
                     [](const idl::Field& a, const idl::Field& b) { return a.id < b.id; });
    for (size_t i = 1; i < fields.size(); ++i) {
        if (fields[i - 1].id == fields[i].id) {
            m_errorReporter->addError(ErrorReporter::kFieldIdCollision, location,
                                      fmt::format("Field labels '{}' and '{}' have the same field id {}.",
                                                  fields[i - 1].name, fields[i].name, fields[i].id));
            return false;
        }
    }
    return true;
}

std::unique_ptr<idl::Type> Translator::unrepresentable(const type::Type* type) {
    m_errorReporter->addUnrepresentableTypeError(type->location, type::describeKind(type));
    return nullptr;
}

} // namespace ferry
