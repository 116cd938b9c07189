#include "ferry/SchemaJSON.hpp"

#include "ferry/ErrorReporter.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value makeString(std::string_view string, Allocator& allocator) {
    rapidjson::Value value;
    value.SetString(string.data(), static_cast<rapidjson::SizeType>(string.size()), allocator);
    return value;
}

bool encodeType(const ferry::idl::Type* type, rapidjson::Value& value, Allocator& allocator);

bool encodeFields(const std::vector<ferry::idl::Field>& fields, rapidjson::Value& value, Allocator& allocator) {
    value.SetArray();
    for (const auto& field : fields) {
        rapidjson::Value fieldValue;
        fieldValue.SetObject();
        fieldValue.AddMember("id", rapidjson::Value(field.id), allocator);
        fieldValue.AddMember("name", makeString(field.name, allocator), allocator);
        rapidjson::Value typeValue;
        if (!encodeType(field.type.get(), typeValue, allocator)) {
            return false;
        }
        fieldValue.AddMember("type", typeValue, allocator);
        value.PushBack(fieldValue, allocator);
    }
    return true;
}

// Function arguments and results are positional, so only their types are recorded.
bool encodeTypeList(const std::vector<ferry::idl::Field>& fields, rapidjson::Value& value, Allocator& allocator) {
    value.SetArray();
    for (const auto& field : fields) {
        rapidjson::Value typeValue;
        if (!encodeType(field.type.get(), typeValue, allocator)) {
            return false;
        }
        value.PushBack(typeValue, allocator);
    }
    return true;
}

bool encodeType(const ferry::idl::Type* type, rapidjson::Value& value, Allocator& allocator) {
    value.SetObject();
    switch (type->kind) {
    case ferry::idl::kPrim:
        value.AddMember("kind", "prim", allocator);
        value.AddMember("prim",
                        makeString(ferry::idl::primName(static_cast<const ferry::idl::PrimType*>(type)->prim),
                                   allocator),
                        allocator);
        return true;

    case ferry::idl::kVar:
        value.AddMember("kind", "var", allocator);
        value.AddMember("name", makeString(static_cast<const ferry::idl::VarType*>(type)->name, allocator),
                        allocator);
        return true;

    case ferry::idl::kRecord:
    case ferry::idl::kVariant: {
        auto kind = type->kind == ferry::idl::kRecord ? "record" : "variant";
        value.AddMember("kind", rapidjson::StringRef(kind), allocator);
        const auto& fields = type->kind == ferry::idl::kRecord ?
            static_cast<const ferry::idl::RecordType*>(type)->fields :
            static_cast<const ferry::idl::VariantType*>(type)->fields;
        rapidjson::Value fieldsValue;
        if (!encodeFields(fields, fieldsValue, allocator)) {
            return false;
        }
        value.AddMember("fields", fieldsValue, allocator);
        return true;
    }

    case ferry::idl::kVector:
    case ferry::idl::kOptional: {
        auto kind = type->kind == ferry::idl::kVector ? "vec" : "opt";
        value.AddMember("kind", rapidjson::StringRef(kind), allocator);
        auto element = type->kind == ferry::idl::kVector ?
            static_cast<const ferry::idl::VectorType*>(type)->element.get() :
            static_cast<const ferry::idl::OptionalType*>(type)->element.get();
        rapidjson::Value elementValue;
        if (!encodeType(element, elementValue, allocator)) {
            return false;
        }
        value.AddMember("element", elementValue, allocator);
        return true;
    }

    case ferry::idl::kFunction: {
        auto function = static_cast<const ferry::idl::FunctionType*>(type);
        value.AddMember("kind", "func", allocator);
        rapidjson::Value arguments;
        if (!encodeTypeList(function->arguments, arguments, allocator)) {
            return false;
        }
        value.AddMember("arguments", arguments, allocator);
        rapidjson::Value results;
        if (!encodeTypeList(function->results, results, allocator)) {
            return false;
        }
        value.AddMember("results", results, allocator);
        rapidjson::Value modes;
        modes.SetArray();
        for (auto mode : function->modes) {
            auto modeName = mode == ferry::idl::kOneway ? "oneway" : "query";
            modes.PushBack(rapidjson::Value(rapidjson::StringRef(modeName)), allocator);
        }
        value.AddMember("modes", modes, allocator);
        return true;
    }

    case ferry::idl::kService: {
        value.AddMember("kind", "service", allocator);
        rapidjson::Value methods;
        methods.SetArray();
        for (const auto& method : static_cast<const ferry::idl::ServiceType*>(type)->methods) {
            rapidjson::Value methodValue;
            methodValue.SetObject();
            methodValue.AddMember("name", makeString(method.name, allocator), allocator);
            rapidjson::Value typeValue;
            if (!encodeType(method.type.get(), typeValue, allocator)) {
                return false;
            }
            methodValue.AddMember("type", typeValue, allocator);
            methods.PushBack(methodValue, allocator);
        }
        value.AddMember("methods", methods, allocator);
        return true;
    }

    case ferry::idl::kPre:
        return false;
    }

    return false;
}

} // namespace

namespace ferry {

bool DumpSchemaJSON(const idl::Program* program, ErrorReporter* errorReporter, std::string& json) {
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();

    rapidjson::Value declarations;
    declarations.SetArray();
    for (const auto& declaration : program->declarations) {
        rapidjson::Value declarationValue;
        declarationValue.SetObject();
        declarationValue.AddMember("name", makeString(declaration.name, allocator), allocator);
        rapidjson::Value typeValue;
        if (!encodeType(declaration.type.get(), typeValue, allocator)) {
            errorReporter->addError(ErrorReporter::kInternal, Location(),
                                    fmt::format("Unable to serialize declaration of '{}'.", declaration.name));
            return false;
        }
        declarationValue.AddMember("type", typeValue, allocator);
        declarations.PushBack(declarationValue, allocator);
    }
    document.AddMember("declarations", declarations, allocator);

    rapidjson::Value actor;
    if (program->actor && !encodeType(program->actor.get(), actor, allocator)) {
        errorReporter->addError(ErrorReporter::kInternal, Location(), "Unable to serialize top-level service.");
        return false;
    }
    document.AddMember("actor", actor, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    document.Accept(writer);
    json.assign(buffer.GetString(), buffer.GetSize());
    return true;
}

} // namespace ferry
