#include "ferry/TypeGraphJSON.hpp"

#include "ferry/ErrorReporter.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

#include <array>
#include <cstring>

namespace {

struct PrimName {
    const char* name;
    ferry::type::PrimKind prim;
};

constexpr std::array<PrimName, 21> kPrimNames = { {
    { "Null", ferry::type::kNull },     { "Bool", ferry::type::kBool },     { "Nat", ferry::type::kNat },
    { "Nat8", ferry::type::kNat8 },     { "Nat16", ferry::type::kNat16 },   { "Nat32", ferry::type::kNat32 },
    { "Nat64", ferry::type::kNat64 },   { "Int", ferry::type::kInt },       { "Int8", ferry::type::kInt8 },
    { "Int16", ferry::type::kInt16 },   { "Int32", ferry::type::kInt32 },   { "Int64", ferry::type::kInt64 },
    { "Word8", ferry::type::kWord8 },   { "Word16", ferry::type::kWord16 }, { "Word32", ferry::type::kWord32 },
    { "Word64", ferry::type::kWord64 }, { "Float", ferry::type::kFloat },   { "Char", ferry::type::kChar },
    { "Text", ferry::type::kText },     { "Any", ferry::type::kAny },       { "Non", ferry::type::kNon },
} };

bool isString(const rapidjson::Value& value, const char* key) {
    return value.HasMember(key) && value[key].IsString();
}

bool equals(const rapidjson::Value& value, const char* string) { return std::strcmp(value.GetString(), string) == 0; }

} // namespace

namespace ferry {

TypeGraphJSON::TypeGraphJSON(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) { }

bool TypeGraphJSON::parse(std::string_view json) {
    m_json = std::string(json);
    m_errorReporter->setCode(m_json.c_str());

    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse(m_json.c_str());
    if (!parseResult) {
        auto lineNumber = m_errorReporter->getLineNumber(m_json.c_str() + parseResult.Offset());
        m_errorReporter->addError(
            ErrorReporter::kJSONParse, Location { static_cast<int32_t>(lineNumber), 0 },
            fmt::format("Failed to parse type graph JSON: {}", rapidjson::GetParseError_En(parseResult.Code())));
        return false;
    }
    SPDLOG_TRACE("Parsed type graph JSON.");

    if (!document.IsObject()) {
        malformed(document, "Type graph JSON is not a JSON object.");
        return false;
    }
    if (!document.HasMember("constructors") || !document["constructors"].IsArray()) {
        malformed(document, "Type graph JSON missing 'constructors' array.");
        return false;
    }
    if (!readConstructors(document["constructors"])) {
        return false;
    }

    if (document.HasMember("entryPoints")) {
        const rapidjson::Value& entryPoints = document["entryPoints"];
        if (!entryPoints.IsArray()) {
            malformed(entryPoints, "Type graph 'entryPoints' is not an array.");
            return false;
        }
        for (const auto& entryPoint : entryPoints.GetArray()) {
            if (!entryPoint.IsString()) {
                malformed(entryPoint, "Type graph entry point is not a string.");
                return false;
            }
            auto constructor = m_constructors.find(entryPoint.GetString());
            if (!constructor) {
                malformed(entryPoint, fmt::format("Unknown entry point type '{}'.", entryPoint.GetString()));
                return false;
            }
            m_entryPoints.emplace_back(constructor);
        }
    }

    if (document.HasMember("actor") && !document["actor"].IsNull()) {
        m_actor = readType(document["actor"]);
        if (!m_actor) {
            return false;
        }
    }

    SPDLOG_DEBUG("Loaded {} type constructors and {} entry points.", m_constructors.size(), m_entryPoints.size());
    return true;
}

bool TypeGraphJSON::readConstructors(const rapidjson::Value& constructors) {
    // Declare every constructor first, so bodies can refer to any of them, including themselves.
    for (const auto& value : constructors.GetArray()) {
        if (!value.IsObject() || !isString(value, "name") || !isString(value, "kind")) {
            malformed(value, "Type constructor must be an object with string 'name' and 'kind' keys.");
            return false;
        }
        type::Constructor::Kind kind;
        if (equals(value["kind"], "def")) {
            kind = type::Constructor::kDefinition;
        } else if (equals(value["kind"], "abstract")) {
            kind = type::Constructor::kAbstract;
        } else {
            malformed(value, fmt::format("Unknown type constructor kind '{}'.", value["kind"].GetString()));
            return false;
        }

        auto constructor = m_constructors.add(value["name"].GetString(), kind);
        if (!constructor) {
            malformed(value, fmt::format("Duplicate type constructor '{}'.", value["name"].GetString()));
            return false;
        }
        constructor->location = locationOf(value);
        if (!readStrings(value, "params", constructor->typeParameters)) {
            return false;
        }
    }

    size_t index = 0;
    for (const auto& value : constructors.GetArray()) {
        auto constructor = m_constructors.constructors()[index].get();
        ++index;
        if (!value.HasMember("body")) {
            if (constructor->kind == type::Constructor::kDefinition) {
                malformed(value, fmt::format("Type constructor '{}' has no body.", constructor->name));
                return false;
            }
            continue;
        }
        constructor->body = readType(value["body"]);
        if (!constructor->body) {
            return false;
        }
    }
    return true;
}

std::unique_ptr<type::Type> TypeGraphJSON::readType(const rapidjson::Value& value) {
    if (!value.IsObject() || !isString(value, "kind")) {
        return malformed(value, "Type must be an object with a string 'kind' key.");
    }
    const rapidjson::Value& kind = value["kind"];
    std::unique_ptr<type::Type> result;

    if (equals(kind, "prim")) {
        if (!isString(value, "prim")) {
            return malformed(value, "Primitive type missing 'prim' name.");
        }
        for (const auto& primName : kPrimNames) {
            if (equals(value["prim"], primName.name)) {
                result = std::make_unique<type::PrimType>(primName.prim);
                break;
            }
        }
        if (!result) {
            return malformed(value, fmt::format("Unknown primitive type '{}'.", value["prim"].GetString()));
        }
    } else if (equals(kind, "var")) {
        if (!isString(value, "name")) {
            return malformed(value, "Type variable missing 'name'.");
        }
        int32_t index = value.HasMember("index") && value["index"].IsInt() ? value["index"].GetInt() : 0;
        result = std::make_unique<type::VarType>(value["name"].GetString(), index);
    } else if (equals(kind, "con")) {
        auto constructor = findConstructor(value);
        if (!constructor) {
            return nullptr;
        }
        auto con = std::make_unique<type::ConType>(constructor);
        if (!readElements(value, "args", con->arguments)) {
            return nullptr;
        }
        result = std::move(con);
    } else if (equals(kind, "typ")) {
        auto constructor = findConstructor(value);
        if (!constructor) {
            return nullptr;
        }
        result = std::make_unique<type::TypType>(constructor);
    } else if (equals(kind, "tuple")) {
        auto tuple = std::make_unique<type::TupleType>();
        if (!readElements(value, "elements", tuple->elements)) {
            return nullptr;
        }
        result = std::move(tuple);
    } else if (equals(kind, "array")) {
        auto element = readElement(value);
        if (!element) {
            return nullptr;
        }
        result = std::make_unique<type::ArrayType>(std::move(element));
    } else if (equals(kind, "opt")) {
        auto element = readElement(value);
        if (!element) {
            return nullptr;
        }
        result = std::make_unique<type::OptionalType>(std::move(element));
    } else if (equals(kind, "async")) {
        auto element = readElement(value);
        if (!element) {
            return nullptr;
        }
        result = std::make_unique<type::AsyncType>(std::move(element));
    } else if (equals(kind, "mut")) {
        auto element = readElement(value);
        if (!element) {
            return nullptr;
        }
        result = std::make_unique<type::MutType>(std::move(element));
    } else if (equals(kind, "serialized")) {
        auto element = readElement(value);
        if (!element) {
            return nullptr;
        }
        result = std::make_unique<type::SerializedType>(std::move(element));
    } else if (equals(kind, "object")) {
        type::ObjectSort sort = type::kPlainObject;
        if (isString(value, "sort")) {
            if (equals(value["sort"], "actor")) {
                sort = type::kActorObject;
            } else if (equals(value["sort"], "module")) {
                sort = type::kModuleObject;
            } else if (!equals(value["sort"], "object")) {
                return malformed(value, fmt::format("Unknown object sort '{}'.", value["sort"].GetString()));
            }
        }
        auto object = std::make_unique<type::ObjectType>(sort);
        if (!readFields(value, object->fields)) {
            return nullptr;
        }
        result = std::move(object);
    } else if (equals(kind, "variant")) {
        auto variant = std::make_unique<type::VariantType>();
        if (!readFields(value, variant->fields)) {
            return nullptr;
        }
        result = std::move(variant);
    } else if (equals(kind, "func")) {
        if (!isString(value, "sort") || !isString(value, "control")) {
            return malformed(value, "Function type missing string 'sort' or 'control'.");
        }
        type::FunctionSort sort;
        if (equals(value["sort"], "local")) {
            sort = type::kLocalFunction;
        } else if (equals(value["sort"], "shared")) {
            sort = type::kSharedFunction;
        } else if (equals(value["sort"], "query")) {
            sort = type::kQueryFunction;
        } else {
            return malformed(value, fmt::format("Unknown function sort '{}'.", value["sort"].GetString()));
        }
        type::Control control;
        if (equals(value["control"], "returns")) {
            control = type::kReturns;
        } else if (equals(value["control"], "promises")) {
            control = type::kPromises;
        } else {
            return malformed(value, fmt::format("Unknown function control '{}'.", value["control"].GetString()));
        }
        auto function = std::make_unique<type::FunctionType>(sort, control);
        if (!readStrings(value, "typeParams", function->typeParameters)
            || !readElements(value, "args", function->arguments)
            || !readElements(value, "results", function->results)) {
            return nullptr;
        }
        result = std::move(function);
    } else if (equals(kind, "pre")) {
        result = std::make_unique<type::PreType>();
    } else {
        return malformed(value, fmt::format("Unknown type kind '{}'.", kind.GetString()));
    }

    result->location = locationOf(value);
    return result;
}

bool TypeGraphJSON::readElements(const rapidjson::Value& value, const char* key,
                                 std::vector<std::unique_ptr<type::Type>>& types) {
    if (!value.HasMember(key)) {
        return true;
    }
    const rapidjson::Value& array = value[key];
    if (!array.IsArray()) {
        malformed(value, fmt::format("Type key '{}' is not an array.", key));
        return false;
    }
    for (const auto& element : array.GetArray()) {
        auto type = readType(element);
        if (!type) {
            return false;
        }
        types.emplace_back(std::move(type));
    }
    return true;
}

bool TypeGraphJSON::readFields(const rapidjson::Value& value, std::vector<type::Field>& fields) {
    if (!value.HasMember("fields")) {
        return true;
    }
    const rapidjson::Value& array = value["fields"];
    if (!array.IsArray()) {
        malformed(value, "Type key 'fields' is not an array.");
        return false;
    }
    for (const auto& field : array.GetArray()) {
        if (!field.IsObject() || !field.HasMember("label") || !field.HasMember("type")) {
            malformed(field, "Field must be an object with 'label' and 'type' keys.");
            return false;
        }
        const rapidjson::Value& labelValue = field["label"];
        Label label;
        if (labelValue.IsUint()) {
            label = Label::fromNumber(labelValue.GetUint());
        } else if (labelValue.IsString()) {
            label = Label::unescape(std::string_view(labelValue.GetString(), labelValue.GetStringLength()));
        } else {
            malformed(field, "Field label must be a string or a non-negative integer.");
            return false;
        }
        auto type = readType(field["type"]);
        if (!type) {
            return false;
        }
        fields.emplace_back(type::Field { label, std::move(type) });
    }
    return true;
}

std::unique_ptr<type::Type> TypeGraphJSON::readElement(const rapidjson::Value& value) {
    if (!value.HasMember("element")) {
        return malformed(value, fmt::format("Type '{}' missing 'element'.", value["kind"].GetString()));
    }
    return readType(value["element"]);
}

bool TypeGraphJSON::readStrings(const rapidjson::Value& value, const char* key, std::vector<std::string>& strings) {
    if (!value.HasMember(key)) {
        return true;
    }
    const rapidjson::Value& array = value[key];
    if (!array.IsArray()) {
        malformed(value, fmt::format("Key '{}' is not an array.", key));
        return false;
    }
    for (const auto& element : array.GetArray()) {
        if (!element.IsString()) {
            malformed(value, fmt::format("Key '{}' must hold only strings.", key));
            return false;
        }
        strings.emplace_back(element.GetString());
    }
    return true;
}

const type::Constructor* TypeGraphJSON::findConstructor(const rapidjson::Value& value) {
    if (!isString(value, "name")) {
        return malformed(value, "Type constructor reference missing 'name'.");
    }
    auto constructor = m_constructors.find(value["name"].GetString());
    if (!constructor) {
        return malformed(value, fmt::format("Unknown type constructor '{}'.", value["name"].GetString()));
    }
    return constructor;
}

std::nullptr_t TypeGraphJSON::malformed(const rapidjson::Value& value, std::string message) {
    m_errorReporter->addError(ErrorReporter::kMalformedTypeGraph, locationOf(value), std::move(message));
    return nullptr;
}

Location TypeGraphJSON::locationOf(const rapidjson::Value& value) const {
    Location location;
    if (!value.IsObject()) {
        return location;
    }
    if (value.HasMember("line") && value["line"].IsInt()) {
        location.lineNumber = value["line"].GetInt();
    }
    if (value.HasMember("column") && value["column"].IsInt()) {
        location.characterNumber = value["column"].GetInt();
    }
    return location;
}

} // namespace ferry
