#include "ferry/SchemaEmitter.hpp"

#include "ferry/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <array>
#include <iterator>

namespace {

constexpr int kIndentSpaces = 2;

// Reserved words of the interface description language, which can only appear as names when quoted.
constexpr std::array<std::string_view, 30> kKeywords = {
    "blob",   "bool",   "composite_query", "empty",   "float32", "float64",   "func",  "import", "int",     "int8",
    "int16",  "int32",  "int64",           "nat",     "nat8",    "nat16",     "nat32", "nat64",  "null",    "oneway",
    "opt",    "principal", "query",        "record",  "reserved", "service",  "text",  "type",   "variant", "vec"
};

void appendIndent(int indent, std::string& text) { text.append(indent * kIndentSpaces, ' '); }

} // namespace

namespace ferry {

SchemaEmitter::SchemaEmitter(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) { }

bool SchemaEmitter::emit(const idl::Program* program, std::string& text) {
    for (const auto& declaration : program->declarations) {
        fmt::format_to(std::back_inserter(text), "type {} = ", quoteName(declaration.name));
        if (!appendType(declaration.type.get(), 0, text)) {
            return false;
        }
        text.append(";\n");
    }

    if (program->actor) {
        text.append("service : ");
        if (!appendType(program->actor.get(), 0, text)) {
            return false;
        }
        text.append("\n");
    }

    SPDLOG_DEBUG("Emitted {} declarations, {} bytes of interface description.", program->declarations.size(),
                 text.size());
    return true;
}

bool SchemaEmitter::emitType(const idl::Type* type, std::string& text) { return appendType(type, 0, text); }

std::string SchemaEmitter::quoteName(std::string_view name) {
    if (isIdentifier(name)) {
        return std::string(name);
    }

    std::string quoted("\"");
    for (auto c : name) {
        auto byte = static_cast<uint8_t>(c);
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
            quoted.push_back(c);
        } else if (byte < 0x20 || byte == 0x7f) {
            fmt::format_to(std::back_inserter(quoted), "\\{:02x}", byte);
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

bool SchemaEmitter::isIdentifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    auto isLetter = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    if (!isLetter(name.front())) {
        return false;
    }
    for (auto c : name) {
        if (!isLetter(c) && !(c >= '0' && c <= '9')) {
            return false;
        }
    }
    for (auto keyword : kKeywords) {
        if (name == keyword) {
            return false;
        }
    }
    return true;
}

bool SchemaEmitter::appendType(const idl::Type* type, int indent, std::string& text) {
    switch (type->kind) {
    case idl::kPrim:
        text.append(idl::primName(static_cast<const idl::PrimType*>(type)->prim));
        return true;

    case idl::kVar:
        text.append(quoteName(static_cast<const idl::VarType*>(type)->name));
        return true;

    case idl::kRecord: {
        auto record = static_cast<const idl::RecordType*>(type);
        text.append("record ");
        return appendFields(record->fields, record->isTuple(), false, indent, text);
    }

    case idl::kVariant:
        text.append("variant ");
        return appendFields(static_cast<const idl::VariantType*>(type)->fields, false, true, indent, text);

    case idl::kVector:
        text.append("vec ");
        return appendType(static_cast<const idl::VectorType*>(type)->element.get(), indent, text);

    case idl::kOptional:
        text.append("opt ");
        return appendType(static_cast<const idl::OptionalType*>(type)->element.get(), indent, text);

    case idl::kFunction:
        text.append("func ");
        return appendSignature(static_cast<const idl::FunctionType*>(type), indent, text);

    case idl::kService:
        return appendService(static_cast<const idl::ServiceType*>(type), indent, text);

    case idl::kPre:
        m_errorReporter->addError(ErrorReporter::kInternal, Location(),
                                  "Unresolved type placeholder in interface description.");
        return false;
    }

    m_errorReporter->addError(ErrorReporter::kInternal, Location(), "Unknown interface type kind in emitter.");
    return false;
}

bool SchemaEmitter::appendFields(const std::vector<idl::Field>& fields, bool isTuple, bool isVariant, int indent,
                                 std::string& text) {
    if (fields.empty()) {
        text.append("{}");
        return true;
    }

    text.append("{ ");
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            text.append("; ");
        }
        if (isTuple) {
            if (!appendType(fields[i].type.get(), indent, text)) {
                return false;
            }
            continue;
        }

        appendLabel(fields[i], text);
        if (isVariant && fields[i].type->kind == idl::kPrim
            && static_cast<const idl::PrimType*>(fields[i].type.get())->prim == idl::kNull) {
            continue;
        }
        text.append(" : ");
        if (!appendType(fields[i].type.get(), indent, text)) {
            return false;
        }
    }
    text.append(" }");
    return true;
}

bool SchemaEmitter::appendSignature(const idl::FunctionType* function, int indent, std::string& text) {
    text.append("(");
    for (size_t i = 0; i < function->arguments.size(); ++i) {
        if (i > 0) {
            text.append(", ");
        }
        if (!appendType(function->arguments[i].type.get(), indent, text)) {
            return false;
        }
    }
    text.append(") -> (");
    for (size_t i = 0; i < function->results.size(); ++i) {
        if (i > 0) {
            text.append(", ");
        }
        if (!appendType(function->results[i].type.get(), indent, text)) {
            return false;
        }
    }
    text.append(")");
    for (auto mode : function->modes) {
        text.append(mode == idl::kOneway ? " oneway" : " query");
    }
    return true;
}

bool SchemaEmitter::appendService(const idl::ServiceType* service, int indent, std::string& text) {
    if (service->methods.empty()) {
        text.append("service {}");
        return true;
    }

    text.append("service {\n");
    for (const auto& method : service->methods) {
        appendIndent(indent + 1, text);
        text.append(quoteName(method.name));
        text.append(" : ");
        bool ok = method.type->kind == idl::kFunction ?
            appendSignature(static_cast<const idl::FunctionType*>(method.type.get()), indent + 1, text) :
            appendType(method.type.get(), indent + 1, text);
        if (!ok) {
            return false;
        }
        text.append(";\n");
    }
    appendIndent(indent, text);
    text.append("}");
    return true;
}

void SchemaEmitter::appendLabel(const idl::Field& field, std::string& text) {
    // Numeric labels print as the number, textual ones as names.
    auto number = fmt::format("{}", field.id);
    if (field.name == number) {
        text.append(number);
    } else {
        text.append(quoteName(field.name));
    }
}

} // namespace ferry
