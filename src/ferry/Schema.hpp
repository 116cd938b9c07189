#ifndef SRC_FERRY_SCHEMA_HPP_
#define SRC_FERRY_SCHEMA_HPP_

#include "ferry/Hash.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {
namespace idl {

// The interface description (Candid-style IDL) document model produced by the Translator.

enum TypeKind { kPrim, kVar, kRecord, kVariant, kVector, kOptional, kFunction, kService, kPre };

enum PrimKind {
    kNull,
    kBool,
    kNat,
    kNat8,
    kNat16,
    kNat32,
    kNat64,
    kInt,
    kInt8,
    kInt16,
    kInt32,
    kInt64,
    kFloat32,
    kFloat64,
    kText,
    kReserved,
    kEmpty
};

enum FuncMode { kOneway, kQuery };

struct Type {
    Type() = delete;
    virtual ~Type() = default;

    TypeKind kind;

protected:
    explicit Type(TypeKind k): kind(k) { }
};

struct Field {
    Hash id;
    std::string name;
    std::unique_ptr<Type> type;
};

struct PrimType : public Type {
    explicit PrimType(PrimKind p): Type(kPrim), prim(p) { }
    virtual ~PrimType() = default;

    PrimKind prim;
};

// Reference to a named declaration in the enclosing Program.
struct VarType : public Type {
    explicit VarType(std::string n): Type(kVar), name(std::move(n)) { }
    virtual ~VarType() = default;

    std::string name;
};

struct RecordType : public Type {
    RecordType(): Type(kRecord) { }
    virtual ~RecordType() = default;

    // True if the field ids are exactly 0..n-1 in order, which the text form prints without labels.
    bool isTuple() const;

    std::vector<Field> fields;
};

struct VariantType : public Type {
    VariantType(): Type(kVariant) { }
    virtual ~VariantType() = default;

    std::vector<Field> fields;
};

struct VectorType : public Type {
    explicit VectorType(std::unique_ptr<Type> e): Type(kVector), element(std::move(e)) { }
    virtual ~VectorType() = default;

    std::unique_ptr<Type> element;
};

struct OptionalType : public Type {
    explicit OptionalType(std::unique_ptr<Type> e): Type(kOptional), element(std::move(e)) { }
    virtual ~OptionalType() = default;

    std::unique_ptr<Type> element;
};

struct FunctionType : public Type {
    FunctionType(): Type(kFunction) { }
    virtual ~FunctionType() = default;

    std::vector<Field> arguments;
    std::vector<Field> results;
    std::vector<FuncMode> modes;
};

struct Method {
    std::string name;
    std::unique_ptr<Type> type;
};

struct ServiceType : public Type {
    ServiceType(): Type(kService) { }
    virtual ~ServiceType() = default;

    // In source order.
    std::vector<Method> methods;
};

// Stands in for a declaration whose body is still being translated. Never survives a successful translation.
struct PreType : public Type {
    PreType(): Type(kPre) { }
    virtual ~PreType() = default;
};

struct TypeDeclaration {
    std::string name;
    std::unique_ptr<Type> type;
};

struct Program {
    std::vector<TypeDeclaration> declarations;
    // The top-level service, may be nullptr.
    std::unique_ptr<Type> actor;
};

std::string_view primName(PrimKind prim);

} // namespace idl
} // namespace ferry

#endif // SRC_FERRY_SCHEMA_HPP_
