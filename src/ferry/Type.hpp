#ifndef SRC_FERRY_TYPE_HPP_
#define SRC_FERRY_TYPE_HPP_

#include "ferry/Label.hpp"
#include "ferry/Location.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ferry {
namespace type {

// The type checker's structural type representation, as handed to the back end. Types form trees; the only sharing
// and the only cycles go through Constructors, which are owned by a ConstructorTable and referenced by pointer.

enum TypeKind {
    kPrim,
    kVar,
    kCon,
    kTyp,
    kTuple,
    kArray,
    kObject,
    kVariant,
    kFunction,
    kOptional,
    kAsync,
    kMut,
    kSerialized,
    kPre
};

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
    // Legacy fixed-width kinds, distinct in the source language but the same as NatN on the wire.
    kWord8,
    kWord16,
    kWord32,
    kWord64,
    kFloat,
    kChar,
    kText,
    // Top and bottom.
    kAny,
    kNon
};

enum ObjectSort { kPlainObject, kActorObject, kModuleObject };

enum FunctionSort { kLocalFunction, kSharedFunction, kQueryFunction };

enum Control { kReturns, kPromises };

struct Type {
    Type() = delete;
    virtual ~Type() = default;

    TypeKind kind;
    Location location;

protected:
    explicit Type(TypeKind k): kind(k) { }
};

struct Constructor;

struct PrimType : public Type {
    explicit PrimType(PrimKind p): Type(kPrim), prim(p) { }
    virtual ~PrimType() = default;

    PrimKind prim;
};

// A reference to a bound type variable. Only meaningful inside the type checker.
struct VarType : public Type {
    VarType(std::string n, int32_t i): Type(kVar), name(std::move(n)), index(i) { }
    virtual ~VarType() = default;

    std::string name;
    int32_t index;
};

// An application of a named type constructor to zero or more arguments.
struct ConType : public Type {
    explicit ConType(const Constructor* c): Type(kCon), constructor(c) { }
    virtual ~ConType() = default;

    const Constructor* constructor;
    std::vector<std::unique_ptr<Type>> arguments;
};

// A type definition appearing as a member of an object, e.g. a type declared inside an actor.
struct TypType : public Type {
    explicit TypType(const Constructor* c): Type(kTyp), constructor(c) { }
    virtual ~TypType() = default;

    const Constructor* constructor;
};

struct TupleType : public Type {
    TupleType(): Type(kTuple) { }
    virtual ~TupleType() = default;

    std::vector<std::unique_ptr<Type>> elements;
};

struct ArrayType : public Type {
    explicit ArrayType(std::unique_ptr<Type> e): Type(kArray), element(std::move(e)) { }
    virtual ~ArrayType() = default;

    std::unique_ptr<Type> element;
};

struct Field {
    Label label;
    std::unique_ptr<Type> type;
};

struct ObjectType : public Type {
    explicit ObjectType(ObjectSort s): Type(kObject), sort(s) { }
    virtual ~ObjectType() = default;

    void addField(Label label, std::unique_ptr<Type> type) { fields.emplace_back(Field { label, std::move(type) }); }

    ObjectSort sort;
    std::vector<Field> fields;
};

struct VariantType : public Type {
    VariantType(): Type(kVariant) { }
    virtual ~VariantType() = default;

    void addField(Label label, std::unique_ptr<Type> type) { fields.emplace_back(Field { label, std::move(type) }); }

    std::vector<Field> fields;
};

struct FunctionType : public Type {
    FunctionType(FunctionSort s, Control c): Type(kFunction), sort(s), control(c) { }
    virtual ~FunctionType() = default;

    FunctionSort sort;
    Control control;
    std::vector<std::string> typeParameters;
    std::vector<std::unique_ptr<Type>> arguments;
    std::vector<std::unique_ptr<Type>> results;
};

struct OptionalType : public Type {
    explicit OptionalType(std::unique_ptr<Type> e): Type(kOptional), element(std::move(e)) { }
    virtual ~OptionalType() = default;

    std::unique_ptr<Type> element;
};

// Async, Mut and Serialized are wrappers the back end never accepts at the interface, but they are legitimate inside
// the type checker's graph, so they must be representable here.
struct AsyncType : public Type {
    explicit AsyncType(std::unique_ptr<Type> e): Type(kAsync), element(std::move(e)) { }
    virtual ~AsyncType() = default;

    std::unique_ptr<Type> element;
};

struct MutType : public Type {
    explicit MutType(std::unique_ptr<Type> e): Type(kMut), element(std::move(e)) { }
    virtual ~MutType() = default;

    std::unique_ptr<Type> element;
};

struct SerializedType : public Type {
    explicit SerializedType(std::unique_ptr<Type> e): Type(kSerialized), element(std::move(e)) { }
    virtual ~SerializedType() = default;

    std::unique_ptr<Type> element;
};

// A type not yet inferred.
struct PreType : public Type {
    PreType(): Type(kPre) { }
    virtual ~PreType() = default;
};

struct Constructor {
    enum Kind { kDefinition, kAbstract };

    Constructor(std::string n, Kind k): name(std::move(n)), kind(k) { }
    ~Constructor() = default;

    std::string name;
    Kind kind;
    std::vector<std::string> typeParameters;
    std::unique_ptr<Type> body;
    Location location;
};

// Owns the constructors of one compilation unit, in declaration order. Constructor pointers stay valid for the life of
// the table.
class ConstructorTable {
public:
    ConstructorTable() = default;
    ~ConstructorTable() = default;

    // Returns nullptr if a constructor named |name| already exists.
    Constructor* add(std::string name, Constructor::Kind kind);
    Constructor* find(std::string_view name) const;

    const std::vector<std::unique_ptr<Constructor>>& constructors() const { return m_constructors; }
    size_t size() const { return m_constructors.size(); }

private:
    std::vector<std::unique_ptr<Constructor>> m_constructors;
    std::unordered_map<std::string, Constructor*> m_byName;
};

// Human readable name of the kind of |t|, for diagnostics.
std::string_view describeKind(const Type* t);

} // namespace type
} // namespace ferry

#endif // SRC_FERRY_TYPE_HPP_
