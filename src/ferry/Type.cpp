#include "ferry/Type.hpp"

namespace ferry {
namespace type {

Constructor* ConstructorTable::add(std::string name, Constructor::Kind kind) {
    if (m_byName.find(name) != m_byName.end()) {
        return nullptr;
    }
    m_constructors.emplace_back(std::make_unique<Constructor>(name, kind));
    auto constructor = m_constructors.back().get();
    m_byName.emplace(std::move(name), constructor);
    return constructor;
}

Constructor* ConstructorTable::find(std::string_view name) const {
    auto iter = m_byName.find(std::string(name));
    if (iter == m_byName.end()) {
        return nullptr;
    }
    return iter->second;
}

std::string_view describeKind(const Type* t) {
    switch (t->kind) {
    case kPrim:
        return "primitive type";
    case kVar:
        return "type variable";
    case kCon:
        return "type constructor application";
    case kTyp:
        return "type definition member";
    case kTuple:
        return "tuple type";
    case kArray:
        return "array type";
    case kObject:
        switch (static_cast<const ObjectType*>(t)->sort) {
        case kPlainObject:
            return "object type";
        case kActorObject:
            return "actor type";
        case kModuleObject:
            return "module type";
        }
        break;
    case kVariant:
        return "variant type";
    case kFunction:
        return "function type";
    case kOptional:
        return "option type";
    case kAsync:
        return "async type";
    case kMut:
        return "mutable type";
    case kSerialized:
        return "serialized type";
    case kPre:
        return "pre-type";
    }
    return "unknown type";
}

} // namespace type
} // namespace ferry
