#include "ferry/Schema.hpp"

namespace ferry {
namespace idl {

bool RecordType::isTuple() const {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].id != i) {
            return false;
        }
    }
    return true;
}

std::string_view primName(PrimKind prim) {
    switch (prim) {
    case kNull:
        return "null";
    case kBool:
        return "bool";
    case kNat:
        return "nat";
    case kNat8:
        return "nat8";
    case kNat16:
        return "nat16";
    case kNat32:
        return "nat32";
    case kNat64:
        return "nat64";
    case kInt:
        return "int";
    case kInt8:
        return "int8";
    case kInt16:
        return "int16";
    case kInt32:
        return "int32";
    case kInt64:
        return "int64";
    case kFloat32:
        return "float32";
    case kFloat64:
        return "float64";
    case kText:
        return "text";
    case kReserved:
        return "reserved";
    case kEmpty:
        return "empty";
    }
    return "";
}

} // namespace idl
} // namespace ferry
