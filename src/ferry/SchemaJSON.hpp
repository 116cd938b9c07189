#ifndef SRC_FERRY_SCHEMA_JSON_HPP_
#define SRC_FERRY_SCHEMA_JSON_HPP_

#include "ferry/Schema.hpp"

#include <string>

namespace ferry {

class ErrorReporter;

// Produces a JSON serialization of |program| in |json|. Every type is an object with a "kind" key naming the type
// constructor, "prim", "var", "record", "variant", "vec", "opt", "func" or "service". Returns false, with an internal
// error reported, if the program still holds a placeholder.
bool DumpSchemaJSON(const idl::Program* program, ErrorReporter* errorReporter, std::string& json);

} // namespace ferry

#endif // SRC_FERRY_SCHEMA_JSON_HPP_
