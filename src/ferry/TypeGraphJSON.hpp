#ifndef SRC_FERRY_TYPE_GRAPH_JSON_HPP_
#define SRC_FERRY_TYPE_GRAPH_JSON_HPP_

#include "ferry/Location.hpp"
#include "ferry/Type.hpp"

#include "rapidjson/fwd.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

class ErrorReporter;

// Loads the type checker's JSON dump of a compilation unit's type constructors:
//
//   { "constructors": [ { "name": "List", "kind": "def", "params": [], "body": TYPE, "line": 1, "column": 6 } ],
//     "entryPoints": [ "Server" ],
//     "actor": TYPE }
//
// "entryPoints" and "actor" are optional. A TYPE is an object whose "kind" is one of:
//   prim        "prim": Null, Bool, Nat, Nat8..Nat64, Int, Int8..Int64, Word8..Word64, Float, Char, Text, Any, Non
//   var         "name", "index"
//   con         "name", optional "args": [TYPE]
//   typ         "name"
//   tuple       "elements": [TYPE]
//   array, opt, async, mut, serialized
//               "element": TYPE
//   object      "sort": "object", "actor" or "module", "fields": [FIELD]
//   variant     "fields": [FIELD]
//   func        "sort": "local", "shared" or "query", "control": "returns" or "promises", optional
//               "typeParams": [string], "args": [TYPE], "results": [TYPE]
//   pre
// and a FIELD is { "label": string or number, "type": TYPE }. String labels are unescaped with Label::unescape().
// Any TYPE may carry "line" and "column", which become its Location.
class TypeGraphJSON {
public:
    TypeGraphJSON() = delete;
    explicit TypeGraphJSON(std::shared_ptr<ErrorReporter> errorReporter);
    ~TypeGraphJSON() = default;

    // Returns false on any error, with the errors reported.
    bool parse(std::string_view json);

    const type::ConstructorTable& constructors() const { return m_constructors; }
    const std::vector<const type::Constructor*>& entryPoints() const { return m_entryPoints; }
    // May be nullptr.
    const type::Type* actor() const { return m_actor.get(); }

private:
    bool readConstructors(const rapidjson::Value& constructors);
    std::unique_ptr<type::Type> readType(const rapidjson::Value& value);
    bool readElements(const rapidjson::Value& value, const char* key, std::vector<std::unique_ptr<type::Type>>& types);
    bool readFields(const rapidjson::Value& value, std::vector<type::Field>& fields);
    std::unique_ptr<type::Type> readElement(const rapidjson::Value& value);
    bool readStrings(const rapidjson::Value& value, const char* key, std::vector<std::string>& strings);
    const type::Constructor* findConstructor(const rapidjson::Value& value);

    // Reports a malformed type graph error at |value|'s location, always returns nullptr.
    std::nullptr_t malformed(const rapidjson::Value& value, std::string message);
    Location locationOf(const rapidjson::Value& value) const;

    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::string m_json;
    type::ConstructorTable m_constructors;
    std::vector<const type::Constructor*> m_entryPoints;
    std::unique_ptr<type::Type> m_actor;
};

} // namespace ferry

#endif // SRC_FERRY_TYPE_GRAPH_JSON_HPP_
