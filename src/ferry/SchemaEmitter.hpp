#ifndef SRC_FERRY_SCHEMA_EMITTER_HPP_
#define SRC_FERRY_SCHEMA_EMITTER_HPP_

#include "ferry/Schema.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace ferry {

class ErrorReporter;

// Renders a translated Program as interface description text:
//
//   type List = opt record { head : nat; tail : List };
//   type Server = service {
//     push : (List) -> () oneway;
//   };
//   service : Server
//
// Declarations print in program order, then the top-level service if the program has one.
class SchemaEmitter {
public:
    SchemaEmitter() = delete;
    explicit SchemaEmitter(std::shared_ptr<ErrorReporter> errorReporter);
    ~SchemaEmitter() = default;

    // Appends the text of |program| to |text|. Returns false if the program still holds a placeholder.
    bool emit(const idl::Program* program, std::string& text);
    // Appends the text of a single type to |text|.
    bool emitType(const idl::Type* type, std::string& text);

    // Returns |name| as is if it can be written bare, otherwise as a quoted string literal.
    static std::string quoteName(std::string_view name);
    static bool isIdentifier(std::string_view name);

private:
    bool appendType(const idl::Type* type, int indent, std::string& text);
    // Tuples print in the short form, with no labels. Null variant cases print as a bare label.
    bool appendFields(const std::vector<idl::Field>& fields, bool isTuple, bool isVariant, int indent,
                      std::string& text);
    bool appendSignature(const idl::FunctionType* function, int indent, std::string& text);
    bool appendService(const idl::ServiceType* service, int indent, std::string& text);
    void appendLabel(const idl::Field& field, std::string& text);

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace ferry

#endif // SRC_FERRY_SCHEMA_EMITTER_HPP_
