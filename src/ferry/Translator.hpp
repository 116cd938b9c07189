#ifndef SRC_FERRY_TRANSLATOR_HPP_
#define SRC_FERRY_TRANSLATOR_HPP_

#include "ferry/Schema.hpp"
#include "ferry/TranslationEnvironment.hpp"
#include "ferry/Type.hpp"

#include <memory>
#include <vector>

namespace ferry {

class ErrorReporter;

// Translates the type checker's types into interface description types. One Translator is one translation run: it
// owns the TranslationEnvironment that memoizes named constructors, so each constructor reachable from the inputs is
// expanded exactly once, however many times and however cyclically it is referenced.
//
// Types with no interface representation are compiler defects. They are reported to the ErrorReporter as
// kUnrepresentableType at the offending type's location, and the failure propagates out as a nullptr or false return.
// A constructor whose body fails to translate leaves the Translator failed: every later call returns nullptr or false
// without reporting anything further.
class Translator {
public:
    Translator() = delete;
    explicit Translator(std::shared_ptr<ErrorReporter> errorReporter);
    // For testing, substitutes the environment's symbol hash.
    Translator(std::shared_ptr<ErrorReporter> errorReporter, TranslationEnvironment::HashFunction hashFunction);
    ~Translator() = default;

    // Returns the equivalent interface type, or nullptr on error. Every constructor reachable from |type| ends up with
    // a declaration in the environment.
    std::unique_ptr<idl::Type> translate(const type::Type* type);

    // Ensures |constructor| has a declaration in the environment, translating its body if it is not there yet.
    // Returns false on error.
    bool translateConstructor(const type::Constructor* constructor, Location location);

    // Translates a whole compilation unit. If |entryPoints| is empty the entry points are every parameterless
    // definition in |table| whose body is an actor, in table order. |actor| may be nullptr; otherwise it becomes the
    // document's top-level service. Consumes the environment. Returns nullptr on error.
    std::unique_ptr<idl::Program> translateProgram(const type::ConstructorTable& table,
                                                   const std::vector<const type::Constructor*>& entryPoints,
                                                   const type::Type* actor);

    bool failed() const { return m_failed; }
    const TranslationEnvironment& environment() const { return m_environment; }
    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

private:
    std::unique_ptr<idl::Type> translatePrim(const type::PrimType* prim);
    std::unique_ptr<idl::Type> translateReference(const type::ConType* con);
    std::unique_ptr<idl::Type> translateRecord(const type::ObjectType* object);
    std::unique_ptr<idl::Type> translateVariant(const type::VariantType* variant);
    std::unique_ptr<idl::Type> translateService(const type::ObjectType* actor);
    std::unique_ptr<idl::Type> translateFunction(const type::FunctionType* function);

    // Positional fields with ids 0..n-1, appended to |fields|.
    bool translateTuple(const std::vector<std::unique_ptr<type::Type>>& elements, std::vector<idl::Field>& fields);
    // Labeled fields, sorted by id. Reports a collision if two labels share an id.
    bool translateFields(const std::vector<type::Field>& source, Location location, std::vector<idl::Field>& fields);

    std::unique_ptr<idl::Type> unrepresentable(const type::Type* type);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    TranslationEnvironment m_environment;
    bool m_failed = false;
};

} // namespace ferry

#endif // SRC_FERRY_TRANSLATOR_HPP_
