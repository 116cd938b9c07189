#ifndef SRC_FERRY_TRANSLATION_ENVIRONMENT_HPP_
#define SRC_FERRY_TRANSLATION_ENVIRONMENT_HPP_

#include "ferry/Hash.hpp"
#include "ferry/Schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ferry {

// Memo table for one translation run, mapping constructor names to their interface declarations. An entry is absent
// until the Translator starts on a constructor, holds a placeholder while the constructor's body is being translated,
// and is resolved once the body is done. A reference to a name in either present state is a reference to the
// declaration, which is what stops recursive types from expanding forever.
//
// Entries are keyed by symbol hash with the name kept alongside, so two names hashing alike are detected rather than
// silently merged. Declarations come out in the order their constructors were first encountered.
class TranslationEnvironment {
public:
    enum State { kAbsent, kPlaceholder, kResolved };

    using HashFunction = Hash (*)(std::string_view);

    TranslationEnvironment();
    // Allows substituting the symbol hash, for testing collision handling.
    explicit TranslationEnvironment(HashFunction hashFunction);
    ~TranslationEnvironment() = default;

    State state(std::string_view name) const;
    // True if |name| hashes the same as a different name already in the table.
    bool collides(std::string_view name) const;

    // |name| must be kAbsent and not collide. Enters a placeholder declaration.
    void addPlaceholder(std::string name);
    // |name| must be kPlaceholder. Replaces the placeholder with |type|.
    void resolve(std::string_view name, std::unique_ptr<idl::Type> type);

    size_t size() const { return m_declarations.size(); }
    size_t placeholderCount() const;

    // Moves the declarations out in first-encountered order, leaving the environment empty.
    std::vector<idl::TypeDeclaration> takeDeclarations();

private:
    struct Entry {
        std::string name;
        size_t index;
    };

    const Entry* findEntry(std::string_view name) const;

    HashFunction m_hashFunction;
    std::unordered_map<Hash, Entry> m_entries;
    std::vector<idl::TypeDeclaration> m_declarations;
};

} // namespace ferry

#endif // SRC_FERRY_TRANSLATION_ENVIRONMENT_HPP_
