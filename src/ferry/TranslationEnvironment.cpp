#include "ferry/TranslationEnvironment.hpp"

#include "spdlog/spdlog.h"

#include <cassert>

namespace {
ferry::Hash symbolHash(std::string_view name) { return ferry::hash(name); }
} // namespace

namespace ferry {

TranslationEnvironment::TranslationEnvironment(): m_hashFunction(symbolHash) { }

TranslationEnvironment::TranslationEnvironment(HashFunction hashFunction): m_hashFunction(hashFunction) { }

TranslationEnvironment::State TranslationEnvironment::state(std::string_view name) const {
    auto entry = findEntry(name);
    if (!entry) {
        return kAbsent;
    }
    if (m_declarations[entry->index].type->kind == idl::kPre) {
        return kPlaceholder;
    }
    return kResolved;
}

bool TranslationEnvironment::collides(std::string_view name) const {
    auto iter = m_entries.find(m_hashFunction(name));
    return iter != m_entries.end() && iter->second.name != name;
}

void TranslationEnvironment::addPlaceholder(std::string name) {
    assert(state(name) == kAbsent);
    assert(!collides(name));
    SPDLOG_TRACE("Translation environment placeholder for {}", name);
    auto symbol = m_hashFunction(name);
    m_entries.emplace(symbol, Entry { name, m_declarations.size() });
    m_declarations.emplace_back(idl::TypeDeclaration { std::move(name), std::make_unique<idl::PreType>() });
}

void TranslationEnvironment::resolve(std::string_view name, std::unique_ptr<idl::Type> type) {
    assert(state(name) == kPlaceholder);
    assert(type && type->kind != idl::kPre);
    auto entry = findEntry(name);
    m_declarations[entry->index].type = std::move(type);
}

size_t TranslationEnvironment::placeholderCount() const {
    size_t count = 0;
    for (const auto& declaration : m_declarations) {
        if (declaration.type->kind == idl::kPre) {
            ++count;
        }
    }
    return count;
}

std::vector<idl::TypeDeclaration> TranslationEnvironment::takeDeclarations() {
    m_entries.clear();
    std::vector<idl::TypeDeclaration> declarations;
    declarations.swap(m_declarations);
    return declarations;
}

const TranslationEnvironment::Entry* TranslationEnvironment::findEntry(std::string_view name) const {
    auto iter = m_entries.find(m_hashFunction(name));
    if (iter == m_entries.end() || iter->second.name != name) {
        return nullptr;
    }
    return &iter->second;
}

} // namespace ferry
