#include "ferry/Hash.hpp"

#include "xxhash.h"

namespace ferry {

Hash hash(std::string_view symbol, Hash seed) {
    return hash(symbol.data(), symbol.size(), seed);
}

Hash hash(const char* symbol, size_t length, Hash seed) {
    return XXH32(symbol, length, seed);
}

Hash idlHash(std::string_view label) {
    Hash h = 0;
    for (auto c : label) {
        h = (h * 223) + static_cast<uint8_t>(c);
    }
    return h;
}

} // namespace ferry
