#ifndef SRC_FERRY_HASH_HPP_
#define SRC_FERRY_HASH_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ferry {

using Hash = std::uint32_t;

// Internal symbol hash, used for keying tables inside the compiler. Never appears on the wire.
Hash hash(std::string_view symbol, Hash seed = 0);
Hash hash(const char* symbol, size_t length, Hash seed = 0);

// The interface description field hash. Record and variant field names are identified on the wire by this value, so
// independently compiled programs must agree on it exactly: h = h * 223 + byte, over the UTF-8 bytes, modulo 2^32.
Hash idlHash(std::string_view label);

} // namespace ferry

#endif // SRC_FERRY_HASH_HPP_
