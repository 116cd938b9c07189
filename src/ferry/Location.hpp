#ifndef SRC_FERRY_LOCATION_HPP_
#define SRC_FERRY_LOCATION_HPP_

#include <cstdint>

namespace ferry {

// A position in the source program, supplied by the type checker. Zero means unknown.
struct Location {
    int32_t lineNumber = 0;
    int32_t characterNumber = 0;

    bool isKnown() const { return lineNumber > 0; }
};

} // namespace ferry

#endif // SRC_FERRY_LOCATION_HPP_
