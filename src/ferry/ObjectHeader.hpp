#ifndef SRC_FERRY_OBJECT_HEADER_HPP_
#define SRC_FERRY_OBJECT_HEADER_HPP_

#include <cstdint>
#include <type_traits>

namespace ferry {

// Heap objects are sequences of 32-bit words in linear memory. The first word of every object is a tag identifying its
// kind. Tag values are shared with the code generator and the collector, so they are fixed numbers rather than a
// dense enumeration.
using Tag = uint32_t;

static constexpr Tag kTagArray = 3;
static constexpr Tag kTagBlob = 10;

static constexpr uint32_t kWordSize = 4;

// A blob is a length-prefixed byte buffer. The payload of |length| bytes follows the header, padded out to a whole
// number of words.
struct BlobHeader {
    Tag tag;
    uint32_t length;
};

// An array is a vector of object references. |length| reference words follow the header.
struct ArrayHeader {
    Tag tag;
    uint32_t length;
};

static constexpr uint32_t kBlobHeaderWords = sizeof(BlobHeader) / kWordSize;
static constexpr uint32_t kArrayHeaderWords = sizeof(ArrayHeader) / kWordSize;

// Array payload may not be larger than half of the 32-bit linear memory: 2 bits for the word size, 1 to divide by two.
// Keeping the bound well under the address space means |length| * kWordSize plus the header can never wrap.
static constexpr uint32_t kMaxArrayLength = 1u << (32 - 2 - 1);

// Layouts are read by machine code, so no vtables and no padding.
static_assert(std::is_standard_layout<BlobHeader>::value);
static_assert(std::is_standard_layout<ArrayHeader>::value);
static_assert(sizeof(BlobHeader) == 2 * kWordSize);
static_assert(sizeof(ArrayHeader) == 2 * kWordSize);

} // namespace ferry

#endif // SRC_FERRY_OBJECT_HEADER_HPP_
