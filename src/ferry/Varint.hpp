#ifndef SRC_FERRY_VARINT_HPP_
#define SRC_FERRY_VARINT_HPP_

#include <cstddef>
#include <cstdint>

namespace ferry {

// (S)LEB128 encoding of integers, 7 data bits per byte, least significant group first, high bit set on every byte
// but the last. Callers must supply buffers of at least the maximum length for the width in use.
static constexpr size_t kMaxVarint32Length = 5;
static constexpr size_t kMaxVarint64Length = 10;

// Both encoders return the number of bytes written, which is always at least one.
size_t encodeUnsigned(uint64_t value, uint8_t* buffer);
size_t encodeSigned(int64_t value, uint8_t* buffer);

// Number of bytes the corresponding encoder would write for |value|.
size_t unsignedLength(uint64_t value);
size_t signedLength(int64_t value);

// Decodes one value from at most |size| bytes at |data|. On success returns true, stores the decoded value in |value|
// and the number of bytes consumed in |length|. Returns false, leaving the outputs untouched, if the input ends before
// a terminating byte, if the encoding is longer than the maximum for the width, or if the final byte carries bits
// that don't fit in the width.
bool decodeUnsigned(const uint8_t* data, size_t size, uint64_t& value, size_t& length);
bool decodeSigned(const uint8_t* data, size_t size, int64_t& value, size_t& length);
bool decodeUnsigned32(const uint8_t* data, size_t size, uint32_t& value, size_t& length);
bool decodeSigned32(const uint8_t* data, size_t size, int32_t& value, size_t& length);

} // namespace ferry

#endif // SRC_FERRY_VARINT_HPP_
