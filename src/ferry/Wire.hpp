#ifndef SRC_FERRY_WIRE_HPP_
#define SRC_FERRY_WIRE_HPP_

#include "ferry/library/Array.hpp"
#include "ferry/library/Blob.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ferry {

struct ThreadContext;

// Appends wire-encoded values to a growing byte buffer. Blobs and text are a LEB128 byte count followed by the bytes;
// a vector is a LEB128 element count followed by the elements.
class WireWriter {
public:
    WireWriter() = default;
    ~WireWriter() = default;

    void writeUnsigned(uint64_t value);
    void writeSigned(int64_t value);
    void writeBytes(const uint8_t* data, size_t size);
    void writeText(std::string_view text);
    void writeBlob(const library::Blob& blob);
    void writeBlobVector(const library::TypedArray<library::Blob>& blobs);

    const std::vector<uint8_t>& buffer() const { return m_buffer; }
    std::vector<uint8_t> takeBuffer() { return std::move(m_buffer); }

private:
    std::vector<uint8_t> m_buffer;
};

// A bounded read cursor over wire-encoded input. The read*() methods report malformed input by returning false and
// leave the cursor where it was. The expect*() methods are for generated deserialization code: they trap with an IDL
// error instead, aborting the current unit of work.
class WireReader {
public:
    WireReader() = delete;
    WireReader(const uint8_t* data, size_t size);
    ~WireReader() = default;

    bool readUnsigned(uint64_t& value);
    bool readSigned(int64_t& value);
    // Reads a length-prefixed byte string into a new heap blob.
    bool readBlob(ThreadContext* context, library::Blob& blob);
    // Reads a counted vector of blobs into a new heap array.
    bool readBlobVector(ThreadContext* context, library::TypedArray<library::Blob>& blobs);

    uint64_t expectUnsigned();
    library::Blob expectBlob(ThreadContext* context);
    library::TypedArray<library::Blob> expectBlobVector(ThreadContext* context);

    size_t position() const { return m_position; }
    size_t remaining() const { return m_size - m_position; }
    bool atEnd() const { return m_position == m_size; }

private:
    // Reads a length prefix and checks that at least |length| * |minimumElementSize| bytes remain after it.
    bool readLength(uint32_t& length, size_t minimumElementSize);

    const uint8_t* m_data;
    size_t m_size;
    size_t m_position;
};

} // namespace ferry

#endif // SRC_FERRY_WIRE_HPP_
