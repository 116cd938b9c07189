#include "ferry/Wire.hpp"

#include "ferry/Trap.hpp"
#include "ferry/Varint.hpp"

#include "spdlog/spdlog.h"

#include <array>
#include <cstring>

namespace ferry {

void WireWriter::writeUnsigned(uint64_t value) {
    std::array<uint8_t, kMaxVarint64Length> bytes;
    auto length = encodeUnsigned(value, bytes.data());
    m_buffer.insert(m_buffer.end(), bytes.begin(), bytes.begin() + length);
}

void WireWriter::writeSigned(int64_t value) {
    std::array<uint8_t, kMaxVarint64Length> bytes;
    auto length = encodeSigned(value, bytes.data());
    m_buffer.insert(m_buffer.end(), bytes.begin(), bytes.begin() + length);
}

void WireWriter::writeBytes(const uint8_t* data, size_t size) {
    writeUnsigned(size);
    m_buffer.insert(m_buffer.end(), data, data + size);
}

void WireWriter::writeText(std::string_view text) {
    writeBytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

void WireWriter::writeBlob(const library::Blob& blob) { writeBytes(blob.start(), blob.size()); }

void WireWriter::writeBlobVector(const library::TypedArray<library::Blob>& blobs) {
    writeUnsigned(blobs.size());
    for (uint32_t i = 0; i < blobs.size(); ++i) {
        writeBlob(blobs.typedAt(i));
    }
}

WireReader::WireReader(const uint8_t* data, size_t size): m_data(data), m_size(size), m_position(0) { }

bool WireReader::readUnsigned(uint64_t& value) {
    size_t length = 0;
    if (!decodeUnsigned(m_data + m_position, remaining(), value, length)) {
        return false;
    }
    m_position += length;
    return true;
}

bool WireReader::readSigned(int64_t& value) {
    size_t length = 0;
    if (!decodeSigned(m_data + m_position, remaining(), value, length)) {
        return false;
    }
    m_position += length;
    return true;
}

bool WireReader::readBlob(ThreadContext* context, library::Blob& blob) {
    auto start = m_position;
    uint32_t length = 0;
    if (!readLength(length, 1)) {
        return false;
    }

    blob = library::Blob::alloc(context, length);
    if (length) {
        std::memcpy(blob.start(), m_data + m_position, length);
    }
    m_position += length;
    SPDLOG_TRACE("Read {} byte blob at input offset {}", length, start);
    return true;
}

bool WireReader::readBlobVector(ThreadContext* context, library::TypedArray<library::Blob>& blobs) {
    auto start = m_position;
    uint32_t count = 0;
    // Every blob needs at least its one byte length prefix.
    if (!readLength(count, 1)) {
        return false;
    }

    // Allocation traps, rather than returns, if |count| is over the array bound.
    auto array = library::TypedArray<library::Blob>::typedAlloc(context, count);
    for (uint32_t i = 0; i < count; ++i) {
        library::Blob blob;
        if (!readBlob(context, blob)) {
            m_position = start;
            return false;
        }
        array.typedPut(i, blob);
    }

    blobs = array;
    return true;
}

uint64_t WireReader::expectUnsigned() {
    uint64_t value = 0;
    if (!readUnsigned(value)) {
        idlTrapWith("malformed or truncated LEB128 value");
    }
    return value;
}

library::Blob WireReader::expectBlob(ThreadContext* context) {
    library::Blob blob;
    if (!readBlob(context, blob)) {
        idlTrapWith("blob length out of bounds");
    }
    return blob;
}

library::TypedArray<library::Blob> WireReader::expectBlobVector(ThreadContext* context) {
    library::TypedArray<library::Blob> blobs;
    if (!readBlobVector(context, blobs)) {
        idlTrapWith("vector of blobs out of bounds");
    }
    return blobs;
}

bool WireReader::readLength(uint32_t& length, size_t minimumElementSize) {
    uint32_t value = 0;
    size_t prefixLength = 0;
    if (!decodeUnsigned32(m_data + m_position, remaining(), value, prefixLength)) {
        return false;
    }
    if (static_cast<uint64_t>(value) * minimumElementSize > m_size - m_position - prefixLength) {
        return false;
    }
    m_position += prefixLength;
    length = value;
    return true;
}

} // namespace ferry
