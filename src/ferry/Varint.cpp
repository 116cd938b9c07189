#include "ferry/Varint.hpp"

namespace {

// Shared decode loop for a |width|-bit integer. Signed results come back sign-extended to 64 bits in |bits|.
bool decodeBits(const uint8_t* data, size_t size, int width, uint64_t& bits, size_t& length, bool isSigned) {
    const size_t maxLength = static_cast<size_t>((width + 6) / 7);
    // Number of payload bits that fit in the last permitted byte.
    const int lastBits = width - (7 * static_cast<int>(maxLength - 1));

    uint64_t result = 0;
    int shift = 0;
    for (size_t i = 0; i < size && i < maxLength; ++i) {
        uint8_t byte = data[i];
        uint8_t payload = byte & 0x7f;
        if (i == maxLength - 1) {
            if (byte & 0x80) {
                return false;
            }
            uint8_t extra = payload >> (isSigned ? lastBits - 1 : lastBits);
            if (isSigned) {
                // Bits past the width must all repeat the sign bit.
                if (extra != 0 && extra != (0x7f >> (lastBits - 1))) {
                    return false;
                }
            } else if (extra != 0) {
                return false;
            }
        }

        result |= static_cast<uint64_t>(payload) << shift;
        shift += 7;

        if ((byte & 0x80) == 0) {
            if (isSigned && shift < 64 && (byte & 0x40)) {
                result |= ~uint64_t(0) << shift;
            }
            if (width < 64) {
                result &= (uint64_t(1) << width) - 1;
                if (isSigned && (result & (uint64_t(1) << (width - 1)))) {
                    result |= ~uint64_t(0) << width;
                }
            }
            bits = result;
            length = i + 1;
            return true;
        }
    }

    return false;
}

} // namespace

namespace ferry {

size_t encodeUnsigned(uint64_t value, uint8_t* buffer) {
    size_t length = 0;
    while (true) {
        buffer[length] = static_cast<uint8_t>(value & 0x7f);
        value >>= 7;
        if (value) {
            // More bytes to come, set high bit and continue.
            buffer[length] |= 0x80;
            ++length;
        } else {
            return length + 1;
        }
    }
}

size_t encodeSigned(int64_t value, uint8_t* buffer) {
    size_t length = 0;
    while (true) {
        buffer[length] = static_cast<uint8_t>(value & 0x7f);
        if (value >= -64 && value < 64) {
            // The sign bit of this group already matches the sign of the whole value.
            return length + 1;
        }
        buffer[length] |= 0x80;
        ++length;
        value >>= 7;
    }
}

size_t unsignedLength(uint64_t value) {
    size_t length = 1;
    while (value >>= 7) {
        ++length;
    }
    return length;
}

size_t signedLength(int64_t value) {
    size_t length = 1;
    while (value < -64 || value >= 64) {
        value >>= 7;
        ++length;
    }
    return length;
}

bool decodeUnsigned(const uint8_t* data, size_t size, uint64_t& value, size_t& length) {
    return decodeBits(data, size, 64, value, length, false);
}

bool decodeSigned(const uint8_t* data, size_t size, int64_t& value, size_t& length) {
    uint64_t bits = 0;
    if (!decodeBits(data, size, 64, bits, length, true)) {
        return false;
    }
    value = static_cast<int64_t>(bits);
    return true;
}

bool decodeUnsigned32(const uint8_t* data, size_t size, uint32_t& value, size_t& length) {
    uint64_t bits = 0;
    if (!decodeBits(data, size, 32, bits, length, false)) {
        return false;
    }
    value = static_cast<uint32_t>(bits);
    return true;
}

bool decodeSigned32(const uint8_t* data, size_t size, int32_t& value, size_t& length) {
    uint64_t bits = 0;
    if (!decodeBits(data, size, 32, bits, length, true)) {
        return false;
    }
    value = static_cast<int32_t>(static_cast<int64_t>(bits));
    return true;
}

} // namespace ferry
