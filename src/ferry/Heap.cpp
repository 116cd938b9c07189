#include "ferry/Heap.hpp"

#include "ferry/Trap.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>

namespace ferry {

Heap::Heap(): Heap(kDefaultMemorySize) { }

// Object addresses must fit in a 32-bit reference, so the reservation is capped at the default size.
Heap::Heap(uint64_t memorySize): m_memory(std::min(memorySize, kDefaultMemorySize)), m_heapPointer(kHeapBase) { }

bool Heap::map() {
    // Remapping would reset the heap pointer under live objects.
    if (m_memory.startAddress()) {
        SPDLOG_WARN("Duplicate calls to Heap::map()");
        return true;
    }
    if (!m_memory.map()) {
        return false;
    }
    m_heapPointer = kHeapBase;
    return m_memory.grow(kHeapBase);
}

ObjectRef Heap::allocateBlob(uint32_t byteLength) {
    uint64_t payloadWords = (static_cast<uint64_t>(byteLength) + kWordSize - 1) / kWordSize;
    uint32_t address = allocateWords(kBlobHeaderWords + payloadWords);
    auto header = reinterpret_cast<BlobHeader*>(m_memory.startAddress() + address);
    header->tag = kTagBlob;
    header->length = byteLength;
    return ObjectRef::fromAddress(address);
}

ObjectRef Heap::allocateArray(uint32_t elementCount) {
    if (elementCount > kMaxArrayLength) {
        rtsTrapWith("Array allocation too large");
    }

    uint32_t address = allocateWords(kArrayHeaderWords + static_cast<uint64_t>(elementCount));
    auto header = reinterpret_cast<ArrayHeader*>(m_memory.startAddress() + address);
    header->tag = kTagArray;
    header->length = elementCount;
    return ObjectRef::fromAddress(address);
}

uint8_t* Heap::allocate(uint32_t byteLength) { return blobPayload(allocateBlob(byteLength)); }

Tag Heap::tag(ObjectRef object) const {
    assert(!object.isNull());
    return *reinterpret_cast<const Tag*>(resolve(object));
}

uint32_t Heap::blobLength(ObjectRef blob) const { return blobHeader(blob)->length; }

uint8_t* Heap::blobPayload(ObjectRef blob) const {
    return reinterpret_cast<uint8_t*>(blobHeader(blob)) + sizeof(BlobHeader);
}

uint32_t Heap::arrayLength(ObjectRef array) const { return arrayHeader(array)->length; }

ObjectRef Heap::arrayAt(ObjectRef array, uint32_t index) const {
    auto header = arrayHeader(array);
    assert(index < header->length);
    auto elements = reinterpret_cast<const uint32_t*>(reinterpret_cast<const uint8_t*>(header) + sizeof(ArrayHeader));
    return ObjectRef::fromBits(elements[index]);
}

void Heap::arrayPut(ObjectRef array, uint32_t index, ObjectRef element) {
    auto header = arrayHeader(array);
    assert(index < header->length);
    auto elements = reinterpret_cast<uint32_t*>(reinterpret_cast<uint8_t*>(header) + sizeof(ArrayHeader));
    elements[index] = element.bits();
}

uint8_t* Heap::resolve(ObjectRef object) const {
    if (object.isNull()) {
        return nullptr;
    }
    assert(object.address() >= kHeapBase && object.address() < m_heapPointer);
    return m_memory.startAddress() + object.address();
}

ObjectRef Heap::refer(const void* object) const {
    if (object == nullptr) {
        return ObjectRef();
    }
    auto offset = reinterpret_cast<const uint8_t*>(object) - m_memory.startAddress();
    assert(offset >= static_cast<ptrdiff_t>(kHeapBase) && static_cast<uint64_t>(offset) < m_heapPointer);
    return ObjectRef::fromAddress(static_cast<uint32_t>(offset));
}

void Heap::resetHeapPointer(uint64_t heapPointer) {
    assert(heapPointer >= kHeapBase && heapPointer <= m_heapPointer);
    m_heapPointer = heapPointer;
}

uint32_t Heap::allocateWords(uint64_t sizeInWords) {
    uint64_t newHeapPointer = m_heapPointer + (sizeInWords * kWordSize);
    if (newHeapPointer > m_memory.reservedSize() || !m_memory.grow(newHeapPointer)) {
        SPDLOG_ERROR("Heap exhausted allocating {} words with {} bytes in use", sizeInWords, allocatedBytes());
        rtsTrapWith("Cannot grow memory");
    }

    auto address = static_cast<uint32_t>(m_heapPointer);
    m_heapPointer = newHeapPointer;
    return address;
}

BlobHeader* Heap::blobHeader(ObjectRef blob) const {
    auto header = reinterpret_cast<BlobHeader*>(resolve(blob));
    assert(header && header->tag == kTagBlob);
    return header;
}

ArrayHeader* Heap::arrayHeader(ObjectRef array) const {
    auto header = reinterpret_cast<ArrayHeader*>(resolve(array));
    assert(header && header->tag == kTagArray);
    return header;
}

} // namespace ferry
