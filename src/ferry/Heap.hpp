#ifndef SRC_FERRY_HEAP_HPP_
#define SRC_FERRY_HEAP_HPP_

#include "ferry/LinearMemory.hpp"
#include "ferry/ObjectHeader.hpp"
#include "ferry/ObjectRef.hpp"

#include <cstddef>
#include <cstdint>

namespace ferry {

// Allocates tagged objects in one program instance's linear memory. Allocation is a bump of the heap pointer;
// reclaiming memory is the collector's business. Allocation failures are traps, never error returns, because a
// truncated or wrapped length would corrupt every later access to the object.
class Heap {
public:
    Heap();
    explicit Heap(uint64_t memorySize);
    ~Heap() = default;

    // Reserves the linear memory. Must succeed before any allocation. Calling it again on a mapped Heap changes
    // nothing.
    bool map();

    // Reserves a header plus |byteLength| bytes, tagged as a blob. The payload is uninitialized.
    ObjectRef allocateBlob(uint32_t byteLength);
    // Reserves a header plus |elementCount| reference words, tagged as an array. The elements are uninitialized. Traps
    // if |elementCount| exceeds kMaxArrayLength.
    ObjectRef allocateArray(uint32_t elementCount);
    // Allocates a blob and returns a pointer to its payload, for callers that only want raw bytes.
    uint8_t* allocate(uint32_t byteLength);

    Tag tag(ObjectRef object) const;

    uint32_t blobLength(ObjectRef blob) const;
    uint8_t* blobPayload(ObjectRef blob) const;

    uint32_t arrayLength(ObjectRef array) const;
    ObjectRef arrayAt(ObjectRef array, uint32_t index) const;
    void arrayPut(ObjectRef array, uint32_t index, ObjectRef element);

    // Converts between references and host pointers into the linear memory.
    uint8_t* resolve(ObjectRef object) const;
    ObjectRef refer(const void* object) const;

    // The heap pointer is the address of the next allocation. The Runtime saves it before a unit of work and restores
    // it if the unit traps.
    uint64_t heapPointer() const { return m_heapPointer; }
    void resetHeapPointer(uint64_t heapPointer);
    uint64_t allocatedBytes() const { return m_heapPointer - kHeapBase; }

    // The whole 32-bit address space, reserved but committed lazily.
    static constexpr uint64_t kDefaultMemorySize = uint64_t(1) << 32;
    // The first words are never handed out, so no object lives at address zero.
    static constexpr uint64_t kHeapBase = 2 * kWordSize;

private:
    // Returns the linear memory address of |sizeInWords| fresh words, trapping if memory can't grow to fit them.
    uint32_t allocateWords(uint64_t sizeInWords);

    BlobHeader* blobHeader(ObjectRef blob) const;
    ArrayHeader* arrayHeader(ObjectRef array) const;

    LinearMemory m_memory;
    uint64_t m_heapPointer;
};

} // namespace ferry

#endif // SRC_FERRY_HEAP_HPP_
