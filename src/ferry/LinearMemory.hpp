#ifndef SRC_FERRY_LINEAR_MEMORY_HPP_
#define SRC_FERRY_LINEAR_MEMORY_HPP_

#include <cstddef>
#include <cstdint>

namespace ferry {

// A contiguous region of virtual memory addressed by 32-bit offsets from its start. The full region is reserved up
// front so that the start address never moves, then committed in whole growth units as the heap expands.
class LinearMemory {
public:
    LinearMemory() = delete;
    explicit LinearMemory(uint64_t reservedSize);
    LinearMemory(const LinearMemory&) = delete;
    LinearMemory& operator=(const LinearMemory&) = delete;
    ~LinearMemory();

    // Reserves the address range. No memory is usable until grow() is called.
    bool map();
    bool unmap();

    // Commits memory so that offsets [0, |newSize|) are readable and writable. Rounds up to kGrowthUnit. Returns false
    // if the request exceeds the reservation or the OS refuses.
    bool grow(uint64_t newSize);

    uint8_t* startAddress() const { return m_startAddress; }
    uint64_t reservedSize() const { return m_reservedSize; }
    uint64_t committedSize() const { return m_committedSize; }

    // Same granule as a wasm memory page.
    static constexpr uint64_t kGrowthUnit = 64 * 1024;

private:
    uint8_t* m_startAddress;
    uint64_t m_reservedSize;
    uint64_t m_committedSize;
};

} // namespace ferry

#endif // SRC_FERRY_LINEAR_MEMORY_HPP_
