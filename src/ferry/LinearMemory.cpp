#include "ferry/LinearMemory.hpp"

#include "spdlog/spdlog.h"

#include <errno.h>
#include <string.h>

#if WIN32
#    define WIN32_LEAN_AND_MEAN
#    include "windows.h"
#else
#    include <sys/mman.h>
#endif // WIN32

namespace ferry {

LinearMemory::LinearMemory(uint64_t reservedSize):
    m_startAddress(nullptr), m_reservedSize(reservedSize), m_committedSize(0) { }

LinearMemory::~LinearMemory() { unmap(); }

bool LinearMemory::map() {
    if (m_startAddress) {
        SPDLOG_WARN("Duplicate calls to LinearMemory::map()");
        return true;
    }

#if WIN32
    void* address = VirtualAlloc(nullptr, m_reservedSize, MEM_RESERVE, PAGE_NOACCESS);
    bool success = (address != nullptr);
#else
    void* address = mmap(nullptr, m_reservedSize, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    bool success = (address != MAP_FAILED);
#endif

    if (!success) {
        SPDLOG_CRITICAL("Linear memory reservation failed for {} bytes: {}", m_reservedSize, strerror(errno));
        return false;
    }

    m_startAddress = reinterpret_cast<uint8_t*>(address);
    m_committedSize = 0;
    return true;
}

bool LinearMemory::unmap() {
    if (m_startAddress == nullptr) {
        return true;
    }

#if WIN32
    bool success = VirtualFree(m_startAddress, 0, MEM_RELEASE);
#else
    bool success = munmap(m_startAddress, m_reservedSize) == 0;
#endif

    if (!success) {
        SPDLOG_ERROR("Linear memory munmap failed");
        return false;
    }

    m_startAddress = nullptr;
    m_committedSize = 0;
    return true;
}

bool LinearMemory::grow(uint64_t newSize) {
    if (newSize <= m_committedSize) {
        return true;
    }
    if (m_startAddress == nullptr || newSize > m_reservedSize) {
        return false;
    }

    uint64_t target = ((newSize + kGrowthUnit - 1) / kGrowthUnit) * kGrowthUnit;
    if (target > m_reservedSize) {
        target = m_reservedSize;
    }

    uint8_t* growStart = m_startAddress + m_committedSize;
    uint64_t growSize = target - m_committedSize;
#if WIN32
    bool success = VirtualAlloc(growStart, growSize, MEM_COMMIT, PAGE_READWRITE) != nullptr;
#else
    bool success = mprotect(growStart, growSize, PROT_READ | PROT_WRITE) == 0;
#endif

    if (!success) {
        SPDLOG_ERROR("Linear memory failed to grow from {} to {} bytes", m_committedSize, target);
        return false;
    }

    SPDLOG_TRACE("Linear memory grew from {} to {} bytes", m_committedSize, target);
    m_committedSize = target;
    return true;
}

} // namespace ferry
