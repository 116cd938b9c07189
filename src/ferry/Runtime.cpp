#include "ferry/Runtime.hpp"

#include "ferry/Heap.hpp"
#include "ferry/ThreadContext.hpp"
#include "ferry/Trap.hpp"

#include "spdlog/spdlog.h"

namespace ferry {

Runtime::Runtime(): Runtime(Heap::kDefaultMemorySize) { }

Runtime::Runtime(uint64_t memorySize):
    m_heap(std::make_shared<Heap>(memorySize)), m_threadContext(std::make_unique<ThreadContext>()) {
    m_threadContext->heap = m_heap;
}

Runtime::~Runtime() { }

bool Runtime::initialize() {
    if (!m_heap->map()) {
        SPDLOG_CRITICAL("Runtime failed to map heap");
        return false;
    }
    return true;
}

bool Runtime::runMessage(const std::function<void(ThreadContext*)>& message) {
    auto heapPointer = m_heap->heapPointer();
    try {
        message(m_threadContext.get());
    } catch (const Trap& trap) {
        SPDLOG_WARN("Message trapped: {}", trap.what());
        m_lastTrap = trap.what();
        m_heap->resetHeapPointer(heapPointer);
        return false;
    }
    return true;
}

} // namespace ferry
