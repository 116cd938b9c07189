#ifndef SRC_FERRY_RUNTIME_HPP_
#define SRC_FERRY_RUNTIME_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ferry {

class Heap;
struct ThreadContext;

// Owns the objects for one running program instance: its Heap and ThreadContext. Instances share nothing, so any
// number may exist side by side.
class Runtime {
public:
    Runtime();
    explicit Runtime(uint64_t memorySize);
    ~Runtime();

    // Maps the heap and finalizes the ThreadContext.
    bool initialize();

    // Runs one unit of work to completion. If it traps, logs the trap, discards everything the unit allocated and
    // returns false; the instance stays usable for the next unit.
    bool runMessage(const std::function<void(ThreadContext*)>& message);

    // Full text of the most recent trap, empty if no unit has trapped.
    const std::string& lastTrap() const { return m_lastTrap; }

    ThreadContext* context() { return m_threadContext.get(); }

private:
    std::shared_ptr<Heap> m_heap;
    std::unique_ptr<ThreadContext> m_threadContext;
    std::string m_lastTrap;
};

} // namespace ferry

#endif // SRC_FERRY_RUNTIME_HPP_
