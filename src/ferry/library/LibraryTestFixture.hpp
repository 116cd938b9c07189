#ifndef SRC_FERRY_LIBRARY_LIBRARY_TEST_FIXTURE_HPP_
#define SRC_FERRY_LIBRARY_LIBRARY_TEST_FIXTURE_HPP_

#include "ferry/Runtime.hpp"
#include "ferry/ThreadContext.hpp"

#include <memory>

// For consumption by unittests only, a test fixture that creates a Runtime with a mapped heap.
namespace ferry {

class LibraryTestFixture {
public:
    LibraryTestFixture(): m_runtime(std::make_unique<Runtime>()) { m_initialized = m_runtime->initialize(); }
    virtual ~LibraryTestFixture() = default;

protected:
    ThreadContext* context() { return m_runtime->context(); }
    Runtime* runtime() { return m_runtime.get(); }
    bool initialized() const { return m_initialized; }

private:
    std::unique_ptr<Runtime> m_runtime;
    bool m_initialized;
};

} // namespace ferry

#endif // SRC_FERRY_LIBRARY_LIBRARY_TEST_FIXTURE_HPP_
