#ifndef SRC_FERRY_THREAD_CONTEXT_HPP_
#define SRC_FERRY_THREAD_CONTEXT_HPP_

#include <memory>

namespace ferry {

class Heap;

// Per-instance state handed to every runtime entry point. Each program instance has exactly one, and only one unit of
// work runs against it at a time.
struct ThreadContext {
    ThreadContext() = default;
    ~ThreadContext() = default;

    std::shared_ptr<Heap> heap;
};

} // namespace ferry

#endif // SRC_FERRY_THREAD_CONTEXT_HPP_
