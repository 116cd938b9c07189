#ifndef SRC_FERRY_LIBRARY_OBJECT_HPP_
#define SRC_FERRY_LIBRARY_OBJECT_HPP_

#include "ferry/Heap.hpp"
#include "ferry/ObjectHeader.hpp"
#include "ferry/ObjectRef.hpp"
#include "ferry/ThreadContext.hpp"

#include <cassert>

namespace ferry { namespace library {

// Our Object class can wrap any heap object reference. It uses the Curious Recurring Template Pattern, or CRTP, to
// provide static function dispatch without adding a vtable. It is a veneer over ObjectRefs that provides tag checking
// when touching heap objects from C++ code. Wrapping a null reference is allowed and yields a null wrapper.
template <typename T> class Object {
public:
    Object(): m_context(nullptr), m_ref() { }
    Object(const Object& o) = default;
    Object& operator=(const Object& o) = default;

    // Wraps an existing reference. Will assert if the tag doesn't match T. For wrapping without tag checking, use
    // wrapUnsafe().
    Object(ThreadContext* context, ObjectRef ref): m_context(context), m_ref(ref) {
        if (m_ref) {
            assert(m_context->heap->tag(m_ref) == T::kTag);
        }
    }

    // Destructor must deliberately do nothing, the collector owns the object.
    ~Object() { }

    static inline T wrapUnsafe(ThreadContext* context, ObjectRef ref) {
        T wrapper;
        wrapper.m_context = context;
        wrapper.m_ref = ref;
        return wrapper;
    }

    inline ObjectRef ref() const { return m_ref; }
    inline bool isNull() const { return m_ref.isNull(); }
    explicit inline operator bool() const { return !isNull(); }
    static constexpr Tag tag() { return T::kTag; }

protected:
    ThreadContext* m_context;
    ObjectRef m_ref;
};

} // namespace library
} // namespace ferry

#endif // SRC_FERRY_LIBRARY_OBJECT_HPP_
