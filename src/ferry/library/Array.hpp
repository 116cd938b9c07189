#ifndef SRC_FERRY_LIBRARY_ARRAY_HPP_
#define SRC_FERRY_LIBRARY_ARRAY_HPP_

#include "ferry/library/Object.hpp"

namespace ferry { namespace library {

// The element type of Array is always ObjectRef, so Arrays are naturally heterogenous. For C++-side access to arrays
// of homogeneous objects TypedArray wraps and unwraps the references into the assigned type.
class Array : public Object<Array> {
public:
    static constexpr Tag kTag = kTagArray;

    Array(): Object<Array>() { }
    Array(ThreadContext* context, ObjectRef ref): Object<Array>(context, ref) { }
    ~Array() { }

    // Elements are uninitialized. Traps if |size| is over kMaxArrayLength.
    static Array alloc(ThreadContext* context, uint32_t size) {
        return Array(context, context->heap->allocateArray(size));
    }

    // Makes a new array of size |size| with each element set to the null reference.
    static Array newClear(ThreadContext* context, uint32_t size) {
        Array array = alloc(context, size);
        for (uint32_t i = 0; i < size; ++i) {
            array.put(i, ObjectRef());
        }
        return array;
    }

    uint32_t size() const {
        if (isNull()) {
            return 0;
        }
        return m_context->heap->arrayLength(m_ref);
    }

    ObjectRef at(uint32_t index) const { return m_context->heap->arrayAt(m_ref, index); }
    void put(uint32_t index, ObjectRef element) { m_context->heap->arrayPut(m_ref, index, element); }
};

template <typename T> class TypedArray : public Array {
public:
    TypedArray(): Array() { }
    TypedArray(ThreadContext* context, ObjectRef ref): Array(context, ref) { }
    ~TypedArray() { }

    static TypedArray<T> typedAlloc(ThreadContext* context, uint32_t size) {
        Array a = alloc(context, size);
        return TypedArray<T>(context, a.ref());
    }

    T typedAt(uint32_t index) const { return T(m_context, at(index)); }
    void typedPut(uint32_t index, T element) { put(index, element.ref()); }
};

} // namespace library
} // namespace ferry

#endif // SRC_FERRY_LIBRARY_ARRAY_HPP_
