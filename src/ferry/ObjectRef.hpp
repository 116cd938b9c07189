#ifndef SRC_FERRY_OBJECT_REF_HPP_
#define SRC_FERRY_OBJECT_REF_HPP_

#include <cstdint>
#include <functional>
#include <type_traits>

namespace ferry {

// A reference to a heap object, stored in a single 32-bit word. References are *skewed*: the stored bits are the
// linear memory address of the object minus one, matching the representation used by generated code, where the low
// bit of an aligned address distinguishes references from scalars. Address zero is never allocated, so its skewed
// form doubles as the null reference.
class ObjectRef {
public:
    constexpr ObjectRef(): m_bits(kNullBits) { }
    constexpr ObjectRef(const ObjectRef& r) = default;
    ObjectRef& operator=(const ObjectRef& r) = default;
    ~ObjectRef() = default;

    static constexpr ObjectRef fromAddress(uint32_t address) { return ObjectRef(address - 1); }
    static constexpr ObjectRef fromBits(uint32_t bits) { return ObjectRef(bits); }

    inline uint32_t address() const { return m_bits + 1; }
    inline uint32_t bits() const { return m_bits; }
    inline bool isNull() const { return m_bits == kNullBits; }
    explicit inline operator bool() const { return !isNull(); }

    inline bool operator==(const ObjectRef& r) const { return m_bits == r.m_bits; }
    inline bool operator!=(const ObjectRef& r) const { return m_bits != r.m_bits; }

    static constexpr uint32_t kNullBits = 0xffffffff;

private:
    explicit constexpr ObjectRef(uint32_t bits): m_bits(bits) { }

    uint32_t m_bits;
};

static_assert(sizeof(ObjectRef) == 4);
static_assert(std::is_standard_layout<ObjectRef>::value);

} // namespace ferry

namespace std {
template <> struct hash<ferry::ObjectRef> {
    size_t operator()(const ferry::ObjectRef& r) const { return static_cast<size_t>(r.bits()); }
};
} // namespace std

#endif // SRC_FERRY_OBJECT_REF_HPP_
