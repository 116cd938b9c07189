#ifndef SRC_FERRY_LIBRARY_BLOB_HPP_
#define SRC_FERRY_LIBRARY_BLOB_HPP_

#include "ferry/library/Object.hpp"

#include <cstring>
#include <string_view>

namespace ferry { namespace library {

// A length-prefixed byte buffer. Text is stored as a blob of UTF-8 bytes.
class Blob : public Object<Blob> {
public:
    static constexpr Tag kTag = kTagBlob;

    Blob(): Object<Blob>() { }
    Blob(ThreadContext* context, ObjectRef ref): Object<Blob>(context, ref) { }
    ~Blob() { }

    // Payload is uninitialized.
    static Blob alloc(ThreadContext* context, uint32_t size) {
        return Blob(context, context->heap->allocateBlob(size));
    }

    static Blob fromView(ThreadContext* context, std::string_view v) {
        Blob blob = alloc(context, static_cast<uint32_t>(v.size()));
        if (v.size()) {
            std::memcpy(blob.start(), v.data(), v.size());
        }
        return blob;
    }

    uint32_t size() const {
        if (isNull()) {
            return 0;
        }
        return m_context->heap->blobLength(m_ref);
    }

    uint8_t* start() const {
        if (isNull()) {
            return nullptr;
        }
        return m_context->heap->blobPayload(m_ref);
    }

    std::string_view view() const {
        if (isNull()) {
            return std::string_view();
        }
        return std::string_view(reinterpret_cast<const char*>(start()), size());
    }
};

} // namespace library
} // namespace ferry

#endif // SRC_FERRY_LIBRARY_BLOB_HPP_
