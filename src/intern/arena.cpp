#include "arena.hpp"
#include "errors.hpp"
#include <boost/container/pmr/global_resource.hpp>
#include <cstring>

namespace ic {

Arena::CountingResource::CountingResource()
    : base_(boost::container::pmr::new_delete_resource()) {
}

void* Arena::CountingResource::do_allocate(size_t bytes, size_t alignment) {
    void* p = base_->allocate(bytes, alignment);
    total_bytes_ += bytes;
    return p;
}

void Arena::CountingResource::do_deallocate(void* p, size_t bytes, size_t alignment) {
    base_->deallocate(p, bytes, alignment);
    total_bytes_ -= bytes;
}

bool Arena::CountingResource::do_is_equal(const boost::container::pmr::memory_resource& other) const noexcept {
    return &other == this;
}

Arena::Arena(size_t initial_block_bytes)
    : buffer_(initial_block_bytes, &upstream_) {
}

const char* Arena::allocate(uint64_t hash, std::string_view bytes) {
    if (bytes.size() > kMaxAtomLength) {
        throw LengthError(bytes.size(), kMaxAtomLength);
    }

    const size_t size = record_size(bytes.size());
    void* raw = buffer_.allocate(size, RECORD_ALIGN);

    auto* header = static_cast<RecordHeader*>(raw);
    header->hash = hash;
    header->length = static_cast<uint32_t>(bytes.size());
    header->reserved = 0;

    char* data = reinterpret_cast<char*>(header + 1);
    if (!bytes.empty()) {
        std::memcpy(data, bytes.data(), bytes.size());
    }
    data[bytes.size()] = '\0';

    allocated_bytes_ += size;
    ++record_count_;
    return data;
}

void Arena::release() {
    buffer_.release();
    allocated_bytes_ = 0;
    record_count_ = 0;
}

} // namespace ic
