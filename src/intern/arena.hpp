#pragma once

#include "record.hpp"
#include <boost/container/pmr/memory_resource.hpp>
#include <boost/container/pmr/monotonic_buffer_resource.hpp>
#include <cstdint>
#include <string_view>

namespace ic {

// Append-only storage for interned records. Blocks are chained, never moved,
// and only released all at once. Not synchronized: the owning Shard locks.
class Arena {
public:
    static constexpr size_t DEFAULT_BLOCK_BYTES = 64 * 1024;

    explicit Arena(size_t initial_block_bytes = DEFAULT_BLOCK_BYTES);

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    // Copies hash, length, bytes and a trailing zero into a new record.
    // Returns the address of the bytes. Throws std::bad_alloc on exhaustion.
    const char* allocate(uint64_t hash, std::string_view bytes);

    size_t allocated_bytes() const { return allocated_bytes_; }
    size_t capacity_bytes() const { return upstream_.total_bytes(); }
    size_t record_count() const { return record_count_; }

    // Frees every block. Every address returned so far becomes dangling.
    void release();

private:
    // Counts what the monotonic resource takes from the heap
    class CountingResource : public boost::container::pmr::memory_resource {
    public:
        CountingResource();

        size_t total_bytes() const { return total_bytes_; }

    protected:
        void* do_allocate(size_t bytes, size_t alignment) override;
        void do_deallocate(void* p, size_t bytes, size_t alignment) override;
        bool do_is_equal(const boost::container::pmr::memory_resource& other) const noexcept override;

    private:
        boost::container::pmr::memory_resource* base_;
        size_t total_bytes_ = 0;
    };

    CountingResource upstream_;
    boost::container::pmr::monotonic_buffer_resource buffer_;
    size_t allocated_bytes_ = 0;
    size_t record_count_ = 0;
};

} // namespace ic
