#include "shard.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ic {

namespace {
    // Grow once size would exceed 3/4 of the slots
    constexpr size_t LOAD_NUM = 3;
    constexpr size_t LOAD_DEN = 4;

    size_t table_capacity(size_t requested) {
        if (requested > Shard::MAX_TABLE_CAPACITY) {
            throw std::invalid_argument("initial table capacity " + std::to_string(requested) +
                                        " exceeds " + std::to_string(Shard::MAX_TABLE_CAPACITY));
        }
        size_t cap = 2;
        while (cap < requested) {
            cap <<= 1;
        }
        return cap;
    }
}

Shard::Shard(size_t index, size_t initial_capacity, size_t arena_block_bytes)
    : index_(index), initial_capacity_(table_capacity(initial_capacity)),
      slots_(initial_capacity_, nullptr), arena_(arena_block_bytes) {
}

bool Shard::matches(const char* record, uint64_t hash, std::string_view bytes) {
    const RecordHeader* header = header_of(record);
    if (header->hash != hash || header->length != bytes.size()) {
        return false;
    }
    return bytes.empty() || std::memcmp(record, bytes.data(), bytes.size()) == 0;
}

size_t Shard::probe(uint64_t hash, std::string_view bytes) const {
    const size_t mask = slots_.size() - 1;
    size_t pos = static_cast<size_t>(hash) & mask;

    for (size_t step = 0; step < slots_.size(); ++step) {
        const char* record = slots_[pos];
        if (record == nullptr || matches(record, hash, bytes)) {
            return pos;
        }
        pos = (pos + 1) & mask;
    }

    // The load factor keeps empty slots around, so a full wrap means corruption
    throw std::logic_error("intern shard table has no free slot");
}

Atom Shard::get_or_insert(uint64_t hash, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t pos = probe(hash, bytes);
    if (slots_[pos] != nullptr) {
        return Atom(Atom::FromRecord{}, slots_[pos]);
    }

    if ((size_ + 1) * LOAD_DEN > slots_.size() * LOAD_NUM) {
        grow();
        pos = probe(hash, bytes);
    }

    const char* record = arena_.allocate(hash, bytes);
    slots_[pos] = record;
    ++size_;
    return Atom(Atom::FromRecord{}, record);
}

std::optional<Atom> Shard::find(uint64_t hash, std::string_view bytes) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* record = slots_[probe(hash, bytes)];
    if (record == nullptr) {
        return std::nullopt;
    }
    return Atom(Atom::FromRecord{}, record);
}

void Shard::grow() {
    std::vector<const char*> old_slots;
    old_slots.swap(slots_);
    slots_.assign(old_slots.size() * 2, nullptr);

    const size_t mask = slots_.size() - 1;
    for (const char* record : old_slots) {
        if (record == nullptr) {
            continue;
        }
        // Reuse the cached hash, the bytes are never rehashed
        size_t pos = static_cast<size_t>(header_of(record)->hash) & mask;
        while (slots_[pos] != nullptr) {
            pos = (pos + 1) & mask;
        }
        slots_[pos] = record;
    }

    spdlog::debug("Intern shard {} grew to {} slots ({} entries)", index_, slots_.size(), size_);
}

size_t Shard::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

size_t Shard::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

size_t Shard::allocated_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return arena_.allocated_bytes();
}

size_t Shard::capacity_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return arena_.capacity_bytes();
}

void Shard::for_each(const std::function<void(Atom)>& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const char* record : slots_) {
        if (record != nullptr) {
            fn(Atom(Atom::FromRecord{}, record));
        }
    }
}

void Shard::unsafe_clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const char*>(initial_capacity_, nullptr).swap(slots_);
    size_ = 0;
    arena_.release();
}

} // namespace ic
