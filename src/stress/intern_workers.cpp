#include "intern_workers.hpp"
#include "../common/hash.hpp"
#include "../common/metrics.hpp"
#include <concurrentqueue.h>
#include <spdlog/spdlog.h>
#include <chrono>

namespace ic {

namespace {
    constexpr size_t BATCH_SIZE = 100;
}

InternWorkers::InternWorkers(const std::vector<std::string>& pool,
                             std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> input_queue,
                             StringCache& cache,
                             uint32_t num_threads)
    : pool_(pool), input_queue_(std::move(input_queue)), cache_(cache),
      num_threads_(num_threads == 0 ? 1 : num_threads), seen_(num_threads_) {
}

InternWorkers::~InternWorkers() {
    close_input();
    join();
}

void InternWorkers::start() {
    if (running_.exchange(true)) {
        return; // already running
    }
    input_closed_.store(false);

    worker_threads_.clear();
    worker_threads_.reserve(num_threads_);

    for (uint32_t i = 0; i < num_threads_; ++i) {
        worker_threads_.emplace_back(
            std::make_unique<std::jthread>([this, i](std::stop_token) {
                worker_thread(i);
            })
        );
    }

    spdlog::info("InternWorkers started with {} threads", num_threads_);
}

void InternWorkers::close_input() {
    input_closed_.store(true);
}

void InternWorkers::join() {
    if (!running_.exchange(false)) {
        return; // not running
    }

    for (auto& thread : worker_threads_) {
        if (thread && thread->joinable()) {
            thread->join();
        }
    }
    worker_threads_.clear();

    spdlog::info("InternWorkers stopped: {} interned, {} mismatches, {} errors",
                 stats_.interned.load(), stats_.mismatches.load(), stats_.errors.load());
}

void InternWorkers::worker_thread(size_t slot) {
    std::vector<uint32_t> batch(BATCH_SIZE);
    AtomMap<uint32_t>& seen = seen_[slot];

    while (true) {
        // Read the flag before dequeuing so nothing queued before close is missed
        const bool closed = input_closed_.load();
        size_t dequeued = input_queue_->try_dequeue_bulk(batch.data(), batch.size());

        if (dequeued == 0) {
            if (closed) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            continue;
        }

        {
            IC_MEASURE_LATENCY("intern_batch_ns");
            for (size_t i = 0; i < dequeued; ++i) {
                try {
                    if (!intern_one(batch[i], seen)) {
                        stats_.mismatches.fetch_add(1);
                    }
                } catch (const std::exception& e) {
                    spdlog::warn("Failed to intern pool entry {}: {}", batch[i], e.what());
                    stats_.errors.fetch_add(1);
                }
            }
        }

        stats_.interned.fetch_add(dequeued);
        MetricsCollector::instance().increment_counter("intern_calls_total", dequeued);
    }
}

bool InternWorkers::intern_one(uint32_t index, AtomMap<uint32_t>& seen) {
    const std::string& input = pool_[index];
    Atom atom = cache_.intern(input);

    if (atom.view() != input || atom.hash() != hash_bytes(input) || atom.c_str()[atom.size()] != '\0') {
        return false;
    }

    auto [it, inserted] = seen.try_emplace(atom, index);
    // Same atom for different content would be a false merge
    return inserted || pool_[it->second] == input;
}

AtomSet InternWorkers::distinct_atoms() const {
    AtomSet atoms;
    for (const auto& seen : seen_) {
        for (const auto& entry : seen) {
            atoms.insert(entry.first);
        }
    }
    return atoms;
}

} // namespace ic
