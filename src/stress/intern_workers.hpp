#pragma once

#include "../intern/atom_containers.hpp"
#include "../intern/string_cache.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Forward declarations
namespace moodycamel {
    template<typename T>
    class ConcurrentQueue;
}

namespace ic {

// Pool of threads that drain pool indices from a queue and intern the
// corresponding strings, checking every returned atom against its input.
class InternWorkers {
public:
    InternWorkers(const std::vector<std::string>& pool,
                  std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> input_queue,
                  StringCache& cache,
                  uint32_t num_threads = 4);

    ~InternWorkers();

    void start();
    // Lets workers exit once the queue is empty
    void close_input();
    // Blocks until every worker has exited
    void join();

    struct Stats {
        std::atomic<uint64_t> interned{0};
        std::atomic<uint64_t> mismatches{0};
        std::atomic<uint64_t> errors{0};
    };

    const Stats& get_stats() const { return stats_; }

    // Union of the atoms seen by all workers. Only valid after join().
    AtomSet distinct_atoms() const;

private:
    void worker_thread(size_t slot);
    bool intern_one(uint32_t index, AtomMap<uint32_t>& seen);

    const std::vector<std::string>& pool_;
    std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> input_queue_;
    StringCache& cache_;

    uint32_t num_threads_;
    std::vector<std::unique_ptr<std::jthread>> worker_threads_;
    std::vector<AtomMap<uint32_t>> seen_;  // one per worker, atom -> pool index
    std::atomic<bool> running_{false};
    std::atomic<bool> input_closed_{false};

    Stats stats_;
};

} // namespace ic
