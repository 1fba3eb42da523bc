#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Forward declare for lock-free queue
namespace moodycamel {
    template<typename T>
    class ConcurrentQueue;
}

namespace ic {

// Produces the stream of work for a stress run: indices into an immutable
// pool of strings. Every pool entry is emitted at least once, then indices
// are drawn at random until `total` items have been queued.
class PathSource {
public:
    // Throws std::invalid_argument if `total` is smaller than the pool
    PathSource(const std::vector<std::string>& pool,
               uint64_t total,
               uint64_t seed,
               std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> output_queue);
    ~PathSource();

    void start();
    void stop();
    bool finished() const { return finished_.load(); }

    // Distinct path-like strings, e.g. "/srv/cache/alpha/build_00042/module.so"
    static std::vector<std::string> generate_paths(uint32_t count, uint64_t seed);

    // Non-empty lines of a text file. Throws std::runtime_error if unreadable.
    static std::vector<std::string> load_lines(const std::string& path);

    struct Stats {
        std::atomic<uint64_t> emitted{0};
    };

    const Stats& get_stats() const { return stats_; }

private:
    void run_loop();

    const std::vector<std::string>& pool_;
    uint64_t total_;
    uint64_t seed_;
    std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> output_queue_;

    std::unique_ptr<std::jthread> worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    Stats stats_;
};

} // namespace ic
