#include "path_source.hpp"
#include "../common/metrics.hpp"
#include <concurrentqueue.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <array>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace ic {

namespace {
    constexpr std::array<const char*, 6> ROOTS = {"/usr/lib", "/srv/cache", "/home/build", "/opt/tools", "/var/data", "/etc/conf.d"};
    constexpr std::array<const char*, 8> DIRS = {"alpha", "beta", "gamma", "delta", "core", "net", "ui", "io"};
    constexpr std::array<const char*, 6> FILES = {"module.so", "index.json", "main.cpp", "config.toml", "README", "data.bin"};
    constexpr size_t BATCH_SIZE = 256;
}

PathSource::PathSource(const std::vector<std::string>& pool,
                       uint64_t total,
                       uint64_t seed,
                       std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> output_queue)
    : pool_(pool), total_(total), seed_(seed), output_queue_(std::move(output_queue)) {
    if (total_ < pool_.size()) {
        throw std::invalid_argument("total_interns (" + std::to_string(total_) +
                                    ") must cover every input string (" + std::to_string(pool_.size()) + ")");
    }
}

PathSource::~PathSource() {
    stop();
}

void PathSource::start() {
    if (running_.exchange(true)) {
        return; // already running
    }
    finished_.store(false);

    worker_thread_ = std::make_unique<std::jthread>([this](std::stop_token) {
        run_loop();
    });

    spdlog::info("PathSource started: {} items over {} strings", total_, pool_.size());
}

void PathSource::stop() {
    if (!running_.exchange(false)) {
        return; // not running
    }

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->request_stop();
        worker_thread_->join();
    }
    worker_thread_.reset();
}

void PathSource::run_loop() {
    std::mt19937_64 rng(seed_);
    std::uniform_int_distribution<uint32_t> pick(0, pool_.empty() ? 0 : static_cast<uint32_t>(pool_.size() - 1));

    std::vector<uint32_t> batch;
    batch.reserve(BATCH_SIZE);

    auto flush = [&]() {
        if (batch.empty()) {
            return;
        }
        output_queue_->enqueue_bulk(batch.data(), batch.size());
        stats_.emitted.fetch_add(batch.size());
        batch.clear();
    };

    uint64_t emitted = 0;
    while (running_.load() && emitted < total_ && !pool_.empty()) {
        // First pass covers every string once, the rest is random repetition
        uint32_t index = emitted < pool_.size() ? static_cast<uint32_t>(emitted) : pick(rng);
        batch.push_back(index);
        ++emitted;

        if (batch.size() == BATCH_SIZE) {
            flush();
        }
    }
    flush();

    MetricsCollector::instance().increment_counter("path_source_items_total", stats_.emitted.load());
    finished_.store(true);
    spdlog::info("PathSource finished after {} items", stats_.emitted.load());
}

std::vector<std::string> PathSource::generate_paths(uint32_t count, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> root_dist(0, ROOTS.size() - 1);
    std::uniform_int_distribution<size_t> dir_dist(0, DIRS.size() - 1);
    std::uniform_int_distribution<size_t> file_dist(0, FILES.size() - 1);

    std::vector<std::string> paths;
    paths.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        // The sequence number keeps every path distinct
        paths.push_back(fmt::format("{}/{}/build_{:05}/{}",
                                    ROOTS[root_dist(rng)], DIRS[dir_dist(rng)], i, FILES[file_dist(rng)]));
    }
    return paths;
}

std::vector<std::string> PathSource::load_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open input file " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }
    spdlog::info("Loaded {} lines from {}", lines.size(), path);
    return lines;
}

} // namespace ic
