#include "common/config.hpp"
#include "common/metrics.hpp"
#include "intern/atom_fmt.hpp"
#include "intern/string_cache.hpp"
#include "stress/intern_workers.hpp"
#include "stress/path_source.hpp"

#include <concurrentqueue.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <unordered_set>

namespace ic {

// One stress run: a PathSource feeding InternWorkers over a shared queue,
// followed by verification of the resulting atoms against the input pool.
class StressRun {
public:
    explicit StressRun(const Config& config) : config_(config) {
        setup_components();
    }

    ~StressRun() {
        source_->stop();
        workers_->close_input();
        workers_->join();
    }

    void run() {
        auto started = std::chrono::steady_clock::now();

        workers_->start();
        source_->start();

        while (!source_->finished()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        workers_->close_input();
        workers_->join();
        source_->stop();

        elapsed_ = std::chrono::steady_clock::now() - started;
    }

    bool verify() const {
        const auto& stats = workers_->get_stats();
        const AtomSet atoms = workers_->distinct_atoms();
        bool ok = true;

        if (atoms.size() != expected_distinct_) {
            spdlog::error("Expected {} distinct atoms, got {}", expected_distinct_, atoms.size());
            ok = false;
        }
        if (stats.mismatches.load() != 0 || stats.errors.load() != 0) {
            spdlog::error("{} mismatched atoms, {} intern errors", stats.mismatches.load(), stats.errors.load());
            ok = false;
        }
        if (stats.interned.load() != source_->get_stats().emitted.load()) {
            spdlog::error("Queued {} items but interned {}", source_->get_stats().emitted.load(), stats.interned.load());
            ok = false;
        }

        // Every input must now resolve, without inserting, to an atom the workers saw
        for (const auto& input : pool_) {
            auto existing = global_cache().find(input);
            if (!existing || !atoms.contains(*existing)) {
                spdlog::error("Input '{}' did not resolve to a worker atom", input);
                ok = false;
                break;
            }
        }

        if (ok && !atoms.empty()) {
            spdlog::info("Sample atom: '{}' hash={:#018x} len={}", *atoms.begin(), atoms.begin()->hash(), atoms.begin()->size());
        }
        return ok;
    }

    void report() const {
        auto stats = global_cache().stats();
        auto& metrics = MetricsCollector::instance();
        metrics.publish_cache_stats(stats);

        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed_).count();
        metrics.set_gauge("stress_elapsed_ms", static_cast<double>(elapsed_ms));

        spdlog::info("Interned {} items in {} ms with {} threads",
                     workers_->get_stats().interned.load(), elapsed_ms, config_.stress.threads);
        spdlog::info("Cache: {} entries in {} shards (largest {}), {} table slots, {} / {} arena bytes used",
                     stats.entries, stats.shard_count, stats.largest_shard, stats.table_slots,
                     stats.allocated_bytes, stats.capacity_bytes);

        const std::string json = metrics.get_json_metrics();
        if (config_.stress.metrics_file.empty()) {
            std::cout << json << std::endl;
            return;
        }

        std::ofstream out(config_.stress.metrics_file);
        if (!out.is_open()) {
            throw std::runtime_error("cannot write metrics to " + config_.stress.metrics_file);
        }
        out << json << '\n';
        spdlog::info("Metrics written to {}", config_.stress.metrics_file);
    }

private:
    void setup_components() {
        if (init_global_cache(config_.cache)) {
            spdlog::info("Configured global cache with {} shards", config_.cache.shard_count);
        } else {
            spdlog::warn("Global cache already existed, configured options ignored");
        }

        if (config_.stress.input_file.empty()) {
            pool_ = PathSource::generate_paths(config_.stress.distinct_strings, config_.stress.seed);
        } else {
            pool_ = PathSource::load_lines(config_.stress.input_file);
        }

        std::unordered_set<std::string_view> unique(pool_.begin(), pool_.end());
        expected_distinct_ = unique.size();
        spdlog::info("Input pool: {} strings, {} distinct", pool_.size(), expected_distinct_);

        queue_ = std::make_shared<moodycamel::ConcurrentQueue<uint32_t>>(config_.stress.total_interns);
        source_ = std::make_unique<PathSource>(pool_, config_.stress.total_interns, config_.stress.seed, queue_);
        workers_ = std::make_unique<InternWorkers>(pool_, queue_, global_cache(), config_.stress.threads);
    }

    Config config_;
    std::vector<std::string> pool_;
    size_t expected_distinct_ = 0;

    std::shared_ptr<moodycamel::ConcurrentQueue<uint32_t>> queue_;
    std::unique_ptr<PathSource> source_;
    std::unique_ptr<InternWorkers> workers_;

    std::chrono::steady_clock::duration elapsed_{};
};

} // namespace ic

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "config.json";
        if (argc > 1) {
            config_path = argv[1];
        }

        ic::Config config = ic::Config::load_from_file(config_path);

        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::set_pattern(config.logging.pattern);
        spdlog::info("Loaded configuration from {}", config_path);

        ic::StressRun run(config);
        run.run();

        const bool ok = run.verify();
        run.report();

        if (!ok) {
            spdlog::error("Stress run FAILED verification");
            return 1;
        }
        spdlog::info("Stress run passed");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
