#include <gtest/gtest.h>
#include "stress/intern_workers.hpp"
#include "stress/path_source.hpp"

#include <concurrentqueue.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unordered_set>

using namespace ic;

TEST(PathSourceTest, GeneratedPathsAreDistinctAndDeterministic) {
    auto paths = PathSource::generate_paths(5000, 42);
    ASSERT_EQ(paths.size(), 5000u);

    std::unordered_set<std::string> unique(paths.begin(), paths.end());
    EXPECT_EQ(unique.size(), 5000u);
    EXPECT_EQ(paths.front().front(), '/');
    EXPECT_NE(paths[17].find("build_00017"), std::string::npos);

    EXPECT_EQ(PathSource::generate_paths(5000, 42), paths);
}

TEST(PathSourceTest, LoadLinesSkipsBlanks) {
    auto path = (std::filesystem::temp_directory_path() / "ic_lines.txt").string();
    {
        std::ofstream out(path);
        out << "alpha\n\nbeta\nalpha\n";
    }

    auto lines = PathSource::load_lines(path);
    EXPECT_EQ(lines, (std::vector<std::string>{"alpha", "beta", "alpha"}));
    std::remove(path.c_str());

    EXPECT_THROW(PathSource::load_lines("/nonexistent/ic_lines.txt"), std::runtime_error);
}

TEST(PathSourceTest, TotalMustCoverPool) {
    auto pool = PathSource::generate_paths(100, 5);
    auto queue = std::make_shared<moodycamel::ConcurrentQueue<uint32_t>>();

    EXPECT_THROW(PathSource(pool, 99, 5, queue), std::invalid_argument);
    EXPECT_THROW(PathSource(pool, 0, 5, queue), std::invalid_argument);
    EXPECT_NO_THROW(PathSource(pool, 100, 5, queue));

    std::vector<std::string> empty;
    EXPECT_NO_THROW(PathSource(empty, 0, 5, queue));
}

TEST(PathSourceTest, MinimalTotalEmitsEveryIndexOnce) {
    auto pool = PathSource::generate_paths(600, 8);
    auto queue = std::make_shared<moodycamel::ConcurrentQueue<uint32_t>>();

    PathSource source(pool, pool.size(), 8, queue);
    source.start();
    while (!source.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    source.stop();

    std::vector<uint32_t> items;
    uint32_t index = 0;
    while (queue->try_dequeue(index)) {
        items.push_back(index);
    }
    ASSERT_EQ(items.size(), pool.size());
    std::unordered_set<uint32_t> indices(items.begin(), items.end());
    EXPECT_EQ(indices.size(), pool.size());
}

TEST(InternWorkersTest, SourceAndWorkersAgreeWithPool) {
    StringCache cache(CacheOptions{8});
    auto pool = PathSource::generate_paths(1000, 3);
    auto queue = std::make_shared<moodycamel::ConcurrentQueue<uint32_t>>(4096);

    PathSource source(pool, 10000, 3, queue);
    InternWorkers workers(pool, queue, cache, 4);

    workers.start();
    source.start();
    while (!source.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    workers.close_input();
    workers.join();
    source.stop();

    EXPECT_EQ(source.get_stats().emitted.load(), 10000u);
    EXPECT_EQ(workers.get_stats().interned.load(), 10000u);
    EXPECT_EQ(workers.get_stats().mismatches.load(), 0u);
    EXPECT_EQ(workers.get_stats().errors.load(), 0u);
    EXPECT_EQ(workers.distinct_atoms().size(), 1000u);
    EXPECT_EQ(cache.size(), 1000u);
}

TEST(InternWorkersTest, DuplicateInputsCollapse) {
    StringCache cache(CacheOptions{2});
    std::vector<std::string> pool = {"dup", "dup", "other", "dup"};
    auto queue = std::make_shared<moodycamel::ConcurrentQueue<uint32_t>>();

    PathSource source(pool, 40, 9, queue);
    InternWorkers workers(pool, queue, cache, 2);
    workers.start();
    source.start();
    while (!source.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    workers.close_input();
    workers.join();

    EXPECT_EQ(workers.get_stats().mismatches.load(), 0u);
    EXPECT_EQ(workers.distinct_atoms().size(), 2u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(InternWorkersTest, OversizedInputCountsAsError) {
    CacheOptions options;
    options.shard_count = 2;
    options.max_length = 4;
    StringCache cache(options);
    std::vector<std::string> pool = {"ok", "too-long"};
    auto queue = std::make_shared<moodycamel::ConcurrentQueue<uint32_t>>();

    PathSource source(pool, 2, 1, queue);
    InternWorkers workers(pool, queue, cache, 1);
    workers.start();
    source.start();
    while (!source.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    workers.close_input();
    workers.join();

    EXPECT_EQ(workers.get_stats().errors.load(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}
