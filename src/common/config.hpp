#pragma once

#include "../intern/string_cache.hpp"
#include <string>
#include <cstdint>

namespace ic {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%f] [%l] %v";
};

struct StressConfig {
    uint32_t threads = 8;
    uint32_t distinct_strings = 20000;
    uint64_t total_interns = 100000;
    uint64_t seed = 12345;
    std::string input_file;    // one string per line; empty = generate paths
    std::string metrics_file;  // empty = print to stdout
};

struct Config {
    CacheOptions cache;
    LoggingConfig logging;
    StressConfig stress;

    static Config load_from_file(const std::string& path);
    static Config default_config();
};

} // namespace ic
