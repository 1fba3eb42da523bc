#include "config.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ic {

namespace {
    // Unsigned field that must fit T without truncation
    template<typename T>
    T read_unsigned(const nlohmann::json& value, const char* key) {
        if (value.is_number_integer() && !value.is_number_unsigned()) {
            throw std::out_of_range(std::string(key) + " must not be negative");
        }
        const uint64_t raw = value.get<uint64_t>();
        if (raw > std::numeric_limits<T>::max()) {
            throw std::out_of_range(std::string(key) + " value " + std::to_string(raw) + " is out of range");
        }
        return static_cast<T>(raw);
    }
}

Config Config::load_from_file(const std::string& path) {
    Config config = default_config();

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::info("No config at {}, using defaults", path);
            return config;
        }

        nlohmann::json j;
        file >> j;

        if (j.contains("cache")) {
            auto& cache = j["cache"];
            if (cache.contains("shard_count")) config.cache.shard_count = read_unsigned<uint32_t>(cache["shard_count"], "shard_count");
            if (cache.contains("arena_block_bytes")) config.cache.arena_block_bytes = read_unsigned<size_t>(cache["arena_block_bytes"], "arena_block_bytes");
            if (cache.contains("initial_table_capacity")) config.cache.initial_table_capacity = read_unsigned<size_t>(cache["initial_table_capacity"], "initial_table_capacity");
            if (cache.contains("max_length")) config.cache.max_length = read_unsigned<size_t>(cache["max_length"], "max_length");
        }

        if (j.contains("logging")) {
            auto& log = j["logging"];
            if (log.contains("level")) config.logging.level = log["level"].get<std::string>();
            if (log.contains("pattern")) config.logging.pattern = log["pattern"].get<std::string>();
        }

        if (j.contains("stress")) {
            auto& stress = j["stress"];
            if (stress.contains("threads")) config.stress.threads = read_unsigned<uint32_t>(stress["threads"], "threads");
            if (stress.contains("distinct_strings")) config.stress.distinct_strings = read_unsigned<uint32_t>(stress["distinct_strings"], "distinct_strings");
            if (stress.contains("total_interns")) config.stress.total_interns = read_unsigned<uint64_t>(stress["total_interns"], "total_interns");
            if (stress.contains("seed")) config.stress.seed = read_unsigned<uint64_t>(stress["seed"], "seed");
            if (stress.contains("input_file")) config.stress.input_file = stress["input_file"].get<std::string>();
            if (stress.contains("metrics_file")) config.stress.metrics_file = stress["metrics_file"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring invalid config {}: {}", path, e.what());
        return default_config();
    } catch (const std::out_of_range& e) {
        spdlog::warn("Ignoring invalid config {}: {}", path, e.what());
        return default_config();
    }

    return config;
}

Config Config::default_config() {
    return Config{};
}

} // namespace ic
