#pragma once

#include "kiln/aggregate.hpp"
#include "kiln/scheduler.hpp"
#include "kiln/utility.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct CacheConfig {
    bool compress = true;
    /// Compression stays on only while decompressing costs at most this share of the last build.
    double max_decompress_fraction = 0.05;
};

struct RenderConfig {
    std::vector<std::string> command; ///< argv template for the process renderer
    std::chrono::milliseconds timeout{60000};
    size_t aggregate_pass_cap = 4;
};

struct SchedulerConfig {
    std::optional<Environment> environment;
    std::map<Phase, PhaseProfile> profiles;
};

/**
 * @brief Everything a build cycle reads from kiln.json.
 *
 * Relative paths are resolved against `base_dir`, the directory holding the
 * config file.
 */
struct EngineConfig {
    std::filesystem::path config_file; ///< empty when built in memory
    std::filesystem::path base_dir = ".";

    std::filesystem::path source_dir = ".";
    std::filesystem::path output_dir = "public";
    std::filesystem::path cache_file = ".kiln/cache.bin";

    std::string content_dir = "content";
    std::string templates_dir = "templates";
    std::string data_dir = "data";
    std::string assets_dir = "assets";

    bool parallel = true;
    bool fast = false;             ///< per-output progress lines off; the driver also raises the log threshold
    bool memory_optimized = false; ///< workers stream outputs to disk instead of buffering
    size_t max_workers = 0;

    CacheConfig cache;
    RenderConfig render;
    std::vector<AggregateFamily> aggregates;
    SchedulerConfig scheduler;

    std::filesystem::path source_root() const;
    std::filesystem::path output_root() const;
    std::filesystem::path cache_path() const;
    std::filesystem::path scratch_dir() const;

    /// @brief Canonical JSON of every setting that affects rendered bytes.
    std::string rendering_identity() const;
};

Result<EngineConfig> parse_config(const nlohmann::json &doc, const std::filesystem::path &base_dir);

/// @brief Reads and parses `path`, then applies KILN_* environment overrides.
Result<EngineConfig> load_config(const std::filesystem::path &path);

/// KILN_PARALLEL=0|1, KILN_MAX_WORKERS=<n>. Scheduling only; never affects output.
Result<void> apply_env_overrides(EngineConfig &config);

/// @brief Structural checks that would otherwise miscompute every output.
Result<void> validate(const EngineConfig &config);

Scheduler::Options scheduler_options(const EngineConfig &config);

} // namespace kiln
