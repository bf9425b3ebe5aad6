#include "kiln/config.hpp"

#include <format>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>

namespace kiln {

using json = nlohmann::json;

namespace {

Result<PhaseProfile> parse_profile(const json &j, PhaseProfile base) {
    if (!j.is_object())
        return std::unexpected("scheduler profile must be an object");
    base.break_even = j.value("break_even", base.break_even);
    base.optimal_small = j.value("optimal_small", base.optimal_small);
    base.optimal_large = j.value("optimal_large", base.optimal_large);
    base.large_workload = j.value("large_workload", base.large_workload);
    base.contention_point = j.value("contention_point", base.contention_point);
    if (base.optimal_small == 0 || base.optimal_large == 0 || base.contention_point == 0)
        return std::unexpected("scheduler profile worker counts must be positive");
    return base;
}

Result<AggregateFamily> parse_family(const json &j) {
    if (!j.is_object())
        return std::unexpected("aggregate entry must be an object");
    auto kind_name = j.value("kind", std::string{});
    auto kind = parse_aggregate_kind(kind_name);
    if (!kind)
        return std::unexpected(std::format("unknown aggregate kind '{}'", kind_name));

    AggregateFamily family;
    family.kind = *kind;
    family.output = j.value("output", std::string{});
    if (family.output.empty())
        return std::unexpected(std::format("{} aggregate is missing 'output'", kind_name));
    if (j.contains("key"))
        family.key = j.at("key").get<std::string>();
    return family;
}

Result<size_t> parse_size(std::string_view text) {
    size_t value = 0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size())
        return std::unexpected(std::format("not a non-negative integer: {}", text));
    return value;
}

} // namespace

std::filesystem::path EngineConfig::source_root() const {
    return (base_dir / source_dir).lexically_normal();
}

std::filesystem::path EngineConfig::output_root() const {
    return (base_dir / output_dir).lexically_normal();
}

std::filesystem::path EngineConfig::cache_path() const {
    return (base_dir / cache_file).lexically_normal();
}

std::filesystem::path EngineConfig::scratch_dir() const {
    return cache_path().parent_path() / "tmp";
}

std::string EngineConfig::rendering_identity() const {
    json j;
    j["source_dir"] = source_dir.generic_string();
    j["output_dir"] = output_dir.generic_string();
    j["content_dir"] = content_dir;
    j["templates_dir"] = templates_dir;
    j["data_dir"] = data_dir;
    j["assets_dir"] = assets_dir;
    j["command"] = render.command;
    json aggs = json::array();
    for (const auto &f : aggregates) {
        json a;
        a["kind"] = to_string(f.kind);
        a["output"] = f.output;
        if (f.key)
            a["key"] = *f.key;
        aggs.push_back(std::move(a));
    }
    j["aggregates"] = std::move(aggs);
    return j.dump();
}

Result<EngineConfig> parse_config(const json &doc, const std::filesystem::path &base_dir) {
    if (!doc.is_object())
        return std::unexpected("config root must be a JSON object");

    EngineConfig cfg;
    cfg.base_dir = base_dir;
    try {
        cfg.source_dir = doc.value("source_dir", cfg.source_dir.string());
        cfg.output_dir = doc.value("output_dir", cfg.output_dir.string());
        cfg.cache_file = doc.value("cache_file", cfg.cache_file.string());
        cfg.content_dir = doc.value("content_dir", cfg.content_dir);
        cfg.templates_dir = doc.value("templates_dir", cfg.templates_dir);
        cfg.data_dir = doc.value("data_dir", cfg.data_dir);
        cfg.assets_dir = doc.value("assets_dir", cfg.assets_dir);

        cfg.parallel = doc.value("parallel", cfg.parallel);
        cfg.fast = doc.value("fast", cfg.fast);
        cfg.memory_optimized = doc.value("memory_optimized", cfg.memory_optimized);
        if (doc.contains("max_workers")) {
            auto n = doc.at("max_workers").get<long long>();
            if (n < 0)
                return std::unexpected("max_workers must not be negative");
            cfg.max_workers = static_cast<size_t>(n);
        }

        if (auto it = doc.find("cache"); it != doc.end()) {
            cfg.cache.compress = it->value("compress", cfg.cache.compress);
            cfg.cache.max_decompress_fraction =
                it->value("max_decompress_fraction", cfg.cache.max_decompress_fraction);
            if (cfg.cache.max_decompress_fraction < 0.0)
                return std::unexpected("cache.max_decompress_fraction must not be negative");
        }

        if (auto it = doc.find("render"); it != doc.end()) {
            if (it->contains("command"))
                cfg.render.command = it->at("command").get<std::vector<std::string>>();
            if (it->contains("timeout_ms")) {
                auto ms = it->at("timeout_ms").get<long long>();
                if (ms <= 0)
                    return std::unexpected("render.timeout_ms must be positive");
                cfg.render.timeout = std::chrono::milliseconds(ms);
            }
            if (it->contains("aggregate_pass_cap")) {
                auto cap = it->at("aggregate_pass_cap").get<long long>();
                if (cap < 1)
                    return std::unexpected("render.aggregate_pass_cap must be at least 1");
                cfg.render.aggregate_pass_cap = static_cast<size_t>(cap);
            }
        }

        if (auto it = doc.find("aggregates"); it != doc.end()) {
            if (!it->is_array())
                return std::unexpected("aggregates must be an array");
            for (const auto &entry : *it) {
                auto family = parse_family(entry);
                if (!family)
                    return std::unexpected(family.error());
                cfg.aggregates.push_back(std::move(*family));
            }
        }

        if (auto it = doc.find("scheduler"); it != doc.end()) {
            auto env_name = it->value("environment", std::string("auto"));
            if (env_name != "auto") {
                auto env = parse_environment(env_name);
                if (!env)
                    return std::unexpected(std::format("unknown scheduler environment '{}'", env_name));
                cfg.scheduler.environment = env;
            }
            if (auto profiles = it->find("profiles"); profiles != it->end()) {
                Environment env = cfg.scheduler.environment.value_or(detect_environment());
                for (const auto &[name, body] : profiles->items()) {
                    auto phase = parse_phase(name);
                    if (!phase)
                        return std::unexpected(std::format("unknown scheduler phase '{}'", name));
                    auto profile = parse_profile(body, calibrated_profile(*phase, env));
                    if (!profile)
                        return std::unexpected(std::format("scheduler.profiles.{}: {}", name, profile.error()));
                    cfg.scheduler.profiles[*phase] = *profile;
                }
            }
        }
    } catch (const json::exception &e) {
        return std::unexpected(std::format("invalid config: {}", e.what()));
    }
    return cfg;
}

Result<EngineConfig> load_config(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::unexpected(std::format("cannot read config file {}", path.string()));

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error &e) {
        return std::unexpected(std::format("{}: {}", path.string(), e.what()));
    }

    auto absolute = std::filesystem::absolute(path).lexically_normal();
    auto cfg = parse_config(doc, absolute.parent_path());
    if (!cfg)
        return std::unexpected(std::format("{}: {}", path.string(), cfg.error()));
    cfg->config_file = absolute;

    if (auto res = apply_env_overrides(*cfg); !res)
        return std::unexpected(res.error());
    return cfg;
}

Result<void> apply_env_overrides(EngineConfig &config) {
    if (const char *parallel = std::getenv("KILN_PARALLEL")) {
        std::string_view v(parallel);
        if (v == "0" || v == "false")
            config.parallel = false;
        else if (v == "1" || v == "true")
            config.parallel = true;
        else
            return std::unexpected(std::format("KILN_PARALLEL: expected 0 or 1, got '{}'", v));
    }
    if (const char *workers = std::getenv("KILN_MAX_WORKERS")) {
        auto n = parse_size(workers);
        if (!n)
            return std::unexpected(std::format("KILN_MAX_WORKERS: {}", n.error()));
        config.max_workers = *n;
    }
    return {};
}

Result<void> validate(const EngineConfig &config) {
    if (config.content_dir.empty() || config.templates_dir.empty())
        return std::unexpected("content_dir and templates_dir must not be empty");

    std::error_code ec;
    auto source = config.source_root();
    if (!std::filesystem::is_directory(source, ec))
        return std::unexpected(std::format("source directory {} does not exist", source.string()));

    auto output = config.output_root();
    auto content = (source / config.content_dir).lexically_normal();
    auto rel = output.lexically_relative(content);
    if (!rel.empty() && *rel.begin() != "..")
        return std::unexpected("output_dir must not live inside content_dir");

    std::set<std::string> fixed_outputs;
    for (const auto &family : config.aggregates) {
        bool expands = family.kind != AggregateKind::Sitemap && !family.key;
        bool has_placeholder = family.output.find("{key}") != std::string::npos;
        if (expands && !has_placeholder)
            return std::unexpected(
                std::format("{} aggregate without a key needs '{{key}}' in its output", to_string(family.kind)));
        if (!expands && !fixed_outputs.insert(family.output).second)
            return std::unexpected(std::format("two aggregates write {}", family.output));
    }
    return {};
}

Scheduler::Options scheduler_options(const EngineConfig &config) {
    Scheduler::Options opts;
    opts.parallel = config.parallel;
    opts.max_workers = config.max_workers;
    opts.environment = config.scheduler.environment;
    opts.overrides = config.scheduler.profiles;
    return opts;
}

} // namespace kiln
