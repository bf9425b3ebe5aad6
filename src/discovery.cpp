#include "kiln/discovery.hpp"

#include "kiln/log.hpp"
#include "kiln/worker_pool.hpp"

#include <format>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include <set>
#include <system_error>

namespace kiln {

namespace {

constexpr std::string_view PARTIALS_DIR = "partials";

bool is_hidden(const std::filesystem::path &name) {
    auto s = name.filename().string();
    return !s.empty() && s.front() == '.';
}

bool under(std::string_view id, std::string_view dir) {
    return id.size() > dir.size() && id.starts_with(dir) && id[dir.size()] == '/';
}

int64_t mtime_of(const std::filesystem::path &path) {
    std::error_code ec;
    auto t = std::filesystem::last_write_time(path, ec);
    if (ec)
        return 0;
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

struct Probe {
    Result<Fingerprint> hash = std::unexpected(std::string("not probed"));
    int64_t mtime = 0;
    uint64_t size = 0;
};

} // namespace

bool is_page_source(const std::filesystem::path &path) {
    static constexpr std::string_view PAGE_EXTENSIONS[] = {".md", ".markdown", ".html", ".htm", ".rst"};
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::find(PAGE_EXTENSIONS, ext) != std::end(PAGE_EXTENSIONS);
}

std::string page_output_id(std::string_view content_relative) {
    std::filesystem::path rel(content_relative);
    auto parent = rel.parent_path();
    auto stem = rel.stem().string();
    std::filesystem::path out = (stem == "_index" || stem == "index") ? parent : parent / stem;
    return (out / "index.html").lexically_normal().generic_string();
}

std::string asset_output_id(std::string_view asset_relative) {
    return std::filesystem::path(asset_relative).lexically_normal().generic_string();
}

ChangeSet diff_sources(const SourceMap &previous, const SourceMap &current) {
    ChangeSet changes;
    for (const auto &[id, src] : current) {
        auto it = previous.find(id);
        if (it == previous.end())
            changes.added.push_back(id);
        else if (it->second.hash != src.hash)
            changes.modified.push_back(id);
    }
    for (const auto &[id, _] : previous) {
        if (!current.contains(id))
            changes.removed.push_back(id);
    }
    return changes;
}

void keep_unlisted_sources(const SourceMap &previous, const std::vector<std::string> &unlisted_dirs,
                           SourceMap &sources) {
    for (const auto &[id, src] : previous) {
        if (sources.contains(id))
            continue;
        bool hidden = std::ranges::any_of(unlisted_dirs, [&](const std::string &dir) { return under(id, dir); });
        if (hidden)
            sources.emplace(id, src);
    }
}

Discovery::Discovery(const EngineConfig &config, const Scheduler &scheduler, FingerprintStore &fingerprints)
    : config_(config), scheduler_(scheduler), fingerprints_(fingerprints) {
}

std::optional<SourceKind> Discovery::classify(std::string_view id) const {
    if (under(id, config_.content_dir))
        return SourceKind::Content;
    if (under(id, config_.templates_dir)) {
        auto rest = id.substr(config_.templates_dir.size() + 1);
        if (under(rest, PARTIALS_DIR))
            return SourceKind::Partial;
        return SourceKind::Template;
    }
    if (!config_.data_dir.empty() && under(id, config_.data_dir))
        return SourceKind::Data;
    if (!config_.assets_dir.empty() && under(id, config_.assets_dir))
        return SourceKind::Asset;
    return std::nullopt;
}

void Discovery::walk_dir(const std::filesystem::path &dir, std::vector<Candidate> &out,
                         std::vector<std::string> &unlisted, std::vector<BuildError> &errors) const {
    auto root = config_.source_root();
    auto dir_id = dir.lexically_relative(root).generic_string();
    auto unlistable = [&](const std::error_code &ec) {
        errors.push_back({ErrorKind::Discovery, dir_id, std::format("cannot list directory: {}", ec.message())});
        unlisted.push_back(dir_id);
    };

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        unlistable(ec);
        return;
    }
    for (auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        const auto &entry = *it;
        if (is_hidden(entry.path()))
            continue;

        std::error_code type_ec;
        if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
            walk_dir(entry.path(), out, unlisted, errors);
            continue;
        }
        if (!entry.is_regular_file(type_ec))
            continue;

        auto id = entry.path().lexically_relative(root).generic_string();
        if (auto kind = classify(id))
            out.push_back({entry.path(), std::move(id), *kind});
    }
    // A failed increment ends the loop as if the listing were complete.
    if (ec)
        unlistable(ec);
}

std::vector<Discovery::Candidate> Discovery::walk(std::vector<std::string> &unlisted,
                                                  std::vector<BuildError> &errors) const {
    std::vector<Candidate> found;
    std::set<std::string> seen_dirs;
    for (const auto &dir : {config_.content_dir, config_.templates_dir, config_.data_dir, config_.assets_dir}) {
        if (dir.empty() || !seen_dirs.insert(dir).second)
            continue;
        std::error_code ec;
        auto base = config_.source_root() / dir;
        if (std::filesystem::is_directory(base, ec))
            walk_dir(base, found, unlisted, errors);
    }

    if (!config_.config_file.empty()) {
        auto rel = config_.config_file.lexically_relative(config_.source_root());
        if (!rel.empty() && *rel.begin() != "..")
            found.push_back({config_.config_file, rel.generic_string(), SourceKind::Config});
    }

    std::ranges::sort(found, {}, &Candidate::id);
    auto dup = std::ranges::unique(found, {}, &Candidate::id);
    found.erase(dup.begin(), dup.end());
    return found;
}

DiscoveredSite Discovery::run(const SourceMap &previous, std::stop_token stop) {
    DiscoveredSite site;
    auto candidates = walk(site.unlisted_dirs, site.errors);

    std::vector<Probe> probes(candidates.size());
    auto decision = scheduler_.choose(Phase::Discovery, candidates.size());
    log_debug("discovery: {} files, {} worker(s)", candidates.size(), decision.workers);

    WorkerPool pool(decision.workers);
    size_t started = pool.run(
        candidates.size(),
        [&](size_t i) {
            const auto &c = candidates[i];
            Probe &p = probes[i];
            p.hash = fingerprints_.fingerprint(c.path);
            p.mtime = mtime_of(c.path);
            std::error_code ec;
            auto sz = std::filesystem::file_size(c.path, ec);
            p.size = ec ? 0 : static_cast<uint64_t>(sz);
        },
        stop);
    if (started < candidates.size())
        log_debug("discovery: stopped after {} of {} files", started, candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        auto &c = candidates[i];
        auto &p = probes[i];
        if (!p.hash) {
            site.errors.push_back({ErrorKind::Discovery, c.id, p.hash.error()});
            if (auto it = previous.find(c.id); it != previous.end())
                site.sources.emplace(c.id, it->second);
            continue;
        }
        SourceArtifact src;
        src.id = c.id;
        src.kind = c.kind;
        src.hash = std::move(*p.hash);
        src.mtime = p.mtime;
        src.size = p.size;
        site.sources.emplace(std::move(c.id), std::move(src));
    }

    keep_unlisted_sources(previous, site.unlisted_dirs, site.sources);
    plan_outputs(site);
    return site;
}

void Discovery::plan_outputs(DiscoveredSite &site) const {
    for (const auto &[id, src] : site.sources) {
        PlannedOutput out;
        if (src.kind == SourceKind::Content) {
            std::string_view rel = std::string_view(id).substr(config_.content_dir.size() + 1);
            if (!is_page_source(std::filesystem::path(rel)))
                continue;
            out.id = page_output_id(rel);
            out.kind = OutputKind::Page;
        } else if (src.kind == SourceKind::Asset) {
            out.id = asset_output_id(std::string_view(id).substr(config_.assets_dir.size() + 1));
            out.kind = OutputKind::Asset;
        } else {
            continue;
        }
        out.source = id;
        out.size = src.size;

        // Sources are visited in id order, so the first claimant keeps the output.
        if (auto it = site.outputs.find(out.id); it != site.outputs.end()) {
            site.errors.push_back(
                {ErrorKind::Discovery, id, std::format("output {} is already produced by {}", out.id, it->second.source)});
            continue;
        }
        site.outputs.emplace(out.id, std::move(out));
    }
}

} // namespace kiln
