#include "kiln/orchestrator.hpp"

#include "kiln/aggregate.hpp"
#include "kiln/atomic_file.hpp"
#include "kiln/log.hpp"
#include "kiln/worker_pool.hpp"

#include <format>
#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <system_error>
#include <utility>

namespace kiln {

std::string_view to_string(BuildMode mode) {
    return mode == BuildMode::Full ? "full" : "incremental";
}

std::string_view to_string(BuildState state) {
    switch (state) {
    case BuildState::Idle:
        return "Idle";
    case BuildState::Discovering:
        return "Discovering";
    case BuildState::DiffingCache:
        return "DiffingCache";
    case BuildState::PropagatingInvalidation:
        return "PropagatingInvalidation";
    case BuildState::Dispatching:
        return "Dispatching";
    case BuildState::Collecting:
        return "Collecting";
    case BuildState::RecomputingAggregates:
        return "RecomputingAggregates";
    case BuildState::Committing:
        return "Committing";
    case BuildState::Failed:
        return "Failed";
    }
    return "Unknown";
}

std::string_view to_string(RebuildReason reason) {
    switch (reason) {
    case RebuildReason::New:
        return "new";
    case RebuildReason::SourceChanged:
        return "source changed";
    case RebuildReason::DependencyChanged:
        return "dependency changed";
    case RebuildReason::OutputMissing:
        return "output missing";
    case RebuildReason::ConfigChanged:
        return "config changed";
    case RebuildReason::FullMode:
        return "full build requested";
    case RebuildReason::CacheUnavailable:
        return "cache unavailable";
    case RebuildReason::MembershipChanged:
        return "membership changed";
    }
    return "unknown";
}

struct BuildOrchestrator::Cycle {
    BuildMode mode = BuildMode::Incremental;
    Cache previous;
    bool cache_available = true;
    Fingerprint config_hash;
    DiscoveredSite site;
    ChangeSet changes;
    std::optional<RebuildReason> full_reason;
    std::map<std::string, RebuildReason> dirty;
    std::vector<std::string> removed;

    Cache next;
    std::unique_ptr<SubRenderCache> fragments = std::make_unique<SubRenderCache>();
    std::set<std::string> rebuilt;
    std::set<std::string> failed;
    std::set<std::string> collided; // aggregate outputs already claimed by a page or asset

    // Dispatch pass counter; lets an aggregate tell whether a member's metadata
    // changed after the aggregate was last rendered this cycle.
    size_t epoch = 0;
    std::map<std::string, size_t, std::less<>> meta_epoch;
    std::map<std::string, size_t, std::less<>> render_epoch;
};

struct BuildOrchestrator::Task {
    std::string id;
    OutputKind kind = OutputKind::Page;
    std::string source;
    std::optional<AggregateSpec> aggregate;
    std::vector<std::string> members;
    uint64_t size = 0;
    RebuildReason reason = RebuildReason::New;
};

struct BuildOrchestrator::Record {
    bool attempted = false;
    bool ok = false;
    bool written = false;
    std::string error;
    RenderOutput output;
    Fingerprint hash;
};

namespace {

Fingerprint current_hash(const Dependency &dep, const SourceMap &sources,
                         const std::map<std::string, OutputArtifact, std::less<>> &outputs) {
    if (dep.kind == DependencyKind::Source) {
        if (auto it = sources.find(dep.id); it != sources.end())
            return it->second.hash;
        return {};
    }
    if (auto it = outputs.find(dep.id); it != outputs.end())
        return it->second.hash;
    return {};
}

bool file_exists(const std::filesystem::path &path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

void prune_empty_parents(std::filesystem::path dir, const std::filesystem::path &root) {
    std::error_code ec;
    while (!dir.empty()) {
        auto rel = dir.lexically_relative(root);
        if (rel.empty() || rel == "." || *rel.begin() == "..")
            return;
        if (!std::filesystem::is_empty(dir, ec) || ec)
            return;
        std::filesystem::remove(dir, ec);
        if (ec)
            return;
        dir = dir.parent_path();
    }
}

bool remove_output_file(const std::filesystem::path &root, std::string_view id) {
    auto path = root / id;
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        log_warn("Failed to remove {}: {}", path.string(), ec.message());
        return false;
    }
    prune_empty_parents(path.parent_path(), root);
    return removed;
}

} // namespace

BuildOrchestrator::BuildOrchestrator(EngineConfig config, Renderer &renderer)
    : config_(std::move(config)), renderer_(renderer), scheduler_(scheduler_options(config_)),
      store_(config_.cache_path(), CacheOptions{config_.cache.compress, config_.cache.max_decompress_fraction}) {
}

void BuildOrchestrator::set_state(BuildState next) {
    if (next != state_)
        log_debug("state: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

std::unexpected<BuildError> BuildOrchestrator::fail(BuildError err) {
    set_state(BuildState::Failed);
    log_error("{}", describe(err));
    return std::unexpected(std::move(err));
}

Result<Fingerprint> BuildOrchestrator::config_hash() const {
    if (!config_.config_file.empty())
        return fingerprint_file(config_.config_file);
    return fingerprint_bytes(config_.rendering_identity());
}

std::expected<BuildOrchestrator::Cycle, BuildError> BuildOrchestrator::prepare(BuildMode mode,
                                                                             std::stop_token stop) {
    set_state(BuildState::Discovering);
    if (auto res = validate(config_); !res)
        return fail({ErrorKind::Config, config_.config_file.string(), res.error()});

    Cycle cycle;
    cycle.mode = mode;
    fingerprints_.clear();
    graph_.clear();

    if (auto res = store_.load(); !res) {
        log_warn("{}: rebuilding everything", describe({ErrorKind::CacheLoad, "", res.error()}));
        cycle.cache_available = false;
    }
    if (mode == BuildMode::Full)
        store_.discard();
    cycle.previous = store_.cache();

    auto hash = config_hash();
    if (!hash)
        return fail({ErrorKind::Config, config_.config_file.string(), hash.error()});
    cycle.config_hash = std::move(*hash);

    Discovery discovery(config_, scheduler_, fingerprints_);
    cycle.site = discovery.run(cycle.previous.sources, stop);
    if (stop.stop_requested())
        return fail({ErrorKind::Cancelled, "", "interrupted during discovery"});
    for (const auto &err : cycle.site.errors)
        log_warn("{}", describe(err));

    cycle.changes = diff_sources(cycle.previous.sources, cycle.site.sources);
    cycle.changes.config_changed = !cycle.previous.empty() && cycle.previous.config_hash != cycle.config_hash;
    log_debug("changes: {} added, {} modified, {} removed{}",
              cycle.changes.added.size(),
              cycle.changes.modified.size(),
              cycle.changes.removed.size(),
              cycle.changes.config_changed ? ", config changed" : "");

    set_state(BuildState::DiffingCache);
    diff(cycle);

    set_state(BuildState::PropagatingInvalidation);
    propagate(cycle);
    return cycle;
}

void BuildOrchestrator::diff(Cycle &cycle) {
    const Cache &prev = cycle.previous;

    if (cycle.mode == BuildMode::Full)
        cycle.full_reason = RebuildReason::FullMode;
    else if (!cycle.cache_available)
        cycle.full_reason = RebuildReason::CacheUnavailable;
    else if (cycle.changes.config_changed)
        cycle.full_reason = RebuildReason::ConfigChanged;
    else if (!prev.outputs.empty() && !std::filesystem::is_directory(config_.output_root()))
        cycle.full_reason = RebuildReason::OutputMissing;

    for (const auto &[id, out] : prev.outputs) {
        if (out.kind != OutputKind::Aggregate && !cycle.site.outputs.contains(id))
            cycle.removed.push_back(id);
    }

    if (cycle.full_reason) {
        for (const auto &[id, _] : cycle.site.outputs)
            cycle.dirty.emplace(id, *cycle.full_reason);
        for (const auto &[id, out] : prev.outputs) {
            if (out.kind == OutputKind::Aggregate)
                cycle.dirty.emplace(id, *cycle.full_reason);
        }
        return;
    }

    for (const auto &[id, out] : prev.outputs) {
        graph_.get_or_create_node(id, DependencyGraph::NodeKind::Output);
        for (const auto &dep : out.dependencies)
            graph_.record_dependency(id, dep);
    }

    std::set<std::string> changed_sources;
    changed_sources.insert(cycle.changes.added.begin(), cycle.changes.added.end());
    changed_sources.insert(cycle.changes.modified.begin(), cycle.changes.modified.end());
    changed_sources.insert(cycle.changes.removed.begin(), cycle.changes.removed.end());

    for (const auto &id : graph_.invalidated_by(cycle.changes)) {
        const auto *out = prev.find_output(id);
        bool own_source = out && changed_sources.contains(out->source);
        cycle.dirty.emplace(id, own_source ? RebuildReason::SourceChanged : RebuildReason::DependencyChanged);
    }

    auto check = [&](const std::string &id, const OutputArtifact *out) -> std::optional<RebuildReason> {
        if (!out)
            return RebuildReason::New;
        for (const auto &dep : out->dependencies) {
            if (current_hash(dep, cycle.site.sources, prev.outputs) != dep.hash)
                return dep.id == out->source ? RebuildReason::SourceChanged : RebuildReason::DependencyChanged;
        }
        if (!file_exists(config_.output_root() / id))
            return RebuildReason::OutputMissing;
        return std::nullopt;
    };

    for (const auto &[id, planned] : cycle.site.outputs) {
        if (cycle.dirty.contains(id))
            continue;
        const auto *out = prev.find_output(id);
        if (out && (out->kind != planned.kind || out->source != planned.source)) {
            cycle.dirty.emplace(id, RebuildReason::SourceChanged);
            continue;
        }
        if (auto reason = check(id, out))
            cycle.dirty.emplace(id, *reason);
    }
    for (const auto &[id, out] : prev.outputs) {
        if (out.kind != OutputKind::Aggregate || cycle.dirty.contains(id))
            continue;
        if (auto reason = check(id, &out))
            cycle.dirty.emplace(id, *reason);
    }
}

void BuildOrchestrator::propagate(Cycle &cycle) {
    std::set<std::string> seeds;
    for (const auto &[id, _] : cycle.dirty)
        seeds.insert(id);
    seeds.insert(cycle.removed.begin(), cycle.removed.end());

    std::set<std::string> removed(cycle.removed.begin(), cycle.removed.end());
    for (const auto &id : graph_.propagate(seeds)) {
        if (!removed.contains(id))
            cycle.dirty.emplace(id, RebuildReason::DependencyChanged);
    }
    for (const auto &id : removed)
        cycle.dirty.erase(id);
}

void BuildOrchestrator::remove_outputs(Cycle &cycle, BuildSummary &summary) {
    for (const auto &id : cycle.removed) {
        if (remove_output_file(config_.output_root(), id))
            log_info("Removed {}", id);
        graph_.clear_dependencies(id);
        ++summary.removed;
    }
}

BuildOrchestrator::Record BuildOrchestrator::render_one(const Task &task, RenderContext &context) {
    Record rec;
    rec.attempted = true;

    Result<RenderOutput> out = std::unexpected(std::string("not rendered"));
    if (task.kind == OutputKind::Asset) {
        auto bytes = read_file(context.site.source_root / task.source);
        if (bytes)
            out = RenderOutput{std::move(*bytes), {}, {}};
        else
            out = std::unexpected(bytes.error());
    } else {
        RenderRequest request{task.id, task.kind, task.source, task.aggregate, task.members};
        try {
            out = renderer_.render(request, context);
        } catch (const std::exception &e) {
            out = std::unexpected(std::format("renderer threw: {}", e.what()));
        }
    }
    if (!out) {
        rec.error = out.error();
        return rec;
    }

    rec.hash = fingerprint_bytes(out->bytes);
    if (config_.memory_optimized) {
        const auto *prev = context.site.output(task.id);
        auto path = config_.output_root() / task.id;
        if (!prev || prev->hash != rec.hash || !file_exists(path)) {
            if (auto res = write_file_atomic(path, out->bytes, false); !res) {
                rec.error = res.error();
                return rec;
            }
        }
        rec.written = true;
        out->bytes = std::string();
    }
    rec.output = std::move(*out);
    rec.ok = true;
    return rec;
}

std::vector<BuildOrchestrator::Record> BuildOrchestrator::render_all(Cycle &cycle, Phase phase,
                                                                     const std::vector<Task> &tasks,
                                                                     const SiteSnapshot &snapshot,
                                                                     std::stop_token stop) {
    std::vector<double> weights;
    weights.reserve(tasks.size());
    for (const auto &t : tasks)
        weights.push_back(task_weight(t.size));
    auto order = order_by_weight(weights);

    auto decision = scheduler_.choose(phase, tasks.size());
    log_debug("{}: {} task(s) on {} worker(s)", to_string(phase), tasks.size(), decision.workers);

    std::vector<Record> records(tasks.size());
    std::atomic<size_t> started = 0;
    RenderContext context{snapshot, *cycle.fragments};

    WorkerPool pool(decision.workers);
    pool.run(
        order,
        [&](size_t i) {
            const auto &task = tasks[i];
            size_t n = started.fetch_add(1) + 1;
            if (!config_.fast)
                log_info("[{}/{}] {} -> {}", n, tasks.size(), to_string(task.kind), task.id);
            log_debug("{}: {}", task.id, to_string(task.reason));
            records[i] = render_one(task, context);
        },
        stop);
    return records;
}

void BuildOrchestrator::collect(Cycle &cycle, const std::vector<Task> &tasks, std::vector<Record> &records,
                                const SiteSnapshot &snapshot, BuildSummary &summary) {
    auto record_failure = [&](const Task &task, std::string message) {
        log_error("Build failed: {} -> {}: {}", to_string(task.kind), task.id, message);
        summary.failures.push_back({ErrorKind::Render, task.id, std::move(message)});
        cycle.failed.insert(task.id);
        cycle.next.outputs.erase(task.id);
    };

    for (size_t i = 0; i < tasks.size(); ++i) {
        const Task &task = tasks[i];
        Record &rec = records[i];
        if (!rec.attempted)
            continue;
        if (!rec.ok) {
            record_failure(task, std::move(rec.error));
            continue;
        }

        const OutputArtifact *prev = cycle.next.find_output(task.id);
        bool meta_changed = !prev || prev->meta != rec.output.meta;
        if (!rec.written) {
            auto path = config_.output_root() / task.id;
            if (!prev || prev->hash != rec.hash || !file_exists(path)) {
                if (auto res = write_file_atomic(path, rec.output.bytes, false); !res) {
                    record_failure(task, res.error());
                    continue;
                }
            }
        }

        OutputArtifact art;
        art.id = task.id;
        art.kind = task.kind;
        art.source = task.source;
        art.hash = std::move(rec.hash);
        if (task.kind == OutputKind::Page)
            art.meta = std::move(rec.output.meta);
        if (task.aggregate) {
            art.aggregate = task.aggregate;
            art.members = task.members;
        }

        std::set<std::pair<DependencyKind, std::string>> seen;
        auto stamp = [&](DependencyKind kind, const std::string &id) {
            if (!seen.emplace(kind, id).second)
                return;
            Fingerprint hash;
            if (kind == DependencyKind::Source) {
                if (const auto *src = snapshot.source(id))
                    hash = src->hash;
            } else if (const auto *out = snapshot.output(id)) {
                hash = out->hash;
            }
            art.dependencies.push_back({kind, id, std::move(hash)});
        };
        // The primary source always leads, whether or not the renderer reported it.
        if (!task.source.empty())
            stamp(DependencyKind::Source, task.source);
        for (const auto &dep : rec.output.dependencies) {
            if (dep.kind == DependencyKind::Output) {
                // Membership is tracked structurally; an aggregate never depends on its own members.
                if (dep.id == task.id || std::ranges::binary_search(task.members, dep.id))
                    continue;
            }
            stamp(dep.kind, dep.id);
        }

        graph_.clear_dependencies(task.id);
        for (const auto &dep : art.dependencies)
            graph_.record_dependency(task.id, dep);

        if (task.kind == OutputKind::Page && meta_changed)
            cycle.meta_epoch[task.id] = cycle.epoch;
        if (task.kind == OutputKind::Aggregate)
            cycle.render_epoch[task.id] = cycle.epoch;

        cycle.next.outputs.insert_or_assign(task.id, std::move(art));
        cycle.rebuilt.insert(task.id);
    }
}

void BuildOrchestrator::dispatch(Cycle &cycle, Phase phase, const std::vector<Task> &tasks, BuildSummary &summary,
                                 std::stop_token stop) {
    if (tasks.empty())
        return;
    ++summary.passes;
    ++cycle.epoch;

    set_state(BuildState::Dispatching);
    SiteSnapshot snapshot{config_.source_root(), config_.output_root(), cycle.site.sources, cycle.next.outputs};
    // A failed output is served from its previous file, so later renders see its previous record.
    for (const auto &id : cycle.failed) {
        if (const auto *prev = cycle.previous.find_output(id))
            snapshot.outputs.emplace(id, *prev);
    }
    auto records = render_all(cycle, phase, tasks, snapshot, stop);

    set_state(BuildState::Collecting);
    collect(cycle, tasks, records, snapshot, summary);
}

bool BuildOrchestrator::output_deps_stale(const Cycle &cycle, const OutputArtifact &out) const {
    return std::ranges::any_of(out.dependencies, [&](const Dependency &dep) {
        if (dep.kind != DependencyKind::Output)
            return false;
        Fingerprint current = current_hash(dep, cycle.site.sources, cycle.next.outputs);
        if (current.empty() && cycle.failed.contains(dep.id)) {
            if (const auto *prev = cycle.previous.find_output(dep.id))
                current = prev->hash;
        }
        return current != dep.hash;
    });
}

void BuildOrchestrator::recompute_aggregates(Cycle &cycle, BuildSummary &summary, std::stop_token stop) {
    const size_t cap = config_.render.aggregate_pass_cap;

    for (size_t pass = 1;; ++pass) {
        if (stop.stop_requested())
            return;
        set_state(BuildState::RecomputingAggregates);

        PageIndex pages;
        for (const auto &[id, out] : cycle.next.outputs) {
            if (out.kind == OutputKind::Page)
                pages.emplace(id, out.meta);
        }
        // Failed pages keep their aggregate memberships from the previous cycle.
        for (const auto &id : cycle.failed) {
            const auto *prev = cycle.previous.find_output(id);
            if (prev && prev->kind == OutputKind::Page)
                pages.emplace(id, prev->meta);
        }
        auto instances = evaluate_aggregates(config_.aggregates, pages);

        std::erase_if(instances, [&](const AggregateInstance &inst) {
            auto planned = cycle.site.outputs.find(inst.output);
            if (planned == cycle.site.outputs.end())
                return false;
            if (cycle.collided.insert(inst.output).second) {
                BuildError err{ErrorKind::Discovery,
                               inst.output,
                               std::format("{} aggregate '{}' collides with the output of {}",
                                           to_string(inst.spec.kind),
                                           inst.spec.key,
                                           planned->second.source)};
                log_warn("{}", describe(err));
                summary.failures.push_back(std::move(err));
            }
            return true;
        });

        std::set<std::string> expected;
        for (const auto &inst : instances)
            expected.insert(inst.output);

        std::vector<std::string> vanished;
        for (const auto &[id, out] : cycle.next.outputs) {
            if (out.kind == OutputKind::Aggregate && !expected.contains(id))
                vanished.push_back(id);
        }
        for (const auto &id : vanished) {
            if (remove_output_file(config_.output_root(), id))
                log_info("Removed {}", id);
            cycle.next.outputs.erase(id);
            graph_.clear_dependencies(id);
            ++summary.removed;
        }

        std::vector<Task> tasks;
        for (const auto &inst : instances) {
            if (cycle.failed.contains(inst.output))
                continue;
            const auto *cur = cycle.next.find_output(inst.output);
            std::optional<RebuildReason> reason;
            if (!cur) {
                reason = RebuildReason::New;
            } else if (auto it = cycle.dirty.find(inst.output); pass == 1 && it != cycle.dirty.end()) {
                reason = it->second;
            } else if (cur->members != inst.members || cur->aggregate != inst.spec) {
                reason = RebuildReason::MembershipChanged;
            } else {
                size_t last = 0;
                if (auto it = cycle.render_epoch.find(inst.output); it != cycle.render_epoch.end())
                    last = it->second;
                bool member_meta_changed = std::ranges::any_of(inst.members, [&](const std::string &m) {
                    auto me = cycle.meta_epoch.find(m);
                    return me != cycle.meta_epoch.end() && me->second > last;
                });
                if (member_meta_changed)
                    reason = RebuildReason::MembershipChanged;
                else if (output_deps_stale(cycle, *cur))
                    reason = RebuildReason::DependencyChanged;
            }
            if (reason)
                tasks.push_back({inst.output, OutputKind::Aggregate, {}, inst.spec, inst.members, 0, *reason});
        }

        for (const auto &[id, out] : cycle.next.outputs) {
            if (out.kind == OutputKind::Aggregate || cycle.failed.contains(id) || !output_deps_stale(cycle, out))
                continue;
            auto planned = cycle.site.outputs.find(id);
            if (planned == cycle.site.outputs.end())
                continue;
            tasks.push_back({id, planned->second.kind, planned->second.source, std::nullopt, {}, planned->second.size,
                             RebuildReason::DependencyChanged});
        }

        if (tasks.empty())
            return;
        if (pass > cap) {
            log_warn("aggregates did not settle after {} passes; {} output(s) left for the next build", cap,
                     tasks.size());
            for (const auto &t : tasks) {
                log_warn("  {}", t.id);
                cycle.next.outputs.erase(t.id);
            }
            return;
        }
        dispatch(cycle, Phase::PostProcessing, tasks, summary, stop);
    }
}

std::expected<BuildSummary, BuildError> BuildOrchestrator::run_cycle(BuildMode mode, std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    log_debug("cycle: {} build of {}", to_string(mode), config_.source_root().string());

    auto prepared = prepare(mode, stop);
    if (!prepared)
        return std::unexpected(prepared.error());
    Cycle &cycle = *prepared;

    BuildSummary summary;
    summary.full_rebuild_reason = cycle.full_reason;
    summary.failures = cycle.site.errors;
    if (cycle.full_reason)
        log_info("Rebuilding everything: {}", to_string(*cycle.full_reason));

    remove_outputs(cycle, summary);

    cycle.next.config_hash = cycle.config_hash;
    cycle.next.sources = cycle.site.sources;
    std::set<std::string> removed(cycle.removed.begin(), cycle.removed.end());
    for (const auto &[id, out] : cycle.previous.outputs) {
        if (!removed.contains(id))
            cycle.next.outputs.emplace(id, out);
    }

    std::vector<Task> tasks;
    for (const auto &[id, planned] : cycle.site.outputs) {
        auto it = cycle.dirty.find(id);
        if (it == cycle.dirty.end())
            continue;
        tasks.push_back({id, planned.kind, planned.source, std::nullopt, {}, planned.size, it->second});
    }
    dispatch(cycle, Phase::Rendering, tasks, summary, stop);
    if (stop.stop_requested())
        return fail({ErrorKind::Cancelled, "", "interrupted; cache not written"});

    recompute_aggregates(cycle, summary, stop);
    if (stop.stop_requested())
        return fail({ErrorKind::Cancelled, "", "interrupted; cache not written"});

    set_state(BuildState::Committing);
    auto elapsed = std::chrono::steady_clock::now() - start;
    cycle.next.last_build_seconds = std::chrono::duration<double>(elapsed).count();
    if (auto res = store_.commit(cycle.next); !res)
        return fail({ErrorKind::CacheCommit, store_.path().string(), res.error()});

    summary.rebuilt = cycle.rebuilt.size();
    summary.rebuilt_outputs.assign(cycle.rebuilt.begin(), cycle.rebuilt.end());
    for (const auto &[id, _] : cycle.next.outputs) {
        if (!cycle.rebuilt.contains(id))
            ++summary.reused;
    }
    summary.fragment_hits = cycle.fragments->hits();
    summary.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    set_state(BuildState::Idle);
    return summary;
}

std::expected<BuildPlan, BuildError> BuildOrchestrator::plan(BuildMode mode) {
    auto prepared = prepare(mode, {});
    if (!prepared)
        return std::unexpected(prepared.error());
    Cycle &cycle = *prepared;

    BuildPlan plan;
    plan.mode = mode;
    plan.full_rebuild_reason = cycle.full_reason;
    plan.changes = std::move(cycle.changes);
    plan.dirty = std::move(cycle.dirty);
    plan.removed = std::move(cycle.removed);
    plan.total_outputs = cycle.site.outputs.size();
    for (const auto &[_, out] : cycle.previous.outputs) {
        if (out.kind == OutputKind::Aggregate)
            ++plan.total_outputs;
    }
    plan.errors = std::move(cycle.site.errors);

    set_state(BuildState::Idle);
    return plan;
}

std::expected<size_t, BuildError> BuildOrchestrator::clean() {
    if (auto res = store_.load(); !res)
        log_warn("{}", describe({ErrorKind::CacheLoad, "", res.error()}));

    log_info("Cleaning build artifacts...");
    size_t removed = 0;
    for (const auto &[id, _] : store_.cache().outputs) {
        if (remove_output_file(config_.output_root(), id)) {
            log_info("Removed {}", id);
            ++removed;
        }
    }

    std::error_code ec;
    std::filesystem::remove_all(config_.scratch_dir(), ec);
    if (ec)
        log_warn("Failed to remove {}: {}", config_.scratch_dir().string(), ec.message());

    if (auto res = store_.remove(); !res)
        return std::unexpected(BuildError{ErrorKind::CacheCommit, store_.path().string(), res.error()});
    fingerprints_.clear();
    graph_.clear();
    return removed;
}

} // namespace kiln
