#pragma once

#include "kiln/cache_store.hpp"
#include "kiln/config.hpp"
#include "kiln/discovery.hpp"
#include "kiln/errors.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/graph.hpp"
#include "kiln/renderer.hpp"
#include "kiln/scheduler.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class BuildMode : uint8_t { Full, Incremental };

enum class BuildState : uint8_t {
    Idle,
    Discovering,
    DiffingCache,
    PropagatingInvalidation,
    Dispatching,
    Collecting,
    RecomputingAggregates,
    Committing,
    Failed,
};

enum class RebuildReason : uint8_t {
    New,
    SourceChanged,
    DependencyChanged,
    OutputMissing,
    ConfigChanged,
    FullMode,
    CacheUnavailable,
    MembershipChanged,
};

std::string_view to_string(BuildMode mode);
std::string_view to_string(BuildState state);
std::string_view to_string(RebuildReason reason);

/// What an incremental cycle would do, computed without rendering anything.
struct BuildPlan {
    BuildMode mode = BuildMode::Incremental;
    std::optional<RebuildReason> full_rebuild_reason;
    ChangeSet changes;
    std::map<std::string, RebuildReason> dirty;
    std::vector<std::string> removed; ///< outputs whose source is gone
    size_t total_outputs = 0;
    std::vector<BuildError> errors;
};

struct BuildSummary {
    size_t rebuilt = 0;
    size_t reused = 0;
    size_t removed = 0;
    size_t passes = 0;
    size_t fragment_hits = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<RebuildReason> full_rebuild_reason;
    std::vector<BuildError> failures; ///< per-artifact discovery and render errors
    std::vector<std::string> rebuilt_outputs;

    size_t failed() const {
        return failures.size();
    }

    int exit_code() const {
        return failures.empty() ? 0 : 1;
    }
};

/**
 * @brief Runs build cycles over one build root.
 *
 * Idle → Discovering → DiffingCache → PropagatingInvalidation → Dispatching →
 * Collecting → RecomputingAggregates → Committing → Idle. Only ConfigError,
 * CacheCommitError and Cancelled end a cycle in Failed; per-artifact errors are
 * collected in the summary and the cycle carries on.
 */
class BuildOrchestrator {
public:
    BuildOrchestrator(EngineConfig config, Renderer &renderer);

    std::expected<BuildSummary, BuildError> run_cycle(BuildMode mode, std::stop_token stop = {});

    /// @brief Discovering through PropagatingInvalidation only; nothing is written.
    std::expected<BuildPlan, BuildError> plan(BuildMode mode);

    /// @brief Deletes every output recorded in the cache, then the cache itself.
    std::expected<size_t, BuildError> clean();

    BuildState state() const {
        return state_;
    }

    const DependencyGraph &graph() const {
        return graph_;
    }

    const EngineConfig &config() const {
        return config_;
    }

private:
    struct Cycle;
    struct Task;
    struct Record;

    std::expected<Cycle, BuildError> prepare(BuildMode mode, std::stop_token stop);
    void diff(Cycle &cycle);
    void propagate(Cycle &cycle);
    void remove_outputs(Cycle &cycle, BuildSummary &summary);
    void dispatch(Cycle &cycle, Phase phase, const std::vector<Task> &tasks, BuildSummary &summary,
                  std::stop_token stop);
    std::vector<Record> render_all(Cycle &cycle, Phase phase, const std::vector<Task> &tasks,
                                   const SiteSnapshot &snapshot, std::stop_token stop);
    Record render_one(const Task &task, RenderContext &context);
    void collect(Cycle &cycle, const std::vector<Task> &tasks, std::vector<Record> &records,
                 const SiteSnapshot &snapshot, BuildSummary &summary);
    void recompute_aggregates(Cycle &cycle, BuildSummary &summary, std::stop_token stop);
    bool output_deps_stale(const Cycle &cycle, const OutputArtifact &out) const;
    Result<Fingerprint> config_hash() const;
    std::unexpected<BuildError> fail(BuildError err);
    void set_state(BuildState next);

    EngineConfig config_;
    Renderer &renderer_;
    Scheduler scheduler_;
    CacheStore store_;
    FingerprintStore fingerprints_;
    DependencyGraph graph_;
    BuildState state_ = BuildState::Idle;
};

} // namespace kiln
