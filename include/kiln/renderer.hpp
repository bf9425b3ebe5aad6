#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

/**
 * @brief Read-only view of the site a render may consult.
 *
 * Built once per dispatch pass and shared by every worker; nothing in it is
 * mutated while workers run.
 */
struct SiteSnapshot {
    std::filesystem::path source_root;
    std::filesystem::path output_root;
    std::map<std::string, SourceArtifact, std::less<>> sources;
    std::map<std::string, OutputArtifact, std::less<>> outputs; ///< outputs settled before this pass

    const SourceArtifact *source(std::string_view id) const;
    const OutputArtifact *output(std::string_view id) const;
};

/**
 * @brief Cycle-scoped memo of rendered fragments (partials, shortcodes).
 *
 * The one structure workers touch concurrently, so every access goes through a
 * single mutex. Keys are chosen by the renderer and must include whatever the
 * fragment's bytes depend on.
 */
class SubRenderCache {
public:
    std::optional<std::string> find(const std::string &key);
    void store(const std::string &key, std::string fragment);

    /// @brief Returns the cached fragment or renders, stores and returns a fresh one.
    template <typename Fn>
    Result<std::string> get_or_render(const std::string &key, Fn &&render) {
        if (auto hit = find(key))
            return *hit;
        Result<std::string> fresh = render();
        if (fresh)
            store(key, *fresh);
        return fresh;
    }

    size_t hits() const;
    size_t misses() const;
    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::string> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

struct RenderRequest {
    std::string output_id;
    OutputKind kind = OutputKind::Page;
    std::string source_id; ///< empty for aggregates
    std::optional<AggregateSpec> aggregate;
    std::vector<std::string> members;
};

struct RenderContext {
    const SiteSnapshot &site;
    SubRenderCache &fragments;
};

struct RenderOutput {
    std::string bytes;
    /// Every artifact consulted. Hashes are ignored; the engine stamps them from the snapshot.
    std::vector<Dependency> dependencies;
    PageMeta meta;
};

/**
 * @brief Turns one output request into bytes.
 *
 * Called concurrently from worker threads. Implementations must report every
 * artifact they consulted; anything left out is not tracked and will not
 * trigger a rebuild when it changes.
 */
class Renderer {
public:
    virtual ~Renderer() = default;
    virtual Result<RenderOutput> render(const RenderRequest &request, RenderContext &context) = 0;
};

} // namespace kiln
