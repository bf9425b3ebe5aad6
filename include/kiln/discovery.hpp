#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/errors.hpp"
#include "kiln/fingerprint.hpp"
#include "kiln/scheduler.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

using SourceMap = std::map<std::string, SourceArtifact, std::less<>>;

/// An output implied by a source: one page per content file, one copy per asset.
struct PlannedOutput {
    std::string id;
    OutputKind kind = OutputKind::Page;
    std::string source;
    uint64_t size = 0; ///< source size, for dispatch weighting
};

struct DiscoveredSite {
    SourceMap sources;
    std::map<std::string, PlannedOutput, std::less<>> outputs;
    std::vector<BuildError> errors;
    std::vector<std::string> unlisted_dirs; ///< directories that could not be listed, relative to the source root
};

bool is_page_source(const std::filesystem::path &path);

/**
 * @brief Output id of a page, from its path relative to the content directory.
 *
 * `a/b.md` → `a/b/index.html`; `a/_index.md` and `a/index.md` → `a/index.html`.
 */
std::string page_output_id(std::string_view content_relative);

std::string asset_output_id(std::string_view asset_relative);

/// @brief Sources added, modified (hash differs) or removed relative to `previous`.
ChangeSet diff_sources(const SourceMap &previous, const SourceMap &current);

/**
 * @brief Copies into `sources` every previous record under a directory that
 * could not be listed, so its files count as unreadable rather than removed.
 */
void keep_unlisted_sources(const SourceMap &previous, const std::vector<std::string> &unlisted_dirs,
                           SourceMap &sources);

/**
 * @brief Walks the configured directories and fingerprints every source.
 *
 * Fingerprinting runs on the Discovery profile. A source that cannot be read is
 * reported as a DiscoveryError and keeps the artifact recorded in `previous`,
 * so its outputs are neither rebuilt nor deleted; without a previous record it
 * is skipped.
 */
class Discovery {
public:
    Discovery(const EngineConfig &config, const Scheduler &scheduler, FingerprintStore &fingerprints);

    DiscoveredSite run(const SourceMap &previous, std::stop_token stop = {});

private:
    struct Candidate {
        std::filesystem::path path;
        std::string id;
        SourceKind kind;
    };

    std::vector<Candidate> walk(std::vector<std::string> &unlisted, std::vector<BuildError> &errors) const;
    void walk_dir(const std::filesystem::path &dir, std::vector<Candidate> &out, std::vector<std::string> &unlisted,
                  std::vector<BuildError> &errors) const;
    std::optional<SourceKind> classify(std::string_view id) const;
    void plan_outputs(DiscoveredSite &site) const;

    const EngineConfig &config_;
    const Scheduler &scheduler_;
    FingerprintStore &fingerprints_;
};

} // namespace kiln
