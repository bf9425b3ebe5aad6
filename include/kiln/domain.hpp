#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/// Lowercase hex SHA-256. Empty means "probed but absent".
using Fingerprint = std::string;

enum class SourceKind : uint8_t { Content, Template, Partial, Data, Config, Asset };

struct SourceArtifact {
    std::string id; // path relative to the source root, '/' separated
    SourceKind kind = SourceKind::Content;
    Fingerprint hash;
    int64_t mtime = 0; // advisory only, never used for change detection
    uint64_t size = 0;
};

enum class OutputKind : uint8_t { Page, Aggregate, Asset };

enum class DependencyKind : uint8_t { Source, Output };

struct Dependency {
    DependencyKind kind = DependencyKind::Source;
    std::string id;
    Fingerprint hash;

    bool operator==(const Dependency &) const = default;
};

/// Page facts reported by the renderer; aggregate predicates are evaluated over these.
struct PageMeta {
    std::string title;
    std::string section;
    std::vector<std::string> tags;
    std::vector<std::string> menus;
    bool draft = false;

    bool operator==(const PageMeta &) const = default;
};

enum class AggregateKind : uint8_t { Tag, Section, Menu, Sitemap };

struct AggregateSpec {
    AggregateKind kind = AggregateKind::Sitemap;
    std::string key;

    bool operator==(const AggregateSpec &) const = default;
};

struct OutputArtifact {
    std::string id; // path relative to the output directory
    OutputKind kind = OutputKind::Page;
    std::string source; // primary source; empty for aggregates
    Fingerprint hash;   // rendered content hash
    std::vector<Dependency> dependencies;
    PageMeta meta;
    std::optional<AggregateSpec> aggregate;
    std::vector<std::string> members; // sorted member output ids (aggregates only)
};

struct ChangeSet {
    std::vector<std::string> added;
    std::vector<std::string> modified;
    std::vector<std::string> removed;
    bool config_changed = false;

    bool empty() const {
        return added.empty() && modified.empty() && removed.empty() && !config_changed;
    }

    size_t size() const {
        return added.size() + modified.size() + removed.size();
    }
};

std::string_view to_string(SourceKind kind);
std::string_view to_string(OutputKind kind);
std::string_view to_string(AggregateKind kind);

std::optional<SourceKind> parse_source_kind(std::string_view name);
std::optional<OutputKind> parse_output_kind(std::string_view name);
std::optional<AggregateKind> parse_aggregate_kind(std::string_view name);

} // namespace kiln
