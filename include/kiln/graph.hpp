#pragma once

#include "kiln/domain.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

/**
 * @brief Which artifacts each output was built from.
 *
 * Nodes live in an arena and are addressed by index. Every node keeps its
 * consumers (reverse edges), so invalidation is a breadth-first walk from the
 * changed artifacts toward the outputs that read them. Output nodes have
 * consumers too (a page embedding a menu), which is what lets one walk reach the
 * fixed point of transitive invalidation.
 *
 * Aggregate membership is not stored here; it is re-evaluated against the page
 * set every cycle.
 */
class DependencyGraph {
public:
    enum class NodeKind : uint8_t { Source, Output };

    struct Node {
        std::string id;
        NodeKind kind;
        std::vector<size_t> consumers;    ///< Outputs that consumed this node.
        std::vector<size_t> dependencies; ///< Nodes this output consumed (outputs only).
    };

    size_t get_or_create_node(std::string_view id, NodeKind kind);
    std::optional<size_t> find(std::string_view id, NodeKind kind) const;

    /**
     * @brief Records that `output` consulted `dep` while rendering.
     *
     * Duplicate edges are ignored.
     */
    void record_dependency(std::string_view output, const Dependency &dep);

    /// @brief Drops every edge recorded for `output`, ahead of recording a fresh render.
    void clear_dependencies(std::string_view output);

    /**
     * @brief Outputs reachable backwards from any added, modified or removed source.
     *
     * Visited-set bounded, so the cost is O(edges) even when aggregates and pages
     * reference each other in a cycle.
     */
    std::set<std::string> invalidated_by(const ChangeSet &changes) const;
    std::set<std::string> invalidated_by(const std::vector<std::string> &changed_sources) const;

    /// @brief Closure of `dirty` under "consumes a dirty output". Includes the seeds.
    std::set<std::string> propagate(const std::set<std::string> &dirty) const;

    /// @brief Outputs that recorded `output` as a dependency.
    std::vector<std::string> consumers_of_output(std::string_view output) const;

    /**
     * @brief Dependencies before consumers. Nodes on a cycle cannot be ordered and
     * are appended at the end in index order.
     */
    std::vector<size_t> topo_order() const;
    bool has_cycle() const;

    /// @brief Graphviz rendering, outputs in `dirty` highlighted.
    void emit_dot(std::ostream &out, const std::set<std::string> &dirty) const;

    const std::vector<Node> &nodes() const {
        return nodes_;
    }

    size_t edge_count() const {
        return edge_count_;
    }

    void clear();

private:
    static std::string key(std::string_view id, NodeKind kind);
    std::vector<bool> walk(std::vector<size_t> seeds) const;
    std::vector<size_t> kahn_order() const;

    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    size_t edge_count_ = 0;
};

} // namespace kiln
