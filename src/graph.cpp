#include "kiln/graph.hpp"

#include <algorithm>
#include <deque>
#include <ostream>

namespace kiln {

std::string DependencyGraph::key(std::string_view id, NodeKind kind) {
    std::string k;
    k.reserve(id.size() + 2);
    k += kind == NodeKind::Source ? "s:" : "o:";
    k += id;
    return k;
}

size_t DependencyGraph::get_or_create_node(std::string_view id, NodeKind kind) {
    std::string k = key(id, kind);
    if (auto it = index_.find(k); it != index_.end()) {
        return it->second;
    }

    size_t idx = nodes_.size();
    nodes_.push_back({std::string(id), kind, {}, {}});
    index_.emplace(std::move(k), idx);
    return idx;
}

std::optional<size_t> DependencyGraph::find(std::string_view id, NodeKind kind) const {
    if (auto it = index_.find(key(id, kind)); it != index_.end())
        return it->second;
    return std::nullopt;
}

void DependencyGraph::record_dependency(std::string_view output, const Dependency &dep) {
    size_t out_id = get_or_create_node(output, NodeKind::Output);
    size_t dep_id =
        get_or_create_node(dep.id, dep.kind == DependencyKind::Source ? NodeKind::Source : NodeKind::Output);

    auto &deps = nodes_[out_id].dependencies;
    if (std::find(deps.begin(), deps.end(), dep_id) != deps.end())
        return;
    deps.push_back(dep_id);
    nodes_[dep_id].consumers.push_back(out_id);
    ++edge_count_;
}

void DependencyGraph::clear_dependencies(std::string_view output) {
    auto out_id = find(output, NodeKind::Output);
    if (!out_id)
        return;

    for (size_t dep_id : nodes_[*out_id].dependencies) {
        auto &consumers = nodes_[dep_id].consumers;
        std::erase(consumers, *out_id);
    }
    edge_count_ -= nodes_[*out_id].dependencies.size();
    nodes_[*out_id].dependencies.clear();
}

std::vector<bool> DependencyGraph::walk(std::vector<size_t> seeds) const {
    std::vector<bool> visited(nodes_.size(), false);
    std::deque<size_t> queue;
    for (size_t s : seeds) {
        if (!visited[s]) {
            visited[s] = true;
            queue.push_back(s);
        }
    }

    while (!queue.empty()) {
        size_t u = queue.front();
        queue.pop_front();
        for (size_t c : nodes_[u].consumers) {
            if (!visited[c]) {
                visited[c] = true;
                queue.push_back(c);
            }
        }
    }
    return visited;
}

std::set<std::string> DependencyGraph::invalidated_by(const ChangeSet &changes) const {
    std::vector<std::string> changed;
    changed.reserve(changes.size());
    changed.insert(changed.end(), changes.added.begin(), changes.added.end());
    changed.insert(changed.end(), changes.modified.begin(), changes.modified.end());
    changed.insert(changed.end(), changes.removed.begin(), changes.removed.end());
    return invalidated_by(changed);
}

std::set<std::string> DependencyGraph::invalidated_by(const std::vector<std::string> &changed_sources) const {
    std::vector<size_t> seeds;
    for (const auto &id : changed_sources) {
        if (auto idx = find(id, NodeKind::Source))
            seeds.push_back(*idx);
    }

    std::set<std::string> out;
    if (seeds.empty())
        return out;

    auto visited = walk(std::move(seeds));
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (visited[i] && nodes_[i].kind == NodeKind::Output)
            out.insert(nodes_[i].id);
    }
    return out;
}

std::set<std::string> DependencyGraph::propagate(const std::set<std::string> &dirty) const {
    std::set<std::string> out = dirty;
    std::vector<size_t> seeds;
    for (const auto &id : dirty) {
        if (auto idx = find(id, NodeKind::Output))
            seeds.push_back(*idx);
    }
    if (seeds.empty())
        return out;

    auto visited = walk(std::move(seeds));
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (visited[i] && nodes_[i].kind == NodeKind::Output)
            out.insert(nodes_[i].id);
    }
    return out;
}

std::vector<std::string> DependencyGraph::consumers_of_output(std::string_view output) const {
    std::vector<std::string> out;
    if (auto idx = find(output, NodeKind::Output)) {
        for (size_t c : nodes_[*idx].consumers)
            out.push_back(nodes_[c].id);
    }
    return out;
}

std::vector<size_t> DependencyGraph::kahn_order() const {
    std::vector<size_t> in_degrees(nodes_.size(), 0);
    for (const auto &node : nodes_) {
        for (size_t c : node.consumers)
            in_degrees[c]++;
    }

    std::deque<size_t> ready;
    for (size_t i = 0; i < in_degrees.size(); ++i) {
        if (in_degrees[i] == 0)
            ready.push_back(i);
    }

    std::vector<size_t> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        size_t u = ready.front();
        ready.pop_front();
        order.push_back(u);
        for (size_t c : nodes_[u].consumers) {
            if (--in_degrees[c] == 0)
                ready.push_back(c);
        }
    }
    return order;
}

std::vector<size_t> DependencyGraph::topo_order() const {
    std::vector<size_t> order = kahn_order();
    if (order.size() != nodes_.size()) {
        std::vector<bool> placed(nodes_.size(), false);
        for (size_t i : order)
            placed[i] = true;
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (!placed[i])
                order.push_back(i);
        }
    }
    return order;
}

bool DependencyGraph::has_cycle() const {
    return kahn_order().size() != nodes_.size();
}

void DependencyGraph::emit_dot(std::ostream &out, const std::set<std::string> &dirty) const {
    out << "digraph kiln_build {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i : topo_order()) {
        const auto &node = nodes_[i];
        std::string color = "0.9 0.9 0.9"; // light gray for sources
        if (node.kind == NodeKind::Output)
            color = dirty.contains(node.id) ? "green" : "white";

        out << "  n" << i << " [label=\"" << node.id << "\", fillcolor=\"" << color << "\"];\n";
        for (size_t c : node.consumers) {
            out << "  n" << i << " -> n" << c << ";\n";
        }
    }
    out << "}\n";
}

void DependencyGraph::clear() {
    nodes_.clear();
    index_.clear();
    edge_count_ = 0;
}

} // namespace kiln
