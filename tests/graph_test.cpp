#include "kiln/graph.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace kiln;

namespace {

Dependency src(std::string id) {
    return {DependencyKind::Source, std::move(id), "h"};
}

Dependency out(std::string id) {
    return {DependencyKind::Output, std::move(id), "h"};
}

} // namespace

class GraphTest : public ::testing::Test {
protected:
    DependencyGraph graph;

    void SetUp() override {
        // Two pages share a template; one embeds the main menu.
        graph.record_dependency("a/index.html", src("content/a.md"));
        graph.record_dependency("a/index.html", src("templates/page.html"));
        graph.record_dependency("b/index.html", src("content/b.md"));
        graph.record_dependency("b/index.html", src("templates/page.html"));
        graph.record_dependency("b/index.html", out("menu/main.html"));
        graph.record_dependency("menu/main.html", src("templates/menu.html"));
    }
};

TEST_F(GraphTest, RecordDependencyIgnoresDuplicates) {
    size_t before = graph.edge_count();
    graph.record_dependency("a/index.html", src("content/a.md"));
    EXPECT_EQ(graph.edge_count(), before);
}

TEST_F(GraphTest, SharedTemplateInvalidatesEveryConsumer) {
    auto dirty = graph.invalidated_by(std::vector<std::string>{"templates/page.html"});
    EXPECT_EQ(dirty, (std::set<std::string>{"a/index.html", "b/index.html"}));
}

TEST_F(GraphTest, PageSourceInvalidatesOnlyItsPage) {
    ChangeSet changes;
    changes.modified = {"content/a.md"};
    EXPECT_EQ(graph.invalidated_by(changes), (std::set<std::string>{"a/index.html"}));
}

TEST_F(GraphTest, InvalidationFollowsOutputEdges) {
    auto dirty = graph.invalidated_by(std::vector<std::string>{"templates/menu.html"});
    EXPECT_EQ(dirty, (std::set<std::string>{"menu/main.html", "b/index.html"}));
}

TEST_F(GraphTest, UnknownSourceInvalidatesNothing) {
    EXPECT_TRUE(graph.invalidated_by(std::vector<std::string>{"data/unused.json"}).empty());
}

TEST_F(GraphTest, PropagateIncludesSeeds) {
    auto closure = graph.propagate({"menu/main.html"});
    EXPECT_EQ(closure, (std::set<std::string>{"menu/main.html", "b/index.html"}));
}

TEST_F(GraphTest, ClearDependenciesDropsEdges) {
    graph.clear_dependencies("b/index.html");
    auto dirty = graph.invalidated_by(std::vector<std::string>{"templates/page.html"});
    EXPECT_EQ(dirty, (std::set<std::string>{"a/index.html"}));
    EXPECT_TRUE(graph.consumers_of_output("menu/main.html").empty());
}

// Test: aggregates and pages referencing each other terminate
TEST(GraphCycleTest, CyclicOutputsTerminate) {
    DependencyGraph graph;
    graph.record_dependency("tags/go/index.html", out("a/index.html"));
    graph.record_dependency("a/index.html", out("tags/go/index.html"));
    graph.record_dependency("a/index.html", src("content/a.md"));

    auto dirty = graph.invalidated_by(std::vector<std::string>{"content/a.md"});
    EXPECT_EQ(dirty, (std::set<std::string>{"a/index.html", "tags/go/index.html"}));
    EXPECT_TRUE(graph.has_cycle());
    EXPECT_EQ(graph.topo_order().size(), graph.nodes().size());
}

TEST_F(GraphTest, TopoOrderPutsDependenciesFirst) {
    EXPECT_FALSE(graph.has_cycle());
    auto order = graph.topo_order();
    ASSERT_EQ(order.size(), graph.nodes().size());

    std::vector<size_t> position(order.size());
    for (size_t i = 0; i < order.size(); ++i)
        position[order[i]] = i;

    auto menu = graph.find("menu/main.html", DependencyGraph::NodeKind::Output);
    auto page = graph.find("b/index.html", DependencyGraph::NodeKind::Output);
    ASSERT_TRUE(menu && page);
    EXPECT_LT(position[*menu], position[*page]);
}

TEST_F(GraphTest, SourceAndOutputWithSameIdAreDistinct) {
    graph.record_dependency("x", src("x"));
    EXPECT_NE(graph.find("x", DependencyGraph::NodeKind::Source), graph.find("x", DependencyGraph::NodeKind::Output));
}

TEST_F(GraphTest, EmitDotHighlightsDirty) {
    std::ostringstream dot;
    graph.emit_dot(dot, {"a/index.html"});
    auto text = dot.str();
    EXPECT_NE(text.find("digraph kiln_build"), std::string::npos);
    EXPECT_NE(text.find("label=\"a/index.html\", fillcolor=\"green\""), std::string::npos);
    EXPECT_NE(text.find("label=\"b/index.html\", fillcolor=\"white\""), std::string::npos);
}

TEST_F(GraphTest, ClearEmptiesGraph) {
    graph.clear();
    EXPECT_TRUE(graph.nodes().empty());
    EXPECT_EQ(graph.edge_count(), 0u);
}
