#include "kiln/aggregate.hpp"

#include <gtest/gtest.h>

using namespace kiln;

namespace {

PageMeta page(std::vector<std::string> tags, std::string section = "", std::vector<std::string> menus = {},
              bool draft = false) {
    PageMeta meta;
    meta.tags = std::move(tags);
    meta.section = std::move(section);
    meta.menus = std::move(menus);
    meta.draft = draft;
    return meta;
}

} // namespace

TEST(SlugifyTest, Basics) {
    EXPECT_EQ(slugify("Hello World"), "hello-world");
    EXPECT_EQ(slugify("  C++ / Rust  "), "c-rust");
    EXPECT_EQ(slugify("go"), "go");
    EXPECT_EQ(slugify("---"), "");
}

TEST(ExpandOutputTest, ReplacesEveryPlaceholder) {
    EXPECT_EQ(expand_output("tags/{key}/index.html", "go"), "tags/go/index.html");
    EXPECT_EQ(expand_output("{key}-{key}.xml", "a"), "a-a.xml");
    EXPECT_EQ(expand_output("sitemap.xml", "x"), "sitemap.xml");
}

TEST(MatchesTest, DraftsNeverMatch) {
    EXPECT_FALSE(matches({AggregateKind::Sitemap, ""}, page({}, "", {}, true)));
    EXPECT_TRUE(matches({AggregateKind::Sitemap, ""}, page({})));
}

TEST(MatchesTest, TagsCompareBySlug) {
    EXPECT_TRUE(matches({AggregateKind::Tag, "web-dev"}, page({"Web Dev"})));
    EXPECT_FALSE(matches({AggregateKind::Tag, "web"}, page({"Web Dev"})));
}

TEST(EvaluateAggregatesTest, UnkeyedFamilyExpandsPerValue) {
    PageIndex pages{
        {"a/index.html", page({"Go", "C++"})},
        {"b/index.html", page({"go"})},
        {"c/index.html", page({"Rust"}, "", {}, true)},
    };
    auto instances = evaluate_aggregates({{AggregateKind::Tag, std::nullopt, "tags/{key}/index.html"}}, pages);
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_EQ(instances[0].output, "tags/c/index.html");
    EXPECT_EQ(instances[0].members, (std::vector<std::string>{"a/index.html"}));
    EXPECT_EQ(instances[1].output, "tags/go/index.html");
    EXPECT_EQ(instances[1].members, (std::vector<std::string>{"a/index.html", "b/index.html"}));
}

TEST(EvaluateAggregatesTest, FixedKeyYieldsEvenWhenEmpty) {
    PageIndex pages{{"a/index.html", page({}, "blog")}};
    auto instances = evaluate_aggregates({{AggregateKind::Menu, "main", "menu/main.html"}}, pages);
    ASSERT_EQ(instances.size(), 1u);
    EXPECT_TRUE(instances[0].members.empty());
    EXPECT_EQ(instances[0].spec.key, "main");
}

TEST(EvaluateAggregatesTest, SectionsAndSitemap) {
    PageIndex pages{
        {"blog/a/index.html", page({}, "blog")},
        {"docs/b/index.html", page({}, "docs")},
        {"index.html", page({})},
    };
    auto instances = evaluate_aggregates({{AggregateKind::Section, std::nullopt, "{key}/list.html"},
                                          {AggregateKind::Sitemap, std::nullopt, "sitemap.xml"}},
                                         pages);
    ASSERT_EQ(instances.size(), 3u);
    EXPECT_EQ(instances[0].output, "blog/list.html");
    EXPECT_EQ(instances[1].output, "docs/list.html");
    EXPECT_EQ(instances[2].output, "sitemap.xml");
    EXPECT_EQ(instances[2].members.size(), 3u);
}

TEST(EvaluateAggregatesTest, NoPagesNoExpandedInstances) {
    auto instances = evaluate_aggregates({{AggregateKind::Tag, std::nullopt, "tags/{key}.html"}}, {});
    EXPECT_TRUE(instances.empty());
}
