#include "kiln/config.hpp"
#include "test_site.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace kiln;
using json = nlohmann::json;
using kiln::testing::TempDirTest;

class ConfigTest : public TempDirTest {
protected:
    void TearDown() override {
        ::unsetenv("KILN_PARALLEL");
        ::unsetenv("KILN_MAX_WORKERS");
        TempDirTest::TearDown();
    }
};

TEST_F(ConfigTest, Defaults) {
    auto cfg = parse_config(json::object(), root);
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_TRUE(cfg->parallel);
    EXPECT_FALSE(cfg->fast);
    EXPECT_EQ(cfg->output_root(), (root / "public").lexically_normal());
    EXPECT_EQ(cfg->cache_path(), (root / ".kiln/cache.bin").lexically_normal());
    EXPECT_EQ(cfg->render.aggregate_pass_cap, 4u);
    EXPECT_TRUE(cfg->cache.compress);
}

TEST_F(ConfigTest, FullDocument) {
    auto doc = json::parse(R"({
        "output_dir": "site",
        "parallel": false,
        "max_workers": 3,
        "memory_optimized": true,
        "cache": {"compress": false, "max_decompress_fraction": 0.1},
        "render": {"command": ["render", "{source}", "{output}"], "timeout_ms": 500, "aggregate_pass_cap": 2},
        "aggregates": [
            {"kind": "tag", "output": "tags/{key}/index.html"},
            {"kind": "menu", "key": "main", "output": "menu/main.html"},
            {"kind": "sitemap", "output": "sitemap.xml"}
        ],
        "scheduler": {"environment": "ci", "profiles": {"rendering": {"break_even": 2}}}
    })");
    auto cfg = parse_config(doc, root);
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_FALSE(cfg->parallel);
    EXPECT_EQ(cfg->max_workers, 3u);
    EXPECT_TRUE(cfg->memory_optimized);
    EXPECT_FALSE(cfg->cache.compress);
    EXPECT_EQ(cfg->render.command.size(), 3u);
    EXPECT_EQ(cfg->render.timeout.count(), 500);
    EXPECT_EQ(cfg->render.aggregate_pass_cap, 2u);
    ASSERT_EQ(cfg->aggregates.size(), 3u);
    EXPECT_EQ(cfg->aggregates[1].key, "main");
    EXPECT_FALSE(cfg->aggregates[0].key);
    EXPECT_EQ(cfg->scheduler.environment, Environment::Ci);

    auto rendering = cfg->scheduler.profiles.at(Phase::Rendering);
    EXPECT_EQ(rendering.break_even, 2u);
    EXPECT_EQ(rendering.contention_point, calibrated_profile(Phase::Rendering, Environment::Ci).contention_point);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
    EXPECT_FALSE(parse_config(json::parse(R"({"max_workers": -1})"), root));
    EXPECT_FALSE(parse_config(json::parse(R"({"render": {"timeout_ms": 0}})"), root));
    EXPECT_FALSE(parse_config(json::parse(R"({"aggregates": [{"kind": "related", "output": "x"}]})"), root));
    EXPECT_FALSE(parse_config(json::parse(R"({"aggregates": [{"kind": "tag"}]})"), root));
    EXPECT_FALSE(parse_config(json::parse(R"({"scheduler": {"profiles": {"linking": {}}}})"), root));
    EXPECT_FALSE(parse_config(json::parse(R"({"parallel": "yes"})"), root));
    EXPECT_FALSE(parse_config(json::parse("[]"), root));
}

TEST_F(ConfigTest, LoadResolvesAgainstConfigDirectory) {
    write("site/kiln.json", R"({"output_dir": "out"})");
    auto cfg = load_config(root / "site/kiln.json");
    ASSERT_TRUE(cfg) << cfg.error();
    EXPECT_EQ(cfg->output_root(), (root / "site/out").lexically_normal());
    EXPECT_EQ(cfg->config_file, (root / "site/kiln.json").lexically_normal());
}

TEST_F(ConfigTest, LoadReportsParseErrors) {
    write("kiln.json", "{ not json");
    auto cfg = load_config(root / "kiln.json");
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().find("kiln.json"), std::string::npos);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    EngineConfig cfg;
    ::setenv("KILN_PARALLEL", "0", 1);
    ::setenv("KILN_MAX_WORKERS", "5", 1);
    ASSERT_TRUE(apply_env_overrides(cfg));
    EXPECT_FALSE(cfg.parallel);
    EXPECT_EQ(cfg.max_workers, 5u);

    ::setenv("KILN_MAX_WORKERS", "many", 1);
    EXPECT_FALSE(apply_env_overrides(cfg));
}

TEST_F(ConfigTest, OverridesNeverChangeRenderingIdentity) {
    EngineConfig cfg;
    auto before = cfg.rendering_identity();
    ::setenv("KILN_PARALLEL", "0", 1);
    ASSERT_TRUE(apply_env_overrides(cfg));
    EXPECT_EQ(cfg.rendering_identity(), before);
}

TEST_F(ConfigTest, ValidateChecksStructure) {
    EngineConfig cfg;
    cfg.base_dir = root;
    EXPECT_TRUE(validate(cfg));

    cfg.output_dir = "content/public";
    EXPECT_FALSE(validate(cfg)) << "output inside content";
    cfg.output_dir = "public";

    cfg.aggregates.push_back({AggregateKind::Tag, std::nullopt, "tags.html"});
    EXPECT_FALSE(validate(cfg)) << "expanding family needs {key}";
    cfg.aggregates.back().output = "tags/{key}.html";
    EXPECT_TRUE(validate(cfg));

    cfg.aggregates.push_back({AggregateKind::Sitemap, std::nullopt, "sitemap.xml"});
    cfg.aggregates.push_back({AggregateKind::Menu, "main", "sitemap.xml"});
    EXPECT_FALSE(validate(cfg)) << "two aggregates write one file";

    cfg.aggregates.clear();
    cfg.source_dir = "missing";
    EXPECT_FALSE(validate(cfg));
}

TEST_F(ConfigTest, SchedulerOptionsCarryOverrides) {
    EngineConfig cfg;
    cfg.parallel = false;
    cfg.max_workers = 7;
    cfg.scheduler.environment = Environment::Production;
    auto opts = scheduler_options(cfg);
    EXPECT_FALSE(opts.parallel);
    EXPECT_EQ(opts.max_workers, 7u);
    EXPECT_EQ(opts.environment, Environment::Production);
}
