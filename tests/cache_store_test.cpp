#include "kiln/cache_store.hpp"
#include "kiln/fingerprint.hpp"
#include "test_site.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/stat.h>

using namespace kiln;
using kiln::testing::TempDirTest;
namespace fs = std::filesystem;

namespace {

Cache sample_cache() {
    Cache cache;
    cache.config_hash = fingerprint_bytes("config");
    cache.last_build_seconds = 1.5;
    cache.sources["content/a.md"] = {"content/a.md", SourceKind::Content, fingerprint_bytes("a"), 42, 1};
    cache.sources["templates/page.html"] = {"templates/page.html", SourceKind::Template, fingerprint_bytes("t"), 7, 1};

    OutputArtifact page;
    page.id = "a/index.html";
    page.kind = OutputKind::Page;
    page.source = "content/a.md";
    page.hash = fingerprint_bytes("<a>");
    page.dependencies = {{DependencyKind::Source, "content/a.md", fingerprint_bytes("a")},
                         {DependencyKind::Source, "templates/page.html", fingerprint_bytes("t")},
                         {DependencyKind::Source, "templates/override.html", ""},
                         {DependencyKind::Output, "menu/main.html", fingerprint_bytes("<menu>")}};
    page.meta.title = "A";
    page.meta.tags = {"Go", "C++"};
    page.meta.menus = {"main"};
    cache.outputs[page.id] = page;

    OutputArtifact tag;
    tag.id = "tags/go/index.html";
    tag.kind = OutputKind::Aggregate;
    tag.hash = fingerprint_bytes("<tag>");
    tag.aggregate = AggregateSpec{AggregateKind::Tag, "go"};
    tag.members = {"a/index.html"};
    cache.outputs[tag.id] = tag;
    return cache;
}

void expect_same(const Cache &a, const Cache &b) {
    EXPECT_EQ(a.config_hash, b.config_hash);
    EXPECT_DOUBLE_EQ(a.last_build_seconds, b.last_build_seconds);
    ASSERT_EQ(a.sources.size(), b.sources.size());
    for (const auto &[id, src] : a.sources) {
        const auto *other = b.find_source(id);
        ASSERT_NE(other, nullptr) << id;
        EXPECT_EQ(src.hash, other->hash);
        EXPECT_EQ(src.kind, other->kind);
        EXPECT_EQ(src.mtime, other->mtime);
    }
    ASSERT_EQ(a.outputs.size(), b.outputs.size());
    for (const auto &[id, out] : a.outputs) {
        const auto *other = b.find_output(id);
        ASSERT_NE(other, nullptr) << id;
        EXPECT_EQ(out.kind, other->kind);
        EXPECT_EQ(out.source, other->source);
        EXPECT_EQ(out.hash, other->hash);
        EXPECT_EQ(out.dependencies, other->dependencies);
        EXPECT_EQ(out.meta, other->meta);
        EXPECT_EQ(out.aggregate, other->aggregate);
        EXPECT_EQ(out.members, other->members);
    }
}

} // namespace

class CacheStoreTest : public TempDirTest {
protected:
    fs::path cache_path() const {
        return root / ".kiln" / "cache.bin";
    }
};

TEST_F(CacheStoreTest, MissingFileIsEmptyCache) {
    CacheStore store(cache_path());
    ASSERT_TRUE(store.load());
    EXPECT_TRUE(store.cache().empty());
    EXPECT_EQ(store.get("a/index.html"), nullptr);
}

TEST_F(CacheStoreTest, CommitThenLoad) {
    auto cache = sample_cache();
    {
        CacheStore store(cache_path());
        auto res = store.commit(cache);
        ASSERT_TRUE(res) << res.error();
    }
    CacheStore store(cache_path());
    auto res = store.load();
    ASSERT_TRUE(res) << res.error();
    expect_same(cache, store.cache());

    const auto *page = store.get("a/index.html");
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->dependencies[2].hash, "") << "absent-dependency entry survives";
}

TEST_F(CacheStoreTest, UncompressedCommitThenLoad) {
    auto cache = sample_cache();
    CacheStore writer(cache_path(), CacheOptions{false, 0.05});
    ASSERT_TRUE(writer.commit(cache));

    auto bytes = read(".kiln/cache.bin");
    ASSERT_GE(bytes.size(), 24u);
    EXPECT_EQ(bytes.substr(0, 8), "KILNC001");
    EXPECT_EQ(bytes[8], 0) << "flags byte says uncompressed";

    CacheStore reader(cache_path());
    ASSERT_TRUE(reader.load());
    expect_same(cache, reader.cache());
}

TEST_F(CacheStoreTest, CorruptFileDegradesToEmpty) {
    CacheStore store(cache_path());
    ASSERT_TRUE(store.commit(sample_cache()));

    auto bytes = read(".kiln/cache.bin");
    bytes[bytes.size() / 2] ^= 0x5a;
    write(".kiln/cache.bin", bytes);

    CacheStore reloaded(cache_path());
    EXPECT_FALSE(reloaded.load());
    EXPECT_TRUE(reloaded.cache().empty());
}

TEST_F(CacheStoreTest, WrongMagicIsRejected) {
    write(".kiln/cache.bin", "NOTKILN0 and some more bytes to pass the header");
    CacheStore store(cache_path());
    auto res = store.load();
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("bad magic"), std::string::npos);
    EXPECT_TRUE(store.cache().empty());
}

TEST_F(CacheStoreTest, TruncatedFileIsRejected) {
    write(".kiln/cache.bin", "KILNC0");
    CacheStore store(cache_path());
    EXPECT_FALSE(store.load());
}

TEST_F(CacheStoreTest, SchemaMismatchIsRejected) {
    auto doc = to_json(sample_cache());
    doc["schema"] = Cache::SCHEMA_VERSION + 1;
    auto packed = pack_envelope(doc.dump(), false);
    ASSERT_TRUE(packed);
    write(".kiln/cache.bin", *packed);

    CacheStore store(cache_path());
    auto res = store.load();
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("schema"), std::string::npos);
}

TEST(EnvelopeTest, CompressedFlagIsSelfDescribing) {
    std::string payload(10000, 'k');
    auto packed = pack_envelope(payload, true);
    ASSERT_TRUE(packed);
    EXPECT_LT(packed->size(), payload.size());
    EXPECT_EQ(static_cast<unsigned char>((*packed)[8]) & 1, 1);

    auto env = unpack_envelope(*packed);
    ASSERT_TRUE(env) << env.error();
    EXPECT_TRUE(env->compressed);
    EXPECT_EQ(env->payload, payload);
}

TEST(EnvelopeTest, UnknownFlagsAreRejected) {
    auto packed = pack_envelope("{}", false);
    ASSERT_TRUE(packed);
    (*packed)[8] = 0x04;
    EXPECT_FALSE(unpack_envelope(*packed));
}

// Test: a compressed envelope claiming an absurd length is rejected, not allocated
TEST(EnvelopeTest, ImplausibleLengthIsRejected) {
    auto packed = pack_envelope(std::string(4096, 'k'), true);
    ASSERT_TRUE(packed);
    for (size_t i = 16; i < 24; ++i)
        (*packed)[i] = static_cast<char>(0xff);

    auto env = unpack_envelope(*packed);
    ASSERT_FALSE(env);
    EXPECT_NE(env.error().find("implausible"), std::string::npos);
}

// Test: a cache with a corrupt length field loads as an error and an empty cache
TEST_F(CacheStoreTest, CorruptLengthDegradesToEmpty) {
    CacheStore store(cache_path());
    ASSERT_TRUE(store.commit(sample_cache()));

    auto bytes = read(".kiln/cache.bin");
    ASSERT_EQ(static_cast<unsigned char>(bytes[8]) & 1, 1);
    for (size_t i = 16; i < 24; ++i)
        bytes[i] = static_cast<char>(0xff);
    write(".kiln/cache.bin", bytes);

    CacheStore reloaded(cache_path());
    auto res = reloaded.load();
    ASSERT_FALSE(res);
    EXPECT_TRUE(reloaded.cache().empty());
}

// Test: a failed commit leaves the previous cache intact and no temp file behind
TEST_F(CacheStoreTest, FailedCommitKeepsPreviousCache) {
    if (::geteuid() == 0)
        GTEST_SKIP() << "permission checks do not apply to root";

    auto first = sample_cache();
    CacheStore store(cache_path());
    ASSERT_TRUE(store.commit(first));

    fs::permissions(cache_path().parent_path(), fs::perms::owner_read | fs::perms::owner_exec);
    Cache second = first;
    second.config_hash = fingerprint_bytes("changed");
    auto res = store.commit(second);
    fs::permissions(cache_path().parent_path(), fs::perms::owner_all);
    ASSERT_FALSE(res);

    CacheStore reloaded(cache_path());
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.cache().config_hash, first.config_hash);

    size_t entries = 0;
    for (const auto &entry : fs::directory_iterator(cache_path().parent_path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(CacheStoreTest, CompressionPolicy) {
    CacheStore store(cache_path(), CacheOptions{true, 0.05});
    Cache cache;
    cache.last_build_seconds = 0.0;
    EXPECT_TRUE(store.should_compress(cache)) << "nothing measured yet";

    CacheStore off(cache_path(), CacheOptions{false, 0.05});
    EXPECT_FALSE(off.should_compress(cache));
}

TEST_F(CacheStoreTest, RemoveDeletesFile) {
    CacheStore store(cache_path());
    ASSERT_TRUE(store.commit(sample_cache()));
    ASSERT_TRUE(fs::exists(cache_path()));
    ASSERT_TRUE(store.remove());
    EXPECT_FALSE(fs::exists(cache_path()));
    EXPECT_TRUE(store.cache().empty());
}

TEST_F(CacheStoreTest, DiscardKeepsFile) {
    CacheStore store(cache_path());
    ASSERT_TRUE(store.commit(sample_cache()));
    store.discard();
    EXPECT_TRUE(store.cache().empty());
    EXPECT_TRUE(fs::exists(cache_path()));
}
