#include "kiln/cache_store.hpp"

#include "kiln/atomic_file.hpp"
#include "kiln/log.hpp"

#include <format>
#include <algorithm>
#include <chrono>
#include <climits>
#include <cstring>
#include <new>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <zlib.h>

namespace kiln {

using json = nlohmann::json;

namespace {

constexpr char MAGIC[8] = {'K', 'I', 'L', 'N', 'C', '0', '0', '1'};
constexpr uint8_t FLAG_ZLIB = 0x01;
constexpr size_t HEADER_SZ = 24; // magic[8] flags[1] reserved[3] crc32[4] length[8]
// Deflate never expands by more than about 1032:1.
constexpr uint64_t MAX_EXPANSION = 1032;

void put_le(std::string &out, uint64_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i)
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
}

uint64_t get_le(std::string_view in, size_t offset, size_t bytes) {
    uint64_t value = 0;
    for (size_t i = 0; i < bytes; ++i)
        value |= static_cast<uint64_t>(static_cast<unsigned char>(in[offset + i])) << (8 * i);
    return value;
}

uint32_t checksum(std::string_view bytes) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    while (!bytes.empty()) {
        auto n = static_cast<uInt>(std::min<size_t>(bytes.size(), UINT_MAX));
        crc = ::crc32(crc, reinterpret_cast<const Bytef *>(bytes.data()), n);
        bytes.remove_prefix(n);
    }
    return static_cast<uint32_t>(crc);
}

json deps_to_json(const std::vector<Dependency> &deps) {
    json arr = json::array();
    for (const auto &d : deps)
        arr.push_back(json::array({d.kind == DependencyKind::Source ? "s" : "o", d.id, d.hash}));
    return arr;
}

std::vector<Dependency> deps_from_json(const json &arr) {
    std::vector<Dependency> deps;
    deps.reserve(arr.size());
    for (const auto &entry : arr) {
        auto tag = entry.at(0).get<std::string>();
        if (tag != "s" && tag != "o")
            throw std::invalid_argument("dependency tag must be 's' or 'o'");
        deps.push_back({tag == "s" ? DependencyKind::Source : DependencyKind::Output,
                        entry.at(1).get<std::string>(),
                        entry.at(2).get<std::string>()});
    }
    return deps;
}

} // namespace

json to_json(const PageMeta &meta) {
    json j = json::object();
    if (!meta.title.empty())
        j["title"] = meta.title;
    if (!meta.section.empty())
        j["section"] = meta.section;
    if (!meta.tags.empty())
        j["tags"] = meta.tags;
    if (!meta.menus.empty())
        j["menus"] = meta.menus;
    if (meta.draft)
        j["draft"] = true;
    return j;
}

PageMeta page_meta_from_json(const json &j) {
    PageMeta meta;
    meta.title = j.value("title", std::string{});
    meta.section = j.value("section", std::string{});
    meta.tags = j.value("tags", std::vector<std::string>{});
    meta.menus = j.value("menus", std::vector<std::string>{});
    meta.draft = j.value("draft", false);
    return meta;
}

Result<std::string> pack_envelope(std::string_view payload, bool compress) {
    std::string out;
    out.reserve(HEADER_SZ + payload.size());
    out.append(MAGIC, sizeof(MAGIC));
    out.push_back(static_cast<char>(compress ? FLAG_ZLIB : 0));
    out.append(3, '\0');
    put_le(out, checksum(payload), 4);
    put_le(out, payload.size(), 8);

    if (!compress) {
        out.append(payload);
        return out;
    }

    uLongf bound = ::compressBound(static_cast<uLong>(payload.size()));
    std::string body(bound, '\0');
    int rc = ::compress2(reinterpret_cast<Bytef *>(body.data()),
                         &bound,
                         reinterpret_cast<const Bytef *>(payload.data()),
                         static_cast<uLong>(payload.size()),
                         Z_BEST_SPEED);
    if (rc != Z_OK)
        return std::unexpected(std::format("zlib compress failed ({})", rc));
    body.resize(bound);
    out.append(body);
    return out;
}

Result<Envelope> unpack_envelope(std::string_view file) {
    if (file.size() < HEADER_SZ)
        return std::unexpected("too small for header");
    if (std::memcmp(file.data(), MAGIC, sizeof(MAGIC)) != 0)
        return std::unexpected("bad magic");

    auto flags = static_cast<uint8_t>(file[8]);
    if ((flags & ~FLAG_ZLIB) != 0)
        return std::unexpected(std::format("unknown envelope flags 0x{:02x}", flags));
    auto crc = static_cast<uint32_t>(get_le(file, 12, 4));
    uint64_t length = get_le(file, 16, 8);
    std::string_view body = file.substr(HEADER_SZ);

    Envelope env;
    env.compressed = (flags & FLAG_ZLIB) != 0;
    if (env.compressed) {
        if (length > (static_cast<uint64_t>(body.size()) + 1) * MAX_EXPANSION)
            return std::unexpected(
                std::format("implausible payload length {} for {} compressed bytes", length, body.size()));
        env.payload.resize(length);
        auto dest_len = static_cast<uLongf>(length);
        int rc = ::uncompress(reinterpret_cast<Bytef *>(env.payload.data()),
                              &dest_len,
                              reinterpret_cast<const Bytef *>(body.data()),
                              static_cast<uLong>(body.size()));
        if (rc != Z_OK || dest_len != length)
            return std::unexpected(std::format("zlib uncompress failed ({})", rc));
    } else {
        if (body.size() != length)
            return std::unexpected("truncated payload");
        env.payload.assign(body);
    }

    if (checksum(env.payload) != crc)
        return std::unexpected("checksum mismatch");
    return env;
}

json to_json(const Cache &cache) {
    json doc;
    doc["schema"] = cache.schema;
    doc["config_hash"] = cache.config_hash;
    doc["last_build_seconds"] = cache.last_build_seconds;

    json sources = json::object();
    for (const auto &[id, src] : cache.sources) {
        sources[id] = {{"kind", to_string(src.kind)}, {"hash", src.hash}, {"mtime", src.mtime}, {"size", src.size}};
    }
    doc["sources"] = std::move(sources);

    json outputs = json::object();
    for (const auto &[id, out] : cache.outputs) {
        json o;
        o["kind"] = to_string(out.kind);
        if (!out.source.empty())
            o["source"] = out.source;
        o["hash"] = out.hash;
        o["deps"] = deps_to_json(out.dependencies);
        if (out.kind == OutputKind::Page)
            o["meta"] = to_json(out.meta);
        if (out.aggregate) {
            o["aggregate"] = {{"kind", to_string(out.aggregate->kind)}, {"key", out.aggregate->key}};
            o["members"] = out.members;
        }
        outputs[id] = std::move(o);
    }
    doc["outputs"] = std::move(outputs);
    return doc;
}

Result<Cache> cache_from_json(const json &doc) {
    Cache cache;
    try {
        cache.schema = doc.at("schema").get<uint32_t>();
        if (cache.schema != Cache::SCHEMA_VERSION)
            return std::unexpected(
                std::format("schema version {} is not {}", cache.schema, Cache::SCHEMA_VERSION));
        cache.config_hash = doc.value("config_hash", std::string{});
        cache.last_build_seconds = doc.value("last_build_seconds", 0.0);

        for (const auto &[id, s] : doc.at("sources").items()) {
            SourceArtifact src;
            src.id = id;
            auto kind = parse_source_kind(s.at("kind").get<std::string>());
            if (!kind)
                return std::unexpected(std::format("source {} has an unknown kind", id));
            src.kind = *kind;
            src.hash = s.at("hash").get<std::string>();
            src.mtime = s.value("mtime", int64_t{0});
            src.size = s.value("size", uint64_t{0});
            cache.sources.emplace(id, std::move(src));
        }

        for (const auto &[id, o] : doc.at("outputs").items()) {
            OutputArtifact out;
            out.id = id;
            auto kind = parse_output_kind(o.at("kind").get<std::string>());
            if (!kind)
                return std::unexpected(std::format("output {} has an unknown kind", id));
            out.kind = *kind;
            out.source = o.value("source", std::string{});
            out.hash = o.at("hash").get<std::string>();
            out.dependencies = deps_from_json(o.at("deps"));
            if (auto m = o.find("meta"); m != o.end())
                out.meta = page_meta_from_json(*m);
            if (auto a = o.find("aggregate"); a != o.end()) {
                auto akind = parse_aggregate_kind(a->at("kind").get<std::string>());
                if (!akind)
                    return std::unexpected(std::format("aggregate {} has an unknown kind", id));
                out.aggregate = AggregateSpec{*akind, a->at("key").get<std::string>()};
                out.members = o.value("members", std::vector<std::string>{});
            }
            cache.outputs.emplace(id, std::move(out));
        }
    } catch (const json::exception &e) {
        return std::unexpected(std::format("malformed cache: {}", e.what()));
    } catch (const std::invalid_argument &e) {
        return std::unexpected(std::format("malformed cache: {}", e.what()));
    }
    return cache;
}

CacheStore::CacheStore(std::filesystem::path path, CacheOptions options)
    : path_(std::move(path)), options_(options) {
}

Result<void> CacheStore::load() {
    cache_ = Cache{};
    decompress_seconds_ = 0.0;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
        return {};

    auto file = read_file(path_);
    if (!file)
        return std::unexpected(file.error());

    auto start = std::chrono::steady_clock::now();
    Result<Envelope> env = std::unexpected(std::string("not read"));
    try {
        env = unpack_envelope(*file);
    } catch (const std::bad_alloc &) {
        return std::unexpected(std::format("{}: out of memory unpacking the cache", path_.string()));
    } catch (const std::length_error &e) {
        return std::unexpected(std::format("{}: {}", path_.string(), e.what()));
    }
    if (!env)
        return std::unexpected(std::format("{}: {}", path_.string(), env.error()));
    if (env->compressed)
        decompress_seconds_ = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    json doc;
    try {
        doc = json::parse(env->payload);
    } catch (const json::parse_error &e) {
        return std::unexpected(std::format("{}: {}", path_.string(), e.what()));
    }

    auto cache = cache_from_json(doc);
    if (!cache)
        return std::unexpected(std::format("{}: {}", path_.string(), cache.error()));
    cache_ = std::move(*cache);
    return {};
}

bool CacheStore::should_compress(const Cache &cache) const {
    if (!options_.compress)
        return false;
    if (decompress_seconds_ <= 0.0 || cache.last_build_seconds <= 0.0)
        return true;
    return decompress_seconds_ <= options_.max_decompress_fraction * cache.last_build_seconds;
}

Result<void> CacheStore::commit(const Cache &cache) {
    bool compress = should_compress(cache);
    if (options_.compress && !compress) {
        log_debug("cache: decompression took {:.3f}s of a {:.3f}s build, writing uncompressed",
                  decompress_seconds_,
                  cache.last_build_seconds);
    }

    std::string payload;
    try {
        payload = to_json(cache).dump();
    } catch (const json::exception &e) {
        return std::unexpected(std::format("cannot serialize cache: {}", e.what()));
    }

    auto bytes = pack_envelope(payload, compress);
    if (!bytes)
        return std::unexpected(bytes.error());
    if (auto res = write_file_atomic(path_, *bytes, true); !res)
        return std::unexpected(res.error());

    cache_ = cache;
    return {};
}

void CacheStore::discard() {
    cache_ = Cache{};
}

Result<void> CacheStore::remove() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec)
        return std::unexpected(std::format("cannot remove {}: {}", path_.string(), ec.message()));
    cache_ = Cache{};
    return {};
}

} // namespace kiln
