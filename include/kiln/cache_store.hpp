#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace kiln {

/// @brief Everything one committed cycle leaves for the next.
struct Cache {
    static constexpr uint32_t SCHEMA_VERSION = 1;

    uint32_t schema = SCHEMA_VERSION;
    Fingerprint config_hash;
    std::map<std::string, SourceArtifact, std::less<>> sources;
    std::map<std::string, OutputArtifact, std::less<>> outputs;
    double last_build_seconds = 0.0;

    bool empty() const {
        return sources.empty() && outputs.empty();
    }

    const OutputArtifact *find_output(std::string_view id) const {
        if (auto it = outputs.find(id); it != outputs.end())
            return &it->second;
        return nullptr;
    }

    const SourceArtifact *find_source(std::string_view id) const {
        if (auto it = sources.find(id); it != sources.end())
            return &it->second;
        return nullptr;
    }
};

struct CacheOptions {
    bool compress = true;
    double max_decompress_fraction = 0.05;
};

struct Envelope {
    std::string payload;
    bool compressed = false;
};

/**
 * @brief Frames a payload for disk: magic "KILNC001", flags, CRC-32, length.
 *
 * The flags byte records whether the body is zlib-compressed, so reading never
 * has to guess.
 */
Result<std::string> pack_envelope(std::string_view payload, bool compress);
Result<Envelope> unpack_envelope(std::string_view file);

nlohmann::json to_json(const PageMeta &meta);
PageMeta page_meta_from_json(const nlohmann::json &j);

nlohmann::json to_json(const Cache &cache);
Result<Cache> cache_from_json(const nlohmann::json &doc);

/**
 * @brief The single on-disk cache of one build root.
 *
 * `load` never makes a cycle fail: a missing file is an empty cache, anything
 * unreadable is reported and leaves an empty cache behind. `commit` is
 * all-or-nothing; the previous file stays valid until the new one has been
 * renamed into place.
 */
class CacheStore {
public:
    explicit CacheStore(std::filesystem::path path, CacheOptions options = {});

    Result<void> load();
    Result<void> commit(const Cache &cache);

    const OutputArtifact *get(std::string_view output_id) const {
        return cache_.find_output(output_id);
    }

    const Cache &cache() const {
        return cache_;
    }

    /// @brief Forgets the loaded cache; the file is untouched.
    void discard();

    /// @brief Deletes the cache file.
    Result<void> remove();

    /// @brief Whether the next commit of `cache` would compress, given the last measured decompression cost.
    bool should_compress(const Cache &cache) const;

    double last_decompress_seconds() const {
        return decompress_seconds_;
    }

    const std::filesystem::path &path() const {
        return path_;
    }

private:
    std::filesystem::path path_;
    CacheOptions options_;
    Cache cache_;
    double decompress_seconds_ = 0.0;
};

} // namespace kiln
