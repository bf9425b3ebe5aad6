#include "kiln/renderer.hpp"

namespace kiln {

const SourceArtifact *SiteSnapshot::source(std::string_view id) const {
    if (auto it = sources.find(id); it != sources.end())
        return &it->second;
    return nullptr;
}

const OutputArtifact *SiteSnapshot::output(std::string_view id) const {
    if (auto it = outputs.find(id); it != outputs.end())
        return &it->second;
    return nullptr;
}

std::optional<std::string> SubRenderCache::find(const std::string &key) {
    std::lock_guard lock(mtx_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        ++hits_;
        return it->second;
    }
    ++misses_;
    return std::nullopt;
}

void SubRenderCache::store(const std::string &key, std::string fragment) {
    std::lock_guard lock(mtx_);
    entries_.insert_or_assign(key, std::move(fragment));
}

size_t SubRenderCache::hits() const {
    std::lock_guard lock(mtx_);
    return hits_;
}

size_t SubRenderCache::misses() const {
    std::lock_guard lock(mtx_);
    return misses_;
}

size_t SubRenderCache::size() const {
    std::lock_guard lock(mtx_);
    return entries_.size();
}

} // namespace kiln
