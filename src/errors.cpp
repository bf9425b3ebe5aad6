#include "kiln/errors.hpp"

#include <format>

namespace kiln {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Discovery:
        return "DiscoveryError";
    case ErrorKind::Render:
        return "RenderError";
    case ErrorKind::CacheLoad:
        return "CacheLoadError";
    case ErrorKind::CacheCommit:
        return "CacheCommitError";
    case ErrorKind::Config:
        return "ConfigError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "UnknownError";
}

std::string describe(const BuildError &err) {
    if (err.artifact.empty())
        return std::format("{}: {}", to_string(err.kind), err.message);
    return std::format("{} [{}]: {}", to_string(err.kind), err.artifact, err.message);
}

} // namespace kiln
