#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace kiln {

enum class ErrorKind : uint8_t {
    Discovery,   ///< unreadable source; artifact skipped
    Render,      ///< per-output failure; previous output left in place
    CacheLoad,   ///< degrades to a full rebuild
    CacheCommit, ///< fatal for the cycle
    Config,      ///< fatal, raised before Dispatching
    Cancelled,   ///< user interrupt; nothing committed
};

struct BuildError {
    ErrorKind kind;
    std::string artifact; // empty for cycle-level errors
    std::string message;
};

std::string_view to_string(ErrorKind kind);

/// @brief Cycle-fatal kinds stop the state machine; the rest are collected.
inline bool is_fatal(ErrorKind kind) {
    return kind == ErrorKind::CacheCommit || kind == ErrorKind::Config || kind == ErrorKind::Cancelled;
}

std::string describe(const BuildError &err);

} // namespace kiln
