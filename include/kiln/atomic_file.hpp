#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace kiln {

/**
 * @brief Replaces `path` with `bytes` so readers see the old file or the new one, never a mix.
 *
 * Writes a sibling temp file and renames it over the target. With `durable`, the
 * temp file and the parent directory are fsync'ed so the rename survives a crash.
 * The temp file is removed on any failure.
 */
Result<void> write_file_atomic(const std::filesystem::path &path, std::string_view bytes, bool durable);

Result<std::string> read_file(const std::filesystem::path &path);

} // namespace kiln
