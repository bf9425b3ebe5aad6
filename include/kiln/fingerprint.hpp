#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kiln {

/// @brief SHA-256 of a buffer, lowercase hex.
Fingerprint fingerprint_bytes(std::string_view bytes);

/**
 * @brief SHA-256 of a file's bytes.
 *
 * A pure function of content: mtime and size never enter the digest, so
 * touching a file without editing it keeps its fingerprint.
 *
 * @return The fingerprint, or a message naming the OS error if the file is unreadable.
 */
Result<Fingerprint> fingerprint_file(const std::filesystem::path &path);

/**
 * @brief Per-cycle memo of file fingerprints.
 *
 * Safe to share between discovery workers: lookups take a shared lock, inserts
 * an exclusive one, and the digest itself is computed outside the lock.
 */
class FingerprintStore {
public:
    Result<Fingerprint> fingerprint(const std::filesystem::path &path);

    /// Unreadable files count as changed.
    bool has_changed(const Fingerprint &previous, const std::filesystem::path &path);

    void clear();
    size_t size() const;

private:
    mutable std::shared_mutex mtx_;
    std::unordered_map<std::string, Fingerprint> memo_;
};

} // namespace kiln
