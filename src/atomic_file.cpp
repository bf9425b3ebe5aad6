#include "kiln/atomic_file.hpp"

#include "kiln/mmap.hpp"

#include <format>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace kiln {

namespace {

std::atomic<unsigned> g_temp_counter{0};

std::filesystem::path temp_sibling(const std::filesystem::path &path) {
    auto name = std::format(".{}.tmp.{}.{}", path.filename().string(), ::getpid(), g_temp_counter.fetch_add(1));
    return path.parent_path() / name;
}

std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

Result<void> write_all(int fd, std::string_view bytes) {
    while (!bytes.empty()) {
        ssize_t n = ::write(fd, bytes.data(), bytes.size());
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(errno_message(errno));
        }
        bytes.remove_prefix(static_cast<size_t>(n));
    }
    return {};
}

Result<void> sync_directory(const std::filesystem::path &dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd == -1)
        return std::unexpected(std::format("cannot open {}: {}", dir.string(), errno_message(errno)));
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0)
        return std::unexpected(std::format("fsync {}: {}", dir.string(), errno_message(err)));
    return {};
}

} // namespace

Result<void> write_file_atomic(const std::filesystem::path &path, std::string_view bytes, bool durable) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return std::unexpected(std::format("cannot create {}: {}", path.parent_path().string(), ec.message()));
    }

    auto tmp = temp_sibling(path);
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1)
        return std::unexpected(std::format("cannot create {}: {}", tmp.string(), errno_message(errno)));

    auto fail = [&](std::string msg) -> Result<void> {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(std::move(msg));
    };

    if (auto res = write_all(fd, bytes); !res) {
        ::close(fd);
        return fail(std::format("write {}: {}", tmp.string(), res.error()));
    }
    if (durable && ::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return fail(std::format("fsync {}: {}", tmp.string(), errno_message(err)));
    }
    if (::close(fd) != 0)
        return fail(std::format("close {}: {}", tmp.string(), errno_message(errno)));

    std::filesystem::rename(tmp, path, ec);
    if (ec)
        return fail(std::format("rename {} -> {}: {}", tmp.string(), path.string(), ec.message()));

    if (durable)
        return sync_directory(path.parent_path());
    return {};
}

Result<std::string> read_file(const std::filesystem::path &path) {
    try {
        MappedFile file(path);
        return std::string(file.content());
    } catch (const std::system_error &e) {
        return std::unexpected(std::format("{}: {}", path.string(), e.code().message()));
    }
}

} // namespace kiln
