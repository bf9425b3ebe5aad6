#pragma once

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace kiln {

/**
 * @brief Read-only view of a whole file, memory mapped.
 *
 * Source fingerprinting reads through this so large assets are hashed without
 * copying. Empty files map to an empty view.
 * Throws std::system_error carrying the OS error on failure, which discovery
 * reports against the artifact.
 */
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path &path) {
#ifdef _WIN32
        file_handle_ = CreateFileW(
            path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (file_handle_ == INVALID_HANDLE_VALUE)
            fail("open", path, static_cast<int>(GetLastError()));

        LARGE_INTEGER file_size;
        if (!GetFileSizeEx(file_handle_, &file_size)) {
            int err = static_cast<int>(GetLastError());
            release();
            fail("stat", path, err);
        }
        size_ = static_cast<size_t>(file_size.QuadPart);
        if (size_ == 0)
            return;

        mapping_handle_ = CreateFileMappingW(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!mapping_handle_) {
            int err = static_cast<int>(GetLastError());
            release();
            fail("map", path, err);
        }
        void *addr = MapViewOfFile(mapping_handle_, FILE_MAP_READ, 0, 0, 0);
        if (!addr) {
            int err = static_cast<int>(GetLastError());
            release();
            fail("map", path, err);
        }
        data_ = static_cast<const char *>(addr);
#else
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1)
            fail("open", path, errno);

        struct stat sb;
        if (::fstat(fd_, &sb) == -1) {
            int err = errno;
            release();
            fail("stat", path, err);
        }
        if (!S_ISREG(sb.st_mode)) {
            release();
            fail("read", path, EISDIR);
        }
        size_ = static_cast<size_t>(sb.st_size);
        if (size_ == 0)
            return;

        ::posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
        void *addr = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (addr == MAP_FAILED) {
            int err = errno;
            release();
            fail("map", path, err);
        }
        data_ = static_cast<const char *>(addr);
#endif
    }

    ~MappedFile() {
        release();
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    size_t size() const {
        return size_;
    }

private:
    [[noreturn]] static void fail(const char *what, const std::filesystem::path &path, int err) {
#ifdef _WIN32
        throw std::system_error(err, std::system_category(), std::string("cannot ") + what + " " + path.string());
#else
        throw std::system_error(err, std::generic_category(), std::string("cannot ") + what + " " + path.string());
#endif
    }

    void release() {
#ifdef _WIN32
        if (data_)
            UnmapViewOfFile(data_);
        if (mapping_handle_)
            CloseHandle(mapping_handle_);
        if (file_handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(file_handle_);
        mapping_handle_ = nullptr;
        file_handle_ = INVALID_HANDLE_VALUE;
#else
        if (data_)
            ::munmap(const_cast<char *>(data_), size_);
        if (fd_ != -1)
            ::close(fd_);
        fd_ = -1;
#endif
        data_ = nullptr;
    }

#ifdef _WIN32
    HANDLE file_handle_ = INVALID_HANDLE_VALUE;
    HANDLE mapping_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    const char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace kiln
