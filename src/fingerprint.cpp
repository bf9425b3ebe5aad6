#include "kiln/fingerprint.hpp"

#include "kiln/mmap.hpp"

#include <format>
#include <algorithm>
#include <array>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <openssl/evp.h>
#include <system_error>

namespace kiln {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

constexpr size_t CHUNK_SZ = 1 << 20;

std::string to_hex(const unsigned char *digest, unsigned int len) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0f]);
    }
    return out;
}

Result<Fingerprint> digest(std::string_view bytes) {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx)
        return std::unexpected("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return std::unexpected("EVP_DigestInit_ex failed");

    while (!bytes.empty()) {
        size_t n = std::min(bytes.size(), CHUNK_SZ);
        if (EVP_DigestUpdate(ctx.get(), bytes.data(), n) != 1)
            return std::unexpected("EVP_DigestUpdate failed");
        bytes.remove_prefix(n);
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md.data(), &len) != 1)
        return std::unexpected("EVP_DigestFinal_ex failed");
    return to_hex(md.data(), len);
}

} // namespace

Fingerprint fingerprint_bytes(std::string_view bytes) {
    auto res = digest(bytes);
    if (!res)
        throw std::runtime_error(res.error());
    return std::move(*res);
}

Result<Fingerprint> fingerprint_file(const std::filesystem::path &path) {
    try {
        MappedFile file(path);
        return digest(file.content());
    } catch (const std::system_error &e) {
        return std::unexpected(std::format("{}: {}", path.string(), e.code().message()));
    }
}

Result<Fingerprint> FingerprintStore::fingerprint(const std::filesystem::path &path) {
    std::string key = path.lexically_normal().string();
    {
        std::shared_lock lock(mtx_);
        if (auto it = memo_.find(key); it != memo_.end())
            return it->second;
    }

    auto res = fingerprint_file(path);
    if (!res)
        return res;

    std::unique_lock lock(mtx_);
    auto [it, _] = memo_.emplace(std::move(key), std::move(*res));
    return it->second;
}

bool FingerprintStore::has_changed(const Fingerprint &previous, const std::filesystem::path &path) {
    auto current = fingerprint(path);
    if (!current)
        return true;
    return *current != previous;
}

void FingerprintStore::clear() {
    std::unique_lock lock(mtx_);
    memo_.clear();
}

size_t FingerprintStore::size() const {
    std::shared_lock lock(mtx_);
    return memo_.size();
}

} // namespace kiln
