/*
 * datafetch/src/downloader/integrity_verifier.cpp
 *
 * Checksum verifier (MD5 / SHA-256 via OpenSSL EVP)
 *
 * Implements datafetch::downloader::IIntegrityVerifier using OpenSSL's EVP interface
 * and the file-level digest/verify helpers built on it.
 * - Files are read sequentially in fixed-size blocks; memory use is bounded by the block size.
 * - The digest is independent of the block size.
 * - The "skip" sentinel short-circuits verification before any file access.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 * - C++20 (std::span)
 */

#include <datafetch/downloader/checksum.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace datafetch::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
    }
    return nullptr;
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() = default;
    ~OpenSslIntegrityVerifier() override = default;

    Expected<void> reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(algo);
        _ctx = EvpMdCtx{};
        if (!_ctx || !_md) {
            return Error{ErrorCode::UnsupportedAlgorithm, "EVP digest context unavailable"};
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            _ctx = EvpMdCtx{};
            return Error{ErrorCode::Unknown, "EVP_DigestInit_ex failed"};
        }
        return {};
    }

    Expected<void> update(std::span<const std::byte> data) override {
        if (!_ctx)
            return Error{ErrorCode::InvalidArgument, "digest not initialized"};
        if (data.empty())
            return {};
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            return Error{ErrorCode::Unknown, "EVP_DigestUpdate failed"};
        }
        return {};
    }

    Expected<std::string> finalize() override {
        if (!_ctx)
            return Error{ErrorCode::InvalidArgument, "digest not initialized"};

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _ctx = EvpMdCtx{};
            return Error{ErrorCode::Unknown, "EVP_DigestFinal_ex failed"};
        }
        auto hex = to_hex_lower(md_buf.data(), md_len);

        // Prepare for reuse with the same algorithm
        auto r = reset(_algo);
        if (!r.ok())
            return r.error();
        return hex;
    }

private:
    HashAlgo _algo{HashAlgo::Md5};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

Expected<HashAlgo> parseHashAlgo(std::string_view name) {
    const auto lower = to_lower(name);
    if (lower == "md5")
        return HashAlgo::Md5;
    if (lower == "sha256")
        return HashAlgo::Sha256;
    return Error{ErrorCode::UnsupportedAlgorithm,
                 "Unsupported checksum type: " + std::string(name)};
}

std::string_view hashAlgoName(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha256:
            return "sha256";
    }
    return "md5";
}

bool isSkipDigest(std::string_view expected) noexcept {
    if (expected.size() != kSkipDigest.size())
        return false;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(expected[i])) != kSkipDigest[i])
            return false;
    }
    return true;
}

Expected<std::string> digestFile(const std::filesystem::path& path, HashAlgo algo,
                                 std::size_t blockSize) {
    if (blockSize == 0)
        return Error{ErrorCode::InvalidArgument, "digest block size must be positive"};

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot open file for checksum: " + path.string()};
    }

    OpenSslIntegrityVerifier hasher;
    if (auto r = hasher.reset(algo); !r.ok())
        return r.error();

    std::vector<char> buffer(blockSize);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
           file.gcount() > 0) {
        const auto n = static_cast<std::size_t>(file.gcount());
        auto r = hasher.update(std::as_bytes(std::span<const char>(buffer.data(), n)));
        if (!r.ok())
            return r.error();
    }
    if (file.bad()) {
        return Error{ErrorCode::IoError, "Read failed while hashing: " + path.string()};
    }
    return hasher.finalize();
}

Expected<void> verifyFile(const std::filesystem::path& path, std::string_view expectedHex,
                          HashAlgo algo, std::size_t blockSize) {
    if (isSkipDigest(expectedHex))
        return {};

    auto actual = digestFile(path, algo, blockSize);
    if (!actual.ok())
        return actual.error();

    if (actual.value() != to_lower(expectedHex)) {
        return Error{ErrorCode::ChecksumMismatch, "Checksum mismatch: expected " +
                                                      std::string(expectedHex) + ", got " +
                                                      actual.value()};
    }
    return {};
}

Expected<void> verifyFile(const std::filesystem::path& path, std::string_view expectedHex,
                          std::string_view algoName) {
    if (isSkipDigest(expectedHex))
        return {};
    auto algo = parseHashAlgo(algoName);
    if (!algo.ok())
        return algo.error();
    return verifyFile(path, expectedHex, algo.value());
}

} // namespace datafetch::downloader
