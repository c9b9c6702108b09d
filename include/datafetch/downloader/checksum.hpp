#pragma once

/*
 * datafetch Checksum Verifier
 *
 * Streams file content through an OpenSSL EVP digest in fixed-size blocks.
 * Stateless apart from the streaming hasher; never touches the network.
 */

#include <datafetch/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace datafetch::downloader {

inline constexpr std::size_t kDefaultDigestBlockSize = 8192;
inline constexpr std::string_view kSkipDigest = "skip";

/**
 * Incremental hasher (reset/update/finalize). finalize() returns lower-case hex
 * and leaves the hasher ready for reuse with the same algorithm.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual Expected<void> reset(HashAlgo algo) = 0;
    virtual Expected<void> update(std::span<const std::byte> data) = 0;
    virtual Expected<std::string> finalize() = 0;
};

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();

/// "md5" / "sha256" (case-insensitive); anything else is UnsupportedAlgorithm.
Expected<HashAlgo> parseHashAlgo(std::string_view name);
std::string_view hashAlgoName(HashAlgo algo) noexcept;

/// True when expected is the skip sentinel (case-insensitive).
bool isSkipDigest(std::string_view expected) noexcept;

Expected<std::string> digestFile(const std::filesystem::path& path, HashAlgo algo,
                                 std::size_t blockSize = kDefaultDigestBlockSize);

/**
 * Compare the file's digest with expectedHex, ignoring case. The skip sentinel
 * succeeds without opening the file. A mismatch yields ChecksumMismatch.
 */
Expected<void> verifyFile(const std::filesystem::path& path, std::string_view expectedHex,
                          HashAlgo algo, std::size_t blockSize = kDefaultDigestBlockSize);

/// Overload taking the algorithm by name; the sentinel check happens before name parsing.
Expected<void> verifyFile(const std::filesystem::path& path, std::string_view expectedHex,
                          std::string_view algoName);

} // namespace datafetch::downloader
