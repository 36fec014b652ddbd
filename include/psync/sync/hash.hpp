#pragma once

#include "psync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace psync::sync {

/// Raw strong-digest bytes
using Digest = std::string;

/**
 * @brief State of the rolling weak checksum over one window
 *
 * a is the byte sum, b the position-weighted sum, both kept modulo 2^16
 * when read through value(). Advancing the window by one byte is O(1).
 */
struct WeakSum {
    std::uint32_t a = 0;
    std::uint32_t b = 0;
    std::size_t window = 0;

    [[nodiscard]] std::uint32_t value() const noexcept {
        return ((b & 0xffffu) << 16) | (a & 0xffffu);
    }
};

/**
 * @brief Incremental strong digest for whole-file checksums
 */
class StrongHasher {
public:
    virtual ~StrongHasher() = default;
    virtual void update(const std::uint8_t* data, std::size_t length) = 0;
    virtual Digest finish() = 0;
};

/**
 * @brief Checksum primitives used by the delta engine and checksum mode
 *
 * The weak functions have a default rsync-style implementation; tests
 * override them to force collisions. All functions are pure.
 */
class HashProvider {
public:
    virtual ~HashProvider() = default;

    virtual Digest strong(const std::uint8_t* data, std::size_t length) const = 0;
    virtual std::unique_ptr<StrongHasher> strong_stream() const = 0;

    virtual WeakSum weak_init(const std::uint8_t* data, std::size_t length) const;

    /// Slide the window one byte: drop @p outgoing, append @p incoming
    virtual WeakSum weak_roll(WeakSum current, std::uint8_t outgoing, std::uint8_t incoming) const;

    /// Shrink the window from the front (used at end of input)
    virtual WeakSum weak_shrink(WeakSum current, std::uint8_t outgoing) const;
};

enum class StrongDigest {
    Sha256,
    Md5
};

/**
 * @brief HashProvider backed by OpenSSL EVP digests
 */
class OpenSslHashProvider final : public HashProvider {
public:
    explicit OpenSslHashProvider(StrongDigest digest = StrongDigest::Sha256);

    Digest strong(const std::uint8_t* data, std::size_t length) const override;
    std::unique_ptr<StrongHasher> strong_stream() const override;

    [[nodiscard]] StrongDigest algorithm() const noexcept { return digest_; }

private:
    StrongDigest digest_;
};

/// Strong digest of a whole file, streamed in @p buffer_size chunks
Result<Digest> hash_file(const HashProvider& hashes,
                         const std::filesystem::path& path,
                         std::size_t buffer_size = 1024 * 1024);

std::string to_hex(const Digest& digest);

} // namespace psync::sync
