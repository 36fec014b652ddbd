#include "psync/sync/compression.hpp"

#include <zstd.h>

#include <string>

namespace psync::sync {

ZstdCompressionProvider::ZstdCompressionProvider(int level, double max_ratio, std::size_t min_length)
    : level_(level), max_ratio_(max_ratio), min_length_(min_length) {}

std::optional<std::vector<std::uint8_t>> ZstdCompressionProvider::compress(const std::uint8_t* data,
                                                                           std::size_t length) const {
    if (length < min_length_) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out(ZSTD_compressBound(length));
    const std::size_t written = ZSTD_compress(out.data(), out.size(), data, length, level_);
    if (ZSTD_isError(written)) {
        return std::nullopt;
    }

    if (static_cast<double>(written) >= max_ratio_ * static_cast<double>(length)) {
        return std::nullopt;
    }
    out.resize(written);
    return out;
}

Result<std::vector<std::uint8_t>> ZstdCompressionProvider::decompress(const std::vector<std::uint8_t>& payload,
                                                                      std::size_t raw_length) const {
    std::vector<std::uint8_t> out(raw_length);
    const std::size_t written = ZSTD_decompress(out.data(), out.size(), payload.data(), payload.size());
    if (ZSTD_isError(written)) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::VerificationFailure,
                                              std::string("zstd decompression failed: ") +
                                                  ZSTD_getErrorName(written));
    }
    if (written != raw_length) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::VerificationFailure,
                                              "zstd decompression size mismatch");
    }
    return Ok(std::move(out));
}

} // namespace psync::sync
