#pragma once

#include "psync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace psync::sync {

/**
 * @brief Optional literal compression applied per literal at transfer time
 */
class CompressionProvider {
public:
    virtual ~CompressionProvider() = default;

    /// Compressed bytes, or nullopt when compression would not pay off
    virtual std::optional<std::vector<std::uint8_t>> compress(const std::uint8_t* data,
                                                               std::size_t length) const = 0;

    virtual Result<std::vector<std::uint8_t>> decompress(const std::vector<std::uint8_t>& payload,
                                                         std::size_t raw_length) const = 0;
};

/**
 * @brief zstd single-shot compression
 *
 * Literals shorter than min_length stay raw, and a result is only kept
 * when it is smaller than max_ratio times the input.
 */
class ZstdCompressionProvider final : public CompressionProvider {
public:
    explicit ZstdCompressionProvider(int level = 3, double max_ratio = 0.9, std::size_t min_length = 64);

    std::optional<std::vector<std::uint8_t>> compress(const std::uint8_t* data,
                                                       std::size_t length) const override;

    Result<std::vector<std::uint8_t>> decompress(const std::vector<std::uint8_t>& payload,
                                                 std::size_t raw_length) const override;

private:
    int level_;
    double max_ratio_;
    std::size_t min_length_;
};

} // namespace psync::sync
