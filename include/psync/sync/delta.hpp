#pragma once

#include "psync/core/result.hpp"
#include "psync/sync/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <unordered_map>
#include <variant>
#include <vector>

namespace psync::sync {

class CompressionProvider;

/**
 * @brief Signature of one fixed-size block of the base file
 */
struct BlockSignature {
    std::uint64_t offset = 0;
    std::uint32_t length = 0;   ///< block size, except possibly the last block
    Digest strong;
};

/**
 * @brief Weak checksum → candidate blocks, each list in ascending offset order
 *
 * Built once per DeltaCopy task and owned by it.
 */
class BlockIndex {
public:
    static BlockIndex build(const std::uint8_t* base,
                            std::size_t length,
                            std::size_t block_size,
                            const HashProvider& hashes);

    /// nullptr when no block has this weak checksum
    [[nodiscard]] const std::vector<BlockSignature>* candidates(std::uint32_t weak) const;

    [[nodiscard]] std::size_t block_count() const noexcept { return block_count_; }
    [[nodiscard]] std::size_t block_size() const noexcept { return block_size_; }

private:
    std::unordered_map<std::uint32_t, std::vector<BlockSignature>> by_weak_;
    std::size_t block_size_ = 0;
    std::size_t block_count_ = 0;
};

struct CopyBlock {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

/**
 * @brief Bytes absent from the base file
 *
 * When compressed is set, bytes holds the compressed payload and
 * raw_length the size it expands to.
 */
struct Literal {
    std::vector<std::uint8_t> bytes;
    std::uint64_t raw_length = 0;
    bool compressed = false;
};

using DeltaInstruction = std::variant<CopyBlock, Literal>;

/// Bytes the instruction contributes to the reconstructed file
std::uint64_t instruction_length(const DeltaInstruction& instruction) noexcept;

/**
 * @brief Ordered instructions that rebuild the source from the base
 */
struct DeltaPlan {
    std::vector<DeltaInstruction> instructions;
    std::uint64_t source_length = 0;
    std::uint64_t matched_bytes = 0;
    std::uint64_t literal_bytes = 0;

    [[nodiscard]] std::uint64_t reconstructed_length() const noexcept;

    /// Literal payload as it would travel (compressed size where compressed)
    [[nodiscard]] std::uint64_t encoded_literal_bytes() const noexcept;
};

/**
 * @brief rsync-style block matcher
 *
 * Slides a block-sized window over the source, keeping its weak checksum
 * rolling in O(1) per byte. A weak hit is only accepted after the strong
 * digests agree; among candidates sharing a weak checksum the lowest base
 * offset that verifies wins. Adjacent matched blocks are merged into one
 * CopyBlock.
 *
 * Before returning, the plan must account for exactly the source length
 * and every CopyBlock must lie inside the base. A plan failing that check
 * is discarded with ErrorKind::VerificationFailure.
 */
class DeltaEngine {
public:
    DeltaEngine(const HashProvider& hashes, std::size_t block_size);

    Result<DeltaPlan> compute(const std::uint8_t* base,
                              std::size_t base_length,
                              const std::uint8_t* source,
                              std::size_t source_length) const;

    Result<DeltaPlan> compute(const std::vector<std::uint8_t>& base,
                              const std::vector<std::uint8_t>& source) const;

    /// A missing base file is treated as empty
    Result<DeltaPlan> compute_files(const std::filesystem::path& base,
                                    const std::filesystem::path& source) const;

    [[nodiscard]] std::size_t block_size() const noexcept { return block_size_; }

private:
    Result<void> verify(const DeltaPlan& plan, std::size_t base_length) const;

    const HashProvider& hashes_;
    std::size_t block_size_;
};

/// Replace literals with compressed payloads where the provider finds it worthwhile
void compress_literals(DeltaPlan& plan, const CompressionProvider& compression);

/// In-memory reconstruction
Result<std::vector<std::uint8_t>> apply_delta(const std::vector<std::uint8_t>& base,
                                              const DeltaPlan& plan,
                                              const CompressionProvider* compression = nullptr);

/**
 * @brief Stream the reconstruction into @p output
 *
 * Instructions are applied strictly in order. Fails with
 * VerificationFailure when the written length differs from the plan.
 */
Result<std::uint64_t> apply_delta_file(const std::filesystem::path& base,
                                       const DeltaPlan& plan,
                                       const std::filesystem::path& output,
                                       const CompressionProvider* compression = nullptr);

Result<std::vector<std::uint8_t>> read_file_bytes(const std::filesystem::path& path);

} // namespace psync::sync
