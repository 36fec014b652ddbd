#include "psync/sync/delta.hpp"

#include "psync/sync/compression.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace psync::sync {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kApplyBufferSize = 256 * 1024;

class PlanBuilder {
public:
    explicit PlanBuilder(DeltaPlan& plan) : plan_(plan) {}

    void add_literal_byte(std::uint8_t byte) { pending_.push_back(byte); }

    void add_literal(const std::uint8_t* data, std::size_t length) {
        pending_.insert(pending_.end(), data, data + length);
    }

    void add_copy(std::uint64_t offset, std::uint64_t length) {
        flush();
        plan_.matched_bytes += length;
        if (!plan_.instructions.empty()) {
            if (auto* last = std::get_if<CopyBlock>(&plan_.instructions.back());
                last && last->offset + last->length == offset) {
                last->length += length;
                return;
            }
        }
        plan_.instructions.emplace_back(CopyBlock{offset, length});
    }

    void flush() {
        if (pending_.empty()) {
            return;
        }
        Literal literal;
        literal.raw_length = pending_.size();
        literal.bytes = std::move(pending_);
        plan_.literal_bytes += literal.raw_length;
        plan_.instructions.emplace_back(std::move(literal));
        pending_.clear();
    }

private:
    DeltaPlan& plan_;
    std::vector<std::uint8_t> pending_;
};

Result<std::vector<std::uint8_t>> literal_bytes(const Literal& literal, const CompressionProvider* compression) {
    if (!literal.compressed) {
        return Ok(literal.bytes);
    }
    if (compression == nullptr) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::VerificationFailure,
                                              "compressed literal without a compression provider");
    }
    return compression->decompress(literal.bytes, static_cast<std::size_t>(literal.raw_length));
}

} // namespace

BlockIndex BlockIndex::build(const std::uint8_t* base,
                             std::size_t length,
                             std::size_t block_size,
                             const HashProvider& hashes) {
    BlockIndex index;
    index.block_size_ = block_size;
    if (block_size == 0) {
        return index;
    }

    for (std::size_t offset = 0; offset < length; offset += block_size) {
        const auto block_length = std::min(block_size, length - offset);
        const auto weak = hashes.weak_init(base + offset, block_length).value();
        // Offsets increase monotonically, so every list stays sorted
        index.by_weak_[weak].push_back(BlockSignature{
            offset, static_cast<std::uint32_t>(block_length), hashes.strong(base + offset, block_length)});
        ++index.block_count_;
    }
    return index;
}

const std::vector<BlockSignature>* BlockIndex::candidates(std::uint32_t weak) const {
    auto it = by_weak_.find(weak);
    return it == by_weak_.end() ? nullptr : &it->second;
}

std::uint64_t instruction_length(const DeltaInstruction& instruction) noexcept {
    if (const auto* copy = std::get_if<CopyBlock>(&instruction)) {
        return copy->length;
    }
    return std::get<Literal>(instruction).raw_length;
}

std::uint64_t DeltaPlan::reconstructed_length() const noexcept {
    std::uint64_t total = 0;
    for (const auto& instruction : instructions) {
        total += instruction_length(instruction);
    }
    return total;
}

std::uint64_t DeltaPlan::encoded_literal_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& instruction : instructions) {
        if (const auto* literal = std::get_if<Literal>(&instruction)) {
            total += literal->bytes.size();
        }
    }
    return total;
}

DeltaEngine::DeltaEngine(const HashProvider& hashes, std::size_t block_size)
    : hashes_(hashes), block_size_(block_size) {}

Result<DeltaPlan> DeltaEngine::compute(const std::uint8_t* base,
                                       std::size_t base_length,
                                       const std::uint8_t* source,
                                       std::size_t source_length) const {
    if (block_size_ == 0) {
        return Err<DeltaPlan>(ErrorKind::ConfigurationError, "block size must be > 0");
    }

    DeltaPlan plan;
    plan.source_length = source_length;
    PlanBuilder builder(plan);

    if (base_length == 0 || source_length == 0) {
        builder.add_literal(source, source_length);
        builder.flush();
        if (auto check = verify(plan, base_length); check.is_error()) {
            return Err<DeltaPlan>(check.error());
        }
        return Ok(std::move(plan));
    }

    const auto index = BlockIndex::build(base, base_length, block_size_, hashes_);

    std::size_t pos = 0;
    WeakSum sum = hashes_.weak_init(source, std::min(block_size_, source_length));

    while (pos < source_length) {
        const std::size_t window = sum.window;

        bool matched = false;
        if (const auto* candidates = index.candidates(sum.value())) {
            std::optional<Digest> window_digest;
            for (const auto& candidate : *candidates) {
                if (candidate.length != window) {
                    continue;
                }
                if (!window_digest) {
                    window_digest = hashes_.strong(source + pos, window);
                }
                if (*window_digest == candidate.strong) {
                    builder.add_copy(candidate.offset, candidate.length);
                    pos += window;
                    matched = true;
                    break;
                }
            }
        }

        if (matched) {
            if (pos < source_length) {
                sum = hashes_.weak_init(source + pos, std::min(block_size_, source_length - pos));
            }
            continue;
        }

        builder.add_literal_byte(source[pos]);
        if (pos + window < source_length) {
            sum = hashes_.weak_roll(sum, source[pos], source[pos + window]);
        } else {
            sum = hashes_.weak_shrink(sum, source[pos]);
        }
        ++pos;
    }

    builder.flush();

    if (auto check = verify(plan, base_length); check.is_error()) {
        return Err<DeltaPlan>(check.error());
    }
    return Ok(std::move(plan));
}

Result<DeltaPlan> DeltaEngine::compute(const std::vector<std::uint8_t>& base,
                                       const std::vector<std::uint8_t>& source) const {
    return compute(base.data(), base.size(), source.data(), source.size());
}

Result<DeltaPlan> DeltaEngine::compute_files(const fs::path& base, const fs::path& source) const {
    auto source_bytes = read_file_bytes(source);
    if (source_bytes.is_error()) {
        return Err<DeltaPlan>(source_bytes.error());
    }

    std::error_code ec;
    std::vector<std::uint8_t> base_bytes;
    if (fs::exists(base, ec)) {
        auto loaded = read_file_bytes(base);
        if (loaded.is_error()) {
            return Err<DeltaPlan>(loaded.error());
        }
        base_bytes = std::move(loaded.value());
    }

    return compute(base_bytes, source_bytes.value());
}

Result<void> DeltaEngine::verify(const DeltaPlan& plan, std::size_t base_length) const {
    std::uint64_t total = 0;
    for (const auto& instruction : plan.instructions) {
        if (const auto* copy = std::get_if<CopyBlock>(&instruction)) {
            if (copy->length == 0 || copy->offset + copy->length > base_length) {
                return Err<void>(ErrorKind::VerificationFailure, "copy instruction outside base file");
            }
        }
        total += instruction_length(instruction);
    }
    if (total != plan.source_length) {
        return Err<void>(ErrorKind::VerificationFailure,
                         "delta plan covers " + std::to_string(total) + " bytes, source has " +
                             std::to_string(plan.source_length));
    }
    return Ok();
}

void compress_literals(DeltaPlan& plan, const CompressionProvider& compression) {
    for (auto& instruction : plan.instructions) {
        auto* literal = std::get_if<Literal>(&instruction);
        if (literal == nullptr || literal->compressed) {
            continue;
        }
        if (auto packed = compression.compress(literal->bytes.data(), literal->bytes.size())) {
            literal->bytes = std::move(*packed);
            literal->compressed = true;
        }
    }
}

Result<std::vector<std::uint8_t>> apply_delta(const std::vector<std::uint8_t>& base,
                                              const DeltaPlan& plan,
                                              const CompressionProvider* compression) {
    std::vector<std::uint8_t> out;
    out.reserve(static_cast<std::size_t>(plan.source_length));

    for (const auto& instruction : plan.instructions) {
        if (const auto* copy = std::get_if<CopyBlock>(&instruction)) {
            if (copy->offset + copy->length > base.size()) {
                return Err<std::vector<std::uint8_t>>(ErrorKind::VerificationFailure,
                                                      "Block match extends beyond base data");
            }
            const auto begin = base.begin() + static_cast<std::ptrdiff_t>(copy->offset);
            out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(copy->length));
            continue;
        }

        auto bytes = literal_bytes(std::get<Literal>(instruction), compression);
        if (bytes.is_error()) {
            return Err<std::vector<std::uint8_t>>(bytes.error());
        }
        out.insert(out.end(), bytes.value().begin(), bytes.value().end());
    }

    if (out.size() != plan.source_length) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::VerificationFailure,
                                              "reconstructed size differs from source");
    }
    return Ok(std::move(out));
}

Result<std::uint64_t> apply_delta_file(const fs::path& base,
                                       const DeltaPlan& plan,
                                       const fs::path& output,
                                       const CompressionProvider* compression) {
    std::ifstream input;
    const bool needs_base = std::any_of(plan.instructions.begin(), plan.instructions.end(),
                                        [](const auto& i) { return std::holds_alternative<CopyBlock>(i); });
    if (needs_base) {
        input.open(base, std::ios::binary);
        if (!input) {
            return Err<std::uint64_t>(io_error("Failed to open base file: " + base.string(),
                                               std::error_code(errno, std::generic_category())));
        }
    }

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<std::uint64_t>(io_error("Failed to create output file: " + output.string(),
                                           std::error_code(errno, std::generic_category())));
    }

    std::vector<char> buffer(kApplyBufferSize);
    std::uint64_t written = 0;

    for (const auto& instruction : plan.instructions) {
        if (const auto* copy = std::get_if<CopyBlock>(&instruction)) {
            input.clear();
            input.seekg(static_cast<std::streamoff>(copy->offset));
            std::uint64_t remaining = copy->length;
            while (remaining > 0) {
                const auto chunk = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
                input.read(buffer.data(), chunk);
                if (input.gcount() != chunk) {
                    return Err<std::uint64_t>(ErrorKind::VerificationFailure,
                                              "base file shorter than copy instruction: " + base.string());
                }
                out.write(buffer.data(), chunk);
                remaining -= static_cast<std::uint64_t>(chunk);
                written += static_cast<std::uint64_t>(chunk);
            }
            continue;
        }

        auto bytes = literal_bytes(std::get<Literal>(instruction), compression);
        if (bytes.is_error()) {
            return Err<std::uint64_t>(bytes.error());
        }
        out.write(reinterpret_cast<const char*>(bytes.value().data()),
                  static_cast<std::streamsize>(bytes.value().size()));
        written += bytes.value().size();
    }

    out.flush();
    if (!out) {
        return Err<std::uint64_t>(io_error("Failed to write output file: " + output.string(),
                                           std::error_code(EIO, std::generic_category())));
    }
    if (written != plan.source_length) {
        return Err<std::uint64_t>(ErrorKind::VerificationFailure, "reconstructed size differs from source");
    }
    return Ok(written);
}

Result<std::vector<std::uint8_t>> read_file_bytes(const fs::path& path) {
    std::ifstream input(path, std::ios::binary | std::ios::ate);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(io_error("Failed to open file: " + path.string(),
                                                       std::error_code(errno, std::generic_category())));
    }
    const auto size = input.tellg();
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(std::max<std::streamoff>(size, 0)));
    input.seekg(0);
    if (!bytes.empty() && !input.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
        return Err<std::vector<std::uint8_t>>(io_error("Failed to read file: " + path.string(),
                                                       std::error_code(EIO, std::generic_category())));
    }
    return Ok(std::move(bytes));
}

} // namespace psync::sync
