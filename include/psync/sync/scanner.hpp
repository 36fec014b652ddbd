#pragma once

#include "psync/core/config.hpp"
#include "psync/core/result.hpp"
#include "psync/sync/hash.hpp"
#include "psync/sync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace psync::sync {

/// Shell-style match: '*' any run of characters, '?' exactly one
bool matches_pattern(std::string_view pattern, std::string_view text);

/**
 * @brief Which entries a scan leaves out
 *
 * Patterns are tried against both the entry name and its relative path.
 * Size bounds only apply to regular files.
 */
struct ScanFilter {
    std::vector<std::string> exclude_files;
    std::vector<std::string> exclude_dirs;
    std::optional<std::uint64_t> min_size;
    std::optional<std::uint64_t> max_size;

    static ScanFilter from_options(const SyncOptions& options);

    [[nodiscard]] bool excludes_file(const std::string& relative_path, std::uint64_t size) const;
    [[nodiscard]] bool excludes_dir(const std::string& relative_path) const;
};

/**
 * @brief Streams the entries of a tree to a visitor as they are found
 *
 * Symlinks are reported as symlinks and never followed. When a hash
 * provider is supplied every regular file gets its whole-file checksum
 * cached on the entry.
 */
class Scanner {
public:
    using Visitor = std::function<void(FileEntry)>;

    explicit Scanner(ScanFilter filter = {}, const HashProvider* checksums = nullptr);

    /// Number of entries visited. A missing root yields zero entries.
    Result<std::size_t> scan(const std::filesystem::path& root, const Visitor& visit) const;

    Result<std::vector<FileEntry>> collect(const std::filesystem::path& root) const;

private:
    std::optional<FileEntry> build_entry(const std::filesystem::directory_entry& entry,
                                         std::string relative_path) const;

    ScanFilter filter_;
    const HashProvider* checksums_;
};

} // namespace psync::sync
