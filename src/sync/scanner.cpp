#include "psync/sync/scanner.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace psync::sync {
namespace {

std::string file_name_of(const std::string& relative_path) {
    const auto slash = relative_path.rfind('/');
    return slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
}

bool matches_any(const std::vector<std::string>& patterns, const std::string& relative_path) {
    const auto name = file_name_of(relative_path);
    for (const auto& pattern : patterns) {
        if (matches_pattern(pattern, name) || matches_pattern(pattern, relative_path)) {
            return true;
        }
    }
    return false;
}

} // namespace

bool matches_pattern(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

ScanFilter ScanFilter::from_options(const SyncOptions& options) {
    ScanFilter filter;
    filter.exclude_files = options.exclude_files;
    filter.exclude_dirs = options.exclude_dirs;
    filter.min_size = options.min_size;
    filter.max_size = options.max_size;
    return filter;
}

bool ScanFilter::excludes_file(const std::string& relative_path, std::uint64_t size) const {
    if (min_size && size < *min_size) {
        return true;
    }
    if (max_size && size > *max_size) {
        return true;
    }
    return matches_any(exclude_files, relative_path);
}

bool ScanFilter::excludes_dir(const std::string& relative_path) const {
    return matches_any(exclude_dirs, relative_path);
}

Scanner::Scanner(ScanFilter filter, const HashProvider* checksums)
    : filter_(std::move(filter)), checksums_(checksums) {}

Result<std::size_t> Scanner::scan(const fs::path& root, const Visitor& visit) const {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return Ok<std::size_t>(0);
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return Err<std::size_t>(io_error("Failed to scan " + root.string(), ec));
    }

    std::size_t visited = 0;
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Skipping unreadable entry under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }

        const auto& entry = *it;
        std::error_code rel_ec;
        auto relative = fs::relative(entry.path(), root, rel_ec);
        if (rel_ec || relative.empty()) {
            continue;
        }
        std::string normalized = relative.generic_string();

        const bool is_symlink = entry.is_symlink(rel_ec);
        if (!is_symlink && entry.is_directory(rel_ec) && filter_.excludes_dir(normalized)) {
            it.disable_recursion_pending();
            continue;
        }

        auto file_entry = build_entry(entry, std::move(normalized));
        if (!file_entry) {
            continue;
        }
        ++visited;
        visit(std::move(*file_entry));
    }

    return Ok(visited);
}

Result<std::vector<FileEntry>> Scanner::collect(const fs::path& root) const {
    std::vector<FileEntry> entries;
    auto scanned = scan(root, [&entries](FileEntry entry) { entries.push_back(std::move(entry)); });
    if (scanned.is_error()) {
        return Err<std::vector<FileEntry>>(scanned.error());
    }
    return Ok(std::move(entries));
}

std::optional<FileEntry> Scanner::build_entry(const fs::directory_entry& entry,
                                              std::string relative_path) const {
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec) {
        spdlog::warn("Cannot stat {}: {}", entry.path().string(), ec.message());
        return std::nullopt;
    }

    FileEntry result;
    result.path = std::move(relative_path);
    result.permissions = status.permissions();

    if (fs::is_symlink(status)) {
        result.kind = EntryKind::Symlink;
        auto target = fs::read_symlink(entry.path(), ec);
        if (ec) {
            spdlog::warn("Cannot read link {}: {}", entry.path().string(), ec.message());
            return std::nullopt;
        }
        result.symlink_target = target.generic_string();
        return result;
    }

    if (fs::is_directory(status)) {
        result.kind = EntryKind::Directory;
        result.modified = entry.last_write_time(ec);
        return result;
    }

    if (!fs::is_regular_file(status)) {
        spdlog::debug("Ignoring special file {}", entry.path().string());
        return std::nullopt;
    }

    result.kind = EntryKind::File;
    result.size = entry.file_size(ec);
    if (ec) {
        spdlog::warn("Cannot size {}: {}", entry.path().string(), ec.message());
        return std::nullopt;
    }
    if (filter_.excludes_file(result.path, result.size)) {
        return std::nullopt;
    }
    result.modified = entry.last_write_time(ec);

    if (checksums_ != nullptr) {
        auto digest = hash_file(*checksums_, entry.path());
        if (digest.is_ok()) {
            result.checksum = std::move(digest.value());
        } else {
            spdlog::warn("Checksum unavailable for {}: {}", result.path, digest.error().describe());
        }
    }
    return result;
}

} // namespace psync::sync
