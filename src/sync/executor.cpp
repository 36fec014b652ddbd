#include "psync/sync/executor.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace psync::sync {
namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::error_code last_errno() {
    return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(io_error("Failed to create directory: " + parent.string(), ec));
    }
    return Ok();
}

void discard(const fs::path& staging) {
    std::error_code ec;
    fs::remove(staging, ec);
    if (ec) {
        spdlog::warn("Could not remove staging file {}: {}", staging.string(), ec.message());
    }
}

} // namespace

ExecutorSettings ExecutorSettings::from_options(const SyncOptions& options) {
    ExecutorSettings settings;
    settings.source_root = options.source;
    settings.destination_root = options.destination;
    settings.copy_flags = options.copy_flags;
    settings.move_files = options.move_files;
    settings.block_size = options.block_size;
    settings.delta_max_size = options.batching.large_file_threshold;
    return settings;
}

TaskExecutor::TaskExecutor(ExecutorSettings settings,
                           const HashProvider& hashes,
                           const MetadataApplier& metadata,
                           const CompressionProvider* compression,
                           events::ProgressReporter& reporter)
    : settings_(std::move(settings)),
      hashes_(hashes),
      metadata_(metadata),
      compression_(compression),
      reporter_(reporter),
      delta_(hashes_, settings_.block_size) {}

fs::path TaskExecutor::staging_path_for(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".psync-tmp");
}

Result<TaskOutcome> TaskExecutor::execute(const SyncTask& task, std::size_t buffer_size) const {
    return std::visit(overloaded{
        [&](const CopyWhole& t) { return copy_whole(t.entry, buffer_size); },
        [&](const DeltaCopy& t) { return delta_copy(t, buffer_size); },
        [&](const DeletePath& t) { return remove_path(t); },
        [&](const CreateDir& t) { return create_dir(t); },
        [&](const CreateSymlink& t) { return create_symlink(t); },
    }, task);
}

Result<TaskOutcome> TaskExecutor::copy_whole(const FileEntry& entry, std::size_t buffer_size) const {
    const auto source = source_of(entry.path);
    const auto target = destination_of(entry.path);
    if (auto res = ensure_parent_exists(target); res.is_error()) {
        return Err<TaskOutcome>(res.error());
    }

    const auto staging = staging_path_for(target);
    auto copied = stream_copy(source, staging, entry, buffer_size);
    if (copied.is_error()) {
        discard(staging);
        return Err<TaskOutcome>(copied.error());
    }

    if (auto res = commit(entry, staging, target); res.is_error()) {
        return Err<TaskOutcome>(res.error());
    }

    TaskOutcome outcome;
    outcome.kind = TaskKind::CopyWhole;
    outcome.bytes_transferred = copied.value();
    return Ok(outcome);
}

Result<TaskOutcome> TaskExecutor::delta_copy(const DeltaCopy& task, std::size_t buffer_size) const {
    const auto source = source_of(task.entry.path);
    const auto target = destination_of(task.base_path);

    auto fall_back = [&](const Error& reason) -> Result<TaskOutcome> {
        spdlog::warn("Delta rejected for {} ({}), copying whole file", task.entry.path, reason.describe());
        auto whole = copy_whole(task.entry, buffer_size);
        if (whole.is_ok()) {
            whole.value().kind = TaskKind::DeltaCopy;
            whole.value().fell_back = true;
        }
        return whole;
    };

    std::error_code ec;
    const auto base_size = fs::exists(target, ec) ? fs::file_size(target, ec) : 0;
    if (ec) {
        return Err<TaskOutcome>(io_error("Failed to stat " + target.string(), ec));
    }
    if (task.entry.size > settings_.delta_max_size || base_size > settings_.delta_max_size) {
        spdlog::debug("{} exceeds the delta size limit, streaming whole file", task.entry.path);
        return copy_whole(task.entry, buffer_size);
    }

    auto plan = delta_.compute_files(target, source);
    if (plan.is_error()) {
        if (plan.error().kind == ErrorKind::VerificationFailure) {
            return fall_back(plan.error());
        }
        return Err<TaskOutcome>(plan.error());
    }

    if (compression_ != nullptr) {
        compress_literals(plan.value(), *compression_);
    }

    const auto staging = staging_path_for(target);
    auto written = apply_delta_file(target, plan.value(), staging, compression_);
    if (written.is_error()) {
        discard(staging);
        if (written.error().kind == ErrorKind::VerificationFailure) {
            return fall_back(written.error());
        }
        return Err<TaskOutcome>(written.error());
    }

    reporter_.task_progress(events::TaskProgressEvent{task.entry.path, written.value(), task.entry.size});

    if (auto res = commit(task.entry, staging, target); res.is_error()) {
        return Err<TaskOutcome>(res.error());
    }

    TaskOutcome outcome;
    outcome.kind = TaskKind::DeltaCopy;
    outcome.used_delta = true;
    outcome.matched_bytes = plan.value().matched_bytes;
    outcome.literal_bytes = plan.value().literal_bytes;
    outcome.bytes_transferred = plan.value().encoded_literal_bytes();
    return Ok(outcome);
}

Result<TaskOutcome> TaskExecutor::remove_path(const DeletePath& task) const {
    const auto target = destination_of(task.path);
    std::error_code ec;
    const auto removed = fs::remove_all(target, ec);
    if (ec) {
        return Err<TaskOutcome>(io_error("Failed to delete " + target.string(), ec));
    }

    TaskOutcome outcome;
    outcome.kind = TaskKind::Delete;
    outcome.entries_deleted = removed;
    return Ok(outcome);
}

Result<TaskOutcome> TaskExecutor::create_dir(const CreateDir& task) const {
    const auto target = destination_of(task.path);
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec && !fs::is_directory(target)) {
        return Err<TaskOutcome>(io_error("Failed to create directory " + target.string(), ec));
    }

    TaskOutcome outcome;
    outcome.kind = TaskKind::CreateDir;
    return Ok(outcome);
}

Result<TaskOutcome> TaskExecutor::create_symlink(const CreateSymlink& task) const {
    const auto target = destination_of(task.path);
    if (auto res = ensure_parent_exists(target); res.is_error()) {
        return Err<TaskOutcome>(res.error());
    }

    std::error_code ec;
    const auto existing = fs::symlink_status(target, ec);
    if (!ec && fs::exists(existing)) {
        fs::remove(target, ec);
        if (ec) {
            return Err<TaskOutcome>(io_error("Failed to replace " + target.string(), ec));
        }
    }
    ec.clear();

    fs::create_symlink(task.target, target, ec);
    if (ec) {
        return Err<TaskOutcome>(io_error("Failed to create symlink " + target.string(), ec));
    }

    TaskOutcome outcome;
    outcome.kind = TaskKind::Symlink;
    return Ok(outcome);
}

Result<std::uint64_t> TaskExecutor::stream_copy(const fs::path& from,
                                                const fs::path& to,
                                                const FileEntry& entry,
                                                std::size_t buffer_size) const {
    std::ifstream input(from, std::ios::binary);
    if (!input) {
        return Err<std::uint64_t>(io_error("Failed to open source file: " + from.string(), last_errno()));
    }

    std::ofstream output(to, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<std::uint64_t>(io_error("Failed to create staging file: " + to.string(), last_errno()));
    }

    std::vector<char> buffer(buffer_size == 0 ? 64 * 1024 : buffer_size);
    const bool report = entry.size > buffer.size();
    std::uint64_t copied = 0;

    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = input.gcount();
        if (bytes_read <= 0) {
            break;
        }
        output.write(buffer.data(), bytes_read);
        if (!output) {
            return Err<std::uint64_t>(io_error("Failed to write " + to.string(), last_errno()));
        }
        copied += static_cast<std::uint64_t>(bytes_read);
        if (report) {
            reporter_.task_progress(events::TaskProgressEvent{entry.path, copied, entry.size});
        }
    }

    if (input.bad()) {
        return Err<std::uint64_t>(io_error("Failed to read " + from.string(), last_errno()));
    }

    output.flush();
    if (!output) {
        return Err<std::uint64_t>(io_error("Failed to flush " + to.string(), last_errno()));
    }
    return Ok(copied);
}

Result<void> TaskExecutor::commit(const FileEntry& entry, const fs::path& staging, const fs::path& target) const {
    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        discard(staging);
        return Err<void>(io_error("Failed to move staging file to " + target.string(), ec));
    }

    const auto source = source_of(entry.path);
    if (auto res = metadata_.apply(entry, source, target, settings_.copy_flags); res.is_error()) {
        return res;
    }

    if (settings_.move_files) {
        fs::remove(source, ec);
        if (ec) {
            return Err<void>(io_error("Failed to remove moved source " + source.string(), ec));
        }
    }
    return Ok();
}

fs::path TaskExecutor::source_of(const std::string& relative) const {
    return settings_.source_root / fs::path(relative);
}

fs::path TaskExecutor::destination_of(const std::string& relative) const {
    return settings_.destination_root / fs::path(relative);
}

} // namespace psync::sync
