#include "psync/sync/engine.hpp"

#include "psync/sync/delta.hpp"
#include "psync/sync/executor.hpp"
#include "psync/sync/scanner.hpp"
#include "psync/sync/scheduler.hpp"
#include "psync/sync/stats.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace psync::sync {

SyncEngine::SyncEngine(SyncOptions options, SyncEnvironment environment)
    : options_(std::move(options)),
      environment_(std::move(environment)),
      platform_(environment_.platform.value_or(detect_platform())) {
    if (environment_.hashes == nullptr) {
        owned_hashes_ = std::make_unique<OpenSslHashProvider>();
        environment_.hashes = owned_hashes_.get();
    }
    if (environment_.metadata == nullptr) {
        owned_metadata_ = std::make_unique<PosixMetadataApplier>();
        environment_.metadata = owned_metadata_.get();
    }
    if (environment_.compression == nullptr && options_.compression.enabled) {
        owned_compression_ = std::make_unique<ZstdCompressionProvider>(
            options_.compression.level, options_.compression.max_ratio, options_.compression.min_literal);
        environment_.compression = owned_compression_.get();
    }
    if (environment_.reporter == nullptr) {
        owned_reporter_ = std::make_unique<events::NullProgressReporter>();
        environment_.reporter = owned_reporter_.get();
    }
    if (!environment_.worker_cap) {
        environment_.worker_cap = default_worker_cap;
    }
}

SyncEngine::~SyncEngine() = default;

Result<void> SyncEngine::validate() const {
    if (auto valid = validate_options(options_, platform_, environment_.worker_cap); valid.is_error()) {
        return valid;
    }
    if (options_.move_files && options_.mirror) {
        spdlog::warn("Move combined with mirror: moved files will not be purged from the destination");
    }
    return Ok();
}

Result<SyncPlan> SyncEngine::plan() const {
    if (auto valid = validate(); valid.is_error()) {
        return Err<SyncPlan>(valid.error());
    }

    const HashProvider* checksums =
        options_.compare_mode == CompareMode::Checksum ? environment_.hashes : nullptr;
    const Scanner scanner(ScanFilter::from_options(options_), checksums);

    DestinationIndex destination;
    auto scanned = scanner.scan(options_.destination, [&destination](FileEntry entry) {
        destination.add(std::move(entry));
    });
    if (scanned.is_error()) {
        return Err<SyncPlan>(scanned.error());
    }
    spdlog::debug("Destination holds {} entr(ies)", scanned.value());

    Comparator comparator(ComparatorSettings::from_options(options_), std::move(destination));
    scanned = scanner.scan(options_.source, [&comparator](FileEntry entry) {
        comparator.add_source(entry);
    });
    if (scanned.is_error()) {
        return Err<SyncPlan>(scanned.error());
    }
    spdlog::debug("Source holds {} entr(ies)", scanned.value());

    return Ok(comparator.finish());
}

Result<RunSummary> SyncEngine::run() {
    const auto started = std::chrono::steady_clock::now();

    auto planned = plan();
    if (planned.is_error()) {
        return Err<RunSummary>(planned.error());
    }
    auto& sync_plan = planned.value();

    SyncStats stats;
    stats.record_skipped(sync_plan.skipped);

    auto& reporter = *environment_.reporter;
    reporter.run_started(events::RunStartedEvent{sync_plan.tasks.size(), sync_plan.total_bytes, options_.dry_run});

    if (options_.dry_run) {
        list_plan(sync_plan);
        stats.add_total(sync_plan.tasks.size());
        auto summary = stats.snapshot();
        summary.dry_run = true;
        summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        reporter.run_completed(events::RunCompletedEvent{summary});
        log_summary(summary);
        return Ok(summary);
    }

    if (options_.confirm) {
        list_plan(sync_plan);
        if (!environment_.confirm || !environment_.confirm(sync_plan)) {
            return Err<RunSummary>(ErrorKind::Cancellation, "Operation cancelled by user");
        }
    }

    std::error_code ec;
    fs::create_directories(options_.destination, ec);
    if (ec && !fs::is_directory(options_.destination)) {
        return Err<RunSummary>(io_error("Failed to create destination " + options_.destination.string(), ec));
    }

    const TaskExecutor executor(ExecutorSettings::from_options(options_), *environment_.hashes,
                                *environment_.metadata, environment_.compression, reporter);
    const RetryController retry(RetryPolicy::from_options(options_), environment_.sleeper);

    SchedulerSettings settings;
    settings.workers = resolve_worker_count(options_, platform_, environment_.worker_cap(platform_));
    settings.queue_capacity = options_.queue_capacity != 0 ? options_.queue_capacity : settings.workers * 2;
    settings.batching = options_.batching;

    spdlog::info("Synchronizing {} -> {} with {} worker(s)",
                 options_.source.string(), options_.destination.string(), settings.workers);

    TransferScheduler scheduler(settings, executor, retry, stats, reporter);
    scheduler.run(std::move(sync_plan.tasks));

    auto summary = stats.snapshot();
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    reporter.run_completed(events::RunCompletedEvent{summary});
    log_summary(summary);
    return Ok(summary);
}

void SyncEngine::list_plan(const SyncPlan& plan) const {
    const DeltaEngine delta(*environment_.hashes, options_.block_size);
    const char* tag = options_.dry_run ? "[dry-run]" : "[plan]";

    for (const auto& task : plan.tasks) {
        const auto kind = kind_of(task);
        const auto& path = target_path(task);

        if (const auto* copy = std::get_if<DeltaCopy>(&task)) {
            auto computed = delta.compute_files(options_.destination / copy->base_path,
                                                options_.source / copy->entry.path);
            if (computed.is_error()) {
                spdlog::warn("{} {} {} (delta unavailable: {})", tag, to_string(kind), path,
                             computed.error().describe());
                continue;
            }
            auto& delta_plan = computed.value();
            if (environment_.compression != nullptr) {
                compress_literals(delta_plan, *environment_.compression);
            }
            spdlog::info("{} {} {} ({} bytes, {} matched, {} literal, {} to send)", tag, to_string(kind), path,
                         copy->entry.size, delta_plan.matched_bytes, delta_plan.literal_bytes,
                         delta_plan.encoded_literal_bytes());
            continue;
        }

        const auto bytes = payload_size(task);
        if (bytes > 0 || kind == TaskKind::CopyWhole) {
            spdlog::info("{} {} {} ({} bytes)", tag, to_string(kind), path, bytes);
        } else {
            spdlog::info("{} {} {}", tag, to_string(kind), path);
        }
    }
    spdlog::info("{} {} task(s), {} unchanged, {} bytes", tag, plan.tasks.size(), plan.skipped, plan.total_bytes);
}

void SyncEngine::log_summary(const RunSummary& summary) const {
    spdlog::info("------------------------------------------------------------");
    spdlog::info("{:>12} {:>10} {:>10} {:>10}", "", "Total", "Done", "Failed");
    spdlog::info("{:>12} {:>10} {:>10} {:>10}", "Tasks", summary.total_tasks, summary.succeeded, summary.failed);
    spdlog::info("{:>12} {:>10}", "Skipped", summary.skipped);
    spdlog::info("{:>12} {:>10} (delta {}, fallback {})", "Files",
                 summary.files_copied, summary.delta_files, summary.delta_fallbacks);
    spdlog::info("{:>12} {:>10}", "Dirs", summary.dirs_created);
    spdlog::info("{:>12} {:>10}", "Symlinks", summary.symlinks_created);
    spdlog::info("{:>12} {:>10}", "Deleted", summary.files_deleted);
    spdlog::info("{:>12} {:>10}", "Bytes", summary.bytes_transferred);
    spdlog::info("{:>12} {:>10}", "Retries", summary.retries);
    spdlog::info("{:>12} {:>10}ms{}", "Elapsed", summary.duration.count(), summary.dry_run ? " (dry run)" : "");
}

} // namespace psync::sync
