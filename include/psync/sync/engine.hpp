#pragma once

#include "psync/core/config.hpp"
#include "psync/core/platform.hpp"
#include "psync/core/result.hpp"
#include "psync/events/progress.hpp"
#include "psync/sync/comparator.hpp"
#include "psync/sync/compression.hpp"
#include "psync/sync/hash.hpp"
#include "psync/sync/metadata.hpp"
#include "psync/sync/retry.hpp"
#include "psync/sync/types.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace psync::sync {

/**
 * @brief Collaborators a run is wired with
 *
 * Null pointers and empty functions select the defaults: OpenSSL SHA-256,
 * POSIX metadata, no progress output, real sleeping, host detection.
 */
struct SyncEnvironment {
    std::optional<PlatformInfo> platform;
    WorkerCapPolicy worker_cap;
    const HashProvider* hashes = nullptr;
    const MetadataApplier* metadata = nullptr;
    const CompressionProvider* compression = nullptr;   ///< overrides the zstd provider built from options
    events::ProgressReporter* reporter = nullptr;
    RetryController::Sleeper sleeper;

    /// Asked once with the full plan when SyncOptions::confirm is set; false cancels
    std::function<bool(const SyncPlan&)> confirm;
};

/**
 * @brief One synchronization run from validation to summary
 *
 * validate -> scan destination -> stream source scan through the
 * comparator -> (list | confirm) -> schedule -> summary.
 * ConfigurationError and Cancellation are returned before anything is
 * written; task failures only show up in the summary.
 */
class SyncEngine {
public:
    SyncEngine(SyncOptions options, SyncEnvironment environment = {});
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /// Validate and compare without touching the destination
    Result<SyncPlan> plan() const;

    Result<RunSummary> run();

    [[nodiscard]] const SyncOptions& options() const noexcept { return options_; }

private:
    Result<void> validate() const;
    void list_plan(const SyncPlan& plan) const;
    void log_summary(const RunSummary& summary) const;

    SyncOptions options_;
    SyncEnvironment environment_;
    PlatformInfo platform_;

    std::unique_ptr<HashProvider> owned_hashes_;
    std::unique_ptr<MetadataApplier> owned_metadata_;
    std::unique_ptr<CompressionProvider> owned_compression_;
    std::unique_ptr<events::ProgressReporter> owned_reporter_;
};

} // namespace psync::sync
