#include "psync/sync/stats.hpp"

namespace psync::sync {

void SyncStats::record(const TaskOutcome& outcome) {
    bump(succeeded_);
    bump(bytes_transferred_, outcome.bytes_transferred);

    switch (outcome.kind) {
        case TaskKind::CopyWhole:
        case TaskKind::DeltaCopy:
            bump(files_copied_);
            if (outcome.used_delta) {
                bump(delta_files_);
            }
            if (outcome.fell_back) {
                bump(delta_fallbacks_);
            }
            break;
        case TaskKind::Delete:
            bump(files_deleted_, outcome.entries_deleted);
            break;
        case TaskKind::CreateDir:
            bump(dirs_created_);
            break;
        case TaskKind::Symlink:
            bump(symlinks_created_);
            break;
    }
}

RunSummary SyncStats::snapshot() const {
    RunSummary summary;
    summary.total_tasks = read(total_tasks_);
    summary.succeeded = read(succeeded_);
    summary.failed = read(errors_);
    summary.skipped = read(skipped_);
    summary.files_copied = read(files_copied_);
    summary.delta_files = read(delta_files_);
    summary.bytes_transferred = read(bytes_transferred_);
    summary.files_deleted = read(files_deleted_);
    summary.dirs_created = read(dirs_created_);
    summary.symlinks_created = read(symlinks_created_);
    summary.retries = read(retries_);
    summary.delta_fallbacks = read(delta_fallbacks_);
    return summary;
}

} // namespace psync::sync
