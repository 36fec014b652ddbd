#include "psync/sync/types.hpp"

#include <nlohmann/json.hpp>

namespace psync::sync {
namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

TaskKind kind_of(const SyncTask& task) noexcept {
    return std::visit(overloaded{
        [](const CopyWhole&) { return TaskKind::CopyWhole; },
        [](const DeltaCopy&) { return TaskKind::DeltaCopy; },
        [](const DeletePath&) { return TaskKind::Delete; },
        [](const CreateDir&) { return TaskKind::CreateDir; },
        [](const CreateSymlink&) { return TaskKind::Symlink; },
    }, task);
}

const std::string& target_path(const SyncTask& task) noexcept {
    return std::visit(overloaded{
        [](const CopyWhole& t) -> const std::string& { return t.entry.path; },
        [](const DeltaCopy& t) -> const std::string& { return t.base_path; },
        [](const DeletePath& t) -> const std::string& { return t.path; },
        [](const CreateDir& t) -> const std::string& { return t.path; },
        [](const CreateSymlink& t) -> const std::string& { return t.path; },
    }, task);
}

std::uint64_t payload_size(const SyncTask& task) noexcept {
    if (const auto* copy = std::get_if<CopyWhole>(&task)) {
        return copy->entry.size;
    }
    if (const auto* delta = std::get_if<DeltaCopy>(&task)) {
        return delta->entry.size;
    }
    return 0;
}

const char* to_string(TaskKind kind) noexcept {
    switch (kind) {
        case TaskKind::CopyWhole: return "COPY";
        case TaskKind::DeltaCopy: return "DELTA";
        case TaskKind::Delete: return "DELETE";
        case TaskKind::CreateDir: return "MKDIR";
        case TaskKind::Symlink: return "SYMLINK";
    }
    return "UNKNOWN";
}

std::string summary_to_json(const RunSummary& summary) {
    nlohmann::json j;
    j["total_tasks"] = summary.total_tasks;
    j["succeeded"] = summary.succeeded;
    j["failed"] = summary.failed;
    j["skipped"] = summary.skipped;
    j["files_copied"] = summary.files_copied;
    j["delta_files"] = summary.delta_files;
    j["bytes_transferred"] = summary.bytes_transferred;
    j["files_deleted"] = summary.files_deleted;
    j["dirs_created"] = summary.dirs_created;
    j["symlinks_created"] = summary.symlinks_created;
    j["retries"] = summary.retries;
    j["delta_fallbacks"] = summary.delta_fallbacks;
    j["dry_run"] = summary.dry_run;
    j["duration_ms"] = summary.duration.count();
    j["any_failures"] = summary.any_failures();
    return j.dump(2);
}

} // namespace psync::sync
