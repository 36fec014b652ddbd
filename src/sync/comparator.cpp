#include "psync/sync/comparator.hpp"

#include <algorithm>
#include <utility>

namespace psync::sync {

void DestinationIndex::add(FileEntry entry) {
    auto key = entry.path;
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

const FileEntry* DestinationIndex::find(const std::string& path) const {
    auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : &it->second;
}

const char* to_string(Action action) noexcept {
    switch (action) {
        case Action::Skip: return "SKIP";
        case Action::CopyWhole: return "COPY";
        case Action::DeltaCopy: return "DELTA";
        case Action::Delete: return "DELETE";
        case Action::CreateDir: return "MKDIR";
        case Action::Symlink: return "SYMLINK";
    }
    return "UNKNOWN";
}

ComparatorSettings ComparatorSettings::from_options(const SyncOptions& options) {
    ComparatorSettings settings;
    settings.mode = options.compare_mode;
    settings.purge = options.purge_enabled();
    settings.delta_threshold = options.delta_threshold;
    settings.delta_max_size = options.batching.large_file_threshold;
    return settings;
}

std::size_t SyncPlan::count(TaskKind kind) const {
    return static_cast<std::size_t>(std::count_if(tasks.begin(), tasks.end(),
        [kind](const SyncTask& task) { return kind_of(task) == kind; }));
}

Comparator::Comparator(ComparatorSettings settings, DestinationIndex destination)
    : settings_(settings), destination_(std::move(destination)) {}

Decision Comparator::decide(const FileEntry* source, const FileEntry* destination) const {
    if (source == nullptr) {
        return Decision{settings_.purge ? Action::Delete : Action::Skip, false};
    }

    const bool kind_changed = destination != nullptr && destination->kind != source->kind;

    if (source->is_directory()) {
        if (destination != nullptr && !kind_changed) {
            return Decision{Action::Skip, false};
        }
        return Decision{Action::CreateDir, kind_changed};
    }

    if (source->is_symlink()) {
        if (destination != nullptr && !kind_changed && destination->symlink_target == source->symlink_target) {
            return Decision{Action::Skip, false};
        }
        return Decision{Action::Symlink, kind_changed};
    }

    if (destination == nullptr || kind_changed) {
        return Decision{Action::CopyWhole, kind_changed};
    }

    if (content_equal(*source, *destination)) {
        return Decision{Action::Skip, false};
    }

    if (source->size == 0 || destination->size <= settings_.delta_threshold) {
        return Decision{Action::CopyWhole, false};
    }
    if (source->size > settings_.delta_max_size || destination->size > settings_.delta_max_size) {
        return Decision{Action::CopyWhole, false};
    }
    return Decision{Action::DeltaCopy, false};
}

bool Comparator::content_equal(const FileEntry& source, const FileEntry& destination) const {
    if (settings_.mode == CompareMode::Checksum && source.checksum && destination.checksum) {
        return source.size == destination.size && *source.checksum == *destination.checksum;
    }
    // Only a newer source counts, so runs without preserved timestamps stay idempotent
    return source.size == destination.size && source.modified <= destination.modified;
}

void Comparator::add_source(const FileEntry& source) {
    const FileEntry* destination = destination_.find(source.path);
    if (destination != nullptr) {
        matched_.insert(source.path);
    }

    const auto decision = decide(&source, destination);
    if (decision.replace_existing) {
        push(DeletePath{source.path});
    }

    switch (decision.action) {
        case Action::Skip:
            ++plan_.skipped;
            break;
        case Action::CopyWhole:
            push(CopyWhole{source});
            break;
        case Action::DeltaCopy:
            push(DeltaCopy{source, source.path});
            break;
        case Action::CreateDir:
            push(CreateDir{source.path});
            break;
        case Action::Symlink:
            push(CreateSymlink{source.path, source.symlink_target});
            break;
        case Action::Delete:
            push(DeletePath{source.path});
            break;
    }
}

SyncPlan Comparator::finish() {
    if (settings_.purge) {
        std::vector<std::string> orphans;
        for (const auto& item : destination_.entries()) {
            if (matched_.count(item.first) == 0) {
                orphans.push_back(item.first);
            }
        }
        std::sort(orphans.begin(), orphans.end());
        for (auto& path : orphans) {
            push(DeletePath{std::move(path)});
        }
    }

    matched_.clear();
    return std::exchange(plan_, SyncPlan{});
}

void Comparator::push(SyncTask task) {
    plan_.total_bytes += payload_size(task);
    plan_.tasks.push_back(std::move(task));
}

} // namespace psync::sync
