#include "tsync/sync/diff_planner.hpp"

#include "tsync/sync/filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace tsync::sync {

namespace {

bool times_differ(const FileEntry& a, const FileEntry& b) {
    const auto delta = a.modified > b.modified ? a.modified - b.modified : b.modified - a.modified;
    return delta > DiffPlanner::kTimeTolerance;
}

FileOperation make_skip(const FileEntry& source, const FileEntry* target, std::string reason, bool warning) {
    FileOperation op;
    op.kind = OperationKind::Skip;
    op.path = source.path;
    op.entry_kind = source.kind;
    op.source = source;
    if (target != nullptr) {
        op.target = *target;
    }
    op.reason = std::move(reason);
    op.warning = warning;
    return op;
}

void mark_ancestors(const std::string& path, std::set<std::string>& occupied) {
    std::string current = path;
    for (auto slash = current.find_last_of('/'); slash != std::string::npos; slash = current.find_last_of('/')) {
        current.resize(slash);
        if (!occupied.insert(current).second) {
            break;
        }
    }
}

} // namespace

DiffPlanner::DiffPlanner(PlanOptions options) : options_(std::move(options)) {}

bool DiffPlanner::differs(const FileEntry& source, const FileEntry& target, CompareMethod method) {
    switch (method) {
        case CompareMethod::Size:
            return source.size != target.size;
        case CompareMethod::Time:
            return times_differ(source, target);
        case CompareMethod::Checksum:
            if (source.checksum && target.checksum) {
                return *source.checksum != *target.checksum;
            }
            break;
        case CompareMethod::SizeTime:
            break;
    }
    return source.size != target.size || times_differ(source, target);
}

Result<DiffPlan> DiffPlanner::plan(const std::vector<FileEntry>& source,
                                   const std::vector<FileEntry>& target,
                                   TimePoint now) const {
    auto compiled = PathFilter::compile(options_.filters, now);
    if (compiled.is_error()) {
        return Err<DiffPlan>(compiled.error());
    }
    const PathFilter& filter = compiled.value();

    std::map<std::string, const FileEntry*> source_index;
    std::set<std::string> source_paths;
    for (const auto& entry : source) {
        source_paths.insert(entry.path);
        if (!is_part_file(entry.path) && filter.accepts(entry)) {
            source_index.emplace(entry.path, &entry);
        }
    }
    std::map<std::string, const FileEntry*> target_index;
    for (const auto& entry : target) {
        if (!is_part_file(entry.path) && filter.accepts_path(entry)) {
            target_index.emplace(entry.path, &entry);
        }
    }

    DiffPlan plan;
    std::vector<FileOperation> skips;
    std::vector<FileOperation> deletes;

    for (const auto& [path, src] : source_index) {
        if (src->kind == FileKind::Other) {
            spdlog::warn("Skipping {}: not a regular file or directory", path);
            skips.push_back(make_skip(*src, nullptr, "special file", true));
            continue;
        }

        const auto found = target_index.find(path);
        if (found == target_index.end()) {
            FileOperation op;
            op.kind = OperationKind::Copy;
            op.path = path;
            op.entry_kind = src->kind;
            op.source = *src;
            op.reason = "missing on target";
            plan.operations.push_back(std::move(op));
            continue;
        }

        const FileEntry* tgt = found->second;
        if (tgt->kind != src->kind) {
            spdlog::warn("Skipping {}: {} on source but {} on target", path,
                         transport::to_string(src->kind), transport::to_string(tgt->kind));
            skips.push_back(make_skip(*src, tgt, "type mismatch", true));
            continue;
        }
        if (src->is_directory()) {
            continue;
        }
        if (options_.mode == SyncMode::AddOnly) {
            skips.push_back(make_skip(*src, tgt, "exists on target", false));
            continue;
        }
        if (differs(*src, *tgt, options_.compare)) {
            FileOperation op;
            op.kind = OperationKind::Update;
            op.path = path;
            op.entry_kind = FileKind::File;
            op.source = *src;
            op.target = *tgt;
            op.reason = "content differs";
            plan.operations.push_back(std::move(op));
        } else {
            skips.push_back(make_skip(*src, tgt, "unchanged", false));
        }
    }

    if (options_.mode == SyncMode::Mirror) {
        // Every target entry takes part, filtered ones included: they are
        // never deleted and they keep their parent directories alive
        std::map<std::string, const FileEntry*> everything;
        for (const auto& entry : target) {
            everything.emplace(entry.path, &entry);
        }
        std::set<std::string> occupied;
        for (auto it = everything.rbegin(); it != everything.rend(); ++it) {
            const auto& [path, tgt] = *it;
            const bool candidate = source_paths.count(path) == 0 && target_index.count(path) != 0;
            bool removable = candidate && tgt->kind != FileKind::Other;
            if (candidate && tgt->kind == FileKind::Other) {
                spdlog::warn("Leaving {} on target: not a regular file or directory", path);
            }
            if (removable && tgt->is_directory() && occupied.count(path) != 0) {
                spdlog::debug("Keeping directory {}: it still holds entries outside the sync", path);
                removable = false;
            }
            if (!removable) {
                mark_ancestors(path, occupied);
                continue;
            }
            FileOperation op;
            op.kind = OperationKind::Delete;
            op.path = path;
            op.entry_kind = tgt->kind;
            op.target = *tgt;
            op.reason = "absent from source";
            deletes.push_back(std::move(op));
        }
    }

    std::move(skips.begin(), skips.end(), std::back_inserter(plan.operations));
    std::move(deletes.begin(), deletes.end(), std::back_inserter(plan.operations));
    return Ok(std::move(plan));
}

} // namespace tsync::sync
