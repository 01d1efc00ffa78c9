#pragma once

#include "tsync/core/result.hpp"
#include "tsync/sync/types.hpp"

#include <chrono>
#include <vector>

namespace tsync::sync {

struct PlanOptions {
    SyncMode mode = SyncMode::Incremental;
    CompareMethod compare = CompareMethod::SizeTime;
    FilterRules filters;
};

/**
 * @brief Turns two directory snapshots into an ordered DiffPlan
 *
 * Operations come out in three groups: copies and updates in path order
 * (so parent directories precede their children), then skips, then deletes
 * in reverse path order (children before parents). Deletes are only ever
 * planned in mirror mode.
 */
class DiffPlanner {
public:
    static constexpr std::chrono::seconds kTimeTolerance{2};

    explicit DiffPlanner(PlanOptions options);

    /// Planning error when a filter pattern or window is invalid.
    Result<DiffPlan> plan(const std::vector<FileEntry>& source,
                          const std::vector<FileEntry>& target,
                          TimePoint now = Clock::now()) const;

    /// True when `source` should replace `target` under `method`.
    static bool differs(const FileEntry& source, const FileEntry& target, CompareMethod method);

    [[nodiscard]] const PlanOptions& options() const noexcept { return options_; }

private:
    PlanOptions options_;
};

} // namespace tsync::sync
