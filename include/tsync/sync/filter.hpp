#pragma once

#include "tsync/core/result.hpp"
#include "tsync/sync/types.hpp"

#include <optional>
#include <string>

namespace tsync::sync {

/// Rejects empty patterns and unterminated bracket expressions.
Result<void> validate_pattern(const std::string& pattern);

/**
 * @brief Compiled form of FilterRules
 *
 * Order of checks: hidden components, excluded directory names, exclude
 * patterns, include patterns (files only), size bounds (files only),
 * modification window (files with a known time only). A pattern without
 * '/' is matched against every path component, one with '/' against the
 * whole relative path and each of its ancestors.
 *
 * accepts_path() applies only the name rules. Size and time bounds
 * describe what to copy, so they are checked on source entries alone.
 */
class PathFilter {
public:
    static Result<PathFilter> compile(const FilterRules& rules, TimePoint now);

    [[nodiscard]] bool accepts(const FileEntry& entry) const;
    [[nodiscard]] bool accepts_path(const FileEntry& entry) const;

    [[nodiscard]] const std::optional<TimePoint>& window_start() const noexcept { return after_; }
    [[nodiscard]] const std::optional<TimePoint>& window_end() const noexcept { return before_; }

private:
    explicit PathFilter(FilterRules rules) : rules_(std::move(rules)) {}

    FilterRules rules_;
    std::optional<TimePoint> after_;
    std::optional<TimePoint> before_;
};

} // namespace tsync::sync
