#include "tsync/sync/filter.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <sstream>
#include <vector>

namespace tsync::sync {

namespace {

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

bool glob(const std::string& pattern, const std::string& text, int flags = 0) {
    return ::fnmatch(pattern.c_str(), text.c_str(), flags) == 0;
}

/// Full path and every ancestor ("a/b/c", "a/b", "a")
std::vector<std::string> path_prefixes(const std::string& path) {
    std::vector<std::string> prefixes;
    std::string current = path;
    while (!current.empty()) {
        prefixes.push_back(current);
        const auto slash = current.find_last_of('/');
        if (slash == std::string::npos) {
            break;
        }
        current.resize(slash);
    }
    return prefixes;
}

bool matches_path(const std::string& pattern, const std::string& path,
                  const std::vector<std::string>& components) {
    if (pattern.find('/') == std::string::npos) {
        return std::any_of(components.begin(), components.end(),
                           [&](const std::string& part) { return glob(pattern, part); });
    }
    const auto prefixes = path_prefixes(path);
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](const std::string& prefix) { return glob(pattern, prefix, FNM_PATHNAME); });
}

TimePoint start_of_day(TimePoint now) {
    std::tm fields = to_calendar(now, TimeZone::Local);
    fields.tm_hour = 0;
    fields.tm_min = 0;
    fields.tm_sec = 0;
    return from_calendar(fields, TimeZone::Local).value_or(now);
}

} // namespace

Result<void> validate_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        return Err<void>(ErrorKind::Planning, "empty filter pattern");
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            if (i + 1 == pattern.size()) {
                return Err<void>(ErrorKind::Planning, "dangling escape in pattern '" + pattern + "'");
            }
            ++i;
        } else if (pattern[i] == '[') {
            std::size_t j = i + 1;
            if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
                ++j;
            }
            // A ']' directly after the opening bracket is a literal member
            if (j < pattern.size() && pattern[j] == ']') {
                ++j;
            }
            const auto close = pattern.find(']', j);
            if (close == std::string::npos) {
                return Err<void>(ErrorKind::Planning, "unterminated '[' in pattern '" + pattern + "'");
            }
            i = close;
        }
    }
    return Ok();
}

Result<PathFilter> PathFilter::compile(const FilterRules& rules, TimePoint now) {
    for (const auto* list : {&rules.include, &rules.exclude}) {
        for (const auto& pattern : *list) {
            if (auto valid = validate_pattern(pattern); valid.is_error()) {
                return Err<PathFilter>(valid.error());
            }
        }
    }
    if (rules.min_size > 0 && rules.max_size > 0 && rules.min_size > rules.max_size) {
        return Err<PathFilter>(ErrorKind::Planning, "min_size exceeds max_size");
    }

    PathFilter filter(rules);
    const auto today = start_of_day(now);
    const auto day = std::chrono::hours(24);
    switch (rules.window) {
        case TimeWindow::Any:
            break;
        case TimeWindow::Today:
            filter.after_ = today;
            filter.before_ = now;
            break;
        case TimeWindow::Yesterday:
            filter.after_ = today - day;
            filter.before_ = today;
            break;
        case TimeWindow::LastDays3:
            filter.after_ = today - 3 * day;
            filter.before_ = now;
            break;
        case TimeWindow::LastDays7:
            filter.after_ = today - 7 * day;
            filter.before_ = now;
            break;
        case TimeWindow::LastDays30:
            filter.after_ = today - 30 * day;
            filter.before_ = now;
            break;
        case TimeWindow::Custom:
            filter.after_ = rules.modified_after;
            filter.before_ = rules.modified_before;
            break;
    }
    if (filter.after_ && filter.before_ && *filter.after_ > *filter.before_) {
        return Err<PathFilter>(ErrorKind::Planning, "modification window ends before it starts");
    }
    return Ok(std::move(filter));
}

bool PathFilter::accepts_path(const FileEntry& entry) const {
    const auto components = split_components(entry.path);

    if (!rules_.include_hidden) {
        const bool hidden = std::any_of(components.begin(), components.end(),
                                        [](const std::string& part) { return part.front() == '.'; });
        if (hidden) {
            return false;
        }
    }

    // Directory names match the entry itself when it is a directory, and
    // every ancestor otherwise
    const std::size_t dir_count = entry.is_directory() ? components.size()
                                                       : (components.empty() ? 0 : components.size() - 1);
    for (std::size_t i = 0; i < dir_count; ++i) {
        const auto& name = components[i];
        if (std::find(rules_.exclude_dirs.begin(), rules_.exclude_dirs.end(), name) != rules_.exclude_dirs.end()) {
            return false;
        }
    }

    for (const auto& pattern : rules_.exclude) {
        if (matches_path(pattern, entry.path, components)) {
            return false;
        }
    }

    if (!entry.is_file()) {
        return true;
    }

    if (!rules_.include.empty()) {
        const std::string name = components.empty() ? entry.path : components.back();
        const bool included = std::any_of(rules_.include.begin(), rules_.include.end(), [&](const std::string& pattern) {
            return pattern.find('/') == std::string::npos ? glob(pattern, name)
                                                          : glob(pattern, entry.path, FNM_PATHNAME);
        });
        if (!included) {
            return false;
        }
    }
    return true;
}

bool PathFilter::accepts(const FileEntry& entry) const {
    if (!accepts_path(entry)) {
        return false;
    }
    if (!entry.is_file()) {
        return true;
    }

    if (rules_.min_size > 0 && entry.size < rules_.min_size) {
        return false;
    }
    if (rules_.max_size > 0 && entry.size > rules_.max_size) {
        return false;
    }

    if (entry.modified != TimePoint{}) {
        if (after_ && entry.modified < *after_) {
            return false;
        }
        if (before_ && entry.modified > *before_) {
            return false;
        }
    }
    return true;
}

} // namespace tsync::sync
