#pragma once

#include "tsync/core/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsync::schedule {

using Variables = std::map<std::string, std::string>;

/**
 * Scan `output` line by line for KEY=VALUE. Lines are trimmed, '#' lines
 * are comments, keys must be identifiers of at most 50 characters and a
 * later line overwrites an earlier one.
 */
Variables parse_key_values(const std::string& output);

enum class ExtractorKind { Regex, JsonPath, Line, Split };

const char* to_string(ExtractorKind kind) noexcept;
std::optional<ExtractorKind> parse_extractor_kind(const std::string& name);

/**
 * @brief Named rule that pulls one value out of a run's output
 *
 * Expressions by kind:
 *   regex     ECMAScript pattern; first capture group, else the whole match
 *   jsonpath  "$.a.b[0]" over output parsed as JSON
 *   line      "line:N" (1-based), "first", "last", "after:K", "before:K", "contains:K"
 *   split     "sep:X,index:N"; negative N counts from the end
 */
struct OutputExtractor {
    std::string name;
    ExtractorKind kind = ExtractorKind::Regex;
    std::string expression;
    std::string default_value;
    bool enabled = true;
};

/// InvalidArgument for an empty name or an expression that cannot compile.
Result<void> validate_extractor(const OutputExtractor& extractor);

/// The extracted value, or the extractor's default when nothing matched.
std::string apply_extractor(const OutputExtractor& extractor, const std::string& output);

/// KEY=VALUE pairs from stdout, then every enabled extractor over stdout + stderr
/// (jsonpath extractors see stdout alone).
Variables extract_variables(const std::string& stdout_text,
                            const std::string& stderr_text,
                            const std::vector<OutputExtractor>& extractors);

} // namespace tsync::schedule
