#include "tsync/schedule/output_parser.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace tsync::schedule {

namespace {

constexpr std::size_t kMaxKeyLength = 50;

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool is_identifier(const std::string& key) {
    if (key.empty() || key.size() > kMaxKeyLength) {
        return false;
    }
    if (!(std::isalpha(static_cast<unsigned char>(key[0])) || key[0] == '_')) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// ECMAScript has no dot-all flag; rewrite '.' outside brackets so it crosses newlines.
std::string dot_matches_newline(const std::string& expression) {
    std::string out;
    out.reserve(expression.size());
    bool in_class = false;
    for (std::size_t i = 0; i < expression.size(); ++i) {
        const char c = expression[i];
        if (c == '\\' && i + 1 < expression.size()) {
            out += c;
            out += expression[++i];
        } else if (in_class) {
            out += c;
            in_class = c != ']';
        } else if (c == '[') {
            out += c;
            in_class = true;
            // A leading ']' (after an optional '^') is a class member
            if (i + 1 < expression.size() && expression[i + 1] == '^') {
                out += expression[++i];
            }
            if (i + 1 < expression.size() && expression[i + 1] == ']') {
                out += expression[++i];
            }
        } else if (c == '.') {
            out += "[\\s\\S]";
        } else {
            out += c;
        }
    }
    return out;
}

std::regex compile_pattern(const std::string& expression) {
    return std::regex(dot_matches_newline(expression), std::regex::ECMAScript | std::regex::multiline);
}

std::optional<std::string> extract_regex(const std::string& expression, const std::string& output) {
    const std::regex pattern = compile_pattern(expression);
    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    return match.size() > 1 ? match[1].str() : match[0].str();
}

std::optional<std::string> extract_json(const std::string& expression, const std::string& output) {
    const auto document = nlohmann::json::parse(output, nullptr, false);
    if (document.is_discarded()) {
        return std::nullopt;
    }

    std::string path = trim(expression);
    if (starts_with(path, "$.")) {
        path.erase(0, 2);
    } else if (starts_with(path, "$")) {
        path.erase(0, 1);
    }

    const nlohmann::json* node = &document;
    std::istringstream keys(path);
    std::string key;
    while (std::getline(keys, key, '.')) {
        if (key.empty()) {
            continue;
        }
        std::string name = key;
        std::optional<std::size_t> index;
        const auto bracket = key.find('[');
        if (bracket != std::string::npos && key.back() == ']') {
            name = key.substr(0, bracket);
            const auto digits = key.substr(bracket + 1, key.size() - bracket - 2);
            if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            index = std::stoul(digits);
        }
        if (!name.empty()) {
            if (!node->is_object() || !node->contains(name)) {
                return std::nullopt;
            }
            node = &(*node)[name];
        }
        if (index) {
            if (!node->is_array() || *index >= node->size()) {
                return std::nullopt;
            }
            node = &(*node)[*index];
        }
    }

    if (node->is_null()) {
        return std::nullopt;
    }
    return node->is_string() ? node->get<std::string>() : node->dump();
}

std::optional<std::string> extract_line(const std::string& expression, const std::string& output) {
    const auto lines = lines_of(trim(output));
    const auto expr = lowercase(trim(expression));

    if (starts_with(expr, "line:")) {
        const auto number = trim(expr.substr(5));
        if (number.empty() || !std::all_of(number.begin(), number.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        const auto n = std::stoul(number);
        if (n >= 1 && n <= lines.size()) {
            return trim(lines[n - 1]);
        }
        return std::nullopt;
    }
    if (expr == "first") {
        return lines.empty() ? std::nullopt : std::optional<std::string>(trim(lines.front()));
    }
    if (expr == "last") {
        return lines.empty() ? std::nullopt : std::optional<std::string>(trim(lines.back()));
    }

    // Keyword forms keep the keyword's original case
    const auto keyword_after = [&](std::size_t prefix) { return trim(trim(expression).substr(prefix)); };
    if (starts_with(expr, "after:")) {
        const auto keyword = keyword_after(6);
        for (const auto& line : lines) {
            if (const auto pos = line.find(keyword); pos != std::string::npos) {
                return trim(line.substr(pos + keyword.size()));
            }
        }
    } else if (starts_with(expr, "before:")) {
        const auto keyword = keyword_after(7);
        for (const auto& line : lines) {
            if (const auto pos = line.find(keyword); pos != std::string::npos) {
                return trim(line.substr(0, pos));
            }
        }
    } else if (starts_with(expr, "contains:")) {
        const auto keyword = keyword_after(9);
        for (const auto& line : lines) {
            if (line.find(keyword) != std::string::npos) {
                return trim(line);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_split(const std::string& expression, const std::string& output) {
    const auto marker = expression.find("index:");
    if (marker == std::string::npos) {
        return std::nullopt;
    }
    std::string separator = expression.substr(0, marker);
    // "sep:,index:2" leaves "sep:," - drop the prefix and one joining comma
    if (starts_with(separator, "sep:")) {
        separator.erase(0, 4);
    }
    if (separator.size() > 1 && separator.back() == ',') {
        separator.pop_back();
    }
    if (separator.empty()) {
        separator = " ";
    }

    const auto index_text = trim(expression.substr(marker + 6));
    long index = 0;
    try {
        std::size_t consumed = 0;
        index = std::stol(index_text, &consumed);
        if (consumed != index_text.size()) {
            return std::nullopt;
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    }

    std::vector<std::string> items;
    const auto text = trim(output);
    std::size_t start = 0;
    for (;;) {
        const auto pos = text.find(separator, start);
        if (pos == std::string::npos) {
            items.push_back(text.substr(start));
            break;
        }
        items.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }

    const long count = static_cast<long>(items.size());
    if (index < 0) {
        index += count;
    }
    if (index < 0 || index >= count) {
        return std::nullopt;
    }
    return trim(items[static_cast<std::size_t>(index)]);
}

} // namespace

Variables parse_key_values(const std::string& output) {
    Variables vars;
    for (const auto& raw : lines_of(output)) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = trim(line.substr(0, eq));
        if (!is_identifier(key)) {
            continue;
        }
        vars[key] = trim(line.substr(eq + 1));
    }
    return vars;
}

const char* to_string(ExtractorKind kind) noexcept {
    switch (kind) {
        case ExtractorKind::Regex: return "regex";
        case ExtractorKind::JsonPath: return "jsonpath";
        case ExtractorKind::Line: return "line";
        case ExtractorKind::Split: return "split";
    }
    return "unknown";
}

std::optional<ExtractorKind> parse_extractor_kind(const std::string& name) {
    if (name == "regex") return ExtractorKind::Regex;
    if (name == "jsonpath") return ExtractorKind::JsonPath;
    if (name == "line") return ExtractorKind::Line;
    if (name == "split") return ExtractorKind::Split;
    return std::nullopt;
}

Result<void> validate_extractor(const OutputExtractor& extractor) {
    if (extractor.name.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "output extractor needs a variable name");
    }
    if (extractor.kind == ExtractorKind::Regex) {
        try {
            compile_pattern(extractor.expression);
        } catch (const std::regex_error& e) {
            return Err<void>(ErrorKind::InvalidArgument,
                             "bad pattern for '" + extractor.name + "': " + e.what());
        }
    }
    if (extractor.kind == ExtractorKind::Split && extractor.expression.find("index:") == std::string::npos) {
        return Err<void>(ErrorKind::InvalidArgument, "split extractor '" + extractor.name + "' has no index");
    }
    return Ok();
}

std::string apply_extractor(const OutputExtractor& extractor, const std::string& output) {
    std::optional<std::string> value;
    try {
        switch (extractor.kind) {
            case ExtractorKind::Regex: value = extract_regex(extractor.expression, output); break;
            case ExtractorKind::JsonPath: value = extract_json(extractor.expression, output); break;
            case ExtractorKind::Line: value = extract_line(extractor.expression, output); break;
            case ExtractorKind::Split: value = extract_split(extractor.expression, output); break;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Extractor '{}' failed, using default: {}", extractor.name, e.what());
    }
    return value.value_or(extractor.default_value);
}

Variables extract_variables(const std::string& stdout_text,
                            const std::string& stderr_text,
                            const std::vector<OutputExtractor>& extractors) {
    Variables vars = parse_key_values(stdout_text);
    const std::string combined = stdout_text + "\n" + stderr_text;
    for (const auto& extractor : extractors) {
        if (!extractor.enabled) {
            continue;
        }
        // stderr text would make the document unparsable
        const std::string& text = extractor.kind == ExtractorKind::JsonPath ? stdout_text : combined;
        vars[extractor.name] = apply_extractor(extractor, text);
    }
    return vars;
}

} // namespace tsync::schedule
