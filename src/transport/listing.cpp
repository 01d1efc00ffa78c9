#include "tsync/transport/listing.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace tsync::transport {

namespace {

constexpr std::array<const char*, 12> kMonths = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<int> month_index(const std::string& name) {
    const auto lower = lowercase(name);
    for (std::size_t i = 0; i < kMonths.size(); ++i) {
        if (lower == kMonths[i]) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

} // namespace

std::vector<std::string> split_lines(const std::string& body) {
    std::vector<std::string> lines;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::optional<ListedEntry> parse_mlsd_line(const std::string& line) {
    // Facts are terminated by ';', then a single space precedes the name
    const auto separator = line.find("; ");
    if (separator == std::string::npos) {
        return std::nullopt;
    }
    ListedEntry entry;
    entry.name = line.substr(separator + 2);
    if (entry.name.empty()) {
        return std::nullopt;
    }

    std::istringstream facts(line.substr(0, separator + 1));
    std::string fact;
    bool typed = false;
    while (std::getline(facts, fact, ';')) {
        const auto eq = fact.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = lowercase(fact.substr(0, eq));
        const auto value = fact.substr(eq + 1);
        if (key == "type") {
            const auto type = lowercase(value);
            if (type == "cdir" || type == "pdir") {
                return std::nullopt;
            }
            typed = true;
            if (type == "file") {
                entry.kind = FileKind::File;
            } else if (type == "dir") {
                entry.kind = FileKind::Directory;
            } else {
                entry.kind = FileKind::Other;
            }
        } else if (key == "size" && all_digits(value)) {
            entry.size = std::strtoull(value.c_str(), nullptr, 10);
        } else if (key == "modify") {
            entry.modified = parse_ftp_timestamp(value);
        }
    }
    if (!typed) {
        return std::nullopt;
    }
    if (entry.kind != FileKind::File) {
        entry.size = 0;
    }
    return entry;
}

std::optional<ListedEntry> parse_unix_listing_line(const std::string& line, TimePoint now) {
    // perms links owner group size month day time-or-year name
    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (fields.size() < 8) {
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        const auto end = line.find(' ', pos);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        fields.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    if (pos + 1 >= line.size()) {
        return std::nullopt;
    }
    std::string name = line.substr(pos + 1);

    const auto& perms = fields[0];
    if (perms.size() < 10 || !all_digits(fields[4])) {
        return std::nullopt;
    }

    ListedEntry entry;
    switch (perms[0]) {
        case '-': entry.kind = FileKind::File; break;
        case 'd': entry.kind = FileKind::Directory; break;
        default: entry.kind = FileKind::Other; break;
    }
    if (entry.kind == FileKind::Other) {
        const auto arrow = name.find(" -> ");
        if (arrow != std::string::npos) {
            name.resize(arrow);
        }
    }
    if (name == "." || name == "..") {
        return std::nullopt;
    }
    entry.name = std::move(name);
    if (entry.kind == FileKind::File) {
        entry.size = std::strtoull(fields[4].c_str(), nullptr, 10);
    }

    const auto month = month_index(fields[5]);
    if (month && all_digits(fields[6])) {
        std::tm tm{};
        tm.tm_mon = *month;
        tm.tm_mday = std::atoi(fields[6].c_str());
        const auto& when = fields[7];
        const auto colon = when.find(':');
        if (colon != std::string::npos) {
            tm.tm_hour = std::atoi(when.substr(0, colon).c_str());
            tm.tm_min = std::atoi(when.substr(colon + 1).c_str());
            tm.tm_year = to_calendar(now, TimeZone::Utc).tm_year;
            auto candidate = from_calendar(tm, TimeZone::Utc);
            if (candidate && *candidate > now + std::chrono::hours(24)) {
                tm.tm_year -= 1;
                candidate = from_calendar(tm, TimeZone::Utc);
            }
            entry.modified = candidate;
        } else if (all_digits(when)) {
            tm.tm_year = std::atoi(when.c_str()) - 1900;
            entry.modified = from_calendar(tm, TimeZone::Utc);
        }
    }
    return entry;
}

std::optional<TimePoint> parse_ftp_timestamp(const std::string& text) {
    const auto digits = text.substr(0, text.find('.'));
    if (digits.size() != 14 || !all_digits(digits)) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = std::atoi(digits.substr(0, 4).c_str()) - 1900;
    tm.tm_mon = std::atoi(digits.substr(4, 2).c_str()) - 1;
    tm.tm_mday = std::atoi(digits.substr(6, 2).c_str());
    tm.tm_hour = std::atoi(digits.substr(8, 2).c_str());
    tm.tm_min = std::atoi(digits.substr(10, 2).c_str());
    tm.tm_sec = std::atoi(digits.substr(12, 2).c_str());
    return from_calendar(tm, TimeZone::Utc);
}

std::string format_ftp_timestamp(TimePoint tp) {
    return format_time(tp, "%Y%m%d%H%M%S", TimeZone::Utc);
}

std::string format_rfc1123(TimePoint tp) {
    return format_time(tp, "%a, %d %b %Y %H:%M:%S GMT", TimeZone::Utc);
}

} // namespace tsync::transport
