#pragma once

#include "tsync/core/time.hpp"
#include "tsync/transport/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tsync::transport {

/// One row of a server directory listing, before it is placed in the tree.
struct ListedEntry {
    std::string name;
    FileKind kind = FileKind::File;
    std::uint64_t size = 0;
    std::optional<TimePoint> modified;
};

/// Split a listing body on CRLF or LF, dropping empty lines.
std::vector<std::string> split_lines(const std::string& body);

/**
 * @brief Parse one RFC 3659 MLSD line ("type=file;size=12;modify=20240101120000; name")
 *
 * Returns nullopt for the "cdir"/"pdir" entries and for lines that carry no
 * name. Symbolic links ("OS.unix=symlink" style types) become FileKind::Other.
 */
std::optional<ListedEntry> parse_mlsd_line(const std::string& line);

/**
 * @brief Parse one `ls -l` style line as produced for SFTP directory URLs
 *
 * `now` resolves listings that omit the year ("Jan  1 12:00"): the most
 * recent such date not later than a day past `now` is chosen. Times are
 * read as UTC.
 */
std::optional<ListedEntry> parse_unix_listing_line(const std::string& line, TimePoint now);

/// "YYYYMMDDHHMMSS[.fff]" in UTC, as used by MDTM/MLSD/MFMT.
std::optional<TimePoint> parse_ftp_timestamp(const std::string& text);
std::string format_ftp_timestamp(TimePoint tp);

/// RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT") for the SFTP `mtime` quote command.
std::string format_rfc1123(TimePoint tp);

} // namespace tsync::transport
