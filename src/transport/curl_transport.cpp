#include "tsync/transport/curl_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <iomanip>
#include <sstream>

namespace tsync::transport {

namespace {

constexpr std::size_t kMaxPooledHandles = 16;

/// curl_global_init must run once before any handle exists
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using Slist = std::unique_ptr<curl_slist, SlistDeleter>;

struct UploadCursor {
    const Bytes* data = nullptr;
    std::size_t position = 0;
};

std::size_t append_to_string(char* data, std::size_t size, std::size_t count, void* target) {
    static_cast<std::string*>(target)->append(data, size * count);
    return size * count;
}

std::size_t append_to_bytes(char* data, std::size_t size, std::size_t count, void* target) {
    auto* bytes = static_cast<Bytes*>(target);
    const auto* begin = reinterpret_cast<const std::uint8_t*>(data);
    bytes->insert(bytes->end(), begin, begin + size * count);
    return size * count;
}

std::size_t read_from_cursor(char* buffer, std::size_t size, std::size_t count, void* source) {
    auto* cursor = static_cast<UploadCursor*>(source);
    const std::size_t remaining = cursor->data->size() - cursor->position;
    const std::size_t chunk = std::min(remaining, size * count);
    std::copy_n(cursor->data->data() + cursor->position, chunk, reinterpret_cast<std::uint8_t*>(buffer));
    cursor->position += chunk;
    return chunk;
}

std::string escape_component(const std::string& component) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : component) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out << static_cast<char>(c);
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::vector<std::string> components(const std::string& absolute_path) {
    std::vector<std::string> parts;
    std::istringstream stream(absolute_path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string escaped_path(const std::string& absolute_path) {
    std::string out;
    for (const auto& part : components(absolute_path)) {
        if (!out.empty()) {
            out += '/';
        }
        out += escape_component(part);
    }
    return out;
}

/// Double-quoted argument for libcurl's SFTP quote parser
std::string sftp_quote(const std::string& path) {
    std::string out = "\"";
    for (char c : path) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

ErrorKind classify_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_FTP_ACCEPT_FAILED:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_LOGIN_DENIED:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSH:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return ErrorKind::Connection;
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_FTP_ACCEPT_TIMEOUT:
            return ErrorKind::Timeout;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return ErrorKind::NotFound;
        case CURLE_REMOTE_ACCESS_DENIED:
            return ErrorKind::PermissionDenied;
        case CURLE_QUOTE_ERROR:
        case CURLE_UPLOAD_FAILED:
            return ErrorKind::Transfer;
        default:
            return ErrorKind::Io;
    }
}

// ───────────────────────── Lease ─────────────────────────

CurlTransport::Lease::Lease(CurlTransport& owner, CurlHandle handle)
    : owner_(owner), handle_(std::move(handle)) {}

CurlTransport::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), handle_(std::move(other.handle_)) {}

CurlTransport::Lease::~Lease() {
    if (handle_) {
        owner_.release(std::move(handle_));
    }
}

// ───────────────────────── CurlTransport ─────────────────────────

CurlTransport::CurlTransport(Endpoint endpoint, TransportOptions options)
    : TransportClient(std::move(options)), endpoint_(std::move(endpoint)) {
    ensure_curl_global();
    root_ = endpoint_.path;
    while (!root_.empty() && root_.back() == '/') {
        root_.pop_back();
    }
    if (!root_.empty() && root_.front() != '/') {
        root_.insert(root_.begin(), '/');
    }
}

CurlTransport::~CurlTransport() {
    std::lock_guard lock(pool_mutex_);
    pool_.clear();
}

std::string CurlTransport::describe() const {
    return endpoint_.describe();
}

std::string CurlTransport::absolute(const std::string& relative) const {
    std::string path = root_;
    if (!relative.empty()) {
        path += "/" + relative;
    }
    return path.empty() ? "/" : path;
}

Result<CurlTransport::Lease> CurlTransport::lease() {
    {
        std::lock_guard lock(pool_mutex_);
        if (!pool_.empty()) {
            CurlHandle handle = std::move(pool_.back());
            pool_.pop_back();
            return Ok(Lease(*this, std::move(handle)));
        }
    }
    CurlHandle handle(curl_easy_init());
    if (!handle) {
        return Err<Lease>(ErrorKind::Io, "curl_easy_init failed");
    }
    return Ok(Lease(*this, std::move(handle)));
}

void CurlTransport::release(CurlHandle handle) {
    std::lock_guard lock(pool_mutex_);
    if (connected_ && pool_.size() < kMaxPooledHandles) {
        pool_.push_back(std::move(handle));
    }
}

void CurlTransport::prepare(CURL* handle, const std::string& absolute_path, bool directory) const {
    curl_easy_reset(handle);

    const std::string url = std::string(scheme()) + "://" + endpoint_.host + url_path(absolute_path, directory);
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_PORT, static_cast<long>(endpoint_.effective_port()));
    if (!endpoint_.username.empty()) {
        curl_easy_setopt(handle, CURLOPT_USERNAME, endpoint_.username.c_str());
        curl_easy_setopt(handle, CURLOPT_PASSWORD, endpoint_.password.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(endpoint_.timeout.count()));

    // Stall detection rather than a hard cap on total transfer time
    const auto operation_timeout = static_cast<long>(options().operation_timeout.count());
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, operation_timeout);
    curl_easy_setopt(handle, CURLOPT_SERVER_RESPONSE_TIMEOUT, operation_timeout);

    curl_easy_setopt(handle, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    apply_protocol_options(handle);
}

Result<void> CurlTransport::perform(CURL* handle, const std::string& what, CURLcode* code) const {
    char error_buffer[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    const CURLcode rc = curl_easy_perform(handle);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, static_cast<char*>(nullptr));
    if (code != nullptr) {
        *code = rc;
    }
    if (rc == CURLE_OK) {
        return Ok();
    }
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    return Err<void>(classify_curl_error(rc), what + ": " + detail);
}

Result<void> CurlTransport::do_connect() {
    auto leased = lease();
    if (leased.is_error()) {
        return Err<void>(leased.error());
    }
    CURL* handle = leased.value().get();
    prepare(handle, "/", true);
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);

    auto result = perform(handle, "connect to " + describe());
    if (result.is_error()) {
        auto error = result.error();
        if (error.kind != ErrorKind::Timeout) {
            error.kind = ErrorKind::Connection;
        }
        return Err<void>(std::move(error));
    }
    connected_ = true;
    spdlog::debug("Connected to {}", describe());
    return Ok();
}

void CurlTransport::do_disconnect() {
    connected_ = false;
    std::lock_guard lock(pool_mutex_);
    pool_.clear();
}

bool CurlTransport::do_is_connected() const {
    return connected_;
}

Result<std::string> CurlTransport::fetch_listing(const std::string& absolute_dir, const char* custom_request) {
    auto leased = lease();
    if (leased.is_error()) {
        return Err<std::string>(leased.error());
    }
    CURL* handle = leased.value().get();
    prepare(handle, absolute_dir, true);
    if (custom_request != nullptr) {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, custom_request);
    }
    std::string body;
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);

    if (auto result = perform(handle, "list " + absolute_dir); result.is_error()) {
        return Err<std::string>(result.error());
    }
    return Ok(std::move(body));
}

Result<void> CurlTransport::run_commands(const std::vector<std::string>& commands) {
    if (commands.empty()) {
        return Ok();
    }
    Slist quote;
    for (const auto& command : commands) {
        curl_slist* appended = curl_slist_append(quote.get(), command.c_str());
        if (appended == nullptr) {
            return Err<void>(ErrorKind::Io, "curl_slist_append failed");
        }
        quote.release();
        quote.reset(appended);
    }

    auto leased = lease();
    if (leased.is_error()) {
        return Err<void>(leased.error());
    }
    CURL* handle = leased.value().get();
    prepare(handle, "/", true);
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(handle, CURLOPT_QUOTE, quote.get());
    return perform(handle, commands.back());
}

Result<std::vector<FileEntry>> CurlTransport::walk(const std::string& relative) {
    std::vector<FileEntry> entries;
    std::deque<std::string> pending{relative};

    while (!pending.empty()) {
        const std::string dir = pending.front();
        pending.pop_front();

        auto listed = list_directory(absolute(dir));
        if (listed.is_error()) {
            return Err<std::vector<FileEntry>>(listed.error());
        }
        for (const auto& item : listed.value()) {
            FileEntry entry;
            entry.path = join_path(dir, item.name);
            entry.kind = item.kind;
            entry.size = item.size;
            entry.modified = item.modified.value_or(TimePoint{});

            if (entry.kind == FileKind::Directory) {
                pending.push_back(entry.path);
            }
            if (entry.kind == FileKind::File) {
                auto refined = refine(std::move(entry));
                if (refined.is_error()) {
                    return Err<std::vector<FileEntry>>(refined.error());
                }
                entries.push_back(std::move(refined.value()));
            } else {
                entries.push_back(std::move(entry));
            }
        }
    }
    return Ok(std::move(entries));
}

Result<std::vector<FileEntry>> CurlTransport::do_list(const std::string& path) {
    auto entries = walk(path);
    if (entries.is_ok() || !(entries.error().kind == ErrorKind::PermissionDenied ||
                             entries.error().kind == ErrorKind::Io ||
                             entries.error().kind == ErrorKind::Transfer)) {
        return entries;
    }
    // Servers answer a missing directory with a generic failure; look it up
    // in the parent listing to tell "absent" from "forbidden".
    auto root_entry = stat_absolute(absolute(path), path);
    if (root_entry.is_error() && root_entry.error().kind == ErrorKind::NotFound) {
        return Err<std::vector<FileEntry>>(root_entry.error());
    }
    return entries;
}

Result<FileEntry> CurlTransport::stat_absolute(const std::string& absolute_path, const std::string& relative) {
    if (absolute_path == "/") {
        FileEntry root;
        root.path = relative;
        root.kind = FileKind::Directory;
        return Ok(std::move(root));
    }
    const auto slash = absolute_path.find_last_of('/');
    const std::string parent = slash == 0 ? "/" : absolute_path.substr(0, slash);
    const std::string name = absolute_path.substr(slash + 1);

    auto listed = list_directory(parent);
    if (listed.is_error()) {
        return Err<FileEntry>(listed.error());
    }
    for (const auto& item : listed.value()) {
        if (item.name != name) {
            continue;
        }
        FileEntry entry;
        entry.path = relative;
        entry.kind = item.kind;
        entry.size = item.size;
        entry.modified = item.modified.value_or(TimePoint{});
        if (entry.kind == FileKind::File) {
            return refine(std::move(entry));
        }
        return Ok(std::move(entry));
    }
    return Err<FileEntry>(ErrorKind::NotFound, "no such entry: " + absolute_path);
}

Result<FileEntry> CurlTransport::do_stat(const std::string& path) {
    return stat_absolute(absolute(path), path);
}

Result<Bytes> CurlTransport::do_read_range(const std::string& path, std::uint64_t offset, std::size_t length) {
    if (length == 0) {
        return Ok(Bytes{});
    }
    auto leased = lease();
    if (leased.is_error()) {
        return Err<Bytes>(leased.error());
    }
    CURL* handle = leased.value().get();
    prepare(handle, absolute(path), false);

    const std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    Bytes data;
    data.reserve(length);
    curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_to_bytes);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &data);

    CURLcode code = CURLE_OK;
    if (auto result = perform(handle, "read " + path, &code); result.is_error()) {
        // Starting at or past the end of the file
        if (code == CURLE_BAD_DOWNLOAD_RESUME || code == CURLE_RANGE_ERROR) {
            return Ok(Bytes{});
        }
        return Err<Bytes>(result.error());
    }
    if (data.size() > length) {
        data.resize(length);
    }
    return Ok(std::move(data));
}

Result<void> CurlTransport::do_write_range(const std::string& path, std::uint64_t offset, const Bytes& data) {
    if (offset > 0) {
        auto current = do_stat(path);
        if (current.is_error()) {
            return Err<void>(current.error());
        }
        if (current.value().size != offset) {
            return Err<void>(ErrorKind::Transfer,
                             "append offset " + std::to_string(offset) + " does not match size " +
                             std::to_string(current.value().size) + " of " + path);
        }
    }

    auto leased = lease();
    if (leased.is_error()) {
        return Err<void>(leased.error());
    }
    CURL* handle = leased.value().get();
    prepare(handle, absolute(path), false);

    UploadCursor cursor{&data, 0};
    curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_from_cursor);
    curl_easy_setopt(handle, CURLOPT_READDATA, &cursor);
    curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(data.size()));
    if (offset > 0) {
        curl_easy_setopt(handle, CURLOPT_APPEND, 1L);
    }
    return perform(handle, "write " + path);
}

Result<void> CurlTransport::do_remove(const std::string& path, FileKind kind) {
    return run_commands(remove_commands(absolute(path), kind));
}

Result<void> CurlTransport::do_mkdir(const std::string& path) {
    std::vector<std::string> commands;
    std::string prefix;
    for (const auto& part : components(absolute(path))) {
        prefix += "/" + part;
        // Existing levels make the command fail; '*' tells libcurl to carry on
        commands.push_back("*" + mkdir_command(prefix));
    }
    if (auto result = run_commands(commands); result.is_error()) {
        return result;
    }
    auto created = do_stat(path);
    if (created.is_error()) {
        return Err<void>(created.error());
    }
    if (!created.value().is_directory()) {
        return Err<void>(ErrorKind::Transfer, "cannot create directory " + path);
    }
    return Ok();
}

Result<void> CurlTransport::do_rename(const std::string& from, const std::string& to) {
    return run_commands(rename_commands(absolute(from), absolute(to)));
}

Result<void> CurlTransport::do_set_modified_time(const std::string& path, TimePoint modified) {
    return run_commands({mtime_command(absolute(path), modified)});
}

// ───────────────────────── SFTP ─────────────────────────

SftpTransport::SftpTransport(Endpoint endpoint, TransportOptions options)
    : CurlTransport(std::move(endpoint), std::move(options)) {}

std::string SftpTransport::url_path(const std::string& absolute_path, bool directory) const {
    std::string path = "/" + escaped_path(absolute_path);
    if (directory && path.back() != '/') {
        path += '/';
    }
    return path;
}

void SftpTransport::apply_protocol_options(CURL* handle) const {
    long auth = CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD;
    if (!endpoint_.private_key_path.empty()) {
        auth |= CURLSSH_AUTH_PUBLICKEY;
        curl_easy_setopt(handle, CURLOPT_SSH_PRIVATE_KEYFILE, endpoint_.private_key_path.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_SSH_AUTH_TYPES, auth);
    if (!endpoint_.known_hosts_path.empty()) {
        curl_easy_setopt(handle, CURLOPT_SSH_KNOWNHOSTS, endpoint_.known_hosts_path.c_str());
    }
}

Result<std::vector<ListedEntry>> SftpTransport::list_directory(const std::string& absolute_dir) {
    auto body = fetch_listing(absolute_dir, nullptr);
    if (body.is_error()) {
        return Err<std::vector<ListedEntry>>(body.error());
    }
    const auto now = Clock::now();
    std::vector<ListedEntry> entries;
    for (const auto& line : split_lines(body.value())) {
        if (auto entry = parse_unix_listing_line(line, now)) {
            entries.push_back(std::move(*entry));
        }
    }
    return Ok(std::move(entries));
}

std::vector<std::string> SftpTransport::remove_commands(const std::string& absolute_path, FileKind kind) const {
    return {(kind == FileKind::Directory ? "rmdir " : "rm ") + sftp_quote(absolute_path)};
}

std::string SftpTransport::mkdir_command(const std::string& absolute_path) const {
    return "mkdir " + sftp_quote(absolute_path);
}

std::vector<std::string> SftpTransport::rename_commands(const std::string& from, const std::string& to) const {
    // SFTPv3 rename refuses to overwrite
    return {"*rm " + sftp_quote(to), "rename " + sftp_quote(from) + " " + sftp_quote(to)};
}

std::string SftpTransport::mtime_command(const std::string& absolute_path, TimePoint modified) const {
    return "mtime " + sftp_quote(format_rfc1123(modified)) + " " + sftp_quote(absolute_path);
}

Result<FileEntry> SftpTransport::refine(FileEntry entry) {
    auto leased = lease();
    if (leased.is_error()) {
        return Err<FileEntry>(leased.error());
    }
    CURL* handle = leased.value().get();
    prepare(handle, absolute(entry.path), false);
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(handle, CURLOPT_FILETIME, 1L);
    if (auto result = perform(handle, "stat " + entry.path); result.is_error()) {
        return Err<FileEntry>(result.error());
    }

    curl_off_t filetime = -1;
    if (curl_easy_getinfo(handle, CURLINFO_FILETIME_T, &filetime) == CURLE_OK && filetime >= 0) {
        entry.modified = from_unix_seconds(static_cast<std::int64_t>(filetime));
    }
    curl_off_t length = -1;
    if (curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
        entry.size = static_cast<std::uint64_t>(length);
    }
    return Ok(std::move(entry));
}

// ───────────────────────── FTP ─────────────────────────

FtpTransport::FtpTransport(Endpoint endpoint, TransportOptions options)
    : CurlTransport(std::move(endpoint), std::move(options)) {}

std::string FtpTransport::url_path(const std::string& absolute_path, bool directory) const {
    // "%2F" anchors the path at the server root instead of the login directory
    std::string path = "/%2F";
    const auto rest = escaped_path(absolute_path);
    if (!rest.empty()) {
        path += "/" + rest;
    }
    if (directory) {
        path += '/';
    }
    return path;
}

void FtpTransport::apply_protocol_options(CURL* handle) const {
    curl_easy_setopt(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    if (!endpoint_.passive_mode) {
        curl_easy_setopt(handle, CURLOPT_FTPPORT, "-");
    }
}

Result<std::vector<ListedEntry>> FtpTransport::list_directory(const std::string& absolute_dir) {
    auto body = fetch_listing(absolute_dir, "MLSD");
    if (body.is_error()) {
        return Err<std::vector<ListedEntry>>(body.error());
    }
    std::vector<ListedEntry> entries;
    for (const auto& line : split_lines(body.value())) {
        if (auto entry = parse_mlsd_line(line)) {
            entries.push_back(std::move(*entry));
        }
    }
    return Ok(std::move(entries));
}

std::vector<std::string> FtpTransport::remove_commands(const std::string& absolute_path, FileKind kind) const {
    return {(kind == FileKind::Directory ? "RMD " : "DELE ") + absolute_path};
}

std::string FtpTransport::mkdir_command(const std::string& absolute_path) const {
    return "MKD " + absolute_path;
}

std::vector<std::string> FtpTransport::rename_commands(const std::string& from, const std::string& to) const {
    return {"*DELE " + to, "RNFR " + from, "RNTO " + to};
}

std::string FtpTransport::mtime_command(const std::string& absolute_path, TimePoint modified) const {
    return "MFMT " + format_ftp_timestamp(modified) + " " + absolute_path;
}

} // namespace tsync::transport
