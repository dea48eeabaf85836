// -----------------------------------------------------------------------------
// frnm — Filename normalizer
// Deepest-first renaming with collision-safe, no-replace renames
// -----------------------------------------------------------------------------
#include "frnm.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <climits>
#include <inttypes.h>
#include <algorithm>
#include <mutex>
#include <new>
#include <tuple>
#include <unordered_set>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <strings.h>
#include <syslog.h>
#include <sys/stat.h>
#include <sys/types.h>

#if defined(__linux__)
#include <sys/syscall.h>
#include <linux/fs.h>
#define HAS_RENAMEAT2 1
#else
#define HAS_RENAMEAT2 0
#endif

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

// -----------------------------------------------------------------------------
// frnm — Unified logging with an injectable sink
// -----------------------------------------------------------------------------
static std::mutex g_log_mutex;
static std::atomic<int> g_log_level{static_cast<int>(LogLevel::error)};
static std::atomic<bool> g_use_syslog{false};
static LogSink g_log_sink;

static int frnm_syslog_priority(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::error: return LOG_ERR;
        case LogLevel::warn:  return LOG_WARNING;
        case LogLevel::info:  return LOG_INFO;
        default:              return LOG_DEBUG;
    }
}

static const char* frnm_level_tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::error: return "ERROR";
        case LogLevel::warn:  return "WARN";
        case LogLevel::info:  return "INFO";
        case LogLevel::debug: return "DEBUG";
        default:              return "OFF";
    }
}

static void frnm_stderr_sink(LogLevel level, const char* module, const char* message) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_time{};
    localtime_r(&t, &tm_time);

    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_time);

    fprintf(stderr, "[%s][%s][%s] %s\n", frnm_level_tag(level), timestamp, module, message);
    fflush(stderr);
}

void frnm_log_configure(LogLevel level, bool use_syslog) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    bool was_open = g_use_syslog.exchange(use_syslog);
    if (use_syslog && !was_open) {
        openlog("frnm", LOG_PID | LOG_NDELAY, LOG_USER);
    } else if (!use_syslog && was_open) {
        closelog();
    }
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

void frnm_log_set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_sink = std::move(sink);
}

LogLevel frnm_log_level() noexcept {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool frnm_parse_log_level(const char* text, LogLevel* out) noexcept {
    if (!text) return false;

    static const struct { const char* name; LogLevel level; } levels[] = {
        {"off", LogLevel::off},
        {"error", LogLevel::error},
        {"warn", LogLevel::warn},
        {"warning", LogLevel::warn},
        {"info", LogLevel::info},
        {"debug", LogLevel::debug},
    };

    for (const auto& entry : levels) {
        if (strcasecmp(text, entry.name) == 0) {
            *out = entry.level;
            return true;
        }
    }
    return false;
}

const char* frnm_log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::off:   return "off";
        case LogLevel::error: return "error";
        case LogLevel::warn:  return "warn";
        case LogLevel::info:  return "info";
        case LogLevel::debug: return "debug";
    }
    return "unknown";
}

void frnm_log_output(LogLevel level, const char* module, const char* fmt, ...) {
    int threshold = g_log_level.load(std::memory_order_relaxed);
    if (level == LogLevel::off || static_cast<int>(level) > threshold) return;

    char buffer[2048];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (len <= 0) return;

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);

        if (g_use_syslog.load(std::memory_order_relaxed)) {
            syslog(frnm_syslog_priority(level), "[%s] [%s] %s", frnm_level_tag(level), module, buffer);
        }

        if (!g_log_sink) {
            frnm_stderr_sink(level, module, buffer);
            return;
        }
        sink = g_log_sink;
    }

    // Called unlocked: a sink may log or replace itself
    sink(level, module, buffer);
}

// -----------------------------------------------------------------------------
// frnm — Environment-based configuration
// -----------------------------------------------------------------------------
std::shared_ptr<const Config> frnm_load_config_from_env() noexcept {
    auto cfg = std::make_shared<Config>();

    auto parse_bool = [](const char* v, bool default_val) -> bool {
        if (!v) return default_val;
        return strcmp(v, "0") != 0 && strcmp(v, "false") != 0 && strcmp(v, "no") != 0;
    };

    if (const char* v = getenv("FRNM_CHAR")) cfg->substitution_char = v;
    if (const char* v = getenv("FRNM_AUDIT_LOG")) cfg->audit_log_path = v;

    if (const char* v = getenv("FRNM_LOG_LEVEL")) {
        if (!frnm_parse_log_level(v, &cfg->log_level)) {
            FRNM_LOG_ERROR("config", "Configuration error: unknown FRNM_LOG_LEVEL '%s' "
                           "(expected off, error, warn, info or debug)", v);
            return nullptr;
        }
    }

    cfg->use_syslog = parse_bool(getenv("FRNM_USE_SYSLOG"), cfg->use_syslog);

    if (!cfg->audit_log_path.empty() && cfg->audit_log_path[0] != '/') {
        FRNM_LOG_ERROR("config", "Configuration error: FRNM_AUDIT_LOG must be an absolute path");
        return nullptr;
    }

    return cfg;
}

// -----------------------------------------------------------------------------
// frnm — RAII wrapper for file descriptors
// -----------------------------------------------------------------------------
class unique_fd {
    int fd_ = -1;
public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd() { if (fd_ >= 0) ::close(fd_); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }

    int get() const noexcept { return fd_; }
    int release() noexcept { int t = fd_; fd_ = -1; return t; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

using dir_ptr = std::unique_ptr<DIR, int(*)(DIR*)>;

// -----------------------------------------------------------------------------
// frnm — Rename audit trail
// -----------------------------------------------------------------------------
class RenameAudit {
    std::string path_;

    static std::string truncate_path(const std::string& p) {
        if (p.size() <= constants::MAX_AUDIT_PATH_LENGTH) return p;
        return p.substr(0, constants::MAX_AUDIT_PATH_LENGTH - 3) + "...";
    }

public:
    explicit RenameAudit(std::string path) : path_(std::move(path)) {}

    void log_operation(const std::string& src, const std::string& dst,
                       bool success, const char* error = nullptr) noexcept {
        if (path_.empty()) return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        struct tm tm_time{};
        localtime_r(&t, &tm_time);

        char timestamp[32];
        strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_time);

        std::string entry;
        try {
            entry = "[AUDIT][";
            entry += timestamp;
            entry += "][PID:";
            entry += std::to_string(getpid());
            entry += "] RENAME: ";
            entry += truncate_path(src);
            entry += " -> ";
            entry += truncate_path(dst);
            entry += success ? " SUCCESS" : " FAILED";

            if (error && error[0] != '\0') {
                entry += " (";
                for (const char* p = error; *p; ++p) {
                    entry += static_cast<unsigned char>(*p) < 32 ? '?' : *p;
                }
                entry += ")";
            }

            if (entry.size() > constants::MAX_AUDIT_ENTRY_SIZE) {
                entry.resize(constants::MAX_AUDIT_ENTRY_SIZE - 3);
                entry += "...";
            }
            entry += '\n';
        } catch (const std::bad_alloc&) {
            FRNM_LOG_DEBUG("audit", "Out of memory building audit entry");
            return;
        }

        unique_fd fd(open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640));
        if (!fd) {
            FRNM_LOG_DEBUG("audit", "Failed to open audit log %s: %s", path_.c_str(), strerror(errno));
            return;
        }

        size_t written = 0;
        while (written < entry.size()) {
            ssize_t res = write(fd.get(), entry.data() + written, entry.size() - written);
            if (res < 0) {
                if (errno == EINTR) continue;
                FRNM_LOG_DEBUG("audit", "Failed to write audit log %s: %s", path_.c_str(), strerror(errno));
                return;
            }
            written += static_cast<size_t>(res);
        }
    }
};

// -----------------------------------------------------------------------------
// frnm — Name generation
// -----------------------------------------------------------------------------
bool frnm_is_allowed_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_';
}

std::pair<std::string, std::string> frnm_split_extension(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) return {name, std::string()};

    size_t first = name.find_first_not_of('.');
    if (first == std::string::npos || first > dot) return {name, std::string()};

    return {name.substr(0, dot), name.substr(dot)};
}

// Disallowed characters become `sub`, then the text is split on `sub` with
// empty pieces dropped. Leading and trailing separators vanish in the split.
static std::vector<std::string> frnm_name_components(const std::string& text, char sub) {
    std::vector<std::string> components;
    std::string current;

    for (char c : text) {
        if (c == sub || !frnm_is_allowed_char(c)) {
            if (!current.empty()) {
                components.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current += c;
    }
    if (!current.empty()) components.push_back(std::move(current));

    return components;
}

static std::string frnm_join(const std::vector<std::string>& parts, char sub) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sub;
        out += parts[i];
    }
    return out;
}

std::string frnm_sanitize_name(const std::string& name, EntryKind kind, char sub) {
    std::string root = name;
    std::string extension;

    if (kind == EntryKind::file) {
        std::tie(root, extension) = frnm_split_extension(name);
    }

    auto components = frnm_name_components(root, sub);
    if (components.size() < 2) return name;

    return frnm_join(components, sub) + extension;
}

EntryKind frnm_classify(const std::string& path) noexcept {
    struct stat st{};
    if (stat(path.c_str(), &st) == 0) {
        if (S_ISREG(st.st_mode)) return EntryKind::file;
        if (S_ISDIR(st.st_mode)) return EntryKind::directory;
        return EntryKind::other;
    }

    // A dangling symlink still exists as an entry
    if (lstat(path.c_str(), &st) == 0) return EntryKind::other;
    return EntryKind::missing;
}

std::string frnm_generate_candidate(const std::string& path, char sub) {
    size_t slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return frnm_sanitize_name(name, frnm_classify(path), sub);
}

// -----------------------------------------------------------------------------
// frnm — Errors
// -----------------------------------------------------------------------------
const char* frnm_error_name(FrnmError error) noexcept {
    switch (error) {
        case FrnmError::none:                      return "none";
        case FrnmError::invalid_substitution_char: return "InvalidSubstitutionChar";
        case FrnmError::path_not_found:            return "PathNotFound";
        case FrnmError::rename_collision:          return "RenameCollision";
        case FrnmError::io_error:                  return "IoError";
    }
    return "unknown";
}

FrnmStatus frnm_validate_substitution_char(const std::string& text, char* out) {
    size_t code_points = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++code_points;
    }

    if (code_points != 1) {
        return FrnmStatus::failure(FrnmError::invalid_substitution_char,
                                   text + " must be a single character.");
    }

    if (text.size() != 1 || !frnm_is_allowed_char(text[0])) {
        return FrnmStatus::failure(FrnmError::invalid_substitution_char,
            "Special character " + text + " cannot be used as a replacement character.\n"
            "Allowed replacement characters include " + constants::ALLOWED_CHARS_DESC);
    }

    *out = text[0];
    return FrnmStatus::success();
}

// -----------------------------------------------------------------------------
// frnm — Deepest-first directory walk
// -----------------------------------------------------------------------------
static std::string frnm_join_path(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

static void frnm_walk_bottom_up(const std::string& dir, std::vector<std::string>& out) {
    std::vector<std::string> files;
    std::vector<std::string> subdirs;

    {
        dir_ptr d(opendir(dir.c_str()), closedir);
        if (!d) {
            FRNM_LOG_WARN("walk", "Cannot open directory %s: %s", dir.c_str(), strerror(errno));
            return;
        }

        struct dirent* de;
        errno = 0;
        while ((de = readdir(d.get())) != nullptr) {
            if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0) {
                errno = 0;
                continue;
            }

            struct stat st{};
            if (fstatat(dirfd(d.get()), de->d_name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
                FRNM_LOG_WARN("walk", "fstatat failed for %s/%s: %s", dir.c_str(), de->d_name, strerror(errno));
                errno = 0;
                continue;
            }

            if (S_ISDIR(st.st_mode)) {
                subdirs.emplace_back(de->d_name);
            } else {
                files.emplace_back(de->d_name);
            }
            errno = 0;
        }

        if (errno != 0) {
            FRNM_LOG_WARN("walk", "readdir failed for %s: %s", dir.c_str(), strerror(errno));
        }
    }

    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());

    for (const auto& sub : subdirs) {
        frnm_walk_bottom_up(frnm_join_path(dir, sub), out);
    }
    for (const auto& name : files) {
        out.push_back(frnm_join_path(dir, name));
    }
    for (const auto& sub : subdirs) {
        out.push_back(frnm_join_path(dir, sub));
    }
}

std::vector<std::string> frnm_collect_descendants(const std::string& dir) {
    std::vector<std::string> children;
    frnm_walk_bottom_up(dir, children);
    FRNM_LOG_DEBUG("walk", "Collected %zu descendants of %s", children.size(), dir.c_str());
    return children;
}

// -----------------------------------------------------------------------------
// frnm — Collision-safe renames
// -----------------------------------------------------------------------------
static bool frnm_list_siblings(int dir_fd, const std::string& self,
                               std::unordered_set<std::string>& siblings) noexcept {
    unique_fd dup_fd(fcntl(dir_fd, F_DUPFD_CLOEXEC, 0));
    if (!dup_fd) return false;

    dir_ptr d(fdopendir(dup_fd.get()), closedir);
    if (!d) return false;
    dup_fd.release();

    try {
        struct dirent* de;
        errno = 0;
        while ((de = readdir(d.get())) != nullptr) {
            if (strcmp(de->d_name, ".") != 0 && strcmp(de->d_name, "..") != 0 && self != de->d_name) {
                siblings.emplace(de->d_name);
            }
            errno = 0;
        }
    } catch (const std::bad_alloc&) {
        errno = ENOMEM;
        return false;
    }
    // An incomplete sibling set could hide a collision
    return errno == 0;
}

// Returns 0 or the errno of the failed rename.
static int frnm_rename_noreplace(int dir_fd, const std::string& from, const std::string& to) noexcept {
#if HAS_RENAMEAT2 && defined(RENAME_NOREPLACE)
    if (syscall(SYS_renameat2, dir_fd, from.c_str(), dir_fd, to.c_str(), RENAME_NOREPLACE) == 0) {
        return 0;
    }

    if (errno != ENOSYS && errno != EINVAL) return errno;
    FRNM_LOG_DEBUG("rename", "renameat2 unsupported here, falling back to renameat");
#endif
    if (renameat(dir_fd, from.c_str(), dir_fd, to.c_str()) == 0) return 0;
    return errno;
}

FrnmStatus frnm_sanitize_one(const std::string& path, char sub,
                             const RenameOptions& opts, RenameStats& stats) {
    size_t slash = path.find_last_of('/');
    std::string dirname;
    std::string old_name;
    if (slash == std::string::npos) {
        dirname = ".";
        old_name = path;
    } else {
        dirname = slash == 0 ? "/" : path.substr(0, slash);
        old_name = path.substr(slash + 1);
    }

    if (old_name.empty()) {
        ++stats.skipped;
        FRNM_LOG_DEBUG("rename", "No basename to rename in %s", path.c_str());
        return FrnmStatus::success();
    }

    EntryKind kind = frnm_classify(path);
    if (kind == EntryKind::missing) {
        ++stats.errors;
        return FrnmStatus::failure(FrnmError::path_not_found, "No such file or directory: " + path);
    }
    if (kind == EntryKind::other) {
        ++stats.skipped;
        FRNM_LOG_DEBUG("rename", "Not a regular file or directory, skipping: %s", path.c_str());
        return FrnmStatus::success();
    }

    std::string new_name = frnm_sanitize_name(old_name, kind, sub);
    FRNM_LOG_DEBUG("rename", "New name for %s => %s", old_name.c_str(), new_name.c_str());

    if (new_name == old_name) {
        ++stats.unchanged;
        return FrnmStatus::success();
    }

    std::string src = frnm_join_path(dirname, old_name);
    std::string dest = frnm_join_path(dirname, new_name);
    RenameAudit audit(opts.audit_log_path);

    unique_fd dir_fd(open(dirname.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir_fd) {
        int err = errno;
        ++stats.errors;
        return FrnmStatus::failure(FrnmError::io_error,
            "Cannot open directory " + dirname + ": " + strerror(err));
    }

    std::unordered_set<std::string> siblings;
    if (!frnm_list_siblings(dir_fd.get(), old_name, siblings)) {
        int err = errno;
        ++stats.errors;
        return FrnmStatus::failure(FrnmError::io_error,
            "Cannot list directory " + dirname + ": " + strerror(err));
    }

    if (siblings.count(new_name) != 0) {
        ++stats.collisions;
        audit.log_operation(src, dest, false, "target exists");
        return FrnmStatus::failure(FrnmError::rename_collision,
                                   "File " + new_name + " already exists.");
    }

    int err = frnm_rename_noreplace(dir_fd.get(), old_name, new_name);
    if (err == EEXIST) {
        ++stats.collisions;
        audit.log_operation(src, dest, false, "target exists");
        return FrnmStatus::failure(FrnmError::rename_collision,
                                   "File " + new_name + " already exists.");
    }
    if (err != 0) {
        ++stats.errors;
        audit.log_operation(src, dest, false, strerror(err));
        return FrnmStatus::failure(FrnmError::io_error,
            "Cannot rename " + src + " to " + dest + ": " + strerror(err));
    }

    ++stats.renamed;
    audit.log_operation(src, dest, true);
    FRNM_LOG_INFO("rename", "Renamed %s -> %s", src.c_str(), dest.c_str());

    if (opts.verbose && opts.out) {
        fprintf(opts.out, "%s%s%s\n", src.c_str(), constants::NOTICE_SEPARATOR, dest.c_str());
        fflush(opts.out);
    }

    return FrnmStatus::success();
}

// -----------------------------------------------------------------------------
// frnm — Main rename operation
// -----------------------------------------------------------------------------
FrnmStatus frnm_rename_entries(const std::string& sub_text,
                               const std::vector<std::string>& entries,
                               const RenameOptions& opts,
                               RenameStats* stats_out) {
    RenameStats local_stats;
    RenameStats& stats = stats_out ? *stats_out : local_stats;

    char sub = constants::DEFAULT_SUBSTITUTION_CHAR;
    FrnmStatus status = frnm_validate_substitution_char(sub_text, &sub);
    if (!status.ok()) {
        ++stats.errors;
        return status;
    }

    FrnmStatus first_failure;

    // True when the run has to stop on this status.
    auto fails_run = [&](FrnmStatus s) -> bool {
        if (s.ok()) return false;
        if (!opts.suppress_errors) {
            first_failure = std::move(s);
            return true;
        }
        FRNM_LOG_WARN("frnm", "Suppressed %s: %s", frnm_error_name(s.error), s.message.c_str());
        if (first_failure.ok()) first_failure = std::move(s);
        return false;
    };

    std::vector<std::string> resolved;
    std::unordered_set<std::string> seen;
    for (const auto& entry : entries) {
        char buf[PATH_MAX];
        if (!realpath(entry.c_str(), buf)) {
            ++stats.errors;
            if (fails_run(FrnmStatus::failure(FrnmError::path_not_found,
                                              "No such file or directory: " + entry))) {
                return first_failure;
            }
            continue;
        }
        if (seen.insert(buf).second) {
            resolved.emplace_back(buf);
        } else {
            FRNM_LOG_DEBUG("frnm", "Duplicate input %s (%s)", entry.c_str(), buf);
        }
    }

    for (const auto& path : resolved) {
        // An earlier input may have renamed this one's ancestor
        EntryKind kind = frnm_classify(path);
        if (kind == EntryKind::missing || kind == EntryKind::other) {
            ++stats.skipped;
            FRNM_LOG_DEBUG("frnm", "Not a regular file or directory anymore, skipping: %s", path.c_str());
            continue;
        }

        // If the path is a directory and the recursive flag is on, rename the
        // deepest child first; renaming the parent first would change the
        // real path of the child
        if (opts.recursive && kind == EntryKind::directory) {
            for (const auto& child : frnm_collect_descendants(path)) {
                if (fails_run(frnm_sanitize_one(child, sub, opts, stats))) return first_failure;
            }
        }

        if (fails_run(frnm_sanitize_one(path, sub, opts, stats))) return first_failure;
    }

    FRNM_LOG_INFO("frnm", "Run finished: %" PRIu64 " renamed, %" PRIu64 " unchanged, %" PRIu64
                  " skipped, %" PRIu64 " collisions, %" PRIu64 " errors",
                  stats.renamed, stats.unchanged, stats.skipped, stats.collisions, stats.errors);

    return first_failure;
}
