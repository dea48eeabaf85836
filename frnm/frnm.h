// -----------------------------------------------------------------------------
// frnm — Filename normalizer
// Replaces unconventional characters in file and directory names
// -----------------------------------------------------------------------------
#pragma once

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#define FRNM_VERSION "1.2.0"

// -----------------------------------------------------------------------------
// frnm — Constants
// -----------------------------------------------------------------------------
namespace constants {
    constexpr char DEFAULT_SUBSTITUTION_CHAR = '_';
    constexpr const char* ALLOWED_CHARS_DESC = "-._0-9a-zA-Z";
    constexpr const char* NOTICE_SEPARATOR = " ===> ";
    constexpr size_t MAX_AUDIT_PATH_LENGTH = 256;
    constexpr size_t MAX_AUDIT_ENTRY_SIZE = 4096;
}

// -----------------------------------------------------------------------------
// frnm — Logging
// -----------------------------------------------------------------------------
enum class LogLevel {
    off = 0,
    error,
    warn,
    info,
    debug,
};

using LogSink = std::function<void(LogLevel level, const char* module, const char* message)>;

// Sets the threshold and syslog mirroring. Until called, only errors reach stderr.
void frnm_log_configure(LogLevel level, bool use_syslog) noexcept;

// Replaces the record sink; an empty sink restores the stderr writer.
void frnm_log_set_sink(LogSink sink);

LogLevel frnm_log_level() noexcept;
bool frnm_parse_log_level(const char* text, LogLevel* out) noexcept;
const char* frnm_log_level_name(LogLevel level) noexcept;

void frnm_log_output(LogLevel level, const char* module, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define FRNM_LOG_ERROR(module, ...)  frnm_log_output(LogLevel::error, module, __VA_ARGS__)
#define FRNM_LOG_WARN(module, ...)   frnm_log_output(LogLevel::warn,  module, __VA_ARGS__)
#define FRNM_LOG_INFO(module, ...)   frnm_log_output(LogLevel::info,  module, __VA_ARGS__)
#define FRNM_LOG_DEBUG(module, ...)  frnm_log_output(LogLevel::debug, module, __VA_ARGS__)

// -----------------------------------------------------------------------------
// frnm — Environment-based configuration
// -----------------------------------------------------------------------------
struct Config {
    std::string substitution_char = std::string(1, constants::DEFAULT_SUBSTITUTION_CHAR);
    LogLevel log_level = LogLevel::error;
    bool use_syslog = false;
    std::string audit_log_path;
};

// Returns nullptr when a variable holds an unusable value.
std::shared_ptr<const Config> frnm_load_config_from_env() noexcept;

// -----------------------------------------------------------------------------
// frnm — Errors and run results
// -----------------------------------------------------------------------------
enum class FrnmError {
    none = 0,
    invalid_substitution_char,
    path_not_found,
    rename_collision,
    io_error,
};

struct FrnmStatus {
    FrnmError error = FrnmError::none;
    std::string message;

    bool ok() const noexcept { return error == FrnmError::none; }

    static FrnmStatus success() { return FrnmStatus{}; }
    static FrnmStatus failure(FrnmError e, std::string msg) {
        return FrnmStatus{e, std::move(msg)};
    }
};

const char* frnm_error_name(FrnmError error) noexcept;

struct RenameStats {
    uint64_t renamed = 0;
    uint64_t unchanged = 0;
    uint64_t skipped = 0;
    uint64_t collisions = 0;
    uint64_t errors = 0;
};

struct RenameOptions {
    bool recursive = false;
    bool verbose = true;
    bool suppress_errors = false;
    FILE* out = stdout;
    std::string audit_log_path;
};

// -----------------------------------------------------------------------------
// frnm — Name generation
// -----------------------------------------------------------------------------
enum class EntryKind {
    file,
    directory,
    other,
    missing,
};

bool frnm_is_allowed_char(char c) noexcept;

// Conventional extension split: the extension starts at the last '.', but
// leading dots never start one (".bashrc" has no extension).
std::pair<std::string, std::string> frnm_split_extension(const std::string& name);

// Pure rename rule. Returns `name` itself when the sanitized result would have
// fewer than two components.
std::string frnm_sanitize_name(const std::string& name, EntryKind kind, char sub);

// Classifies `path` (following symlinks) without modifying anything.
EntryKind frnm_classify(const std::string& path) noexcept;

// Candidate basename for an existing entry.
std::string frnm_generate_candidate(const std::string& path, char sub);

// -----------------------------------------------------------------------------
// frnm — Traversal and renaming
// -----------------------------------------------------------------------------
// Validates the substitution character; on success stores it in `out`.
FrnmStatus frnm_validate_substitution_char(const std::string& text, char* out);

// All descendants of `dir`, every entry before any of its ancestors.
// Symlinked directories are listed but not entered.
std::vector<std::string> frnm_collect_descendants(const std::string& dir);

// Renames one entry within its parent directory.
FrnmStatus frnm_sanitize_one(const std::string& path, char sub,
                             const RenameOptions& opts, RenameStats& stats);

// Validates, resolves and renames every entry. With suppress_errors the run
// continues past failures and returns the first one encountered.
FrnmStatus frnm_rename_entries(const std::string& sub,
                               const std::vector<std::string>& entries,
                               const RenameOptions& opts,
                               RenameStats* stats = nullptr);

// -----------------------------------------------------------------------------
// frnm — Command line
// -----------------------------------------------------------------------------
// Parses argv, runs the rename and returns the process exit status:
// 0 on success, 1 when the run failed, 2 on a usage or configuration error.
int frnm_cli_run(int argc, char* argv[], FILE* out, FILE* err);
