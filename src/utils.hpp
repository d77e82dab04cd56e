#pragma once

#include "exception.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_GRAY = "\033[0;37m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

enum class LogLevel {
    DEBUG,
    INFO,
    ERROR
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Log functions
void log_debug(std::string_view msg);
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Concurrency control (RAII lock), one engine session per lock file
class WorkspaceLock {
public:
    explicit WorkspaceLock(const fs::path& lock_file);
    ~WorkspaceLock();
    WorkspaceLock(const WorkspaceLock&) = delete;
    WorkspaceLock& operator=(const WorkspaceLock&) = delete;
private:
    fs::path lock_file_;
    int lock_fd = -1;
};

// Per-process scratch directory, removed on destruction
class TmpDirManager {
public:
    TmpDirManager();
    ~TmpDirManager();
    TmpDirManager(const TmpDirManager&) = delete;
    TmpDirManager& operator=(const TmpDirManager&) = delete;
    const fs::path& path() const { return tmp_dir_path_; }
private:
    fs::path tmp_dir_path_;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file_bytes(const fs::path& path);
void write_file_bytes(const fs::path& path, std::string_view content);
std::vector<std::string> read_lines_from_file(const fs::path& path);

// Rejects absolute paths and ".." components, returns root / path
fs::path validate_path(const fs::path& path, const fs::path& root);

std::vector<std::string> split(std::string_view s, char delim);
std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
