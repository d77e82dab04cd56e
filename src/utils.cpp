#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    LogLevel log_level = LogLevel::INFO;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void set_log_level(LogLevel level) {
    log_level = level;
}

LogLevel get_log_level() {
    return log_level;
}

void log_debug(std::string_view msg) {
    if (log_level != LogLevel::DEBUG) return;
    log_internal(get_string("debug.prefix") + " ", COLOR_GRAY, msg, std::cout);
}

void log_info(std::string_view msg) {
    if (log_level == LogLevel::ERROR) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    if (log_level == LogLevel::ERROR) return;
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

WorkspaceLock::WorkspaceLock(const fs::path& lock_file) : lock_file_(lock_file) {
    ensure_dir_exists(lock_file_.parent_path());
    lock_fd = open(lock_file_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw PipkinException(string_format("error.create_file_failed", lock_file_.string()) + ": " + strerror(errno));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw PipkinException(get_string("error.workspace_locked"));
        } else {
            throw PipkinException(string_format("error.workspace_lock_failed", strerror(err)));
        }
    }
}

WorkspaceLock::~WorkspaceLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

TmpDirManager::TmpDirManager() : tmp_dir_path_(get_tmp_dir()) {
    ensure_dir_exists(tmp_dir_path_);
}

TmpDirManager::~TmpDirManager() {
    std::error_code ec;
    fs::remove_all(tmp_dir_path_, ec);
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw PipkinException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw PipkinException(string_format("error.path_not_dir", path.string()));
    }
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PipkinException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_file_bytes(const fs::path& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw PipkinException(string_format("error.create_file_failed", path.string()) + ": " + strerror(errno));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw PipkinException(string_format("error.write_file_failed", path.string()));
    }
}

std::vector<std::string> read_lines_from_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PipkinException(string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        result.push_back(line);
    }
    return result;
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw PipkinException(string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw PipkinException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::vector<std::string> split(std::string_view s, char delim) {
    std::vector<std::string> res;
    size_t start = 0, end = 0;
    while ((end = s.find(delim, start)) != std::string_view::npos) {
        res.emplace_back(s.substr(start, end - start));
        start = end + 1;
    }
    res.emplace_back(s.substr(start));
    return res;
}

std::string trim(std::string_view s) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
