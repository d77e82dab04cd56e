#include "target.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace {

constexpr size_t SERIAL_CHUNK_SIZE = 384; // 512 base64 characters per line

// Writes and flushes one file; returns 0 or an errno value
int write_and_fsync(const fs::path& path, std::string_view content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return errno;

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return err;
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return err;
    }
    if (::close(fd) != 0) return errno;
    return 0;
}

// "lib", "/lib/" and "lib//" all name /lib on the device
std::string absolute_device_dir(const std::string& dir) {
    std::string result;
    for (const auto& part : split(dir, '/')) {
        if (!part.empty()) result += "/" + part;
    }
    return result.empty() ? "/" : result;
}

} // anonymous namespace

PackageSnapshot TargetAdapter::list_distributions(const std::function<bool(const std::string&)>& skip) {
    std::vector<std::string> meta_dirs;
    for (const auto& entry : list_dir("")) {
        if (entry.is_dir && is_meta_dir_name(entry.name) && !(skip && skip(entry.name))) {
            meta_dirs.push_back(entry.name);
        }
    }
    std::ranges::sort(meta_dirs);

    PackageSnapshot snapshot;
    for (const auto& meta_dir : meta_dirs) {
        bool has_record = false;
        for (const auto& entry : list_dir(meta_dir)) {
            if (!entry.is_dir && entry.name == "RECORD") has_record = true;
        }

        std::string metadata = read_file(meta_dir + "/METADATA");
        std::string record;
        if (has_record) {
            record = read_file(meta_dir + "/RECORD");
        } else {
            log_warning(string_format("warning.missing_record", meta_dir));
        }

        Distribution dist = load_distribution(meta_dir, metadata, record);
        if (snapshot.contains(dist.name())) {
            log_warning(string_format("warning.duplicate_distribution", dist.name(), meta_dir));
            continue;
        }
        snapshot.emplace(dist.name(), std::move(dist));
    }
    return snapshot;
}

// --- Directory transport ---

DirTargetAdapter::DirTargetAdapter(fs::path root) : root_(std::move(root)) {}

fs::path DirTargetAdapter::resolve(const std::string& operation, const std::string& path) const {
    try {
        return path.empty() ? root_ : validate_path(path, root_);
    } catch (const PipkinException& e) {
        throw TargetIOError(operation, path, e.what());
    }
}

std::string DirTargetAdapter::read_file(const std::string& path) {
    const fs::path full = resolve("read", path);
    try {
        return read_file_bytes(full);
    } catch (const PipkinException& e) {
        throw TargetIOError("read", path, e.what());
    }
}

void DirTargetAdapter::write_file(const std::string& path, std::string_view content) {
    const fs::path full = resolve("write", path);
    std::error_code ec;
    fs::create_directories(full.parent_path(), ec);
    if (ec) {
        throw TargetIOError("write", path, ec.message());
    }
    if (int err = write_and_fsync(full, content); err != 0) {
        throw TargetIOError("write", path, std::strerror(err));
    }
}

void DirTargetAdapter::delete_file(const std::string& path) {
    const fs::path full = resolve("delete", path);
    std::error_code ec;
    if (!fs::remove(full, ec) && ec) {
        throw TargetIOError("delete", path, ec.message());
    }
}

void DirTargetAdapter::make_dirs(const std::string& path) {
    const fs::path full = resolve("mkdir", path);
    std::error_code ec;
    fs::create_directories(full, ec);
    if (ec) {
        throw TargetIOError("mkdir", path, ec.message());
    }
}

bool DirTargetAdapter::remove_dir_if_empty(const std::string& path) {
    const fs::path full = resolve("rmdir", path);
    std::error_code ec;
    if (!fs::is_directory(full, ec) || !fs::is_empty(full, ec)) {
        return false;
    }
    if (!fs::remove(full, ec) && ec) {
        throw TargetIOError("rmdir", path, ec.message());
    }
    return true;
}

std::vector<DirEntry> DirTargetAdapter::list_dir(const std::string& path) {
    const fs::path full = resolve("list", path);
    std::vector<DirEntry> result;
    std::error_code ec;
    if (!fs::is_directory(full, ec)) {
        return result;
    }
    for (fs::directory_iterator it(full, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        DirEntry item;
        item.name = entry.path().filename().string();
        std::error_code entry_ec;
        item.is_dir = entry.is_directory(entry_ec);
        if (!item.is_dir) {
            const auto size = entry.file_size(entry_ec);
            item.size = entry_ec ? 0 : size;
        }
        result.push_back(std::move(item));
    }
    if (ec) {
        throw TargetIOError("list", path, ec.message());
    }
    std::ranges::sort(result, {}, &DirEntry::name);
    return result;
}

void DirTargetAdapter::sync() {
    // every file is flushed on write
}

std::string DirTargetAdapter::describe() const {
    return string_format("target.dir", root_.string());
}

// --- Mounted volume transport ---

MountTargetAdapter::MountTargetAdapter(fs::path mount_point, const std::string& package_dir)
    : DirTargetAdapter(mount_point / fs::path(package_dir).relative_path()), mount_point_(std::move(mount_point)) {}

void MountTargetAdapter::sync() {
    int fd = ::open(mount_point_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw TargetIOError("sync", mount_point_.string(), std::strerror(errno));
    }
    int rc = ::syncfs(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw TargetIOError("sync", mount_point_.string(), std::strerror(err));
    }
}

std::string MountTargetAdapter::describe() const {
    return string_format("target.mount", mount_point_.string());
}

// --- Serial transport ---

SerialTargetAdapter::SerialTargetAdapter(std::unique_ptr<SerialConnection> connection,
                                         std::chrono::milliseconds timeout, const std::string& package_dir)
    : connection_(std::move(connection)), timeout_(timeout), package_root_(absolute_device_dir(package_dir)) {}

std::string SerialTargetAdapter::device_path(const std::string& path) const {
    if (path.empty()) return package_root_;
    return package_root_ == "/" ? "/" + path : package_root_ + "/" + path;
}

std::vector<std::string> SerialTargetAdapter::await_response(const std::string& operation, const std::string& path) {
    std::vector<std::string> payload;
    while (true) {
        std::optional<std::string> raw;
        try {
            raw = connection_->read_line(timeout_);
        } catch (const TargetIOError&) {
            throw;
        } catch (const PipkinException& e) {
            throw TargetIOError(operation, path, e.what());
        }
        if (!raw) {
            throw TargetIOError(operation, path, get_string("error.serial_timeout"));
        }

        const std::string line = strip_terminal_escapes(*raw);
        if (line == "OK") {
            return payload;
        }
        if (line == "ERR" || line.starts_with("ERR ")) {
            throw TargetIOError(operation, path, line.size() > 4 ? line.substr(4) : line);
        }
        if (line.starts_with("=")) {
            payload.push_back(line.substr(1));
        } else if (!line.empty()) {
            log_debug(string_format("debug.serial_noise", line));
        }
    }
}

std::vector<std::string> SerialTargetAdapter::request(const std::string& operation, const std::string& path,
                                                      const std::string& line) {
    try {
        connection_->write(line + "\n");
    } catch (const TargetIOError&) {
        throw;
    } catch (const PipkinException& e) {
        throw TargetIOError(operation, path, e.what());
    }
    return await_response(operation, path);
}

std::string SerialTargetAdapter::read_file(const std::string& path) {
    std::string content;
    for (const auto& chunk : request("read", path, "GET " + device_path(path))) {
        try {
            content += base64_decode(trim(chunk));
        } catch (const PipkinException& e) {
            throw TargetIOError("read", path, e.what());
        }
    }
    return content;
}

void SerialTargetAdapter::write_file(const std::string& path, std::string_view content) {
    try {
        connection_->write("PUT " + std::to_string(content.size()) + " " + device_path(path) + "\n");
        for (size_t pos = 0; pos < content.size(); pos += SERIAL_CHUNK_SIZE) {
            connection_->write(base64_encode(content.substr(pos, SERIAL_CHUNK_SIZE)) + "\n");
        }
        connection_->write("END\n");
    } catch (const TargetIOError&) {
        throw;
    } catch (const PipkinException& e) {
        throw TargetIOError("write", path, e.what());
    }
    await_response("write", path);
}

void SerialTargetAdapter::delete_file(const std::string& path) {
    request("delete", path, "RM " + device_path(path));
}

void SerialTargetAdapter::make_dirs(const std::string& path) {
    // MKDIR creates missing parents and accepts existing directories
    request("mkdir", path, "MKDIR " + device_path(path));
}

bool SerialTargetAdapter::remove_dir_if_empty(const std::string& path) {
    if (!list_dir(path).empty()) {
        return false;
    }
    request("rmdir", path, "RMDIR " + device_path(path));
    return true;
}

std::vector<DirEntry> SerialTargetAdapter::list_dir(const std::string& path) {
    std::vector<DirEntry> result;
    for (const auto& line : request("list", path, "LS " + device_path(path))) {
        DirEntry entry;
        if (line.starts_with("D ")) {
            entry.name = line.substr(2);
            entry.is_dir = true;
        } else if (line.starts_with("F ")) {
            const auto space = line.find(' ', 2);
            if (space == std::string::npos) {
                throw TargetIOError("list", path, string_format("error.serial_bad_listing", line));
            }
            try {
                entry.size = std::stoull(line.substr(2, space - 2));
            } catch (const std::exception&) {
                throw TargetIOError("list", path, string_format("error.serial_bad_listing", line));
            }
            entry.name = line.substr(space + 1);
        } else {
            throw TargetIOError("list", path, string_format("error.serial_bad_listing", line));
        }
        result.push_back(std::move(entry));
    }
    std::ranges::sort(result, {}, &DirEntry::name);
    return result;
}

void SerialTargetAdapter::sync() {
    request("sync", "", "SYNC");
}

std::string SerialTargetAdapter::describe() const {
    return string_format("target.serial", connection_->name());
}

std::optional<std::string> SerialTargetAdapter::runtime_version() {
    if (!runtime_version_) {
        auto payload = request("version", "", "VER");
        if (payload.empty()) return std::nullopt;
        // "<runtime> <version>"
        auto parts = split(trim(payload.front()), ' ');
        runtime_version_ = parts.size() > 1 ? parts[1] : parts[0];
    }
    return runtime_version_;
}
