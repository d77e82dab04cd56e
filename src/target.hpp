#pragma once

#include "distribution.hpp"
#include "serial.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Package directory below the device root, unless --target names another
inline const std::string DEFAULT_PACKAGE_DIR = "lib";

struct DirEntry {
    std::string name;
    bool is_dir = false;
    std::uintmax_t size = 0;
};

// Uniform file operations on a package directory. Paths are relative to it and use "/".
// Every transport failure is reported as TargetIOError.
class TargetAdapter {
public:
    virtual ~TargetAdapter() = default;

    // Scans the *.dist-info directories of the package directory. skip receives
    // the metadata directory name.
    PackageSnapshot list_distributions(const std::function<bool(const std::string&)>& skip = {});

    virtual std::string read_file(const std::string& path) = 0;
    // The parent directory must exist (make_dirs)
    virtual void write_file(const std::string& path, std::string_view content) = 0;
    virtual void delete_file(const std::string& path) = 0;
    virtual void make_dirs(const std::string& path) = 0;
    // Returns true when the directory was empty and got removed
    virtual bool remove_dir_if_empty(const std::string& path) = 0;
    // Empty result for a missing directory
    virtual std::vector<DirEntry> list_dir(const std::string& path) = 0;
    virtual void sync() = 0;

    virtual bool supports_streaming_write() const { return false; }
    virtual std::string describe() const = 0;
    // e.g. "1.20.0" for a MicroPython device; nullopt when unknown
    virtual std::optional<std::string> runtime_version() { return std::nullopt; }
};

class DirTargetAdapter : public TargetAdapter {
public:
    explicit DirTargetAdapter(fs::path root);

    std::string read_file(const std::string& path) override;
    void write_file(const std::string& path, std::string_view content) override;
    void delete_file(const std::string& path) override;
    void make_dirs(const std::string& path) override;
    bool remove_dir_if_empty(const std::string& path) override;
    std::vector<DirEntry> list_dir(const std::string& path) override;
    void sync() override;

    bool supports_streaming_write() const override { return true; }
    std::string describe() const override;

    const fs::path& root() const { return root_; }

protected:
    fs::path resolve(const std::string& operation, const std::string& path) const;

private:
    fs::path root_;
};

// Removable volume; packages go to <mount>/lib unless another package directory is given
class MountTargetAdapter : public DirTargetAdapter {
public:
    explicit MountTargetAdapter(fs::path mount_point, const std::string& package_dir = DEFAULT_PACKAGE_DIR);

    void sync() override;
    std::string describe() const override;

private:
    fs::path mount_point_;
};

class SerialTargetAdapter : public TargetAdapter {
public:
    explicit SerialTargetAdapter(std::unique_ptr<SerialConnection> connection,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(10),
                                 const std::string& package_dir = DEFAULT_PACKAGE_DIR);

    std::string read_file(const std::string& path) override;
    void write_file(const std::string& path, std::string_view content) override;
    void delete_file(const std::string& path) override;
    void make_dirs(const std::string& path) override;
    bool remove_dir_if_empty(const std::string& path) override;
    std::vector<DirEntry> list_dir(const std::string& path) override;
    void sync() override;

    std::string describe() const override;
    std::optional<std::string> runtime_version() override;

private:
    // Sends one request line and collects the "=" payload lines up to OK
    std::vector<std::string> request(const std::string& operation, const std::string& path,
                                     const std::string& line);
    std::vector<std::string> await_response(const std::string& operation, const std::string& path);
    std::string device_path(const std::string& path) const;

    std::unique_ptr<SerialConnection> connection_;
    std::chrono::milliseconds timeout_;
    std::string package_root_;
    std::optional<std::string> runtime_version_;
};
