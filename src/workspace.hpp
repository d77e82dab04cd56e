#pragma once

#include "distribution.hpp"
#include "installer.hpp"
#include "utils.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Items a fresh environment ships with; never seeded, cleared or reported
bool is_initial_environment_item(const std::string& name);

// Owns the cached installer environment under <root>/pip-<major>
class WorkspaceManager {
public:
    WorkspaceManager(Installer& installer, fs::path workspaces_root, fs::path pip_cache_dir);

    // Takes the workspace lock, drops workspaces of other installer versions and
    // (re)creates an unfinished environment
    void prepare();

    const fs::path& dir() const { return dir_; }
    fs::path site_dir() const;
    std::string key();

    // Mirrors the target: one placeholder metadata directory per distribution, no payload
    void seed(const PackageSnapshot& snapshot);
    ProcessResult run_installer(const std::vector<std::string>& args);
    PackageSnapshot snapshot() const;

    // Removes every cached environment
    void discard_all();

private:
    void clear_site_packages();

    Installer& installer_;
    fs::path root_;
    fs::path pip_cache_dir_;
    fs::path dir_;
    std::unique_ptr<WorkspaceLock> lock_;
};
