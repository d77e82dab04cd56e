#include "workspace.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "target.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace {

constexpr std::array<std::string_view, 5> INITIAL_DISTS = {"pip", "setuptools", "pkg-resources", "wheel",
                                                           "distutils-hack"};
constexpr std::array<std::string_view, 4> INITIAL_FILES = {"easy_install.py", "distutils-precedence.pth",
                                                           "_distutils_hack", "__pycache__"};

const std::string READY_MARKER = ".ready";
const std::string LOCK_FILE_NAME = "workspace.lock";

// Installer layouts change with the major version only
std::string workspace_key(const std::string& version) {
    return "pip-" + version.substr(0, version.find('.'));
}

} // anonymous namespace

bool is_initial_environment_item(const std::string& name) {
    if (std::ranges::find(INITIAL_FILES, name) != INITIAL_FILES.end()) {
        return true;
    }
    std::string stem = name;
    if (name.ends_with(".dist-info") || name.ends_with(".egg-info")) {
        stem = name.substr(0, name.find('-'));
    }
    return std::ranges::find(INITIAL_DISTS, normalize_name(stem)) != INITIAL_DISTS.end();
}

WorkspaceManager::WorkspaceManager(Installer& installer, fs::path workspaces_root, fs::path pip_cache_dir)
    : installer_(installer), root_(std::move(workspaces_root)), pip_cache_dir_(std::move(pip_cache_dir)) {}

std::string WorkspaceManager::key() {
    return workspace_key(installer_.version());
}

void WorkspaceManager::prepare() {
    ensure_dir_exists(root_);
    lock_ = std::make_unique<WorkspaceLock>(root_ / LOCK_FILE_NAME);

    const std::string current = key();
    for (const auto& entry : fs::directory_iterator(root_)) {
        const std::string name = entry.path().filename().string();
        if (name == current || name == LOCK_FILE_NAME) continue;
        log_debug(string_format("debug.discarding_workspace", entry.path().string()));
        fs::remove_all(entry.path());
    }

    dir_ = root_ / current;
    // The marker holds the installer version found in the finished environment
    if (fs::exists(dir_ / READY_MARKER) && workspace_key(trim(read_file_bytes(dir_ / READY_MARKER))) == current) {
        log_debug(string_format("debug.using_workspace", dir_.string()));
        return;
    }

    fs::remove_all(dir_);
    installer_.create_environment(dir_, installer_environment(current_environment(), pip_cache_dir_));
    const std::string installed = installer_.environment_version(dir_);
    if (workspace_key(installed) != current) {
        throw InstallerFailure(string_format("error.installer_version_mismatch", installed, installer_.version()));
    }
    write_file_bytes(dir_ / READY_MARKER, installed + "\n");
}

fs::path WorkspaceManager::site_dir() const {
    return installer_.site_packages(dir_);
}

void WorkspaceManager::clear_site_packages() {
    const fs::path site = site_dir();
    for (const auto& entry : fs::directory_iterator(site)) {
        if (!is_initial_environment_item(entry.path().filename().string())) {
            fs::remove_all(entry.path());
        }
    }
}

void WorkspaceManager::seed(const PackageSnapshot& snapshot) {
    clear_site_packages();
    const fs::path site = site_dir();

    for (const auto& [name, dist] : snapshot) {
        const std::string& meta_dir = dist.meta_dir();
        ensure_dir_exists(site / meta_dir);

        std::vector<RecordEntry> record = dist.payload();
        record.push_back({meta_dir + "/METADATA", "", std::nullopt});
        record.push_back({meta_dir + "/INSTALLER", "", std::nullopt});
        record.push_back({meta_dir + "/RECORD", "", std::nullopt});

        write_file_bytes(site / meta_dir / "METADATA", render_metadata(dist));
        write_file_bytes(site / meta_dir / "INSTALLER", "pip\n");
        write_file_bytes(site / meta_dir / "RECORD", render_record(record));
        log_debug(string_format("debug.seeded", dist.display_name(), dist.version()));
    }
}

ProcessResult WorkspaceManager::run_installer(const std::vector<std::string>& args) {
    const Environment env = installer_environment(current_environment(), pip_cache_dir_);
    return installer_.run(dir_, args, env, [](std::string_view chunk) {
        if (get_log_level() != LogLevel::ERROR) {
            std::cout << chunk << std::flush;
        }
    });
}

PackageSnapshot WorkspaceManager::snapshot() const {
    DirTargetAdapter site(site_dir());
    return site.list_distributions(is_initial_environment_item);
}

void WorkspaceManager::discard_all() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return;
    for (const auto& entry : fs::directory_iterator(root_)) {
        if (entry.path().filename() == LOCK_FILE_NAME) continue;
        fs::remove_all(entry.path());
    }
}
