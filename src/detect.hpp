#pragma once

#include "target.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Where auto-detection looks; tests point these at fixtures
struct DetectionSources {
    fs::path sysfs_tty = "/sys/class/tty";
    fs::path mounts_file = "/proc/mounts";
    fs::path dev_dir = "/dev";
};

struct TargetCandidate {
    enum class Kind { Serial, Mount };
    Kind kind;
    std::string location; // device node or mount point
    std::string description;
};

std::vector<TargetCandidate> find_target_candidates(const DetectionSources& sources = {});

// At most one of port, mount and dir set; all empty means auto-detect
struct TargetSelection {
    std::string port;
    std::string mount;
    std::string dir;
    // Package directory on the device; relative to dir, and only when given
    std::string package_dir;
};

// Throws NoTargetFound when auto-detection yields zero or several candidates
std::unique_ptr<TargetAdapter> create_target_adapter(const TargetSelection& selection,
                                                     const DetectionSources& sources = {});
