#pragma once

#include "process.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Every workspace runs these, whatever the host Python carries
inline const std::string PINNED_PIP_VERSION = "22.0";
inline const std::string PINNED_WHEEL_VERSION = "0.37";

// The external package installer, driven as a black box
class Installer {
public:
    virtual ~Installer() = default;

    // The version every new environment is meant to run
    virtual std::string version() = 0;
    // Throws InstallerFailure when the environment's installer cannot be queried
    virtual std::string environment_version(const fs::path& dir) = 0;
    virtual void create_environment(const fs::path& dir, const Environment& env) = 0;
    virtual fs::path site_packages(const fs::path& dir) const = 0;
    virtual ProcessResult run(const fs::path& dir, const std::vector<std::string>& args, const Environment& env,
                              const OutputCallback& on_output = {}) = 0;
};

class PipInstaller : public Installer {
public:
    explicit PipInstaller(std::string python = "python3");

    std::string version() override;
    std::string environment_version(const fs::path& dir) override;
    void create_environment(const fs::path& dir, const Environment& env) override;
    fs::path site_packages(const fs::path& dir) const override;
    ProcessResult run(const fs::path& dir, const std::vector<std::string>& args, const Environment& env,
                      const OutputCallback& on_output = {}) override;

private:
    std::string python_;
};

// Environment for the installer: no PIP_* variables, cache inside pipkin's cache directory
Environment installer_environment(const Environment& base, const fs::path& pip_cache_dir);
