#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

inline const std::string MP_ORG_INDEX = "https://micropython.org/pi/simple";
inline const std::string PYPI_INDEX = "https://pypi.org/simple";
inline constexpr long DEFAULT_UPSTREAM_TIMEOUT = 20; // seconds

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path CACHE_DIR;
extern std::filesystem::path CONFIG_FILE;

// Derived paths
extern std::filesystem::path WORKSPACES_DIR;
extern std::filesystem::path PIP_CACHE_DIR;
std::filesystem::path get_tmp_dir();

struct Settings {
    std::string index_url;
    std::vector<std::string> extra_index_urls;
    bool no_mp_org = false;
    long timeout = DEFAULT_UPSTREAM_TIMEOUT;
    std::string python = "python3";
    std::string mpy_cross = "mpy-cross";
    std::vector<std::string> dummy_packages;
    std::vector<std::string> rewrite_legacy_packages;
    // (package, index url)
    std::vector<std::pair<std::string, std::string>> excluded_indexes;
    std::vector<std::pair<std::string, std::string>> pinned_indexes;
};

// Functions
void set_cache_dir(const std::string& cache_dir);
void set_config_file(const std::string& config_file);
void init_paths_from_environment();
Settings load_settings();
Settings load_settings(const std::filesystem::path& config_file);
