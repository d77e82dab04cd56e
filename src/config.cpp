#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

fs::path CACHE_DIR = "/tmp/pipkin-cache";
fs::path CONFIG_FILE = "/etc/pipkin/pipkin.conf";

// Derived paths
fs::path WORKSPACES_DIR = CACHE_DIR / "workspaces";
fs::path PIP_CACHE_DIR = CACHE_DIR / "pip";

void set_cache_dir(const std::string& cache_dir) {
    CACHE_DIR = fs::path(cache_dir).lexically_normal();
    WORKSPACES_DIR = CACHE_DIR / "workspaces";
    PIP_CACHE_DIR = CACHE_DIR / "pip";
}

void set_config_file(const std::string& config_file) {
    CONFIG_FILE = config_file;
}

void init_paths_from_environment() {
    const char* home = getenv("HOME");

    if (const char* dir = getenv("PIPKIN_CACHE_DIR"); dir && *dir) {
        set_cache_dir(dir);
    } else if (const char* xdg = getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        set_cache_dir((fs::path(xdg) / "pipkin").string());
    } else if (home && *home) {
        set_cache_dir((fs::path(home) / ".cache" / "pipkin").string());
    }

    if (const char* conf = getenv("PIPKIN_CONFIG"); conf && *conf) {
        set_config_file(conf);
    } else if (const char* xdg = getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        set_config_file((fs::path(xdg) / "pipkin" / "pipkin.conf").string());
    } else if (home && *home) {
        set_config_file((fs::path(home) / ".config" / "pipkin" / "pipkin.conf").string());
    }
}

fs::path get_tmp_dir() {
    static const fs::path tmp_dir = fs::temp_directory_path() / ("pipkin_" + std::to_string(getpid()));
    return tmp_dir;
}

Settings load_settings() {
    return load_settings(CONFIG_FILE);
}

Settings load_settings(const fs::path& config_file) {
    Settings settings;
    if (!fs::exists(config_file)) {
        return settings;
    }

    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw PipkinException(string_format("error.open_file_failed", config_file.string()));
    }

    // Returns (package, url) for "exclude-index" / "pin-index" values
    auto package_and_url = [&](const std::string& value, int line_no) {
        const auto pos = value.find_first_of(" \t");
        if (pos == std::string::npos) {
            throw PipkinException(string_format("error.config_syntax", config_file.string(), line_no));
        }
        return std::make_pair(trim(value.substr(0, pos)), trim(value.substr(pos + 1)));
    };

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw PipkinException(string_format("error.config_syntax", config_file.string(), line_no));
        }
        const std::string key = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));

        if (key == "index-url") {
            settings.index_url = value;
        } else if (key == "extra-index-url") {
            settings.extra_index_urls.push_back(value);
        } else if (key == "no-mp-org") {
            settings.no_mp_org = (value == "1" || value == "true" || value == "yes");
        } else if (key == "timeout") {
            try {
                settings.timeout = std::stol(value);
            } catch (const std::exception&) {
                throw PipkinException(string_format("error.config_syntax", config_file.string(), line_no));
            }
        } else if (key == "python") {
            settings.python = value;
        } else if (key == "mpy-cross") {
            settings.mpy_cross = value;
        } else if (key == "dummy") {
            settings.dummy_packages.push_back(value);
        } else if (key == "rewrite-legacy") {
            settings.rewrite_legacy_packages.push_back(value);
        } else if (key == "exclude-index") {
            settings.excluded_indexes.push_back(package_and_url(value, line_no));
        } else if (key == "pin-index") {
            settings.pinned_indexes.push_back(package_and_url(value, line_no));
        } else {
            log_warning(string_format("warning.unknown_config_key", key, config_file.string()));
        }
    }
    return settings;
}
