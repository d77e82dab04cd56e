#include "localization.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

#ifndef PIPKIN_L10N_DIR
#define PIPKIN_L10N_DIR "/usr/share/pipkin/l10n"
#endif

namespace fs = std::filesystem;

namespace {
    fs::path l10n_dir = PIPKIN_L10N_DIR;
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;
}

void set_l10n_dir(const fs::path& dir) {
    l10n_dir = dir;
}

void load_strings(const std::string& lang) {
    const fs::path file_path = l10n_dir / (lang + ".txt");
    std::ifstream file(file_path);
    if (!file.is_open()) {
        if (lang != "en") { // Avoid infinite recursion
            load_strings("en");
        } else {
            log_warning("Could not open localization file " + file_path.string());
        }
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        if (line.back() == '\r') line.pop_back();
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            translations[key] = value;
        }
    }
}

void init_localization() {
    translations.clear();
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).size() >= 2 && std::string(lang_env) != "C") {
        lang = std::string(lang_env).substr(0, 2);
    }
    load_strings(lang);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
