#pragma once

#include <string>
#include <string_view>
#include <vector>

// Packages replaced by metadata-only wheels unless configured otherwise
extern const std::vector<std::string> BUILTIN_DUMMY_PACKAGES;

struct SynthesizedFile {
    std::string filename;
    std::string content;
};

std::string placeholder_wheel_filename(const std::string& name, const std::string& version);

// A wheel holding only a dist-info directory (METADATA, WHEEL, RECORD)
SynthesizedFile build_placeholder_wheel(const std::string& name, const std::string& version);

// Replaces the setup.py of a legacy sdist with one generated from PKG-INFO, the
// archive's modules and packages, and *.egg-info/requires.txt.
// Throws PipkinException when the archive has no PKG-INFO.
std::string rewrite_legacy_sdist(std::string_view sdist_bytes);

std::string generate_setup_py(const std::string& name, const std::string& version,
                              const std::vector<std::string>& py_modules, const std::vector<std::string>& packages,
                              const std::vector<std::string>& install_requires);
