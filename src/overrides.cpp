#include "overrides.hpp"
#include "archive.hpp"
#include "distribution.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>
#include <sstream>

const std::vector<std::string> BUILTIN_DUMMY_PACKAGES = {
    "adafruit-blinka",
    "adafruit-platformdetect",
    "adafruit-pureio",
    "pyftdi",
    "pyserial",
    "pyusb",
    "binho-host-adapter",
    "sysv-ipc",
};

namespace {

std::string wheel_escape(const std::string& text) {
    std::string out = text;
    std::ranges::replace(out, '-', '_');
    return out;
}

std::string python_string(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::string python_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += python_string(items[i]);
    }
    return out + "]";
}

std::string strip_dot_slash(std::string path) {
    while (path.starts_with("./")) path.erase(0, 2);
    return path;
}

std::vector<std::string> parse_requires_txt(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.starts_with("[")) break; // extras sections follow
        if (line.empty() || line.starts_with("#")) continue;
        result.push_back(line);
    }
    return result;
}

} // anonymous namespace

std::string placeholder_wheel_filename(const std::string& name, const std::string& version) {
    return wheel_escape(normalize_name(name)) + "-" + wheel_escape(version) + "-py3-none-any.whl";
}

SynthesizedFile build_placeholder_wheel(const std::string& name, const std::string& version) {
    const std::string meta_dir = wheel_escape(normalize_name(name)) + "-" + wheel_escape(version) + ".dist-info";
    const std::string metadata = render_metadata(name, version, {});
    const std::string wheel = "Wheel-Version: 1.0\n"
                              "Generator: pipkin\n"
                              "Root-Is-Purelib: true\n"
                              "Tag: py3-none-any\n";

    std::vector<RecordEntry> record = {
        {meta_dir + "/METADATA", record_hash(metadata), metadata.size()},
        {meta_dir + "/WHEEL", record_hash(wheel), wheel.size()},
        {meta_dir + "/RECORD", "", std::nullopt},
    };

    std::vector<ArchiveMember> members = {
        {meta_dir + "/METADATA", metadata},
        {meta_dir + "/WHEEL", wheel},
        {meta_dir + "/RECORD", render_record(record)},
    };
    return {placeholder_wheel_filename(name, version), write_zip(members)};
}

std::string generate_setup_py(const std::string& name, const std::string& version,
                              const std::vector<std::string>& py_modules, const std::vector<std::string>& packages,
                              const std::vector<std::string>& install_requires) {
    std::string out = "from setuptools import setup\n\n";
    out += "setup(\n";
    out += "    name=" + python_string(name) + ",\n";
    out += "    version=" + python_string(version) + ",\n";
    out += "    py_modules=" + python_list(py_modules) + ",\n";
    out += "    packages=" + python_list(packages) + ",\n";
    out += "    install_requires=" + python_list(install_requires) + ",\n";
    out += ")\n";
    return out;
}

std::string rewrite_legacy_sdist(std::string_view sdist_bytes) {
    std::vector<ArchiveMember> members = read_archive(sdist_bytes);
    if (members.empty()) {
        throw PipkinException(get_string("error.sdist_missing_pkg_info"));
    }

    const std::string first = strip_dot_slash(members.front().path);
    const std::string top = first.substr(0, first.find('/'));
    const std::string prefix = top + "/";

    const ArchiveMember* pkg_info = nullptr;
    const ArchiveMember* requires_txt = nullptr;
    std::vector<std::string> py_modules;
    std::set<std::string> packages;

    for (const auto& member : members) {
        const std::string path = strip_dot_slash(member.path);
        if (member.is_dir || !path.starts_with(prefix)) continue;
        const std::string rel = path.substr(prefix.size());

        if (rel == "PKG-INFO") {
            pkg_info = &member;
            continue;
        }
        const auto slash = rel.rfind('/');
        const std::string dir = slash == std::string::npos ? "" : rel.substr(0, slash);
        const std::string file = slash == std::string::npos ? rel : rel.substr(slash + 1);

        if (dir.ends_with(".egg-info")) {
            if (file == "requires.txt") requires_txt = &member;
            continue;
        }
        if (dir.empty()) {
            if (file.ends_with(".py") && file != "setup.py") {
                py_modules.push_back(file.substr(0, file.size() - 3));
            }
        } else if (file == "__init__.py") {
            std::string package = dir;
            std::ranges::replace(package, '/', '.');
            packages.insert(package);
        }
    }

    if (!pkg_info) {
        throw PipkinException(get_string("error.sdist_missing_pkg_info"));
    }
    Metadata meta = parse_metadata(pkg_info->content);

    std::vector<std::string> install_requires;
    if (requires_txt) {
        install_requires = parse_requires_txt(requires_txt->content);
    } else {
        for (const auto& req : meta.requirements) install_requires.push_back(req.str());
    }
    std::ranges::sort(py_modules);

    const std::string setup_py = generate_setup_py(meta.name, meta.version, py_modules,
                                                   {packages.begin(), packages.end()}, install_requires);

    std::vector<ArchiveMember> rewritten;
    bool replaced = false;
    for (auto& member : members) {
        if (strip_dot_slash(member.path) == prefix + "setup.py") {
            member.content = setup_py;
            replaced = true;
        }
        rewritten.push_back(std::move(member));
    }
    if (!replaced) {
        rewritten.push_back({prefix + "setup.py", setup_py});
    }

    log_debug(string_format("debug.sdist_rewritten", meta.name, meta.version));
    return write_tar_gz(rewritten);
}
