#include "detect.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <sstream>

namespace {

// Board vendors shipping MicroPython or CircuitPython over USB CDC
constexpr std::array<std::string_view, 6> KNOWN_VENDOR_IDS = {
    "2e8a", // Raspberry Pi
    "f055", // MicroPython (pyboard)
    "239a", // Adafruit
    "303a", // Espressif
    "10c4", // Silicon Labs CP210x
    "1a86", // WCH CH340
};

constexpr std::array<std::string_view, 2> KNOWN_VOLUME_LABELS = {"CIRCUITPY", "PYBFLASH"};

std::string read_sysfs_value(const fs::path& path) {
    std::ifstream in(path);
    std::string value;
    std::getline(in, value);
    return trim(value);
}

// /proc/mounts escapes blanks as octal, e.g. "\040"
std::string unescape_mount_field(const std::string& field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string octal = field.substr(i + 1, 3);
            if (std::ranges::all_of(octal, [](char c) { return c >= '0' && c <= '7'; })) {
                out += static_cast<char>(std::stoi(octal, nullptr, 8));
                i += 3;
                continue;
            }
        }
        out += field[i];
    }
    return out;
}

void find_serial_candidates(const DetectionSources& sources, std::vector<TargetCandidate>& result) {
    std::error_code ec;
    if (!fs::is_directory(sources.sysfs_tty, ec)) {
        return;
    }

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(sources.sysfs_tty, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.starts_with("ttyACM") || name.starts_with("ttyUSB")) {
            names.push_back(name);
        }
    }
    std::ranges::sort(names);

    for (const auto& name : names) {
        // device points at the USB interface, idVendor lives one level up
        const fs::path interface = fs::canonical(sources.sysfs_tty / name / "device", ec);
        if (ec) {
            log_debug(string_format("debug.detect_skip_tty", name));
            continue;
        }
        const std::string vid = to_lower(read_sysfs_value(interface.parent_path() / "idVendor"));
        if (std::ranges::find(KNOWN_VENDOR_IDS, vid) == KNOWN_VENDOR_IDS.end()) {
            log_debug(string_format("debug.detect_unknown_vendor", name, vid));
            continue;
        }
        const std::string product = read_sysfs_value(interface.parent_path() / "product");
        result.push_back({TargetCandidate::Kind::Serial, (sources.dev_dir / name).string(),
                          product.empty() ? vid : vid + " " + product});
    }
}

void find_mount_candidates(const DetectionSources& sources, std::vector<TargetCandidate>& result) {
    std::ifstream in(sources.mounts_file);
    if (!in) {
        return;
    }
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string device, mount_point;
        if (!(fields >> device >> mount_point)) continue;
        mount_point = unescape_mount_field(mount_point);
        const std::string label = fs::path(mount_point).filename().string();
        if (std::ranges::find(KNOWN_VOLUME_LABELS, label) != KNOWN_VOLUME_LABELS.end()) {
            result.push_back({TargetCandidate::Kind::Mount, mount_point, device});
        }
    }
}

} // anonymous namespace

std::vector<TargetCandidate> find_target_candidates(const DetectionSources& sources) {
    std::vector<TargetCandidate> result;
    find_serial_candidates(sources, result);
    find_mount_candidates(sources, result);
    return result;
}

std::unique_ptr<TargetAdapter> create_target_adapter(const TargetSelection& selection,
                                                     const DetectionSources& sources) {
    const int given = !selection.port.empty() + !selection.mount.empty() + !selection.dir.empty();
    if (given > 1) {
        throw PipkinException(get_string("error.multiple_targets"));
    }

    const std::string package_dir = selection.package_dir.empty() ? DEFAULT_PACKAGE_DIR : selection.package_dir;
    if (!selection.port.empty()) {
        return std::make_unique<SerialTargetAdapter>(std::make_unique<PosixSerialPort>(selection.port),
                                                     std::chrono::seconds(10), package_dir);
    }
    if (!selection.mount.empty()) {
        return std::make_unique<MountTargetAdapter>(selection.mount, package_dir);
    }
    if (!selection.dir.empty()) {
        fs::path root = selection.dir;
        if (!selection.package_dir.empty()) root /= fs::path(selection.package_dir).relative_path();
        return std::make_unique<DirTargetAdapter>(root);
    }

    const auto candidates = find_target_candidates(sources);
    if (candidates.size() != 1) {
        std::string seen;
        for (const auto& candidate : candidates) {
            seen += "\n  " + candidate.location + " (" + candidate.description + ")";
        }
        if (candidates.empty()) {
            throw NoTargetFound(get_string("error.no_target_found"));
        }
        throw NoTargetFound(string_format("error.several_targets_found", candidates.size()) + seen);
    }

    const auto& chosen = candidates.front();
    log_info(string_format("info.target_detected", chosen.location));
    if (chosen.kind == TargetCandidate::Kind::Serial) {
        return std::make_unique<SerialTargetAdapter>(std::make_unique<PosixSerialPort>(chosen.location),
                                                     std::chrono::seconds(10), package_dir);
    }
    return std::make_unique<MountTargetAdapter>(chosen.location, package_dir);
}
