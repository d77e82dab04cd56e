#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// PEP 503 normalization: lower case, runs of "-", "_" and "." become a single "-"
std::string normalize_name(const std::string& name);

struct Requirement {
    std::string name; // normalized
    std::string raw_name;
    std::vector<std::string> extras;
    std::vector<std::pair<std::string, std::string>> clauses; // (operator, version)
    std::string marker;

    // Accepts "name", "name[extra]>=1.0,<2", "name (>=1.0)" and "; marker" suffixes.
    // Throws MalformedMetadata.
    static Requirement parse(const std::string& text);

    bool satisfied_by(const std::string& version) const;
    std::string str() const;
};

struct RecordEntry {
    std::string path;
    std::string hash;
    std::optional<std::uintmax_t> size;

    bool operator==(const RecordEntry&) const = default;
};

// Immutable description of one installed distribution
class Distribution {
public:
    Distribution(std::string display_name, std::string version, std::vector<Requirement> requirements,
                 std::vector<RecordEntry> files, std::string meta_dir = "");

    const std::string& name() const { return name_; }
    const std::string& display_name() const { return display_name_; }
    const std::string& version() const { return version_; }
    const std::vector<Requirement>& requirements() const { return requirements_; }
    const std::vector<RecordEntry>& files() const { return files_; }
    const std::string& meta_dir() const { return meta_dir_; }

    bool is_meta_file(const std::string& path) const;
    // Manifest without the entries of the distribution's own metadata directory
    std::vector<RecordEntry> payload() const;

    // name, version and payload manifest
    bool operator==(const Distribution& other) const;

private:
    std::string name_;
    std::string display_name_;
    std::string version_;
    std::vector<Requirement> requirements_;
    std::vector<RecordEntry> files_;
    std::string meta_dir_;
};

using PackageSnapshot = std::map<std::string, Distribution>;

struct Metadata {
    std::string name;
    std::string version;
    std::vector<Requirement> requirements;
};

std::string make_meta_dir_name(const std::string& name, const std::string& version);
// "foo_bar-1.0.dist-info" -> ("foo-bar", "1.0"); throws MalformedMetadata
std::pair<std::string, std::string> parse_meta_dir_name(const std::string& dir_name);
bool is_meta_dir_name(const std::string& dir_name);

Metadata parse_metadata(const std::string& text);
std::vector<RecordEntry> parse_record(const std::string& text);

// Trimmed declaration file: Metadata-Version, Name, Version, Requires-Dist
std::string render_metadata(const Distribution& dist);
std::string render_metadata(const std::string& name, const std::string& version,
                            const std::vector<Requirement>& requirements);
std::string render_record(const std::vector<RecordEntry>& entries);

Distribution load_distribution(const std::string& meta_dir, const std::string& metadata_text,
                               const std::string& record_text);
