#include "distribution.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace {

// Splits one RECORD line, honouring double-quoted fields
std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

std::string quote_csv_field(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

} // anonymous namespace

std::string normalize_name(const std::string& name) {
    std::string out;
    bool in_separator = false;
    for (char c : trim(name)) {
        if (c == '-' || c == '_' || c == '.') {
            in_separator = true;
            continue;
        }
        if (in_separator && !out.empty()) out += '-';
        in_separator = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

Requirement Requirement::parse(const std::string& text) {
    static const std::regex head_re(R"(^\s*([A-Za-z0-9](?:[A-Za-z0-9._-]*[A-Za-z0-9])?)\s*(?:\[([^\]]*)\])?\s*(.*)$)");
    static const std::regex clause_re(R"(^\s*(===|==|!=|~=|<=|>=|<|>)\s*([^\s,;()]+)\s*$)");

    Requirement req;
    std::string body = text;
    if (const auto pos = body.find(';'); pos != std::string::npos) {
        req.marker = trim(body.substr(pos + 1));
        body = body.substr(0, pos);
    }

    std::smatch m;
    if (!std::regex_match(body, m, head_re)) {
        throw MalformedMetadata(string_format("error.bad_requirement", text));
    }
    req.raw_name = m[1].str();
    req.name = normalize_name(req.raw_name);
    if (m[2].matched) {
        for (const auto& extra : split(m[2].str(), ',')) {
            if (auto e = trim(extra); !e.empty()) req.extras.push_back(e);
        }
    }

    std::string rest = trim(m[3].str());
    if (rest.starts_with("@")) {
        return req; // direct URL reference, nothing to compare
    }
    if (rest.starts_with("(") && rest.ends_with(")")) {
        rest = rest.substr(1, rest.size() - 2);
    }
    if (trim(rest).empty()) {
        return req;
    }

    for (const auto& clause : split(rest, ',')) {
        std::smatch cm;
        if (!std::regex_match(clause, cm, clause_re)) {
            throw MalformedMetadata(string_format("error.bad_requirement", text));
        }
        req.clauses.emplace_back(cm[1].str(), cm[2].str());
    }
    return req;
}

bool Requirement::satisfied_by(const std::string& version) const {
    return std::ranges::all_of(clauses, [&](const auto& clause) {
        return version_satisfies(version, clause.first, clause.second);
    });
}

std::string Requirement::str() const {
    std::string out = raw_name.empty() ? name : raw_name;
    if (!extras.empty()) {
        out += "[";
        for (size_t i = 0; i < extras.size(); ++i) out += (i ? "," : "") + extras[i];
        out += "]";
    }
    for (size_t i = 0; i < clauses.size(); ++i) {
        out += (i ? "," : "") + clauses[i].first + clauses[i].second;
    }
    if (!marker.empty()) out += "; " + marker;
    return out;
}

Distribution::Distribution(std::string display_name, std::string version, std::vector<Requirement> requirements,
                           std::vector<RecordEntry> files, std::string meta_dir)
    : name_(normalize_name(display_name)), display_name_(std::move(display_name)), version_(std::move(version)),
      requirements_(std::move(requirements)), files_(std::move(files)), meta_dir_(std::move(meta_dir)) {
    if (meta_dir_.empty()) {
        meta_dir_ = make_meta_dir_name(display_name_, version_);
    }
}

bool Distribution::is_meta_file(const std::string& path) const {
    return path.starts_with(meta_dir_ + "/");
}

std::vector<RecordEntry> Distribution::payload() const {
    std::vector<RecordEntry> result;
    for (const auto& entry : files_) {
        if (!is_meta_file(entry.path)) result.push_back(entry);
    }
    return result;
}

bool Distribution::operator==(const Distribution& other) const {
    return name_ == other.name_ && versions_equal(version_, other.version_) && payload() == other.payload();
}

std::string make_meta_dir_name(const std::string& name, const std::string& version) {
    std::string safe = trim(name);
    std::ranges::replace(safe, '-', '_');
    std::string safe_version = version;
    std::ranges::replace(safe_version, '-', '_');
    return safe + "-" + safe_version + ".dist-info";
}

bool is_meta_dir_name(const std::string& dir_name) {
    return dir_name.ends_with(".dist-info") && dir_name.find('-') != std::string::npos;
}

std::pair<std::string, std::string> parse_meta_dir_name(const std::string& dir_name) {
    if (!is_meta_dir_name(dir_name)) {
        throw MalformedMetadata(string_format("error.bad_meta_dir_name", dir_name));
    }
    const std::string stem = dir_name.substr(0, dir_name.size() - std::string(".dist-info").size());
    const auto pos = stem.find('-');
    if (pos == 0 || pos + 1 >= stem.size()) {
        throw MalformedMetadata(string_format("error.bad_meta_dir_name", dir_name));
    }
    return {normalize_name(stem.substr(0, pos)), stem.substr(pos + 1)};
}

Metadata parse_metadata(const std::string& text) {
    Metadata meta;
    std::istringstream in(text);
    std::string line;
    std::string key, value;

    auto flush = [&]() {
        if (key.empty()) return;
        const std::string lkey = to_lower(key);
        if (lkey == "name") meta.name = trim(value);
        else if (lkey == "version") meta.version = trim(value);
        else if (lkey == "requires-dist") meta.requirements.push_back(Requirement::parse(trim(value)));
        key.clear();
        value.clear();
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break; // headers end, description body follows
        if (line[0] == ' ' || line[0] == '\t') {
            value += " " + trim(line); // continuation
            continue;
        }
        flush();
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            throw MalformedMetadata(string_format("error.bad_metadata_line", line));
        }
        key = trim(line.substr(0, pos));
        value = line.substr(pos + 1);
    }
    flush();

    if (meta.name.empty() || meta.version.empty()) {
        throw MalformedMetadata(get_string("error.metadata_missing_fields"));
    }
    return meta;
}

std::vector<RecordEntry> parse_record(const std::string& text) {
    std::vector<RecordEntry> entries;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        auto fields = split_csv_line(line);
        RecordEntry entry;
        entry.path = fields[0];
        if (entry.path.empty()) {
            throw MalformedMetadata(string_format("error.bad_record_line", line));
        }
        if (fields.size() > 1) entry.hash = fields[1];
        if (fields.size() > 2 && !fields[2].empty()) {
            try {
                entry.size = std::stoull(fields[2]);
            } catch (const std::exception&) {
                throw MalformedMetadata(string_format("error.bad_record_line", line));
            }
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string render_metadata(const std::string& name, const std::string& version,
                            const std::vector<Requirement>& requirements) {
    std::string out = "Metadata-Version: 2.1\n";
    out += "Name: " + name + "\n";
    out += "Version: " + version + "\n";
    for (const auto& req : requirements) {
        out += "Requires-Dist: " + req.str() + "\n";
    }
    return out;
}

std::string render_metadata(const Distribution& dist) {
    return render_metadata(dist.display_name(), dist.version(), dist.requirements());
}

std::string render_record(const std::vector<RecordEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        out += quote_csv_field(entry.path) + "," + entry.hash + ",";
        if (entry.size) out += std::to_string(*entry.size);
        out += "\n";
    }
    return out;
}

Distribution load_distribution(const std::string& meta_dir, const std::string& metadata_text,
                               const std::string& record_text) {
    Metadata meta = parse_metadata(metadata_text);
    auto [dir_name, dir_version] = parse_meta_dir_name(meta_dir);
    if (dir_name != normalize_name(meta.name)) {
        throw MalformedMetadata(string_format("error.meta_dir_name_mismatch", meta_dir, meta.name));
    }
    return Distribution(meta.name, meta.version, std::move(meta.requirements), parse_record(record_text), meta_dir);
}
