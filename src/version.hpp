#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

// PEP 440 version
struct Version {
    long epoch = 0;
    std::vector<long> release;
    std::optional<std::pair<int, long>> pre; // (0=a, 1=b, 2=rc, number)
    std::optional<long> post;
    std::optional<long> dev;
    std::vector<std::string> local;

    static std::optional<Version> parse(const std::string& text);
    std::string public_str() const;
    std::string str() const;
    bool is_prerelease() const { return pre.has_value() || dev.has_value(); }
};

// Total order; -1, 0 or 1. The local label only breaks ties when include_local is set.
int compare_versions(const Version& a, const Version& b, bool include_local = true);

// String forms. Invalid versions sort before valid ones and compare lexicographically among themselves.
int compare_versions(const std::string& a, const std::string& b);
bool version_compare(const std::string& v1, const std::string& v2); // strictly less
bool versions_equal(const std::string& v1, const std::string& v2);

// Single clause, e.g. (">=", "1.0") or ("==", "1.2.*")
bool version_satisfies(const std::string& version, const std::string& op, const std::string& version_req);
