#include "version.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <string_view>
#include <tuple>

namespace {

const std::regex& version_regex() {
    static const std::regex re(
        R"(^\s*v?(?:(\d+)!)?(\d+(?:\.\d+)*))"
        R"((?:[-_.]?(a|b|c|rc|alpha|beta|pre|preview)[-_.]?(\d+)?)?)"
        R"((?:(?:-(\d+))|(?:[-_.]?(post|rev|r)[-_.]?(\d+)?))?)"
        R"((?:[-_.]?(dev)[-_.]?(\d+)?)?)"
        R"((?:\+([a-z0-9]+(?:[-_.][a-z0-9]+)*))?\s*$)",
        std::regex::icase);
    return re;
}

long to_long(const std::ssub_match& m) {
    return m.matched ? std::stol(m.str()) : 0;
}

bool is_numeric(const std::string& s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; });
}

// dev-only releases sort before pre-releases, finals after them
std::tuple<int, int, long> pre_key(const Version& v) {
    if (!v.pre && !v.post && v.dev) return {0, 0, 0};
    if (!v.pre) return {2, 0, 0};
    return {1, v.pre->first, v.pre->second};
}

std::tuple<int, long> post_key(const Version& v) {
    if (!v.post) return {0, 0};
    return {1, *v.post};
}

std::tuple<int, long> dev_key(const Version& v) {
    if (!v.dev) return {1, 0};
    return {0, *v.dev};
}

int compare_release(const std::vector<long>& a, const std::vector<long>& b) {
    const size_t len = std::max(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        const long x = i < a.size() ? a[i] : 0;
        const long y = i < b.size() ? b[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }
    return 0;
}

// Local segments may be arbitrarily long digit runs
int compare_digits(const std::string& a, const std::string& b) {
    const auto x = std::string_view(a).substr(std::min(a.find_first_not_of('0'), a.size()));
    const auto y = std::string_view(b).substr(std::min(b.find_first_not_of('0'), b.size()));
    if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
    if (x != y) return x < y ? -1 : 1;
    return 0;
}

int compare_local(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const size_t len = std::min(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        const bool na = is_numeric(a[i]);
        const bool nb = is_numeric(b[i]);
        if (na && nb) {
            if (int c = compare_digits(a[i], b[i]); c != 0) return c;
        } else if (na != nb) {
            return na ? 1 : -1; // numeric segments sort after alphanumeric ones
        } else if (a[i] != b[i]) {
            return a[i] < b[i] ? -1 : 1;
        }
    }
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    return 0;
}

template<typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

bool release_prefix_matches(const Version& v, const Version& prefix) {
    if (v.epoch != prefix.epoch) return false;
    for (size_t i = 0; i < prefix.release.size(); ++i) {
        const long x = i < v.release.size() ? v.release[i] : 0;
        if (x != prefix.release[i]) return false;
    }
    return true;
}

bool same_release(const Version& a, const Version& b) {
    return a.epoch == b.epoch && compare_release(a.release, b.release) == 0;
}

} // anonymous namespace

std::optional<Version> Version::parse(const std::string& text) {
    std::smatch m;
    if (!std::regex_match(text, m, version_regex())) {
        return std::nullopt;
    }

    Version v;
    try {
        v.epoch = to_long(m[1]);
        for (const auto& part : split(m[2].str(), '.')) {
            v.release.push_back(std::stol(part));
        }
        if (m[3].matched) {
            const std::string label = to_lower(m[3].str());
            int kind = 2;
            if (label == "a" || label == "alpha") kind = 0;
            else if (label == "b" || label == "beta") kind = 1;
            v.pre = std::make_pair(kind, to_long(m[4]));
        }
        if (m[5].matched) {
            v.post = to_long(m[5]);
        } else if (m[6].matched) {
            v.post = to_long(m[7]);
        }
        if (m[8].matched) {
            v.dev = to_long(m[9]);
        }
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (m[10].matched) {
        std::string local = to_lower(m[10].str());
        std::ranges::replace(local, '-', '.');
        std::ranges::replace(local, '_', '.');
        v.local = split(local, '.');
    }
    return v;
}

std::string Version::public_str() const {
    std::string out;
    if (epoch != 0) out += std::to_string(epoch) + "!";
    for (size_t i = 0; i < release.size(); ++i) {
        if (i > 0) out += ".";
        out += std::to_string(release[i]);
    }
    if (pre) {
        static const char* labels[] = {"a", "b", "rc"};
        out += labels[pre->first] + std::to_string(pre->second);
    }
    if (post) out += ".post" + std::to_string(*post);
    if (dev) out += ".dev" + std::to_string(*dev);
    return out;
}

std::string Version::str() const {
    std::string out = public_str();
    for (size_t i = 0; i < local.size(); ++i) {
        out += (i == 0 ? "+" : ".") + local[i];
    }
    return out;
}

int compare_versions(const Version& a, const Version& b, bool include_local) {
    if (int c = three_way(a.epoch, b.epoch); c != 0) return c;
    if (int c = compare_release(a.release, b.release); c != 0) return c;
    if (int c = three_way(pre_key(a), pre_key(b)); c != 0) return c;
    if (int c = three_way(post_key(a), post_key(b)); c != 0) return c;
    if (int c = three_way(dev_key(a), dev_key(b)); c != 0) return c;
    return include_local ? compare_local(a.local, b.local) : 0;
}

int compare_versions(const std::string& a, const std::string& b) {
    const auto va = Version::parse(a);
    const auto vb = Version::parse(b);
    if (va && vb) return compare_versions(*va, *vb);
    if (!va && !vb) return three_way(a, b);
    return va ? 1 : -1;
}

bool version_compare(const std::string& v1, const std::string& v2) {
    return compare_versions(v1, v2) < 0;
}

bool versions_equal(const std::string& v1, const std::string& v2) {
    return compare_versions(v1, v2) == 0;
}

bool version_satisfies(const std::string& version, const std::string& op, const std::string& version_req) {
    if (op == "===") {
        return to_lower(trim(version)) == to_lower(trim(version_req));
    }

    const auto v = Version::parse(version);
    if (!v) return false;

    const bool wildcard = version_req.ends_with(".*");
    const auto req = Version::parse(wildcard ? version_req.substr(0, version_req.size() - 2) : version_req);
    if (!req) return false;

    if (op == "==" || op == "!=") {
        bool equal;
        if (wildcard) {
            equal = release_prefix_matches(*v, *req);
        } else {
            equal = compare_versions(*v, *req, !req->local.empty()) == 0;
        }
        return op == "==" ? equal : !equal;
    }
    if (wildcard) return false;

    const int c = compare_versions(*v, *req, false);
    if (op == ">=") return c >= 0;
    if (op == "<=") return c <= 0;
    if (op == "<") {
        // <V never admits pre-releases of V itself unless V is one
        if (c >= 0) return false;
        return !(v->is_prerelease() && !req->is_prerelease() && same_release(*v, *req));
    }
    if (op == ">") {
        if (c <= 0) return false;
        return !(v->post && !req->post && same_release(*v, *req));
    }
    if (op == "~=") {
        if (req->release.size() < 2 || c < 0) return false;
        Version prefix = *req;
        prefix.release.pop_back();
        return release_prefix_matches(*v, prefix);
    }
    return false;
}
