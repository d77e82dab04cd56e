#include "upstream.hpp"
#include "distribution.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <regex>

namespace {

constexpr std::array<std::string_view, 5> SDIST_SUFFIXES = {".tar.gz", ".tgz", ".tar.bz2", ".zip", ".tar"};

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

// Collapses "." and ".." segments of the path part of an absolute URL
std::string normalize_url_path(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return url;
    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) return url;

    const std::string origin = url.substr(0, path_start);
    std::string path = url.substr(path_start);
    std::string query;
    if (const auto q = path.find_first_of("?#"); q != std::string::npos) {
        query = path.substr(q);
        path = path.substr(0, q);
    }

    std::vector<std::string> segments;
    const auto parts = split(path, '/');
    for (size_t i = 1; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (part == ".") continue;
        if (part == "..") {
            if (!segments.empty()) segments.pop_back();
            continue;
        }
        segments.push_back(part);
    }

    std::string out = origin;
    for (const auto& segment : segments) out += "/" + segment;
    if (path.ends_with("/") || path.ends_with("/.") || path.ends_with("/..")) {
        if (!out.ends_with("/")) out += "/";
    }
    return out + query;
}

std::string attribute_value(const std::string& attributes, const std::string& name) {
    const std::regex re(name + R"re(\s*=\s*(?:"([^"]*)"|'([^']*)'))re", std::regex::icase);
    std::smatch m;
    if (!std::regex_search(attributes, m, re)) return "";
    return m[1].matched ? m[1].str() : m[2].str();
}

} // anonymous namespace

HttpUpstreamIndex::HttpUpstreamIndex(std::string url, long timeout_seconds)
    : url_(strip_trailing_slash(std::move(url))), timeout_seconds_(timeout_seconds) {}

std::vector<FileLink> HttpUpstreamIndex::list_files(const std::string& name) {
    const std::string page_url = url_ + "/" + normalize_name(name) + "/";
    HttpResponse response = http_get(page_url, timeout_seconds_);
    if (response.status == 404) {
        return {};
    }
    if (response.status != 200) {
        throw UpstreamUnreachable(string_format("error.upstream_status", page_url, response.status));
    }
    return parse_simple_index_page(response.body, response.effective_url, name);
}

std::string HttpUpstreamIndex::fetch_file(const std::string& url) {
    HttpResponse response = http_get(url, timeout_seconds_);
    if (response.status != 200) {
        throw UpstreamUnreachable(string_format("error.upstream_status", url, response.status));
    }
    return std::move(response.body);
}

std::vector<FileLink> parse_simple_index_page(const std::string& html, const std::string& page_url,
                                              const std::string& name) {
    static const std::regex anchor_re(R"(<a\s+([^>]*)>([^<]*)</a\s*>)", std::regex::icase);

    std::vector<FileLink> links;
    for (auto it = std::sregex_iterator(html.begin(), html.end(), anchor_re); it != std::sregex_iterator(); ++it) {
        const std::string attributes = (*it)[1].str();
        std::string href = html_unescape(attribute_value(attributes, "href"));
        if (href.empty()) continue;

        FileLink link;
        if (const auto hash_pos = href.find('#'); hash_pos != std::string::npos) {
            link.hash_fragment = href.substr(hash_pos + 1);
            href = href.substr(0, hash_pos);
        }
        link.url = resolve_url(page_url, href);
        link.requires_python = html_unescape(attribute_value(attributes, "data-requires-python"));

        link.filename = trim(html_unescape((*it)[2].str()));
        if (link.filename.empty()) {
            const std::string path = link.url.substr(0, link.url.find('?'));
            link.filename = path.substr(path.rfind('/') + 1);
        }
        link.version = version_from_filename(link.filename, name);
        links.push_back(std::move(link));
    }
    return links;
}

bool is_wheel_filename(const std::string& filename) {
    return filename.ends_with(".whl");
}

bool is_sdist_filename(const std::string& filename) {
    for (auto suffix : SDIST_SUFFIXES) {
        if (filename.ends_with(suffix)) return true;
    }
    return false;
}

std::string version_from_filename(const std::string& filename, const std::string& name) {
    if (is_wheel_filename(filename)) {
        // {name}-{version}(-{build})?-{python}-{abi}-{platform}.whl
        const auto parts = split(filename.substr(0, filename.size() - 4), '-');
        return parts.size() >= 5 ? parts[1] : "";
    }

    std::string stem;
    for (auto suffix : SDIST_SUFFIXES) {
        if (filename.ends_with(suffix)) {
            stem = filename.substr(0, filename.size() - suffix.size());
            break;
        }
    }
    if (stem.empty()) return "";

    // the name part may itself contain dashes
    const std::string wanted = normalize_name(name);
    for (size_t pos = stem.find('-'); pos != std::string::npos; pos = stem.find('-', pos + 1)) {
        if (normalize_name(stem.substr(0, pos)) == wanted) {
            return stem.substr(pos + 1);
        }
    }
    const auto last = stem.rfind('-');
    return last == std::string::npos ? "" : stem.substr(last + 1);
}

std::string resolve_url(const std::string& base, const std::string& href) {
    if (href.find("://") != std::string::npos) {
        return href;
    }
    const auto scheme_end = base.find("://");
    if (scheme_end == std::string::npos) {
        return href;
    }
    if (href.starts_with("//")) {
        return base.substr(0, scheme_end + 1) + href;
    }
    if (href.starts_with("/")) {
        const auto path_start = base.find('/', scheme_end + 3);
        return normalize_url_path(base.substr(0, path_start) + href);
    }
    std::string dir = base.substr(0, base.find_first_of("?#"));
    dir = dir.substr(0, dir.rfind('/') + 1);
    if (dir.size() <= scheme_end + 3) dir = base + "/";
    return normalize_url_path(dir + href);
}

std::string html_escape(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string html_unescape(const std::string& text) {
    static const std::array<std::pair<std::string_view, char>, 6> entities = {{
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&#39;", '\''}, {"&#x27;", '\''},
    }};
    std::string out;
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                if (text.compare(i, entity.size(), entity) == 0) {
                    out += ch;
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += text[i++];
    }
    return out;
}
