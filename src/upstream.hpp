#pragma once

#include <string>
#include <vector>

// One file offered by a "simple" index page
struct FileLink {
    std::string filename;
    std::string url; // absolute, without fragment
    std::string hash_fragment; // e.g. "sha256=..."; empty when the index gives none
    std::string version; // empty when the filename cannot be parsed
    std::string requires_python;
};

class UpstreamIndex {
public:
    virtual ~UpstreamIndex() = default;

    virtual const std::string& url() const = 0;
    // Empty when the index does not know the package. Throws UpstreamUnreachable.
    virtual std::vector<FileLink> list_files(const std::string& name) = 0;
    // Throws UpstreamUnreachable
    virtual std::string fetch_file(const std::string& url) = 0;
};

class HttpUpstreamIndex : public UpstreamIndex {
public:
    HttpUpstreamIndex(std::string url, long timeout_seconds);

    const std::string& url() const override { return url_; }
    std::vector<FileLink> list_files(const std::string& name) override;
    std::string fetch_file(const std::string& url) override;

private:
    std::string url_;
    long timeout_seconds_;
};

std::vector<FileLink> parse_simple_index_page(const std::string& html, const std::string& page_url,
                                              const std::string& name);
std::string version_from_filename(const std::string& filename, const std::string& name);
bool is_wheel_filename(const std::string& filename);
bool is_sdist_filename(const std::string& filename);

std::string resolve_url(const std::string& base, const std::string& href);
std::string html_escape(const std::string& text);
std::string html_unescape(const std::string& text);
