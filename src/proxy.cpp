#include "proxy.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "overrides.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iterator>

namespace {

constexpr size_t MAX_REQUEST_HEADER = 64 * 1024;
constexpr int CLIENT_READ_TIMEOUT_MS = 30000;
constexpr int ACCEPT_POLL_MS = 200;

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string percent_decode(const std::string& text) {
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

HttpReply make_reply(int status, const std::string& reason, std::string body = "") {
    HttpReply reply;
    reply.status = status;
    reply.reason = reason;
    reply.body = body.empty() ? std::to_string(status) + " " + reason + "\n" : std::move(body);
    reply.headers.emplace_back("Content-Type", "text/plain");
    return reply;
}

HttpReply redirect(int status, const std::string& reason, const std::string& location) {
    HttpReply reply = make_reply(status, reason);
    reply.headers.emplace_back("Location", location);
    return reply;
}

bool send_all(int fd, std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Reads up to the blank line ending the request header; gives up on shutdown
std::string read_request_header(int fd, const std::atomic<bool>& stopping) {
    std::string data;
    char buffer[4096];
    int idle_ms = 0;
    while (data.find("\r\n\r\n") == std::string::npos && data.find("\n\n") == std::string::npos) {
        if (data.size() > MAX_REQUEST_HEADER || stopping) return "";
        if (idle_ms >= CLIENT_READ_TIMEOUT_MS) return "";
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0) return "";
        if (rc == 0) {
            idle_ms += ACCEPT_POLL_MS;
            continue;
        }
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        data.append(buffer, static_cast<size_t>(n));
    }
    return data;
}

} // anonymous namespace

// --- Route table ---

PackageRoute RouteTable::route_for(const std::string& name) const {
    auto it = packages.find(normalize_name(name));
    return it == packages.end() ? PackageRoute{} : it->second;
}

bool RouteTable::constraint_allows(const std::string& name, const std::string& version) const {
    auto it = constraints.find(normalize_name(name));
    if (it == constraints.end() || it->second.empty()) {
        return true;
    }
    if (version.empty()) {
        return false;
    }
    return std::ranges::all_of(it->second, [&](const Requirement& req) { return req.satisfied_by(version); });
}

std::vector<IndexRoute> default_indexes(const Settings& settings) {
    std::vector<IndexRoute> indexes;
    if (!settings.no_mp_org) {
        indexes.push_back({MP_ORG_INDEX, true});
    }
    indexes.push_back({strip_trailing_slash(settings.index_url.empty() ? PYPI_INDEX : settings.index_url), false});
    for (const auto& url : settings.extra_index_urls) {
        indexes.push_back({strip_trailing_slash(url), false});
    }
    return indexes;
}

RouteTable build_route_table(const Settings& settings, const std::vector<Requirement>& requirements) {
    RouteTable table;
    table.indexes = default_indexes(settings);

    for (const auto& name : BUILTIN_DUMMY_PACKAGES) {
        table.packages[normalize_name(name)].dummy = true;
    }
    for (const auto& name : settings.dummy_packages) {
        table.packages[normalize_name(name)].dummy = true;
    }
    for (const auto& name : settings.rewrite_legacy_packages) {
        table.packages[normalize_name(name)].rewrite_legacy = true;
    }
    for (const auto& [name, url] : settings.excluded_indexes) {
        table.packages[normalize_name(name)].excluded_indexes.insert(strip_trailing_slash(url));
    }
    for (const auto& [name, url] : settings.pinned_indexes) {
        table.packages[normalize_name(name)].pinned_index = strip_trailing_slash(url);
    }

    for (const auto& req : requirements) {
        if (!req.clauses.empty()) {
            table.constraints[req.name].push_back(req);
        }
    }
    return table;
}

// --- Resolution ---

ProxyIndexServer::ProxyIndexServer(RouteTable routes, UpstreamFactory upstream_factory)
    : routes_(std::move(routes)), upstream_factory_(std::move(upstream_factory)) {}

ProxyIndexServer::~ProxyIndexServer() {
    shutdown();
}

std::vector<IndexRoute> ProxyIndexServer::candidate_indexes(const PackageRoute& route) const {
    if (!route.pinned_index.empty()) {
        return {{route.pinned_index, route.pinned_index == MP_ORG_INDEX}};
    }
    std::vector<IndexRoute> result;
    for (const auto& index : routes_.indexes) {
        if (!route.excluded_indexes.contains(index.url)) {
            result.push_back(index);
        }
    }
    return result;
}

std::vector<ServedFile> ProxyIndexServer::resolve_dummy(const std::string& name, const PackageRoute& route) const {
    std::vector<std::string> versions;
    for (const auto& index : candidate_indexes(route)) {
        try {
            for (const auto& link : upstream_factory_(index.url)->list_files(name)) {
                if (link.version.empty()) continue;
                const bool known = std::ranges::any_of(versions, [&](const std::string& v) {
                    return versions_equal(v, link.version);
                });
                if (!known) versions.push_back(link.version);
            }
        } catch (const UpstreamUnreachable& e) {
            log_warning(e.what());
            continue;
        }
        if (!versions.empty()) break;
    }
    if (versions.empty()) {
        versions.push_back("0.0.0");
    }
    std::ranges::sort(versions, version_compare);

    std::vector<ServedFile> files;
    for (const auto& version : versions) {
        ServedFile file;
        file.link.filename = placeholder_wheel_filename(name, version);
        file.link.version = version;
        file.source = ServedFile::Source::Placeholder;
        files.push_back(std::move(file));
    }
    return files;
}

std::vector<ServedFile> ProxyIndexServer::resolve(const std::string& name) const {
    const std::string normalized = normalize_name(name);
    const PackageRoute route = routes_.route_for(normalized);
    if (route.dummy) {
        log_debug(string_format("debug.proxy_dummy", normalized));
        return resolve_dummy(normalized, route);
    }

    for (const auto& index : candidate_indexes(route)) {
        std::vector<FileLink> links;
        try {
            links = upstream_factory_(index.url)->list_files(normalized);
        } catch (const UpstreamUnreachable& e) {
            log_warning(string_format("warning.upstream_unreachable", index.url, e.what()));
            continue;
        }

        const bool satisfies = std::ranges::any_of(links, [&](const FileLink& link) {
            return routes_.constraint_allows(normalized, link.version);
        });
        if (!satisfies) continue;

        log_debug(string_format("debug.proxy_resolved", normalized, index.url));
        std::vector<ServedFile> files;
        for (auto& link : links) {
            ServedFile file;
            const bool rewrite = (index.rewrite_legacy_sdists || route.rewrite_legacy) &&
                                 (link.filename.ends_with(".tar.gz") || link.filename.ends_with(".tgz"));
            file.source = rewrite ? ServedFile::Source::Rewrite : ServedFile::Source::Redirect;
            file.link = std::move(link);
            files.push_back(std::move(file));
        }
        return files;
    }
    return {};
}

// --- HTTP ---

HttpReply ProxyIndexServer::serve_listing(const std::string& name) const {
    const auto files = resolve(name);
    if (files.empty()) {
        return make_reply(404, "Not Found");
    }

    const std::string normalized = normalize_name(name);
    std::string html = "<!DOCTYPE html>\n<html>\n<head><title>Links for " + html_escape(normalized) +
                       "</title></head>\n<body>\n<h1>Links for " + html_escape(normalized) + "</h1>\n";
    for (const auto& file : files) {
        std::string href = "/" + normalized + "/" + file.link.filename;
        if (file.source == ServedFile::Source::Redirect && !file.link.hash_fragment.empty()) {
            href += "#" + file.link.hash_fragment;
        }
        html += "<a href=\"" + html_escape(href) + "\"";
        if (!file.link.requires_python.empty()) {
            html += " data-requires-python=\"" + html_escape(file.link.requires_python) + "\"";
        }
        html += ">" + html_escape(file.link.filename) + "</a><br/>\n";
    }
    html += "</body>\n</html>\n";

    HttpReply reply;
    reply.body = std::move(html);
    reply.headers.emplace_back("Content-Type", "text/html; charset=utf-8");
    return reply;
}

HttpReply ProxyIndexServer::serve_file(const std::string& name, const std::string& filename) const {
    const auto files = resolve(name);
    const auto it = std::ranges::find_if(files, [&](const ServedFile& f) { return f.link.filename == filename; });
    if (it == files.end()) {
        return make_reply(404, "Not Found");
    }

    switch (it->source) {
        case ServedFile::Source::Redirect:
            return redirect(302, "Found", it->link.url);
        case ServedFile::Source::Placeholder: {
            HttpReply reply;
            reply.body = build_placeholder_wheel(normalize_name(name), it->link.version).content;
            reply.headers.emplace_back("Content-Type", "application/octet-stream");
            return reply;
        }
        case ServedFile::Source::Rewrite:
            break;
    }

    std::string original;
    try {
        original = upstream_factory_(it->link.url)->fetch_file(it->link.url);
    } catch (const UpstreamUnreachable& e) {
        log_warning(e.what());
        return make_reply(404, "Not Found");
    }

    HttpReply reply;
    try {
        reply.body = rewrite_legacy_sdist(original);
    } catch (const PipkinException& e) {
        log_warning(string_format("warning.sdist_not_rewritten", filename, e.what()));
        reply.body = std::move(original);
    }
    reply.headers.emplace_back("Content-Type", "application/octet-stream");
    return reply;
}

HttpReply ProxyIndexServer::handle(const std::string& method, const std::string& target) const {
    if (method != "GET" && method != "HEAD") {
        HttpReply reply = make_reply(405, "Method Not Allowed");
        reply.headers.emplace_back("Allow", "GET, HEAD");
        return reply;
    }

    const std::string path = percent_decode(target.substr(0, target.find_first_of("?#")));
    if (!path.starts_with("/")) {
        return make_reply(400, "Bad Request");
    }

    auto segments = split(std::string_view(path).substr(1), '/');
    if (segments.empty() || segments[0].empty()) {
        return make_reply(404, "Not Found");
    }
    if (segments.size() == 1) {
        return redirect(301, "Moved Permanently", "/" + segments[0] + "/");
    }
    if (segments.size() == 2 && segments[1].empty()) {
        return serve_listing(segments[0]);
    }
    if (segments.size() == 2) {
        return serve_file(segments[0], segments[1]);
    }
    return make_reply(404, "Not Found");
}

// --- Server ---

void ProxyIndexServer::start() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        throw PipkinException(string_format("error.proxy_socket_failed", std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(listen_fd_, 16) < 0) {
        int err = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw PipkinException(string_format("error.proxy_socket_failed", std::strerror(err)));
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        int err = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw PipkinException(string_format("error.proxy_socket_failed", std::strerror(err)));
    }
    port_ = ntohs(addr.sin_port);

    stopping_ = false;
    accept_thread_ = std::thread(&ProxyIndexServer::accept_loop, this);
    log_debug(string_format("debug.proxy_started", index_url()));
}

void ProxyIndexServer::shutdown() {
    stopping_ = true;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

std::string ProxyIndexServer::index_url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + "/";
}

void ProxyIndexServer::accept_loop() {
    while (!stopping_) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc <= 0) continue;

        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                log_warning(string_format("warning.proxy_accept_failed", std::strerror(errno)));
            }
            continue;
        }

        reap_finished_workers();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back({std::thread([this, client_fd, done]() {
                                serve_connection(client_fd);
                                ::close(client_fd);
                                *done = true;
                            }),
                            done});
    }
}

void ProxyIndexServer::reap_finished_workers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = std::stable_partition(workers_.begin(), workers_.end(),
                                        [](const Worker& worker) { return !*worker.done; });
        std::move(it, workers_.end(), std::back_inserter(finished));
        workers_.erase(it, workers_.end());
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

size_t ProxyIndexServer::tracked_connections() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void ProxyIndexServer::serve_connection(int client_fd) const {
    const std::string header = read_request_header(client_fd, stopping_);
    if (header.empty() && stopping_) {
        return;
    }
    const auto line_end = header.find_first_of("\r\n");
    const auto parts = split(header.substr(0, line_end), ' ');

    HttpReply reply;
    std::string method;
    if (parts.size() < 2) {
        reply = make_reply(400, "Bad Request");
    } else {
        method = parts[0];
        log_debug(string_format("debug.proxy_request", parts[0], parts[1]));
        try {
            reply = handle(method, parts[1]);
        } catch (const std::exception& e) {
            log_error(string_format("error.proxy_handler_failed", parts[1], e.what()));
            reply = make_reply(500, "Internal Server Error");
        }
    }

    std::string response = "HTTP/1.0 " + std::to_string(reply.status) + " " + reply.reason + "\r\n";
    for (const auto& [key, value] : reply.headers) {
        response += key + ": " + value + "\r\n";
    }
    response += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    if (method != "HEAD") {
        response += reply.body;
    }
    if (!send_all(client_fd, response)) {
        log_debug(string_format("debug.proxy_send_failed", std::strerror(errno)));
    }
}
