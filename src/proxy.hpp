#pragma once

#include "config.hpp"
#include "distribution.hpp"
#include "upstream.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct IndexRoute {
    std::string url;
    bool rewrite_legacy_sdists = false;
};

struct PackageRoute {
    bool dummy = false;
    bool rewrite_legacy = false;
    std::string pinned_index; // empty when not pinned
    std::set<std::string> excluded_indexes;
};

// Built once per session, read-only while serving
struct RouteTable {
    std::vector<IndexRoute> indexes;
    std::map<std::string, PackageRoute> packages; // by normalized name
    std::map<std::string, std::vector<Requirement>> constraints;

    PackageRoute route_for(const std::string& name) const;
    bool constraint_allows(const std::string& name, const std::string& version) const;
};

std::vector<IndexRoute> default_indexes(const Settings& settings);
RouteTable build_route_table(const Settings& settings, const std::vector<Requirement>& requirements);

struct ServedFile {
    enum class Source { Redirect, Rewrite, Placeholder };
    FileLink link;
    Source source = Source::Redirect;
};

struct HttpReply {
    int status = 200;
    std::string reason = "OK";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

// Local "simple" index merging the upstream indexes of a RouteTable
class ProxyIndexServer {
public:
    using UpstreamFactory = std::function<std::unique_ptr<UpstreamIndex>(const std::string& url)>;

    ProxyIndexServer(RouteTable routes, UpstreamFactory upstream_factory);
    ~ProxyIndexServer();
    ProxyIndexServer(const ProxyIndexServer&) = delete;
    ProxyIndexServer& operator=(const ProxyIndexServer&) = delete;

    // Binds 127.0.0.1 on an ephemeral port and starts accepting
    void start();
    void shutdown();

    uint16_t port() const { return port_; }
    std::string index_url() const;
    // Connection threads not yet reaped, finished or not
    size_t tracked_connections();

    HttpReply handle(const std::string& method, const std::string& target) const;
    // Files offered for one package; empty when no index has it
    std::vector<ServedFile> resolve(const std::string& name) const;

private:
    std::vector<ServedFile> resolve_dummy(const std::string& name, const PackageRoute& route) const;
    std::vector<IndexRoute> candidate_indexes(const PackageRoute& route) const;
    HttpReply serve_listing(const std::string& name) const;
    HttpReply serve_file(const std::string& name, const std::string& filename) const;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void reap_finished_workers();
    void serve_connection(int client_fd) const;

    RouteTable routes_;
    UpstreamFactory upstream_factory_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread accept_thread_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};
