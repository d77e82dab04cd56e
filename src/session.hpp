#pragma once

#include "compiler.hpp"
#include "config.hpp"
#include "installer.hpp"
#include "planner.hpp"
#include "proxy.hpp"
#include "target.hpp"
#include "workspace.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct IndexOptions {
    bool no_index = false;
    std::vector<std::string> find_links;
};

struct SelectionOptions {
    std::vector<std::string> specs;
    std::vector<std::string> requirement_files;
    std::vector<std::string> constraint_files;
    bool pre = false;
    bool no_deps = false;
};

struct InstallOptions {
    SelectionOptions selection;
    bool upgrade = false;
    std::string upgrade_strategy;
    bool force_reinstall = false;
    bool compile = false;
    bool keep_going = false;
};

struct ListOptions {
    bool outdated = false;
    bool uptodate = false;
    bool not_required = false;
    bool pre = false;
    std::string format;
    std::vector<std::string> excludes;
};

// One engine run against one target: wires target, workspace, proxy and planner
class Session {
public:
    using CompilerFactory = std::function<std::unique_ptr<Compiler>(const std::string& executable)>;

    Session(TargetAdapter& target, Installer& installer, Settings settings, IndexOptions index_options,
            ProxyIndexServer::UpstreamFactory upstream_factory, fs::path workspaces_root, fs::path pip_cache_dir);

    ApplyReport install(const InstallOptions& options);
    ApplyReport uninstall(const std::vector<std::string>& packages, const std::vector<std::string>& requirement_files,
                          bool yes, bool keep_going);
    void list(const ListOptions& options);
    void show(const std::vector<std::string>& packages);
    void freeze(const std::vector<std::string>& excludes);
    void check();
    void download(const SelectionOptions& selection, const std::string& dest);
    // Builds wheels for the selection; pip's working directory when wheel_dir is empty
    void wheel(const SelectionOptions& selection, const std::string& wheel_dir);
    void cache(const std::string& command, const std::vector<std::string>& args);

    void set_compiler_factory(CompilerFactory factory) { compiler_factory_ = std::move(factory); }
    WorkspaceManager& workspace() { return workspace_; }

private:
    PackageSnapshot populate();
    void invoke(const std::vector<std::string>& args);
    void invoke_with_index(std::vector<std::string> args, const std::vector<Requirement>& requirements);
    ApplyReport apply_changes(const PackageSnapshot& target_state, const PackageSnapshot& before, bool compile,
                              bool keep_going);

    TargetAdapter& target_;
    Settings settings_;
    IndexOptions index_options_;
    ProxyIndexServer::UpstreamFactory upstream_factory_;
    WorkspaceManager workspace_;
    CompilerFactory compiler_factory_;
};

std::vector<std::string> selection_args(const SelectionOptions& selection);
std::vector<std::string> exclusion_args(const std::vector<std::string>& excludes);
// Top-level requirements from specifiers, requirement and constraint files; unparseable lines are skipped
std::vector<Requirement> collect_requirements(const SelectionOptions& selection);
