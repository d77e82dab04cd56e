#pragma once

#include "compiler.hpp"
#include "distribution.hpp"
#include "exception.hpp"
#include "target.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class OperationKind {
    Remove,
    Upgrade,
    Install
};

struct Operation {
    OperationKind kind;
    std::optional<Distribution> from;
    std::optional<Distribution> to;

    const std::string& name() const { return to ? to->name() : from->name(); }
};

using OperationPlan = std::vector<Operation>;

// Removes, then upgrades, then installs, each group sorted by name.
// Equal distributions produce no operation.
OperationPlan compute_plan(const PackageSnapshot& before, const PackageSnapshot& after);
std::string describe_operation(const Operation& op);

struct ApplyOptions {
    Compiler* compiler = nullptr; // .py payload is compiled when set
    bool keep_going = false;
    fs::path scratch_dir; // compiler output; defaults to the process tmp dir
};

struct SkippedFile {
    std::string path;
    std::string reason;
};

struct FailedOperation {
    std::string name;
    std::string message;
};

struct ApplyReport {
    std::vector<std::string> applied;
    std::vector<SkippedFile> skipped_files;
    std::vector<FailedOperation> failed;

    bool complete() const { return failed.empty(); }
};

// Applies a plan to a target, reading new payload from the workspace site directory
class ApplyTask {
public:
    ApplyTask(TargetAdapter& target, fs::path source_root, PackageSnapshot target_state, ApplyOptions options = {});

    ApplyReport run(OperationPlan plan);

private:
    bool record_failure(const Operation& op, const PipkinException& e);
    void remove_tree(const std::string& dir);
    void remove_distribution(const Distribution& planned);
    void install_distribution(const Distribution& dist);
    std::optional<RecordEntry> transfer_file(const RecordEntry& entry);
    std::optional<RecordEntry> transfer_compiled(const std::string& path);
    void ensure_parent_dirs(const std::string& path);

    TargetAdapter& target_;
    fs::path source_root_;
    PackageSnapshot target_state_;
    ApplyOptions options_;
    ApplyReport report_;
    std::set<std::string> ensured_dirs_;
};

// Payload entries that belong on the target: inside the package directory, no byte code caches
bool is_transferable_path(const std::string& path);
