#include "planner.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

OperationPlan compute_plan(const PackageSnapshot& before, const PackageSnapshot& after) {
    OperationPlan removes, upgrades, installs;

    // std::map iterates in name order, so every group comes out sorted
    for (const auto& [name, old_dist] : before) {
        auto it = after.find(name);
        if (it == after.end()) {
            removes.push_back({OperationKind::Remove, old_dist, std::nullopt});
        } else if (!(old_dist == it->second)) {
            upgrades.push_back({OperationKind::Upgrade, old_dist, it->second});
        }
    }
    for (const auto& [name, new_dist] : after) {
        if (!before.contains(name)) {
            installs.push_back({OperationKind::Install, std::nullopt, new_dist});
        }
    }

    OperationPlan plan = std::move(removes);
    plan.insert(plan.end(), std::make_move_iterator(upgrades.begin()), std::make_move_iterator(upgrades.end()));
    plan.insert(plan.end(), std::make_move_iterator(installs.begin()), std::make_move_iterator(installs.end()));
    return plan;
}

std::string describe_operation(const Operation& op) {
    switch (op.kind) {
        case OperationKind::Remove:
            return string_format("info.op_remove", op.from->display_name(), op.from->version());
        case OperationKind::Upgrade:
            return string_format("info.op_upgrade", op.to->display_name(), op.from->version(), op.to->version());
        case OperationKind::Install:
            return string_format("info.op_install", op.to->display_name(), op.to->version());
    }
    return {};
}

bool is_transferable_path(const std::string& path) {
    if (path.empty() || path.starts_with("/") || path.ends_with(".pyc")) {
        return false;
    }
    for (const auto& component : split(path, '/')) {
        if (component == ".." || component == "__pycache__") return false;
    }
    return true;
}

ApplyTask::ApplyTask(TargetAdapter& target, fs::path source_root, PackageSnapshot target_state, ApplyOptions options)
    : target_(target), source_root_(std::move(source_root)), target_state_(std::move(target_state)),
      options_(std::move(options)) {
    if (options_.scratch_dir.empty()) {
        options_.scratch_dir = get_tmp_dir() / "compiled";
    }
}

ApplyReport ApplyTask::run(OperationPlan plan) {
    // All removals first: a file may move from one package to another within a plan
    std::vector<bool> failed(plan.size(), false);
    bool aborted = false;
    for (size_t i = 0; i < plan.size() && !aborted; ++i) {
        if (!plan[i].from) continue;
        log_info(describe_operation(plan[i]));
        try {
            remove_distribution(*plan[i].from);
        } catch (const PipkinException& e) {
            failed[i] = true;
            aborted = !record_failure(plan[i], e);
        }
    }

    for (size_t i = 0; i < plan.size() && !aborted; ++i) {
        if (failed[i]) continue;
        const Operation& op = plan[i];
        if (!op.from) log_info(describe_operation(op));
        try {
            if (op.to) install_distribution(*op.to);
            report_.applied.push_back(describe_operation(op));
        } catch (const PipkinException& e) {
            aborted = !record_failure(op, e);
        }
    }

    try {
        target_.sync();
    } catch (const TargetIOError& e) {
        report_.failed.push_back({"", e.what()});
        log_error(e.what());
    }
    return std::move(report_);
}

bool ApplyTask::record_failure(const Operation& op, const PipkinException& e) {
    report_.failed.push_back({op.name(), e.what()});
    log_error(string_format("error.operation_failed", describe_operation(op), e.what()));
    if (!options_.keep_going) {
        log_warning(get_string("warning.apply_aborted"));
        return false;
    }
    return true;
}

void ApplyTask::remove_tree(const std::string& dir) {
    for (const auto& entry : target_.list_dir(dir)) {
        const std::string path = dir + "/" + entry.name;
        if (entry.is_dir) {
            remove_tree(path);
        } else {
            target_.delete_file(path);
        }
    }
    target_.remove_dir_if_empty(dir);
}

void ApplyTask::remove_distribution(const Distribution& planned) {
    // The target's own RECORD is authoritative
    auto it = target_state_.find(planned.name());
    const Distribution& recorded = it != target_state_.end() ? it->second : planned;

    std::set<std::string> dirs;
    for (const auto& entry : recorded.files()) {
        if (entry.path.starts_with("../") || entry.path.starts_with("/")) continue;
        target_.delete_file(entry.path);
        log_debug(string_format("debug.removed_file", entry.path));

        for (auto pos = entry.path.rfind('/'); pos != std::string::npos && pos > 0;
             pos = entry.path.rfind('/', pos - 1)) {
            dirs.insert(entry.path.substr(0, pos));
        }
    }

    // Whatever the RECORD left out of the metadata directory (or all of it,
    // when there is no RECORD) still has to go
    if (it != target_state_.end() && !recorded.meta_dir().empty()) {
        const std::string& meta_dir = recorded.meta_dir();
        remove_tree(meta_dir);
        std::erase_if(dirs, [&](const std::string& dir) {
            return dir == meta_dir || dir.starts_with(meta_dir + "/");
        });
        ensured_dirs_.erase(meta_dir);
    }

    // deepest first
    std::vector<std::string> ordered(dirs.begin(), dirs.end());
    std::ranges::sort(ordered, [](const std::string& a, const std::string& b) {
        const auto depth_a = std::ranges::count(a, '/');
        const auto depth_b = std::ranges::count(b, '/');
        return depth_a != depth_b ? depth_a > depth_b : a > b;
    });
    for (const auto& dir : ordered) {
        if (target_.remove_dir_if_empty(dir)) {
            ensured_dirs_.erase(dir);
        }
    }
    target_state_.erase(planned.name());
}

void ApplyTask::ensure_parent_dirs(const std::string& path) {
    const auto pos = path.rfind('/');
    if (pos == std::string::npos) return;
    const std::string dir = path.substr(0, pos);
    if (ensured_dirs_.contains(dir)) return;
    target_.make_dirs(dir);
    ensured_dirs_.insert(dir);
}

std::optional<RecordEntry> ApplyTask::transfer_compiled(const std::string& path) {
    const std::string mpy_path = path.substr(0, path.size() - 3) + ".mpy";
    const fs::path output = options_.scratch_dir / mpy_path;
    ensure_dir_exists(output.parent_path());

    try {
        options_.compiler->compile(validate_path(path, source_root_), path, output);
    } catch (const CompilationFailure& e) {
        log_warning(string_format("warning.compile_skipped", path, e.what()));
        report_.skipped_files.push_back({path, e.what()});
        return std::nullopt;
    }

    const std::string content = read_file_bytes(output);
    std::error_code ec;
    fs::remove(output, ec);

    ensure_parent_dirs(mpy_path);
    target_.write_file(mpy_path, content);
    return RecordEntry{mpy_path, record_hash(content), content.size()};
}

std::optional<RecordEntry> ApplyTask::transfer_file(const RecordEntry& entry) {
    if (!is_transferable_path(entry.path)) {
        log_debug(string_format("debug.skipped_file", entry.path));
        return std::nullopt;
    }
    if (options_.compiler && entry.path.ends_with(".py")) {
        return transfer_compiled(entry.path);
    }

    const std::string content = read_file_bytes(validate_path(entry.path, source_root_));
    ensure_parent_dirs(entry.path);
    target_.write_file(entry.path, content);
    log_debug(string_format("debug.wrote_file", entry.path));
    return RecordEntry{entry.path, record_hash(content), content.size()};
}

void ApplyTask::install_distribution(const Distribution& dist) {
    std::vector<RecordEntry> written;
    for (const auto& entry : dist.payload()) {
        if (auto record = transfer_file(entry)) {
            written.push_back(std::move(*record));
        }
    }

    const std::string meta_dir = dist.meta_dir();
    const std::string metadata = render_metadata(dist);
    written.push_back({meta_dir + "/METADATA", record_hash(metadata), metadata.size()});
    written.push_back({meta_dir + "/RECORD", "", std::nullopt});

    ensure_parent_dirs(meta_dir + "/METADATA");
    target_.write_file(meta_dir + "/METADATA", metadata);
    target_.write_file(meta_dir + "/RECORD", render_record(written));

    target_state_.insert_or_assign(dist.name(),
                                   Distribution(dist.display_name(), dist.version(), dist.requirements(), written,
                                                meta_dir));
}
