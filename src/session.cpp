#include "session.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <iostream>

namespace {

const std::vector<std::string> ALWAYS_EXCLUDED = {"pip", "pkg_resources", "setuptools", "wheel"};

void add_requirement_lines(const std::string& file, std::vector<Requirement>& out) {
    for (const auto& raw : read_lines_from_file(file)) {
        std::string line = trim(raw.substr(0, raw.find(" #")));
        if (line.empty() || line.starts_with("#") || line.starts_with("-")) continue;
        try {
            out.push_back(Requirement::parse(line));
        } catch (const MalformedMetadata&) {
            log_debug(string_format("debug.requirement_not_routed", line));
        }
    }
}

} // anonymous namespace

std::vector<std::string> selection_args(const SelectionOptions& selection) {
    std::vector<std::string> args;
    for (const auto& path : selection.requirement_files) {
        args.insert(args.end(), {"-r", path});
    }
    for (const auto& path : selection.constraint_files) {
        args.insert(args.end(), {"-c", path});
    }
    if (selection.no_deps) args.push_back("--no-deps");
    if (selection.pre) args.push_back("--pre");
    args.insert(args.end(), selection.specs.begin(), selection.specs.end());
    return args;
}

std::vector<std::string> exclusion_args(const std::vector<std::string>& excludes) {
    std::vector<std::string> args;
    for (const auto& name : excludes) {
        args.insert(args.end(), {"--exclude", name});
    }
    for (const auto& name : ALWAYS_EXCLUDED) {
        args.insert(args.end(), {"--exclude", name});
    }
    return args;
}

std::vector<Requirement> collect_requirements(const SelectionOptions& selection) {
    std::vector<Requirement> result;
    for (const auto& spec : selection.specs) {
        try {
            result.push_back(Requirement::parse(spec));
        } catch (const MalformedMetadata&) {
            log_debug(string_format("debug.requirement_not_routed", spec));
        }
    }
    for (const auto& file : selection.requirement_files) {
        add_requirement_lines(file, result);
    }
    for (const auto& file : selection.constraint_files) {
        add_requirement_lines(file, result);
    }
    return result;
}

Session::Session(TargetAdapter& target, Installer& installer, Settings settings, IndexOptions index_options,
                 ProxyIndexServer::UpstreamFactory upstream_factory, fs::path workspaces_root, fs::path pip_cache_dir)
    : target_(target), settings_(std::move(settings)), index_options_(std::move(index_options)),
      upstream_factory_(std::move(upstream_factory)),
      workspace_(installer, std::move(workspaces_root), std::move(pip_cache_dir)),
      compiler_factory_([](const std::string& executable) { return std::make_unique<MpyCrossCompiler>(executable); }) {
    workspace_.prepare();
}

PackageSnapshot Session::populate() {
    log_info(string_format("info.reading_target", target_.describe()));
    PackageSnapshot target_state = target_.list_distributions();
    workspace_.seed(target_state);
    return target_state;
}

void Session::invoke(const std::vector<std::string>& args) {
    ProcessResult result = workspace_.run_installer(args);
    if (result.exit_status != 0) {
        throw InstallerFailure(string_format("error.installer_failed", result.exit_status), result.exit_status);
    }
}

void Session::invoke_with_index(std::vector<std::string> args, const std::vector<Requirement>& requirements) {
    if (index_options_.no_index) {
        args.push_back("--no-index");
        for (const auto& link : index_options_.find_links) {
            args.insert(args.end(), {"--find-links", link});
        }
        invoke(args);
        return;
    }

    ProxyIndexServer proxy(build_route_table(settings_, requirements), upstream_factory_);
    proxy.start();
    log_info(string_format("info.using_proxy", proxy.index_url()));

    args.insert(args.end(), {"--index-url", proxy.index_url()});
    for (const auto& link : index_options_.find_links) {
        args.insert(args.end(), {"--find-links", link});
    }
    invoke(args);
}

ApplyReport Session::apply_changes(const PackageSnapshot& target_state, const PackageSnapshot& before, bool compile,
                                   bool keep_going) {
    const PackageSnapshot after = workspace_.snapshot();
    OperationPlan plan = compute_plan(before, after);
    if (plan.empty()) {
        log_info(get_string("info.nothing_to_do"));
        return {};
    }

    std::unique_ptr<Compiler> compiler;
    if (compile) {
        compiler = compiler_factory_(select_mpy_cross(settings_.mpy_cross, target_.runtime_version()));
    }

    TmpDirManager scratch;
    ApplyOptions options;
    options.compiler = compiler.get();
    options.keep_going = keep_going;
    options.scratch_dir = scratch.path();

    ApplyTask task(target_, workspace_.site_dir(), target_state, options);
    ApplyReport report = task.run(std::move(plan));

    for (const auto& skipped : report.skipped_files) {
        log_warning(string_format("warning.file_skipped", skipped.path, skipped.reason));
    }
    if (report.complete()) {
        log_info(string_format("info.apply_complete", report.applied.size()));
    } else {
        log_error(string_format("error.apply_incomplete", report.applied.size(), report.failed.size()));
    }
    return report;
}

ApplyReport Session::install(const InstallOptions& options) {
    std::vector<std::string> args = {"install", "--no-compile"};
    if (options.upgrade) args.push_back("--upgrade");
    if (!options.upgrade_strategy.empty()) args.insert(args.end(), {"--upgrade-strategy", options.upgrade_strategy});
    if (options.force_reinstall) args.push_back("--force-reinstall");
    const auto selection = selection_args(options.selection);
    args.insert(args.end(), selection.begin(), selection.end());

    const PackageSnapshot target_state = populate();
    const PackageSnapshot before = workspace_.snapshot();
    invoke_with_index(args, collect_requirements(options.selection));
    return apply_changes(target_state, before, options.compile, options.keep_going);
}

ApplyReport Session::uninstall(const std::vector<std::string>& packages,
                               const std::vector<std::string>& requirement_files, bool yes, bool keep_going) {
    std::vector<std::string> args = {"uninstall"};
    if (yes) args.push_back("--yes");
    for (const auto& file : requirement_files) {
        args.insert(args.end(), {"-r", file});
    }
    args.insert(args.end(), packages.begin(), packages.end());

    const PackageSnapshot target_state = populate();
    const PackageSnapshot before = workspace_.snapshot();
    invoke(args);
    return apply_changes(target_state, before, false, keep_going);
}

void Session::list(const ListOptions& options) {
    std::vector<std::string> args = {"list"};
    if (options.outdated) args.push_back("--outdated");
    if (options.uptodate) args.push_back("--uptodate");
    if (options.not_required) args.push_back("--not-required");
    if (options.pre) args.push_back("--pre");
    if (!options.format.empty()) args.insert(args.end(), {"--format", options.format});
    const auto excludes = exclusion_args(options.excludes);
    args.insert(args.end(), excludes.begin(), excludes.end());

    populate();
    if (options.outdated || options.uptodate) {
        invoke_with_index(args, {});
    } else {
        invoke(args);
    }
}

void Session::show(const std::vector<std::string>& packages) {
    std::vector<std::string> args = {"show"};
    args.insert(args.end(), packages.begin(), packages.end());
    populate();
    invoke(args);
}

void Session::freeze(const std::vector<std::string>& excludes) {
    std::vector<std::string> args = {"freeze"};
    const auto exclusions = exclusion_args(excludes);
    args.insert(args.end(), exclusions.begin(), exclusions.end());
    populate();
    invoke(args);
}

void Session::check() {
    populate();
    invoke({"check"});
}

void Session::download(const SelectionOptions& selection, const std::string& dest) {
    std::vector<std::string> args = {"download"};
    if (!dest.empty()) args.insert(args.end(), {"--dest", dest});
    const auto selection_list = selection_args(selection);
    args.insert(args.end(), selection_list.begin(), selection_list.end());

    populate();
    invoke_with_index(args, collect_requirements(selection));
}

void Session::wheel(const SelectionOptions& selection, const std::string& wheel_dir) {
    std::vector<std::string> args = {"wheel"};
    if (!wheel_dir.empty()) args.insert(args.end(), {"--wheel-dir", wheel_dir});
    const auto selection_list = selection_args(selection);
    args.insert(args.end(), selection_list.begin(), selection_list.end());

    populate();
    invoke_with_index(args, collect_requirements(selection));
}

void Session::cache(const std::string& command, const std::vector<std::string>& args) {
    std::vector<std::string> full = {"cache", command};
    full.insert(full.end(), args.begin(), args.end());
    invoke(full);

    if (command == "purge") {
        workspace_.discard_all();
        log_info(get_string("info.workspaces_purged"));
    }
}
