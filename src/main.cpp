#include "config.hpp"
#include "detect.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "installer.hpp"
#include "localization.hpp"
#include "session.hpp"
#include "upstream.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef PIPKIN_VERSION
#define PIPKIN_VERSION "0.0.0"
#endif

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({"", "Target", "Selection", "Index"});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.uninstall_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.show_desc") << std::endl;
    std::cerr << get_string("info.freeze_desc") << std::endl;
    std::cerr << get_string("info.check_desc") << std::endl;
    std::cerr << get_string("info.download_desc") << std::endl;
    std::cerr << get_string("info.wheel_desc") << std::endl;
    std::cerr << get_string("info.cache_desc") << std::endl;
}

std::vector<std::string> strings_of(const cxxopts::ParseResult& result, const std::string& key) {
    return result.count(key) ? result[key].as<std::vector<std::string>>() : std::vector<std::string>{};
}

void check_argument_count(const cxxopts::ParseResult& result, const cxxopts::Options& options, size_t min,
                          std::optional<size_t> max = std::nullopt) {
    const size_t count = strings_of(result, "packages").size();
    if (count < min || (max.has_value() && count > max.value())) {
        print_usage(options);
        throw PipkinException(get_string("error.invalid_argument_count"));
    }
}

SelectionOptions selection_from(const cxxopts::ParseResult& result) {
    SelectionOptions selection;
    selection.specs = strings_of(result, "packages");
    selection.requirement_files = strings_of(result, "requirement");
    selection.constraint_files = strings_of(result, "constraint");
    selection.pre = result["pre"].as<bool>();
    selection.no_deps = result["no-deps"].as<bool>();
    return selection;
}

// Command-line options override the configuration file
void apply_overrides(Settings& settings, const cxxopts::ParseResult& result) {
    if (result.count("index-url")) settings.index_url = result["index-url"].as<std::string>();
    for (const auto& url : strings_of(result, "extra-index-url")) {
        settings.extra_index_urls.push_back(url);
    }
    if (result["no-mp-org"].as<bool>()) settings.no_mp_org = true;
    if (result.count("python")) settings.python = result["python"].as<std::string>();
    if (result.count("mpy-cross")) settings.mpy_cross = result["mpy-cross"].as<std::string>();
}

int run_command(const std::string& command, const cxxopts::ParseResult& result, const cxxopts::Options& options) {
    init_paths_from_environment();
    Settings settings = load_settings();
    apply_overrides(settings, result);

    if (command == "cache") {
        check_argument_count(result, options, 1);
    } else if (command == "install" || command == "download" || command == "wheel" ||
               command == "uninstall") {
        if (strings_of(result, "packages").empty() && strings_of(result, "requirement").empty()) {
            print_usage(options);
            throw PipkinException(get_string("error.nothing_selected"));
        }
    } else if (command == "show") {
        check_argument_count(result, options, 1);
    } else if (command == "list" || command == "freeze" || command == "check") {
        check_argument_count(result, options, 0, 0);
    } else {
        print_usage(options);
        throw PipkinException(string_format("error.unknown_command", command));
    }

    IndexOptions index_options;
    index_options.no_index = result["no-index"].as<bool>();
    index_options.find_links = strings_of(result, "find-links");

    PipInstaller installer(settings.python);
    const long timeout = settings.timeout;
    auto upstream_factory = [timeout](const std::string& url) -> std::unique_ptr<UpstreamIndex> {
        return std::make_unique<HttpUpstreamIndex>(url, timeout);
    };

    // The cache command needs a workspace but never touches a target
    std::unique_ptr<TargetAdapter> target;
    if (command == "cache") {
        target = std::make_unique<DirTargetAdapter>(get_tmp_dir());
    } else {
        TargetSelection selection;
        if (result.count("port")) selection.port = result["port"].as<std::string>();
        if (result.count("mount")) selection.mount = result["mount"].as<std::string>();
        if (result.count("dir")) selection.dir = result["dir"].as<std::string>();
        if (result.count("target")) selection.package_dir = result["target"].as<std::string>();
        target = create_target_adapter(selection);
    }

    Session session(*target, installer, settings, index_options, upstream_factory, WORKSPACES_DIR, PIP_CACHE_DIR);

    const bool keep_going = result["keep-going"].as<bool>();
    if (command == "install") {
        InstallOptions install;
        install.selection = selection_from(result);
        install.upgrade = result["upgrade"].as<bool>();
        if (result.count("upgrade-strategy")) install.upgrade_strategy = result["upgrade-strategy"].as<std::string>();
        install.force_reinstall = result["force-reinstall"].as<bool>();
        install.compile = result["compile"].as<bool>();
        install.keep_going = keep_going;
        return session.install(install).complete() ? 0 : 1;
    }
    if (command == "uninstall") {
        return session.uninstall(strings_of(result, "packages"), strings_of(result, "requirement"),
                                 result["yes"].as<bool>(), keep_going).complete() ? 0 : 1;
    }
    if (command == "list") {
        ListOptions list;
        list.outdated = result["outdated"].as<bool>();
        list.uptodate = result["uptodate"].as<bool>();
        list.not_required = result["not-required"].as<bool>();
        list.pre = result["pre"].as<bool>();
        if (result.count("format")) list.format = result["format"].as<std::string>();
        list.excludes = strings_of(result, "exclude");
        session.list(list);
    } else if (command == "show") {
        session.show(strings_of(result, "packages"));
    } else if (command == "freeze") {
        session.freeze(strings_of(result, "exclude"));
    } else if (command == "check") {
        session.check();
    } else if (command == "download") {
        const std::string dest = result.count("dest") ? result["dest"].as<std::string>() : std::string{};
        session.download(selection_from(result), dest);
    } else if (command == "wheel") {
        const std::string dir = result.count("wheel-dir") ? result["wheel-dir"].as<std::string>() : std::string{};
        session.wheel(selection_from(result), dir);
    } else if (command == "cache") {
        auto args = strings_of(result, "packages");
        const std::string sub = args.front();
        args.erase(args.begin());
        session.cache(sub, args);
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    int status = 0;
    try {
        init_localization();
        CurlGlobalInitializer curl_initializer;

        cxxopts::Options options(argv[0], string_format("info.usage", argv[0]));

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("version", get_string("info.version_desc"))
            ("v,verbose", get_string("info.verbose_desc"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("info.quiet_desc"), cxxopts::value<bool>()->default_value("false"))
            ("keep-going", get_string("info.keep_going_desc"), cxxopts::value<bool>()->default_value("false"))
            ("y,yes", get_string("info.yes_desc"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.add_options("Target")
            ("p,port", get_string("info.port_desc"), cxxopts::value<std::string>())
            ("m,mount", get_string("info.mount_desc"), cxxopts::value<std::string>())
            ("d,dir", get_string("info.dir_desc"), cxxopts::value<std::string>())
            ("t,target", get_string("info.target_desc"), cxxopts::value<std::string>());

        options.add_options("Selection")
            ("r,requirement", get_string("info.requirement_desc"), cxxopts::value<std::vector<std::string>>())
            ("c,constraint", get_string("info.constraint_desc"), cxxopts::value<std::vector<std::string>>())
            ("pre", get_string("info.pre_desc"), cxxopts::value<bool>()->default_value("false"))
            ("no-deps", get_string("info.no_deps_desc"), cxxopts::value<bool>()->default_value("false"))
            ("U,upgrade", get_string("info.upgrade_desc"), cxxopts::value<bool>()->default_value("false"))
            ("upgrade-strategy", get_string("info.upgrade_strategy_desc"), cxxopts::value<std::string>())
            ("force-reinstall", get_string("info.force_reinstall_desc"), cxxopts::value<bool>()->default_value("false"))
            ("compile", get_string("info.compile_desc"), cxxopts::value<bool>()->default_value("false"))
            ("mpy-cross", get_string("info.mpy_cross_desc"), cxxopts::value<std::string>())
            ("python", get_string("info.python_desc"), cxxopts::value<std::string>())
            ("dest", get_string("info.dest_desc"), cxxopts::value<std::string>())
            ("w,wheel-dir", get_string("info.wheel_dir_desc"), cxxopts::value<std::string>())
            ("outdated", get_string("info.outdated_desc"), cxxopts::value<bool>()->default_value("false"))
            ("uptodate", get_string("info.uptodate_desc"), cxxopts::value<bool>()->default_value("false"))
            ("not-required", get_string("info.not_required_desc"), cxxopts::value<bool>()->default_value("false"))
            ("format", get_string("info.format_desc"), cxxopts::value<std::string>())
            ("exclude", get_string("info.exclude_desc"), cxxopts::value<std::vector<std::string>>());

        options.add_options("Index")
            ("i,index-url", get_string("info.index_url_desc"), cxxopts::value<std::string>())
            ("extra-index-url", get_string("info.extra_index_url_desc"), cxxopts::value<std::vector<std::string>>())
            ("no-index", get_string("info.no_index_desc"), cxxopts::value<bool>()->default_value("false"))
            ("no-mp-org", get_string("info.no_mp_org_desc"), cxxopts::value<bool>()->default_value("false"))
            ("find-links", get_string("info.find_links_desc"), cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }
        if (result.count("version")) {
            std::cout << "pipkin " << PIPKIN_VERSION << std::endl;
            return 0;
        }

        if (result["verbose"].as<bool>()) {
            set_log_level(LogLevel::DEBUG);
        } else if (result["quiet"].as<bool>()) {
            set_log_level(LogLevel::ERROR);
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }
        if (result.count("port") + result.count("mount") + result.count("dir") > 1) {
            throw PipkinException(get_string("error.multiple_targets"));
        }

        status = run_command(result["command"].as<std::string>(), result, options);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PipkinException& e) {
        log_error(string_format("error.pipkin_error", e.what()));
        status = 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        status = 1;
    }

    try {
        fs::remove_all(get_tmp_dir());
    } catch (const fs::filesystem_error& e) {
        log_warning(string_format("warning.cleanup_tmp_failed", get_tmp_dir().string(), e.what()));
    }

    return status;
}
