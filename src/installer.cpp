#include "installer.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

PipInstaller::PipInstaller(std::string python) : python_(std::move(python)) {}

std::string PipInstaller::version() {
    return PINNED_PIP_VERSION;
}

std::string PipInstaller::environment_version(const fs::path& dir) {
    const std::string python = (dir / "bin" / "python").string();
    ProcessResult result = run_process({python, "-I", "-m", "pip", "--version"}, current_environment());
    if (result.exit_status != 0) {
        throw InstallerFailure(string_format("error.installer_version_failed", python, trim(result.output)),
                               result.exit_status);
    }
    // "pip 22.0.4 from /home/user/.cache/pipkin/workspaces/pip-22/lib/python3.11/site-packages/pip (python 3.11)"
    const auto parts = split(trim(result.output), ' ');
    if (parts.size() < 2 || parts[0] != "pip") {
        throw InstallerFailure(string_format("error.installer_version_failed", python, trim(result.output)));
    }
    return parts[1];
}

void PipInstaller::create_environment(const fs::path& dir, const Environment& env) {
    log_info(string_format("info.creating_workspace", dir.string()));
    ProcessResult result = run_process({python_, "-m", "venv", "--clear", dir.string()}, env);
    if (result.exit_status != 0) {
        throw InstallerFailure(string_format("error.venv_failed", dir.string(), trim(result.output)),
                               result.exit_status);
    }

    // The host's pip only bootstraps; the workspace gets the pinned one
    result = run_process({(dir / "bin" / "python").string(), "-I", "-m", "pip", "--disable-pip-version-check",
                          "install", "--no-warn-script-location", "--upgrade",
                          "pip==" + PINNED_PIP_VERSION + ".*", "wheel==" + PINNED_WHEEL_VERSION + ".*"},
                         env);
    if (result.exit_status != 0) {
        throw InstallerFailure(string_format("error.pinned_installer_failed", dir.string(), trim(result.output)),
                               result.exit_status);
    }
}

fs::path PipInstaller::site_packages(const fs::path& dir) const {
    const fs::path lib = dir / "lib";
    std::error_code ec;
    if (fs::is_directory(lib, ec)) {
        for (const auto& entry : fs::directory_iterator(lib, ec)) {
            const std::string name = entry.path().filename().string();
            if (name.starts_with("python") && fs::is_directory(entry.path() / "site-packages")) {
                return entry.path() / "site-packages";
            }
        }
    }
    throw InstallerFailure(string_format("error.site_packages_not_found", dir.string()));
}

ProcessResult PipInstaller::run(const fs::path& dir, const std::vector<std::string>& args, const Environment& env,
                                const OutputCallback& on_output) {
    std::vector<std::string> command = {
        (dir / "bin" / "python").string(),
        "-I",
        "-m",
        "pip",
        "--disable-pip-version-check",
        "--trusted-host",
        "127.0.0.1",
    };
    command.insert(command.end(), args.begin(), args.end());

    std::string joined;
    for (const auto& arg : command) joined += (joined.empty() ? "" : " ") + arg;
    log_debug(string_format("debug.calling_installer", joined));

    return run_process(command, env, {}, on_output);
}

Environment installer_environment(const Environment& base, const fs::path& pip_cache_dir) {
    Environment env;
    for (const auto& [key, value] : base) {
        if (!key.starts_with("PIP_")) {
            env.emplace(key, value);
        }
    }
    env["PIP_CACHE_DIR"] = pip_cache_dir.string();
    return env;
}
