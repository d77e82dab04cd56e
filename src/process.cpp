#include "process.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

Environment current_environment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string item = *entry;
        const auto pos = item.find('=');
        if (pos == std::string::npos) continue;
        env[item.substr(0, pos)] = item.substr(pos + 1);
    }
    return env;
}

ProcessResult run_process(const std::vector<std::string>& args, const Environment& env,
                          const fs::path& working_dir, const OutputCallback& on_output) {
    if (args.empty()) {
        throw PipkinException(get_string("error.empty_command"));
    }

    // Prepared before fork, the child only calls async-signal-safe functions
    std::vector<std::string> env_strings;
    for (const auto& [key, value] : env) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> c_args;
    for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);
    std::vector<char*> c_env;
    for (auto& item : env_strings) c_env.push_back(item.data());
    c_env.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw PipkinException(string_format("error.process_start_failed", args[0], std::strerror(errno)));
    }

    log_debug(string_format("debug.run_process", args[0]));
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw PipkinException(string_format("error.process_start_failed", args[0], std::strerror(err)));
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) _exit(127);
        execvpe(c_args[0], c_args.data(), c_env.data());
        _exit(127);
    }
    close(fds[1]);

    ProcessResult result;
    char buffer[4096];
    while (true) {
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.output.append(buffer, static_cast<size_t>(n));
        if (on_output) {
            on_output(std::string_view(buffer, static_cast<size_t>(n)));
        }
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw PipkinException(string_format("error.process_wait_failed", args[0], std::strerror(errno)));
        }
    }
    result.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}
