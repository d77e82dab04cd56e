#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

using Environment = std::map<std::string, std::string>;

struct ProcessResult {
    int exit_status = -1; // -1 when killed by a signal
    std::string output; // stdout and stderr interleaved
};

// Receives the child's output as it arrives
using OutputCallback = std::function<void(std::string_view)>;

Environment current_environment();

// fork/execvp with stdout and stderr captured through one pipe. An executable
// that cannot be started exits with status 127. Throws PipkinException when
// the child cannot be created.
ProcessResult run_process(const std::vector<std::string>& args, const Environment& env,
                          const fs::path& working_dir = {}, const OutputCallback& on_output = {});
