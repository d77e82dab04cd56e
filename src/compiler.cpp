#include "compiler.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

MpyCrossCompiler::MpyCrossCompiler(std::string executable) : executable_(std::move(executable)) {}

void MpyCrossCompiler::compile(const fs::path& input, const std::string& embedded_source_path,
                               const fs::path& output) {
    ProcessResult result;
    try {
        result = run_process({executable_, "-s", embedded_source_path, "-o", output.string(), input.string()},
                             current_environment());
    } catch (const PipkinException& e) {
        throw CompilationFailure(embedded_source_path, e.what());
    }

    if (result.exit_status == 127) {
        throw CompilationFailure(embedded_source_path, string_format("error.compiler_not_found", executable_));
    }
    if (result.exit_status != 0 || !fs::exists(output)) {
        throw CompilationFailure(embedded_source_path, trim(result.output));
    }
}

std::string select_mpy_cross(const std::string& configured, const std::optional<std::string>& runtime_version) {
    if (configured != "mpy-cross" || !runtime_version) {
        return configured;
    }
    const auto parts = split(*runtime_version, '.');
    if (parts.size() < 2) {
        return configured;
    }
    return configured + "-" + parts[0] + "." + parts[1];
}
