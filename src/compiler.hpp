#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Source-to-bytecode compiler for payload files
class Compiler {
public:
    virtual ~Compiler() = default;

    // embedded_source_path is the name recorded in the output. Throws CompilationFailure.
    virtual void compile(const fs::path& input, const std::string& embedded_source_path, const fs::path& output) = 0;
};

class MpyCrossCompiler : public Compiler {
public:
    explicit MpyCrossCompiler(std::string executable);

    void compile(const fs::path& input, const std::string& embedded_source_path, const fs::path& output) override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

// "mpy-cross" with runtime "1.20.0" -> "mpy-cross-1.20" when no explicit executable was configured
std::string select_mpy_cross(const std::string& configured, const std::optional<std::string>& runtime_version);
