#pragma once

#include <stdexcept>
#include <string>

class PipkinException : public std::runtime_error {
public:
    explicit PipkinException(const std::string& message)
        : std::runtime_error(message) {}
};

// Zero or several candidate targets during auto-detection.
class NoTargetFound : public PipkinException {
public:
    using PipkinException::PipkinException;
};

class MalformedMetadata : public PipkinException {
public:
    using PipkinException::PipkinException;
};

// One upstream index failed for one lookup. Never leaves the proxy.
class UpstreamUnreachable : public PipkinException {
public:
    using PipkinException::PipkinException;
};

class InstallerFailure : public PipkinException {
public:
    InstallerFailure(const std::string& message, int exit_status = -1)
        : PipkinException(message), exit_status_(exit_status) {}

    int exit_status() const { return exit_status_; }

private:
    int exit_status_;
};

class TargetIOError : public PipkinException {
public:
    TargetIOError(const std::string& operation, const std::string& path, const std::string& message)
        : PipkinException(operation + " " + path + ": " + message), operation_(operation), path_(path) {}

    const std::string& operation() const { return operation_; }
    const std::string& path() const { return path_; }

private:
    std::string operation_;
    std::string path_;
};

class CompilationFailure : public PipkinException {
public:
    CompilationFailure(const std::string& path, const std::string& message)
        : PipkinException(path + ": " + message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
