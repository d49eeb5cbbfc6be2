/**
 * sandkit error taxonomy
 *
 * Engine faults are thrown as SandboxError subclasses. Guest-code failures
 * (non-zero exit, timeout) are never thrown; they are reported inside
 * ExecutionResult.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace sandkit {

enum class ErrorKind {
    UNSUPPORTED_LANGUAGE,
    INVALID_CONFIG,
    PROVISIONING_FAILED,
    REQUIREMENTS_INSTALL_FAILED,
    INVALID_PATH,
    FILE_NOT_FOUND,
    CLOSED,
    ENGINE_FAULT
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNSUPPORTED_LANGUAGE:        return "UnsupportedLanguage";
        case ErrorKind::INVALID_CONFIG:              return "InvalidConfig";
        case ErrorKind::PROVISIONING_FAILED:         return "ProvisioningFailed";
        case ErrorKind::REQUIREMENTS_INSTALL_FAILED: return "RequirementsInstallFailed";
        case ErrorKind::INVALID_PATH:                return "InvalidPath";
        case ErrorKind::FILE_NOT_FOUND:              return "FileNotFound";
        case ErrorKind::CLOSED:                      return "Closed";
        case ErrorKind::ENGINE_FAULT:                return "EngineFault";
        default: return "Unknown";
    }
}

class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class UnsupportedLanguage : public SandboxError {
public:
    explicit UnsupportedLanguage(const std::string& language)
        : SandboxError(ErrorKind::UNSUPPORTED_LANGUAGE,
                       "unsupported coding language: " + language),
          language_(language) {}

    const std::string& language() const { return language_; }

private:
    std::string language_;
};

class InvalidConfig : public SandboxError {
public:
    explicit InvalidConfig(const std::string& message)
        : SandboxError(ErrorKind::INVALID_CONFIG, message) {}
};

class ProvisioningFailed : public SandboxError {
public:
    explicit ProvisioningFailed(const std::string& message)
        : SandboxError(ErrorKind::PROVISIONING_FAILED, message) {}
};

class RequirementsInstallFailed : public SandboxError {
public:
    RequirementsInstallFailed(const std::string& message, int exit_code, std::string output)
        : SandboxError(ErrorKind::REQUIREMENTS_INSTALL_FAILED, message),
          exit_code_(exit_code), output_(std::move(output)) {}

    int exit_code() const { return exit_code_; }
    // Combined installer output (truncated to its tail)
    const std::string& output() const { return output_; }

private:
    int exit_code_;
    std::string output_;
};

class InvalidPath : public SandboxError {
public:
    explicit InvalidPath(const std::string& path, const std::string& reason = "escapes the workspace root")
        : SandboxError(ErrorKind::INVALID_PATH, "invalid path '" + path + "': " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class FileNotFound : public SandboxError {
public:
    explicit FileNotFound(const std::string& path, const std::string& reason = "no such file or directory")
        : SandboxError(ErrorKind::FILE_NOT_FOUND, path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class SandboxClosed : public SandboxError {
public:
    explicit SandboxClosed(const std::string& sandbox_id)
        : SandboxError(ErrorKind::CLOSED, "sandbox " + sandbox_id + " is closed") {}
};

class EngineFault : public SandboxError {
public:
    explicit EngineFault(const std::string& message)
        : SandboxError(ErrorKind::ENGINE_FAULT, message) {}
};

} // namespace sandkit
