#pragma once
#include <stdexcept>
#include <string>

namespace sandkit::docker {

// Daemon answered with an unexpected HTTP status
class ApiError : public std::runtime_error {
public:
    ApiError(int status, const std::string& message)
        : std::runtime_error("docker API error " + std::to_string(status) + ": " + message),
          status_(status), daemon_message_(message) {}

    int status() const { return status_; }
    const std::string& daemon_message() const { return daemon_message_; }
    bool not_found() const { return status_ == 404; }
    bool conflict() const { return status_ == 409; }

private:
    int status_;
    std::string daemon_message_;
};

// Could not talk to the daemon at all (socket, protocol)
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error("docker transport error: " + message) {}
};

// Malformed or unreadable tar data
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& message)
        : std::runtime_error("archive error: " + message) {}
};

} // namespace sandkit::docker
