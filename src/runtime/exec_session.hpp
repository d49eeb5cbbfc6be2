/**
 * One process inside a running environment, raced against a deadline
 *
 * A reader thread drains the attached stream into separate stdout/stderr
 * buffers while the caller waits for either end of stream or the deadline.
 * On timeout the cancellation token fires, which kills the in-environment
 * process group; if the stream still does not end within the grace period
 * the connection is aborted. A process may close its output and keep
 * running, so end of stream is followed by exit-status polling that is
 * raced against the same deadline.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "docker/container_runtime.hpp"

namespace sandkit::runtime {

// Exit code reported for a process killed on timeout
constexpr int TIMED_OUT_EXIT_CODE = -1;

// Longest accepted timeout; run_exec clamps longer ones to it
constexpr std::chrono::milliseconds MAX_EXEC_TIMEOUT = std::chrono::hours(24 * 7);

struct ExecOptions {
    std::optional<std::chrono::milliseconds> timeout;
    // In-environment file holding the process group leader's pid. Required
    // for timeout enforcement; the command must write it (see session_command).
    std::string pid_file;
    std::chrono::milliseconds kill_grace{2000};
    size_t max_output_bytes = 16 * 1024 * 1024;   // Per stream
};

struct ExecOutcome {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    bool timed_out = false;
    bool output_truncated = false;
    std::chrono::milliseconds elapsed{0};
};

// Run spec to completion (or timeout). Guest failures are reported in the
// outcome; Docker-layer failures propagate as ApiError/TransportError.
ExecOutcome run_exec(docker::ContainerRuntime& runtime,
                     const std::string& container_id,
                     const docker::ExecSpec& spec,
                     const ExecOptions& options);

// Wrap argv so it runs as the leader of a new session and records its pid
// in pid_file. Falls back to a plain exec when the image has no setsid.
std::vector<std::string> session_command(const std::string& pid_file,
                                         const std::vector<std::string>& argv);

} // namespace sandkit::runtime
