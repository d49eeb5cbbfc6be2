/**
 * Execution Controller
 *
 * Materializes a code payload as a source file in the environment's
 * scratch directory and runs it with the profile's interpreter, racing a
 * wall-clock deadline. Guest failures (non-zero exit, timeout) are
 * reported in ExecutionResult, never thrown.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/engine_config.hpp"
#include "config/language_profile.hpp"
#include "docker/container_runtime.hpp"
#include "runtime/exec_session.hpp"

namespace sandkit::runtime {

struct ExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;                      // TIMED_OUT_EXIT_CODE when timed_out
    bool timed_out = false;
    std::chrono::milliseconds elapsed{0};
    bool output_truncated = false;          // A stream hit max_output_bytes

    bool ok() const { return !timed_out && exit_code == 0; }
    nlohmann::json to_json() const;
};

struct RunRequest {
    std::string code;
    std::map<std::string, std::string> env;               // This invocation only
    std::optional<std::chrono::milliseconds> timeout;
};

// Throws InvalidConfig for malformed env names or a timeout outside
// (0, MAX_EXEC_TIMEOUT]
void validate_run_request(const RunRequest& request);

// Fractional seconds to a timeout, rounded down to whole milliseconds.
// Throws InvalidConfig unless finite and within (0, MAX_EXEC_TIMEOUT].
std::chrono::milliseconds timeout_from_seconds(double seconds);

class Executor {
public:
    Executor(docker::ContainerRuntime& runtime,
             std::string container_id,
             const config::LanguageProfile& profile,
             const config::EngineConfig& config);

    // Docker-layer failures propagate as ApiError/TransportError/ArchiveError
    ExecutionResult run(const RunRequest& request);

    uint64_t runs() const { return run_counter_; }

private:
    docker::ContainerRuntime& runtime_;
    std::string container_id_;
    const config::LanguageProfile& profile_;
    const config::EngineConfig& config_;
    uint64_t run_counter_ = 0;

    std::string scratch_path(const std::string& name) const;
    void remove_artifacts(const std::vector<std::string>& paths) noexcept;
};

} // namespace sandkit::runtime
