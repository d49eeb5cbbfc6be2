#include "runtime/executor.hpp"
#include "docker/archive.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>

namespace sandkit::runtime {

namespace {

constexpr unsigned SCRATCH_DIR_MODE = 0777;

} // namespace

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j;
    j["stdout"] = stdout_data;
    j["stderr"] = stderr_data;
    j["exit_code"] = exit_code;
    j["timed_out"] = timed_out;
    j["elapsed_ms"] = elapsed.count();
    j["output_truncated"] = output_truncated;
    return j;
}

void validate_run_request(const RunRequest& request) {
    for (const auto& [name, value] : request.env) {
        if (name.empty() || name.find('=') != std::string::npos ||
            name.find('\0') != std::string::npos) {
            throw InvalidConfig("invalid environment variable name: '" + name + "'");
        }
        if (value.find('\0') != std::string::npos) {
            throw InvalidConfig("environment variable " + name + " contains a NUL byte");
        }
    }
    if (request.timeout && request.timeout->count() <= 0) {
        throw InvalidConfig("timeout must be positive");
    }
    if (request.timeout && *request.timeout > MAX_EXEC_TIMEOUT) {
        throw InvalidConfig("timeout exceeds the maximum of " +
                            std::to_string(MAX_EXEC_TIMEOUT.count()) + "ms");
    }
}

std::chrono::milliseconds timeout_from_seconds(double seconds) {
    const double max_seconds = static_cast<double>(MAX_EXEC_TIMEOUT.count()) / 1000.0;
    if (!std::isfinite(seconds) || seconds <= 0 || seconds > max_seconds) {
        throw InvalidConfig("timeout must be between 0 and " +
                            std::to_string(MAX_EXEC_TIMEOUT.count() / 1000) + " seconds");
    }
    auto ms = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    if (ms.count() <= 0) {
        throw InvalidConfig("timeout must be at least 1ms");
    }
    return ms;
}

Executor::Executor(docker::ContainerRuntime& runtime,
                   std::string container_id,
                   const config::LanguageProfile& profile,
                   const config::EngineConfig& config)
    : runtime_(runtime),
      container_id_(std::move(container_id)),
      profile_(profile),
      config_(config) {}

std::string Executor::scratch_path(const std::string& name) const {
    return config_.scratch_dir + "/" + name;
}

ExecutionResult Executor::run(const RunRequest& request) {
    validate_run_request(request);

    const uint64_t n = ++run_counter_;
    const std::string stem = "run-" + std::to_string(n);
    const std::string source_rel = scratch_path(stem + profile_.source_extension);
    const std::string source_abs = config_.workspace_root + "/" + source_rel;
    const std::string pid_file = config_.workspace_root + "/" + scratch_path(stem + ".pid");

    // Materialize the source
    const std::string code = profile_.dedent_source ? util::dedent(request.code) : request.code;
    docker::TarWriter tar;
    tar.add_parents(source_rel, SCRATCH_DIR_MODE);
    tar.add_file(source_rel, code);
    runtime_.put_archive(container_id_, config_.workspace_root, tar.finish());

    docker::ExecSpec spec;
    spec.command = session_command(pid_file, profile_.run_command(source_abs));
    spec.working_dir = config_.workspace_root;
    for (const auto& [name, value] : request.env) {
        spec.env.push_back(name + "=" + value);
    }

    ExecOptions options;
    options.timeout = request.timeout;
    options.pid_file = pid_file;
    options.kill_grace = std::chrono::milliseconds(config_.kill_grace_ms);
    options.max_output_bytes = config_.max_output_bytes;

    spdlog::debug("Running {} ({} bytes) in {}", source_abs, code.size(), util::short_id(container_id_));
    auto outcome = run_exec(runtime_, container_id_, spec, options);
    remove_artifacts({source_abs, pid_file});

    ExecutionResult result;
    result.stdout_data = std::move(outcome.stdout_data);
    result.stderr_data = std::move(outcome.stderr_data);
    result.exit_code = outcome.exit_code;
    result.timed_out = outcome.timed_out;
    result.elapsed = outcome.elapsed;
    result.output_truncated = outcome.output_truncated;

    if (result.output_truncated) {
        spdlog::warn("Output of {} truncated at {} bytes per stream", source_abs, config_.max_output_bytes);
    }
    return result;
}

void Executor::remove_artifacts(const std::vector<std::string>& paths) noexcept {
    try {
        docker::ExecSpec spec;
        spec.command = {"rm", "-f", "--"};
        spec.command.insert(spec.command.end(), paths.begin(), paths.end());
        auto outcome = run_exec(runtime_, container_id_, spec, ExecOptions{});
        if (outcome.exit_code != 0) {
            spdlog::debug("Removing run artifacts exited {}: {}", outcome.exit_code,
                          util::trim(outcome.stderr_data));
        }
    } catch (const std::exception& e) {
        // The environment may be gone; the next provision starts clean anyway
        spdlog::debug("Failed to remove run artifacts: {}", e.what());
    }
}

} // namespace sandkit::runtime
