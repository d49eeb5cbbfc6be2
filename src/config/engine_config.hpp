/**
 * Engine configuration
 *
 * Process-wide settings shared by every sandbox. Layered as
 * defaults < JSON file < environment (SANDKIT_*, DOCKER_HOST).
 */
#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace sandkit::config {

// How requirements get into the environment
enum class InstallStrategy {
    EXEC,         // Run the package manager inside the started container
    IMAGE_BUILD   // Build an ephemeral image with the requirements baked in
};

InstallStrategy install_strategy_from_string(const std::string& str);
const char* install_strategy_to_string(InstallStrategy strategy);

struct EngineConfig {
    std::string docker_socket = "/var/run/docker.sock";
    std::string api_version = "v1.41";

    std::string workspace_root = "/workspace";     // File operations are scoped here
    std::string scratch_dir = ".sandkit";          // Execution sources, relative to workspace

    int stop_timeout_sec = 10;                     // Grace before the runtime kills PID 1
    int kill_grace_ms = 2000;                      // Wait for the stream to drain after a kill
    int image_remove_attempts = 3;
    int image_remove_backoff_ms = 2000;
    bool pull_missing_images = true;
    InstallStrategy install_strategy = InstallStrategy::EXEC;

    size_t max_output_bytes = 16 * 1024 * 1024;    // Per stream
    size_t max_events = 1000;                      // Event log capacity per sandbox

    // Throws InvalidConfig on type errors or out-of-range values
    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Read a JSON file and merge it over the defaults
    static EngineConfig load_file(const std::string& path);

    // Defaults, then $SANDKIT_CONFIG (if set), then environment overrides
    static EngineConfig from_env();

    // Apply SANDKIT_* / DOCKER_HOST variables on top of this config
    void apply_env();

    void validate() const;
};

} // namespace sandkit::config
