/**
 * Lifecycle Manager
 *
 * Owns teardown of everything a sandbox allocated in the runtime. Teardown
 * is best effort and never throws: each failed step is logged, recorded as
 * a CLEANUP event, and the remaining steps still run.
 */
#pragma once
#include <string>
#include "config/engine_config.hpp"
#include "docker/container_runtime.hpp"
#include "runtime/event_log.hpp"

namespace sandkit::runtime {

// Runtime resources held by one sandbox. Fields are filled in as they are
// allocated so a partially provisioned environment can still be released.
struct EnvironmentHandle {
    std::string container_id;
    std::string image;             // Image the container runs from
    std::string ephemeral_image;   // Built for this sandbox only; removed at teardown

    bool empty() const { return container_id.empty() && ephemeral_image.empty(); }
};

// Stop and remove the container, then remove the ephemeral image (with
// retries). Returns true if every step succeeded or found nothing to do.
bool teardown_environment(docker::ContainerRuntime& runtime,
                          const EnvironmentHandle& handle,
                          const config::EngineConfig& config,
                          EventLog& events) noexcept;

} // namespace sandkit::runtime
