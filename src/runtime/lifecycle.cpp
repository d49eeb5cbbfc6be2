#include "runtime/lifecycle.hpp"
#include "docker/errors.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace sandkit::runtime {

namespace {

// A 404 during teardown means the resource is already gone
bool already_gone(const docker::ApiError& e) {
    return e.not_found();
}

bool stop_container(docker::ContainerRuntime& runtime, const std::string& id,
                    const config::EngineConfig& config, EventLog& events) {
    try {
        runtime.stop_container(id, config.stop_timeout_sec);
        events.log(EventCategory::CLEANUP, "STOP_CONTAINER", {{"container", id}});
        return true;
    } catch (const docker::ApiError& e) {
        if (already_gone(e)) {
            return true;
        }
        spdlog::warn("Failed to stop container {}: {}", util::short_id(id), e.what());
        events.log_failure(EventCategory::CLEANUP, "STOP_CONTAINER", e.what(), {{"container", id}});
    } catch (const std::exception& e) {
        spdlog::warn("Failed to stop container {}: {}", util::short_id(id), e.what());
        events.log_failure(EventCategory::CLEANUP, "STOP_CONTAINER", e.what(), {{"container", id}});
    }
    return false;
}

bool remove_container(docker::ContainerRuntime& runtime, const std::string& id, EventLog& events) {
    try {
        // Forced: also covers a container the stop step could not reach
        runtime.remove_container(id, true);
        events.log(EventCategory::CLEANUP, "REMOVE_CONTAINER", {{"container", id}});
        return true;
    } catch (const docker::ApiError& e) {
        if (already_gone(e)) {
            events.log(EventCategory::CLEANUP, "REMOVE_CONTAINER", {{"container", id}, {"already_gone", true}});
            return true;
        }
        spdlog::warn("Failed to remove container {}: {}", util::short_id(id), e.what());
        events.log_failure(EventCategory::CLEANUP, "REMOVE_CONTAINER", e.what(), {{"container", id}});
    } catch (const std::exception& e) {
        spdlog::warn("Failed to remove container {}: {}", util::short_id(id), e.what());
        events.log_failure(EventCategory::CLEANUP, "REMOVE_CONTAINER", e.what(), {{"container", id}});
    }
    return false;
}

// Removal can race the container removal (image still "in use"), hence retries
bool remove_image(docker::ContainerRuntime& runtime, const std::string& image,
                  const config::EngineConfig& config, EventLog& events) {
    std::string last_error;
    for (int attempt = 1; attempt <= config.image_remove_attempts; ++attempt) {
        try {
            runtime.remove_image(image, true);
            events.log(EventCategory::CLEANUP, "REMOVE_IMAGE", {{"image", image}, {"attempt", attempt}});
            return true;
        } catch (const docker::ApiError& e) {
            if (already_gone(e)) {
                events.log(EventCategory::CLEANUP, "REMOVE_IMAGE", {{"image", image}, {"already_gone", true}});
                return true;
            }
            last_error = e.what();
        } catch (const std::exception& e) {
            last_error = e.what();
        }

        spdlog::debug("Removing image {} failed (attempt {}/{}): {}", util::short_id(image),
                      attempt, config.image_remove_attempts, last_error);
        if (attempt < config.image_remove_attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config.image_remove_backoff_ms));
        }
    }

    spdlog::warn("Failed to remove image {} after {} attempts: {}", util::short_id(image),
                 config.image_remove_attempts, last_error);
    events.log_failure(EventCategory::CLEANUP, "REMOVE_IMAGE", last_error,
                       {{"image", image}, {"attempts", config.image_remove_attempts}});
    return false;
}

} // namespace

bool teardown_environment(docker::ContainerRuntime& runtime,
                          const EnvironmentHandle& handle,
                          const config::EngineConfig& config,
                          EventLog& events) noexcept {
    bool clean = true;

    if (!handle.container_id.empty()) {
        clean &= stop_container(runtime, handle.container_id, config, events);
        clean &= remove_container(runtime, handle.container_id, events);
    }
    if (!handle.ephemeral_image.empty()) {
        clean &= remove_image(runtime, handle.ephemeral_image, config, events);
    }

    if (clean) {
        spdlog::debug("Environment {} torn down", util::short_id(handle.container_id));
    }
    return clean;
}

} // namespace sandkit::runtime
