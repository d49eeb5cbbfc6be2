/**
 * Provisioner
 *
 * Creates and populates one environment: image resolution (pull or build),
 * container creation with limits applied at creation time, start, workspace
 * setup and requirement installation. Any failure releases what was already
 * allocated before the error propagates.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "config/engine_config.hpp"
#include "config/language_profile.hpp"
#include "config/resource_config.hpp"
#include "docker/container_runtime.hpp"
#include "runtime/event_log.hpp"
#include "runtime/lifecycle.hpp"

namespace sandkit::runtime {

// Container labels
constexpr const char* LABEL_MANAGED = "sandkit.managed";
constexpr const char* LABEL_SANDBOX = "sandkit.sandbox";

// Installer output kept in RequirementsInstallFailed
constexpr size_t INSTALL_OUTPUT_TAIL = 4096;

struct ProvisionRequest {
    std::string sandbox_id;
    const config::LanguageProfile* profile = nullptr;
    config::ResourceConfig resources;               // Includes the network mode
    std::vector<std::string> requirements;
    std::optional<std::string> custom_image;
};

class Provisioner {
public:
    Provisioner(docker::ContainerRuntime& runtime, const config::EngineConfig& config, EventLog& events);

    // Fills handle as resources are allocated. On success the container is
    // running and ready. On failure handle is torn down and cleared, then
    // ProvisioningFailed / RequirementsInstallFailed / EngineFault propagates.
    void provision(const ProvisionRequest& request, EnvironmentHandle& handle);

private:
    docker::ContainerRuntime& runtime_;
    const config::EngineConfig& config_;
    EventLog& events_;

    void ensure_image(const std::string& image);
    std::string build_requirements_image(const ProvisionRequest& request, const std::string& base_image);
    std::string create_container(const ProvisionRequest& request, const std::string& image);
    void install_requirements(const ProvisionRequest& request, const std::string& container_id);
};

} // namespace sandkit::runtime
