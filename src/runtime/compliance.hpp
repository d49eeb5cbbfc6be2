/**
 * Requirement compliance check
 *
 * One language-native probe per requirement, run inside the environment.
 * The report is advisory: it never fails provisioning or blocks run_code.
 */
#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/engine_config.hpp"
#include "config/language_profile.hpp"
#include "docker/container_runtime.hpp"

namespace sandkit::runtime {

// Upper bound for a single probe
constexpr std::chrono::milliseconds PROBE_TIMEOUT{30000};

struct ComplianceReport {
    std::map<std::string, bool> packages;   // requirement spec -> available

    bool all_available() const;
    std::vector<std::string> missing() const;
    nlohmann::json to_json() const;
};

// Probe each requirement in container_id. Docker-layer failures propagate.
ComplianceReport check_compliance(docker::ContainerRuntime& runtime,
                                  const std::string& container_id,
                                  const config::LanguageProfile& profile,
                                  const std::vector<std::string>& requirements,
                                  const config::EngineConfig& config);

} // namespace sandkit::runtime
