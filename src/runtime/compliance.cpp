#include "runtime/compliance.hpp"
#include "runtime/exec_session.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>

namespace sandkit::runtime {

bool ComplianceReport::all_available() const {
    for (const auto& [name, available] : packages) {
        if (!available) return false;
    }
    return true;
}

std::vector<std::string> ComplianceReport::missing() const {
    std::vector<std::string> result;
    for (const auto& [name, available] : packages) {
        if (!available) result.push_back(name);
    }
    return result;
}

nlohmann::json ComplianceReport::to_json() const {
    nlohmann::json j;
    j["packages"] = packages;
    j["all_available"] = all_available();
    return j;
}

ComplianceReport check_compliance(docker::ContainerRuntime& runtime,
                                  const std::string& container_id,
                                  const config::LanguageProfile& profile,
                                  const std::vector<std::string>& requirements,
                                  const config::EngineConfig& config) {
    ComplianceReport report;
    const std::string scratch = config.workspace_root + "/" + config.scratch_dir;

    for (const auto& requirement : requirements) {
        if (util::trim(requirement).empty()) {
            continue;
        }

        ExecOptions options;
        options.timeout = PROBE_TIMEOUT;
        options.pid_file = scratch + "/probe.pid";
        options.kill_grace = std::chrono::milliseconds(config.kill_grace_ms);
        options.max_output_bytes = 64 * 1024;

        docker::ExecSpec spec;
        spec.command = session_command(options.pid_file, profile.probe_command(requirement));
        spec.working_dir = config.workspace_root;

        auto outcome = run_exec(runtime, container_id, spec, options);
        bool available = !outcome.timed_out && outcome.exit_code == 0;
        report.packages[requirement] = available;

        if (available) {
            spdlog::debug("Requirement {} available in {}", requirement, util::short_id(container_id));
        } else {
            spdlog::debug("Requirement {} unavailable in {} (exit {}): {}", requirement,
                          util::short_id(container_id), outcome.exit_code,
                          util::tail(util::trim(outcome.stderr_data), 256));
        }
    }

    return report;
}

} // namespace sandkit::runtime
