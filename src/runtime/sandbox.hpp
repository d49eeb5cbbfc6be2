/**
 * sandkit Sandbox
 *
 * One short-lived, resource-constrained, network-isolated container that
 * runs untrusted code. Created provisioned and READY by Sandbox::create();
 * released exactly once by close() or the destructor, on every exit path.
 *
 * Operations on one sandbox are serialized; separate sandboxes are
 * independent and may be used from different threads in parallel.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config/engine_config.hpp"
#include "config/language_profile.hpp"
#include "config/resource_config.hpp"
#include "docker/container_runtime.hpp"
#include "runtime/compliance.hpp"
#include "runtime/event_log.hpp"
#include "runtime/executor.hpp"
#include "runtime/file_transfer.hpp"
#include "runtime/lifecycle.hpp"

namespace sandkit::runtime {

enum class SandboxState {
    PROVISIONING,
    READY,
    EXECUTING,
    CLOSED
};

inline const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::PROVISIONING: return "PROVISIONING";
        case SandboxState::READY:        return "READY";
        case SandboxState::EXECUTING:    return "EXECUTING";
        case SandboxState::CLOSED:       return "CLOSED";
        default: return "UNKNOWN";
    }
}

// Factory arguments
struct SandboxOptions {
    std::string language;
    std::optional<std::string> custom_image;      // Never removed by close()
    std::vector<std::string> requirements;        // Package specs, e.g. "numpy>=1.20"
    std::string network_mode = "none";
    std::string resource_preset = "small";
    config::ResourceOverrides overrides;          // network_mode here wins over the field above
    bool check_compliance = false;                // Probe requirements once provisioned
    config::EngineConfig engine;

    // Null = docker::shared_runtime()
    std::shared_ptr<docker::ContainerRuntime> runtime;
};

class Sandbox {
    // Restricts construction to create()
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Resolve, validate and provision. Throws UnsupportedLanguage,
    // InvalidConfig, ProvisioningFailed, RequirementsInstallFailed or
    // EngineFault; nothing is left allocated when it throws.
    static std::unique_ptr<Sandbox> create(const SandboxOptions& options);

    Sandbox(PrivateTag,
            std::string id,
            const SandboxOptions& options,
            const config::LanguageProfile& profile,
            config::ResourceConfig resources,
            std::vector<std::string> requirements,
            std::shared_ptr<docker::ContainerRuntime> runtime);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Probe each requirement; advisory only
    ComplianceReport run_compliance(const std::vector<std::string>& requirements);

    // Guest failures and timeouts are reported in the result. Throws
    // SandboxClosed, InvalidConfig (bad env/timeout) or EngineFault.
    ExecutionResult run_code(const std::string& code,
                             const std::map<std::string, std::string>& env = {},
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // File operations, paths relative to the workspace root
    void write_file(const std::string& content, const std::string& filename);
    std::string read_file(const std::string& filename);
    void delete_file(const std::string& filename);
    void write_dir(const std::string& directory);
    void delete_dir(const std::string& directory);

    // Idempotent, never throws. Waits for an in-flight operation to finish.
    void close() noexcept;

    // Status
    const std::string& id() const { return id_; }
    SandboxState state() const { return state_.load(); }
    bool closed() const { return state() == SandboxState::CLOSED; }
    const config::LanguageProfile& profile() const { return *profile_; }
    const config::ResourceConfig& resources() const { return resources_; }
    const std::vector<std::string>& requirements() const { return requirements_; }
    const config::EngineConfig& engine_config() const { return config_; }
    std::string container_id() const;
    std::string image() const;
    std::optional<ComplianceReport> compliance_report() const;

    // Failed steps that were swallowed (teardown, cleanup)
    std::vector<EventLogEntry> diagnostics() const { return events_.failures(); }
    const EventLog& events() const { return events_; }

private:
    std::string id_;
    const config::LanguageProfile* profile_;
    config::ResourceConfig resources_;
    std::vector<std::string> requirements_;
    std::optional<std::string> custom_image_;
    bool check_compliance_;
    config::EngineConfig config_;
    std::shared_ptr<docker::ContainerRuntime> runtime_;

    EventLog events_;
    EnvironmentHandle handle_;
    std::unique_ptr<Executor> executor_;
    std::unique_ptr<FileTransfer> files_;
    std::optional<ComplianceReport> compliance_;

    std::atomic<SandboxState> state_{SandboxState::PROVISIONING};
    mutable std::mutex op_mutex_;   // One operation at a time

    void provision();
    void ensure_open() const;       // Caller holds op_mutex_

    // Log a FILESYSTEM event around a file operation
    template <typename Fn>
    auto file_op(const std::string& event_type, const std::string& path, Fn&& fn) -> decltype(fn());

    friend class ExecutingScope;
};

// Convenience factory: options.language is replaced by language
std::unique_ptr<Sandbox> create_sandbox(const std::string& language, SandboxOptions options = {});

// Check requirement specs: non-empty, not an option flag. Returns them
// trimmed, de-duplicated, in first-seen order. Throws InvalidConfig.
std::vector<std::string> normalize_requirements(const std::vector<std::string>& requirements);

} // namespace sandkit::runtime
