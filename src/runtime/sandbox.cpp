#include "runtime/sandbox.hpp"
#include "runtime/engine_errors.hpp"
#include "runtime/provisioner.hpp"
#include "docker/docker_client.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <random>
#include <sstream>
#include <iomanip>
#include <type_traits>

namespace sandkit::runtime {

namespace {

// 12 lowercase hex characters; valid in container names and image tags
std::string generate_sandbox_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist(0, (1ULL << 48) - 1);
    std::ostringstream oss;
    oss << std::hex << std::setw(12) << std::setfill('0') << dist(gen);
    return oss.str();
}

} // namespace

// READY -> EXECUTING for the lifetime of one execution, back to READY on
// every exit path (including timeouts and engine faults)
class ExecutingScope {
public:
    explicit ExecutingScope(Sandbox& sandbox) : sandbox_(sandbox) {
        sandbox_.state_ = SandboxState::EXECUTING;
    }
    ~ExecutingScope() {
        sandbox_.state_ = SandboxState::READY;
    }

    ExecutingScope(const ExecutingScope&) = delete;
    ExecutingScope& operator=(const ExecutingScope&) = delete;

private:
    Sandbox& sandbox_;
};

// ============================================================================
// Construction
// ============================================================================

std::vector<std::string> normalize_requirements(const std::vector<std::string>& requirements) {
    std::vector<std::string> result;
    for (const auto& raw : requirements) {
        std::string req = util::trim(raw);
        if (req.empty()) {
            throw InvalidConfig("empty requirement");
        }
        if (req[0] == '-') {
            throw InvalidConfig("requirement looks like an option: " + req);
        }
        if (req.find_first_of(std::string("\0\n\r", 3)) != std::string::npos) {
            throw InvalidConfig("requirement contains control characters: " + req);
        }
        if (std::find(result.begin(), result.end(), req) == result.end()) {
            result.push_back(req);
        }
    }
    return result;
}

std::unique_ptr<Sandbox> Sandbox::create(const SandboxOptions& options) {
    const auto& profile = config::resolve_profile(options.language);
    options.engine.validate();

    auto requirements = normalize_requirements(options.requirements);

    if (options.custom_image && util::trim(*options.custom_image).empty()) {
        throw InvalidConfig("custom image reference is empty");
    }

    config::ResourceOverrides overrides = options.overrides;
    if (!overrides.network_mode) {
        overrides.network_mode = options.network_mode;
    }
    auto resources = config::resolve_resources(options.resource_preset, overrides);

    auto runtime = options.runtime ? options.runtime : docker::shared_runtime();

    auto sandbox = std::make_unique<Sandbox>(PrivateTag{}, generate_sandbox_id(), options, profile,
                                             resources, std::move(requirements), runtime);
    // On failure the destructor runs close(), which finds nothing left to release
    sandbox->provision();
    return sandbox;
}

Sandbox::Sandbox(PrivateTag,
                 std::string id,
                 const SandboxOptions& options,
                 const config::LanguageProfile& profile,
                 config::ResourceConfig resources,
                 std::vector<std::string> requirements,
                 std::shared_ptr<docker::ContainerRuntime> runtime)
    : id_(std::move(id)),
      profile_(&profile),
      resources_(std::move(resources)),
      requirements_(std::move(requirements)),
      custom_image_(options.custom_image),
      check_compliance_(options.check_compliance),
      config_(options.engine),
      runtime_(std::move(runtime)),
      events_(id_, options.engine.max_events) {}

Sandbox::~Sandbox() {
    close();
}

void Sandbox::provision() {
    std::lock_guard<std::mutex> lock(op_mutex_);

    spdlog::info("Provisioning sandbox {} ({}, {} requirement(s), network={})",
                 id_, profile_->name, requirements_.size(), resources_.network_mode);

    ProvisionRequest request;
    request.sandbox_id = id_;
    request.profile = profile_;
    request.resources = resources_;
    request.requirements = requirements_;
    request.custom_image = custom_image_;

    Provisioner provisioner(*runtime_, config_, events_);
    provisioner.provision(request, handle_);

    executor_ = std::make_unique<Executor>(*runtime_, handle_.container_id, *profile_, config_);
    files_ = std::make_unique<FileTransfer>(*runtime_, handle_.container_id, config_.workspace_root);

    if (check_compliance_ && !requirements_.empty()) {
        compliance_ = translate_engine_errors("compliance check", [&] {
            return check_compliance(*runtime_, handle_.container_id, *profile_, requirements_, config_);
        });
        events_.log(EventCategory::EXECUTION, "COMPLIANCE_CHECK", compliance_->to_json());
        if (!compliance_->all_available()) {
            spdlog::warn("Sandbox {}: requirements not usable: {}", id_,
                         util::join(compliance_->missing(), ", "));
        }
    }

    state_ = SandboxState::READY;
    events_.log(EventCategory::LIFECYCLE, "READY", {{"container", handle_.container_id}});
    spdlog::info("Sandbox {} ready (container {})", id_, util::short_id(handle_.container_id));
}

void Sandbox::ensure_open() const {
    if (state_ == SandboxState::CLOSED) {
        throw SandboxClosed(id_);
    }
    if (state_ == SandboxState::PROVISIONING) {
        throw EngineFault("sandbox " + id_ + " is not provisioned");
    }
}

// ============================================================================
// Execution
// ============================================================================

ComplianceReport Sandbox::run_compliance(const std::vector<std::string>& requirements) {
    std::lock_guard<std::mutex> lock(op_mutex_);
    ensure_open();

    auto reqs = normalize_requirements(requirements);
    ExecutingScope scope(*this);

    try {
        auto report = translate_engine_errors("compliance check", [&] {
            return check_compliance(*runtime_, handle_.container_id, *profile_, reqs, config_);
        });
        events_.log(EventCategory::EXECUTION, "COMPLIANCE_CHECK", report.to_json());
        return report;
    } catch (const SandboxError& e) {
        events_.log_failure(EventCategory::EXECUTION, "COMPLIANCE_CHECK", e.what());
        throw;
    }
}

ExecutionResult Sandbox::run_code(const std::string& code,
                                  const std::map<std::string, std::string>& env,
                                  std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(op_mutex_);
    ensure_open();

    RunRequest request{code, env, timeout};
    validate_run_request(request);

    ExecutingScope scope(*this);
    try {
        auto result = translate_engine_errors("run_code", [&] {
            return executor_->run(request);
        });

        nlohmann::json details = {
            {"run", executor_->runs()},
            {"exit_code", result.exit_code},
            {"timed_out", result.timed_out},
            {"elapsed_ms", result.elapsed.count()},
            {"output_truncated", result.output_truncated}
        };
        if (timeout) {
            details["timeout_ms"] = timeout->count();
        }
        events_.log(EventCategory::EXECUTION, "RUN_CODE", details);

        if (result.timed_out) {
            spdlog::info("Sandbox {}: run {} timed out after {}ms", id_, executor_->runs(),
                         result.elapsed.count());
        }
        return result;
    } catch (const SandboxError& e) {
        spdlog::error("Sandbox {}: run_code failed: {}", id_, e.what());
        events_.log_failure(EventCategory::EXECUTION, "RUN_CODE", e.what());
        throw;
    }
}

// ============================================================================
// Files
// ============================================================================

template <typename Fn>
auto Sandbox::file_op(const std::string& event_type, const std::string& path, Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::mutex> lock(op_mutex_);
    ensure_open();
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            events_.log(EventCategory::FILESYSTEM, event_type, {{"path", path}});
        } else {
            auto result = fn();
            events_.log(EventCategory::FILESYSTEM, event_type, {{"path", path}, {"bytes", result.size()}});
            return result;
        }
    } catch (const SandboxError& e) {
        events_.log_failure(EventCategory::FILESYSTEM, event_type, e.what(), {{"path", path}});
        throw;
    }
}

void Sandbox::write_file(const std::string& content, const std::string& filename) {
    file_op("WRITE_FILE", filename, [&] { files_->write_file(content, filename); });
}

std::string Sandbox::read_file(const std::string& filename) {
    return file_op("READ_FILE", filename, [&] { return files_->read_file(filename); });
}

void Sandbox::delete_file(const std::string& filename) {
    file_op("DELETE_FILE", filename, [&] { files_->delete_file(filename); });
}

void Sandbox::write_dir(const std::string& directory) {
    file_op("WRITE_DIR", directory, [&] { files_->write_dir(directory); });
}

void Sandbox::delete_dir(const std::string& directory) {
    file_op("DELETE_DIR", directory, [&] { files_->delete_dir(directory); });
}

// ============================================================================
// Teardown
// ============================================================================

void Sandbox::close() noexcept {
    std::lock_guard<std::mutex> lock(op_mutex_);
    if (state_ == SandboxState::CLOSED) {
        return;
    }

    bool clean = true;
    if (!handle_.empty()) {
        spdlog::info("Closing sandbox {}", id_);
        clean = teardown_environment(*runtime_, handle_, config_, events_);
    }

    executor_.reset();
    files_.reset();
    handle_ = EnvironmentHandle{};
    state_ = SandboxState::CLOSED;

    events_.log(EventCategory::LIFECYCLE, "CLOSED", {{"clean", clean}}, clean);
    if (!clean) {
        spdlog::warn("Sandbox {} closed with {} cleanup failure(s); see diagnostics()",
                     id_, events_.failures().size());
    }
}

std::string Sandbox::container_id() const {
    std::lock_guard<std::mutex> lock(op_mutex_);
    return handle_.container_id;
}

std::string Sandbox::image() const {
    std::lock_guard<std::mutex> lock(op_mutex_);
    return handle_.image;
}

std::optional<ComplianceReport> Sandbox::compliance_report() const {
    std::lock_guard<std::mutex> lock(op_mutex_);
    return compliance_;
}

std::unique_ptr<Sandbox> create_sandbox(const std::string& language, SandboxOptions options) {
    options.language = language;
    return Sandbox::create(options);
}

} // namespace sandkit::runtime
