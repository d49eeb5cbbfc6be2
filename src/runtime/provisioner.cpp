#include "runtime/provisioner.hpp"
#include "runtime/exec_session.hpp"
#include "runtime/file_transfer.hpp"
#include "docker/archive.hpp"
#include "docker/errors.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>

namespace sandkit::runtime {

namespace {

constexpr size_t INSTALL_OUTPUT_CAP = 1024 * 1024;

std::map<std::string, std::string> sandbox_labels(const std::string& sandbox_id) {
    return {{LABEL_MANAGED, "true"}, {LABEL_SANDBOX, sandbox_id}};
}

} // namespace

Provisioner::Provisioner(docker::ContainerRuntime& runtime,
                         const config::EngineConfig& config,
                         EventLog& events)
    : runtime_(runtime), config_(config), events_(events) {}

void Provisioner::provision(const ProvisionRequest& request, EnvironmentHandle& handle) {
    const auto& profile = *request.profile;
    const std::string image = request.custom_image.value_or(profile.base_image);
    const bool build_image = !request.requirements.empty() &&
                             config_.install_strategy == config::InstallStrategy::IMAGE_BUILD;

    events_.log(EventCategory::LIFECYCLE, "PROVISION_START", {
        {"language", profile.name},
        {"image", image},
        {"requirements", request.requirements},
        {"resources", request.resources.to_json()},
        {"install_strategy", config::install_strategy_to_string(config_.install_strategy)}
    });

    std::string stage = "resolving image " + image;
    // Log, then release whatever was allocated so far
    auto fail = [&](const std::exception& e) {
        spdlog::error("Provisioning sandbox {} failed while {}: {}", request.sandbox_id, stage, e.what());
        events_.log_failure(EventCategory::LIFECYCLE, "PROVISION_FAILED", e.what(), {{"stage", stage}});
        if (!handle.empty() && !teardown_environment(runtime_, handle, config_, events_)) {
            spdlog::warn("Sandbox {} left resources behind after failed provisioning", request.sandbox_id);
        }
        handle = EnvironmentHandle{};
    };

    try {
        ensure_image(image);
        handle.image = image;

        if (build_image) {
            stage = "building requirements image";
            handle.ephemeral_image = "sandkit/" + request.sandbox_id;
            handle.image = build_requirements_image(request, image);
        }

        stage = "creating container";
        handle.container_id = create_container(request, handle.image);

        stage = "starting container";
        runtime_.start_container(handle.container_id);
        events_.log(EventCategory::LIFECYCLE, "CONTAINER_STARTED", {{"container", handle.container_id}});

        stage = "creating workspace";
        FileTransfer files(runtime_, handle.container_id, config_.workspace_root);
        files.create_directories({config_.workspace_root,
                                  config_.workspace_root + "/" + config_.scratch_dir});

        if (!request.requirements.empty() && !build_image) {
            stage = "installing requirements";
            install_requirements(request, handle.container_id);
        }
    } catch (const SandboxError& e) {
        fail(e);
        throw;
    } catch (const docker::ApiError& e) {
        fail(e);
        throw ProvisioningFailed(stage + ": " + e.what());
    } catch (const docker::TransportError& e) {
        fail(e);
        throw ProvisioningFailed(stage + ": " + e.what());
    } catch (const docker::ArchiveError& e) {
        fail(e);
        throw ProvisioningFailed(stage + ": " + e.what());
    }

    events_.log(EventCategory::LIFECYCLE, "PROVISION_DONE", {
        {"container", handle.container_id},
        {"image", handle.image}
    });
}

void Provisioner::ensure_image(const std::string& image) {
    if (runtime_.image_exists(image)) {
        spdlog::debug("Image {} present", image);
        return;
    }
    if (!config_.pull_missing_images) {
        throw ProvisioningFailed("image " + image + " is not available and pulling is disabled");
    }
    runtime_.pull_image(image);
    if (!runtime_.image_exists(image)) {
        throw ProvisioningFailed("image " + image + " still missing after pull");
    }
    events_.log(EventCategory::LIFECYCLE, "IMAGE_PULLED", {{"image", image}});
}

std::string Provisioner::build_requirements_image(const ProvisionRequest& request,
                                                  const std::string& base_image) {
    const std::string tag = "sandkit/" + request.sandbox_id;

    docker::TarWriter context;
    context.add_file("Dockerfile", request.profile->dockerfile(base_image, request.requirements));

    std::string image_id;
    try {
        image_id = runtime_.build_image(context.finish(), tag, sandbox_labels(request.sandbox_id));
    } catch (const docker::ApiError& e) {
        throw RequirementsInstallFailed("building image with requirements failed: " + e.daemon_message(),
                                        -1, util::tail(e.daemon_message(), INSTALL_OUTPUT_TAIL));
    }

    events_.log(EventCategory::LIFECYCLE, "IMAGE_BUILT", {{"tag", tag}, {"image_id", image_id}});
    spdlog::info("Built image {} ({}) for sandbox {}", tag, util::short_id(image_id), request.sandbox_id);
    return tag;
}

std::string Provisioner::create_container(const ProvisionRequest& request, const std::string& image) {
    docker::ContainerSpec spec;
    spec.name = "sandkit-" + request.sandbox_id;
    spec.image = image;
    spec.command = {"tail", "-f", "/dev/null"};
    spec.working_dir = config_.workspace_root;
    spec.labels = sandbox_labels(request.sandbox_id);
    spec.memory_bytes = request.resources.memory_limit_bytes;
    spec.cpu_period_us = request.resources.cpu_period_us;
    spec.cpu_quota_us = request.resources.cpu_quota_us;
    spec.pids_limit = request.resources.pids_limit;
    spec.network_mode = request.resources.network_mode;

    auto id = runtime_.create_container(spec);
    events_.log(EventCategory::LIFECYCLE, "CONTAINER_CREATED", {
        {"container", id},
        {"image", image},
        {"name", spec.name}
    });
    spdlog::debug("Created container {} from {}", util::short_id(id), image);
    return id;
}

void Provisioner::install_requirements(const ProvisionRequest& request, const std::string& container_id) {
    docker::ExecSpec spec;
    spec.command = request.profile->install_command(request.requirements);
    spec.working_dir = config_.workspace_root;

    ExecOptions options;
    options.max_output_bytes = INSTALL_OUTPUT_CAP;

    spdlog::info("Installing {} requirement(s) in sandbox {}", request.requirements.size(), request.sandbox_id);
    auto outcome = run_exec(runtime_, container_id, spec, options);

    events_.log(EventCategory::LIFECYCLE, "REQUIREMENTS_INSTALL", {
        {"requirements", request.requirements},
        {"exit_code", outcome.exit_code},
        {"elapsed_ms", outcome.elapsed.count()}
    }, outcome.exit_code == 0);

    if (outcome.exit_code != 0) {
        std::string output = util::trim(outcome.stderr_data + "\n" + outcome.stdout_data);
        throw RequirementsInstallFailed(
            "installing requirements failed with exit code " + std::to_string(outcome.exit_code) +
                ": " + util::tail(util::trim(outcome.stderr_data), 512),
            outcome.exit_code, util::tail(output, INSTALL_OUTPUT_TAIL));
    }
}

} // namespace sandkit::runtime
