#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <limits>
#include <thread>
#include "fake_runtime.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/sandbox.hpp"
#include "util/errors.hpp"

using namespace sandkit;
using namespace sandkit::runtime;
using sandkit::testing::FakeContainer;
using sandkit::testing::FakeExecResult;
using sandkit::testing::FakeRuntime;
using sandkit::testing::fake_join;
using std::chrono::milliseconds;

namespace {

SandboxOptions fake_options(const std::shared_ptr<FakeRuntime>& runtime, const std::string& language = "python") {
    SandboxOptions options;
    options.language = language;
    options.resource_preset = "tiny";
    options.runtime = runtime;
    options.engine.kill_grace_ms = 200;
    options.engine.stop_timeout_sec = 0;
    options.engine.image_remove_backoff_ms = 0;
    return options;
}

// Guest that prints its own source file
FakeExecResult echo_source(const std::vector<std::string>& argv, const docker::ExecSpec&, FakeContainer& c) {
    FakeExecResult r;
    auto it = c.files.find(fake_join(argv.back(), ""));
    if (it == c.files.end()) {
        r.exit_code = 2;
        r.stderr_data = "can't open file";
        return r;
    }
    r.stdout_data = it->second.content;
    return r;
}

FakeExecResult hang(const std::vector<std::string>&, const docker::ExecSpec&, FakeContainer&) {
    FakeExecResult r;
    r.stdout_data = "started\n";
    r.keep_running = true;
    return r;
}

bool wait_for_state(const Sandbox& sandbox, SandboxState state) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (sandbox.state() == state) return true;
        std::this_thread::sleep_for(milliseconds(1));
    }
    return false;
}

bool has_event(const std::vector<EventLogEntry>& entries, const std::string& type) {
    return std::any_of(entries.begin(), entries.end(),
                       [&](const EventLogEntry& e) { return e.event_type == type; });
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, create_provisions_a_ready_constrained_container) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));

    EXPECT_EQ(sandbox->state(), SandboxState::READY);
    EXPECT_EQ(sandbox->id().size(), 12u);
    EXPECT_TRUE(std::all_of(sandbox->id().begin(), sandbox->id().end(),
                            [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); }));
    EXPECT_EQ(sandbox->profile().name, "python");
    EXPECT_EQ(sandbox->image(), "python:3.9-slim");
    EXPECT_EQ(runtime->live_containers(), 1u);

    const auto& spec = runtime->last_container_spec();
    EXPECT_EQ(spec.name, "sandkit-" + sandbox->id());
    EXPECT_EQ(spec.image, "python:3.9-slim");
    EXPECT_EQ(spec.working_dir, "/workspace");
    EXPECT_EQ(spec.memory_bytes, 128LL * 1024 * 1024);
    EXPECT_EQ(spec.cpu_quota_us, 25000);
    EXPECT_EQ(spec.cpu_period_us, 100000);
    EXPECT_EQ(spec.pids_limit, 256);
    EXPECT_EQ(spec.network_mode, "none");
    EXPECT_EQ(spec.labels.at(LABEL_MANAGED), "true");
    EXPECT_EQ(spec.labels.at(LABEL_SANDBOX), sandbox->id());

    // Workspace and scratch exist before any operation
    EXPECT_TRUE(runtime->file_exists(sandbox->container_id(), "/workspace/.sandkit"));
}

// NOLINTNEXTLINE
TEST(sandbox, close_releases_everything_and_is_idempotent) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));
    sandbox->close();

    EXPECT_EQ(sandbox->state(), SandboxState::CLOSED);
    EXPECT_TRUE(sandbox->closed());
    EXPECT_EQ(runtime->live_containers(), 0u);
    EXPECT_TRUE(sandbox->diagnostics().empty());

    size_t calls = runtime->calls().size();
    sandbox->close();
    EXPECT_EQ(runtime->calls().size(), calls);
    EXPECT_EQ(runtime->count_calls("remove_container"), 1u);
}

// NOLINTNEXTLINE
TEST(sandbox, operations_after_close_fail_with_closed) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));
    sandbox->close();

    try {
        sandbox->run_code("print(1)");
        FAIL() << "expected SandboxClosed";
    } catch (const SandboxClosed& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CLOSED);
    }
    EXPECT_THROW(sandbox->write_file("x", "x.txt"), SandboxClosed);
    EXPECT_THROW(sandbox->read_file("x.txt"), SandboxClosed);
    EXPECT_THROW(sandbox->delete_file("x.txt"), SandboxClosed);
    EXPECT_THROW(sandbox->write_dir("d"), SandboxClosed);
    EXPECT_THROW(sandbox->delete_dir("d"), SandboxClosed);
    EXPECT_THROW(sandbox->run_compliance({"numpy"}), SandboxClosed);
}

// NOLINTNEXTLINE
TEST(sandbox, destructor_closes) {
    auto runtime = std::make_shared<FakeRuntime>();
    {
        auto sandbox = create_sandbox("python", fake_options(runtime));
        EXPECT_EQ(runtime->live_containers(), 1u);
    }
    EXPECT_EQ(runtime->live_containers(), 0u);
}

// NOLINTNEXTLINE
TEST(sandbox, network_mode_reaches_the_container) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto options = fake_options(runtime);
    options.network_mode = "bridge";
    auto sandbox = Sandbox::create(options);
    EXPECT_EQ(runtime->last_container_spec().network_mode, "bridge");
    EXPECT_EQ(sandbox->resources().network_mode, "bridge");

    options.overrides.network_mode = "host";
    auto other = Sandbox::create(options);
    EXPECT_EQ(runtime->last_container_spec().network_mode, "host");
}

// ============================================================================
// Validation
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, bad_arguments_fail_before_touching_the_runtime) {
    auto runtime = std::make_shared<FakeRuntime>();

    auto options = fake_options(runtime, "cobol");
    EXPECT_THROW(Sandbox::create(options), UnsupportedLanguage);

    options = fake_options(runtime);
    options.resource_preset = "gigantic";
    EXPECT_THROW(Sandbox::create(options), InvalidConfig);

    options = fake_options(runtime);
    options.requirements = {"--index-url=http://evil"};
    EXPECT_THROW(Sandbox::create(options), InvalidConfig);

    options = fake_options(runtime);
    options.network_mode = "container:other";
    EXPECT_THROW(Sandbox::create(options), InvalidConfig);

    options = fake_options(runtime);
    options.custom_image = "  ";
    EXPECT_THROW(Sandbox::create(options), InvalidConfig);

    EXPECT_TRUE(runtime->calls().empty());
}

// NOLINTNEXTLINE
TEST(sandbox, normalize_requirements_trims_and_dedupes) {
    auto reqs = normalize_requirements({" numpy ", "pandas==2.0", "numpy"});
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0], "numpy");
    EXPECT_EQ(reqs[1], "pandas==2.0");

    EXPECT_THROW(normalize_requirements({""}), InvalidConfig);
    EXPECT_THROW(normalize_requirements({"-r requirements.txt"}), InvalidConfig);
    EXPECT_THROW(normalize_requirements({"numpy\nrequests"}), InvalidConfig);
}

// NOLINTNEXTLINE
TEST(sandbox, invalid_run_arguments) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));
    const size_t execs_before = runtime->count_calls("create_exec");

    EXPECT_THROW(sandbox->run_code("print(1)", {{"A=B", "x"}}), InvalidConfig);
    EXPECT_THROW(sandbox->run_code("print(1)", {{"", "x"}}), InvalidConfig);
    EXPECT_THROW(sandbox->run_code("print(1)", {}, milliseconds(0)), InvalidConfig);
    EXPECT_THROW(sandbox->run_code("print(1)", {}, milliseconds::max()), InvalidConfig);
    EXPECT_THROW(sandbox->run_code("print(1)", {}, MAX_EXEC_TIMEOUT + milliseconds(1)), InvalidConfig);
    EXPECT_EQ(sandbox->state(), SandboxState::READY);
    EXPECT_EQ(runtime->count_calls("create_exec"), execs_before);
}

// NOLINTNEXTLINE
TEST(sandbox, timeout_from_seconds_bounds) {
    EXPECT_EQ(timeout_from_seconds(2.5), milliseconds(2500));
    EXPECT_EQ(timeout_from_seconds(0.001), milliseconds(1));
    EXPECT_EQ(timeout_from_seconds(7 * 24 * 3600), MAX_EXEC_TIMEOUT);

    EXPECT_THROW(timeout_from_seconds(0), InvalidConfig);
    EXPECT_THROW(timeout_from_seconds(-1), InvalidConfig);
    EXPECT_THROW(timeout_from_seconds(0.0001), InvalidConfig);
    EXPECT_THROW(timeout_from_seconds(1e300), InvalidConfig);
    EXPECT_THROW(timeout_from_seconds(std::numeric_limits<double>::infinity()), InvalidConfig);
    EXPECT_THROW(timeout_from_seconds(std::numeric_limits<double>::quiet_NaN()), InvalidConfig);
}

// ============================================================================
// Execution
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, run_code_materializes_dedented_source) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler(echo_source);
    auto sandbox = Sandbox::create(fake_options(runtime));

    auto result = sandbox->run_code("    import sys\n    print('hi')\n");
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.stdout_data, "import sys\nprint('hi')\n");
    EXPECT_EQ(sandbox->state(), SandboxState::READY);

    // Source and pid file are cleaned up after the run
    EXPECT_FALSE(runtime->file_exists(sandbox->container_id(), "/workspace/.sandkit/run-1.py"));
    EXPECT_FALSE(runtime->file_exists(sandbox->container_id(), "/workspace/.sandkit/run-1.pid"));

    auto exec_events = sandbox->events().get_entries(EventCategory::EXECUTION);
    EXPECT_TRUE(has_event(exec_events, "RUN_CODE"));
}

// NOLINTNEXTLINE
TEST(sandbox, node_source_is_not_dedented) {
    auto runtime = std::make_shared<FakeRuntime>();
    std::vector<std::string> seen_argv;
    runtime->set_guest_handler([&](const std::vector<std::string>& argv, const docker::ExecSpec& spec,
                                   FakeContainer& c) {
        seen_argv = argv;
        return echo_source(argv, spec, c);
    });
    auto sandbox = Sandbox::create(fake_options(runtime, "javascript"));
    EXPECT_EQ(sandbox->image(), "node:lts-slim");

    auto result = sandbox->run_code("  console.log(1)\n");
    EXPECT_EQ(result.stdout_data, "  console.log(1)\n");
    ASSERT_EQ(seen_argv.size(), 2u);
    EXPECT_EQ(seen_argv[0], "node");
    EXPECT_EQ(seen_argv[1], "/workspace/.sandkit/run-1.js");
}

// NOLINTNEXTLINE
TEST(sandbox, guest_failure_is_a_result_not_an_error) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler([](const std::vector<std::string>&, const docker::ExecSpec&, FakeContainer&) {
        FakeExecResult r;
        r.stderr_data = "ZeroDivisionError: division by zero\n";
        r.exit_code = 1;
        return r;
    });
    auto sandbox = Sandbox::create(fake_options(runtime));

    auto result = sandbox->run_code("1/0");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_NE(result.stderr_data.find("ZeroDivisionError"), std::string::npos);

    auto j = result.to_json();
    EXPECT_EQ(j["exit_code"], 1);
    EXPECT_EQ(j["timed_out"], false);
    EXPECT_TRUE(j.contains("elapsed_ms"));
}

// NOLINTNEXTLINE
TEST(sandbox, env_is_scoped_to_one_run) {
    auto runtime = std::make_shared<FakeRuntime>();
    std::vector<std::vector<std::string>> envs;
    runtime->set_guest_handler([&](const std::vector<std::string>&, const docker::ExecSpec& spec, FakeContainer&) {
        envs.push_back(spec.env);
        return FakeExecResult{};
    });
    auto sandbox = Sandbox::create(fake_options(runtime));

    sandbox->run_code("print(1)", {{"API_KEY", "secret"}, {"MODE", "a=b"}});
    sandbox->run_code("print(2)");

    ASSERT_EQ(envs.size(), 2u);
    EXPECT_NE(std::find(envs[0].begin(), envs[0].end(), "API_KEY=secret"), envs[0].end());
    EXPECT_NE(std::find(envs[0].begin(), envs[0].end(), "MODE=a=b"), envs[0].end());
    EXPECT_TRUE(envs[1].empty());
}

// NOLINTNEXTLINE
TEST(sandbox, timeout_is_reported_and_sandbox_stays_usable) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler(hang);
    auto sandbox = Sandbox::create(fake_options(runtime));

    auto result = sandbox->run_code("while True: pass", {}, milliseconds(200));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, TIMED_OUT_EXIT_CODE);
    EXPECT_EQ(result.stdout_data, "started\n");
    EXPECT_GE(result.elapsed, milliseconds(200));
    EXPECT_LT(result.elapsed, milliseconds(2000));
    EXPECT_EQ(runtime->kills(), 1u);
    EXPECT_EQ(sandbox->state(), SandboxState::READY);

    runtime->set_guest_handler(echo_source);
    auto next = sandbox->run_code("print('again')");
    EXPECT_TRUE(next.ok());
    EXPECT_EQ(next.stdout_data, "print('again')");
}

// NOLINTNEXTLINE
TEST(sandbox, engine_failure_during_run_is_engine_fault) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));

    runtime->fail_operation("create_exec", 1);
    EXPECT_THROW(sandbox->run_code("print(1)"), EngineFault);
    EXPECT_EQ(sandbox->state(), SandboxState::READY);
    EXPECT_TRUE(has_event(sandbox->diagnostics(), "RUN_CODE"));

    EXPECT_TRUE(sandbox->run_code("print(1)").ok());
}

// ============================================================================
// Files
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, files_written_are_visible_to_code) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler([](const std::vector<std::string>&, const docker::ExecSpec&, FakeContainer& c) {
        FakeExecResult r;
        r.stdout_data = c.files.at("/workspace/data/input.csv").content;
        c.files["/workspace/data/output.txt"] = {false, "done"};
        return r;
    });
    auto sandbox = Sandbox::create(fake_options(runtime));

    sandbox->write_file("a,b\n1,2\n", "data/input.csv");
    auto result = sandbox->run_code("print(open('data/input.csv').read())");
    EXPECT_EQ(result.stdout_data, "a,b\n1,2\n");
    EXPECT_EQ(sandbox->read_file("data/output.txt"), "done");

    sandbox->delete_file("data/output.txt");
    EXPECT_THROW(sandbox->read_file("data/output.txt"), FileNotFound);
    sandbox->delete_dir("data");
    EXPECT_THROW(sandbox->delete_dir("data"), FileNotFound);
    EXPECT_THROW(sandbox->write_file("x", "../../etc/passwd"), InvalidPath);

    auto fs = sandbox->events().get_entries(EventCategory::FILESYSTEM);
    EXPECT_TRUE(has_event(fs, "WRITE_FILE"));
    EXPECT_TRUE(has_event(fs, "DELETE_DIR"));
    EXPECT_EQ(sandbox->state(), SandboxState::READY);
}

// ============================================================================
// Requirements
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, requirements_installed_by_exec) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto options = fake_options(runtime);
    options.requirements = {"numpy", "requests==2.31"};
    options.check_compliance = true;
    auto sandbox = Sandbox::create(options);

    auto history = runtime->exec_history();
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history[0].command[0], "pip");
    EXPECT_EQ(runtime->count_calls("build_image"), 0u);

    auto report = sandbox->compliance_report();
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->all_available());
    EXPECT_EQ(report->packages.size(), 2u);
}

// NOLINTNEXTLINE
TEST(sandbox, compliance_is_advisory) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));
    EXPECT_FALSE(sandbox->compliance_report());

    runtime->add_installed_package("requests");
    auto report = sandbox->run_compliance({"requests>=2", "not-a-real-package"});
    EXPECT_FALSE(report.all_available());
    EXPECT_TRUE(report.packages.at("requests>=2"));
    ASSERT_EQ(report.missing().size(), 1u);
    EXPECT_EQ(report.missing()[0], "not-a-real-package");
    EXPECT_EQ(report.to_json()["all_available"], false);
    EXPECT_EQ(sandbox->state(), SandboxState::READY);
}

// NOLINTNEXTLINE
TEST(sandbox, failed_install_tears_down_the_environment) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_install_exit_code(1);
    auto options = fake_options(runtime);
    options.requirements = {"definitely-not-a-package-xyz"};

    try {
        Sandbox::create(options);
        FAIL() << "expected RequirementsInstallFailed";
    } catch (const RequirementsInstallFailed& e) {
        EXPECT_EQ(e.kind(), ErrorKind::REQUIREMENTS_INSTALL_FAILED);
        EXPECT_EQ(e.exit_code(), 1);
        EXPECT_NE(e.output().find("No matching distribution"), std::string::npos);
    }
    EXPECT_EQ(runtime->live_containers(), 0u);
}

// NOLINTNEXTLINE
TEST(sandbox, image_build_strategy_removes_its_image) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto options = fake_options(runtime);
    options.requirements = {"numpy"};
    options.engine.install_strategy = config::InstallStrategy::IMAGE_BUILD;
    auto sandbox = Sandbox::create(options);

    EXPECT_EQ(runtime->count_calls("build_image"), 1u);
    EXPECT_EQ(sandbox->image(), "sandkit/" + sandbox->id());
    EXPECT_EQ(runtime->last_container_spec().image, "sandkit/" + sandbox->id());
    EXPECT_EQ(runtime->live_images_with_prefix("sandkit/"), 1u);
    EXPECT_EQ(runtime->list_images(std::string(LABEL_SANDBOX) + "=" + sandbox->id()).size(), 1u);

    sandbox->close();
    EXPECT_EQ(runtime->live_images_with_prefix("sandkit/"), 0u);
    EXPECT_EQ(runtime->live_containers(), 0u);
    EXPECT_TRUE(sandbox->diagnostics().empty());
}

// NOLINTNEXTLINE
TEST(sandbox, image_build_failure_leaves_nothing) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_build_error("The command '/bin/sh -c pip install nope' returned a non-zero code: 1");
    auto options = fake_options(runtime);
    options.requirements = {"nope"};
    options.engine.install_strategy = config::InstallStrategy::IMAGE_BUILD;

    try {
        Sandbox::create(options);
        FAIL() << "expected RequirementsInstallFailed";
    } catch (const RequirementsInstallFailed& e) {
        EXPECT_NE(e.output().find("non-zero code"), std::string::npos);
    }
    EXPECT_EQ(runtime->live_images_with_prefix("sandkit/"), 0u);
    EXPECT_EQ(runtime->live_containers(), 0u);
    EXPECT_EQ(runtime->count_calls("create_container"), 0u);
}

// ============================================================================
// Provisioning failures
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, missing_image_is_pulled) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->add_pullable_image("python:3.12-slim");
    auto options = fake_options(runtime);
    options.custom_image = "python:3.12-slim";
    auto sandbox = Sandbox::create(options);

    EXPECT_EQ(runtime->count_calls("pull_image"), 1u);
    EXPECT_EQ(sandbox->image(), "python:3.12-slim");

    // A custom image is never removed
    sandbox->close();
    EXPECT_EQ(runtime->count_calls("remove_image"), 0u);
}

// NOLINTNEXTLINE
TEST(sandbox, unpullable_image_fails_provisioning) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto options = fake_options(runtime);
    options.custom_image = "ghcr.io/nobody/ghost:1";

    try {
        Sandbox::create(options);
        FAIL() << "expected ProvisioningFailed";
    } catch (const ProvisioningFailed& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PROVISIONING_FAILED);
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
    }
    EXPECT_EQ(runtime->count_calls("create_container"), 0u);
    EXPECT_EQ(runtime->live_containers(), 0u);

    options.engine.pull_missing_images = false;
    size_t pulls = runtime->count_calls("pull_image");
    EXPECT_THROW(Sandbox::create(options), ProvisioningFailed);
    EXPECT_EQ(runtime->count_calls("pull_image"), pulls);
}

// NOLINTNEXTLINE
TEST(sandbox, start_failure_removes_the_created_container) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->fail_operation("start_container", 1);

    EXPECT_THROW(Sandbox::create(fake_options(runtime)), ProvisioningFailed);
    EXPECT_EQ(runtime->count_calls("create_container"), 1u);
    EXPECT_EQ(runtime->live_containers(), 0u);
}

// ============================================================================
// Cleanup failures
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, cleanup_failures_are_swallowed_into_diagnostics) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto sandbox = Sandbox::create(fake_options(runtime));

    runtime->fail_operation("stop_container");
    EXPECT_NO_THROW(sandbox->close());
    EXPECT_EQ(sandbox->state(), SandboxState::CLOSED);

    // The forced remove still ran
    EXPECT_EQ(runtime->live_containers(), 0u);
    auto diagnostics = sandbox->diagnostics();
    EXPECT_TRUE(has_event(diagnostics, "STOP_CONTAINER"));
    for (const auto& d : diagnostics) {
        EXPECT_FALSE(d.success);
        if (d.category == EventCategory::CLEANUP) {
            EXPECT_TRUE(d.details.contains("error"));
        }
    }
}

// NOLINTNEXTLINE
TEST(sandbox, image_removal_is_retried) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto options = fake_options(runtime);
    options.requirements = {"numpy"};
    options.engine.install_strategy = config::InstallStrategy::IMAGE_BUILD;
    options.engine.image_remove_attempts = 3;
    auto sandbox = Sandbox::create(options);

    // Fails twice, then succeeds
    runtime->fail_operation("remove_image", 2);
    sandbox->close();
    EXPECT_EQ(runtime->count_calls("remove_image"), 3u);
    EXPECT_EQ(runtime->live_images_with_prefix("sandkit/"), 0u);
    EXPECT_TRUE(sandbox->diagnostics().empty());
}

// NOLINTNEXTLINE
TEST(sandbox, exhausted_image_removal_is_reported) {
    auto runtime = std::make_shared<FakeRuntime>();
    auto options = fake_options(runtime);
    options.requirements = {"numpy"};
    options.engine.install_strategy = config::InstallStrategy::IMAGE_BUILD;
    options.engine.image_remove_attempts = 2;
    auto sandbox = Sandbox::create(options);

    runtime->fail_operation("remove_image");
    sandbox->close();
    EXPECT_EQ(runtime->count_calls("remove_image"), 2u);
    EXPECT_TRUE(has_event(sandbox->diagnostics(), "REMOVE_IMAGE"));
    EXPECT_TRUE(has_event(sandbox->events().get_entries(EventCategory::LIFECYCLE), "CLOSED"));
}

// ============================================================================
// Concurrency
// ============================================================================

// NOLINTNEXTLINE
TEST(sandbox, operations_on_one_sandbox_are_serialized) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler(hang);
    auto sandbox = Sandbox::create(fake_options(runtime));

    ExecutionResult result;
    std::thread runner([&] { result = sandbox->run_code("while True: pass", {}, milliseconds(300)); });
    ASSERT_TRUE(wait_for_state(*sandbox, SandboxState::EXECUTING));

    // Blocks until the run above has finished
    sandbox->write_file("after", "after.txt");
    runner.join();

    EXPECT_TRUE(result.timed_out);
    auto calls = runtime->calls();
    auto kill = std::find(calls.begin(), calls.end(), "kill_process");
    auto last_put = std::find(calls.rbegin(), calls.rend(), "put_archive");
    ASSERT_NE(kill, calls.end());
    EXPECT_GT(std::distance(calls.begin(), last_put.base()) - 1, std::distance(calls.begin(), kill));
}

// NOLINTNEXTLINE
TEST(sandbox, close_waits_for_running_code) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler(hang);
    auto sandbox = Sandbox::create(fake_options(runtime));

    ExecutionResult result;
    std::thread runner([&] { result = sandbox->run_code("while True: pass", {}, milliseconds(300)); });
    ASSERT_TRUE(wait_for_state(*sandbox, SandboxState::EXECUTING));

    sandbox->close();
    runner.join();

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(sandbox->state(), SandboxState::CLOSED);
    EXPECT_EQ(runtime->live_containers(), 0u);
}

// NOLINTNEXTLINE
TEST(sandbox, independent_sandboxes_run_in_parallel) {
    auto runtime = std::make_shared<FakeRuntime>();
    runtime->set_guest_handler(echo_source);

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&, i] {
            auto sandbox = Sandbox::create(fake_options(runtime));
            auto result = sandbox->run_code("print(" + std::to_string(i) + ")");
            if (result.ok() && result.stdout_data == "print(" + std::to_string(i) + ")") ok++;
            sandbox->close();
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 4);
    EXPECT_EQ(runtime->live_containers(), 0u);
    EXPECT_EQ(runtime->count_calls("create_container"), 4u);
}
