/**
 * Container runtime boundary
 *
 * Everything the engine needs from the container runtime service. The
 * Docker implementation lives in docker_client.hpp; tests substitute an
 * in-memory fake.
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sandkit::docker {

// Creation-time container parameters; limits are applied atomically here
struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;              // Keeps the container idle
    std::string working_dir;
    std::map<std::string, std::string> labels;

    int64_t memory_bytes = 0;
    int64_t cpu_period_us = 0;
    int64_t cpu_quota_us = 0;
    int64_t pids_limit = 0;
    std::string network_mode = "none";
};

struct ExecSpec {
    std::vector<std::string> command;
    std::vector<std::string> env;                  // "KEY=VALUE", this process only
    std::string working_dir;
};

struct ExecState {
    bool running = false;
    std::optional<int> exit_code;
};

// Attached output of a started exec
class ExecStream {
public:
    virtual ~ExecStream() = default;

    // Blocking read of raw multiplexed bytes. Returns 0 at end of stream.
    // Throws TransportError on connection failure.
    virtual size_t read_some(char* buffer, size_t size) = 0;

    // Unblock a pending read_some from another thread; subsequent reads
    // return 0. Safe to call more than once.
    virtual void abort() = 0;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Images
    virtual bool image_exists(const std::string& image) = 0;
    virtual void pull_image(const std::string& image) = 0;
    // Build from a tar context containing a Dockerfile; returns the image id
    virtual std::string build_image(const std::string& context_tar, const std::string& tag,
                                    const std::map<std::string, std::string>& labels) = 0;
    virtual void remove_image(const std::string& image, bool force) = 0;
    virtual std::vector<std::string> list_images(const std::string& label) = 0;

    // Containers
    virtual std::string create_container(const ContainerSpec& spec) = 0;
    virtual void start_container(const std::string& id) = 0;
    virtual void stop_container(const std::string& id, int timeout_sec) = 0;
    virtual void remove_container(const std::string& id, bool force) = 0;
    virtual std::vector<std::string> list_containers(const std::string& label) = 0;

    // Processes
    virtual std::string create_exec(const std::string& container_id, const ExecSpec& spec) = 0;
    virtual std::unique_ptr<ExecStream> start_exec(const std::string& exec_id) = 0;
    virtual ExecState inspect_exec(const std::string& exec_id) = 0;
    // SIGKILL the process group whose leader pid is recorded in pid_file
    virtual void kill_process(const std::string& container_id, const std::string& pid_file) = 0;

    // Files (tar streams)
    virtual void put_archive(const std::string& container_id, const std::string& path,
                             const std::string& tar) = 0;
    virtual std::string get_archive(const std::string& container_id, const std::string& path) = 0;
};

} // namespace sandkit::docker
