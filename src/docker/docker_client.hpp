/**
 * Docker Engine API client
 *
 * ContainerRuntime over the daemon's unix socket. Holds no mutable state
 * beyond its configuration; one process-wide instance is shared by every
 * sandbox (see shared_runtime()).
 */
#pragma once
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "docker/container_runtime.hpp"
#include "docker/http_client.hpp"

namespace sandkit::docker {

class DockerClient : public ContainerRuntime {
public:
    DockerClient(const std::string& socket_path, const std::string& api_version);

    // Non-copyable
    DockerClient(const DockerClient&) = delete;
    DockerClient& operator=(const DockerClient&) = delete;

    // GET /_ping
    bool ping();

    bool image_exists(const std::string& image) override;
    void pull_image(const std::string& image) override;
    std::string build_image(const std::string& context_tar, const std::string& tag,
                            const std::map<std::string, std::string>& labels) override;
    void remove_image(const std::string& image, bool force) override;
    std::vector<std::string> list_images(const std::string& label) override;

    std::string create_container(const ContainerSpec& spec) override;
    void start_container(const std::string& id) override;
    void stop_container(const std::string& id, int timeout_sec) override;
    void remove_container(const std::string& id, bool force) override;
    std::vector<std::string> list_containers(const std::string& label) override;

    std::string create_exec(const std::string& container_id, const ExecSpec& spec) override;
    std::unique_ptr<ExecStream> start_exec(const std::string& exec_id) override;
    ExecState inspect_exec(const std::string& exec_id) override;
    void kill_process(const std::string& container_id, const std::string& pid_file) override;

    void put_archive(const std::string& container_id, const std::string& path,
                     const std::string& tar) override;
    std::string get_archive(const std::string& container_id, const std::string& path) override;

private:
    UnixHttpClient http_;
    std::string prefix_;   // "/v1.41"

    std::string url(const std::string& path) const;

    // Throw ApiError unless status is one of the accepted codes
    static void expect(const HttpResponse& res, std::initializer_list<int> accepted,
                       const std::string& what);

    // Scan a JSON-lines progress stream (pull/build) for an error record
    static void check_progress_stream(const std::string& body, const std::string& what);
};

// Process-wide runtime connection, created from EngineConfig::from_env()
// on first use
std::shared_ptr<ContainerRuntime> shared_runtime();

// Replace the process-wide runtime (tests, embedding applications)
void set_shared_runtime(std::shared_ptr<ContainerRuntime> runtime);

// Split "repo:tag" / "repo@digest" / "host:5000/repo:tag" into name and tag
std::pair<std::string, std::string> split_image_reference(const std::string& image);

} // namespace sandkit::docker
