#include "docker/docker_client.hpp"
#include "docker/errors.hpp"
#include "config/engine_config.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <sstream>

using json = nlohmann::json;
namespace http = boost::beast::http;

namespace sandkit::docker {

namespace {

// Waits (bounded) for the target's pid file, then kills its whole process group.
// $0 is the pid file path.
const char* KILL_SCRIPT = R"SH(
i=0
while [ ! -s "$0" ] && [ "$i" -lt 20 ]; do sleep 0.1; i=$((i+1)); done
[ -s "$0" ] || exit 0
pid=$(cat "$0")
kill -KILL -- "-$pid" 2>/dev/null || kill -KILL "$pid" 2>/dev/null
exit 0
)SH";

std::string error_message(const HttpResponse& res) {
    try {
        auto j = json::parse(res.body);
        if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            return j["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    return res.body.empty() ? "status " + std::to_string(res.status) : res.body;
}

std::string label_filter(const std::string& label) {
    json filters;
    filters["label"] = json::array({label});
    return url_encode(filters.dump());
}

std::vector<std::string> collect_ids(const std::string& body) {
    std::vector<std::string> ids;
    try {
        auto arr = json::parse(body);
        for (const auto& item : arr) {
            if (item.contains("Id")) ids.push_back(item["Id"].get<std::string>());
        }
    } catch (const json::exception& e) {
        throw TransportError(std::string("malformed list response: ") + e.what());
    }
    return ids;
}

std::mutex g_runtime_mutex;
std::shared_ptr<ContainerRuntime> g_runtime;

} // namespace

DockerClient::DockerClient(const std::string& socket_path, const std::string& api_version)
    : http_(socket_path),
      prefix_(api_version.empty() ? "" : "/" + api_version) {
    spdlog::debug("Docker client using {} (API {})", socket_path,
                  api_version.empty() ? "default" : api_version);
}

std::string DockerClient::url(const std::string& path) const {
    return prefix_ + path;
}

void DockerClient::expect(const HttpResponse& res, std::initializer_list<int> accepted,
                          const std::string& what) {
    for (int code : accepted) {
        if (res.status == code) return;
    }
    throw ApiError(res.status, what + ": " + error_message(res));
}

void DockerClient::check_progress_stream(const std::string& body, const std::string& what) {
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) continue;
        json record;
        try {
            record = json::parse(line);
        } catch (const json::exception&) {
            continue;
        }
        if (record.contains("error")) {
            std::string msg = record["error"].is_string() ? record["error"].get<std::string>()
                                                          : record["error"].dump();
            throw ApiError(500, what + ": " + msg);
        }
    }
}

bool DockerClient::ping() {
    try {
        auto res = http_.request(http::verb::get, url("/_ping"));
        return res.ok();
    } catch (const TransportError& e) {
        spdlog::debug("Docker ping failed: {}", e.what());
        return false;
    }
}

// ============================================================================
// Images
// ============================================================================

bool DockerClient::image_exists(const std::string& image) {
    auto res = http_.request(http::verb::get, url("/images/" + image + "/json"));
    if (res.status == 404) return false;
    expect(res, {200}, "inspect image " + image);
    return true;
}

void DockerClient::pull_image(const std::string& image) {
    auto [name, tag] = split_image_reference(image);
    std::string target = url("/images/create?fromImage=" + url_encode(name));
    if (!tag.empty()) {
        target += "&tag=" + url_encode(tag);
    }

    spdlog::info("Pulling image {}", image);
    auto res = http_.request(http::verb::post, target);
    expect(res, {200}, "pull " + image);
    // The daemon reports failures inside the progress stream with status 200
    check_progress_stream(res.body, "pull " + image);
}

std::string DockerClient::build_image(const std::string& context_tar, const std::string& tag,
                                      const std::map<std::string, std::string>& labels) {
    json label_json = labels;
    std::string target = url("/build?rm=1&forcerm=1&t=" + url_encode(tag) +
                             "&labels=" + url_encode(label_json.dump()));

    spdlog::info("Building image {}", tag);
    auto res = http_.request(http::verb::post, target, context_tar, "application/x-tar");
    expect(res, {200}, "build " + tag);
    check_progress_stream(res.body, "build " + tag);

    std::string image_id;
    std::istringstream lines(res.body);
    std::string line;
    while (std::getline(lines, line)) {
        try {
            auto record = json::parse(line);
            if (record.contains("aux") && record["aux"].contains("ID")) {
                image_id = record["aux"]["ID"].get<std::string>();
            }
        } catch (const json::exception&) {
            continue;
        }
    }
    return image_id.empty() ? tag : image_id;
}

void DockerClient::remove_image(const std::string& image, bool force) {
    auto res = http_.request(http::verb::delete_,
                             url("/images/" + image + (force ? "?force=1" : "")));
    expect(res, {200}, "remove image " + image);
}

std::vector<std::string> DockerClient::list_images(const std::string& label) {
    auto res = http_.request(http::verb::get, url("/images/json?filters=" + label_filter(label)));
    expect(res, {200}, "list images");
    return collect_ids(res.body);
}

// ============================================================================
// Containers
// ============================================================================

std::string DockerClient::create_container(const ContainerSpec& spec) {
    json body;
    body["Image"] = spec.image;
    body["Cmd"] = spec.command;
    body["WorkingDir"] = spec.working_dir;
    body["Labels"] = spec.labels;
    body["Tty"] = false;
    body["OpenStdin"] = false;
    body["NetworkDisabled"] = spec.network_mode == "none";

    json host;
    host["Memory"] = spec.memory_bytes;
    host["MemorySwap"] = spec.memory_bytes;  // No swap beyond the memory limit
    host["CpuPeriod"] = spec.cpu_period_us;
    host["CpuQuota"] = spec.cpu_quota_us;
    host["PidsLimit"] = spec.pids_limit;
    host["NetworkMode"] = spec.network_mode;
    host["Init"] = true;                     // Reaps processes killed on timeout
    host["SecurityOpt"] = json::array({"no-new-privileges"});
    body["HostConfig"] = host;

    std::string target = url("/containers/create");
    if (!spec.name.empty()) {
        target += "?name=" + url_encode(spec.name);
    }

    auto res = http_.request(http::verb::post, target, body.dump());
    expect(res, {201}, "create container from " + spec.image);

    try {
        return json::parse(res.body).at("Id").get<std::string>();
    } catch (const json::exception& e) {
        throw TransportError(std::string("malformed create response: ") + e.what());
    }
}

void DockerClient::start_container(const std::string& id) {
    auto res = http_.request(http::verb::post, url("/containers/" + id + "/start"));
    expect(res, {204, 304}, "start container " + id);
}

void DockerClient::stop_container(const std::string& id, int timeout_sec) {
    auto res = http_.request(http::verb::post,
                             url("/containers/" + id + "/stop?t=" + std::to_string(timeout_sec)));
    expect(res, {204, 304}, "stop container " + id);
}

void DockerClient::remove_container(const std::string& id, bool force) {
    auto res = http_.request(http::verb::delete_,
                             url("/containers/" + id + "?v=1" + (force ? "&force=1" : "")));
    expect(res, {204}, "remove container " + id);
}

std::vector<std::string> DockerClient::list_containers(const std::string& label) {
    auto res = http_.request(http::verb::get,
                             url("/containers/json?all=1&filters=" + label_filter(label)));
    expect(res, {200}, "list containers");
    return collect_ids(res.body);
}

// ============================================================================
// Processes
// ============================================================================

std::string DockerClient::create_exec(const std::string& container_id, const ExecSpec& spec) {
    json body;
    body["AttachStdin"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["Tty"] = false;
    body["Cmd"] = spec.command;
    if (!spec.env.empty()) body["Env"] = spec.env;
    if (!spec.working_dir.empty()) body["WorkingDir"] = spec.working_dir;

    auto res = http_.request(http::verb::post, url("/containers/" + container_id + "/exec"), body.dump());
    expect(res, {201}, "create exec in " + container_id);

    try {
        return json::parse(res.body).at("Id").get<std::string>();
    } catch (const json::exception& e) {
        throw TransportError(std::string("malformed exec response: ") + e.what());
    }
}

std::unique_ptr<ExecStream> DockerClient::start_exec(const std::string& exec_id) {
    json body;
    body["Detach"] = false;
    body["Tty"] = false;

    HttpResponse error;
    auto stream = http_.open_stream(http::verb::post, url("/exec/" + exec_id + "/start"),
                                    body.dump(), error);
    if (!stream) {
        throw ApiError(error.status, "start exec " + exec_id + ": " + error_message(error));
    }
    return stream;
}

ExecState DockerClient::inspect_exec(const std::string& exec_id) {
    auto res = http_.request(http::verb::get, url("/exec/" + exec_id + "/json"));
    expect(res, {200}, "inspect exec " + exec_id);

    ExecState state;
    try {
        auto j = json::parse(res.body);
        state.running = j.value("Running", false);
        if (j.contains("ExitCode") && j["ExitCode"].is_number_integer()) {
            state.exit_code = j["ExitCode"].get<int>();
        }
    } catch (const json::exception& e) {
        throw TransportError(std::string("malformed exec inspect response: ") + e.what());
    }
    return state;
}

void DockerClient::kill_process(const std::string& container_id, const std::string& pid_file) {
    ExecSpec spec;
    spec.command = {"sh", "-c", KILL_SCRIPT, pid_file};

    auto exec_id = create_exec(container_id, spec);
    auto stream = start_exec(exec_id);

    // The script's own output is irrelevant; drain until it exits
    char buf[4096];
    while (stream->read_some(buf, sizeof(buf)) > 0) {
    }
    spdlog::debug("Killed process group from {} in {}", pid_file, container_id.substr(0, 12));
}

// ============================================================================
// Files
// ============================================================================

void DockerClient::put_archive(const std::string& container_id, const std::string& path,
                               const std::string& tar) {
    auto res = http_.request(http::verb::put,
                             url("/containers/" + container_id + "/archive?path=" + url_encode(path)),
                             tar, "application/x-tar");
    expect(res, {200}, "copy into " + path);
}

std::string DockerClient::get_archive(const std::string& container_id, const std::string& path) {
    auto res = http_.request(http::verb::get,
                             url("/containers/" + container_id + "/archive?path=" + url_encode(path)));
    expect(res, {200}, "copy out of " + path);
    return std::move(res.body);
}

// ============================================================================
// Process-wide runtime
// ============================================================================

std::shared_ptr<ContainerRuntime> shared_runtime() {
    std::lock_guard<std::mutex> lock(g_runtime_mutex);
    if (!g_runtime) {
        auto cfg = config::EngineConfig::from_env();
        g_runtime = std::make_shared<DockerClient>(cfg.docker_socket, cfg.api_version);
    }
    return g_runtime;
}

void set_shared_runtime(std::shared_ptr<ContainerRuntime> runtime) {
    std::lock_guard<std::mutex> lock(g_runtime_mutex);
    g_runtime = std::move(runtime);
}

std::pair<std::string, std::string> split_image_reference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};  // Digest references are pulled as-is
    }
    size_t slash = image.rfind('/');
    size_t colon = image.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image.substr(0, colon), image.substr(colon + 1)};
    }
    return {image, "latest"};
}

} // namespace sandkit::docker
