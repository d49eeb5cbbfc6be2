#include "config/engine_config.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace sandkit::config {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') return nullptr;
    return value;
}

int env_int(const char* name, int fallback) {
    const char* value = env_or_null(name);
    if (!value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw InvalidConfig(std::string(name) + " is not an integer: " + value);
    }
}

bool env_bool(const char* name, bool fallback) {
    const char* value = env_or_null(name);
    if (!value) return fallback;
    std::string v = value;
    if (v == "1" || v == "true" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "no") return false;
    throw InvalidConfig(std::string(name) + " is not a boolean: " + v);
}

} // namespace

InstallStrategy install_strategy_from_string(const std::string& str) {
    if (str == "exec") return InstallStrategy::EXEC;
    if (str == "image-build" || str == "image_build") return InstallStrategy::IMAGE_BUILD;
    throw InvalidConfig("unknown install strategy '" + str + "'");
}

const char* install_strategy_to_string(InstallStrategy strategy) {
    switch (strategy) {
        case InstallStrategy::IMAGE_BUILD: return "image-build";
        default: return "exec";
    }
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig c;
    try {
        if (j.contains("docker_socket")) c.docker_socket = j["docker_socket"].get<std::string>();
        if (j.contains("api_version")) c.api_version = j["api_version"].get<std::string>();
        if (j.contains("workspace_root")) c.workspace_root = j["workspace_root"].get<std::string>();
        if (j.contains("scratch_dir")) c.scratch_dir = j["scratch_dir"].get<std::string>();
        if (j.contains("stop_timeout_sec")) c.stop_timeout_sec = j["stop_timeout_sec"].get<int>();
        if (j.contains("kill_grace_ms")) c.kill_grace_ms = j["kill_grace_ms"].get<int>();
        if (j.contains("image_remove_attempts")) {
            c.image_remove_attempts = j["image_remove_attempts"].get<int>();
        }
        if (j.contains("image_remove_backoff_ms")) {
            c.image_remove_backoff_ms = j["image_remove_backoff_ms"].get<int>();
        }
        if (j.contains("pull_missing_images")) {
            c.pull_missing_images = j["pull_missing_images"].get<bool>();
        }
        if (j.contains("install_strategy")) {
            c.install_strategy = install_strategy_from_string(j["install_strategy"].get<std::string>());
        }
        if (j.contains("max_output_bytes")) c.max_output_bytes = j["max_output_bytes"].get<size_t>();
        if (j.contains("max_events")) c.max_events = j["max_events"].get<size_t>();
    } catch (const json::exception& e) {
        throw InvalidConfig(std::string("invalid engine config: ") + e.what());
    }
    c.validate();
    return c;
}

json EngineConfig::to_json() const {
    json j;
    j["docker_socket"] = docker_socket;
    j["api_version"] = api_version;
    j["workspace_root"] = workspace_root;
    j["scratch_dir"] = scratch_dir;
    j["stop_timeout_sec"] = stop_timeout_sec;
    j["kill_grace_ms"] = kill_grace_ms;
    j["image_remove_attempts"] = image_remove_attempts;
    j["image_remove_backoff_ms"] = image_remove_backoff_ms;
    j["pull_missing_images"] = pull_missing_images;
    j["install_strategy"] = install_strategy_to_string(install_strategy);
    j["max_output_bytes"] = max_output_bytes;
    j["max_events"] = max_events;
    return j;
}

EngineConfig EngineConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidConfig("cannot open config file " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw InvalidConfig("cannot parse config file " + path + ": " + e.what());
    }
    spdlog::debug("Loaded engine config from {}", path);
    return from_json(j);
}

EngineConfig EngineConfig::from_env() {
    EngineConfig c;
    if (const char* path = env_or_null("SANDKIT_CONFIG")) {
        c = load_file(path);
    }
    c.apply_env();
    return c;
}

void EngineConfig::apply_env() {
    if (const char* host = env_or_null("DOCKER_HOST")) {
        std::string h = host;
        const std::string prefix = "unix://";
        if (h.rfind(prefix, 0) == 0) {
            docker_socket = h.substr(prefix.size());
        } else {
            spdlog::warn("DOCKER_HOST={} is not a unix socket; using {}", h, docker_socket);
        }
    }
    if (const char* sock = env_or_null("SANDKIT_DOCKER_SOCKET")) docker_socket = sock;
    if (const char* ver = env_or_null("SANDKIT_API_VERSION")) api_version = ver;
    if (const char* root = env_or_null("SANDKIT_WORKSPACE_ROOT")) workspace_root = root;
    if (const char* strategy = env_or_null("SANDKIT_INSTALL_STRATEGY")) {
        install_strategy = install_strategy_from_string(strategy);
    }
    stop_timeout_sec = env_int("SANDKIT_STOP_TIMEOUT_SEC", stop_timeout_sec);
    kill_grace_ms = env_int("SANDKIT_KILL_GRACE_MS", kill_grace_ms);
    pull_missing_images = env_bool("SANDKIT_PULL_MISSING_IMAGES", pull_missing_images);
    validate();
}

void EngineConfig::validate() const {
    if (docker_socket.empty()) {
        throw InvalidConfig("docker_socket must not be empty");
    }
    if (workspace_root.size() < 2 || workspace_root[0] != '/' ||
        workspace_root.find("..") != std::string::npos) {
        throw InvalidConfig("workspace_root must be an absolute path below /: " + workspace_root);
    }
    if (scratch_dir.empty() || scratch_dir[0] == '/' || scratch_dir.find('/') != std::string::npos ||
        scratch_dir == "." || scratch_dir == "..") {
        throw InvalidConfig("scratch_dir must be a single relative path component: " + scratch_dir);
    }
    if (stop_timeout_sec < 0) throw InvalidConfig("stop_timeout_sec must be >= 0");
    if (kill_grace_ms < 0) throw InvalidConfig("kill_grace_ms must be >= 0");
    if (image_remove_attempts < 1) throw InvalidConfig("image_remove_attempts must be >= 1");
    if (image_remove_backoff_ms < 0) throw InvalidConfig("image_remove_backoff_ms must be >= 0");
    if (max_output_bytes == 0) throw InvalidConfig("max_output_bytes must be > 0");
    if (max_events == 0) throw InvalidConfig("max_events must be > 0");
}

} // namespace sandkit::config
