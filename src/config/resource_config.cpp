#include "config/resource_config.hpp"
#include "util/errors.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdint>
#include <limits>
#include <unistd.h>

namespace sandkit::config {

namespace {

const std::vector<ResourcePreset> PRESETS = {
    {"tiny",    "128m", 25000},
    {"small",   "512m", 50000},
    {"medium",  "1g",   75000},
    {"large",   "2g",   100000},
    {"xlarge",  "4g",   150000},
    {"2xlarge", "8g",   200000},
    {"4xlarge", "16g",  300000},
    {"8xlarge", "32g",  400000},
};

bool preset_fits(const ResourcePreset& preset, const HostCapacity& host) {
    return parse_memory_limit(preset.memory) <= host.max_memory() &&
           preset.cpu_quota_us <= host.max_cpu_quota();
}

} // namespace

nlohmann::json ResourceConfig::to_json() const {
    nlohmann::json j;
    j["memory_limit_bytes"] = memory_limit_bytes;
    j["cpu_period_us"] = cpu_period_us;
    j["cpu_quota_us"] = cpu_quota_us;
    j["pids_limit"] = pids_limit;
    j["network_mode"] = network_mode;
    return j;
}

bool ResourceOverrides::empty() const {
    return !memory && !cpu_period_us && !cpu_quota_us && !pids_limit && !network_mode;
}

ResourceOverrides ResourceOverrides::from_json(const nlohmann::json& j) {
    ResourceOverrides o;
    try {
        if (j.contains("memory")) {
            // Accept both "512m" and a raw byte count
            if (j["memory"].is_string()) {
                o.memory = j["memory"].get<std::string>();
            } else {
                o.memory = std::to_string(j["memory"].get<int64_t>());
            }
        }
        if (j.contains("cpu_period")) o.cpu_period_us = j["cpu_period"].get<int64_t>();
        if (j.contains("cpu_quota")) o.cpu_quota_us = j["cpu_quota"].get<int64_t>();
        if (j.contains("pids_limit")) o.pids_limit = j["pids_limit"].get<int64_t>();
        if (j.contains("network_mode")) o.network_mode = j["network_mode"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfig(std::string("invalid resource overrides: ") + e.what());
    }
    return o;
}

HostCapacity HostCapacity::detect() {
    HostCapacity host;
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGESIZE);
    long cpus = sysconf(_SC_NPROCESSORS_ONLN);
    if (pages > 0 && page_size > 0) {
        host.memory_bytes = static_cast<int64_t>(pages) * page_size;
    }
    host.cpu_count = cpus > 0 ? cpus : 1;
    return host;
}

int64_t HostCapacity::max_memory() const {
    return static_cast<int64_t>(static_cast<double>(memory_bytes) * 0.99);
}

int64_t HostCapacity::max_cpu_quota() const {
    return static_cast<int64_t>(static_cast<double>(cpu_count * DEFAULT_CPU_PERIOD) * 0.99);
}

int64_t parse_memory_limit(const std::string& text) {
    if (text.empty()) {
        throw InvalidConfig("empty memory limit");
    }

    int64_t multiplier = 1;
    std::string digits = text;
    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
    if (!std::isdigit(static_cast<unsigned char>(unit))) {
        switch (unit) {
            case 'k': multiplier = 1024LL; break;
            case 'm': multiplier = 1024LL * 1024; break;
            case 'g': multiplier = 1024LL * 1024 * 1024; break;
            default:
                throw InvalidConfig(fmt::format("unknown memory unit in '{}'", text));
        }
        digits = text.substr(0, text.size() - 1);
    }

    if (digits.empty() || digits.size() > 15) {
        throw InvalidConfig(fmt::format("invalid memory limit '{}'", text));
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidConfig(fmt::format("invalid memory limit '{}'", text));
        }
    }
    const int64_t value = std::stoll(digits);
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        throw InvalidConfig(fmt::format("memory limit '{}' is out of range", text));
    }
    return value * multiplier;
}

const std::vector<ResourcePreset>& resource_presets() {
    return PRESETS;
}

std::vector<std::string> available_presets(const HostCapacity& host) {
    std::vector<std::string> names;
    for (const auto& preset : PRESETS) {
        // Presets grow monotonically; stop at the first that doesn't fit
        if (!preset_fits(preset, host)) break;
        names.push_back(preset.name);
    }
    return names;
}

std::string largest_available_preset(const HostCapacity& host) {
    auto names = available_presets(host);
    return names.empty() ? std::string() : names.back();
}

bool is_valid_network_mode(const std::string& mode) {
    if (mode.empty() || mode.size() > 128) return false;
    // container:<id> would join another container's network namespace
    if (mode.rfind("container:", 0) == 0) return false;
    for (char c : mode) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

ResourceConfig resolve_resources(const std::string& preset,
                                 const ResourceOverrides& overrides,
                                 const HostCapacity& host) {
    const ResourcePreset* found = nullptr;
    for (const auto& p : PRESETS) {
        if (p.name == preset) {
            found = &p;
            break;
        }
    }
    if (!found) {
        throw InvalidConfig(fmt::format("unknown resource preset '{}'", preset));
    }

    ResourceConfig rc;
    rc.memory_limit_bytes = parse_memory_limit(found->memory);
    rc.cpu_quota_us = found->cpu_quota_us;

    if (overrides.memory) rc.memory_limit_bytes = parse_memory_limit(*overrides.memory);
    if (overrides.cpu_period_us) rc.cpu_period_us = *overrides.cpu_period_us;
    if (overrides.cpu_quota_us) rc.cpu_quota_us = *overrides.cpu_quota_us;
    if (overrides.pids_limit) rc.pids_limit = *overrides.pids_limit;
    if (overrides.network_mode) rc.network_mode = *overrides.network_mode;

    if (rc.memory_limit_bytes < MIN_MEMORY_BYTES) {
        throw InvalidConfig(fmt::format("memory limit {} below minimum {}",
                                        rc.memory_limit_bytes, MIN_MEMORY_BYTES));
    }
    if (rc.memory_limit_bytes > host.max_memory()) {
        throw InvalidConfig(fmt::format("memory limit {} exceeds host capacity {}",
                                        rc.memory_limit_bytes, host.max_memory()));
    }
    if (rc.cpu_period_us < MIN_CPU_PERIOD || rc.cpu_period_us > MAX_CPU_PERIOD) {
        throw InvalidConfig(fmt::format("cpu period {} outside [{}, {}]",
                                        rc.cpu_period_us, MIN_CPU_PERIOD, MAX_CPU_PERIOD));
    }
    if (rc.cpu_quota_us < MIN_CPU_QUOTA) {
        throw InvalidConfig(fmt::format("cpu quota {} below minimum {}",
                                        rc.cpu_quota_us, MIN_CPU_QUOTA));
    }
    // Compare the effective CPU share, not the raw quota, so a custom period is judged fairly
    double cpus_requested = static_cast<double>(rc.cpu_quota_us) / static_cast<double>(rc.cpu_period_us);
    double cpus_allowed = static_cast<double>(host.max_cpu_quota()) / DEFAULT_CPU_PERIOD;
    if (cpus_requested > cpus_allowed) {
        throw InvalidConfig(fmt::format("cpu quota {}/{} exceeds host capacity ({:.2f} cpus)",
                                        rc.cpu_quota_us, rc.cpu_period_us, cpus_allowed));
    }
    if (rc.pids_limit < 1) {
        throw InvalidConfig(fmt::format("pids limit {} must be positive", rc.pids_limit));
    }
    if (!is_valid_network_mode(rc.network_mode)) {
        throw InvalidConfig(fmt::format("invalid network mode '{}'", rc.network_mode));
    }

    spdlog::debug("Resolved preset {}: memory={} cpu={}/{} pids={} network={}",
                  preset, rc.memory_limit_bytes, rc.cpu_quota_us, rc.cpu_period_us,
                  rc.pids_limit, rc.network_mode);
    return rc;
}

} // namespace sandkit::config
