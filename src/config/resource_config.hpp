/**
 * Resource Config Resolver
 *
 * Turns a named preset plus optional overrides into the concrete limits
 * requested from the container runtime at creation time.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sandkit::config {

constexpr int64_t DEFAULT_CPU_PERIOD = 100000;   // 100ms
constexpr int64_t DEFAULT_PIDS_LIMIT = 256;
constexpr int64_t MIN_MEMORY_BYTES = 6 * 1024 * 1024;  // Runtime refuses less
constexpr int64_t MIN_CPU_PERIOD = 1000;
constexpr int64_t MAX_CPU_PERIOD = 1000000;
constexpr int64_t MIN_CPU_QUOTA = 1000;

// Limits applied atomically when the environment is created
struct ResourceConfig {
    int64_t memory_limit_bytes = 512LL * 1024 * 1024;
    int64_t cpu_period_us = DEFAULT_CPU_PERIOD;
    int64_t cpu_quota_us = 50000;
    int64_t pids_limit = DEFAULT_PIDS_LIMIT;
    std::string network_mode = "none";

    nlohmann::json to_json() const;
};

// Explicit overrides applied on top of a preset
struct ResourceOverrides {
    std::optional<std::string> memory;     // "256m", "2g", "1048576"
    std::optional<int64_t> cpu_period_us;
    std::optional<int64_t> cpu_quota_us;
    std::optional<int64_t> pids_limit;
    std::optional<std::string> network_mode;

    bool empty() const;

    // Keys: memory, cpu_period, cpu_quota, pids_limit, network_mode
    static ResourceOverrides from_json(const nlohmann::json& j);
};

// What the host can actually grant
struct HostCapacity {
    int64_t memory_bytes = 0;
    int64_t cpu_count = 0;

    // Read from sysconf()
    static HostCapacity detect();

    // 99% of physical memory
    int64_t max_memory() const;
    // 99% of online_cpus * DEFAULT_CPU_PERIOD
    int64_t max_cpu_quota() const;
};

struct ResourcePreset {
    std::string name;
    std::string memory;
    int64_t cpu_quota_us;
};

// Parse "512m"/"1g"/"64k"/"1048576" into bytes (1024-based).
// Throws InvalidConfig on anything else.
int64_t parse_memory_limit(const std::string& text);

// Every preset, smallest first
const std::vector<ResourcePreset>& resource_presets();

// Presets that fit the host, smallest first
std::vector<std::string> available_presets(const HostCapacity& host = HostCapacity::detect());

// Largest preset that fits the host; empty if none does
std::string largest_available_preset(const HostCapacity& host = HostCapacity::detect());

// Throws InvalidConfig for unknown presets and out-of-range values
ResourceConfig resolve_resources(const std::string& preset,
                                 const ResourceOverrides& overrides = {},
                                 const HostCapacity& host = HostCapacity::detect());

// Accepts none, bridge, host and user-defined network names
bool is_valid_network_mode(const std::string& mode);

} // namespace sandkit::config
