#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <nlohmann/json.hpp>
#include "config/engine_config.hpp"
#include "config/language_profile.hpp"
#include "runtime/sandbox.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Exit codes besides the guest's own
constexpr int EXIT_TIMEOUT = 124;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_ENGINE = 125;

struct CliArgs {
    std::string language;
    std::string source_file;                 // "-" = stdin
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<std::string> requirements;
    std::string preset = "small";
    std::string network = "none";
    std::optional<std::string> image;
    std::map<std::string, std::string> env;
    std::string config_file;
    std::string log_level = "warn";
    bool compliance = false;
    bool list_languages = false;
};

void print_usage(const char* prog) {
    fmt::print(stderr,
        "Usage: {} <language> <source-file|-> [options]\n"
        "\n"
        "Run a source file inside a fresh, network-isolated sandbox and print\n"
        "the execution result as JSON.\n"
        "\n"
        "Options:\n"
        "  --timeout S        Wall-clock limit in seconds (fractions allowed)\n"
        "  --require PKG      Install a package before running (repeatable)\n"
        "  --compliance       Probe requirements after installing them\n"
        "  --preset NAME      Resource preset (default: small)\n"
        "  --network MODE     none, bridge, host or a network name (default: none)\n"
        "  --image REF        Use REF instead of the language's base image\n"
        "  --env K=V          Environment variable for the run (repeatable)\n"
        "  --config FILE      Engine config JSON\n"
        "  --log-level L      trace, debug, info, warn, error (default: warn)\n"
        "  --languages        List supported languages and exit\n"
        "\n"
        "Exit status: the program's exit code, {} on timeout, {} on usage or\n"
        "configuration errors, {} when the sandbox itself failed.\n",
        prog, EXIT_TIMEOUT, EXIT_USAGE, EXIT_ENGINE);
}

// Returns an error message, empty on success
std::string parse_args(int argc, char** argv, CliArgs& args) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw sandkit::InvalidConfig(flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--timeout") {
            std::string v = value(arg);
            char* end = nullptr;
            double seconds = std::strtod(v.c_str(), &end);
            if (end == v.c_str() || *end != '\0') {
                return "invalid --timeout: " + v;
            }
            try {
                args.timeout = sandkit::runtime::timeout_from_seconds(seconds);
            } catch (const sandkit::InvalidConfig& e) {
                return "invalid --timeout " + v + ": " + e.what();
            }
        } else if (arg == "--require") {
            args.requirements.push_back(value(arg));
        } else if (arg == "--compliance") {
            args.compliance = true;
        } else if (arg == "--preset") {
            args.preset = value(arg);
        } else if (arg == "--network") {
            args.network = value(arg);
        } else if (arg == "--image") {
            args.image = value(arg);
        } else if (arg == "--env") {
            std::string kv = value(arg);
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                return "invalid --env (expected K=V): " + kv;
            }
            args.env[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg == "--config") {
            args.config_file = value(arg);
        } else if (arg == "--log-level") {
            args.log_level = value(arg);
        } else if (arg == "--languages") {
            args.list_languages = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            return "unknown option: " + arg;
        } else {
            positional.push_back(arg);
        }
    }

    if (args.list_languages) {
        return "";
    }
    if (positional.size() != 2) {
        return "expected <language> and <source-file>";
    }
    args.language = positional[0];
    args.source_file = positional[1];
    return "";
}

std::string read_source(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw sandkit::InvalidConfig("cannot open source file " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

int exit_code_for(const sandkit::SandboxError& e) {
    switch (e.kind()) {
        case sandkit::ErrorKind::UNSUPPORTED_LANGUAGE:
        case sandkit::ErrorKind::INVALID_CONFIG:
        case sandkit::ErrorKind::INVALID_PATH:
            return EXIT_USAGE;
        default:
            return EXIT_ENGINE;
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace sandkit;

    CliArgs args;
    std::string error;
    try {
        error = parse_args(argc, argv, args);
    } catch (const InvalidConfig& e) {
        error = e.what();
    }
    if (!error.empty()) {
        fmt::print(stderr, fmt::fg(fmt::color::red), "error: {}\n\n", error);
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    util::init_logger(util::log_level_from_string(args.log_level));

    if (args.list_languages) {
        for (const auto& name : config::list_languages()) {
            const auto& profile = config::resolve_profile(name);
            fmt::print("{:<10} {}\n", name, profile.base_image);
        }
        return 0;
    }

    try {
        runtime::SandboxOptions options;
        if (!args.config_file.empty()) {
            options.engine = config::EngineConfig::load_file(args.config_file);
            options.engine.apply_env();
        } else {
            options.engine = config::EngineConfig::from_env();
        }
        options.custom_image = args.image;
        options.requirements = args.requirements;
        options.network_mode = args.network;
        options.resource_preset = args.preset;
        options.check_compliance = args.compliance;

        std::string code = read_source(args.source_file);

        auto sandbox = runtime::create_sandbox(args.language, options);
        auto result = sandbox->run_code(code, args.env, args.timeout);
        auto compliance = sandbox->compliance_report();
        std::string sandbox_id = sandbox->id();
        sandbox->close();

        nlohmann::json out = result.to_json();
        out["sandbox"] = sandbox_id;
        if (compliance) {
            out["compliance"] = compliance->to_json();
        }
        auto diagnostics = sandbox->diagnostics();
        if (!diagnostics.empty()) {
            nlohmann::json diag = nlohmann::json::array();
            for (const auto& entry : diagnostics) {
                diag.push_back(entry.to_json());
            }
            out["diagnostics"] = diag;
        }
        std::cout << out.dump(2) << std::endl;

        if (result.timed_out) {
            fmt::print(stderr, fmt::fg(fmt::color::yellow), "timed out after {}ms\n", result.elapsed.count());
            return EXIT_TIMEOUT;
        }
        return result.exit_code;
    } catch (const RequirementsInstallFailed& e) {
        fmt::print(stderr, fmt::fg(fmt::color::red), "{}: {}\n", error_kind_to_string(e.kind()), e.what());
        if (!e.output().empty()) {
            fmt::print(stderr, "{}\n", e.output());
        }
        return exit_code_for(e);
    } catch (const SandboxError& e) {
        fmt::print(stderr, fmt::fg(fmt::color::red), "{}: {}\n", error_kind_to_string(e.kind()), e.what());
        return exit_code_for(e);
    }
}
