/**
 * Language Profile Registry
 *
 * Static, closed set of per-language execution profiles. Adding a language
 * means adding a registry entry in language_profile.cpp.
 */
#pragma once
#include <string>
#include <vector>

namespace sandkit::config {

struct LanguageProfile {
    std::string name;                      // Canonical name ("python", "node")
    std::string base_image;                // Default image reference
    std::string source_extension;          // Including the dot
    std::vector<std::string> install_prefix;   // Package manager argv, requirements appended
    std::vector<std::string> install_extras;   // Packages always installed with the requirements
    std::vector<std::string> run_prefix;       // Interpreter argv, source path appended
    std::vector<std::string> probe_prefix;     // Compliance probe argv, requirement appended
    bool dedent_source = false;            // Strip common indentation before running

    // Package manager invocation for a requirement set
    std::vector<std::string> install_command(const std::vector<std::string>& requirements) const;

    // Command that runs a materialized source file
    std::vector<std::string> run_command(const std::string& source_path) const;

    // Command exiting 0 iff the requirement is usable inside the environment
    std::vector<std::string> probe_command(const std::string& requirement) const;

    // Dockerfile deriving an image with the requirements preinstalled
    std::string dockerfile(const std::string& image,
                           const std::vector<std::string>& requirements) const;
};

// Look up a profile by name or alias (case-insensitive).
// Throws UnsupportedLanguage for unknown names.
const LanguageProfile& resolve_profile(const std::string& language);

bool is_supported_language(const std::string& language);

// Canonical names of every registered language, sorted
std::vector<std::string> list_languages();

} // namespace sandkit::config
