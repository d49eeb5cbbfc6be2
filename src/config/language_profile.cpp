#include "config/language_profile.hpp"
#include "util/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace sandkit::config {

namespace {

// argv[1]: requirement spec such as "numpy", "numpy>=1.20", "requests[socks]==2.31"
// Exit 0 = installed and satisfies the specifier, 1 = missing/conflict, 2 = unparsable
const char* PYTHON_PROBE = R"PY(
import re, sys
from importlib import metadata
spec = sys.argv[1].strip()
m = re.match(r"[A-Za-z0-9][A-Za-z0-9._-]*", spec)
if not m:
    sys.exit(2)
try:
    installed = metadata.version(m.group(0))
except metadata.PackageNotFoundError:
    sys.exit(1)
rest = spec[m.end():].strip()
if rest.startswith("["):
    rest = rest[rest.find("]") + 1:].strip()
rest = rest.split(";")[0].strip()
if not rest:
    sys.exit(0)
try:
    from packaging.specifiers import SpecifierSet
    from packaging.version import Version
except ImportError:
    sys.exit(0)
try:
    sys.exit(0 if SpecifierSet(rest).contains(Version(installed)) else 1)
except Exception:
    sys.exit(2)
)PY";

// argv[1]: "lodash", "lodash@4.17.21", "@scope/pkg@1.0.0"
const char* NODE_PROBE = R"JS(
const spec = process.argv[1].trim();
const at = spec.indexOf('@', 1);
const name = at > 0 ? spec.slice(0, at) : spec;
const wanted = at > 0 ? spec.slice(at + 1) : '';
let pkg;
try {
  pkg = require(require.resolve(name + '/package.json', { paths: [process.cwd()] }));
} catch (e) {
  process.exit(1);
}
if (wanted && wanted !== 'latest' && /^\d/.test(wanted) && pkg.version !== wanted) {
  process.exit(1);
}
process.exit(0);
)JS";

struct Registry {
    std::map<std::string, LanguageProfile> profiles;
    std::map<std::string, std::string> aliases;

    Registry() {
        LanguageProfile python;
        python.name = "python";
        python.base_image = "python:3.9-slim";
        python.source_extension = ".py";
        python.install_prefix = {"pip", "install", "--no-cache-dir", "--disable-pip-version-check"};
        python.install_extras = {"packaging"};  // Needed by the probe's specifier checks
        python.run_prefix = {"python", "-u"};
        python.probe_prefix = {"python", "-c", PYTHON_PROBE};
        python.dedent_source = true;
        profiles[python.name] = python;

        LanguageProfile node;
        node.name = "node";
        node.base_image = "node:lts-slim";
        node.source_extension = ".js";
        node.install_prefix = {"npm", "install", "--no-audit", "--no-fund", "--loglevel=error"};
        node.run_prefix = {"node"};
        node.probe_prefix = {"node", "-e", NODE_PROBE};
        profiles[node.name] = node;

        aliases = {
            {"python", "python"}, {"python3", "python"}, {"py", "python"},
            {"node", "node"}, {"nodejs", "node"}, {"javascript", "node"}, {"js", "node"},
        };
    }
};

const Registry& registry() {
    static const Registry instance;
    return instance;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::vector<std::string> LanguageProfile::install_command(
    const std::vector<std::string>& requirements) const {
    std::vector<std::string> argv = install_prefix;
    argv.insert(argv.end(), requirements.begin(), requirements.end());
    for (const auto& extra : install_extras) {
        if (std::find(requirements.begin(), requirements.end(), extra) == requirements.end()) {
            argv.push_back(extra);
        }
    }
    return argv;
}

std::vector<std::string> LanguageProfile::run_command(const std::string& source_path) const {
    std::vector<std::string> argv = run_prefix;
    argv.push_back(source_path);
    return argv;
}

std::vector<std::string> LanguageProfile::probe_command(const std::string& requirement) const {
    std::vector<std::string> argv = probe_prefix;
    argv.push_back(requirement);
    return argv;
}

std::string LanguageProfile::dockerfile(const std::string& image,
                                        const std::vector<std::string>& requirements) const {
    // Exec form: each requirement stays a single argument
    nlohmann::json run = install_command(requirements);
    return "FROM " + image + "\nRUN " + run.dump() + "\n";
}

const LanguageProfile& resolve_profile(const std::string& language) {
    const auto& reg = registry();
    auto alias = reg.aliases.find(lowercase(language));
    if (alias == reg.aliases.end()) {
        throw UnsupportedLanguage(language);
    }
    return reg.profiles.at(alias->second);
}

bool is_supported_language(const std::string& language) {
    return registry().aliases.count(lowercase(language)) > 0;
}

std::vector<std::string> list_languages() {
    std::vector<std::string> names;
    for (const auto& [name, _] : registry().profiles) {
        names.push_back(name);
    }
    return names;
}

} // namespace sandkit::config
