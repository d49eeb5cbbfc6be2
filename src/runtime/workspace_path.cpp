#include "runtime/workspace_path.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"
#include <sstream>
#include <vector>

namespace sandkit::runtime {

bool normalize_relative(const std::string& path, std::string& out) {
    std::vector<std::string> parts;
    std::istringstream in(path);
    std::string part;
    while (std::getline(in, part, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (parts.empty()) {
                return false;
            }
            parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }
    out = util::join(parts, "/");
    return true;
}

WorkspacePath resolve_workspace_path(const std::string& root, const std::string& path) {
    if (path.empty()) {
        throw InvalidPath(path, "empty path");
    }
    if (path.find('\0') != std::string::npos) {
        throw InvalidPath(path, "contains a NUL byte");
    }

    std::string root_norm;
    if (!normalize_relative(root, root_norm)) {
        throw InvalidConfig("workspace root escapes '/': " + root);
    }

    std::string candidate = path;
    if (path[0] == '/') {
        std::string abs_norm;
        if (!normalize_relative(path, abs_norm)) {
            throw InvalidPath(path);
        }
        bool inside = root_norm.empty() || abs_norm == root_norm ||
                      abs_norm.rfind(root_norm + "/", 0) == 0;
        if (!inside) {
            throw InvalidPath(path);
        }
        candidate = abs_norm.substr(root_norm.size());
    }

    std::string relative;
    if (!normalize_relative(candidate, relative)) {
        throw InvalidPath(path);
    }
    if (relative.empty()) {
        throw InvalidPath(path, "refers to the workspace root itself");
    }

    WorkspacePath resolved;
    resolved.relative = relative;
    resolved.absolute = (root_norm.empty() ? "" : "/" + root_norm) + "/" + relative;
    return resolved;
}

} // namespace sandkit::runtime
