/**
 * Workspace-scoped path resolution
 *
 * Caller paths are interpreted relative to the workspace root and
 * normalized lexically. Anything that would leave the root is rejected
 * with InvalidPath before a request reaches the environment.
 */
#pragma once
#include <string>

namespace sandkit::runtime {

struct WorkspacePath {
    std::string relative;   // "a/b/c.txt", never empty, no "." or ".." parts
    std::string absolute;   // "/workspace/a/b/c.txt"
};

// Lexically normalize path against root. Absolute paths are accepted only
// when they already lie inside root. Throws InvalidPath for empty paths,
// NUL bytes, escapes via "..", and the root itself.
WorkspacePath resolve_workspace_path(const std::string& root, const std::string& path);

// Collapse "//", "." and ".." in a relative path; returns false if ".."
// climbs above the start
bool normalize_relative(const std::string& path, std::string& out);

} // namespace sandkit::runtime
