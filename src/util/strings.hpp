#pragma once
#include <string>
#include <vector>

namespace sandkit::util {

std::string trim(const std::string& s);

std::string join(const std::vector<std::string>& items, const std::string& delimiter);

// Remove the whitespace prefix common to every non-blank line.
// Blank lines do not count towards the common prefix.
std::string dedent(const std::string& text);

// Keep at most max_bytes from the end of s (for error messages built
// from long command output)
std::string tail(const std::string& s, size_t max_bytes);

// First 12 characters of a container/image/exec id, for log lines
std::string short_id(const std::string& id);

} // namespace sandkit::util
