#include "util/strings.hpp"
#include <sstream>

namespace sandkit::util {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

std::string dedent(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    // Find the longest common leading whitespace of non-blank lines
    bool have_prefix = false;
    std::string prefix;
    for (const auto& l : lines) {
        size_t first = l.find_first_not_of(" \t");
        if (first == std::string::npos) continue;  // blank
        std::string lead = l.substr(0, first);
        if (!have_prefix) {
            prefix = lead;
            have_prefix = true;
            continue;
        }
        size_t n = 0;
        while (n < prefix.size() && n < lead.size() && prefix[n] == lead[n]) n++;
        prefix.resize(n);
    }

    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& l = lines[i];
        if (l.find_first_not_of(" \t") == std::string::npos) {
            // Whitespace-only lines are normalized to empty
        } else {
            out << l.substr(prefix.size());
        }
        if (i + 1 < lines.size()) out << '\n';
    }
    if (!text.empty() && text.back() == '\n') out << '\n';
    return out.str();
}

std::string tail(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    return "..." + s.substr(s.size() - max_bytes);
}

std::string short_id(const std::string& id) {
    // Image ids carry a "sha256:" prefix
    std::string bare = id.rfind("sha256:", 0) == 0 ? id.substr(7) : id;
    return bare.substr(0, 12);
}

} // namespace sandkit::util
