#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace linksim {

inline std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Case-insensitive membership. An empty list matches everything.
inline bool matchesAnyIgnoreCase(const std::string& value,
                                 const std::vector<std::string>& allowed) {
    if (allowed.empty()) return true;
    std::string v = toLower(value);
    for (const auto& a : allowed) {
        if (toLower(a) == v) return true;
    }
    return false;
}

} // namespace linksim
