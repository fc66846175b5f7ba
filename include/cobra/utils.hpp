#ifndef COBRA_UTILS_HPP
#define COBRA_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace cobra::utils {

inline std::string padEnd(std::string s, std::size_t width) {
    if (s.size() < width) s.append(width - s.size(), ' ');
    return s;
}

// Name part of a use string: "serve [port]" -> "serve". A use starting with whitespace is kept whole.
inline std::string firstWord(std::string_view use) {
    const auto idx = use.find_first_of(" \t\n");
    if (idx == std::string_view::npos || idx == 0) return std::string(use);
    return std::string(use.substr(0, idx));
}

// Ordering for help listings: case-insensitive first ("alpha" < "Zeta"); names differing only in case put the
// lowercase letter first ("a" < "A").
inline bool collateLess(std::string_view a, std::string_view b) {
    const auto lower = [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); };
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const char x = lower(a[i]);
        const char y = lower(b[i]);
        if (x != y) return static_cast<unsigned char>(x) < static_cast<unsigned char>(y);
    }
    if (a.size() != b.size()) return a.size() < b.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) return std::islower(static_cast<unsigned char>(a[i])) != 0;
    }
    return false;
}

} // namespace cobra::utils

#endif // COBRA_UTILS_HPP
