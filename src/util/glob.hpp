#pragma once

#include <cstddef>
#include <string_view>

namespace util {

// '*' (any run) and '?' (one byte) inside a single path component.
inline bool component_match(std::string_view pattern, std::string_view name) noexcept {
    while (!pattern.empty()) {
        if (pattern.front() == '*') {
            while (!pattern.empty() && pattern.front() == '*') {
                pattern.remove_prefix(1);
            }
            if (pattern.empty()) {
                return true;
            }
            for (std::size_t skip = 0; skip <= name.size(); ++skip) {
                if (component_match(pattern, name.substr(skip))) {
                    return true;
                }
            }
            return false;
        }
        if (name.empty() || (pattern.front() != '?' && pattern.front() != name.front())) {
            return false;
        }
        pattern.remove_prefix(1);
        name.remove_prefix(1);
    }
    return name.empty();
}

// Matches '/'-separated paths one component at a time, so wildcards never
// cross a '/' and both sides need the same depth.
inline bool glob_match(std::string_view pattern, std::string_view path) noexcept {
    while (true) {
        const auto ps = pattern.find('/');
        const auto vs = path.find('/');
        if (!component_match(pattern.substr(0, ps), path.substr(0, vs))) {
            return false;
        }
        if (ps == std::string_view::npos || vs == std::string_view::npos) {
            return ps == vs;
        }
        pattern.remove_prefix(ps + 1);
        path.remove_prefix(vs + 1);
    }
}

// A pattern containing '/' is matched against the whole relative path,
// anything else against the last path component only.
inline bool path_glob_match(std::string_view pattern, std::string_view relative_path) noexcept {
    if (pattern.find('/') != std::string_view::npos) {
        return glob_match(pattern, relative_path);
    }
    const auto slash = relative_path.rfind('/');
    return component_match(pattern, slash == std::string_view::npos ? relative_path : relative_path.substr(slash + 1));
}

} // namespace util
