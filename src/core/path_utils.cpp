/**
 * @file path_utils.cpp
 * @brief Remote path helpers
 */

#include <ftp_bridge/core/path_utils.h>

namespace ftp_bridge::path_utils {

auto normalize(std::string_view path) -> std::string {
    std::string out;
    out.reserve(path.size());

    for (char c : path) {
        if (c == '\\') {
            c = '/';
        }
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }

    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

auto join(std::string_view dir, std::string_view name) -> std::string {
    auto base = normalize(dir);
    auto child = normalize(name);

    if (base.empty() || base == ".") {
        return child;
    }
    if (child.empty()) {
        return base;
    }
    if (child.front() == '/') {
        child.erase(0, 1);
    }
    if (base.back() == '/') {
        return base + child;
    }
    return base + "/" + child;
}

auto parent(std::string_view path) -> std::string {
    auto norm = normalize(path);
    auto pos = norm.find_last_of('/');
    if (pos == std::string::npos) {
        return {};
    }
    if (pos == 0) {
        return "/";
    }
    return norm.substr(0, pos);
}

auto basename(std::string_view path) -> std::string {
    auto norm = normalize(path);
    if (norm == "/") {
        return {};
    }
    auto pos = norm.find_last_of('/');
    if (pos == std::string::npos) {
        return norm;
    }
    return norm.substr(pos + 1);
}

auto is_directory_like(std::string_view raw_path) -> bool {
    if (raw_path.empty()) {
        return false;
    }
    auto last = raw_path.back();
    return last == '/' || last == '\\';
}

auto is_absolute(std::string_view path) -> bool {
    return !path.empty() && (path.front() == '/' || path.front() == '\\');
}

}  // namespace ftp_bridge::path_utils
