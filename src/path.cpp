// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file path.cpp
 * @brief Lexical path helpers
 */

#include <parcp/path.hpp>

#include <vector>

namespace parcp::path {

std::string clean(std::string_view p) {
    if (p.empty()) return ".";

    const bool rooted = p.front() == '/';
    std::vector<std::string_view> parts;

    size_t pos = 0;
    while (pos <= p.size()) {
        size_t next = p.find('/', pos);
        if (next == std::string_view::npos) next = p.size();
        std::string_view seg = p.substr(pos, next - pos);
        pos = next + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(seg);
            }
            continue;
        }
        parts.push_back(seg);
    }

    std::string out;
    if (rooted) out += '/';
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += '/';
        out += parts[i];
    }
    if (out.empty()) out = ".";
    return out;
}

std::string join(std::string_view dir, std::string_view name) {
    if (name.empty()) return clean(dir);
    if (dir.empty()) return clean(name);
    std::string s(dir);
    s += '/';
    s += name;
    return clean(s);
}

std::string parent(std::string_view p) {
    std::string c = clean(p);
    size_t slash = c.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return c.substr(0, slash);
}

std::string relative(std::string_view root, std::string_view p) {
    // A root of "." has no prefix in front of its children.
    if (root == ".") return p == "." ? std::string() : std::string(p);
    if (p.size() <= root.size()) return {};
    std::string_view suffix = p.substr(root.size());
    while (!suffix.empty() && suffix.front() == '/') suffix.remove_prefix(1);
    return std::string(suffix);
}

bool is_within(std::string_view child, std::string_view ancestor) {
    std::string c = clean(child);
    std::string a = clean(ancestor);
    if (c == a) return false;

    if (a == "/") return c.front() == '/';
    if (a == ".") return c.front() != '/' && c != ".." && c.rfind("../", 0) != 0;

    return c.size() > a.size() && c.compare(0, a.size(), a) == 0 && c[a.size()] == '/';
}

} // namespace parcp::path
