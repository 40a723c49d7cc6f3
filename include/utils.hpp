#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace http_resilience {
namespace util {

inline std::string toupper(const std::string& str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'a' && c <= 'z')
            c -= 32;
    return s;
}

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x += 32;
        if (y >= 'A' && y <= 'Z') y += 32;
        if (x != y) return false;
    }
    return true;
}

inline std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r' || sv.front() == '\n'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
        sv.remove_suffix(1);
    return sv;
}

/**
 * Split a raw "Name: value" header line.
 * Returns false when the line carries no colon.
 */
inline bool splitHeader(std::string_view line, std::string_view& name, std::string_view& value) {
    auto pos = line.find(':');
    if (pos == std::string_view::npos) return false;
    name = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));
    return true;
}

/**
 * First value of a header in "Name: value" form, name compared case-insensitively.
 */
inline std::optional<std::string> headerValue(const std::vector<std::string>& headers, std::string_view name) {
    for (const auto& h : headers) {
        std::string_view k, v;
        if (splitHeader(h, k, v) && iequals(k, name))
            return std::string(v);
    }
    return std::nullopt;
}

/**
 * Comma-separated directives of a Cache-Control (or Pragma) value, trimmed.
 */
inline std::vector<std::string> directives(std::string_view value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string_view::npos) end = value.size();
        auto d = trim(value.substr(start, end - start));
        if (!d.empty()) out.emplace_back(d);
        start = end + 1;
    }
    return out;
}

inline bool hasDirective(const std::optional<std::string>& value, std::string_view directive) {
    if (!value) return false;
    for (const auto& d : directives(*value))
        if (iequals(d, directive)) return true;
    return false;
}

/**
 * Uniform jitter sample in [-1, 1].
 */
inline double uniform_jitter() {
    thread_local std::mt19937_64 rg{
        [] {
            std::random_device rd;
            std::seed_seq seq{
                rd(), rd(), rd(), rd(),
                static_cast<unsigned>(
                    std::hash<std::thread::id>{}(std::this_thread::get_id()))
            };
            return std::mt19937_64(seq);
        }()
    };
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return dist(rg);
}

} // namespace util
} // namespace http_resilience
