#include "runner_selector.h"

#include <algorithm>

namespace skytest::runner {

namespace {

char lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

std::string_view trim(std::string_view s) {
    while (!s.empty() && s.front() == ' ')
        s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ')
        s.remove_suffix(1);
    return s;
}

// Strips a case-insensitive "not " prefix.
bool strip_not(std::string_view &filter) {
    if (filter.size() >= 4 && iequals(filter.substr(0, 4), "not ")) {
        filter = trim(filter.substr(4));
        return true;
    }
    return false;
}

} // namespace

bool iequals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (lower(lhs[i]) != lower(rhs[i]))
            return false;
    }
    return true;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty())
        return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return lower(a) == lower(b); });
    return it != haystack.end();
}

bool matches_marker_filter(const TestMeta &meta, std::string_view filter) {
    filter = trim(filter);
    if (filter.empty())
        return true;
    const bool negate = strip_not(filter);
    const bool has    = std::any_of(meta.markers.begin(), meta.markers.end(), [&](const std::string &m) { return iequals(m, filter); });
    return negate ? !has : has;
}

bool matches_name_filter(std::string_view name, std::string_view base_name, const Options &opts) {
    if (!opts.test_names.empty()) {
        return std::any_of(opts.test_names.begin(), opts.test_names.end(),
                           [&](const std::string &allowed) { return allowed == name || allowed == base_name; });
    }
    std::string_view filter = opts.filter;
    if (filter.empty())
        return true;
    const bool negate  = strip_not(filter);
    const bool matches = icontains(name, filter);
    return negate ? !matches : matches;
}

} // namespace skytest::runner
