#include "skytest/discovery.h"

#include "skytest/errors.h"

#include <algorithm>
#include <set>
#include <system_error>

namespace skytest {

namespace fs = std::filesystem;

namespace {

bool has_glob_chars(std::string_view s) { return s.find_first_of("*?[") != std::string_view::npos; }

bool is_hidden(const fs::path &p) {
    const std::string name = p.filename().string();
    return name.size() > 1 && name[0] == '.' && name != "..";
}

// Matches a `[...]` class starting at pattern[pi] (just after '['). Sets `next`
// to the index after ']'. Returns false on a malformed class.
bool match_class(std::string_view pattern, std::size_t pi, char ch, bool &matched, std::size_t &next) {
    bool negate = false;
    if (pi < pattern.size() && (pattern[pi] == '^' || pattern[pi] == '!')) {
        negate = true;
        ++pi;
    }
    bool        hit   = false;
    bool        first = true;
    while (pi < pattern.size() && (first || pattern[pi] != ']')) {
        first  = false;
        char lo = pattern[pi];
        if (lo == '\\' && pi + 1 < pattern.size())
            lo = pattern[++pi];
        char hi = lo;
        if (pi + 2 < pattern.size() && pattern[pi + 1] == '-' && pattern[pi + 2] != ']') {
            hi = pattern[pi + 2];
            pi += 2;
        }
        if (lo <= ch && ch <= hi)
            hit = true;
        ++pi;
    }
    if (pi >= pattern.size())
        return false;
    matched = hit != negate;
    next    = pi + 1;
    return true;
}

void glob_expand(const fs::path &base, const std::vector<std::string> &parts, std::size_t idx, std::vector<fs::path> &out) {
    if (idx == parts.size()) {
        std::error_code ec;
        if (fs::exists(base, ec))
            out.push_back(base);
        return;
    }
    const std::string &part = parts[idx];
    if (!has_glob_chars(part)) {
        glob_expand(base.empty() ? fs::path(part) : base / part, parts, idx + 1, out);
        return;
    }
    const fs::path  dir = base.empty() ? fs::path(".") : base;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return;
    std::vector<std::string> names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name[0] == '.' && part[0] != '.')
            continue;
        if (match_pattern(part, name))
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    for (const auto &name : names)
        glob_expand(base.empty() ? fs::path(name) : base / name, parts, idx + 1, out);
}

std::vector<fs::path> glob(std::string_view pattern) {
    const fs::path           p(pattern);
    std::vector<std::string> parts;
    fs::path                 base;
    if (p.has_root_path())
        base = p.root_path();
    for (const auto &comp : p.relative_path())
        parts.push_back(comp.string());
    std::vector<fs::path> out;
    glob_expand(base, parts, 0, out);
    return out;
}

} // namespace

const std::vector<std::string> &default_test_patterns() {
    static const std::vector<std::string> patterns{"*_test.star", "test_*.star"};
    return patterns;
}

bool match_pattern(std::string_view pattern, std::string_view name) {
    std::size_t ni = 0, pi = 0, star = std::string_view::npos, mark = 0;
    while (ni < name.size()) {
        if (pi < pattern.size()) {
            const char pc = pattern[pi];
            if (pc == '*') {
                star = pi++;
                mark = ni;
                continue;
            }
            if (pc == '[') {
                bool        matched = false;
                std::size_t next    = 0;
                if (match_class(pattern, pi + 1, name[ni], matched, next) && matched) {
                    pi = next;
                    ++ni;
                    continue;
                }
            } else if (pc == '?' || pc == name[ni]) {
                ++pi;
                ++ni;
                continue;
            } else if (pc == '\\' && pi + 1 < pattern.size() && pattern[pi + 1] == name[ni]) {
                pi += 2;
                ++ni;
                continue;
            }
        }
        if (star != std::string_view::npos) {
            pi = star + 1;
            ni = ++mark;
            continue;
        }
        return false;
    }
    while (pi < pattern.size() && pattern[pi] == '*')
        ++pi;
    return pi == pattern.size();
}

bool is_test_file(const fs::path &path, const std::vector<std::string> &patterns) {
    const auto       &pats = patterns.empty() ? default_test_patterns() : patterns;
    const std::string base = path.filename().string();
    return std::any_of(pats.begin(), pats.end(), [&](const std::string &p) { return match_pattern(p, base); });
}

PathKind classify_path(std::string_view path) {
    if (has_glob_chars(path))
        return PathKind::Glob;
    std::error_code ec;
    if (fs::is_directory(fs::path(path), ec))
        return PathKind::Dir;
    return PathKind::File;
}

std::vector<fs::path> discover_files(const fs::path &dir, const std::vector<std::string> &patterns, bool recursive) {
    std::vector<fs::path> files;
    std::error_code       ec;
    if (recursive) {
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            if (it->is_directory(ec)) {
                if (is_hidden(it->path()))
                    it.disable_recursion_pending();
                continue;
            }
            if (is_test_file(it->path(), patterns))
                files.push_back(it->path());
        }
    } else {
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_directory(ec) && is_test_file(it->path(), patterns))
                files.push_back(it->path());
        }
    }
    if (ec)
        throw FileError(dir.string(), ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> expand_paths(const std::vector<std::string> &paths, const std::vector<std::string> &patterns, bool recursive) {
    std::vector<fs::path> result;
    std::set<std::string> seen;
    auto                  add = [&](const fs::path &p) {
        if (seen.insert(p.lexically_normal().string()).second)
            result.push_back(p);
    };
    for (const auto &arg : paths) {
        switch (classify_path(arg)) {
        case PathKind::Glob:
            for (const auto &m : glob(arg))
                add(m);
            break;
        case PathKind::Dir:
            for (const auto &f : discover_files(arg, patterns, recursive))
                add(f);
            break;
        case PathKind::File: add(fs::path(arg)); break;
        }
    }
    if (result.empty())
        throw NoFilesFound();
    return result;
}

std::pair<std::string, std::string> split_test_selector(std::string_view arg) {
    const auto pos = arg.find("::");
    if (pos == std::string_view::npos)
        return {std::string(arg), std::string()};
    return {std::string(arg.substr(0, pos)), std::string(arg.substr(pos + 2))};
}

} // namespace skytest
