#include "text_diff.h"

#include <algorithm>
#include <fmt/format.h>

namespace skytest::detail {

namespace {

enum class Tag { Equal, Replace, Delete, Insert };

struct Opcode {
    Tag         tag;
    std::size_t i1, i2, j1, j2;
};

std::vector<Opcode> opcodes(const std::vector<std::string> &a, const std::vector<std::string> &b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    // lcs[i][j] = LCS length of a[i..] and b[j..]
    std::vector<std::vector<std::size_t>> lcs(n + 1, std::vector<std::size_t>(m + 1, 0));
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    std::vector<Opcode> out;
    auto                push = [&](Tag tag, std::size_t i1, std::size_t i2, std::size_t j1, std::size_t j2) {
        if (i1 == i2 && j1 == j2)
            return;
        if (!out.empty() && out.back().tag == tag) {
            out.back().i2 = i2;
            out.back().j2 = j2;
            return;
        }
        out.push_back(Opcode{tag, i1, i2, j1, j2});
    };

    std::size_t i = 0, j = 0, di = 0, dj = 0;
    auto        flush = [&] {
        if (di == i && dj == j)
            return;
        const Tag tag = (di == i) ? Tag::Insert : (dj == j) ? Tag::Delete : Tag::Replace;
        push(tag, di, i, dj, j);
    };
    while (i < n || j < m) {
        if (i < n && j < m && a[i] == b[j]) {
            flush();
            push(Tag::Equal, i, i + 1, j, j + 1);
            ++i;
            ++j;
            di = i;
            dj = j;
        } else if (j < m && (i == n || lcs[i][j + 1] >= lcs[i + 1][j])) {
            ++j;
        } else {
            ++i;
        }
    }
    flush();
    return out;
}

std::vector<std::vector<Opcode>> grouped(std::vector<Opcode> codes, std::size_t n) {
    if (codes.empty())
        codes.push_back(Opcode{Tag::Equal, 0, 1, 0, 1});
    if (codes.front().tag == Tag::Equal) {
        auto &c = codes.front();
        c.i1    = std::max(c.i1, c.i2 > n ? c.i2 - n : 0);
        c.j1    = std::max(c.j1, c.j2 > n ? c.j2 - n : 0);
    }
    if (codes.back().tag == Tag::Equal) {
        auto &c = codes.back();
        c.i2    = std::min(c.i2, c.i1 + n);
        c.j2    = std::min(c.j2, c.j1 + n);
    }

    std::vector<std::vector<Opcode>> groups;
    std::vector<Opcode>              group;
    for (auto c : codes) {
        if (c.tag == Tag::Equal && c.i2 - c.i1 > 2 * n) {
            group.push_back(Opcode{Tag::Equal, c.i1, std::min(c.i2, c.i1 + n), c.j1, std::min(c.j2, c.j1 + n)});
            groups.push_back(std::move(group));
            group.clear();
            c.i1 = std::max(c.i1, c.i2 - n);
            c.j1 = std::max(c.j1, c.j2 - n);
        }
        group.push_back(c);
    }
    if (!group.empty() && !(group.size() == 1 && group.front().tag == Tag::Equal))
        groups.push_back(std::move(group));
    return groups;
}

std::string format_range(std::size_t start, std::size_t stop) {
    std::size_t       beginning = start + 1;
    const std::size_t length    = stop - start;
    if (length == 1)
        return fmt::format("{}", beginning);
    if (length == 0)
        --beginning;
    return fmt::format("{},{}", beginning, length);
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t              start = 0;
    while (true) {
        const auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    lines.back().push_back('\n');
    return lines;
}

std::string unified_diff(std::string_view a, std::string_view b, std::string_view from_file, std::string_view to_file, std::size_t context) {
    const auto al = split_lines(a);
    const auto bl = split_lines(b);

    std::string out;
    bool        started = false;
    for (const auto &group : grouped(opcodes(al, bl), context)) {
        if (!started) {
            started = true;
            fmt::format_to(std::back_inserter(out), "--- {}\n+++ {}\n", from_file, to_file);
        }
        const auto &first = group.front();
        const auto &last  = group.back();
        fmt::format_to(std::back_inserter(out), "@@ -{} +{} @@\n", format_range(first.i1, last.i2), format_range(first.j1, last.j2));
        for (const auto &c : group) {
            if (c.tag == Tag::Equal) {
                for (std::size_t i = c.i1; i < c.i2; ++i)
                    out += " " + al[i];
                continue;
            }
            if (c.tag == Tag::Replace || c.tag == Tag::Delete) {
                for (std::size_t i = c.i1; i < c.i2; ++i)
                    out += "-" + al[i];
            }
            if (c.tag == Tag::Replace || c.tag == Tag::Insert) {
                for (std::size_t j = c.j1; j < c.j2; ++j)
                    out += "+" + bl[j];
            }
        }
    }
    return out;
}

} // namespace skytest::detail
