#include "skytest/reporter.h"

#include <fmt/format.h>

namespace skytest {

void MarkdownReporter::report_summary(std::ostream &out, const RunResult &result) const {
    const Summary s = result.summary();

    out << "## Test Results\n\n";
    out << fmt::format("**{} tests** in {} files completed in **{} ms**\n\n", s.passed + s.failed, result.files.size(),
                       to_millis(result.duration));
    out << "| Status | Count |\n";
    out << "|--------|-------|\n";
    out << fmt::format("| Passed | {} |\n", s.passed);
    out << fmt::format("| Failed | {} |\n", s.failed);
    out << fmt::format("| Skipped | {} |\n", s.skipped);
    if (s.xfail != 0 || s.xpass != 0) {
        out << fmt::format("| XFail | {} |\n", s.xfail);
        out << fmt::format("| XPass | {} |\n", s.xpass);
    }
    out << '\n';

    bool any_file_error = false;
    for (const auto &f : result.files)
        any_file_error = any_file_error || f.setup_error || f.teardown_error;

    if (s.failed > 0 || any_file_error) {
        out << "### Failed Tests\n\n";
        auto details = [&](const std::string &file, std::string_view name, std::string_view message) {
            out << "<details>\n";
            out << fmt::format("<summary><code>{}::{}</code></summary>\n\n", file, name);
            out << "```\n" << message;
            if (!message.empty() && message.back() != '\n')
                out << '\n';
            out << "```\n\n</details>\n\n";
        };
        for (const auto &f : result.files) {
            if (f.setup_error)
                details(f.file, "setup_file", *f.setup_error);
            for (const auto &t : f.tests) {
                if (!t.failed())
                    continue;
                details(f.file, t.name, t.error ? std::string_view(t.error->message) : std::string_view("unexpected pass (xpass)"));
            }
            if (f.teardown_error)
                details(f.file, "teardown_file", *f.teardown_error);
        }
    }

    if (s.skipped > 0) {
        out << "### Skipped Tests\n\n";
        for (const auto &f : result.files) {
            for (const auto &t : f.tests) {
                if (!t.skipped)
                    continue;
                if (!t.skip_reason.empty())
                    out << fmt::format("- `{}::{}` - {}\n", f.file, t.name, t.skip_reason);
                else
                    out << fmt::format("- `{}::{}`\n", f.file, t.name);
            }
        }
        out << '\n';
    }
}

} // namespace skytest
