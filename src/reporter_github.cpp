#include "skytest/reporter.h"

#include <fmt/format.h>

namespace skytest {

using detail::gha_escape;

namespace {

// Starlark tracebacks are not available across the engine boundary, so
// annotations point at the first line of the file.
void annotate(std::ostream &out, std::string_view file, std::string_view title, std::string_view message) {
    out << fmt::format("::error file={},line={},title={}::{}\n", file, 1, gha_escape(title), gha_escape(message));
}

} // namespace

void GitHubReporter::report_file(std::ostream &out, const FileResult &result) const {
    if (result.setup_error)
        annotate(out, result.file, "setup_file", *result.setup_error);
    for (const auto &t : result.tests) {
        if (t.xpass)
            annotate(out, result.file, t.name, t.xfail_reason.empty() ? "XPASS" : "XPASS: " + t.xfail_reason);
        else if (t.failed())
            annotate(out, result.file, t.name, t.error ? t.error->message : "failure (no details)");
    }
    if (result.teardown_error)
        annotate(out, result.file, "teardown_file", *result.teardown_error);
}

void GitHubReporter::report_summary(std::ostream &out, const RunResult &result) const {
    const Summary s = result.summary();
    if (s.failed > 0 || result.has_failures())
        out << fmt::format("::notice title=skytest::{} passed, {} failed, {} skipped\n", s.passed, s.failed, s.skipped);
}

} // namespace skytest
