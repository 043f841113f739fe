#include "skytest/reporter.h"

#include <fmt/format.h>

namespace skytest {

using detail::escape_cdata;
using detail::escape_xml;

namespace {

double seconds(Duration d) { return std::chrono::duration<double>(d).count(); }

void write_error_case(std::ostream &out, const FileResult &f, std::string_view name, std::string_view type, const std::string &message) {
    out << fmt::format("    <testcase name=\"{}\" classname=\"{}\" time=\"0\">\n", name, escape_xml(f.file));
    out << fmt::format("      <error message=\"{}\" type=\"{}\"><![CDATA[{}]]></error>\n", escape_xml(message), type,
                       escape_cdata(message));
    out << "    </testcase>\n";
}

} // namespace

void JUnitReporter::report_summary(std::ostream &out, const RunResult &result) const {
    std::size_t total_tests  = 0;
    std::size_t total_errors = 0;
    for (const auto &f : result.files) {
        total_tests += f.tests.size();
        total_errors += (f.setup_error ? 1 : 0) + (f.teardown_error ? 1 : 0);
    }

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << fmt::format("<testsuites tests=\"{}\" errors=\"{}\" time=\"{:.3f}\">\n", total_tests, total_errors, seconds(result.duration));
    for (const auto &f : result.files) {
        std::size_t failures = 0;
        std::size_t skipped  = 0;
        for (const auto &t : f.tests) {
            if (t.failed())
                ++failures;
            if (t.skipped)
                ++skipped;
        }
        const std::size_t errors = (f.setup_error ? 1 : 0) + (f.teardown_error ? 1 : 0);
        out << fmt::format("  <testsuite name=\"{}\" tests=\"{}\" failures=\"{}\" errors=\"{}\" skipped=\"{}\" time=\"{:.3f}\">\n",
                           escape_xml(f.file), f.tests.size(), failures, errors, skipped, seconds(f.duration));
        for (const auto &t : f.tests) {
            out << fmt::format("    <testcase name=\"{}\" classname=\"{}\" time=\"{:.3f}\"", escape_xml(t.name), escape_xml(f.file),
                               seconds(t.duration));
            if (!t.failed() && !t.skipped) {
                out << "/>\n";
                continue;
            }
            out << ">\n";
            if (t.skipped) {
                out << "      <skipped";
                if (!t.skip_reason.empty())
                    out << " message=\"" << escape_xml(t.skip_reason) << "\"";
                out << "/>\n";
            } else {
                const std::string message = t.error ? t.error->message : (t.xpass ? "unexpected pass (xpass)" : "failure (no details)");
                const std::string_view type = t.xpass ? "XPass" : (t.error ? error_kind_name(t.error->kind) : "failure");
                out << fmt::format("      <failure message=\"{}\" type=\"{}\"><![CDATA[{}]]></failure>\n", escape_xml(message), type,
                                   escape_cdata(message));
            }
            out << "    </testcase>\n";
        }
        if (f.setup_error)
            write_error_case(out, f, "setup", "SetupError", *f.setup_error);
        if (f.teardown_error)
            write_error_case(out, f, "teardown", "TeardownError", *f.teardown_error);
        out << "  </testsuite>\n";
    }
    out << "</testsuites>\n";
}

} // namespace skytest
