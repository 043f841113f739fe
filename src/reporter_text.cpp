#include "skytest/reporter.h"

#include <fmt/color.h>
#include <fmt/format.h>

namespace skytest {

namespace {

struct Tag {
    const char *text;
    fmt::color  color;
};

Tag tag_for(Outcome outcome) {
    switch (outcome) {
    case Outcome::Pass: return {"[ PASS ]", fmt::color::green};
    case Outcome::Fail: return {"[ FAIL ]", fmt::color::red};
    case Outcome::Skip: return {"[ SKIP ]", fmt::color::yellow};
    case Outcome::XFail: return {"[ XFAIL ]", fmt::color::cyan};
    case Outcome::XPass: return {"[ XPASS ]", fmt::color::red};
    }
    return {"[ ???? ]", fmt::color::white};
}

void write_indented(std::ostream &out, std::string_view text, std::string_view indent) {
    while (!text.empty()) {
        const auto nl = text.find('\n');
        out << indent << text.substr(0, nl) << '\n';
        if (nl == std::string_view::npos)
            break;
        text.remove_prefix(nl + 1);
    }
}

} // namespace

void TextReporter::report_file(std::ostream &out, const FileResult &result) const {
    if (result.setup_error) {
        if (opts_.color)
            out << fmt::format(fmt::fg(fmt::color::red), "SETUP FAILED");
        else
            out << "SETUP FAILED";
        out << fmt::format(": {}\n", result.file);
        write_indented(out, *result.setup_error, "  ");
        return;
    }

    for (const auto &t : result.tests) {
        const Outcome outcome = t.outcome();
        const Tag     tag     = tag_for(outcome);
        if (opts_.color)
            out << fmt::format(fmt::fg(tag.color), "{}", tag.text);
        else
            out << tag.text;
        out << ' ' << t.name;

        std::string_view reason;
        if (outcome == Outcome::Skip)
            reason = t.skip_reason;
        else if (outcome == Outcome::XFail || outcome == Outcome::XPass)
            reason = t.xfail_reason;
        if (!reason.empty())
            out << " :: " << reason;
        if (opts_.show_duration)
            out << fmt::format(" ({} ms)", to_millis(t.duration));
        out << '\n';

        if (outcome == Outcome::Fail && t.error)
            write_indented(out, t.error->message, "      ");
        if (opts_.verbose && !t.output.empty()) {
            out << "      Output:\n";
            write_indented(out, t.output, "        ");
        }
    }

    if (result.teardown_error) {
        if (opts_.color)
            out << fmt::format(fmt::fg(fmt::color::red), "TEARDOWN FAILED");
        else
            out << "TEARDOWN FAILED";
        out << fmt::format(": {}\n", result.file);
        write_indented(out, *result.teardown_error, "  ");
    }
}

void TextReporter::report_summary(std::ostream &out, const RunResult &result) const {
    const Summary s = result.summary();
    out << '\n';
    out << fmt::format("Results: {} passed, {} failed, {} total in {} file(s)\n", s.passed, s.failed, s.passed + s.failed,
                       result.files.size());
    out << fmt::format("Summary: passed {}/{}; failed {}; skipped {}; xfail {}; xpass {}.\n", s.passed, s.total(), s.failed, s.skipped,
                       s.xfail, s.xpass);

    bool header = false;
    for (const auto &f : result.files) {
        auto emit = [&](std::string_view name, std::string_view issue) {
            if (!header) {
                out << "Failed tests:\n";
                header = true;
            }
            out << fmt::format("  {}::{}:\n", f.file, name);
            out << fmt::format("    {}\n", issue.substr(0, issue.find('\n')));
        };
        if (f.setup_error)
            emit("setup_file", *f.setup_error);
        for (const auto &t : f.tests) {
            if (t.xpass)
                emit(t.name, t.xfail_reason.empty() ? std::string_view("XPASS") : std::string_view(t.xfail_reason));
            else if (t.failed())
                emit(t.name, t.error ? std::string_view(t.error->message) : std::string_view("failure (no details)"));
        }
        if (f.teardown_error)
            emit("teardown_file", *f.teardown_error);
    }

    if (opts_.show_duration)
        out << fmt::format("Duration: {} ms\n", to_millis(result.duration));
}

} // namespace skytest
