#pragma once

#include "skytest/result.h"

#include <memory>
#include <ostream>
#include <string_view>

namespace skytest {

// Formats results. report_summary is called once at the end of a run.
// Reporters with incremental output also get report_file once per finished
// file, in input order, so their output streams while the run is going.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void report_file(std::ostream &, const FileResult &) const {}
    virtual void report_summary(std::ostream &out, const RunResult &result) const = 0;

    virtual bool supports_incremental_output() const { return false; }
};

struct TextReporterOptions {
    bool verbose       = false; // show captured output
    bool show_duration = false;
    bool color         = true;
};

class TextReporter : public Reporter {
public:
    explicit TextReporter(TextReporterOptions opts = {}) : opts_(opts) {}

    void report_file(std::ostream &out, const FileResult &result) const override;
    void report_summary(std::ostream &out, const RunResult &result) const override;
    bool supports_incremental_output() const override { return true; }

private:
    TextReporterOptions opts_;
};

// Only usable when built with Boost.JSON.
class JsonReporter : public Reporter {
public:
    void report_summary(std::ostream &out, const RunResult &result) const override;
};

class JUnitReporter : public Reporter {
public:
    void report_summary(std::ostream &out, const RunResult &result) const override;
};

// GitHub-flavoured Markdown, suitable for $GITHUB_STEP_SUMMARY.
class MarkdownReporter : public Reporter {
public:
    void report_summary(std::ostream &out, const RunResult &result) const override;
};

// `::error file=...` workflow commands, one per failing test or file hook.
class GitHubReporter : public Reporter {
public:
    void report_file(std::ostream &out, const FileResult &result) const override;
    void report_summary(std::ostream &out, const RunResult &result) const override;
    bool supports_incremental_output() const override { return true; }
};

enum class ReportFormat {
    Text,
    Json,
    JUnit,
    Markdown,
    GitHub,
};

// Throws UsageError on an unknown name.
ReportFormat parse_report_format(std::string_view name);

// Throws UsageError for json when Boost.JSON support was not compiled in.
std::unique_ptr<Reporter> make_reporter(ReportFormat format, TextReporterOptions text_opts = {});

namespace detail {
std::string gha_escape(std::string_view s);
std::string escape_xml(std::string_view s);
// Splits "]]>" so the text can sit inside a single CDATA section.
std::string escape_cdata(std::string_view s);
} // namespace detail

} // namespace skytest
