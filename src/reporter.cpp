#include "skytest/reporter.h"

#include "skytest/errors.h"

#include <string>

namespace skytest {

namespace detail {

std::string gha_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '%': out += "%25"; break;
        case '\r': out += "%0D"; break;
        case '\n': out += "%0A"; break;
        default: out.push_back(ch); break;
        }
    }
    return out;
}

std::string escape_xml(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out.push_back(ch); break;
        }
    }
    return out;
}

std::string escape_cdata(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::size_t pos = 0;
    for (auto hit = s.find("]]>"); hit != std::string_view::npos; hit = s.find("]]>", pos)) {
        out.append(s.substr(pos, hit - pos));
        out += "]]]]><![CDATA[>";
        pos = hit + 3;
    }
    out.append(s.substr(pos));
    return out;
}

} // namespace detail

ReportFormat parse_report_format(std::string_view name) {
    if (name == "text")
        return ReportFormat::Text;
    if (name == "json")
        return ReportFormat::Json;
    if (name == "junit" || name == "xml")
        return ReportFormat::JUnit;
    if (name == "markdown" || name == "md")
        return ReportFormat::Markdown;
    if (name == "github")
        return ReportFormat::GitHub;
    throw UsageError("unknown format '" + std::string(name) + "' (expected text, json, junit, markdown or github)");
}

std::unique_ptr<Reporter> make_reporter(ReportFormat format, TextReporterOptions text_opts) {
    switch (format) {
    case ReportFormat::Text: return std::make_unique<TextReporter>(text_opts);
    case ReportFormat::Json:
#ifdef SKYTEST_USE_BOOST_JSON
        return std::make_unique<JsonReporter>();
#else
        throw UsageError("json output requires a build with Boost.JSON");
#endif
    case ReportFormat::JUnit: return std::make_unique<JUnitReporter>();
    case ReportFormat::Markdown: return std::make_unique<MarkdownReporter>();
    case ReportFormat::GitHub: return std::make_unique<GitHubReporter>();
    }
    throw UsageError("unknown report format");
}

} // namespace skytest
