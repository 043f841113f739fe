#include "skytest/reporter.h"

#include "skytest/errors.h"

#ifdef SKYTEST_USE_BOOST_JSON
#include <boost/json.hpp>
#include <boost/json/src.hpp>
#endif

namespace skytest {

#ifdef SKYTEST_USE_BOOST_JSON
namespace {

boost::json::object test_to_json(const TestResult &t) {
    boost::json::object obj;
    obj["name"]        = t.name;
    obj["passed"]      = t.passed;
    obj["duration_ms"] = to_millis(t.duration);
    if (t.skipped) {
        obj["skipped"] = true;
        if (!t.skip_reason.empty())
            obj["skip_reason"] = t.skip_reason;
    }
    if (t.xfail) {
        obj["xfail"] = true;
        obj["xpass"] = t.xpass;
        if (!t.xfail_reason.empty())
            obj["xfail_reason"] = t.xfail_reason;
    }
    if (t.error) {
        obj["error"]      = t.error->message;
        obj["error_kind"] = std::string(error_kind_name(t.error->kind));
    }
    if (!t.output.empty())
        obj["output"] = t.output;
    return obj;
}

} // namespace

void JsonReporter::report_summary(std::ostream &out, const RunResult &result) const {
    const Summary       s = result.summary();
    boost::json::object root;
    root["passed"]      = s.passed;
    root["failed"]      = s.failed;
    root["skipped"]     = s.skipped;
    root["total"]       = s.passed + s.failed;
    root["files"]       = result.files.size();
    root["duration_ms"] = to_millis(result.duration);

    boost::json::array files;
    for (const auto &f : result.files) {
        boost::json::object jf;
        jf["file"]        = f.file;
        jf["duration_ms"] = to_millis(f.duration);
        if (f.setup_error)
            jf["setup_error"] = *f.setup_error;
        if (f.teardown_error)
            jf["teardown_error"] = *f.teardown_error;
        boost::json::array tests;
        for (const auto &t : f.tests)
            tests.push_back(test_to_json(t));
        jf["tests"] = std::move(tests);
        files.push_back(std::move(jf));
    }
    root["results"] = std::move(files);
    out << boost::json::serialize(root) << '\n';
}
#else
void JsonReporter::report_summary(std::ostream &, const RunResult &) const {
    throw UsageError("json output requires a build with Boost.JSON");
}
#endif

} // namespace skytest
