#include "skytest/result.h"
#include "skytest/options.h"

#include <cctype>
#include <cstdint>
#include <fmt/format.h>

namespace skytest {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Execution: return "execution";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Setup: return "setup";
    case ErrorKind::Teardown: return "teardown";
    case ErrorKind::FixtureNotFound: return "fixture-not-found";
    case ErrorKind::FixtureResolution: return "fixture-resolution";
    case ErrorKind::FixtureCycle: return "fixture-cycle";
    case ErrorKind::Snapshot: return "snapshot";
    }
    return "unknown";
}

Outcome TestResult::outcome() const {
    if (skipped)
        return Outcome::Skip;
    if (xpass)
        return Outcome::XPass;
    if (xfail && passed)
        return Outcome::XFail;
    return passed ? Outcome::Pass : Outcome::Fail;
}

Summary &Summary::operator+=(const Summary &other) {
    passed += other.passed;
    failed += other.failed;
    skipped += other.skipped;
    xfail += other.xfail;
    xpass += other.xpass;
    return *this;
}

Summary FileResult::summary() const {
    Summary s;
    for (const auto &t : tests) {
        switch (t.outcome()) {
        case Outcome::Pass: ++s.passed; break;
        case Outcome::Fail: ++s.failed; break;
        case Outcome::Skip: ++s.skipped; break;
        case Outcome::XFail:
            ++s.passed;
            ++s.xfail;
            break;
        case Outcome::XPass:
            ++s.failed;
            ++s.xpass;
            break;
        }
    }
    return s;
}

bool FileResult::has_failures() const {
    if (setup_error || teardown_error)
        return true;
    for (const auto &t : tests) {
        if (t.failed())
            return true;
    }
    return false;
}

Summary RunResult::summary() const {
    Summary s;
    for (const auto &f : files)
        s += f.summary();
    return s;
}

bool RunResult::has_failures() const {
    for (const auto &f : files) {
        if (f.has_failures())
            return true;
    }
    return false;
}

long long to_millis(Duration d) { return std::chrono::duration_cast<std::chrono::milliseconds>(d).count(); }

std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
    std::size_t i = 0;
    std::uint64_t n = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        n = n * 10 + static_cast<std::uint64_t>(text[i] - '0');
        if (n > 1000000000ull)
            return std::nullopt;
        ++i;
    }
    if (i == 0)
        return std::nullopt;
    const std::string_view unit = text.substr(i);
    const auto             count = static_cast<std::int64_t>(n);
    if (unit == "ms")
        return std::chrono::milliseconds(count);
    if (unit.empty() || unit == "s")
        return std::chrono::seconds(count);
    if (unit == "m")
        return std::chrono::minutes(count);
    if (unit == "h")
        return std::chrono::hours(count);
    return std::nullopt;
}

std::string format_duration(std::chrono::milliseconds d) {
    const auto ms = d.count();
    if (ms != 0 && ms % 3600000 == 0)
        return fmt::format("{}h", ms / 3600000);
    if (ms != 0 && ms % 60000 == 0)
        return fmt::format("{}m", ms / 60000);
    if (ms != 0 && ms % 1000 == 0)
        return fmt::format("{}s", ms / 1000);
    return fmt::format("{}ms", ms);
}

} // namespace skytest
