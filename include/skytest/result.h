#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

using Duration = std::chrono::nanoseconds;

enum class ErrorKind {
    Execution,
    Timeout,
    Setup,
    Teardown,
    FixtureNotFound,
    FixtureResolution,
    FixtureCycle,
    Snapshot,
};

std::string_view error_kind_name(ErrorKind kind);

struct TestError {
    ErrorKind   kind = ErrorKind::Execution;
    std::string message;
};

enum class Outcome {
    Pass,
    Fail,
    Skip,
    XFail,
    XPass,
};

struct TestResult {
    std::string              name;
    std::string              file;
    bool                     passed  = false;
    bool                     skipped = false;
    bool                     xfail   = false; // marked xfail (either caught or xpass)
    bool                     xpass   = false;
    std::string              skip_reason;
    std::string              xfail_reason;
    Duration                 duration{0};
    std::optional<TestError> error;
    std::string              output;

    Outcome outcome() const;
    bool    failed() const { return !passed && !skipped; }
};

struct Summary {
    std::size_t passed  = 0;
    std::size_t failed  = 0;
    std::size_t skipped = 0;
    std::size_t xfail   = 0;
    std::size_t xpass   = 0;

    std::size_t total() const { return passed + failed + skipped; }
    Summary    &operator+=(const Summary &other);
};

struct FileResult {
    std::string                file;
    std::vector<TestResult>    tests;
    std::optional<std::string> setup_error;
    std::optional<std::string> teardown_error;
    std::vector<std::string>   snapshots_written;
    Duration                   duration{0};

    Summary summary() const;
    bool    has_failures() const;
};

struct RunResult {
    std::vector<FileResult> files;
    Duration                duration{0};

    Summary summary() const;
    bool    has_failures() const;
};

long long to_millis(Duration d);

} // namespace skytest
