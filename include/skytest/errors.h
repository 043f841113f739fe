#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace skytest {

// Base of every exception thrown by the library.
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reading, parsing or loading a test file (or one of its preludes/conftests) failed.
class FileError : public error {
public:
    FileError(std::string file, const std::string &message) : error(file + ": " + message), file_(std::move(file)) {}

    const std::string &file() const { return file_; }

private:
    std::string file_;
};

// Raised by the engine when evaluation fails. Builtins may throw it as well.
class EvalError : public error {
public:
    using error::error;
};

// Raised by the engine (through ExecutionContext::check_cancelled) once a context was cancelled.
class TimeoutError : public EvalError {
public:
    using EvalError::EvalError;
};

// A failed assertion from the `assert` module.
class AssertionError : public EvalError {
public:
    using EvalError::EvalError;
};

// A `setup`/`setup_file` hook failed. The message carries the "setup failed: " prefix.
class SetupError : public error {
public:
    using error::error;
};

// A `teardown`/`teardown_file` hook failed.
class TeardownError : public error {
public:
    using error::error;
};

class FixtureNotFound : public error {
public:
    explicit FixtureNotFound(std::string name) : error("fixture not found: " + name), name_(std::move(name)) {}

    const std::string &name() const { return name_; }

private:
    std::string name_;
};

class FixtureResolutionError : public error {
public:
    FixtureResolutionError(std::string name, const std::string &message)
        : error("fixture " + name + ": " + message), name_(std::move(name)) {}

    const std::string &name() const { return name_; }

private:
    std::string name_;
};

class FixtureCycle : public error {
public:
    explicit FixtureCycle(std::vector<std::string> chain) : error(describe(chain)), chain_(std::move(chain)) {}

    const std::vector<std::string> &chain() const { return chain_; }

private:
    static std::string describe(const std::vector<std::string> &chain) {
        std::string out = "fixture cycle: ";
        for (std::size_t i = 0; i < chain.size(); ++i) {
            if (i != 0)
                out += " -> ";
            out += chain[i];
        }
        return out;
    }

    std::vector<std::string> chain_;
};

class SnapshotMismatch : public error {
public:
    SnapshotMismatch(std::string name, std::string expected, std::string actual, std::string diff)
        : error("snapshot mismatch for \"" + name + "\":\n" + diff), name_(std::move(name)), expected_(std::move(expected)),
          actual_(std::move(actual)), diff_(std::move(diff)) {}

    const std::string &name() const { return name_; }
    const std::string &expected() const { return expected_; }
    const std::string &actual() const { return actual_; }
    const std::string &diff() const { return diff_; }

private:
    std::string name_;
    std::string expected_;
    std::string actual_;
    std::string diff_;
};

class MockError : public EvalError {
public:
    using EvalError::EvalError;
};

class WatchError : public error {
public:
    using error::error;
};

class NoFilesFound : public error {
public:
    NoFilesFound() : error("no test files found") {}
};

class UsageError : public error {
public:
    using error::error;
};

} // namespace skytest
