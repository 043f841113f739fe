#pragma once

#include "skytest/coverage.h"
#include "skytest/engine.h"
#include "skytest/options.h"
#include "skytest/result.h"

#include <filesystem>
#include <memory>
#include <string_view>

namespace skytest {

class FixtureRegistry;

// Runs the tests of one file at a time. A Runner is not meant to be shared
// between threads; the parallel executor creates one per file.
class Runner {
public:
    // `coverage` is shared between runners; when null and opts.coverage is
    // set the runner keeps its own collector.
    explicit Runner(Engine &engine, Options opts = {}, CoverageCollector *coverage = nullptr);

    // Throws FileError on read/parse/prelude/conftest failure.
    FileResult run_file(const std::filesystem::path &path, std::string_view source);
    FileResult run_file(const std::filesystem::path &path);

    const Options           &options() const { return opts_; }
    const CoverageCollector *coverage() const { return coverage_; }

private:
    Namespace exec(const std::filesystem::path &path, std::string_view source, const Namespace &predeclared, std::string_view what);
    Namespace build_predeclared() const;
    Namespace load_preludes(Namespace predeclared);
    void      load_conftest_fixtures(const std::filesystem::path &test_file, const Namespace &predeclared, FixtureRegistry &out);
    void      install_hooks(ExecutionContext &ctx) const;

    Engine                            &engine_;
    Options                            opts_;
    std::unique_ptr<CoverageCollector> owned_coverage_;
    CoverageCollector                 *coverage_ = nullptr;
};

// Reads a whole file; throws FileError.
std::string read_source(const std::filesystem::path &path);

} // namespace skytest
