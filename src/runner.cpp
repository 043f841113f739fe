#include "skytest/runner.h"

#include "log.h"
#include "runner_metadata.h"
#include "runner_selector.h"
#include "skytest/assert_module.h"
#include "skytest/errors.h"
#include "skytest/fixtures.h"
#include "skytest/mock.h"
#include "skytest/snapshot.h"

#include <chrono>
#include <condition_variable>
#include <fmt/format.h>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace skytest {

namespace fs = std::filesystem;

namespace {

using runner::ParamCase;
using runner::TestMeta;

// Cancels a context once `timeout` elapses unless stopped first.
class CancelTimer {
public:
    CancelTimer(ExecutionContext &ctx, std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0)
            return;
        thread_ = std::thread([this, &ctx, timeout] {
            std::unique_lock<std::mutex> lk(mtx_);
            if (!cv_.wait_for(lk, timeout, [this] { return stopped_; }))
                ctx.cancel(fmt::format("test timeout after {}", format_duration(timeout)));
        });
    }

    CancelTimer(const CancelTimer &)            = delete;
    CancelTimer &operator=(const CancelTimer &) = delete;

    ~CancelTimer() { stop(); }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stopped_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable())
            thread_.join();
    }

private:
    std::mutex              mtx_;
    std::condition_variable cv_;
    bool                    stopped_ = false;
    std::thread             thread_;
};

// Runs `fn`, turning any exception into a TestError.
template <typename Fn> std::optional<TestError> guarded(const ExecutionContext &ctx, Fn &&fn) {
    try {
        fn();
        return std::nullopt;
    } catch (const SetupError &e) {
        return TestError{ErrorKind::Setup, e.what()};
    } catch (const TeardownError &e) {
        return TestError{ErrorKind::Teardown, e.what()};
    } catch (const SnapshotMismatch &e) {
        return TestError{ErrorKind::Snapshot, e.what()};
    } catch (const FixtureNotFound &e) {
        return TestError{ErrorKind::FixtureNotFound, e.what()};
    } catch (const FixtureCycle &e) {
        return TestError{ErrorKind::FixtureCycle, e.what()};
    } catch (const FixtureResolutionError &e) {
        if (ctx.cancelled())
            return TestError{ErrorKind::Timeout, ctx.cancel_reason()};
        return TestError{ErrorKind::FixtureResolution, e.what()};
    } catch (const TimeoutError &e) {
        return TestError{ErrorKind::Timeout, e.what()};
    } catch (const std::exception &e) {
        if (ctx.cancelled())
            return TestError{ErrorKind::Timeout, ctx.cancel_reason()};
        return TestError{ErrorKind::Execution, e.what()};
    }
}

// Calls a setup/teardown hook, wrapping its failure into `Err`. Timeouts pass through.
template <typename Err> void run_hook(ExecutionContext &ctx, const Value &hook, std::string_view what) {
    try {
        call_value(ctx, hook);
    } catch (const TimeoutError &) {
        throw;
    } catch (const std::exception &e) {
        throw Err(fmt::format("{} failed: {}", what, e.what()));
    }
}

std::optional<Value> optional_global(const Namespace &globals, const char *name) {
    auto it = globals.find(name);
    if (it == globals.end() || !it->second.is_callable())
        return std::nullopt;
    return it->second;
}

// Everything one file run needs while its tests execute.
struct FileState {
    fs::path             path;
    Namespace            globals;
    FixtureRegistry      fixtures;
    MockManager          mocks;
    SnapshotManager      snapshots;
    std::optional<Value> setup;
    std::optional<Value> teardown;

    explicit FileState(bool update_snapshots) : snapshots(update_snapshots) {}
};

void apply_xfail(TestResult &r, const TestMeta &meta) {
    if (!meta.xfail)
        return;
    r.xfail        = true;
    r.xfail_reason = meta.xfail_reason;
    if (r.passed) {
        r.xpass  = true;
        r.passed = false;
    } else {
        r.passed = true;
        r.error.reset();
    }
}

TestResult skipped_result(const std::string &name, const std::string &file, const TestMeta &meta) {
    TestResult r;
    r.name        = name;
    r.file        = file;
    r.skipped     = true;
    r.skip_reason = meta.skip_reason;
    return r;
}

} // namespace

std::string read_source(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw FileError(path.string(), "cannot open file");
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw FileError(path.string(), "read failed");
    return ss.str();
}

Runner::Runner(Engine &engine, Options opts, CoverageCollector *coverage) : engine_(engine), opts_(std::move(opts)), coverage_(coverage) {
    if (opts_.test_prefix.empty())
        opts_.test_prefix = "test_";
    if (opts_.coverage && !coverage_) {
        owned_coverage_ = std::make_unique<CoverageCollector>();
        coverage_       = owned_coverage_.get();
    }
}

void Runner::install_hooks(ExecutionContext &ctx) const {
    if (opts_.coverage && coverage_) {
        CoverageCollector *collector = coverage_;
        ctx.set_exec_hook([collector](std::string_view file, int line) { collector->before_exec(file, line); });
    }
}

Namespace Runner::exec(const fs::path &path, std::string_view source, const Namespace &predeclared, std::string_view what) {
    ExecutionContext ctx(path.string());
    install_hooks(ctx);
    try {
        return engine_.exec_file(ctx, path.string(), source, predeclared);
    } catch (const FileError &) {
        throw;
    } catch (const std::exception &e) {
        throw FileError(path.string(), fmt::format("executing {}: {}", what, e.what()));
    }
}

Namespace Runner::build_predeclared() const {
    Namespace predeclared = opts_.predeclared;
    if (!opts_.disable_assert)
        predeclared["assert"] = make_assert_module();
    return predeclared;
}

Namespace Runner::load_preludes(Namespace predeclared) {
    for (const auto &prelude : opts_.preludes) {
        const std::string source  = read_source(prelude);
        Namespace         globals = exec(prelude, source, predeclared, "prelude");
        for (auto &[name, value] : globals)
            predeclared.insert_or_assign(name, std::move(value));
    }
    return predeclared;
}

void Runner::load_conftest_fixtures(const fs::path &test_file, const Namespace &predeclared, FixtureRegistry &out) {
    for (const auto &conftest : find_conftest_files(test_file)) {
        const std::string source  = read_source(conftest);
        const Namespace   globals = exec(conftest, source, predeclared, "conftest");
        FixtureRegistry   found;
        find_fixtures(globals, found);
        out.merge_from(found);
        log_info("loaded {} fixture(s) from {}", found.size(), conftest.string());
    }
}

FileResult Runner::run_file(const fs::path &path) { return run_file(path, read_source(path)); }

FileResult Runner::run_file(const fs::path &path, std::string_view source) {
    const auto  start = std::chrono::steady_clock::now();
    const auto  file  = path.string();
    FileResult  result;
    result.file = file;

    const Namespace predeclared = load_preludes(build_predeclared());

    FileState state(opts_.update_snapshots);
    state.path = path;
    load_conftest_fixtures(path, predeclared, state.fixtures);

    state.globals = exec(path, source, predeclared, "test file");
    {
        FixtureRegistry own;
        find_fixtures(state.globals, own);
        state.fixtures.merge_from(own);
    }
    state.fixtures.register_builtin("mock", state.mocks.module());
    state.setup    = optional_global(state.globals, "setup");
    state.teardown = optional_global(state.globals, "teardown");

    const auto tests  = runner::find_test_functions(state.globals, opts_.test_prefix);
    const auto metas  = runner::extract_test_meta(state.globals);
    const auto params = runner::extract_test_params(state.globals);
    log_info("{}: {} test function(s), {} fixture(s)", file, tests.size(), state.fixtures.size());

    auto finish = [&] {
        for (const auto &name : state.snapshots.created())
            result.snapshots_written.push_back(name);
        for (const auto &name : state.snapshots.updated())
            result.snapshots_written.push_back(name);
        state.fixtures.clear_file_cache();
        result.duration = std::chrono::steady_clock::now() - start;
        return result;
    };

    if (auto setup_file = optional_global(state.globals, "setup_file")) {
        ExecutionContext ctx(file);
        install_hooks(ctx);
        if (auto err = guarded(ctx, [&] { run_hook<SetupError>(ctx, *setup_file, "setup_file"); })) {
            result.setup_error = err->message;
            return finish();
        }
    }

    auto run_one = [&](const std::string &name, const Value &fn, const ParamCase *pc) {
        TestResult r;
        r.name = name;
        r.file = file;

        const auto       t0 = std::chrono::steady_clock::now();
        ExecutionContext ctx(name);
        install_hooks(ctx);
        ctx.set_snapshots(&state.snapshots);
        state.snapshots.set_context(path, name);
        {
            CancelTimer timer(ctx, opts_.timeout);
            bool        setup_ok = true;
            if (state.setup) {
                if (auto err = guarded(ctx, [&] { run_hook<SetupError>(ctx, *state.setup, "setup"); })) {
                    r.error  = std::move(err);
                    setup_ok = false;
                }
            }
            if (setup_ok) {
                auto err = guarded(ctx, [&] {
                    Args args;
                    if (pc)
                        args.push_back(pc->case_dict);
                    const auto names = fn.as_callable()->param_names();
                    for (auto &v : state.fixtures.resolve_args(ctx, names, pc ? 1 : 0))
                        args.push_back(std::move(v));
                    call_value(ctx, fn, args);
                });
                if (err)
                    r.error = std::move(err);
                else
                    r.passed = true;

                if (state.teardown) {
                    auto terr = guarded(ctx, [&] { run_hook<TeardownError>(ctx, *state.teardown, "teardown"); });
                    if (terr && !r.error) {
                        r.error  = std::move(terr);
                        r.passed = false;
                    }
                }
            }
            timer.stop();
        }
        r.output   = ctx.captured_output();
        r.duration = std::chrono::steady_clock::now() - t0;
        return r;
    };

    const TestMeta no_meta;
    bool           stop = false;
    for (const auto &name : tests) {
        if (stop)
            break;
        auto        meta_it = metas.find(name);
        const auto &meta    = meta_it != metas.end() ? meta_it->second : no_meta;
        if (!runner::matches_marker_filter(meta, opts_.marker_filter))
            continue;

        const Value &fn = state.globals.at(name);
        auto         run_case = [&](const std::string &case_name, const ParamCase *pc) {
            if (!runner::matches_name_filter(case_name, name, opts_))
                return;
            if (meta.skip) {
                result.tests.push_back(skipped_result(case_name, file, meta));
                return;
            }
            TestResult r = run_one(case_name, fn, pc);
            apply_xfail(r, meta);
            const bool failed = r.failed();
            result.tests.push_back(std::move(r));
            state.fixtures.clear_test_cache();
            state.mocks.reset();
            if (opts_.fail_fast && failed)
                stop = true;
        };

        if (auto p = params.find(name); p != params.end()) {
            for (const auto &pc : p->second) {
                run_case(pc.virtual_name(name), &pc);
                if (stop)
                    break;
            }
        } else {
            run_case(name, nullptr);
        }
    }

    if (auto teardown_file = optional_global(state.globals, "teardown_file")) {
        ExecutionContext ctx(file);
        install_hooks(ctx);
        if (auto err = guarded(ctx, [&] { run_hook<TeardownError>(ctx, *teardown_file, "teardown_file"); }))
            result.teardown_error = err->message;
    }

    return finish();
}

} // namespace skytest
