#include "skytest/errors.h"
#include "skytest/runner.h"

#include "support/scripted_engine.h"
#include "support/temp_dir.h"

#include <algorithm>
#include <atomic>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <thread>

using namespace skytest;
using skytest::test_support::fn;
using skytest::test_support::failing;
using skytest::test_support::member;
using skytest::test_support::noop;
using skytest::test_support::ScriptedEngine;
using skytest::test_support::TempDir;

namespace fs = std::filesystem;

namespace {

Value str(const char *s) { return Value::string(s); }

Value meta(std::vector<std::pair<Value, Value>> entries) { return Value::dict(std::move(entries)); }

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override { tmp_.mkdir(".git"); }

    // Registers a scripted file on disk so conftest and prelude lookups see it.
    fs::path script(std::string_view rel, skytest::test_support::Script s) {
        const auto p = tmp_.write(rel, "# scripted\n");
        engine_.add(p, std::move(s));
        return p;
    }

    FileResult run(const fs::path &p, Options opts = {}) {
        Runner r(engine_, std::move(opts));
        return r.run_file(p);
    }

    static const TestResult *find(const FileResult &fr, std::string_view name) {
        auto it = std::find_if(fr.tests.begin(), fr.tests.end(), [&](const TestResult &t) { return t.name == name; });
        return it == fr.tests.end() ? nullptr : &*it;
    }

    static std::vector<std::string> names(const FileResult &fr) {
        std::vector<std::string> out;
        for (const auto &t : fr.tests)
            out.push_back(t.name);
        return out;
    }

    TempDir        tmp_;
    ScriptedEngine engine_;
};

} // namespace

TEST_F(RunnerTest, RunsTestFunctionsInNameOrder) {
    auto path = script("basic_test.star", [](ExecutionContext &, const Namespace &pre) {
        const Value assert_mod = pre.at("assert");
        Namespace   g;
        g["test_b_fails"] = fn("test_b_fails", [assert_mod](ExecutionContext &ctx, const Args &) {
            return call_value(ctx, member(assert_mod, "eq"), {Value::integer(1), Value::integer(2)});
        });
        g["test_a_passes"] = noop("test_a_passes");
        g["helper"]        = noop("helper");
        g["test_value"]    = Value::integer(3);
        return g;
    });

    const auto fr = run(path);
    EXPECT_EQ(names(fr), (std::vector<std::string>{"test_a_passes", "test_b_fails"}));
    EXPECT_TRUE(fr.tests[0].passed);
    ASSERT_TRUE(fr.tests[1].error);
    EXPECT_EQ(fr.tests[1].error->kind, ErrorKind::Execution);
    EXPECT_EQ(fr.tests[1].error->message, "assertion failed: expected 1 == 2");

    const auto s = fr.summary();
    EXPECT_EQ(s.passed, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.total(), 2u);
    EXPECT_TRUE(fr.has_failures());
}

TEST_F(RunnerTest, CustomPrefix) {
    auto path = script("prefix_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["check_one"] = noop("check_one");
        g["test_two"]  = noop("test_two");
        return g;
    });
    Options opts;
    opts.test_prefix = "check_";
    EXPECT_EQ(names(run(path, opts)), (std::vector<std::string>{"check_one"}));
}

TEST_F(RunnerTest, SkipAndExpectedFailure) {
    auto ran  = std::make_shared<std::atomic<int>>(0);
    auto path = script("meta_test.star", [ran](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_skip"] = fn("test_skip", [ran](ExecutionContext &, const Args &) {
            ++*ran;
            return Value();
        });
        g["test_xfail"]    = failing("test_xfail", "known bug");
        g["test_xpass"]    = noop("test_xpass");
        g["__test_meta__"] = meta({
            {str("test_skip"), meta({{str("skip"), str("not ready")}})},
            {str("test_xfail"), meta({{str("xfail"), str("issue 12")}})},
            {str("test_xpass"), meta({{str("xfail"), Value::boolean(true)}})},
        });
        return g;
    });

    const auto fr = run(path);
    EXPECT_EQ(ran->load(), 0);

    const auto *skip = find(fr, "test_skip");
    ASSERT_NE(skip, nullptr);
    EXPECT_TRUE(skip->skipped);
    EXPECT_FALSE(skip->passed);
    EXPECT_EQ(skip->skip_reason, "not ready");
    EXPECT_EQ(skip->outcome(), Outcome::Skip);

    const auto *xfail = find(fr, "test_xfail");
    ASSERT_NE(xfail, nullptr);
    EXPECT_TRUE(xfail->passed);
    EXPECT_TRUE(xfail->xfail);
    EXPECT_FALSE(xfail->error);
    EXPECT_EQ(xfail->xfail_reason, "issue 12");
    EXPECT_EQ(xfail->outcome(), Outcome::XFail);

    const auto *xpass = find(fr, "test_xpass");
    ASSERT_NE(xpass, nullptr);
    EXPECT_FALSE(xpass->passed);
    EXPECT_TRUE(xpass->xpass);
    EXPECT_TRUE(xpass->failed());

    const auto s = fr.summary();
    EXPECT_EQ(s.skipped, 1u);
    EXPECT_EQ(s.xfail, 1u);
    EXPECT_EQ(s.xpass, 1u);
}

TEST_F(RunnerTest, MarkerFilter) {
    auto path = script("marker_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_fast"]     = noop("test_fast");
        g["test_slow"]     = noop("test_slow");
        g["__test_meta__"] = meta({{str("test_slow"), meta({{str("markers"), Value::list({str("slow"), str("db")})}})}});
        return g;
    });

    Options only;
    only.marker_filter = "slow";
    EXPECT_EQ(names(run(path, only)), (std::vector<std::string>{"test_slow"}));

    Options excluded;
    excluded.marker_filter = "not SLOW";
    EXPECT_EQ(names(run(path, excluded)), (std::vector<std::string>{"test_fast"}));
}

TEST_F(RunnerTest, NameFilterAndAllowList) {
    auto path = script("filter_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_add"]      = noop("test_add");
        g["test_add_many"] = noop("test_add_many");
        g["test_sub"]      = noop("test_sub");
        return g;
    });

    Options filter;
    filter.filter = "ADD";
    EXPECT_EQ(names(run(path, filter)), (std::vector<std::string>{"test_add", "test_add_many"}));

    Options negated;
    negated.filter = "not add";
    EXPECT_EQ(names(run(path, negated)), (std::vector<std::string>{"test_sub"}));

    Options allow;
    allow.test_names = {"test_add"};
    allow.filter     = "sub";
    EXPECT_EQ(names(run(path, allow)), (std::vector<std::string>{"test_add"}));
}

TEST_F(RunnerTest, ParametrizedCasesReceiveCaseDictFirst) {
    auto seen = std::make_shared<std::vector<std::string>>();
    auto path = script("param_test.star", [seen](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["fixture_base"] = fn("fixture_base", [](ExecutionContext &, const Args &) { return Value::integer(10); });
        g["test_sq"]      = fn("test_sq", {"case", "base"}, [seen](ExecutionContext &, const Args &args) {
            const Value *n = args[0].as_dict()->find("n");
            seen->push_back(fmt::format("{}+{}", n->as_int(), args[1].as_int()));
            if (n->as_int() == 3)
                throw EvalError("three is odd");
            return Value();
        });
        g["__test_params__"] = meta({{str("test_sq"), Value::list({
                                                          meta({{str("name"), str("two")}, {str("n"), Value::integer(2)}}),
                                                          meta({{str("n"), Value::integer(3)}}),
                                                      })}});
        return g;
    });

    const auto fr = run(path);
    EXPECT_EQ(names(fr), (std::vector<std::string>{"test_sq[two]", "test_sq[1]"}));
    EXPECT_EQ(*seen, (std::vector<std::string>{"2+10", "3+10"}));
    EXPECT_TRUE(fr.tests[0].passed);
    EXPECT_TRUE(fr.tests[1].failed());

    Options by_case;
    by_case.test_names = {"test_sq[1]"};
    EXPECT_EQ(names(run(path, by_case)), (std::vector<std::string>{"test_sq[1]"}));

    Options by_base;
    by_base.test_names = {"test_sq"};
    EXPECT_EQ(run(path, by_base).tests.size(), 2u);
}

TEST_F(RunnerTest, FixtureScopes) {
    auto file_calls = std::make_shared<std::atomic<int>>(0);
    auto test_calls = std::make_shared<std::atomic<int>>(0);
    auto path       = script("fixture_test.star", [=](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["fixture_db"] = fn("fixture_db", [file_calls](ExecutionContext &, const Args &) {
            ++*file_calls;
            return str("db");
        });
        g["fixture_tmp"] = fn("fixture_tmp", {"db"}, [test_calls](ExecutionContext &, const Args &args) {
            ++*test_calls;
            return Value::string(args[0].as_string() + "/tmp");
        });
        g["__fixture_config__"] = meta({{str("db"), str("file")}});
        g["test_one"] = fn("test_one", {"tmp", "db"}, [](ExecutionContext &, const Args &args) -> Value {
            if (args[0].as_string() != "db/tmp" || args[1].as_string() != "db")
                throw EvalError("wrong fixture values");
            return Value();
        });
        g["test_two"] = fn("test_two", {"tmp"}, [](ExecutionContext &, const Args &) { return Value(); });
        return g;
    });

    const auto fr = run(path);
    EXPECT_FALSE(fr.has_failures());
    EXPECT_EQ(file_calls->load(), 1);
    EXPECT_EQ(test_calls->load(), 2);
}

TEST_F(RunnerTest, FixtureErrorsAreClassified) {
    auto path = script("fixture_errors_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["fixture_a"]      = fn("fixture_a", {"b"}, [](ExecutionContext &, const Args &) { return Value(); });
        g["fixture_b"]      = fn("fixture_b", {"a"}, [](ExecutionContext &, const Args &) { return Value(); });
        g["fixture_broken"] = failing("fixture_broken", "connection refused");
        g["test_missing"]   = fn("test_missing", {"nope"}, [](ExecutionContext &, const Args &) { return Value(); });
        g["test_cycle"]     = fn("test_cycle", {"a"}, [](ExecutionContext &, const Args &) { return Value(); });
        g["test_broken"]    = fn("test_broken", {"broken"}, [](ExecutionContext &, const Args &) { return Value(); });
        return g;
    });

    const auto fr = run(path);
    ASSERT_EQ(fr.tests.size(), 3u);
    EXPECT_EQ(find(fr, "test_missing")->error->kind, ErrorKind::FixtureNotFound);
    EXPECT_EQ(find(fr, "test_missing")->error->message, "fixture not found: nope");
    EXPECT_EQ(find(fr, "test_cycle")->error->kind, ErrorKind::FixtureCycle);
    EXPECT_EQ(find(fr, "test_broken")->error->kind, ErrorKind::FixtureResolution);
    EXPECT_NE(find(fr, "test_broken")->error->message.find("connection refused"), std::string::npos);
}

TEST_F(RunnerTest, SetupAndTeardownHooks) {
    auto log  = std::make_shared<std::vector<std::string>>();
    auto path = script("hooks_test.star", [log](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["setup"] = fn("setup", [log](ExecutionContext &, const Args &) {
            log->push_back("setup");
            return Value();
        });
        g["teardown"] = fn("teardown", [log](ExecutionContext &, const Args &) -> Value {
            log->push_back("teardown");
            throw EvalError("cleanup broke");
        });
        g["test_pass"] = fn("test_pass", [log](ExecutionContext &, const Args &) {
            log->push_back("pass");
            return Value();
        });
        g["test_zfail"] = fn("test_zfail", [log](ExecutionContext &, const Args &) -> Value {
            log->push_back("fail");
            throw EvalError("body broke");
        });
        return g;
    });

    const auto fr = run(path);
    EXPECT_EQ(*log, (std::vector<std::string>{"setup", "pass", "teardown", "setup", "fail", "teardown"}));

    const auto *pass = find(fr, "test_pass");
    EXPECT_FALSE(pass->passed);
    EXPECT_EQ(pass->error->kind, ErrorKind::Teardown);
    EXPECT_EQ(pass->error->message, "teardown failed: cleanup broke");

    const auto *fail = find(fr, "test_zfail");
    EXPECT_EQ(fail->error->kind, ErrorKind::Execution);
    EXPECT_EQ(fail->error->message, "body broke");
}

TEST_F(RunnerTest, SetupFailureSkipsBodyAndTeardown) {
    auto log  = std::make_shared<std::vector<std::string>>();
    auto path = script("setup_fail_test.star", [log](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["setup"]    = failing("setup", "no database");
        g["teardown"] = fn("teardown", [log](ExecutionContext &, const Args &) {
            log->push_back("teardown");
            return Value();
        });
        g["test_x"] = fn("test_x", [log](ExecutionContext &, const Args &) {
            log->push_back("body");
            return Value();
        });
        return g;
    });

    const auto fr = run(path);
    ASSERT_EQ(fr.tests.size(), 1u);
    EXPECT_EQ(fr.tests[0].error->kind, ErrorKind::Setup);
    EXPECT_EQ(fr.tests[0].error->message, "setup failed: no database");
    EXPECT_TRUE(log->empty());
}

TEST_F(RunnerTest, FileLevelHooks) {
    auto log      = std::make_shared<std::vector<std::string>>();
    auto bad_path = script("setup_file_test.star", [log](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["setup_file"] = failing("setup_file", "no server");
        g["test_x"]     = fn("test_x", [log](ExecutionContext &, const Args &) {
            log->push_back("body");
            return Value();
        });
        return g;
    });
    const auto bad = run(bad_path);
    EXPECT_TRUE(bad.tests.empty());
    EXPECT_EQ(bad.setup_error, "setup_file failed: no server");
    EXPECT_TRUE(bad.has_failures());
    EXPECT_TRUE(log->empty());

    auto teardown_path = script("teardown_file_test.star", [log](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["setup_file"] = fn("setup_file", [log](ExecutionContext &, const Args &) {
            log->push_back("setup_file");
            return Value();
        });
        g["teardown_file"] = failing("teardown_file", "leak");
        g["test_x"]        = noop("test_x");
        return g;
    });
    const auto td = run(teardown_path);
    EXPECT_EQ(*log, (std::vector<std::string>{"setup_file"}));
    ASSERT_EQ(td.tests.size(), 1u);
    EXPECT_TRUE(td.tests[0].passed);
    EXPECT_EQ(td.teardown_error, "teardown_file failed: leak");
    EXPECT_TRUE(td.has_failures());
}

TEST_F(RunnerTest, TimeoutCancelsLongTest) {
    auto path = script("timeout_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_spin"] = fn("test_spin", [](ExecutionContext &ctx, const Args &) -> Value {
            for (;;) {
                ctx.check_cancelled();
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        });
        g["test_quick"] = noop("test_quick");
        return g;
    });

    Options opts;
    opts.timeout  = std::chrono::milliseconds(50);
    const auto fr = run(path, opts);
    const auto *spin = find(fr, "test_spin");
    ASSERT_NE(spin, nullptr);
    ASSERT_TRUE(spin->error);
    EXPECT_EQ(spin->error->kind, ErrorKind::Timeout);
    EXPECT_EQ(spin->error->message, "test timeout after 50ms");
    EXPECT_TRUE(find(fr, "test_quick")->passed);
}

TEST_F(RunnerTest, FailFastStopsAfterFirstFailure) {
    auto path = script("bail_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_a"] = failing("test_a", "boom");
        g["test_b"] = noop("test_b");
        return g;
    });

    Options opts;
    opts.fail_fast = true;
    EXPECT_EQ(names(run(path, opts)), (std::vector<std::string>{"test_a"}));
    EXPECT_EQ(run(path).tests.size(), 2u);
}

TEST_F(RunnerTest, ExecutionFailuresBecomeFileErrors) {
    const auto unscripted = tmp_.write("broken_test.star", "def (:\n");
    try {
        run(unscripted);
        FAIL() << "expected FileError";
    } catch (const FileError &e) {
        EXPECT_EQ(e.file(), unscripted.string());
        EXPECT_NE(std::string(e.what()).find("executing test file"), std::string::npos);
    }

    EXPECT_THROW(run(tmp_.path() / "missing_test.star"), FileError);

    auto prelude = script("bad_prelude.star", [](ExecutionContext &, const Namespace &) -> Namespace { throw EvalError("undefined: x"); });
    auto ok      = script("ok_test.star", [](ExecutionContext &, const Namespace &) { return Namespace{{"test_a", noop("test_a")}}; });
    Options opts;
    opts.preludes = {prelude.string()};
    EXPECT_THROW(run(ok, opts), FileError);
}

TEST_F(RunnerTest, PreludesShadowInOrder) {
    auto first  = script("first.star", [](ExecutionContext &, const Namespace &) {
        return Namespace{{"greeting", str("hello")}, {"answer", Value::integer(1)}};
    });
    auto second = script("second.star", [](ExecutionContext &, const Namespace &pre) {
        // Later preludes see earlier ones.
        return Namespace{{"answer", Value::integer(pre.at("answer").as_int() + 41)}};
    });
    auto seen   = std::make_shared<Namespace>();
    auto path   = script("prelude_test.star", [seen](ExecutionContext &, const Namespace &pre) {
        *seen = pre;
        return Namespace{{"test_a", noop("test_a")}};
    });

    Options opts;
    opts.preludes              = {first.string(), second.string()};
    opts.predeclared["custom"] = Value::boolean(true);
    run(path, opts);
    EXPECT_EQ(seen->at("greeting"), str("hello"));
    EXPECT_EQ(seen->at("answer"), Value::integer(42));
    EXPECT_EQ(seen->at("custom"), Value::boolean(true));
    EXPECT_TRUE(seen->count("assert"));

    Options bare;
    bare.disable_assert = true;
    run(path, bare);
    EXPECT_FALSE(seen->count("assert"));
}

TEST_F(RunnerTest, ConftestFixturesAreOverriddenByFile) {
    script("conftest.star", [](ExecutionContext &, const Namespace &) {
        return Namespace{{"fixture_shared", fn("fixture_shared", [](ExecutionContext &, const Args &) { return str("root"); })},
                         {"fixture_env", fn("fixture_env", [](ExecutionContext &, const Args &) { return str("conftest"); })}};
    });
    script("pkg/conftest.star", [](ExecutionContext &, const Namespace &) {
        return Namespace{{"fixture_env", fn("fixture_env", [](ExecutionContext &, const Args &) { return str("pkg"); })}};
    });
    auto got  = std::make_shared<std::vector<std::string>>();
    auto path = script("pkg/lib_test.star", [got](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_env"] = fn("test_env", {"shared", "env"}, [got](ExecutionContext &, const Args &args) {
            got->push_back(args[0].as_string());
            got->push_back(args[1].as_string());
            return Value();
        });
        return g;
    });
    run(path);
    EXPECT_EQ(*got, (std::vector<std::string>{"root", "pkg"}));

    got->clear();
    auto local = script("pkg/local_test.star", [got](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["fixture_env"] = fn("fixture_env", [](ExecutionContext &, const Args &) { return str("file"); });
        g["test_env"]    = fn("test_env", {"env"}, [got](ExecutionContext &, const Args &args) {
            got->push_back(args[0].as_string());
            return Value();
        });
        return g;
    });
    run(local);
    EXPECT_EQ(*got, (std::vector<std::string>{"file"}));
}

TEST_F(RunnerTest, BrokenConftestIsAFileError) {
    script("conftest.star", [](ExecutionContext &, const Namespace &) -> Namespace { throw EvalError("bad conftest"); });
    auto path = script("x_test.star", [](ExecutionContext &, const Namespace &) { return Namespace{{"test_a", noop("test_a")}}; });
    try {
        run(path);
        FAIL() << "expected FileError";
    } catch (const FileError &e) {
        EXPECT_NE(std::string(e.what()).find("bad conftest"), std::string::npos);
    }
}

TEST_F(RunnerTest, CapturesPrintedOutput) {
    auto path = script("print_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_talk"] = fn("test_talk", [](ExecutionContext &ctx, const Args &) {
            ctx.print("hello");
            ctx.print("world");
            return Value();
        });
        return g;
    });
    const auto fr = run(path);
    ASSERT_EQ(fr.tests.size(), 1u);
    EXPECT_EQ(fr.tests[0].output, "hello\nworld\n");
}

TEST_F(RunnerTest, CoverageRecordsExecutedLines) {
    auto path = script("cov_test.star", [](ExecutionContext &, const Namespace &) {
        Namespace g;
        g["test_a"] = fn("test_a", {}, [](ExecutionContext &, const Args &) { return Value(); }, "cov_test.star", 7);
        return g;
    });

    CoverageCollector collector;
    Options           opts;
    opts.coverage = true;
    Runner runner(engine_, opts, &collector);
    runner.run_file(path);

    const auto report = collector.report();
    EXPECT_GE(report.covered_lines(), 2u);
    bool saw_body = false;
    for (const auto &f : report.files) {
        if (f.path == "cov_test.star")
            saw_body = f.hits.count(7) == 1;
    }
    EXPECT_TRUE(saw_body);
}

TEST_F(RunnerTest, MockFixtureIsResetBetweenTests) {
    auto counts = std::make_shared<std::vector<std::int64_t>>();
    auto path   = script("mock_test.star", [counts](ExecutionContext &, const Namespace &) {
        auto body = [counts](ExecutionContext &ctx, const Args &args) {
            const Value &mock    = args[0];
            const Value  wrapped = call_value(ctx, member(mock, "wrap"), {args[1]});
            counts->push_back(call_value(ctx, member(mock, "call_count"), {wrapped}).as_int());
            call_value(ctx, wrapped);
            counts->push_back(call_value(ctx, member(mock, "call_count"), {wrapped}).as_int());
            return Value();
        };
        Namespace g;
        g["fixture_svc"]        = fn("fixture_svc", [](ExecutionContext &, const Args &) { return noop("svc"); });
        g["__fixture_config__"] = meta({{str("svc"), str("file")}});
        g["test_first"]         = fn("test_first", {"mock", "svc"}, body);
        g["test_second"]        = fn("test_second", {"mock", "svc"}, body);
        return g;
    });

    const auto fr = run(path);
    EXPECT_FALSE(fr.has_failures());
    EXPECT_EQ(*counts, (std::vector<std::int64_t>{0, 1, 0, 1}));
}

TEST_F(RunnerTest, SnapshotsAreWrittenThenCompared) {
    auto value = std::make_shared<Value>(Value::list({Value::integer(1), str("two")}));
    auto path  = script("snap_test.star", [value](ExecutionContext &, const Namespace &pre) {
        const Value assert_mod = pre.at("assert");
        Namespace   g;
        g["test_snap"] = fn("test_snap", [assert_mod, value](ExecutionContext &ctx, const Args &) {
            return call_value(ctx, member(assert_mod, "snapshot"), {*value, str("items")});
        });
        return g;
    });

    const auto created = run(path);
    EXPECT_TRUE(created.tests[0].passed);
    EXPECT_EQ(created.snapshots_written, (std::vector<std::string>{"items"}));
    EXPECT_TRUE(fs::exists(tmp_.path() / "__snapshots__" / "snap_test" / "test_snap__items.snap"));

    const auto same = run(path);
    EXPECT_TRUE(same.tests[0].passed);
    EXPECT_TRUE(same.snapshots_written.empty());

    *value             = Value::list({Value::integer(1), str("three")});
    const auto changed = run(path);
    ASSERT_TRUE(changed.tests[0].error);
    EXPECT_EQ(changed.tests[0].error->kind, ErrorKind::Snapshot);

    Options update;
    update.update_snapshots = true;
    const auto updated      = run(path, update);
    EXPECT_TRUE(updated.tests[0].passed);
    EXPECT_EQ(updated.snapshots_written, (std::vector<std::string>{"items"}));
}
