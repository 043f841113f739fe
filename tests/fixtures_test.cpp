#include "skytest/errors.h"
#include "skytest/fixtures.h"

#include "support/scripted_engine.h"
#include "support/temp_dir.h"

#include <gtest/gtest.h>

using namespace skytest;
using skytest::test_support::fn;
using skytest::test_support::TempDir;

namespace {

// Producer returning an increasing counter, so re-computation is visible.
Value counting(std::string name, std::shared_ptr<int> calls, std::vector<std::string> params = {}) {
    return fn(std::move(name), std::move(params), [calls](ExecutionContext &, const Args &) { return Value::integer(++*calls); });
}

Fixture make_fixture(std::string name, Value producer, FixtureScope scope = FixtureScope::Test) {
    Fixture f;
    f.name     = std::move(name);
    f.producer = std::move(producer);
    f.scope    = scope;
    return f;
}

} // namespace

TEST(FixtureRegistryTest, BuiltinsBypassComputation) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    reg.register_builtin("mock", Value::string("module"));
    EXPECT_EQ(reg.get_or_compute(ctx, "mock").as_string(), "module");
    EXPECT_TRUE(reg.contains("mock"));
    EXPECT_EQ(reg.size(), 0u);
}

TEST(FixtureRegistryTest, UnknownFixtureThrows) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    try {
        reg.get_or_compute(ctx, "db");
        FAIL() << "expected FixtureNotFound";
    } catch (const FixtureNotFound &e) {
        EXPECT_EQ(e.name(), "db");
        EXPECT_STREQ(e.what(), "fixture not found: db");
    }
}

TEST(FixtureRegistryTest, TestScopeIsCachedWithinTestOnly) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    auto             calls = std::make_shared<int>(0);
    reg.register_fixture(make_fixture("n", counting("fixture_n", calls)));

    EXPECT_EQ(reg.get_or_compute(ctx, "n").as_int(), 1);
    EXPECT_EQ(reg.get_or_compute(ctx, "n").as_int(), 1);
    reg.clear_test_cache();
    EXPECT_EQ(reg.get_or_compute(ctx, "n").as_int(), 2);
}

TEST(FixtureRegistryTest, FileScopeSurvivesTestCacheClear) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    auto             calls = std::make_shared<int>(0);
    reg.register_fixture(make_fixture("conn", counting("fixture_conn", calls), FixtureScope::File));

    EXPECT_EQ(reg.get_or_compute(ctx, "conn").as_int(), 1);
    reg.clear_test_cache();
    EXPECT_EQ(reg.get_or_compute(ctx, "conn").as_int(), 1);
    reg.clear_file_cache();
    EXPECT_EQ(reg.get_or_compute(ctx, "conn").as_int(), 2);
}

TEST(FixtureRegistryTest, DependenciesResolveRecursively) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    reg.register_fixture(make_fixture("base", fn("fixture_base", [](ExecutionContext &, const Args &) { return Value::integer(20); })));
    reg.register_fixture(make_fixture(
        "derived", fn("fixture_derived", {"base"}, [](ExecutionContext &, const Args &a) { return Value::integer(a[0].as_int() + 1); })));
    EXPECT_EQ(reg.get_or_compute(ctx, "derived").as_int(), 21);

    auto args = reg.resolve_args(ctx, {"case", "base", "derived"}, 1);
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0].as_int(), 20);
    EXPECT_EQ(args[1].as_int(), 21);
}

TEST(FixtureRegistryTest, CycleIsReportedWithChain) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    auto             none = [](ExecutionContext &, const Args &) { return Value(); };
    reg.register_fixture(make_fixture("a", fn("fixture_a", {"b"}, none)));
    reg.register_fixture(make_fixture("b", fn("fixture_b", {"a"}, none)));
    try {
        reg.get_or_compute(ctx, "a");
        FAIL() << "expected FixtureCycle";
    } catch (const FixtureCycle &e) {
        EXPECT_EQ(e.chain(), (std::vector<std::string>{"a", "b", "a"}));
        EXPECT_STREQ(e.what(), "fixture cycle: a -> b -> a");
    }
}

TEST(FixtureRegistryTest, ProducerFailureBecomesResolutionError) {
    FixtureRegistry  reg;
    ExecutionContext ctx;
    reg.register_fixture(make_fixture("bad", test_support::failing("fixture_bad", "boom")));
    try {
        reg.get_or_compute(ctx, "bad");
        FAIL() << "expected FixtureResolutionError";
    } catch (const FixtureResolutionError &e) {
        EXPECT_EQ(e.name(), "bad");
        EXPECT_STREQ(e.what(), "fixture bad: boom");
    }
}

TEST(FixtureRegistryTest, MergeFromOverridesDefinitions) {
    FixtureRegistry  outer;
    FixtureRegistry  inner;
    ExecutionContext ctx;
    outer.register_fixture(make_fixture("v", fn("fixture_v", [](ExecutionContext &, const Args &) { return Value::string("outer"); })));
    outer.register_fixture(make_fixture("only_outer", fn("fixture_only_outer", [](ExecutionContext &, const Args &) { return Value(); })));
    inner.register_fixture(make_fixture("v", fn("fixture_v", [](ExecutionContext &, const Args &) { return Value::string("inner"); })));

    outer.merge_from(inner);
    EXPECT_EQ(outer.get_or_compute(ctx, "v").as_string(), "inner");
    EXPECT_EQ(outer.names(), (std::vector<std::string>{"only_outer", "v"}));
}

TEST(FindFixturesTest, ReadsPrefixAndScopeConfig) {
    Namespace globals;
    globals["fixture_db"]         = test_support::noop("fixture_db");
    globals["fixture_tmp"]        = test_support::noop("fixture_tmp");
    globals["fixture_"]           = test_support::noop("fixture_");
    globals["fixture_constant"]   = Value::integer(3);
    globals["helper"]             = test_support::noop("helper");
    globals["__fixture_config__"] = Value::dict({{Value::string("db"), Value::string("file")}});

    FixtureRegistry reg;
    find_fixtures(globals, reg);
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"db", "tmp"}));

    auto calls = std::make_shared<int>(0);
    globals["fixture_db"] = counting("fixture_db", calls);
    FixtureRegistry counted;
    find_fixtures(globals, counted);
    ExecutionContext ctx;
    counted.get_or_compute(ctx, "db");
    counted.clear_test_cache();
    counted.get_or_compute(ctx, "db");
    EXPECT_EQ(*calls, 1);
}

TEST(ConftestTest, FoundRootToLeafAndStopsAtWorkspaceMarker) {
    TempDir tmp;
    tmp.write("conftest.star");
    tmp.mkdir("repo/.git");
    tmp.write("repo/conftest.star");
    tmp.write("repo/pkg/conftest.star");
    const auto test = tmp.write("repo/pkg/sub/a_test.star");

    auto found = find_conftest_files(test);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0], std::filesystem::absolute(tmp.path() / "repo" / "conftest.star"));
    EXPECT_EQ(found[1], std::filesystem::absolute(tmp.path() / "repo" / "pkg" / "conftest.star"));
}
