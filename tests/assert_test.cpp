#include "skytest/assert_module.h"
#include "skytest/errors.h"
#include "skytest/snapshot.h"

#include "support/scripted_engine.h"
#include "support/temp_dir.h"

#include <gtest/gtest.h>

using namespace skytest;
using skytest::test_support::member;

namespace {

class AssertModuleTest : public ::testing::Test {
protected:
    Value call(std::string_view fn, Args args, Kwargs kwargs = {}) { return call_value(ctx_, member(module_, fn), args, kwargs); }

    std::string failure(std::string_view fn, Args args, Kwargs kwargs = {}) {
        try {
            call(fn, std::move(args), std::move(kwargs));
        } catch (const AssertionError &e) {
            return e.what();
        }
        return "<no failure>";
    }

    Value            module_ = make_assert_module();
    ExecutionContext ctx_{"test_assert"};
};

} // namespace

TEST_F(AssertModuleTest, EqualityAndMessages) {
    EXPECT_NO_THROW(call("eq", {Value::integer(1), Value::floating(1.0)}));
    EXPECT_EQ(failure("eq", {Value::integer(1), Value::integer(2)}), "assertion failed: expected 1 == 2");
    EXPECT_EQ(failure("eq", {Value::integer(1), Value::integer(2)}, {{"msg", Value::string("custom")}}), "assertion failed: custom");
    EXPECT_EQ(failure("ne", {Value::string("a"), Value::string("a")}), "assertion failed: expected \"a\" != \"a\"");
}

TEST_F(AssertModuleTest, Truthiness) {
    EXPECT_NO_THROW(call("true", {Value::list({Value()})}));
    EXPECT_NO_THROW(call("false", {Value::string("")}));
    EXPECT_EQ(failure("true", {Value::integer(0)}), "assertion failed: expected 0 to be true");
}

TEST_F(AssertModuleTest, Contains) {
    EXPECT_NO_THROW(call("contains", {Value::string("hello world"), Value::string("lo w")}));
    EXPECT_NO_THROW(call("contains", {Value::dict({{Value::string("k"), Value()}}), Value::string("k")}));
    EXPECT_EQ(failure("contains", {Value::list({Value::integer(1)}), Value::integer(2)}), "assertion failed: expected [1] to contain 2");
    EXPECT_THROW(call("contains", {Value::integer(1), Value::integer(1)}), EvalError);
}

TEST_F(AssertModuleTest, Ordering) {
    EXPECT_NO_THROW(call("lt", {Value::integer(1), Value::integer(2)}));
    EXPECT_NO_THROW(call("le", {Value::integer(2), Value::integer(2)}));
    EXPECT_NO_THROW(call("gt", {Value::string("b"), Value::string("a")}));
    EXPECT_EQ(failure("ge", {Value::integer(1), Value::integer(2)}), "assertion failed: expected 1 >= 2");
    EXPECT_THROW(call("lt", {Value::integer(1), Value::string("a")}), EvalError);
}

TEST_F(AssertModuleTest, Lengths) {
    EXPECT_NO_THROW(call("len", {Value::list({Value(), Value()}), Value::integer(2)}));
    EXPECT_EQ(failure("len", {Value::string("abc"), Value::integer(2)}), "assertion failed: expected len(string) == 2, got 3");
    EXPECT_NO_THROW(call("empty", {Value::dict()}));
    EXPECT_EQ(failure("not_empty", {Value::tuple()}), "assertion failed: expected tuple to not be empty");
    EXPECT_THROW(call("len", {Value::integer(3), Value::integer(1)}), EvalError);
}

TEST_F(AssertModuleTest, FailsChecksErrorAndPattern) {
    auto boom = test_support::failing("boom", "division by zero");
    EXPECT_NO_THROW(call("fails", {boom}));
    EXPECT_NO_THROW(call("fails", {boom, Value::string("by zero")}));
    EXPECT_THROW(call("fails", {boom, Value::string("overflow")}), AssertionError);
    EXPECT_THROW(call("fails", {test_support::noop("ok")}), AssertionError);
}

TEST_F(AssertModuleTest, FailsAcceptsAnyTestError) {
    auto missing = test_support::fn("missing", [](ExecutionContext &, const Args &) -> Value { throw FixtureNotFound("db"); });
    EXPECT_NO_THROW(call("fails", {missing, Value::string("fixture not found: db")}));

    auto mismatch = test_support::fn("mismatch", [](ExecutionContext &, const Args &) -> Value {
        throw SnapshotMismatch("n", "1\n", "2\n", "-1\n+2\n");
    });
    EXPECT_NO_THROW(call("fails", {mismatch, Value::string("snapshot mismatch")}));

    auto nested = test_support::fn("nested", [this](ExecutionContext &, const Args &) { return call("eq", {Value::integer(1), Value::integer(2)}); });
    EXPECT_NO_THROW(call("fails", {nested}));
}

TEST_F(AssertModuleTest, FailsDoesNotSwallowTimeouts) {
    ctx_.cancel("test timeout after 1s");
    EXPECT_THROW(call("fails", {test_support::noop("slow")}), TimeoutError);
}

TEST_F(AssertModuleTest, SnapshotUsesContextManager) {
    EXPECT_THROW(call("snapshot", {Value::integer(1), Value::string("n")}), EvalError);

    test_support::TempDir tmp;
    SnapshotManager  snaps;
    snaps.set_context(tmp.path() / "a_test.star", "test_assert");
    ctx_.set_snapshots(&snaps);
    call("snapshot", {Value::integer(1), Value::string("n")});
    EXPECT_EQ(snaps.created(), std::vector<std::string>{"n"});
    EXPECT_THROW(call("snapshot", {Value::integer(2), Value::string("n")}), SnapshotMismatch);
}
