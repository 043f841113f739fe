#include "skytest/assert_module.h"

#include "skytest/engine.h"
#include "skytest/errors.h"
#include "skytest/snapshot.h"

#include <algorithm>
#include <fmt/format.h>

namespace skytest {

namespace {

template <typename... Args>
[[noreturn]] void fail(const Value &msg, fmt::format_string<Args...> format_string, Args &&...args) {
    if (msg.is_string() && !msg.as_string().empty())
        throw AssertionError("assertion failed: " + msg.as_string());
    throw AssertionError("assertion failed: " + fmt::format(format_string, std::forward<Args>(args)...));
}

std::optional<std::size_t> length_of(const Value &v) {
    switch (v.kind()) {
    case Value::Kind::List:
    case Value::Kind::Tuple:
    case Value::Kind::Set: return v.elements()->size();
    case Value::Kind::Dict: return v.as_dict()->entries.size();
    case Value::Kind::String:
    case Value::Kind::Bytes: return v.as_string().size();
    default: return std::nullopt;
    }
}

std::size_t checked_length(const Value &v, std::string_view fn) {
    const auto n = length_of(v);
    if (!n)
        throw EvalError(fmt::format("{}: type {} has no len()", fn, v.type_name()));
    return *n;
}

using Check = bool (*)(int);

Value compare_builtin(std::string name, std::string_view op, Check check) {
    return make_builtin(name, [name, op, check](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
        auto       a   = unpack_args(name, args, kwargs, {"a", "b", "msg"}, 2);
        const auto cmp = compare_values(a[0], a[1]);
        if (!cmp)
            throw EvalError(fmt::format("{}: {} {} {} not implemented", name, a[0].type_name(), op, a[1].type_name()));
        if (!check(*cmp))
            fail(a[2], "expected {} {} {}", a[0].repr(), op, a[1].repr());
        return Value();
    });
}

bool contains(const Value &container, const Value &item) {
    switch (container.kind()) {
    case Value::Kind::List:
    case Value::Kind::Tuple:
    case Value::Kind::Set: {
        const auto &items = *container.elements();
        return std::find(items.begin(), items.end(), item) != items.end();
    }
    case Value::Kind::Dict: return container.as_dict()->find(item) != nullptr;
    case Value::Kind::String: return item.is_string() && container.as_string().find(item.as_string()) != std::string::npos;
    default: throw EvalError(fmt::format("assert.contains: unsupported container type {}", container.type_name()));
    }
}

} // namespace

Value make_assert_module() {
    std::vector<std::pair<std::string, Value>> members;

    members.emplace_back("eq", make_builtin("assert.eq", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.eq", args, kwargs, {"a", "b", "msg"}, 2);
                             if (a[0] != a[1])
                                 fail(a[2], "expected {} == {}", a[0].repr(), a[1].repr());
                             return Value();
                         }));
    members.emplace_back("ne", make_builtin("assert.ne", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.ne", args, kwargs, {"a", "b", "msg"}, 2);
                             if (a[0] == a[1])
                                 fail(a[2], "expected {} != {}", a[0].repr(), a[1].repr());
                             return Value();
                         }));
    members.emplace_back("true", make_builtin("assert.true", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.true", args, kwargs, {"cond", "msg"}, 1);
                             if (!a[0].truth())
                                 fail(a[1], "expected {} to be true", a[0].repr());
                             return Value();
                         }));
    members.emplace_back("false", make_builtin("assert.false", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.false", args, kwargs, {"cond", "msg"}, 1);
                             if (a[0].truth())
                                 fail(a[1], "expected {} to be false", a[0].repr());
                             return Value();
                         }));
    members.emplace_back("contains", make_builtin("assert.contains", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.contains", args, kwargs, {"container", "item", "msg"}, 2);
                             if (!contains(a[0], a[1]))
                                 fail(a[2], "expected {} to contain {}", a[0].repr(), a[1].repr());
                             return Value();
                         }));
    members.emplace_back("fails", make_builtin("assert.fails", [](ExecutionContext &ctx, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.fails", args, kwargs, {"fn", "pattern"}, 1);
                             if (!a[0].is_callable())
                                 throw EvalError(fmt::format("assert.fails: expected callable, got {}", a[0].type_name()));
                             std::string message;
                             bool        failed = false;
                             try {
                                 call_value(ctx, a[0]);
                             } catch (const TimeoutError &) {
                                 throw;
                             } catch (const error &e) {
                                 failed  = true;
                                 message = e.what();
                             }
                             if (!failed)
                                 throw AssertionError("assert.fails: expected function to fail, but it succeeded");
                             if (a[1].is_string() && message.find(a[1].as_string()) == std::string::npos)
                                 throw AssertionError(fmt::format("assert.fails: error {} does not match pattern {}", quote_string(message),
                                                                  quote_string(a[1].as_string())));
                             return Value();
                         }));
    members.emplace_back("lt", compare_builtin("assert.lt", "<", [](int c) { return c < 0; }));
    members.emplace_back("le", compare_builtin("assert.le", "<=", [](int c) { return c <= 0; }));
    members.emplace_back("gt", compare_builtin("assert.gt", ">", [](int c) { return c > 0; }));
    members.emplace_back("ge", compare_builtin("assert.ge", ">=", [](int c) { return c >= 0; }));
    members.emplace_back("len", make_builtin("assert.len", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto       a      = unpack_args("assert.len", args, kwargs, {"container", "expected", "msg"}, 2);
                             const auto actual = checked_length(a[0], "assert.len");
                             const auto want   = a[1].as_int();
                             if (want < 0 || static_cast<std::size_t>(want) != actual)
                                 fail(a[2], "expected len({}) == {}, got {}", a[0].type_name(), want, actual);
                             return Value();
                         }));
    members.emplace_back("empty", make_builtin("assert.empty", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto       a      = unpack_args("assert.empty", args, kwargs, {"container", "msg"}, 1);
                             const auto actual = checked_length(a[0], "assert.empty");
                             if (actual != 0)
                                 fail(a[1], "expected {} to be empty, got length {}", a[0].type_name(), actual);
                             return Value();
                         }));
    members.emplace_back("not_empty", make_builtin("assert.not_empty", [](ExecutionContext &, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.not_empty", args, kwargs, {"container", "msg"}, 1);
                             if (checked_length(a[0], "assert.not_empty") == 0)
                                 fail(a[1], "expected {} to not be empty", a[0].type_name());
                             return Value();
                         }));
    members.emplace_back("snapshot", make_builtin("assert.snapshot", [](ExecutionContext &ctx, const Args &args, const Kwargs &kwargs) {
                             auto a = unpack_args("assert.snapshot", args, kwargs, {"value", "name"}, 2);
                             if (!a[1].is_string())
                                 throw EvalError(fmt::format("assert.snapshot: name must be a string, got {}", a[1].type_name()));
                             SnapshotManager *snapshots = ctx.snapshots();
                             if (!snapshots)
                                 throw EvalError("assert.snapshot: snapshots are not available in this context");
                             snapshots->compare(a[0], a[1].as_string());
                             return Value();
                         }));

    return Value::structure("assert", std::move(members));
}

} // namespace skytest
